#include "core/session/session_store.hpp"

#include <chrono>
#include <mutex>

namespace session {
namespace core {

namespace {

std::int64_t CurrentUnixSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

common::Status InMemorySessionStore::CreateSession(const SessionRecord& record) {
    PutRaw(record.token, FieldValue(record.user_id), record.created_at);
    return common::Status::OK();
}

common::StatusOr<UserId> InMemorySessionStore::LookupUserId(const std::string& token) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = rows_.find(token);
    if (it == rows_.end()) {
        return common::Status::NotFound("Session not found");
    }
    auto uid = DecodeUserId(it->second.uid);
    if (!uid) {
        return common::Status::NotFound("Invalid uid for session");
    }
    return common::StatusOr<UserId>(*uid);
}

common::Status InMemorySessionStore::DeleteSession(const std::string& token) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rows_.erase(token);
    return common::Status::OK();
}

common::Status InMemorySessionStore::PurgeCreatedBefore(std::int64_t cutoff_unix_seconds) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = rows_.begin(); it != rows_.end();) {
        if (it->second.created_at < cutoff_unix_seconds) {
            it = rows_.erase(it);
        } else {
            ++it;
        }
    }
    return common::Status::OK();
}

void InMemorySessionStore::PutRaw(const std::string& token, FieldValue uid, std::int64_t created_at) {
    Row row{std::move(uid), created_at != 0 ? created_at : CurrentUnixSeconds()};
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rows_[token] = std::move(row);
}

std::size_t InMemorySessionStore::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rows_.size();
}

} // namespace core
} // namespace session
