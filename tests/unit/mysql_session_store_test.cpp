#include <gtest/gtest.h>

#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/session_store.hpp"
#include "storage/mysql/transaction.hpp"

#include <chrono>
#include <cstdlib>
#include <string>

namespace {

std::string GetEnvOr(const char* name, const std::string& fallback) {
    if (const char* value = std::getenv(name)) {
        return value;
    }
    return fallback;
}

std::int64_t NowUnixSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void ExecuteSQL(session::storage::ConnectionPool& pool, const std::string& sql) {
    auto lease_or = pool.Acquire();
    ASSERT_TRUE(lease_or.IsOk()) << lease_or.GetStatus().Message();
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    ASSERT_EQ(0, mysql_real_query(conn, sql.c_str(), sql.size())) << mysql_error(conn);
}

// 需要可访问的 MySQL; 连接失败时跳过
class MySqlSessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        session::storage::Options options;
        options.host = GetEnvOr("SESSION_DB_HOST", "127.0.0.1");
        options.port = static_cast<std::uint16_t>(std::stoi(GetEnvOr("SESSION_DB_PORT", "3306")));
        options.user = GetEnvOr("SESSION_DB_USER", "root");
        options.password = GetEnvOr("SESSION_DB_PASSWORD", "");
        options.database = GetEnvOr("SESSION_DB_NAME", "session");
        options.pool_size = 2;
        pool_ = std::make_shared<session::storage::ConnectionPool>(options);
        {
            auto probe = pool_->Acquire();
            if (!probe.IsOk()) {
                pool_.reset();
                GTEST_SKIP() << "MySQL is not reachable: " << probe.GetStatus().Message();
            }
        }
        ExecuteSQL(*pool_,
                   "CREATE TABLE IF NOT EXISTS session_db ("
                   "session_id VARCHAR(64) NOT NULL PRIMARY KEY, "
                   "uid BIGINT NOT NULL, "
                   "created_at DATETIME NOT NULL DEFAULT CURRENT_TIMESTAMP)");
        ExecuteSQL(*pool_, "DELETE FROM session_db");
        store_ = std::make_unique<session::storage::MySqlSessionStore>(pool_);
    }

    void TearDown() override {
        if (pool_) {
            ExecuteSQL(*pool_, "DELETE FROM session_db");
        }
    }

    session::core::SessionRecord Record(const std::string& token, session::core::UserId uid,
                                        std::int64_t created_at = 0) {
        session::core::SessionRecord record;
        record.token = token;
        record.user_id = uid;
        record.created_at = created_at;
        return record;
    }

    std::shared_ptr<session::storage::ConnectionPool> pool_;
    std::unique_ptr<session::storage::MySqlSessionStore> store_;
};

} // namespace

TEST_F(MySqlSessionStoreTest, CreateAndLookup) {
    ASSERT_TRUE(store_->CreateSession(Record("tok-a", 42)).IsOk());
    auto uid = store_->LookupUserId("tok-a");
    ASSERT_TRUE(uid.IsOk()) << uid.GetStatus().ToString();
    EXPECT_EQ(uid.Value(), 42);
}

TEST_F(MySqlSessionStoreTest, MissingTokenIsNotFound) {
    auto uid = store_->LookupUserId("missing");
    ASSERT_FALSE(uid.IsOk());
    EXPECT_EQ(uid.GetStatus().Code(), session::common::StatusCode::kNotFound);
}

TEST_F(MySqlSessionStoreTest, NonPositiveUidIsNotFound) {
    ExecuteSQL(*pool_, "INSERT INTO session_db (session_id, uid) VALUES ('zero', 0)");
    auto uid = store_->LookupUserId("zero");
    ASSERT_FALSE(uid.IsOk());
    EXPECT_EQ(uid.GetStatus().Code(), session::common::StatusCode::kNotFound);
}

TEST_F(MySqlSessionStoreTest, UnsignedIntUidAboveInt32Range) {
    ExecuteSQL(*pool_, "ALTER TABLE session_db MODIFY uid INT UNSIGNED NOT NULL");
    ExecuteSQL(*pool_, "INSERT INTO session_db (session_id, uid) VALUES ('big', 3000000000)");
    auto uid = store_->LookupUserId("big");
    ExecuteSQL(*pool_, "ALTER TABLE session_db MODIFY uid BIGINT NOT NULL");
    ASSERT_TRUE(uid.IsOk()) << uid.GetStatus().ToString();
    EXPECT_EQ(uid.Value(), std::int64_t{3000000000});
}

TEST_F(MySqlSessionStoreTest, DuplicateTokenIsAlreadyExists) {
    ASSERT_TRUE(store_->CreateSession(Record("dup", 1)).IsOk());
    auto status = store_->CreateSession(Record("dup", 2));
    EXPECT_EQ(status.Code(), session::common::StatusCode::kAlreadyExists);
}

TEST_F(MySqlSessionStoreTest, TokensAreEscaped) {
    const std::string token = "it's'; DROP TABLE session_db; --";
    ASSERT_TRUE(store_->CreateSession(Record(token, 5)).IsOk());
    auto uid = store_->LookupUserId(token);
    ASSERT_TRUE(uid.IsOk()) << uid.GetStatus().ToString();
    EXPECT_EQ(uid.Value(), 5);
    EXPECT_TRUE(store_->DeleteSession(token).IsOk());
}

TEST_F(MySqlSessionStoreTest, DeleteIsIdempotent) {
    ASSERT_TRUE(store_->CreateSession(Record("tok-d", 3)).IsOk());
    EXPECT_TRUE(store_->DeleteSession("tok-d").IsOk());
    EXPECT_TRUE(store_->DeleteSession("tok-d").IsOk());
    EXPECT_EQ(store_->LookupUserId("tok-d").GetStatus().Code(), session::common::StatusCode::kNotFound);
}

TEST_F(MySqlSessionStoreTest, PurgeRemovesOldRows) {
    const auto now = NowUnixSeconds();
    ASSERT_TRUE(store_->CreateSession(Record("old", 1, now - 48 * 3600)).IsOk());
    ASSERT_TRUE(store_->CreateSession(Record("new", 2, now - 60)).IsOk());

    ASSERT_TRUE(store_->PurgeCreatedBefore(now - 24 * 3600).IsOk());
    EXPECT_FALSE(store_->LookupUserId("old").IsOk());
    EXPECT_TRUE(store_->LookupUserId("new").IsOk());
}

TEST_F(MySqlSessionStoreTest, UncommittedTransactionRollsBack) {
    ASSERT_TRUE(store_->CreateSession(Record("keep", 1)).IsOk());
    {
        session::storage::Transaction tx(pool_);
        ASSERT_TRUE(tx.Begin().IsOk());
        ASSERT_TRUE(tx.Execute("DELETE FROM session_db WHERE session_id = 'keep'").IsOk());
    }
    EXPECT_TRUE(store_->LookupUserId("keep").IsOk());
}
