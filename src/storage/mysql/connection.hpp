#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/options.hpp"

#include <mysql/mysql.h>
#include <memory>
#include <string>

namespace session {
namespace storage {

// 单个 MySQL 连接, 析构时关闭
class Connection {
public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection();

    static common::StatusOr<std::unique_ptr<Connection>> Create(const Options& options);

    MYSQL* Raw() const noexcept { return handle_; }
    const Options& GetOptions() const noexcept { return options_; }

    // 连接是否仍然可用
    bool Alive() const;
    // 按当前连接字符集转义字符串字面量
    std::string Escape(const std::string& value) const;

private:
    Connection(MYSQL* handle, Options options);

    MYSQL* handle_ = nullptr;
    Options options_;
};

// 带 mysql_error 信息的内部错误
common::Status MySqlError(const std::string& context, MYSQL* handle);

} // namespace storage
} // namespace session
