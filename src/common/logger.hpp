#pragma once

// 项目头文件
#include "common/config.hpp"

// 第三方库
#include <spdlog/logger.h>

// C++ 标准库
#include <memory>

namespace session {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器, 未初始化时退回 spdlog 默认日志器
std::shared_ptr<spdlog::logger> GetLogger();

#define SESSION_LOG_DEBUG(...) ::session::common::GetLogger()->debug(__VA_ARGS__)
#define SESSION_LOG_INFO(...)  ::session::common::GetLogger()->info(__VA_ARGS__)
#define SESSION_LOG_WARN(...)  ::session::common::GetLogger()->warn(__VA_ARGS__)
#define SESSION_LOG_ERROR(...) ::session::common::GetLogger()->error(__VA_ARGS__)

} // namespace common
} // namespace session
