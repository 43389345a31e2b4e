#pragma once

// 项目头文件
#include "common/config.hpp"
#include "common/status.hpp"

// 第三方库
#include <nlohmann/json.hpp>

// C++ 标准库
#include <shared_mutex>
#include <string>

namespace session {
namespace common {

class ConfigLoader {
public:
    // 读取失败或 JSON 非法时抛出 std::runtime_error
    static AppConfig Load(const std::string& path);
    static AppConfig LoadFromString(const std::string& content);
    static std::string DetectConfigPath();
private:
    static AppConfig FromJson(const nlohmann::json& j);
    static nlohmann::json ReadFile(const std::string& path);
};

// 当前生效的配置, 可被 Reload 原地替换
class ConfigStore {
public:
    ConfigStore(std::string path, AppConfig initial);

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    AppConfig Current() const;
    const std::string& Path() const noexcept { return path_; }

    // 重新读取文件; 失败时保留旧配置
    Status Reload();
    // 直接替换 (测试或内嵌使用)
    void Replace(AppConfig config);

private:
    std::string path_;
    mutable std::shared_mutex mutex_;
    AppConfig config_;
};

} // namespace common
} // namespace session
