#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace pipehub {

class Config {
public:
    // 单例接口
    static Config& instance();

    // 加载 JSON 配置文件：文件不存在返回 false；解析失败抛 core::ConfigError
    bool load(const std::string& path);

    // 从环境变量覆盖配置
    void load_from_env();

    // 恢复内置默认值（清空已加载内容）
    void reset();

    void set(const std::string& key, nlohmann::json value);
    bool has(const std::string& key) const;

    // Dotted key lookup ("log.path"). Missing key or type mismatch -> def.
    template <typename T>
    T get(const std::string& key, const T& def = T{}) const {
        std::lock_guard<std::mutex> lk(m_mu);
        auto it = m_config.find(key);
        if (it == m_config.end()) return def;
        try {
            return it->second.get<T>();
        } catch (const nlohmann::json::exception&) {
            return def;
        }
    }

    std::string db_path() const { return get<std::string>("database.path", "pipehub.db"); }
    std::string migrations_dir() const { return get<std::string>("database.migrations_dir", "migrations"); }
    int busy_timeout_ms() const { return get<int>("database.busy_timeout_ms", 60000); }
    std::string log_path() const { return get<std::string>("log.path", ""); }
    std::string log_level() const { return get<std::string>("log.level", "info"); }

    // Source of the last successful load(), empty when running on defaults.
    std::string loaded_from() const;

private:
    Config();
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void flatten_(const std::string& prefix, const nlohmann::json& node);

private:
    mutable std::mutex m_mu;
    std::unordered_map<std::string, nlohmann::json> m_config;
    std::string m_loaded_from;
};

} // namespace pipehub
