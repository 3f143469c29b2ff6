#include "config.h"
#include <cstdlib>
#include <fstream>
#include "core/errors.h"
#include "log/logger.h"

namespace pipehub {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    reset();
}

void Config::reset() {
    std::lock_guard<std::mutex> lk(m_mu);
    m_config.clear();
    m_loaded_from.clear();

    m_config["database.path"] = "pipehub.db";
    m_config["database.migrations_dir"] = "migrations";
    m_config["database.busy_timeout_ms"] = 60000;
    m_config["log.path"] = "";
    m_config["log.level"] = "info";
    m_config["log.rotate_bytes"] = 10 * 1024 * 1024; // 10MB
    m_config["log.max_files"] = 5;
}

bool Config::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        Logger::debug("Config file not found: " + path);
        return false;
    }

    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::exception& ex) {
        throw core::ConfigError("Failed to parse config file: " + path + ", error: " + ex.what());
    }
    if (!j.is_object()) {
        throw core::ConfigError("Config file must contain a JSON object: " + path);
    }

    {
        std::lock_guard<std::mutex> lk(m_mu);
        flatten_("", j);
        m_loaded_from = path;
    }
    Logger::info("Config loaded from: " + path);
    return true;
}

// 嵌套对象展开为 "a.b.c"；对象本身也保留一份，便于整体读取
void Config::flatten_(const std::string& prefix, const nlohmann::json& node) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        m_config[key] = it.value();
        if (it.value().is_object()) {
            flatten_(key, it.value());
        }
    }
}

void Config::load_from_env() {
    if (const char* p = std::getenv("PIPEHUB_DB")) {
        set("database.path", p);
    }
    if (const char* p = std::getenv("PIPEHUB_MIGRATIONS")) {
        set("database.migrations_dir", p);
    }
    if (const char* p = std::getenv("PIPEHUB_LOG")) {
        set("log.path", p);
    }
    if (const char* p = std::getenv("PIPEHUB_LOG_LEVEL")) {
        set("log.level", p);
    }
}

void Config::set(const std::string& key, nlohmann::json value) {
    std::lock_guard<std::mutex> lk(m_mu);
    m_config[key] = std::move(value);
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_config.find(key) != m_config.end();
}

std::string Config::loaded_from() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_loaded_from;
}

} // namespace pipehub
