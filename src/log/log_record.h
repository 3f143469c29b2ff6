#pragma once
#include <string>
#include <map>
#include <chrono>
#include <cstdint>
#include "log/logger.h"

namespace pipehub::core {

enum class LogStream : int {
    System = 0,
    Event  = 1, // 任务生命周期事件（start/finish）
};

struct LogRecord {
    // ---- identity / routing ----
    std::string taskName;                  // 可选：关联的任务
    std::string runId;                     // 可选：关联的运行记录

    // ---- content ----
    LogLevel level{LogLevel::Info};
    LogStream stream{LogStream::System};
    std::string message;

    // ---- timing ----
    std::chrono::system_clock::time_point ts{std::chrono::system_clock::now()};
    std::int64_t durationMs{-1};           // <0 表示没有耗时信息

    // ---- extra fields ----
    std::map<std::string, std::string> fields;
};

} // namespace pipehub::core
