#include "logger.h"
#include <algorithm>
#include <cctype>
#include "log_manager.h"
#include "log_record.h"

namespace pipehub {

LogLevel parseLogLevel(const std::string& s) {
    std::string str = s;
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    if (str == "debug") return LogLevel::Debug;
    if (str == "info")  return LogLevel::Info;
    if (str == "warn" || str == "warning") return LogLevel::Warn;
    if (str == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void Logger::debug(const std::string &msg) {
    write(LogLevel::Debug, msg);
}

void Logger::info(const std::string &msg) {
    write(LogLevel::Info, msg);
}

void Logger::warn(const std::string &msg) {
    write(LogLevel::Warn, msg);
}

void Logger::error(const std::string &msg) {
    write(LogLevel::Error, msg);
}

void Logger::write(LogLevel level, const std::string &msg) {
    core::LogRecord rec;
    rec.level = level;
    rec.stream = core::LogStream::System;
    rec.message = msg;
    rec.ts = std::chrono::system_clock::now();
    core::LogManager::instance().emit(rec);
}

} // namespace pipehub
