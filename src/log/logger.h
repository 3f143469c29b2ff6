#pragma once
#include <string>

namespace pipehub {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// "debug" / "info" / "warn" / "error"（不区分大小写），无法识别时返回 Info
LogLevel parseLogLevel(const std::string& s);

class Logger {
public:
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);

private:
    static void write(LogLevel level, const std::string& msg);
};

} // namespace pipehub
