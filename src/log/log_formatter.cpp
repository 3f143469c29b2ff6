#include "log_formatter.h"
#include <sstream>
#include "core/utils.h"

namespace pipehub::core {

namespace {

// 值里有空格、引号、'=' 或控制字符时加引号，保证一行能按 key=value 切分
bool needsQuoting(const std::string& v)
{
    if (v.empty()) return true;
    for (char c : v) {
        if (c == ' ' || c == '"' || c == '=' || static_cast<unsigned char>(c) < 0x20) return true;
    }
    return false;
}

} // namespace

LogFormatter& LogFormatter::instance() {
    static LogFormatter inst;
    return inst;
}

const char* LogFormatter::levelName(LogLevel lv) {
    static const char* const kNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    const auto idx = static_cast<int>(lv);
    return (idx >= 0 && idx < 4) ? kNames[idx] : "INFO";
}

std::string LogFormatter::quoteValue(const std::string& v) {
    return needsQuoting(v) ? escapeMsg_(v) : v;
}

const char* LogFormatter::streamName_(LogStream s) {
    return s == LogStream::Event ? "EVENT" : "SYSTEM";
}

std::string LogFormatter::escapeMsg_(const std::string& s) {
    std::string escaped;
    escaped.reserve(s.size() + 2);
    escaped += '"';
    for (char c : s) {
        switch (c) {
        case '\n': escaped += "\\n"; break;
        case '\r': escaped += "\\r"; break;
        case '\t': escaped += "\\t"; break;
        case '"':  escaped += "\\\""; break;
        case '\\': escaped += "\\\\"; break;
        default:   escaped += c;
        }
    }
    escaped += '"';
    return escaped;
}

std::string LogFormatter::formatLine(const LogRecord& r) const {
    std::ostringstream line;
    line << "ts=[" << utils::formatTimestampMs(r.ts) << "] level=[" << levelName(r.level)
         << "] stream=" << streamName_(r.stream);

    // 任务相关字段只在有值时输出
    if (!r.taskName.empty()) line << " task=" << quoteValue(r.taskName);
    if (!r.runId.empty())    line << " run_id=" << quoteValue(r.runId);
    if (r.durationMs >= 0)   line << " duration_ms=" << r.durationMs;

    line << " msg=" << escapeMsg_(r.message);

    for (const auto& [key, value] : r.fields) {
        line << ' ' << key << '=' << quoteValue(value);
    }
    return line.str();
}

} // namespace pipehub::core
