#pragma once
#include <string>
#include "log_record.h"

namespace pipehub::core {

// 单行文本：
// ts=[2026-10-16 09:30:01.123] level=[INFO] stream=EVENT task=ingest_market_daily run_id=9f.. duration_ms=7 msg="run finished" status=SUCCESS
class LogFormatter {
public:
    static LogFormatter& instance();

    std::string formatLine(const LogRecord& r) const;

    static const char* levelName(LogLevel lv);

    // 普通 token 原样输出；含空格、引号、'=' 的值加引号转义
    static std::string quoteValue(const std::string& v);

private:
    LogFormatter() = default;

    static const char* streamName_(LogStream s);
    static std::string escapeMsg_(const std::string& s);
};

} // namespace pipehub::core
