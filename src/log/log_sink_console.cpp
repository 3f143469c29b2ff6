// log_sink_console.cpp
#include "log_sink_console.h"
#include <iostream>
#include "log_formatter.h"

namespace pipehub::core {

void ConsoleLogSink::consume(const LogRecord& rec) {
    const std::string line = LogFormatter::instance().formatLine(rec);
    std::lock_guard<std::mutex> lk(_mu);
    std::cerr << line << "\n";
}

} // namespace pipehub::core
