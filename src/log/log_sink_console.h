// log_sink_console.h
#pragma once
#include <mutex>
#include "log_sink.h"

namespace pipehub::core {

// stdout 留给命令输出（JSON），日志统一写 stderr
class ConsoleLogSink : public ILogSink {
public:
    void consume(const LogRecord& rec) override;

private:
    std::mutex _mu;
};

} // namespace pipehub::core
