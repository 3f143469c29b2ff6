#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "log_record.h"
#include "log_sink.h"

namespace pipehub::core {

class LogManager {
public:
    static LogManager& instance();

    // 统一入口：按级别过滤后分发给所有 sink
    void emit(const LogRecord& rec);

    void addSink(std::shared_ptr<ILogSink> sink);
    void setSinks(std::vector<std::shared_ptr<ILogSink>> sinks);
    void clearSinks();

    void setMinLevel(LogLevel level) { _minLevel.store(level); }
    LogLevel minLevel() const { return _minLevel.load(); }

private:
    LogManager() = default;

private:
    mutable std::mutex _mu;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
    std::atomic<LogLevel> _minLevel{LogLevel::Info};
};

// 任务生命周期事件
void emitEvent(const std::string& taskName,
               const std::string& runId,
               LogLevel level,
               const std::string& msg,
               long long durationMs = -1,
               const std::map<std::string, std::string>& extra = {});

} // namespace pipehub::core
