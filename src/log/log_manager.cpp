#include "log_manager.h"
#include <iostream>
#include "log_formatter.h"

namespace pipehub::core {

LogManager& LogManager::instance() {
    static LogManager g;
    return g;
}

void LogManager::emit(const LogRecord& rec) {
    if (rec.level < _minLevel.load()) return;

    std::vector<std::shared_ptr<ILogSink>> sinksSnapshot;
    {
        std::lock_guard<std::mutex> lk(_mu);
        // 拷贝 sinks（避免锁内做 IO）
        sinksSnapshot = _sinks;
    }

    if (sinksSnapshot.empty()) {
        // 还没初始化 sink（例如加载配置阶段）：直接打到 stderr，保证不丢
        std::cerr << LogFormatter::instance().formatLine(rec) << "\n";
        return;
    }

    for (auto& s : sinksSnapshot) {
        if (s) s->consume(rec);
    }
}

void LogManager::addSink(std::shared_ptr<ILogSink> sink)
{
    if (!sink) return;
    std::lock_guard<std::mutex> lk(_mu);
    _sinks.push_back(std::move(sink));
}

void LogManager::setSinks(std::vector<std::shared_ptr<ILogSink>> sinks)
{
    std::lock_guard<std::mutex> lk(_mu);
    _sinks = std::move(sinks);
}

void LogManager::clearSinks()
{
    std::lock_guard<std::mutex> lk(_mu);
    _sinks.clear();
}

void emitEvent(const std::string& taskName,
               const std::string& runId,
               LogLevel level,
               const std::string& msg,
               long long durationMs,
               const std::map<std::string, std::string>& extra)
{
    LogRecord rec;
    rec.taskName   = taskName;
    rec.runId      = runId;
    rec.level      = level;
    rec.stream     = LogStream::Event;
    rec.message    = msg;
    rec.durationMs = durationMs;
    rec.fields     = extra;
    LogManager::instance().emit(rec);
}

} // namespace pipehub::core
