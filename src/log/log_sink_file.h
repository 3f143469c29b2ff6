#pragma once
#include "log_sink.h"
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace pipehub::core {

// 追加写入 log.path，超过 rotateBytes 时轮转：
//   pipehub.log -> pipehub.log.1 -> ... -> pipehub.log.N（N = maxFiles，更早的删除）
// 文件打不开时只在 stderr 报一次，之后的记录丢弃，不影响任务执行。
class FileLogSink : public ILogSink {
public:
    struct Options {
        std::string path = "logs/pipehub.log";
        std::uint64_t rotateBytes = 10 * 1024 * 1024; // 0 = never rotate
        int maxFiles = 5;
        bool flushEachLine = true;
    };

    explicit FileLogSink(Options opt);
    void consume(const LogRecord& rec) override;

private:
    bool openLocked_();
    void rotateLocked_();
    std::string backupName_(int index) const;

private:
    Options _opt;
    std::ofstream _out;
    std::uint64_t _bytes{0}; // 当前文件大小
    bool _openFailed{false};
    std::mutex _mu;
};

} // namespace pipehub::core
