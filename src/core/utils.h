#pragma once

#include <string>
#include <cstddef>
#include <chrono>

namespace pipehub {
namespace utils {

// 本地时间，格式：YYYY-MM-DD HH:MM:SS.mmm
std::string formatTimestampMs(const std::chrono::system_clock::time_point& ts);

long long toEpochMs(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point fromEpochMs(long long ms);

// n 个小写十六进制字符
std::string random_hex(std::size_t n);

// 128-bit random run id, 32 hex chars
std::string generate_run_id();

struct CommandResult {
    int exitCode{-1};        // -1: 进程没能启动；被信号终止时为 128 + signo
    std::string stdoutData;
    std::string stderrData;
};

// /bin/sh -c cmd，stdout / stderr 分别捕获
CommandResult run_command(const std::string& cmd);

} // namespace utils
} // namespace pipehub
