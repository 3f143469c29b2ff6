#include "utils.h"
#include <cerrno>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pipehub {
namespace utils {

namespace {

void set_nonblocking(int fd)
{
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return;
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// 读完当前可读的数据；EOF 或出错时关闭 fd
void drain_fd(int fd, std::string& out, bool& openFlag)
{
    char buf[4096];
    while (true) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        openFlag = false;
        ::close(fd);
        return;
    }
}

} // namespace

std::string formatTimestampMs(const std::chrono::system_clock::time_point &ts)
{
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(ts);
    std::time_t t = std::chrono::system_clock::to_time_t(seconds);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;

    // 本地时间（线程安全）
    std::tm buf {};
#if defined(_WIN32)
    localtime_s(&buf, &t);
#else
    localtime_r(&t, &buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

long long toEpochMs(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMs(long long ms)
{
    using namespace std::chrono;
    return system_clock::time_point(duration_cast<system_clock::duration>(milliseconds(ms)));
}

std::string random_hex(std::size_t n)
{
    static const char* kHex = "0123456789abcdef";
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 15);

    std::string out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out += kHex[dist(rng)];
    }
    return out;
}

std::string generate_run_id()
{
    return random_hex(32);
}

CommandResult run_command(const std::string &cmd)
{
    CommandResult r;

    int outPipe[2]{-1, -1};
    int errPipe[2]{-1, -1};
    if (::pipe(outPipe) != 0) {
        r.stderrData = "pipe() failed";
        return r;
    }
    if (::pipe(errPipe) != 0) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        r.stderrData = "pipe() failed";
        return r;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        r.stderrData = "fork() failed";
        return r;
    }

    if (pid == 0) {
        // ---- child ----
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);

        const char* sh = "/bin/sh";
        ::execl(sh, sh, "-c", cmd.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    // ---- parent ----
    ::close(outPipe[1]);
    ::close(errPipe[1]);
    set_nonblocking(outPipe[0]);
    set_nonblocking(errPipe[0]);

    // 两个管道都读到 EOF 才结束，避免子进程写满 stderr 卡住
    bool outOpen = true;
    bool errOpen = true;
    while (outOpen || errOpen) {
        pollfd fds[2];
        int nfds = 0;
        if (outOpen) fds[nfds++] = pollfd{outPipe[0], POLLIN, 0};
        if (errOpen) fds[nfds++] = pollfd{errPipe[0], POLLIN, 0};
        if (::poll(fds, nfds, 100) < 0 && errno != EINTR) {
            break;
        }
        if (outOpen) drain_fd(outPipe[0], r.stdoutData, outOpen);
        if (errOpen) drain_fd(errPipe[0], r.stderrData, errOpen);
    }
    if (outOpen) ::close(outPipe[0]);
    if (errOpen) ::close(errPipe[0]);

    int status = 0;
    pid_t w;
    do {
        w = ::waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w != pid) {
        return r;
    }

    if (WIFEXITED(status)) {
        r.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        r.exitCode = 128 + WTERMSIG(status);
    } else {
        r.exitCode = status;
    }
    return r;
}

} // namespace utils
} // namespace pipehub
