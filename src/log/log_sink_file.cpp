#include "log_sink_file.h"
#include <filesystem>
#include <iostream>
#include "log_formatter.h"

namespace fs = std::filesystem;

namespace pipehub::core {

FileLogSink::FileLogSink(Options opt) : _opt(std::move(opt)) {}

std::string FileLogSink::backupName_(int index) const
{
    return _opt.path + "." + std::to_string(index);
}

bool FileLogSink::openLocked_()
{
    if (_out.is_open()) return true;
    if (_openFailed) return false;

    std::error_code ec;
    const fs::path target(_opt.path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }

    _out.open(_opt.path, std::ios::out | std::ios::app);
    if (!_out.is_open()) {
        _openFailed = true;
        std::cerr << "FileLogSink: cannot open " << _opt.path << ", file logging disabled\n";
        return false;
    }

    // 追加模式：从已有文件大小继续计数
    const auto existing = fs::file_size(target, ec);
    _bytes = ec ? 0 : static_cast<std::uint64_t>(existing);
    return true;
}

void FileLogSink::rotateLocked_()
{
    _out.close();

    std::error_code ec;
    if (_opt.maxFiles > 0) {
        fs::remove(backupName_(_opt.maxFiles), ec);
        for (int i = _opt.maxFiles - 1; i >= 1; --i) {
            fs::rename(backupName_(i), backupName_(i + 1), ec); // 不存在的序号直接跳过
        }
        fs::rename(_opt.path, backupName_(1), ec);
    } else {
        fs::remove(_opt.path, ec);
    }
    _bytes = 0;
}

void FileLogSink::consume(const LogRecord& rec)
{
    if (_opt.path.empty()) return;

    std::string line = LogFormatter::instance().formatLine(rec);
    line += '\n';

    std::lock_guard<std::mutex> lk(_mu);
    if (!openLocked_()) return;

    // 空文件不轮转：单行超过上限时照样写进去
    if (_opt.rotateBytes > 0 && _bytes > 0 && _bytes + line.size() > _opt.rotateBytes) {
        rotateLocked_();
        if (!openLocked_()) return;
    }

    _out << line;
    _bytes += line.size();
    if (_opt.flushEachLine) _out.flush();
}

} // namespace pipehub::core
