// vrglove/logger/log_sink.cpp
#include "log_sink.hpp"
#include "../log.h"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace vrglove {

static Logger::ptr g_logger = VRGLOVE_LOG_NAME("datalog");

FileSink::~FileSink() {
    close();
}

ErrorCode FileSink::open(const std::string& path) {
    close();
    path_ = path;
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        VRGLOVE_LOG_ERROR(g_logger) << "Failed to open " << path_ << ", error: " << strerror(errno);
        return ErrorCode::write_failure;
    }
    good_offset_ = 0;
    return ErrorCode::ok;
}

ErrorCode FileSink::write(const std::uint8_t* data, std::size_t size) {
    if (fd_ < 0) return ErrorCode::write_failure;

    std::size_t total = 0;
    while (total < size) {
        ssize_t n = ::write(fd_, data + total, size - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            // Roll back a partial record so the file stays parseable.
            if (total > 0) {
                if (::ftruncate(fd_, static_cast<off_t>(good_offset_)) != 0 ||
                    ::lseek(fd_, static_cast<off_t>(good_offset_), SEEK_SET) < 0) {
                    VRGLOVE_LOG_ERROR(g_logger) << "rollback of " << path_ << " failed: " << strerror(errno);
                }
            }
            VRGLOVE_LOG_DEBUG(g_logger) << "write " << path_ << ": " << strerror(err);
            return ErrorCode::write_failure;
        }
        total += static_cast<std::size_t>(n);
    }
    good_offset_ += static_cast<long long>(size);
    return ErrorCode::ok;
}

ErrorCode FileSink::flush() {
    if (fd_ < 0) return ErrorCode::write_failure;
    if (::fdatasync(fd_) != 0 && errno != EINVAL) {
        VRGLOVE_LOG_DEBUG(g_logger) << "fdatasync " << path_ << ": " << strerror(errno);
        return ErrorCode::write_failure;
    }
    return ErrorCode::ok;
}

void FileSink::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace vrglove
