// vrglove/logger/log_sink.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "../error.h"

namespace vrglove {

// Byte destination of one log stream. Only the stream's writer thread
// touches a sink. write() is all-or-nothing: on failure nothing of the
// record remains in the destination.
class LogSink {
public:
    typedef std::unique_ptr<LogSink> ptr;

    virtual ~LogSink() = default;

    virtual ErrorCode open(const std::string& path) = 0;
    virtual ErrorCode write(const std::uint8_t* data, std::size_t size) = 0;
    virtual ErrorCode flush() = 0;
    virtual void      close() = 0;
};

class FileSink : public LogSink {
public:
    FileSink() = default;
    ~FileSink() override;

    ErrorCode open(const std::string& path) override;
    ErrorCode write(const std::uint8_t* data, std::size_t size) override;
    ErrorCode flush() override;
    void      close() override;

private:
    std::string path_;
    int         fd_ = -1;
    long long   good_offset_ = 0;
};

} // namespace vrglove
