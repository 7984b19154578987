// vrglove/logger/stream_logger.hpp
#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../config.h"
#include "../error.h"
#include "../types.hpp"
#include "log_record.hpp"
#include "log_sink.hpp"

namespace vrglove {

struct StreamLoggerOptions {
    std::size_t               queue_capacity = kStreamQueueCapacity;
    std::size_t               degraded_capacity = kDegradedBufferCapacity;
    std::chrono::milliseconds retry_interval{kLogRetryIntervalMs};
};

struct StreamStatus {
    SourceId      source = SourceId::imu1;
    std::string   path;
    std::uint64_t written = 0;
    std::uint64_t dropped = 0;
    std::size_t   pending = 0;
    bool          degraded = false;
    ErrorCode     last_error = ErrorCode::ok;
};

// One source's append-only file with its own writer thread. append() never
// blocks on I/O. After a write failure the stream is degraded: frames are
// kept in a bounded buffer (oldest dropped) and the sink is retried every
// retry_interval until it accepts data again.
class LogStream {
public:
    typedef std::shared_ptr<LogStream> ptr;

    LogStream(SourceId source, std::string path, LogSink::ptr sink, StreamLoggerOptions options);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    ErrorCode open(const LogHeader& header);
    void      start();
    ErrorCode append(const FramePtr& frame);
    ErrorCode flush(std::chrono::milliseconds timeout);
    ErrorCode finish();
    void      discard();

    StreamStatus status() const;
    SourceId     source() const { return source_; }
    const std::string& path() const { return path_; }

    std::function<void(SourceId, ErrorCode)> on_error;

private:
    void      run();
    ErrorCode write_frame(const SensorFrame& frame);

    const SourceId              source_;
    const std::string           path_;
    LogSink::ptr                sink_;
    const StreamLoggerOptions   options_;

    mutable std::mutex          mutex_;
    std::condition_variable     cv_;
    std::condition_variable     drained_cv_;
    std::deque<FramePtr>        pending_;
    bool                        degraded_ = false;
    bool                        stopping_ = false;
    bool                        started_ = false;
    std::uint64_t               flush_requested_ = 0;
    std::uint64_t               flush_done_ = 0;
    std::uint64_t               written_ = 0;
    std::uint64_t               dropped_ = 0;
    ErrorCode                   last_error_ = ErrorCode::ok;

    std::int64_t                last_t_ns_ = 0;     // writer thread only
    std::thread                 thread_;
};

// Explicitly owned data-stream logger. One session at a time; a session
// opens every requested stream together under a shared session id:
//
//   <root>/<DDMMYYYY_HHMMSS>_vr_glove/<session>_<tag>_<DDMMYYYY_HHMMSS>.vglog
class StreamLogger {
public:
    typedef std::function<LogSink::ptr(SourceId)> SinkFactory;
    typedef std::function<void(SourceId, ErrorCode)> ErrorListener;

    explicit StreamLogger(StreamLoggerOptions options = StreamLoggerOptions(),
                          SinkFactory factory = SinkFactory());
    ~StreamLogger();

    StreamLogger(const StreamLogger&) = delete;
    StreamLogger& operator=(const StreamLogger&) = delete;

    ErrorCode start_session(const std::string& root_dir,
                            const std::vector<SourceId>& sources,
                            const DeviceHandle& device,
                            const DeviceInfo& info);
    ErrorCode stop_session();

    ErrorCode append(SourceId source, const FramePtr& frame);
    ErrorCode append(const FramePtr& frame) { return append(frame->source, frame); }
    ErrorCode flush(SourceId source, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));
    ErrorCode flush_all(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

    bool        active() const;
    std::string session_id() const;
    std::string session_directory() const;
    std::string stream_path(SourceId source) const;

    bool                      status(SourceId source, StreamStatus& out) const;
    std::vector<StreamStatus> status() const;

    void set_error_listener(ErrorListener listener);

private:
    LogStream::ptr stream(SourceId source) const;

    StreamLoggerOptions                             options_;
    SinkFactory                                     factory_;

    mutable std::mutex                              mutex_;
    std::array<LogStream::ptr, kSourceCount>        streams_;
    std::string                                     session_id_;
    std::string                                     session_dir_;
    ErrorListener                                   error_listener_;
};

} // namespace vrglove
