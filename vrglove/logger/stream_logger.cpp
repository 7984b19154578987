// vrglove/logger/stream_logger.cpp
#include "stream_logger.hpp"
#include "../log.h"

#include <ctime>
#include <filesystem>
#include <random>
#include <sstream>
#include <iomanip>

namespace vrglove {

static Logger::ptr g_logger = VRGLOVE_LOG_NAME("datalog");

static std::int64_t unix_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// =============================================================================
// LogStream
// =============================================================================
LogStream::LogStream(SourceId source, std::string path, LogSink::ptr sink, StreamLoggerOptions options)
    : source_(source)
    , path_(std::move(path))
    , sink_(std::move(sink))
    , options_(options)
{}

LogStream::~LogStream() {
    discard();
}

ErrorCode LogStream::open(const LogHeader& header) {
    ErrorCode rc = sink_->open(path_);
    if (rc != ErrorCode::ok) return rc;

    std::vector<std::uint8_t> bytes(LogFormat::MAGIC, LogFormat::MAGIC + sizeof(LogFormat::MAGIC));
    std::vector<std::uint8_t> record;
    encode_header(header, record);
    bytes.insert(bytes.end(), record.begin(), record.end());

    rc = sink_->write(bytes.data(), bytes.size());
    if (rc != ErrorCode::ok) {
        sink_->close();
    }
    return rc;
}

void LogStream::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) return;
    started_ = true;
    thread_ = std::thread(&LogStream::run, this);
}

ErrorCode LogStream::append(const FramePtr& frame) {
    if (!frame || frame->source != source_) return ErrorCode::invalid_argument;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return ErrorCode::cancelled;

        const std::size_t cap = degraded_ ? options_.degraded_capacity : options_.queue_capacity;
        while (!pending_.empty() && pending_.size() >= cap) {
            pending_.pop_front();
            ++dropped_;
        }
        pending_.push_back(frame);
        if (degraded_) return ErrorCode::write_failure;
    }
    cv_.notify_one();
    return ErrorCode::ok;
}

ErrorCode LogStream::write_frame(const SensorFrame& frame) {
    std::int64_t t_ns = to_ns(frame.timestamp);
    if (t_ns <= last_t_ns_) t_ns = last_t_ns_ + 1;

    std::vector<std::uint8_t> record;
    encode_frame_record(frame, t_ns, record);
    ErrorCode rc = sink_->write(record.data(), record.size());
    if (rc == ErrorCode::ok) last_t_ns_ = t_ns;
    return rc;
}

void LogStream::run() {
    for (;;) {
        std::deque<FramePtr> batch;
        bool stopping = false;
        bool flush_now = false;
        std::uint64_t flush_target = 0;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (degraded_ && !stopping_) {
                cv_.wait_for(lock, options_.retry_interval, [this] { return stopping_; });
                flush_now = true;
            } else {
                cv_.wait(lock, [this] {
                    return stopping_ || !pending_.empty() || flush_requested_ != flush_done_;
                });
            }
            stopping = stopping_;
            batch.swap(pending_);
            flush_target = flush_requested_;
            flush_now = flush_now || flush_target != flush_done_ || stopping;
        }

        // Disk I/O happens outside the lock; append() keeps queueing.
        std::size_t done = 0;
        ErrorCode rc = ErrorCode::ok;
        for (; done < batch.size(); ++done) {
            rc = write_frame(*batch[done]);
            if (rc != ErrorCode::ok) break;
        }
        if (rc == ErrorCode::ok && flush_now) {
            rc = sink_->flush();
        }

        bool entered_degraded = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            written_ += done;
            if (rc != ErrorCode::ok) {
                for (std::size_t i = batch.size(); i > done; --i) {
                    pending_.push_front(batch[i - 1]);
                }
                while (pending_.size() > options_.degraded_capacity) {
                    pending_.pop_front();
                    ++dropped_;
                }
                last_error_ = rc;
                if (!degraded_) {
                    degraded_ = true;
                    entered_degraded = true;
                }
            } else {
                if (degraded_) {
                    degraded_ = false;
                    VRGLOVE_LOG_INFO(g_logger) << "stream " << source_tag(source_) << " recovered, "
                                               << written_ << " records written, " << dropped_ << " dropped";
                }
                flush_done_ = flush_target;
            }
            drained_cv_.notify_all();

            if (stopping) {
                if (!pending_.empty()) {
                    dropped_ += pending_.size();
                    pending_.clear();
                }
                break;
            }
        }

        if (entered_degraded) {
            VRGLOVE_LOG_ERROR(g_logger) << "stream " << source_tag(source_) << " write failed ("
                                        << to_string(rc) << "), buffering and retrying every "
                                        << options_.retry_interval.count() << " ms";
            if (on_error) on_error(source_, rc);
        }
    }
}

ErrorCode LogStream::flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (degraded_) return ErrorCode::write_failure;
    if (!started_ || stopping_) return ErrorCode::ok;

    const std::uint64_t target = ++flush_requested_;
    cv_.notify_one();
    const bool done = drained_cv_.wait_for(lock, timeout, [this, target] {
        return flush_done_ >= target || degraded_;
    });
    if (!done || degraded_) return ErrorCode::write_failure;
    return ErrorCode::ok;
}

ErrorCode LogStream::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();

    // Writer has exited; this thread now owns the sink.
    bool lost = false;
    std::uint64_t written = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        written = written_;
        lost = dropped_ > 0 || degraded_;
    }

    LogTrailer trailer;
    trailer.records = written;
    trailer.wall_end_ms = unix_now_ms();
    std::vector<std::uint8_t> record;
    encode_trailer(trailer, record);
    ErrorCode rc = sink_->write(record.data(), record.size());
    if (rc == ErrorCode::ok) rc = sink_->flush();
    sink_->close();

    if (rc != ErrorCode::ok || lost) {
        VRGLOVE_LOG_WARN(g_logger) << "stream " << source_tag(source_) << " closed with loss: "
                                   << written << " written, " << status().dropped << " dropped";
        return ErrorCode::write_failure;
    }
    return ErrorCode::ok;
}

void LogStream::discard() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    if (sink_) sink_->close();
}

StreamStatus LogStream::status() const {
    StreamStatus s;
    s.source = source_;
    s.path = path_;
    std::lock_guard<std::mutex> lock(mutex_);
    s.written = written_;
    s.dropped = dropped_;
    s.pending = pending_.size();
    s.degraded = degraded_;
    s.last_error = last_error_;
    return s;
}

// =============================================================================
// StreamLogger
// =============================================================================
StreamLogger::StreamLogger(StreamLoggerOptions options, SinkFactory factory)
    : options_(options)
    , factory_(std::move(factory))
{
    if (!factory_) {
        factory_ = [](SourceId) { return LogSink::ptr(new FileSink()); };
    }
}

StreamLogger::~StreamLogger() {
    if (active()) {
        ErrorCode rc = stop_session();
        if (rc != ErrorCode::ok) {
            VRGLOVE_LOG_WARN(g_logger) << "session closed with " << to_string(rc);
        }
    }
}

static std::string wall_stamp() {
    const std::time_t now = std::time(nullptr);
    std::tm tm_now;
    localtime_r(&now, &tm_now);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%d%m%Y_%H%M%S", &tm_now);
    return buf;
}

static std::string new_session_id() {
    std::random_device rd;
    std::ostringstream ss;
    ss << std::hex << std::setw(8) << std::setfill('0') << rd();
    return ss.str();
}

ErrorCode StreamLogger::start_session(const std::string& root_dir,
                                      const std::vector<SourceId>& sources,
                                      const DeviceHandle& device,
                                      const DeviceInfo& info) {
    if (sources.empty()) return ErrorCode::invalid_argument;
    if (active()) {
        VRGLOVE_LOG_WARN(g_logger) << "session " << session_id() << " already running";
        return ErrorCode::device_busy;
    }

    const std::string stamp = wall_stamp();
    const std::string sid = new_session_id();
    const std::filesystem::path dir = std::filesystem::path(root_dir) / (stamp + "_vr_glove");

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        VRGLOVE_LOG_ERROR(g_logger) << "cannot create " << dir.string() << ": " << ec.message();
        return ErrorCode::write_failure;
    }

    LogHeader header;
    header.session_id = sid;
    header.device = device.name.empty() ? info.model : device.name;
    header.address = device.address;
    header.firmware = info.firmware;
    header.wall_start_ms = unix_now_ms();
    header.mono_start_ns = to_ns(Clock::now());

    std::array<LogStream::ptr, kSourceCount> opened;
    std::vector<LogStream::ptr> order;
    ErrorCode rc = ErrorCode::ok;

    for (SourceId source : sources) {
        const auto idx = static_cast<std::size_t>(source);
        if (idx >= kSourceCount) { rc = ErrorCode::invalid_argument; break; }
        if (opened[idx]) continue;

        const std::string path =
            (dir / (sid + "_" + source_tag(source) + "_" + stamp + ".vglog")).string();
        LogSink::ptr sink = factory_(source);
        if (!sink) { rc = ErrorCode::write_failure; break; }

        auto stream = std::make_shared<LogStream>(source, path, std::move(sink), options_);
        header.source = source;
        header.tag = source_tag(source);
        rc = stream->open(header);
        if (rc != ErrorCode::ok) {
            VRGLOVE_LOG_ERROR(g_logger) << "cannot open stream " << path << ": " << to_string(rc);
            break;
        }
        opened[idx] = stream;
        order.push_back(stream);
    }

    if (rc != ErrorCode::ok) {
        // All or nothing: undo the streams opened so far.
        for (auto& s : order) {
            s->discard();
            std::filesystem::remove(s->path(), ec);
        }
        std::filesystem::remove(dir, ec);
        return rc;
    }

    for (auto& s : order) {
        s->on_error = [this](SourceId source, ErrorCode code) {
            ErrorListener listener;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                listener = error_listener_;
            }
            if (listener) listener(source, code);
        };
        s->start();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        streams_ = opened;
        session_id_ = sid;
        session_dir_ = dir.string();
    }
    VRGLOVE_LOG_INFO(g_logger) << "session " << sid << " started: " << order.size()
                               << " stream(s) in " << dir.string();
    return ErrorCode::ok;
}

ErrorCode StreamLogger::stop_session() {
    std::array<LogStream::ptr, kSourceCount> streams;
    std::string sid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        streams.swap(streams_);
        sid.swap(session_id_);
        session_dir_.clear();
    }
    if (sid.empty()) return ErrorCode::ok;

    ErrorCode result = ErrorCode::ok;
    std::uint64_t total = 0;
    for (auto& s : streams) {
        if (!s) continue;
        ErrorCode rc = s->finish();
        total += s->status().written;
        if (rc != ErrorCode::ok) result = rc;
    }
    VRGLOVE_LOG_INFO(g_logger) << "session " << sid << " stopped, " << total << " records";
    return result;
}

LogStream::ptr StreamLogger::stream(SourceId source) const {
    const auto idx = static_cast<std::size_t>(source);
    if (idx >= kSourceCount) return LogStream::ptr();
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_[idx];
}

ErrorCode StreamLogger::append(SourceId source, const FramePtr& frame) {
    LogStream::ptr s = stream(source);
    if (!s) return ErrorCode::invalid_argument;
    return s->append(frame);
}

ErrorCode StreamLogger::flush(SourceId source, std::chrono::milliseconds timeout) {
    LogStream::ptr s = stream(source);
    if (!s) return ErrorCode::invalid_argument;
    return s->flush(timeout);
}

ErrorCode StreamLogger::flush_all(std::chrono::milliseconds timeout) {
    ErrorCode result = ErrorCode::ok;
    for (std::size_t i = 0; i < kSourceCount; ++i) {
        LogStream::ptr s = stream(static_cast<SourceId>(i));
        if (!s) continue;
        ErrorCode rc = s->flush(timeout);
        if (rc != ErrorCode::ok) result = rc;
    }
    return result;
}

bool StreamLogger::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !session_id_.empty();
}

std::string StreamLogger::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

std::string StreamLogger::session_directory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_dir_;
}

std::string StreamLogger::stream_path(SourceId source) const {
    LogStream::ptr s = stream(source);
    return s ? s->path() : std::string();
}

bool StreamLogger::status(SourceId source, StreamStatus& out) const {
    LogStream::ptr s = stream(source);
    if (!s) return false;
    out = s->status();
    return true;
}

std::vector<StreamStatus> StreamLogger::status() const {
    std::vector<StreamStatus> out;
    for (std::size_t i = 0; i < kSourceCount; ++i) {
        LogStream::ptr s = stream(static_cast<SourceId>(i));
        if (s) out.push_back(s->status());
    }
    return out;
}

void StreamLogger::set_error_listener(ErrorListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_listener_ = std::move(listener);
}

} // namespace vrglove
