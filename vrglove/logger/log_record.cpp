// vrglove/logger/log_record.cpp
#include "log_record.hpp"
#include "../util/crc16.h"
#include "../log.h"

#include <cstring>

namespace vrglove {

static Logger::ptr g_logger = VRGLOVE_LOG_NAME("datalog");

std::int64_t to_ns(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

TimePoint from_ns(std::int64_t ns) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(ns)));
}

// -----------------------------------------------------------------------------
// Encoding
// -----------------------------------------------------------------------------
namespace {

class BodyWriter {
public:
    explicit BodyWriter(LogFormat::Kind kind) { u8(static_cast<std::uint8_t>(kind)); }

    void u8(std::uint8_t v) { body_.push_back(v); }
    void u16(std::uint16_t v) {
        body_.push_back(static_cast<std::uint8_t>(v & 0xFF));
        body_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    }
    void u32(std::uint32_t v) {
        for (int i = 0; i < 4; ++i) body_.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
    }
    void u64(std::uint64_t v) {
        for (int i = 0; i < 8; ++i) body_.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
    }
    void i64(std::int64_t v) { u64(static_cast<std::uint64_t>(v)); }
    void f32(float v) {
        std::uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        u32(bits);
    }
    void str(const std::string& s) {
        const std::size_t n = s.size() > 0xFFFF ? 0xFFFF : s.size();
        u16(static_cast<std::uint16_t>(n));
        body_.insert(body_.end(), s.begin(), s.begin() + static_cast<std::ptrdiff_t>(n));
    }

    // len | body | crc
    void finish(std::vector<std::uint8_t>& out) const {
        out.clear();
        out.reserve(body_.size() + 6);
        const std::uint32_t len = static_cast<std::uint32_t>(body_.size());
        for (int i = 0; i < 4; ++i) out.push_back(static_cast<std::uint8_t>((len >> (8 * i)) & 0xFF));
        out.insert(out.end(), body_.begin(), body_.end());
        const std::uint16_t crc = crc16(body_.data(), body_.size());
        out.push_back(static_cast<std::uint8_t>(crc & 0xFF));
        out.push_back(static_cast<std::uint8_t>((crc >> 8) & 0xFF));
    }

private:
    std::vector<std::uint8_t> body_;
};

class BodyReader {
public:
    explicit BodyReader(const std::vector<std::uint8_t>& body) : body_(body), pos_(0) {}

    bool ok() const { return ok_; }
    bool done() const { return pos_ == body_.size(); }

    std::uint8_t u8() {
        if (!need(1)) return 0;
        return body_[pos_++];
    }
    std::uint16_t u16() {
        if (!need(2)) return 0;
        std::uint16_t v = static_cast<std::uint16_t>(body_[pos_] | (body_[pos_ + 1] << 8));
        pos_ += 2;
        return v;
    }
    std::uint32_t u32() {
        if (!need(4)) return 0;
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v |= static_cast<std::uint32_t>(body_[pos_ + i]) << (8 * i);
        pos_ += 4;
        return v;
    }
    std::uint64_t u64() {
        if (!need(8)) return 0;
        std::uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v |= static_cast<std::uint64_t>(body_[pos_ + i]) << (8 * i);
        pos_ += 8;
        return v;
    }
    std::int64_t i64() { return static_cast<std::int64_t>(u64()); }
    float f32() {
        const std::uint32_t bits = u32();
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }
    std::string str() {
        const std::uint16_t n = u16();
        if (!need(n)) return std::string();
        std::string s(reinterpret_cast<const char*>(body_.data() + pos_), n);
        pos_ += n;
        return s;
    }

private:
    bool need(std::size_t n) {
        if (!ok_ || pos_ + n > body_.size()) {
            ok_ = false;
            return false;
        }
        return true;
    }

    const std::vector<std::uint8_t>& body_;
    std::size_t                      pos_;
    bool                             ok_ = true;
};

} // namespace

void encode_header(const LogHeader& header, std::vector<std::uint8_t>& out) {
    BodyWriter w(LogFormat::Kind::header);
    w.u16(header.version);
    w.str(header.session_id);
    w.u8(static_cast<std::uint8_t>(header.source));
    w.str(header.tag);
    w.str(header.device);
    w.str(header.address);
    w.str(header.firmware);
    w.i64(header.wall_start_ms);
    w.i64(header.mono_start_ns);
    w.finish(out);
}

void encode_frame_record(const SensorFrame& frame, std::int64_t t_ns, std::vector<std::uint8_t>& out) {
    BodyWriter w(LogFormat::Kind::frame);
    std::uint8_t flags = 0;
    if (frame.valid)      flags |= LogFormat::FLAG_VALID;
    if (frame.calibrated) flags |= LogFormat::FLAG_CALIBRATED;
    if (frame.has_seq)    flags |= LogFormat::FLAG_HAS_SEQ;

    w.u8(static_cast<std::uint8_t>(frame.source));
    w.u8(flags);
    w.u32(frame.seq);
    w.i64(t_ns);
    const std::size_t n = frame.raw.size();
    w.u16(static_cast<std::uint16_t>(n));
    for (std::size_t i = 0; i < n; ++i) w.f32(frame.raw[i]);
    for (std::size_t i = 0; i < n; ++i) w.f32(i < frame.values.size() ? frame.values[i] : frame.raw[i]);
    w.finish(out);
}

void encode_trailer(const LogTrailer& trailer, std::vector<std::uint8_t>& out) {
    BodyWriter w(LogFormat::Kind::trailer);
    w.u64(trailer.records);
    w.i64(trailer.wall_end_ms);
    w.finish(out);
}

// -----------------------------------------------------------------------------
// LogReader
// -----------------------------------------------------------------------------
ErrorCode LogReader::open(const std::string& path) {
    close();
    in_.open(path, std::ios::binary);
    if (!in_.is_open()) {
        VRGLOVE_LOG_ERROR(g_logger) << "cannot open " << path;
        return ErrorCode::invalid_argument;
    }

    char magic[4];
    if (!in_.read(magic, sizeof(magic)) || std::memcmp(magic, LogFormat::MAGIC, sizeof(magic)) != 0) {
        VRGLOVE_LOG_ERROR(g_logger) << path << ": not a stream log";
        return ErrorCode::decode_error;
    }

    std::vector<std::uint8_t> body;
    if (read_record(body) != ReadResult::ok) return ErrorCode::decode_error;

    BodyReader r(body);
    if (static_cast<LogFormat::Kind>(r.u8()) != LogFormat::Kind::header) return ErrorCode::decode_error;
    header_.version = r.u16();
    header_.session_id = r.str();
    header_.source = static_cast<SourceId>(r.u8());
    header_.tag = r.str();
    header_.device = r.str();
    header_.address = r.str();
    header_.firmware = r.str();
    header_.wall_start_ms = r.i64();
    header_.mono_start_ns = r.i64();
    if (!r.ok() || header_.version != LogFormat::VERSION) {
        VRGLOVE_LOG_ERROR(g_logger) << path << ": bad header (version " << header_.version << ")";
        return ErrorCode::decode_error;
    }
    return ErrorCode::ok;
}

void LogReader::close() {
    if (in_.is_open()) in_.close();
    in_.clear();
    header_ = LogHeader();
    trailer_ = LogTrailer();
    has_trailer_ = false;
    frames_read_ = 0;
}

LogReader::ReadResult LogReader::read_record(std::vector<std::uint8_t>& body) {
    std::uint8_t len_bytes[4];
    if (!in_.read(reinterpret_cast<char*>(len_bytes), sizeof(len_bytes))) {
        return in_.gcount() == 0 ? ReadResult::eof : ReadResult::corrupt;
    }
    const std::uint32_t len = static_cast<std::uint32_t>(len_bytes[0])
                            | (static_cast<std::uint32_t>(len_bytes[1]) << 8)
                            | (static_cast<std::uint32_t>(len_bytes[2]) << 16)
                            | (static_cast<std::uint32_t>(len_bytes[3]) << 24);
    if (len == 0 || len > LogFormat::MAX_BODY) return ReadResult::corrupt;

    body.resize(len);
    std::uint8_t crc_bytes[2];
    if (!in_.read(reinterpret_cast<char*>(body.data()), len) ||
        !in_.read(reinterpret_cast<char*>(crc_bytes), sizeof(crc_bytes))) {
        return ReadResult::corrupt;
    }
    const std::uint16_t expected = static_cast<std::uint16_t>(crc_bytes[0] | (crc_bytes[1] << 8));
    return crc16(body.data(), body.size()) == expected ? ReadResult::ok : ReadResult::corrupt;
}

ErrorCode LogReader::next(SensorFrame& out, bool& end) {
    end = false;
    if (!in_.is_open() || has_trailer_) {
        end = true;
        return ErrorCode::ok;
    }

    std::vector<std::uint8_t> body;
    const ReadResult res = read_record(body);
    if (res == ReadResult::eof) {
        end = true;
        return ErrorCode::ok;
    }
    if (res == ReadResult::corrupt) return ErrorCode::decode_error;

    BodyReader r(body);
    const auto kind = static_cast<LogFormat::Kind>(r.u8());
    if (kind == LogFormat::Kind::trailer) {
        trailer_.records = r.u64();
        trailer_.wall_end_ms = r.i64();
        if (!r.ok()) return ErrorCode::decode_error;
        has_trailer_ = true;
        end = true;
        return ErrorCode::ok;
    }
    if (kind != LogFormat::Kind::frame) return ErrorCode::decode_error;

    out = SensorFrame();
    out.source = static_cast<SourceId>(r.u8());
    const std::uint8_t flags = r.u8();
    out.seq = r.u32();
    out.timestamp = from_ns(r.i64());
    const std::uint16_t n = r.u16();
    out.raw.resize(n);
    out.values.resize(n);
    for (std::uint16_t i = 0; i < n; ++i) out.raw[i] = r.f32();
    for (std::uint16_t i = 0; i < n; ++i) out.values[i] = r.f32();
    out.valid = (flags & LogFormat::FLAG_VALID) != 0;
    out.calibrated = (flags & LogFormat::FLAG_CALIBRATED) != 0;
    out.has_seq = (flags & LogFormat::FLAG_HAS_SEQ) != 0;
    if (!r.ok() || !r.done()) return ErrorCode::decode_error;

    ++frames_read_;
    return ErrorCode::ok;
}

ErrorCode LogReader::read_all(const std::string& path, LogHeader& header,
                              std::vector<SensorFrame>& frames, LogTrailer* trailer) {
    LogReader reader;
    ErrorCode rc = reader.open(path);
    if (rc != ErrorCode::ok) return rc;

    frames.clear();
    for (;;) {
        SensorFrame frame;
        bool end = false;
        rc = reader.next(frame, end);
        if (rc != ErrorCode::ok) return rc;
        if (end) break;
        frames.push_back(std::move(frame));
    }
    header = reader.header();
    if (trailer) *trailer = reader.trailer();
    return ErrorCode::ok;
}

} // namespace vrglove
