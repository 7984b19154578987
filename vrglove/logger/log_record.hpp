// vrglove/logger/log_record.hpp
#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "../error.h"
#include "../types.hpp"

namespace vrglove {

// Stream file layout (little endian):
//
//   "VGLG" | record*
//   record := body_len u32 | body | crc16(body) u16
//   body   := kind u8 | ...
//
//   header  : version u16 | session str | source u8 | tag str | device str |
//             address str | firmware str | wall_start_ms i64 | mono_start_ns i64
//   frame   : source u8 | flags u8 | seq u32 | t_ns i64 | n u16 | raw f32[n] | values f32[n]
//   trailer : records u64 | wall_end_ms i64
//
// str := len u16 | bytes. t_ns is host steady-clock time.
struct LogFormat {
    static constexpr char          MAGIC[4] = {'V', 'G', 'L', 'G'};
    static constexpr std::uint16_t VERSION  = 1;
    static constexpr std::size_t   MAX_BODY = 64 * 1024;

    enum class Kind : std::uint8_t {
        header  = 1,
        frame   = 2,
        trailer = 3
    };

    enum Flags : std::uint8_t {
        FLAG_VALID      = 0x01,
        FLAG_CALIBRATED = 0x02,
        FLAG_HAS_SEQ    = 0x04
    };
};

struct LogHeader {
    std::uint16_t version = LogFormat::VERSION;
    std::string   session_id;
    SourceId      source = SourceId::imu1;
    std::string   tag;
    std::string   device;
    std::string   address;
    std::string   firmware;
    std::int64_t  wall_start_ms = 0;
    std::int64_t  mono_start_ns = 0;
};

struct LogTrailer {
    std::uint64_t records = 0;
    std::int64_t  wall_end_ms = 0;
};

std::int64_t to_ns(TimePoint tp);
TimePoint    from_ns(std::int64_t ns);

void encode_header(const LogHeader& header, std::vector<std::uint8_t>& out);
void encode_frame_record(const SensorFrame& frame, std::int64_t t_ns, std::vector<std::uint8_t>& out);
void encode_trailer(const LogTrailer& trailer, std::vector<std::uint8_t>& out);

// Sequential reader for replay and verification.
class LogReader {
public:
    ErrorCode open(const std::string& path);
    void      close();

    // ok with a frame; end = true after the trailer or at clean EOF.
    // A truncated or corrupt record yields decode_error.
    ErrorCode next(SensorFrame& out, bool& end);

    const LogHeader&  header() const { return header_; }
    bool              has_trailer() const { return has_trailer_; }
    const LogTrailer& trailer() const { return trailer_; }
    std::uint64_t     frames_read() const { return frames_read_; }

    // Convenience: every frame in a file.
    static ErrorCode read_all(const std::string& path, LogHeader& header,
                              std::vector<SensorFrame>& frames, LogTrailer* trailer = nullptr);

private:
    enum class ReadResult { ok, eof, corrupt };
    ReadResult read_record(std::vector<std::uint8_t>& body);

    std::ifstream   in_;
    LogHeader       header_;
    LogTrailer      trailer_;
    bool            has_trailer_ = false;
    std::uint64_t   frames_read_ = 0;
};

} // namespace vrglove
