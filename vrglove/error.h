#ifndef __VRGLOVE_ERROR_H__
#define __VRGLOVE_ERROR_H__

#include <cstdint>

namespace vrglove {

enum class ErrorCode : std::uint8_t {
    ok = 0,
    connect_timeout,
    device_unreachable,
    connection_lost,
    decode_error,          // malformed payload, frame dropped
    invalid_config,        // rejected before transmission
    write_rejected,        // device declined a well-formed write
    insufficient_samples,
    drift_exceeded,        // advisory
    write_failure,         // log I/O
    device_busy,
    not_connected,
    cancelled,
    invalid_argument
};

const char* to_string(ErrorCode code);

inline bool is_ok(ErrorCode code) { return code == ErrorCode::ok; }

} // namespace vrglove

#endif
