#include "error.h"

namespace vrglove {

const char* to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::ok:                   return "ok";
    case ErrorCode::connect_timeout:      return "ConnectTimeout";
    case ErrorCode::device_unreachable:   return "DeviceUnreachable";
    case ErrorCode::connection_lost:      return "ConnectionLost";
    case ErrorCode::decode_error:         return "DecodeError";
    case ErrorCode::invalid_config:       return "InvalidConfig";
    case ErrorCode::write_rejected:       return "WriteRejected";
    case ErrorCode::insufficient_samples: return "InsufficientSamples";
    case ErrorCode::drift_exceeded:       return "DriftExceeded";
    case ErrorCode::write_failure:        return "WriteFailure";
    case ErrorCode::device_busy:          return "DeviceBusy";
    case ErrorCode::not_connected:        return "NotConnected";
    case ErrorCode::cancelled:            return "Cancelled";
    case ErrorCode::invalid_argument:     return "InvalidArgument";
    }
    return "Unknown";
}

} // namespace vrglove
