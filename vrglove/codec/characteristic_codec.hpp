// vrglove/codec/characteristic_codec.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../error.h"
#include "../types.hpp"

namespace vrglove {
namespace codec {

// Telemetry payloads. decode_* reject a payload whose length does not match
// the characteristic layout with ErrorCode::decode_error. Values outside
// their physical range decode with valid = false.
ErrorCode decode_frame(SourceId source, const std::uint8_t *data, std::size_t length,
                       SensorFrame &out);
ErrorCode decode_notification(const RawNotification &note, SensorFrame &out);

// Inverse of decode_frame for the raw payload vector.
ErrorCode encode_frame(const SensorFrame &frame, std::vector<std::uint8_t> &out);

// Config characteristic
ErrorCode decode_config(const std::uint8_t *data, std::size_t length, SensorConfig &out);
ErrorCode encode_config(const SensorConfig &config, std::vector<std::uint8_t> &out);
ErrorCode validate_config(const SensorConfig &config);
ErrorCode apply_change(const ConfigChange &change, SensorConfig &config);

// Enumeration lookups. Return false if value is not in the table.
bool accel_gyro_rate_index(float hz, std::uint8_t &index);
bool mag_rate_index(float hz, std::uint8_t &index);
bool accel_range_index(float g, std::uint8_t &index);
bool gyro_range_index(float dps, std::uint8_t &index);
bool mag_range_index(float gauss, std::uint8_t &index);

// Device information strings and clock
ErrorCode decode_string(const std::uint8_t *data, std::size_t length, std::string &out);
ErrorCode decode_timestamp(const std::uint8_t *data, std::size_t length, std::uint32_t &unix_s);
void      encode_timestamp(std::uint32_t unix_s, std::vector<std::uint8_t> &out);

// Joystick deflection in percent of full travel, 0 inside the deadzone.
float joystick_percent(int raw);

// Full-scale magnitude per channel for a source under the given config.
void full_scale(SourceId source, const SensorConfig &config, std::vector<float> &out);

} // namespace codec
} // namespace vrglove
