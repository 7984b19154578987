// vrglove/codec/characteristic_codec.cpp
#include "characteristic_codec.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace vrglove {
namespace codec {

using P = GattProtocol;

static constexpr float kFlexFullScaleKohm  = 100.0f;
static constexpr float kDegToRad           = 3.14159265358979f / 180.0f;
static constexpr float kGaussToMicroTesla  = 100.0f;
static constexpr float kTableEpsilon       = 1e-3f;

// ---- Little-endian helpers ----
static inline uint16_t read_u16_le(const uint8_t *p) {
    return static_cast<uint16_t>(p[0]) |
           static_cast<uint16_t>(p[1]) << 8;
}

static inline int16_t read_i16_le(const uint8_t *p) {
    return static_cast<int16_t>(read_u16_le(p));
}

static inline uint32_t read_u32_le(const uint8_t *p) {
    return static_cast<uint32_t>(p[0])
         | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16)
         | (static_cast<uint32_t>(p[3]) << 24);
}

static inline float read_f32_le(const uint8_t *p) {
    uint32_t bits = read_u32_le(p);
    float v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

static inline void write_u16_le(std::vector<uint8_t> &out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

static inline void write_i16_le(std::vector<uint8_t> &out, int16_t v) {
    write_u16_le(out, static_cast<uint16_t>(v));
}

static inline void write_u32_le(std::vector<uint8_t> &out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

static inline void write_f32_le(std::vector<uint8_t> &out, float v) {
    uint32_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    write_u32_le(out, bits);
}

// Range is checked after rounding: scaled values land a hair outside the
// i16 limits (-32768 * 0.01f / 0.01f < -32768.0f).
static inline bool fits_i16(float v) {
    if (!std::isfinite(v) || std::fabs(v) > 40000.0f) return false;
    const long r = std::lround(v);
    return r >= -32768 && r <= 32767;
}

static inline int16_t to_i16(float v) {
    return static_cast<int16_t>(std::lround(v));
}

template <std::size_t N>
static bool lookup(const std::array<float, N> &table, float value, uint8_t &index) {
    for (std::size_t i = 0; i < N; ++i) {
        if (std::fabs(table[i] - value) < kTableEpsilon) {
            index = static_cast<uint8_t>(i);
            return true;
        }
    }
    return false;
}

bool accel_gyro_rate_index(float hz, uint8_t &index)  { return lookup(P::ACCEL_GYRO_FREQ_HZ, hz, index); }
bool mag_rate_index(float hz, uint8_t &index)         { return lookup(P::MAG_FREQ_HZ, hz, index); }
bool accel_range_index(float g, uint8_t &index)       { return lookup(P::ACCEL_RANGE_G, g, index); }
bool gyro_range_index(float dps, uint8_t &index)      { return lookup(P::GYRO_RANGE_DPS, dps, index); }
bool mag_range_index(float gauss, uint8_t &index)     { return lookup(P::MAG_RANGE_GAUSS, gauss, index); }

float joystick_percent(int raw) {
    const float d = static_cast<float>(raw) - P::JOYSTICK_CENTER;
    if (std::fabs(d) <= P::JOYSTICK_DEADZONE) return 0.0f;
    // Travel differs by one count between the two halves of 0..4095.
    const float span = d > 0.0f ? static_cast<float>(P::JOYSTICK_MAX) - P::JOYSTICK_CENTER
                                : P::JOYSTICK_CENTER;
    const float pct = (std::fabs(d) - P::JOYSTICK_DEADZONE) / (span - P::JOYSTICK_DEADZONE) * 100.0f;
    return d > 0.0f ? std::min(pct, 100.0f) : -std::min(pct, 100.0f);
}

// ---- Per-characteristic decoders ----

static void decode_imu_raw(const uint8_t *p, SensorFrame &out) {
    out.raw.resize(9);
    for (int i = 0; i < 3; ++i) {
        out.raw[i] = static_cast<float>(read_i16_le(p + 2 * i));                          // mg
    }
    for (int i = 3; i < 6; ++i) {
        out.raw[i] = static_cast<float>(read_i16_le(p + 2 * i)) * P::GYRO_LSB_RAD_S;      // rad/s
    }
    for (int i = 6; i < 9; ++i) {
        out.raw[i] = static_cast<float>(read_i16_le(p + 2 * i));                          // uT
    }
}

static void decode_imu_euler(const uint8_t *p, SensorFrame &out) {
    out.raw.resize(4);
    out.raw[0] = read_f32_le(p + 0);
    out.raw[1] = read_f32_le(p + 4);
    out.raw[2] = read_f32_le(p + 8);
    out.raw[3] = static_cast<float>(p[12]);
    for (int i = 0; i < 3; ++i) {
        if (!std::isfinite(out.raw[i])) out.valid = false;
    }
}

static void decode_joystick(const uint8_t *p, SensorFrame &out) {
    const int x = read_i16_le(p + 0);
    const int y = read_i16_le(p + 2);
    out.raw.resize(5);
    out.raw[0] = static_cast<float>(x);
    out.raw[1] = static_cast<float>(y);
    out.raw[2] = joystick_percent(x);
    out.raw[3] = joystick_percent(y);
    out.raw[4] = static_cast<float>(p[4]);
    if (x < 0 || x > P::JOYSTICK_MAX || y < 0 || y > P::JOYSTICK_MAX || p[4] > 1) {
        out.valid = false;
    }
}

static void decode_floats(const uint8_t *p, std::size_t count, SensorFrame &out) {
    out.raw.resize(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.raw[i] = read_f32_le(p + 4 * i);
        if (!std::isfinite(out.raw[i])) out.valid = false;
    }
}

static void decode_bytes(const uint8_t *p, std::size_t count, uint8_t max_value, SensorFrame &out) {
    out.raw.resize(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.raw[i] = static_cast<float>(p[i]);
        if (p[i] > max_value) out.valid = false;
    }
}

ErrorCode decode_frame(SourceId source, const uint8_t *data, std::size_t length,
                       SensorFrame &out)
{
    const CharId ch = source_char(source);
    if (ch == CharId::count) return ErrorCode::invalid_argument;
    if (!data || length != char_info(ch).length) return ErrorCode::decode_error;

    out.source = source;
    out.valid = true;
    out.calibrated = false;

    switch (source) {
    case SourceId::imu1:
    case SourceId::imu2:
        decode_imu_raw(data, out);
        break;
    case SourceId::imu1_euler:
    case SourceId::imu2_euler:
        decode_imu_euler(data, out);
        break;
    case SourceId::joystick:
        decode_joystick(data, out);
        break;
    case SourceId::buttons:
        decode_bytes(data, P::BUTTONS_SIZE, 1, out);
        break;
    case SourceId::pressure:
        decode_floats(data, 1, out);
        break;
    case SourceId::flex:
        decode_floats(data, 5, out);
        break;
    case SourceId::battery:
        decode_bytes(data, 1, 100, out);
        break;
    case SourceId::charging:
        decode_bytes(data, 1, 2, out);
        break;
    case SourceId::status:
        decode_bytes(data, P::STATUS_SIZE, 3, out);
        break;
    default:
        return ErrorCode::invalid_argument;
    }

    out.values = out.raw;
    return ErrorCode::ok;
}

ErrorCode decode_notification(const RawNotification &note, SensorFrame &out) {
    SourceId source;
    if (!char_source(note.characteristic, source)) return ErrorCode::invalid_argument;
    ErrorCode rc = decode_frame(source, note.payload.data(), note.payload.size(), out);
    if (rc == ErrorCode::ok) {
        out.timestamp = note.timestamp;
    }
    return rc;
}

// ---- Encoders ----

static ErrorCode encode_bytes(const SensorFrame &frame, std::size_t count, std::vector<uint8_t> &out) {
    if (frame.raw.size() != count) return ErrorCode::invalid_argument;
    for (std::size_t i = 0; i < count; ++i) {
        const float v = frame.raw[i];
        if (v < 0.0f || v > 255.0f) return ErrorCode::invalid_argument;
        out.push_back(static_cast<uint8_t>(std::lround(v)));
    }
    return ErrorCode::ok;
}

ErrorCode encode_frame(const SensorFrame &frame, std::vector<uint8_t> &out) {
    out.clear();
    const std::vector<float> &v = frame.raw;

    switch (frame.source) {
    case SourceId::imu1:
    case SourceId::imu2: {
        if (v.size() != 9) return ErrorCode::invalid_argument;
        for (int i = 0; i < 9; ++i) {
            const float lsb = (i >= 3 && i < 6) ? v[i] / P::GYRO_LSB_RAD_S : v[i];
            if (!fits_i16(lsb)) return ErrorCode::invalid_argument;
            write_i16_le(out, to_i16(lsb));
        }
        return ErrorCode::ok;
    }
    case SourceId::imu1_euler:
    case SourceId::imu2_euler:
        if (v.size() != 4 || v[3] < 0.0f || v[3] > 255.0f) return ErrorCode::invalid_argument;
        write_f32_le(out, v[0]);
        write_f32_le(out, v[1]);
        write_f32_le(out, v[2]);
        out.push_back(static_cast<uint8_t>(std::lround(v[3])));
        return ErrorCode::ok;
    case SourceId::joystick:
        if (v.size() != 5 || !fits_i16(v[0]) || !fits_i16(v[1]) ||
            v[4] < 0.0f || v[4] > 255.0f) {
            return ErrorCode::invalid_argument;
        }
        write_i16_le(out, to_i16(v[0]));
        write_i16_le(out, to_i16(v[1]));
        out.push_back(static_cast<uint8_t>(std::lround(v[4])));
        return ErrorCode::ok;
    case SourceId::buttons:
        return encode_bytes(frame, P::BUTTONS_SIZE, out);
    case SourceId::pressure:
    case SourceId::flex: {
        const std::size_t n = frame.source == SourceId::flex ? 5 : 1;
        if (v.size() != n) return ErrorCode::invalid_argument;
        for (float f : v) write_f32_le(out, f);
        return ErrorCode::ok;
    }
    case SourceId::battery:
    case SourceId::charging:
        return encode_bytes(frame, 1, out);
    case SourceId::status:
        return encode_bytes(frame, P::STATUS_SIZE, out);
    default:
        return ErrorCode::invalid_argument;
    }
}

// ---- Config ----

struct ImuPositions {
    std::size_t ag_freq, mag_freq, accel_range, gyro_range, mag_range;
};

static const ImuPositions kImuPositions[2] = {
    {P::CFG_IMU1_AG_FREQ_POS, P::CFG_IMU1_MAG_FREQ_POS,
     P::CFG_IMU1_ACCEL_RANGE_POS, P::CFG_IMU1_GYRO_RANGE_POS, P::CFG_IMU1_MAG_RANGE_POS},
    {P::CFG_IMU2_AG_FREQ_POS, P::CFG_IMU2_MAG_FREQ_POS,
     P::CFG_IMU2_ACCEL_RANGE_POS, P::CFG_IMU2_GYRO_RANGE_POS, P::CFG_IMU2_MAG_RANGE_POS},
};

template <std::size_t N>
static bool from_index(const std::array<float, N> &table, uint8_t index, float &value) {
    if (index >= N) return false;
    value = table[index];
    return true;
}

ErrorCode decode_config(const uint8_t *data, std::size_t length, SensorConfig &out) {
    if (!data || length != P::CONFIG_SIZE) return ErrorCode::decode_error;
    if (data[P::CFG_COMMAND_POS] > static_cast<uint8_t>(P::Command::calibrate_imu2)) {
        return ErrorCode::decode_error;
    }

    SensorConfig cfg;
    cfg.command = data[P::CFG_COMMAND_POS];
    for (int i = 0; i < 2; ++i) {
        const ImuPositions &pos = kImuPositions[i];
        ImuConfig &imu = cfg.imu[i];
        if (!from_index(P::ACCEL_GYRO_FREQ_HZ, data[pos.ag_freq], imu.accel_gyro_rate_hz) ||
            !from_index(P::MAG_FREQ_HZ, data[pos.mag_freq], imu.mag_rate_hz) ||
            !from_index(P::ACCEL_RANGE_G, data[pos.accel_range], imu.accel_range_g) ||
            !from_index(P::GYRO_RANGE_DPS, data[pos.gyro_range], imu.gyro_range_dps) ||
            !from_index(P::MAG_RANGE_GAUSS, data[pos.mag_range], imu.mag_range_gauss)) {
            return ErrorCode::decode_error;
        }
    }
    cfg.update_rate_ms = read_u16_le(data + P::CFG_UPDATE_RATE_POS);
    out = cfg;
    return ErrorCode::ok;
}

ErrorCode validate_config(const SensorConfig &config) {
    uint8_t idx;
    if (config.command > static_cast<uint8_t>(P::Command::calibrate_imu2)) {
        return ErrorCode::invalid_config;
    }
    for (const ImuConfig &imu : config.imu) {
        if (!accel_gyro_rate_index(imu.accel_gyro_rate_hz, idx) ||
            !mag_rate_index(imu.mag_rate_hz, idx) ||
            !accel_range_index(imu.accel_range_g, idx) ||
            !gyro_range_index(imu.gyro_range_dps, idx) ||
            !mag_range_index(imu.mag_range_gauss, idx)) {
            return ErrorCode::invalid_config;
        }
    }
    if (config.update_rate_ms == 0) return ErrorCode::invalid_config;
    return ErrorCode::ok;
}

ErrorCode encode_config(const SensorConfig &config, std::vector<uint8_t> &out) {
    ErrorCode rc = validate_config(config);
    if (rc != ErrorCode::ok) return rc;

    std::vector<uint8_t> buf(P::CONFIG_SIZE, 0);
    buf[P::CFG_COMMAND_POS] = config.command;
    for (int i = 0; i < 2; ++i) {
        const ImuPositions &pos = kImuPositions[i];
        const ImuConfig &imu = config.imu[i];
        accel_gyro_rate_index(imu.accel_gyro_rate_hz, buf[pos.ag_freq]);
        mag_rate_index(imu.mag_rate_hz, buf[pos.mag_freq]);
        accel_range_index(imu.accel_range_g, buf[pos.accel_range]);
        gyro_range_index(imu.gyro_range_dps, buf[pos.gyro_range]);
        mag_range_index(imu.mag_range_gauss, buf[pos.mag_range]);
    }
    buf[P::CFG_UPDATE_RATE_POS]     = static_cast<uint8_t>(config.update_rate_ms & 0xFF);
    buf[P::CFG_UPDATE_RATE_POS + 1] = static_cast<uint8_t>((config.update_rate_ms >> 8) & 0xFF);
    out.swap(buf);
    return ErrorCode::ok;
}

ErrorCode apply_change(const ConfigChange &change, SensorConfig &config) {
    if (change.imu != 1 && change.imu != 2) return ErrorCode::invalid_config;
    uint8_t idx;
    ImuConfig &imu = config.imu[change.imu - 1];

    switch (change.field) {
    case ConfigField::accel_gyro_rate:
        if (!accel_gyro_rate_index(change.value, idx)) return ErrorCode::invalid_config;
        imu.accel_gyro_rate_hz = P::ACCEL_GYRO_FREQ_HZ[idx];
        break;
    case ConfigField::mag_rate:
        if (!mag_rate_index(change.value, idx)) return ErrorCode::invalid_config;
        imu.mag_rate_hz = P::MAG_FREQ_HZ[idx];
        break;
    case ConfigField::accel_range:
        if (!accel_range_index(change.value, idx)) return ErrorCode::invalid_config;
        imu.accel_range_g = P::ACCEL_RANGE_G[idx];
        break;
    case ConfigField::gyro_range:
        if (!gyro_range_index(change.value, idx)) return ErrorCode::invalid_config;
        imu.gyro_range_dps = P::GYRO_RANGE_DPS[idx];
        break;
    case ConfigField::mag_range:
        if (!mag_range_index(change.value, idx)) return ErrorCode::invalid_config;
        imu.mag_range_gauss = P::MAG_RANGE_GAUSS[idx];
        break;
    default:
        return ErrorCode::invalid_config;
    }
    return ErrorCode::ok;
}

// ---- Strings / clock ----

ErrorCode decode_string(const uint8_t *data, std::size_t length, std::string &out) {
    if (!data || length == 0 || length > P::MAX_STRING_SIZE) return ErrorCode::decode_error;
    std::size_t n = length;
    while (n > 0 && data[n - 1] == 0) --n;   // trailing NULs
    out.assign(reinterpret_cast<const char *>(data), n);
    return ErrorCode::ok;
}

ErrorCode decode_timestamp(const uint8_t *data, std::size_t length, uint32_t &unix_s) {
    if (!data || length != P::TIMESTAMP_SIZE) return ErrorCode::decode_error;
    unix_s = read_u32_le(data);
    return ErrorCode::ok;
}

void encode_timestamp(uint32_t unix_s, std::vector<uint8_t> &out) {
    out.clear();
    write_u32_le(out, unix_s);
}

// ---- Full scale ----

void full_scale(SourceId source, const SensorConfig &config, std::vector<float> &out) {
    out.clear();
    switch (source) {
    case SourceId::imu1:
    case SourceId::imu2: {
        const ImuConfig &imu = config.imu[source == SourceId::imu1 ? 0 : 1];
        out.insert(out.end(), 3, imu.accel_range_g * 1000.0f);
        out.insert(out.end(), 3, imu.gyro_range_dps * kDegToRad);
        out.insert(out.end(), 3, imu.mag_range_gauss * kGaussToMicroTesla);
        break;
    }
    case SourceId::imu1_euler:
    case SourceId::imu2_euler:
        out = {180.0f, 180.0f, 180.0f, 3.0f};
        break;
    case SourceId::joystick:
        out = {P::JOYSTICK_CENTER, P::JOYSTICK_CENTER, 100.0f, 100.0f, 1.0f};
        break;
    case SourceId::buttons:
        out.assign(P::BUTTONS_SIZE, 1.0f);
        break;
    case SourceId::pressure:
        out.assign(1, kFlexFullScaleKohm);
        break;
    case SourceId::flex:
        out.assign(5, kFlexFullScaleKohm);
        break;
    case SourceId::battery:
        out.assign(1, 100.0f);
        break;
    case SourceId::charging:
        out.assign(1, 2.0f);
        break;
    case SourceId::status:
        out.assign(P::STATUS_SIZE, 3.0f);
        break;
    default:
        break;
    }
}

} // namespace codec
} // namespace vrglove
