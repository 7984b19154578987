// protocol_data.hpp
#pragma once
#include <array>
#include <cstdint>
#include <cstddef>

namespace vrglove {

// Characteristics exposed by the glove peripheral.
enum class CharId : std::uint8_t {
    battery_level = 0,
    battery_charging,
    firmware,
    hardware,
    model,
    manufacturer,
    config,
    imu1_raw,
    imu2_raw,
    imu1_euler,
    imu2_euler,
    timestamp,
    overall_status,
    flex,
    force,
    joystick,
    buttons,
    count
};

constexpr std::size_t kCharCount = static_cast<std::size_t>(CharId::count);

struct CharInfo {
    CharId      id;
    const char* name;
    const char* uuid;        // canonical lowercase form
    std::size_t length;      // 0 = variable (strings)
    bool        notify;
    bool        writable;
    bool        required;    // session fails without it
};

struct GattProtocol {
    // Payload sizes
    static constexpr std::size_t IMU_RAW_SIZE        = 18;  // 9 x i16
    static constexpr std::size_t IMU_EULER_SIZE      = 13;  // 3 x f32 + u8
    static constexpr std::size_t CONFIG_SIZE         = 15;
    static constexpr std::size_t FLEX_SIZE           = 20;  // 5 x f32
    static constexpr std::size_t FORCE_SIZE          = 4;
    static constexpr std::size_t JOYSTICK_SIZE       = 5;
    static constexpr std::size_t BUTTONS_SIZE        = 4;
    static constexpr std::size_t STATUS_SIZE         = 4;
    static constexpr std::size_t BATTERY_SIZE        = 1;
    static constexpr std::size_t TIMESTAMP_SIZE      = 4;
    static constexpr std::size_t MAX_STRING_SIZE     = 32;

    // Config byte positions
    static constexpr std::size_t CFG_COMMAND_POS           = 0;
    static constexpr std::size_t CFG_IMU1_AG_FREQ_POS      = 1;
    static constexpr std::size_t CFG_IMU1_MAG_FREQ_POS     = 2;
    static constexpr std::size_t CFG_IMU2_AG_FREQ_POS      = 3;
    static constexpr std::size_t CFG_IMU2_MAG_FREQ_POS     = 4;
    static constexpr std::size_t CFG_IMU1_ACCEL_RANGE_POS  = 5;
    static constexpr std::size_t CFG_IMU1_GYRO_RANGE_POS   = 6;
    static constexpr std::size_t CFG_IMU1_MAG_RANGE_POS    = 7;
    static constexpr std::size_t CFG_IMU2_ACCEL_RANGE_POS  = 8;
    static constexpr std::size_t CFG_IMU2_GYRO_RANGE_POS   = 9;
    static constexpr std::size_t CFG_IMU2_MAG_RANGE_POS    = 10;
    static constexpr std::size_t CFG_UPDATE_RATE_POS       = 11;  // u16 LE, ms

    enum class Command : std::uint8_t {
        idle            = 0,
        run             = 1,
        calibrate_imu1  = 2,
        calibrate_imu2  = 3
    };

    // Index -> value enumeration tables
    static constexpr std::array<float, 6> ACCEL_GYRO_FREQ_HZ = {12.5f, 26.0f, 52.0f, 104.0f, 208.0f, 416.0f};
    static constexpr std::array<float, 8> MAG_FREQ_HZ        = {0.625f, 1.25f, 2.5f, 5.0f, 10.0f, 20.0f, 40.0f, 80.0f};
    static constexpr std::array<float, 4> ACCEL_RANGE_G      = {2.0f, 4.0f, 8.0f, 16.0f};
    static constexpr std::array<float, 5> GYRO_RANGE_DPS     = {125.0f, 250.0f, 500.0f, 1000.0f, 2000.0f};
    static constexpr std::array<float, 4> MAG_RANGE_GAUSS    = {4.0f, 8.0f, 12.0f, 16.0f};

    // Unit conversion
    static constexpr float GYRO_LSB_RAD_S    = 0.01f;
    static constexpr int   JOYSTICK_MAX      = 4095;
    static constexpr float JOYSTICK_CENTER   = 2048.0f;
    static constexpr float JOYSTICK_DEADZONE = 100.0f;
};

// Characteristic table, indexed by CharId.
constexpr std::array<CharInfo, kCharCount> kCharTable = {{
    {CharId::battery_level,    "battery_level",    "2a19",                                 GattProtocol::BATTERY_SIZE,   true,  false, false},
    {CharId::battery_charging, "battery_charging", "6e401301-b5a3-f393-e0a9-e50e24dcca9e", GattProtocol::BATTERY_SIZE,   true,  false, false},
    {CharId::firmware,         "firmware",         "2a26",                                 0,                            false, false, false},
    {CharId::hardware,         "hardware",         "2a27",                                 0,                            false, false, false},
    {CharId::model,            "model",            "2a24",                                 0,                            false, false, true},
    {CharId::manufacturer,     "manufacturer",     "2a29",                                 0,                            false, false, false},
    {CharId::config,           "config",           "6e401001-b5a3-f393-e0a9-e50e24dcca9e", GattProtocol::CONFIG_SIZE,    true,  true,  true},
    {CharId::imu1_raw,         "imu1_raw",         "6e401101-b5a3-f393-e0a9-e50e24dcca9e", GattProtocol::IMU_RAW_SIZE,   true,  false, true},
    {CharId::imu2_raw,         "imu2_raw",         "6e401102-b5a3-f393-e0a9-e50e24dcca9e", GattProtocol::IMU_RAW_SIZE,   true,  false, true},
    {CharId::imu1_euler,       "imu1_euler",       "6e401111-b5a3-f393-e0a9-e50e24dcca9e", GattProtocol::IMU_EULER_SIZE, true,  false, false},
    {CharId::imu2_euler,       "imu2_euler",       "6e401112-b5a3-f393-e0a9-e50e24dcca9e", GattProtocol::IMU_EULER_SIZE, true,  false, false},
    {CharId::timestamp,        "timestamp",        "6e401201-b5a3-f393-e0a9-e50e24dcca9e", GattProtocol::TIMESTAMP_SIZE, false, true,  false},
    {CharId::overall_status,   "overall_status",   "6e401202-b5a3-f393-e0a9-e50e24dcca9e", GattProtocol::STATUS_SIZE,    true,  false, false},
    {CharId::flex,             "flex",             "6e401401-b5a3-f393-e0a9-e50e24dcca9e", GattProtocol::FLEX_SIZE,      true,  false, false},
    {CharId::force,            "force",            "6e401402-b5a3-f393-e0a9-e50e24dcca9e", GattProtocol::FORCE_SIZE,     true,  false, false},
    {CharId::joystick,         "joystick",         "6e401501-b5a3-f393-e0a9-e50e24dcca9e", GattProtocol::JOYSTICK_SIZE,  true,  false, false},
    {CharId::buttons,          "buttons",          "6e401502-b5a3-f393-e0a9-e50e24dcca9e", GattProtocol::BUTTONS_SIZE,   true,  false, false},
}};

inline const CharInfo& char_info(CharId id) {
    return kCharTable[static_cast<std::size_t>(id)];
}

} // namespace vrglove
