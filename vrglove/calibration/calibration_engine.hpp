// vrglove/calibration/calibration_engine.hpp
#pragma once

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

#include "../config.h"
#include "../error.h"
#include "../types.hpp"

namespace vrglove {

struct CalibrationOptions {
    int                       window = kCalibrationWindow;
    int                       min_samples = kCalibrationMinSamples;
    std::chrono::milliseconds timeout{kCalibrationTimeoutMs};
    int                       drift_window = kDriftWindow;
    float                     drift_bound = kDriftBoundFraction;
    int                       drift_check_every = kDriftWindow;   // calibrated frames, 0 = manual only
};

// Per-source zero/offset/scale correction.
//
//   corrected = raw * scale - offset
//
// apply() runs on the router's ingress thread for every frame. Profiles are
// only mutated here and handed out as copies.
class CalibrationEngine {
public:
    using DriftListener = std::function<void(SourceId source, float drift)>;

    explicit CalibrationEngine(CalibrationOptions options = CalibrationOptions());

    void apply(SensorFrame& frame);

    // Captures options.window resting samples from the live stream and
    // stores offset = mean(raw * scale). Blocks up to options.timeout.
    ErrorCode zero_calibrate(SourceId source, CalibrationProfile& out);
    void      cancel_capture();

    // Mean corrected reading over the rolling window as a fraction of full
    // scale. Stores the estimate; drift_exceeded is advisory. apply() runs
    // the same check every options.drift_check_every calibrated frames.
    ErrorCode check_drift(SourceId source, float& drift);

    // Offsets from an external calibration tool. scale may be empty (ones).
    ErrorCode import_offsets(SourceId source, const std::vector<float>& offset,
                             const std::vector<float>& scale);

    void set_profile(const CalibrationProfile& profile);
    bool profile(SourceId source, CalibrationProfile& out) const;
    std::vector<CalibrationProfile> profiles() const;
    void clear(SourceId source);

    void set_sensor_config(const SensorConfig& config);
    void set_drift_listener(DriftListener listener);

    static bool calibratable(SourceId source);

private:
    struct Capture {
        bool                            active = false;
        SourceId                        source = SourceId::imu1;
        std::vector<std::vector<float>> samples;
    };

    static bool channel_calibratable(Unit unit);
    // mutex_ held
    bool estimate_drift(SourceId source, float& drift) const;
    void reset_drift(std::size_t idx);

    CalibrationOptions                                  options_;
    mutable std::mutex                                  mutex_;
    std::condition_variable                             capture_cv_;
    Capture                                             capture_;
    bool                                                capture_cancelled_ = false;
    std::array<CalibrationProfile, kSourceCount>        profiles_;
    std::array<bool, kSourceCount>                      has_profile_{};
    std::array<std::deque<std::vector<float>>, kSourceCount> recent_;
    std::array<int, kSourceCount>                       since_drift_check_{};
    std::array<bool, kSourceCount>                      drift_flagged_{};
    SensorConfig                                        sensor_config_;
    DriftListener                                       drift_listener_;
};

} // namespace vrglove
