// vrglove/calibration/calibration_engine.cpp
#include "calibration_engine.hpp"
#include "../codec/characteristic_codec.hpp"
#include "../log.h"

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>

namespace vrglove {

static Logger::ptr g_logger = VRGLOVE_LOG_NAME("calibration");

static std::int64_t unix_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

CalibrationEngine::CalibrationEngine(CalibrationOptions options)
    : options_(options)
{
    if (options_.min_samples > options_.window) options_.min_samples = options_.window;
}

bool CalibrationEngine::channel_calibratable(Unit unit) {
    return unit != Unit::none && unit != Unit::state && unit != Unit::percent;
}

bool CalibrationEngine::calibratable(SourceId source) {
    for (const ChannelInfo& ch : channel_layout(source)) {
        if (channel_calibratable(ch.unit)) return true;
    }
    return false;
}

void CalibrationEngine::apply(SensorFrame& frame) {
    const auto idx = static_cast<std::size_t>(frame.source);
    if (idx >= kSourceCount) return;

    std::unique_lock<std::mutex> lock(mutex_);

    if (capture_.active && capture_.source == frame.source && frame.valid) {
        capture_.samples.push_back(frame.raw);
        if (static_cast<int>(capture_.samples.size()) >= options_.window) {
            capture_cv_.notify_all();
        }
    }

    if (has_profile_[idx]) {
        const CalibrationProfile& p = profiles_[idx];
        const Eigen::Index n = static_cast<Eigen::Index>(frame.raw.size());
        if (p.offset.size() == frame.raw.size() && p.scale.size() == frame.raw.size()) {
            frame.values.resize(frame.raw.size());
            Eigen::Map<const Eigen::ArrayXf> raw(frame.raw.data(), n);
            Eigen::Map<const Eigen::ArrayXf> offset(p.offset.data(), n);
            Eigen::Map<const Eigen::ArrayXf> scale(p.scale.data(), n);
            Eigen::Map<Eigen::ArrayXf> values(frame.values.data(), n);
            values = raw * scale - offset;

            // Corrected joystick counts are deflection from the learned center.
            if (frame.source == SourceId::joystick && n >= 4) {
                frame.values[2] = codec::joystick_percent(
                    static_cast<int>(std::lround(frame.values[0] + GattProtocol::JOYSTICK_CENTER)));
                frame.values[3] = codec::joystick_percent(
                    static_cast<int>(std::lround(frame.values[1] + GattProtocol::JOYSTICK_CENTER)));
            }
            frame.calibrated = true;
        }
    }

    if (frame.valid && calibratable(frame.source)) {
        auto& window = recent_[idx];
        window.push_back(frame.values);
        while (static_cast<int>(window.size()) > options_.drift_window) {
            window.pop_front();
        }
    }

    // Periodic drift check; the listener hears each crossing of the bound once.
    if (!frame.calibrated || options_.drift_check_every <= 0 ||
        ++since_drift_check_[idx] < options_.drift_check_every) {
        return;
    }
    since_drift_check_[idx] = 0;
    float drift = 0.0f;
    if (!estimate_drift(frame.source, drift)) return;
    profiles_[idx].drift = drift;
    const bool over = drift > options_.drift_bound;
    const bool crossed = over && !drift_flagged_[idx];
    drift_flagged_[idx] = over;
    if (!crossed) return;

    DriftListener listener = drift_listener_;
    lock.unlock();
    VRGLOVE_LOG_WARN(g_logger) << source_tag(frame.source) << " drifted to " << drift * 100.0f
                               << "% of full scale, recalibrate at rest";
    if (listener) listener(frame.source, drift);
}

bool CalibrationEngine::estimate_drift(SourceId source, float& drift) const {
    const auto& window = recent_[static_cast<std::size_t>(source)];
    const int needed = std::max(1, options_.drift_window / 2);
    if (static_cast<int>(window.size()) < needed) return false;

    const std::vector<ChannelInfo>& layout = channel_layout(source);
    const Eigen::Index n = static_cast<Eigen::Index>(layout.size());
    std::vector<float> fs;
    codec::full_scale(source, sensor_config_, fs);

    Eigen::ArrayXf sum = Eigen::ArrayXf::Zero(n);
    int count = 0;
    for (const auto& v : window) {
        if (static_cast<Eigen::Index>(v.size()) != n) continue;
        sum += Eigen::Map<const Eigen::ArrayXf>(v.data(), n);
        ++count;
    }
    if (count == 0) return false;
    const Eigen::ArrayXf mean = sum / static_cast<float>(count);

    drift = 0.0f;
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto ui = static_cast<std::size_t>(i);
        if (!channel_calibratable(layout[ui].unit) || ui >= fs.size() || fs[ui] <= 0.0f) continue;
        drift = std::max(drift, std::fabs(mean[i]) / fs[ui]);
    }
    return true;
}

void CalibrationEngine::reset_drift(std::size_t idx) {
    recent_[idx].clear();
    since_drift_check_[idx] = 0;
    drift_flagged_[idx] = false;
}

ErrorCode CalibrationEngine::zero_calibrate(SourceId source, CalibrationProfile& out) {
    const auto idx = static_cast<std::size_t>(source);
    if (idx >= kSourceCount || !calibratable(source)) {
        return ErrorCode::invalid_argument;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (capture_.active) return ErrorCode::device_busy;

    capture_.active = true;
    capture_.source = source;
    capture_.samples.clear();
    capture_.samples.reserve(static_cast<std::size_t>(options_.window));
    capture_cancelled_ = false;

    VRGLOVE_LOG_INFO(g_logger) << "zero calibration of " << source_tag(source)
                               << ": collecting " << options_.window << " samples";

    capture_cv_.wait_for(lock, options_.timeout, [this] {
        return capture_cancelled_ || static_cast<int>(capture_.samples.size()) >= options_.window;
    });

    std::vector<std::vector<float>> samples;
    samples.swap(capture_.samples);
    capture_.active = false;

    if (capture_cancelled_) {
        capture_cancelled_ = false;
        return ErrorCode::cancelled;
    }

    const std::vector<ChannelInfo>& layout = channel_layout(source);
    const std::size_t n = layout.size();
    samples.erase(std::remove_if(samples.begin(), samples.end(),
                                 [n](const std::vector<float>& s) { return s.size() != n; }),
                  samples.end());
    if (static_cast<int>(samples.size()) > options_.window) {
        samples.resize(static_cast<std::size_t>(options_.window));
    }

    if (static_cast<int>(samples.size()) < options_.min_samples) {
        VRGLOVE_LOG_WARN(g_logger) << "zero calibration of " << source_tag(source) << ": "
                                   << samples.size() << " samples, need " << options_.min_samples;
        return ErrorCode::insufficient_samples;
    }

    Eigen::ArrayXf scale = Eigen::ArrayXf::Ones(static_cast<Eigen::Index>(n));
    if (has_profile_[idx] && profiles_[idx].scale.size() == n) {
        scale = Eigen::Map<const Eigen::ArrayXf>(profiles_[idx].scale.data(), static_cast<Eigen::Index>(n));
    }

    Eigen::ArrayXf sum = Eigen::ArrayXf::Zero(static_cast<Eigen::Index>(n));
    for (const auto& s : samples) {
        sum += Eigen::Map<const Eigen::ArrayXf>(s.data(), static_cast<Eigen::Index>(n)) * scale;
    }
    const Eigen::ArrayXf mean = sum / static_cast<float>(samples.size());

    CalibrationProfile profile;
    profile.source = source;
    profile.offset.assign(n, 0.0f);
    profile.scale.assign(scale.data(), scale.data() + n);
    for (std::size_t i = 0; i < n; ++i) {
        if (channel_calibratable(layout[i].unit)) {
            profile.offset[i] = mean[static_cast<Eigen::Index>(i)];
        }
    }
    profile.drift = 0.0f;
    profile.calibrated_at_ms = unix_now_ms();
    profile.samples = static_cast<std::uint32_t>(samples.size());

    profiles_[idx] = profile;
    has_profile_[idx] = true;
    reset_drift(idx);
    out = profile;

    VRGLOVE_LOG_INFO(g_logger) << "zero calibration of " << source_tag(source) << " done ("
                               << profile.samples << " samples)";
    return ErrorCode::ok;
}

void CalibrationEngine::cancel_capture() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capture_.active) {
        capture_cancelled_ = true;
        capture_cv_.notify_all();
    }
}

ErrorCode CalibrationEngine::check_drift(SourceId source, float& drift) {
    const auto idx = static_cast<std::size_t>(source);
    if (idx >= kSourceCount || !calibratable(source)) return ErrorCode::invalid_argument;

    DriftListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!estimate_drift(source, drift)) return ErrorCode::insufficient_samples;
        if (has_profile_[idx]) {
            profiles_[idx].drift = drift;
        }
        drift_flagged_[idx] = drift > options_.drift_bound;
        if (!drift_flagged_[idx]) {
            return ErrorCode::ok;
        }
        listener = drift_listener_;
    }

    VRGLOVE_LOG_WARN(g_logger) << source_tag(source) << " drift " << drift * 100.0f
                               << "% of full scale exceeds " << options_.drift_bound * 100.0f << "%";
    if (listener) listener(source, drift);
    return ErrorCode::drift_exceeded;
}

ErrorCode CalibrationEngine::import_offsets(SourceId source, const std::vector<float>& offset,
                                            const std::vector<float>& scale) {
    const auto idx = static_cast<std::size_t>(source);
    if (idx >= kSourceCount || !calibratable(source)) return ErrorCode::invalid_argument;

    const std::size_t n = channel_layout(source).size();
    if (offset.size() != n || (!scale.empty() && scale.size() != n)) {
        VRGLOVE_LOG_ERROR(g_logger) << "import for " << source_tag(source) << ": expected " << n
                                    << " channels, got offset " << offset.size() << " scale " << scale.size();
        return ErrorCode::invalid_argument;
    }

    CalibrationProfile profile;
    profile.source = source;
    profile.offset = offset;
    profile.scale = scale.empty() ? std::vector<float>(n, 1.0f) : scale;
    profile.calibrated_at_ms = unix_now_ms();
    profile.samples = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    profiles_[idx] = profile;
    has_profile_[idx] = true;
    reset_drift(idx);
    VRGLOVE_LOG_INFO(g_logger) << "imported external offsets for " << source_tag(source);
    return ErrorCode::ok;
}

void CalibrationEngine::set_profile(const CalibrationProfile& profile) {
    const auto idx = static_cast<std::size_t>(profile.source);
    if (idx >= kSourceCount) return;
    const std::size_t n = channel_layout(profile.source).size();
    if (profile.offset.size() != n || profile.scale.size() != n) {
        VRGLOVE_LOG_WARN(g_logger) << "ignoring " << source_tag(profile.source)
                                   << " profile with " << profile.offset.size() << " channels";
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    profiles_[idx] = profile;
    has_profile_[idx] = true;
    reset_drift(idx);
}

bool CalibrationEngine::profile(SourceId source, CalibrationProfile& out) const {
    const auto idx = static_cast<std::size_t>(source);
    if (idx >= kSourceCount) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!has_profile_[idx]) return false;
    out = profiles_[idx];
    return true;
}

std::vector<CalibrationProfile> CalibrationEngine::profiles() const {
    std::vector<CalibrationProfile> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < kSourceCount; ++i) {
        if (has_profile_[i]) out.push_back(profiles_[i]);
    }
    return out;
}

void CalibrationEngine::clear(SourceId source) {
    const auto idx = static_cast<std::size_t>(source);
    if (idx >= kSourceCount) return;
    std::lock_guard<std::mutex> lock(mutex_);
    has_profile_[idx] = false;
    profiles_[idx] = CalibrationProfile();
    reset_drift(idx);
}

void CalibrationEngine::set_sensor_config(const SensorConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sensor_config_ = config;
}

void CalibrationEngine::set_drift_listener(DriftListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    drift_listener_ = std::move(listener);
}

} // namespace vrglove
