// vrglove/router/telemetry_router.cpp
#include "telemetry_router.hpp"
#include "../calibration/calibration_engine.hpp"
#include "../codec/characteristic_codec.hpp"
#include "../log.h"

#include <algorithm>

namespace vrglove {

static Logger::ptr g_logger = VRGLOVE_LOG_NAME("router");

Subscription::Subscription(std::string name, std::size_t capacity, std::vector<SourceId> sources)
    : name_(std::move(name))
    , sources_(std::move(sources))
    , queue_(capacity)
{}

bool Subscription::wants(SourceId source) const {
    return sources_.empty() ||
           std::find(sources_.begin(), sources_.end(), source) != sources_.end();
}

void Subscription::offer(const FramePtr& frame) {
    if (queue_.push_drop_oldest(frame)) {
        ++dropped_;
    }
    ++delivered_;
}

TelemetryRouter::TelemetryRouter(std::shared_ptr<NotificationQueue> ingress,
                                 std::shared_ptr<CalibrationEngine> calibration)
    : ingress_(std::move(ingress))
    , calibration_(std::move(calibration))
    , subscribers_(std::make_shared<const SubscriberList>())
{}

TelemetryRouter::~TelemetryRouter() {
    stop();
}

bool TelemetryRouter::start() {
    if (running_.exchange(true)) return true;
    if (!ingress_) {
        running_ = false;
        VRGLOVE_LOG_ERROR(g_logger) << "no ingress channel";
        return false;
    }
    thread_ = std::thread(&TelemetryRouter::run, this);
    return true;
}

void TelemetryRouter::stop() {
    if (!running_.exchange(false)) return;
    if (thread_.joinable()) thread_.join();
}

SubscriptionPtr TelemetryRouter::subscribe(const std::string& name, std::size_t capacity,
                                           std::vector<SourceId> sources) {
    auto sub = std::make_shared<Subscription>(name, capacity, std::move(sources));
    std::lock_guard<std::mutex> lock(subscribe_mutex_);
    auto next = std::make_shared<SubscriberList>(*subscribers_);
    next->push_back(sub);
    subscribers_ = std::move(next);
    VRGLOVE_LOG_DEBUG(g_logger) << "subscriber '" << name << "' capacity " << capacity;
    return sub;
}

void TelemetryRouter::unsubscribe(const SubscriptionPtr& subscription) {
    if (!subscription) return;
    {
        std::lock_guard<std::mutex> lock(subscribe_mutex_);
        auto next = std::make_shared<SubscriberList>(*subscribers_);
        next->erase(std::remove(next->begin(), next->end(), subscription), next->end());
        subscribers_ = std::move(next);
    }
    subscription->close();
}

void TelemetryRouter::dispatch(const RawNotification& note) {
    ++received_;
    SensorFrame frame;
    ErrorCode rc = codec::decode_notification(note, frame);
    if (rc != ErrorCode::ok) {
        const std::uint64_t n = ++decode_errors_;
        // Log the first few, then every 1000th.
        if (n <= 5 || n % 1000 == 0) {
            VRGLOVE_LOG_WARN(g_logger) << "dropped " << char_info(note.characteristic).name
                                       << " payload of " << note.payload.size() << " bytes ("
                                       << n << " decode errors)";
        }
        return;
    }
    publish(std::move(frame));
}

void TelemetryRouter::publish(SensorFrame frame) {
    const auto idx = static_cast<std::size_t>(frame.source);
    if (idx >= kSourceCount) return;

    if (calibration_) calibration_->apply(frame);

    std::lock_guard<std::mutex> lock(order_mutex_);
    if (frame.timestamp <= last_ts_[idx] && last_ts_[idx] != TimePoint()) {
        frame.timestamp = last_ts_[idx] + std::chrono::nanoseconds(1);
        ++reordered_;
    }
    last_ts_[idx] = frame.timestamp;

    FramePtr shared = std::make_shared<const SensorFrame>(std::move(frame));
    std::shared_ptr<const SubscriberList> subscribers;
    {
        std::lock_guard<std::mutex> lock(subscribe_mutex_);
        subscribers = subscribers_;
    }
    for (const SubscriptionPtr& sub : *subscribers) {
        if (sub->wants(shared->source)) sub->offer(shared);
    }
    ++published_;
    ++per_source_[idx];
}

RouterStats TelemetryRouter::stats() const {
    RouterStats s;
    s.received      = received_.load();
    s.published     = published_.load();
    s.decode_errors = decode_errors_.load();
    s.reordered     = reordered_.load();
    for (std::size_t i = 0; i < kSourceCount; ++i) {
        s.per_source[i] = per_source_[i].load();
    }
    return s;
}

void TelemetryRouter::run() {
    VRGLOVE_LOG_INFO(g_logger) << "router started";
    while (running_.load(std::memory_order_relaxed)) {
        RawNotification note;
        if (!ingress_->pop(note, std::chrono::milliseconds(50))) {
            if (ingress_->closed()) std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        dispatch(note);
    }
    VRGLOVE_LOG_INFO(g_logger) << "router stopped (" << published_.load() << " frames, "
                               << decode_errors_.load() << " decode errors)";
}

} // namespace vrglove
