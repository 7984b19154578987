// vrglove/router/telemetry_router.hpp
#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../config.h"
#include "../types.hpp"
#include "../transport/transport_session.hpp"
#include "../util/bounded_queue.hpp"

namespace vrglove {

class CalibrationEngine;

// A subscriber's private inbound queue. When full, the router evicts the
// oldest frame of this subscriber only and counts it.
class Subscription {
public:
    Subscription(std::string name, std::size_t capacity, std::vector<SourceId> sources);

    bool pop(FramePtr& out, std::chrono::milliseconds timeout) { return queue_.pop(out, timeout); }
    bool try_pop(FramePtr& out) { return queue_.try_pop(out); }

    const std::string& name() const { return name_; }
    std::uint64_t delivered() const { return delivered_.load(); }
    std::uint64_t dropped() const { return dropped_.load(); }
    std::size_t   pending() const { return queue_.size(); }
    bool          wants(SourceId source) const;

    void close() { queue_.close(); }

private:
    friend class TelemetryRouter;
    void offer(const FramePtr& frame);

    std::string                 name_;
    std::vector<SourceId>       sources_;   // empty = every source
    BoundedQueue<FramePtr>      queue_;
    std::atomic<std::uint64_t>  delivered_{0};
    std::atomic<std::uint64_t>  dropped_{0};
};

typedef std::shared_ptr<Subscription> SubscriptionPtr;

struct RouterStats {
    std::uint64_t received = 0;
    std::uint64_t published = 0;
    std::uint64_t decode_errors = 0;
    std::uint64_t reordered = 0;     // timestamps bumped to keep per-source order
    std::array<std::uint64_t, kSourceCount> per_source{};
};

// Single ingress point: drains the transport's notification channel on its
// own thread, decodes, applies calibration and fans the immutable frame out
// to every subscriber without ever blocking on one of them.
class TelemetryRouter {
public:
    TelemetryRouter(std::shared_ptr<NotificationQueue> ingress,
                    std::shared_ptr<CalibrationEngine> calibration);
    ~TelemetryRouter();

    TelemetryRouter(const TelemetryRouter&) = delete;
    TelemetryRouter& operator=(const TelemetryRouter&) = delete;

    bool start();
    void stop();
    bool running() const { return running_.load(); }

    SubscriptionPtr subscribe(const std::string& name,
                              std::size_t capacity = kSubscriberQueueCapacity,
                              std::vector<SourceId> sources = {});
    void unsubscribe(const SubscriptionPtr& subscription);

    // Decode + publish one notification on the caller's thread.
    void dispatch(const RawNotification& note);
    // Publish an already decoded frame.
    void publish(SensorFrame frame);

    RouterStats stats() const;

private:
    void run();

    typedef std::vector<SubscriptionPtr> SubscriberList;

    std::shared_ptr<NotificationQueue>          ingress_;
    std::shared_ptr<CalibrationEngine>          calibration_;
    std::shared_ptr<const SubscriberList>       subscribers_;   // copy-on-write, swapped under subscribe_mutex_
    std::mutex                                  subscribe_mutex_;

    std::mutex                                  order_mutex_;
    std::array<TimePoint, kSourceCount>         last_ts_{};

    std::atomic<bool>                           running_{false};
    std::thread                                 thread_;

    std::atomic<std::uint64_t>                  received_{0};
    std::atomic<std::uint64_t>                  published_{0};
    std::atomic<std::uint64_t>                  decode_errors_{0};
    std::atomic<std::uint64_t>                  reordered_{0};
    std::array<std::atomic<std::uint64_t>, kSourceCount> per_source_{};
};

} // namespace vrglove
