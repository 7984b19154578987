#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <memory>

#include "../align/imu_pair_aligner.hpp"
#include "../config.h"
#include "../router/telemetry_router.hpp"
#include "../types.hpp"

namespace vrglove {

class StreamLogger;
class TransportSession;
class ConfigRegistry;

// Drains a router subscription into the stream logger.
class RecordWorker {
public:
    RecordWorker(SubscriptionPtr subscription,
                 std::shared_ptr<StreamLogger> logger,
                 std::atomic<bool> &stop_flag);
    void operator()();

private:
    SubscriptionPtr                 sub_;
    std::shared_ptr<StreamLogger>   logger_;
    std::atomic<bool>              &stop_;
    uint64_t                        failures_ = 0;
};

// Console status line: link state, battery, IMU readings, joystick, router
// and logger counters, IMU pair skew. Redrawn every refresh interval.
class DisplayWorker {
public:
    DisplayWorker(SubscriptionPtr subscription,
                  std::shared_ptr<TransportSession> session,
                  std::shared_ptr<TelemetryRouter> router,
                  std::shared_ptr<StreamLogger> logger,
                  std::atomic<bool> &stop_flag,
                  std::chrono::milliseconds refresh = std::chrono::milliseconds(kDisplayRefreshMs));
    void operator()();

    const ImuPairAligner& aligner() const { return aligner_; }

private:
    SubscriptionPtr                         sub_;
    std::shared_ptr<TransportSession>       session_;
    std::shared_ptr<TelemetryRouter>        router_;
    std::shared_ptr<StreamLogger>           logger_;
    std::atomic<bool>                      &stop_flag_;
    std::chrono::milliseconds               refresh_;
    std::array<FramePtr, kSourceCount>      latest_;
    ImuPairAligner                          aligner_;

    void draw_status_line(double fps);
};

} // namespace vrglove
