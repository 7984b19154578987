// vrglove/align/imu_pair_aligner.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "../config.h"
#include "../types.hpp"

namespace vrglove {

struct ImuPair {
    FramePtr                 first;     // imu1 side
    FramePtr                 second;    // imu2 side
    std::chrono::nanoseconds skew{0};   // second - first
};

struct AlignStats {
    std::uint64_t pairs = 0;
    std::uint64_t unmatched_first = 0;
    std::uint64_t unmatched_second = 0;
    double        mean_abs_skew_ms = 0.0;
    double        max_abs_skew_ms = 0.0;
};

// Pairs frames of the two IMUs by host capture time. Frames whose partner
// does not arrive within the tolerance are counted unmatched.
class ImuPairAligner {
public:
    explicit ImuPairAligner(std::chrono::milliseconds tolerance = std::chrono::milliseconds(kImuPairToleranceMs),
                            SourceId first = SourceId::imu1,
                            SourceId second = SourceId::imu2,
                            std::size_t max_pending = 256);

    // Feeds one frame; appends any completed pairs to out.
    void push(const FramePtr& frame, std::vector<ImuPair>& out);

    AlignStats stats() const;
    void       reset();

    std::chrono::milliseconds tolerance() const { return tolerance_; }

private:
    void expire(std::deque<FramePtr>& queue, TimePoint now, std::uint64_t& unmatched);
    void record(const ImuPair& pair);

    const std::chrono::milliseconds tolerance_;
    const SourceId                  first_;
    const SourceId                  second_;
    const std::size_t               max_pending_;

    mutable std::mutex              mutex_;
    std::deque<FramePtr>            pending_first_;
    std::deque<FramePtr>            pending_second_;
    AlignStats                      stats_;
    double                          abs_skew_sum_ms_ = 0.0;
};

} // namespace vrglove
