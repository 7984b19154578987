// vrglove/align/imu_pair_aligner.cpp
#include "imu_pair_aligner.hpp"

#include <algorithm>
#include <cmath>

namespace vrglove {

ImuPairAligner::ImuPairAligner(std::chrono::milliseconds tolerance, SourceId first,
                               SourceId second, std::size_t max_pending)
    : tolerance_(tolerance)
    , first_(first)
    , second_(second)
    , max_pending_(max_pending == 0 ? 1 : max_pending)
{}

void ImuPairAligner::expire(std::deque<FramePtr>& queue, TimePoint now, std::uint64_t& unmatched) {
    while (!queue.empty() && queue.front()->timestamp + tolerance_ < now) {
        queue.pop_front();
        ++unmatched;
    }
}

void ImuPairAligner::record(const ImuPair& pair) {
    const double skew_ms = std::fabs(std::chrono::duration<double, std::milli>(pair.skew).count());
    ++stats_.pairs;
    abs_skew_sum_ms_ += skew_ms;
    stats_.mean_abs_skew_ms = abs_skew_sum_ms_ / static_cast<double>(stats_.pairs);
    stats_.max_abs_skew_ms = std::max(stats_.max_abs_skew_ms, skew_ms);
}

void ImuPairAligner::push(const FramePtr& frame, std::vector<ImuPair>& out) {
    if (!frame) return;
    const bool is_first = frame->source == first_;
    if (!is_first && frame->source != second_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    std::deque<FramePtr>& mine  = is_first ? pending_first_ : pending_second_;
    std::deque<FramePtr>& other = is_first ? pending_second_ : pending_first_;
    std::uint64_t& mine_unmatched  = is_first ? stats_.unmatched_first : stats_.unmatched_second;
    std::uint64_t& other_unmatched = is_first ? stats_.unmatched_second : stats_.unmatched_first;

    expire(other, frame->timestamp, other_unmatched);

    // Closest partner within tolerance.
    auto best = other.end();
    auto best_gap = std::chrono::nanoseconds::max();
    for (auto it = other.begin(); it != other.end(); ++it) {
        const auto gap = std::chrono::duration_cast<std::chrono::nanoseconds>(
            (*it)->timestamp > frame->timestamp ? (*it)->timestamp - frame->timestamp
                                                : frame->timestamp - (*it)->timestamp);
        if (gap <= tolerance_ && gap < best_gap) {
            best = it;
            best_gap = gap;
        }
    }

    if (best == other.end()) {
        mine.push_back(frame);
        while (mine.size() > max_pending_) {
            mine.pop_front();
            ++mine_unmatched;
        }
        return;
    }

    ImuPair pair;
    pair.first  = is_first ? frame : *best;
    pair.second = is_first ? *best : frame;
    pair.skew   = std::chrono::duration_cast<std::chrono::nanoseconds>(
        pair.second->timestamp - pair.first->timestamp);

    // Anything queued before the partner can no longer pair in order.
    other_unmatched += static_cast<std::uint64_t>(std::distance(other.begin(), best));
    other.erase(other.begin(), best + 1);

    record(pair);
    out.push_back(pair);
}

AlignStats ImuPairAligner::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void ImuPairAligner::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_first_.clear();
    pending_second_.clear();
    stats_ = AlignStats();
    abs_skew_sum_ms_ = 0.0;
}

} // namespace vrglove
