#include "workers.hpp"
#include "../logger/stream_logger.hpp"
#include "../log.h"

namespace vrglove {

static Logger::ptr g_logger = VRGLOVE_LOG_NAME("record");

RecordWorker::RecordWorker(SubscriptionPtr subscription,
                           std::shared_ptr<StreamLogger> logger,
                           std::atomic<bool> &stop_flag)
    : sub_(std::move(subscription)), logger_(std::move(logger)), stop_(stop_flag) {}

void RecordWorker::operator()() {
    while (!stop_.load(std::memory_order_relaxed)) {
        FramePtr frame;
        if (!sub_->pop(frame, std::chrono::milliseconds(50))) continue;

        ErrorCode rc = logger_->append(frame);
        // A degraded stream keeps buffering on its own; note it and move on.
        if (rc != ErrorCode::ok && (++failures_ == 1 || failures_ % 1000 == 0)) {
            VRGLOVE_LOG_WARN(g_logger) << "append " << source_tag(frame->source) << ": "
                                       << to_string(rc) << " (" << failures_ << " so far)";
        }
    }

    // Hand over whatever is still queued.
    FramePtr frame;
    while (sub_->try_pop(frame)) {
        ErrorCode rc = logger_->append(frame);
        if (rc != ErrorCode::ok) ++failures_;
    }
}

} // namespace vrglove
