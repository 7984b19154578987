#include "workers.hpp"
#include "../logger/stream_logger.hpp"
#include "../transport/transport_session.hpp"

#include <cstdio>
#include <thread>
#include <vector>

namespace vrglove {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
DisplayWorker::DisplayWorker(SubscriptionPtr subscription,
                             std::shared_ptr<TransportSession> session,
                             std::shared_ptr<TelemetryRouter> router,
                             std::shared_ptr<StreamLogger> logger,
                             std::atomic<bool> &stop_flag,
                             std::chrono::milliseconds refresh)
    : sub_(std::move(subscription)),
      session_(std::move(session)),
      router_(std::move(router)),
      logger_(std::move(logger)),
      stop_flag_(stop_flag),
      refresh_(refresh)
{}

// -----------------------------------------------------------------------------
// Main loop
// -----------------------------------------------------------------------------
void DisplayWorker::operator()() {
    auto next_draw = Clock::now() + refresh_;
    auto last_time = Clock::now();
    uint64_t last_published = 0;
    double fps = 0.0;
    std::vector<ImuPair> pairs;

    while (!stop_flag_.load(std::memory_order_relaxed)) {
        // --- 1. drain frames until the next redraw ---
        FramePtr frame;
        const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next_draw - Clock::now());
        if (wait.count() > 0 && sub_->pop(frame, wait)) {
            latest_[static_cast<size_t>(frame->source)] = frame;
            pairs.clear();
            aligner_.push(frame, pairs);
            continue;
        }
        if (Clock::now() < next_draw) continue;
        next_draw = Clock::now() + refresh_;

        // --- 2. frame rate ---
        const auto now = Clock::now();
        const uint64_t published = router_->stats().published;
        const double dt = std::chrono::duration<double>(now - last_time).count();
        if (dt > 0.0) fps = static_cast<double>(published - last_published) / dt;
        last_published = published;
        last_time = now;

        // --- 3. draw ---
        draw_status_line(fps);
    }
    std::printf("\n");
    std::fflush(stdout);
}

// ============================================================================
//  STATUS LINE
// ============================================================================
void DisplayWorker::draw_status_line(double fps) {
    char buf[512];
    int n = std::snprintf(buf, sizeof(buf), "\r[%s]", to_string(session_->state()));

    auto append = [&](const char *fmt, auto... args) {
        if (n < 0 || n >= static_cast<int>(sizeof(buf))) return;
        n += std::snprintf(buf + n, sizeof(buf) - static_cast<size_t>(n), fmt, args...);
    };

    const FramePtr &bat = latest_[static_cast<size_t>(SourceId::battery)];
    if (bat && !bat->values.empty()) append(" bat %3.0f%%", bat->values[0]);

    const FramePtr &chg = latest_[static_cast<size_t>(SourceId::charging)];
    if (chg && !chg->values.empty()) append(chg->values[0] >= 2.0f ? " full" : chg->values[0] >= 1.0f ? " chg" : "");

    for (SourceId imu : {SourceId::imu1, SourceId::imu2}) {
        const FramePtr &f = latest_[static_cast<size_t>(imu)];
        if (f && f->values.size() >= 6) {
            append(" | %s a(%6.0f %6.0f %6.0f) g(%5.2f %5.2f %5.2f)%s", source_tag(imu),
                   f->values[0], f->values[1], f->values[2],
                   f->values[3], f->values[4], f->values[5],
                   f->calibrated ? "*" : "");
        }
    }

    const FramePtr &joy = latest_[static_cast<size_t>(SourceId::joystick)];
    if (joy && joy->values.size() >= 5) {
        append(" | joy %4.0f%% %4.0f%% %s", joy->values[2], joy->values[3], joy->values[4] > 0.5f ? "B" : "-");
    }

    const FramePtr &btn = latest_[static_cast<size_t>(SourceId::buttons)];
    if (btn && btn->values.size() >= 4) {
        append(" [%c%c%c%c]",
               btn->values[0] > 0.5f ? '1' : '.', btn->values[1] > 0.5f ? '2' : '.',
               btn->values[2] > 0.5f ? '3' : '.', btn->values[3] > 0.5f ? '4' : '.');
    }

    const AlignStats align = aligner_.stats();
    if (align.pairs > 0) append(" | skew %.1f/%.1f ms", align.mean_abs_skew_ms, align.max_abs_skew_ms);

    const RouterStats rs = router_->stats();
    append(" | %.0f fps drop %llu", fps, static_cast<unsigned long long>(sub_->dropped() + rs.decode_errors));

    if (logger_ && logger_->active()) {
        int degraded = 0;
        uint64_t written = 0;
        for (const StreamStatus &s : logger_->status()) {
            written += s.written;
            if (s.degraded) ++degraded;
        }
        append(" | rec %llu%s", static_cast<unsigned long long>(written), degraded ? " DEGRADED" : "");
    }

    std::fputs(buf, stdout);
    std::fflush(stdout);
}

} // namespace vrglove
