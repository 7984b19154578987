#include "vrglove/logger/stream_logger.hpp"
#include "test_common.hpp"

#include <atomic>
#include <filesystem>
#include <unistd.h>

using namespace vrglove;

namespace {

// FileSink that can be made to refuse writes, like a full or yanked disk.
class FlakySink : public LogSink {
public:
    explicit FlakySink(std::shared_ptr<std::atomic<bool>> failing) : failing_(std::move(failing)) {}

    ErrorCode open(const std::string& path) override { return file_.open(path); }
    ErrorCode write(const std::uint8_t* data, std::size_t size) override {
        if (failing_->load()) return ErrorCode::write_failure;
        return file_.write(data, size);
    }
    ErrorCode flush() override {
        if (failing_->load()) return ErrorCode::write_failure;
        return file_.flush();
    }
    void close() override { file_.close(); }

private:
    FileSink                            file_;
    std::shared_ptr<std::atomic<bool>>  failing_;
};

class UnopenableSink : public LogSink {
public:
    ErrorCode open(const std::string&) override { return ErrorCode::write_failure; }
    ErrorCode write(const std::uint8_t*, std::size_t) override { return ErrorCode::write_failure; }
    ErrorCode flush() override { return ErrorCode::write_failure; }
    void close() override {}
};

const std::vector<SourceId> kStreams = {
    SourceId::imu1, SourceId::imu2, SourceId::joystick,
    SourceId::flex, SourceId::battery, SourceId::buttons
};

FramePtr make_frame(SourceId source, int i, TimePoint t0) {
    auto f = std::make_shared<SensorFrame>();
    f->source = source;
    f->timestamp = t0 + std::chrono::milliseconds(i);
    f->has_seq = true;
    f->seq = static_cast<std::uint32_t>(i);
    const std::size_t n = channel_layout(source).size();
    for (std::size_t c = 0; c < n; ++c) {
        f->raw.push_back(static_cast<float>(i) + 0.25f * static_cast<float>(c));
    }
    f->values = f->raw;
    f->calibrated = (i % 2) == 0;
    return f;
}

std::string temp_root(const char* name) {
    return (std::filesystem::temp_directory_path() /
            (std::string("vrglove_") + name + "_" + std::to_string(::getpid()))).string();
}

} // namespace

static void test_failure_isolated_and_recovered() {
    const std::string root = temp_root("log");
    std::filesystem::remove_all(root);

    auto failing = std::make_shared<std::atomic<bool>>(false);
    StreamLoggerOptions options;
    options.retry_interval = std::chrono::milliseconds(20);
    StreamLogger logger(options, [failing](SourceId source) -> LogSink::ptr {
        if (source == SourceId::imu2) return LogSink::ptr(new FlakySink(failing));
        return LogSink::ptr(new FileSink());
    });

    std::atomic<int> errors{0};
    logger.set_error_listener([&errors](SourceId source, ErrorCode) {
        if (source == SourceId::imu2) ++errors;
    });

    DeviceHandle device;
    device.address = "D4:36:39:8A:11:02";
    device.name = "DegapVrGlove-R";
    DeviceInfo info;
    info.firmware = "1.4.2";
    VRGLOVE_CHECK(logger.start_session(root, kStreams, device, info) == ErrorCode::ok);
    VRGLOVE_CHECK(logger.active());
    VRGLOVE_CHECK(logger.session_id().size() == 8);
    VRGLOVE_CHECK(logger.start_session(root, kStreams, device, info) == ErrorCode::device_busy);

    const TimePoint t0 = Clock::now();
    for (int i = 0; i < 200; ++i) {
        for (SourceId s : kStreams) VRGLOVE_CHECK(logger.append(make_frame(s, i, t0)) == ErrorCode::ok);
    }
    VRGLOVE_CHECK(logger.flush_all() == ErrorCode::ok);

    // imu2's disk goes away; the others must not notice.
    failing->store(true);
    for (int i = 200; i < 400; ++i) {
        for (SourceId s : kStreams) {
            ErrorCode rc = logger.append(make_frame(s, i, t0));
            if (s != SourceId::imu2) VRGLOVE_CHECK(rc == ErrorCode::ok);
        }
    }
    StreamStatus st;
    VRGLOVE_CHECK(test::wait_for([&] { return logger.status(SourceId::imu2, st) && st.degraded; }));
    VRGLOVE_CHECK(test::wait_for([&] { return errors.load() == 1; }));
    VRGLOVE_CHECK(logger.flush(SourceId::imu2) == ErrorCode::write_failure);
    VRGLOVE_CHECK(logger.flush(SourceId::imu1) == ErrorCode::ok);

    failing->store(false);
    VRGLOVE_CHECK(test::wait_for([&] { return logger.status(SourceId::imu2, st) && !st.degraded; }));
    VRGLOVE_CHECK(logger.flush_all() == ErrorCode::ok);

    for (const StreamStatus& s : logger.status()) {
        VRGLOVE_CHECK(s.dropped == 0);
        VRGLOVE_CHECK(s.written == 400);
    }

    std::vector<std::string> paths;
    for (SourceId s : kStreams) paths.push_back(logger.stream_path(s));
    const std::string sid = logger.session_id();
    const std::string dir = logger.session_directory();
    VRGLOVE_CHECK(dir.find("_vr_glove") != std::string::npos);

    VRGLOVE_CHECK(logger.stop_session() == ErrorCode::ok);
    VRGLOVE_CHECK(!logger.active());

    for (std::size_t k = 0; k < kStreams.size(); ++k) {
        LogHeader header;
        std::vector<SensorFrame> frames;
        LogTrailer trailer;
        VRGLOVE_CHECK(LogReader::read_all(paths[k], header, frames, &trailer) == ErrorCode::ok);
        VRGLOVE_CHECK(header.session_id == sid);
        VRGLOVE_CHECK(header.source == kStreams[k]);
        VRGLOVE_CHECK(header.address == device.address);
        VRGLOVE_CHECK(header.firmware == "1.4.2");
        VRGLOVE_CHECK(frames.size() == 400);
        VRGLOVE_CHECK(trailer.records == 400);
        for (std::size_t i = 0; i < frames.size(); ++i) {
            VRGLOVE_CHECK(frames[i].seq == i);
            if (i > 0) VRGLOVE_CHECK(frames[i].timestamp > frames[i - 1].timestamp);
        }
        if (!frames.empty()) {
            VRGLOVE_CHECK(frames[0].calibrated && !frames[1].calibrated);
            VRGLOVE_CHECK(frames[3].raw.size() == channel_layout(kStreams[k]).size());
            VRGLOVE_CHECK(frames[3].raw[0] == 3.0f);
        }
    }
    std::filesystem::remove_all(root);
}

static void test_degraded_buffer_bounded() {
    const std::string root = temp_root("bounded");
    std::filesystem::remove_all(root);

    auto failing = std::make_shared<std::atomic<bool>>(true);
    StreamLoggerOptions options;
    options.degraded_capacity = 50;
    options.retry_interval = std::chrono::milliseconds(20);
    StreamLogger logger(options, [failing](SourceId) { return LogSink::ptr(new FlakySink(failing)); });

    // Header goes out while the sink still works.
    failing->store(false);
    VRGLOVE_CHECK(logger.start_session(root, {SourceId::battery}, DeviceHandle(), DeviceInfo()) == ErrorCode::ok);
    failing->store(true);

    const TimePoint t0 = Clock::now();
    logger.append(make_frame(SourceId::battery, 0, t0));
    StreamStatus st;
    VRGLOVE_CHECK(test::wait_for([&] { return logger.status(SourceId::battery, st) && st.degraded; }));
    for (int i = 1; i < 300; ++i) {
        VRGLOVE_CHECK(logger.append(make_frame(SourceId::battery, i, t0)) == ErrorCode::write_failure);
    }
    logger.status(SourceId::battery, st);
    VRGLOVE_CHECK(st.pending <= 50);
    VRGLOVE_CHECK(st.dropped >= 200);

    // Session still ends cleanly, reporting the loss.
    failing->store(false);
    VRGLOVE_CHECK(logger.stop_session() == ErrorCode::write_failure);
    std::filesystem::remove_all(root);
}

static void test_all_or_nothing() {
    const std::string root = temp_root("atomic");
    std::filesystem::remove_all(root);

    StreamLogger logger(StreamLoggerOptions(), [](SourceId source) -> LogSink::ptr {
        if (source == SourceId::flex) return LogSink::ptr(new UnopenableSink());
        return LogSink::ptr(new FileSink());
    });
    VRGLOVE_CHECK(logger.start_session(root, kStreams, DeviceHandle(), DeviceInfo()) == ErrorCode::write_failure);
    VRGLOVE_CHECK(!logger.active());

    std::size_t leftovers = 0;
    if (std::filesystem::exists(root)) {
        for (auto it = std::filesystem::recursive_directory_iterator(root);
             it != std::filesystem::recursive_directory_iterator(); ++it) {
            if (it->is_regular_file()) ++leftovers;
        }
    }
    VRGLOVE_CHECK(leftovers == 0);
    VRGLOVE_CHECK(logger.append(make_frame(SourceId::imu1, 0, Clock::now())) == ErrorCode::invalid_argument);
    std::filesystem::remove_all(root);
}

int main() {
    VRGLOVE_LOG_INFO(test::logger()) << "=== stream logger ===";
    test_failure_isolated_and_recovered();
    test_degraded_buffer_bounded();
    test_all_or_nothing();
    return test::report("test_stream_logger");
}
