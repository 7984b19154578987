// vrglove/controller/glove_controller.cpp
#include "glove_controller.hpp"
#include "../worker/workers.hpp"
#include "../log.h"

#include <cstring>

namespace vrglove {

static Logger::ptr g_logger = VRGLOVE_LOG_NAME("controller");

std::vector<SourceId> ControllerOptions::default_streams() {
    std::vector<SourceId> all;
    for (std::size_t i = 0; i < kSourceCount; ++i) {
        all.push_back(static_cast<SourceId>(i));
    }
    return all;
}

bool parse_options(int argc, char **argv, ControllerOptions &options) {
    if (argc > 5) return false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) return false;
    }
    if (argc > 1) options.bridge_device = argv[1];
    if (argc > 2) options.log_directory = argv[2];
    if (argc > 3) options.calibration_file = argv[3];
    if (argc > 4) options.transport.name_filter = argv[4];
    return true;
}

GloveController::GloveController(std::shared_ptr<GattLink> link, ControllerOptions options)
    : options_(std::move(options))
    , link_(std::move(link))
    , session_(std::make_shared<TransportSession>(link_, options_.transport))
    , calibration_(std::make_shared<CalibrationEngine>(options_.calibration))
    , store_(options_.calibration_file)
    , router_(std::make_shared<TelemetryRouter>(session_->notifications(), calibration_))
    , registry_(std::make_shared<ConfigRegistry>(session_))
    , stream_logger_(std::make_shared<StreamLogger>(options_.logger))
{
    registry_->bind();
    std::shared_ptr<CalibrationEngine> calibration = calibration_;
    registry_->add_config_listener([calibration](const SensorConfig &config) {
        calibration->set_sensor_config(config);
    });
    registry_->add_loss_listener([](ErrorCode reason) {
        if (reason == ErrorCode::connection_lost) {
            VRGLOVE_LOG_ERROR(g_logger) << "glove unreachable, reconnect manually";
        } else {
            VRGLOVE_LOG_ERROR(g_logger) << "glove kept its own config after reconnect: " << to_string(reason);
        }
    });
    router_->start();
}

GloveController::~GloveController() {
    shutdown();
}

// -----------------------------------------------------------------------------
// Connection
// -----------------------------------------------------------------------------
ErrorCode GloveController::connect() {
    std::vector<DeviceHandle> found;
    ErrorCode rc = session_->discover(found);
    if (rc != ErrorCode::ok) {
        VRGLOVE_LOG_ERROR(g_logger) << "discovery failed: " << to_string(rc);
        return rc;
    }
    if (found.empty()) {
        VRGLOVE_LOG_ERROR(g_logger) << "no glove matching '" << options_.transport.name_filter << "'";
        return ErrorCode::device_unreachable;
    }
    return connect(found.front());
}

ErrorCode GloveController::connect(const DeviceHandle &device) {
    ErrorCode rc = session_->connect(device);
    if (rc != ErrorCode::ok) return rc;
    return start_streams();
}

// A session that ran out of reconnect attempts, or was disconnected by the
// user, has forgotten its subscriptions.
ErrorCode GloveController::reconnect() {
    ErrorCode rc = session_->reconnect();
    if (rc != ErrorCode::ok) return rc;
    return start_streams();
}

ErrorCode GloveController::start_streams() {
    load_calibration();

    ErrorCode rc = subscribe_streams();
    if (rc != ErrorCode::ok) {
        session_->disconnect();
        return rc;
    }
    return ErrorCode::ok;
}

ErrorCode GloveController::subscribe_streams() {
    int subscribed = 0;
    for (SourceId source : options_.streams) {
        const CharId id = source_char(source);
        if (id == CharId::count || !session_->has_characteristic(id)) {
            VRGLOVE_LOG_DEBUG(g_logger) << "device has no " << source_tag(source) << " stream";
            continue;
        }
        ErrorCode rc = session_->subscribe(id);
        if (rc != ErrorCode::ok) {
            if (char_info(id).required) {
                VRGLOVE_LOG_ERROR(g_logger) << "cannot stream " << source_tag(source) << ": " << to_string(rc);
                return rc;
            }
            VRGLOVE_LOG_WARN(g_logger) << "skipping " << source_tag(source) << ": " << to_string(rc);
            continue;
        }
        ++subscribed;
    }
    VRGLOVE_LOG_INFO(g_logger) << subscribed << " stream(s) enabled";
    return ErrorCode::ok;
}

void GloveController::disconnect() {
    calibration_->cancel_capture();
    session_->disconnect();
}

void GloveController::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    ErrorCode rc = stop_logging();
    if (rc != ErrorCode::ok) {
        VRGLOVE_LOG_WARN(g_logger) << "log session closed with " << to_string(rc);
    }
    disconnect();
    router_->stop();
}

// -----------------------------------------------------------------------------
// Configuration
// -----------------------------------------------------------------------------
ErrorCode GloveController::set_config(const ConfigChange &change, SensorConfig *applied) {
    return registry_->request_config(change, applied);
}

ErrorCode GloveController::calibrate_device_imu(int imu) {
    if (imu == 1) return registry_->device_command(GattProtocol::Command::calibrate_imu1);
    if (imu == 2) return registry_->device_command(GattProtocol::Command::calibrate_imu2);
    return ErrorCode::invalid_argument;
}

SensorConfig GloveController::config() const {
    return registry_->config();
}

SessionState GloveController::state() const {
    return session_->state();
}

// -----------------------------------------------------------------------------
// Calibration
// -----------------------------------------------------------------------------
void GloveController::load_calibration() {
    const std::string address = session_->snapshot().device.address;
    std::vector<CalibrationProfile> profiles;
    ErrorCode rc = store_.load(address, profiles);
    if (rc != ErrorCode::ok) {
        VRGLOVE_LOG_WARN(g_logger) << "calibration file unreadable, starting uncalibrated";
        return;
    }
    for (const CalibrationProfile &p : profiles) {
        calibration_->set_profile(p);
    }
}

ErrorCode GloveController::persist_calibration() {
    std::string address = session_->snapshot().device.address;
    if (address.empty()) address = "unknown";
    return store_.save(address, calibration_->profiles());
}

ErrorCode GloveController::zero_calibrate(SourceId source, CalibrationProfile *out) {
    CalibrationProfile profile;
    ErrorCode rc = calibration_->zero_calibrate(source, profile);
    if (rc != ErrorCode::ok) return rc;
    if (out) *out = profile;
    return persist_calibration();
}

ErrorCode GloveController::import_calibration(SourceId source, const std::vector<float> &offset,
                                              const std::vector<float> &scale) {
    ErrorCode rc = calibration_->import_offsets(source, offset, scale);
    if (rc != ErrorCode::ok) return rc;
    return persist_calibration();
}

ErrorCode GloveController::check_drift(SourceId source, float &drift) {
    ErrorCode rc = calibration_->check_drift(source, drift);
    if (rc == ErrorCode::ok || rc == ErrorCode::drift_exceeded) {
        ErrorCode prc = persist_calibration();
        if (prc != ErrorCode::ok) {
            VRGLOVE_LOG_WARN(g_logger) << "drift estimate not persisted: " << to_string(prc);
        }
    }
    return rc;
}

// -----------------------------------------------------------------------------
// Recording
// -----------------------------------------------------------------------------
ErrorCode GloveController::start_logging(const std::string &directory) {
    if (record_thread_.joinable()) return ErrorCode::device_busy;

    const std::string root = directory.empty() ? options_.log_directory : directory;
    ErrorCode rc = stream_logger_->start_session(root, options_.streams,
                                                 session_->snapshot().device,
                                                 registry_->device_info());
    if (rc != ErrorCode::ok) return rc;

    record_sub_ = router_->subscribe("record", options_.logger.queue_capacity, options_.streams);
    record_stop_ = false;
    record_thread_ = std::thread(RecordWorker(record_sub_, stream_logger_, record_stop_));
    return ErrorCode::ok;
}

ErrorCode GloveController::stop_logging() {
    if (!record_thread_.joinable()) return ErrorCode::ok;

    record_stop_ = true;
    record_thread_.join();
    router_->unsubscribe(record_sub_);
    record_sub_.reset();
    return stream_logger_->stop_session();
}

bool GloveController::logging() const {
    return stream_logger_->active();
}

} // namespace vrglove
