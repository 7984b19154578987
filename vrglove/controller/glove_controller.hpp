// vrglove/controller/glove_controller.hpp
#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "../calibration/calibration_engine.hpp"
#include "../calibration/calibration_store.hpp"
#include "../config.h"
#include "../error.h"
#include "../logger/stream_logger.hpp"
#include "../registry/config_registry.hpp"
#include "../router/telemetry_router.hpp"
#include "../transport/transport_session.hpp"
#include "../types.hpp"

namespace vrglove {

struct ControllerOptions {
    std::string             bridge_device = kDefaultBridgeDevice;
    std::string             log_directory = kDefaultLogDirectory;
    std::string             calibration_file = kDefaultCalibrationFile;
    TransportOptions        transport;              // transport.name_filter: name or address
    CalibrationOptions      calibration;
    StreamLoggerOptions     logger;
    std::size_t             subscriber_capacity = kSubscriberQueueCapacity;
    std::vector<SourceId>   streams = default_streams();

    static std::vector<SourceId> default_streams();
};

// vrglove_host [bridge_device] [log_directory] [calibration_file] [device]
bool parse_options(int argc, char **argv, ControllerOptions &options);

// Wires transport, router, calibration, registry and the stream logger into
// the surface a UI/CLI drives: connect, configure, calibrate, record.
class GloveController {
public:
    GloveController(std::shared_ptr<GattLink> link, ControllerOptions options = ControllerOptions());
    ~GloveController();

    GloveController(const GloveController&) = delete;
    GloveController& operator=(const GloveController&) = delete;

    // discover -> connect -> load calibration -> subscribe
    ErrorCode connect();
    ErrorCode connect(const DeviceHandle &device);
    ErrorCode reconnect();
    void      disconnect();
    void      shutdown();

    ErrorCode set_config(const ConfigChange &change, SensorConfig *applied = nullptr);
    ErrorCode calibrate_device_imu(int imu);
    SensorConfig config() const;
    SessionState state() const;

    ErrorCode zero_calibrate(SourceId source, CalibrationProfile *out = nullptr);
    ErrorCode import_calibration(SourceId source, const std::vector<float> &offset,
                                 const std::vector<float> &scale);
    ErrorCode check_drift(SourceId source, float &drift);

    ErrorCode start_logging(const std::string &directory = std::string());
    ErrorCode stop_logging();
    bool      logging() const;

    std::shared_ptr<TransportSession>   session() const { return session_; }
    std::shared_ptr<TelemetryRouter>    router() const { return router_; }
    std::shared_ptr<CalibrationEngine>  calibration() const { return calibration_; }
    std::shared_ptr<ConfigRegistry>     registry() const { return registry_; }
    std::shared_ptr<StreamLogger>       stream_logger() const { return stream_logger_; }
    const ControllerOptions&            options() const { return options_; }

private:
    ErrorCode start_streams();
    ErrorCode subscribe_streams();
    ErrorCode persist_calibration();
    void      load_calibration();

    ControllerOptions                   options_;
    std::shared_ptr<GattLink>           link_;
    std::shared_ptr<TransportSession>   session_;
    std::shared_ptr<CalibrationEngine>  calibration_;
    CalibrationStore                    store_;
    std::shared_ptr<TelemetryRouter>    router_;
    std::shared_ptr<ConfigRegistry>     registry_;
    std::shared_ptr<StreamLogger>       stream_logger_;

    SubscriptionPtr                     record_sub_;
    std::atomic<bool>                   record_stop_{false};
    std::thread                         record_thread_;
    bool                                shut_down_ = false;
};

} // namespace vrglove
