// vrglove/registry/config_registry.hpp
#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "../error.h"
#include "../protocol_data.hpp"
#include "../types.hpp"

namespace vrglove {

class TransportSession;

// Last acknowledged device configuration and metadata.
//
// A change is validated and encoded before anything is sent, written through
// the transport, and committed only with the value the device reports back.
// At most one read-modify-write per characteristic is in flight; a
// concurrent second request gets device_busy.
//
// Loss listeners hear connection_lost when the reconnect budget runs out, and
// the failure code when a reconnect could not restore the config (the
// registry then holds what the device reports).
class ConfigRegistry {
public:
    typedef std::function<void(const SensorConfig&)> ConfigListener;
    typedef std::function<void(ErrorCode)>           LossListener;

    explicit ConfigRegistry(std::shared_ptr<TransportSession> session);

    ConfigRegistry(const ConfigRegistry&) = delete;
    ConfigRegistry& operator=(const ConfigRegistry&) = delete;

    // Installs the ready hook and state listener on the session.
    void bind();

    ErrorCode request_config(const ConfigChange& change, SensorConfig* applied = nullptr);
    ErrorCode request_config(const SensorConfig& desired, SensorConfig* applied = nullptr);
    ErrorCode device_command(GattProtocol::Command command);

    ErrorCode refresh();
    ErrorCode read_device_info();
    ErrorCode reapply();
    ErrorCode sync_time(std::uint32_t* device_time = nullptr);

    // Run by the transport after every (re)connection.
    ErrorCode on_ready(bool reconnect);

    SensorConfig config() const;
    bool         config_known() const;
    DeviceInfo   device_info() const;
    ErrorCode    last_error() const;

    void add_config_listener(ConfigListener listener);
    void add_loss_listener(LossListener listener);

private:
    class WriteSlot;

    // Caller holds the config write slot.
    ErrorCode commit_config(const SensorConfig& desired, SensorConfig* applied);
    void      notify_config(const SensorConfig& config);
    void      notify_loss(ErrorCode reason);
    void      on_state(SessionState state, ErrorCode reason);

    std::shared_ptr<TransportSession>   session_;

    mutable std::mutex                  mutex_;
    SensorConfig                        config_;
    bool                                config_known_ = false;
    DeviceInfo                          info_;
    ErrorCode                           last_error_ = ErrorCode::ok;
    ErrorCode                           ready_error_ = ErrorCode::ok;
    std::array<bool, kCharCount>        in_flight_{};

    std::mutex                          listener_mutex_;
    std::vector<ConfigListener>         config_listeners_;
    std::vector<LossListener>           loss_listeners_;
};

} // namespace vrglove
