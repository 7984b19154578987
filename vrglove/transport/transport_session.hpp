// vrglove/transport/transport_session.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "../config.h"
#include "../error.h"
#include "../types.hpp"
#include "../link/gatt_link.hpp"
#include "../util/bounded_queue.hpp"

namespace vrglove {

using NotificationQueue = BoundedQueue<RawNotification>;

struct TransportOptions {
    std::chrono::milliseconds discovery_timeout{kDiscoveryTimeoutMs};
    std::chrono::milliseconds connect_timeout{kConnectTimeoutMs};
    int                       connect_attempts = kConnectAttempts;
    std::chrono::milliseconds connect_retry_delay{kConnectRetryDelayMs};
    int                       service_check_attempts = kServiceCheckAttempts;
    std::chrono::milliseconds service_check_delay{kServiceCheckDelayMs};
    int                       notify_attempts = kNotifyAttempts;
    std::chrono::milliseconds notify_retry_delay{kNotifyRetryDelayMs};
    int                       reconnect_attempts = kReconnectAttempts;
    std::chrono::milliseconds reconnect_interval{kReconnectIntervalMs};
    std::chrono::milliseconds heartbeat_interval{kHeartbeatIntervalMs};   // 0 disables
    std::chrono::milliseconds cancel_grace{kCancelGraceMs};
    std::string               name_filter = kDeviceNameFilter;           // empty accepts all
    std::size_t               event_queue_capacity = kLinkEventQueueCapacity;
    std::size_t               notification_queue_capacity = kNotificationQueueCapacity;
};

struct TransportStats {
    std::uint64_t notifications  = 0;
    std::uint64_t dropped        = 0;   // channel overflow
    std::uint64_t unknown_handle = 0;
    std::uint64_t link_losses    = 0;
    std::uint64_t reconnects     = 0;
};

// Owns the link lifecycle:
//   idle -> scanning -> discovered -> connecting -> service_discovery -> ready
//   ready -> {disconnected, reconnecting} -> ready | idle
//
// Notifications leave through a bounded channel (notifications()); the
// receive path never blocks on the consumer. Unexpected link loss while
// ready starts the reconnect supervisor, which re-runs the ready hook
// (config re-application) before notifications are re-enabled.
class TransportSession {
public:
    using StateListener = std::function<void(SessionState state, ErrorCode reason)>;
    // Runs after service discovery on every (re)connection, before any
    // notification is (re-)enabled. reconnect is false on the first connect.
    using ReadyHook = std::function<ErrorCode(bool reconnect)>;

    explicit TransportSession(std::shared_ptr<GattLink> link,
                              TransportOptions options = TransportOptions());
    ~TransportSession();

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    ErrorCode discover(std::chrono::milliseconds timeout, std::vector<DeviceHandle>& out);
    ErrorCode discover(std::vector<DeviceHandle>& out) { return discover(options_.discovery_timeout, out); }
    ErrorCode connect(const DeviceHandle& device);
    ErrorCode subscribe(CharId id);
    ErrorCode unsubscribe(CharId id);
    ErrorCode write_config(CharId id, const std::vector<std::uint8_t>& bytes,
                           std::vector<std::uint8_t>& ack);
    ErrorCode read(CharId id, std::vector<std::uint8_t>& out);
    void      disconnect();

    // User-initiated: drop the link and go through scanning again.
    ErrorCode reconnect();

    std::shared_ptr<NotificationQueue> notifications() const { return notifications_; }

    void add_state_listener(StateListener listener);
    void set_ready_hook(ReadyHook hook);

    SessionState   state() const;
    DeviceSession  snapshot() const;
    bool           has_characteristic(CharId id) const;
    TransportStats stats() const;
    const TransportOptions& options() const { return options_; }

private:
    ErrorCode establish(bool reconnecting);
    ErrorCode resolve_services();
    ErrorCode enable_notify(CharId id, bool enable);
    void      run_reconnect();
    bool      sleep_cancellable(std::chrono::milliseconds delay);
    bool      link_usable() const;
    std::uint16_t handle_of(CharId id) const;
    bool      char_of(std::uint16_t handle, CharId& out) const;
    void      set_state(SessionState state, ErrorCode reason = ErrorCode::ok);

    void pump();
    void supervise();

    std::shared_ptr<GattLink>           link_;
    TransportOptions                    options_;
    std::shared_ptr<LinkEventQueue>     events_;
    std::shared_ptr<NotificationQueue>  notifications_;

    std::timed_mutex                    op_mutex_;      // one public operation at a time

    mutable std::mutex                  state_mutex_;
    DeviceSession                       session_;
    std::set<CharId>                    subscribed_;
    bool                                link_up_ = false;

    std::mutex                          listener_mutex_;
    std::vector<StateListener>          listeners_;
    ReadyHook                           ready_hook_;

    std::mutex                          wake_mutex_;
    std::condition_variable             wake_cv_;
    bool                                link_lost_ = false;

    std::atomic<bool>                   cancel_{false};
    std::atomic<bool>                   user_disconnect_{false};
    std::atomic<bool>                   stop_{false};

    std::atomic<std::uint64_t>          n_notifications_{0};
    std::atomic<std::uint64_t>          n_dropped_{0};
    std::atomic<std::uint64_t>          n_unknown_{0};
    std::atomic<std::uint64_t>          n_link_losses_{0};
    std::atomic<std::uint64_t>          n_reconnects_{0};

    std::thread                         pump_thread_;
    std::thread                         supervisor_thread_;
};

// "00002a19-0000-1000-8000-00805f9b34fb" -> "2a19"; otherwise lowercased.
std::string normalize_uuid(const std::string& uuid);

} // namespace vrglove
