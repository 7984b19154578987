// vrglove/transport/transport_session.cpp
#include "transport_session.hpp"
#include "../log.h"

#include <algorithm>
#include <cctype>

namespace vrglove {

static Logger::ptr g_logger = VRGLOVE_LOG_NAME("transport");

std::string normalize_uuid(const std::string& uuid) {
    std::string out(uuid);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const std::string kBaseSuffix = "-0000-1000-8000-00805f9b34fb";
    if (out.size() == 36 && out.compare(0, 4, "0000") == 0 &&
        out.compare(8, std::string::npos, kBaseSuffix) == 0) {
        return out.substr(4, 4);
    }
    return out;
}

TransportSession::TransportSession(std::shared_ptr<GattLink> link, TransportOptions options)
    : link_(std::move(link))
    , options_(std::move(options))
    , events_(std::make_shared<LinkEventQueue>(options_.event_queue_capacity))
    , notifications_(std::make_shared<NotificationQueue>(options_.notification_queue_capacity))
{
    link_->attach(events_);
    pump_thread_       = std::thread(&TransportSession::pump, this);
    supervisor_thread_ = std::thread(&TransportSession::supervise, this);
}

TransportSession::~TransportSession() {
    disconnect();
    stop_ = true;
    cancel_ = true;
    link_->cancel();
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();
    events_->close();
    if (pump_thread_.joinable()) pump_thread_.join();
    if (supervisor_thread_.joinable()) supervisor_thread_.join();
    link_->attach(nullptr);
}

// -----------------------------------------------------------------------------
// State
// -----------------------------------------------------------------------------
void TransportSession::set_state(SessionState state, ErrorCode reason) {
    SessionState prev;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        prev = session_.state;
        session_.state = state;
    }
    if (prev != state) {
        VRGLOVE_LOG_INFO(g_logger) << "state " << to_string(prev) << " -> " << to_string(state)
                                   << (reason == ErrorCode::ok ? "" : " (")
                                   << (reason == ErrorCode::ok ? "" : to_string(reason))
                                   << (reason == ErrorCode::ok ? "" : ")");
    }
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for (auto& listener : listeners_) {
        listener(state, reason);
    }
}

SessionState TransportSession::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return session_.state;
}

DeviceSession TransportSession::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return session_;
}

bool TransportSession::has_characteristic(CharId id) const {
    return handle_of(id) != 0;
}

TransportStats TransportSession::stats() const {
    TransportStats s;
    s.notifications  = n_notifications_.load();
    s.dropped        = n_dropped_.load();
    s.unknown_handle = n_unknown_.load();
    s.link_losses    = n_link_losses_.load();
    s.reconnects     = n_reconnects_.load();
    return s;
}

void TransportSession::add_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.push_back(std::move(listener));
}

void TransportSession::set_ready_hook(ReadyHook hook) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    ready_hook_ = std::move(hook);
}

std::uint16_t TransportSession::handle_of(CharId id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return session_.handles[static_cast<std::size_t>(id)];
}

bool TransportSession::char_of(std::uint16_t handle, CharId& out) const {
    if (handle == 0) return false;
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (std::size_t i = 0; i < kCharCount; ++i) {
        if (session_.handles[i] == handle) {
            out = static_cast<CharId>(i);
            return true;
        }
    }
    return false;
}

bool TransportSession::link_usable() const {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!link_up_) return false;
    }
    return link_->is_connected();
}

bool TransportSession::sleep_cancellable(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    return !wake_cv_.wait_for(lock, delay, [this] { return cancel_.load() || stop_.load(); });
}

// -----------------------------------------------------------------------------
// Discovery / connection
// -----------------------------------------------------------------------------
ErrorCode TransportSession::discover(std::chrono::milliseconds timeout, std::vector<DeviceHandle>& out) {
    std::lock_guard<std::timed_mutex> op(op_mutex_);
    cancel_ = false;
    out.clear();

    const SessionState current = state();
    if (current != SessionState::idle && current != SessionState::discovered) {
        VRGLOVE_LOG_WARN(g_logger) << "discover refused in state " << to_string(current);
        return ErrorCode::device_busy;
    }

    set_state(SessionState::scanning);
    std::vector<DeviceHandle> found;
    ErrorCode rc = link_->scan(timeout, found);

    for (const DeviceHandle& dev : found) {
        if (options_.name_filter.empty() ||
            dev.name.find(options_.name_filter) != std::string::npos ||
            dev.address == options_.name_filter) {
            out.push_back(dev);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const DeviceHandle& a, const DeviceHandle& b) { return a.rssi > b.rssi; });

    VRGLOVE_LOG_INFO(g_logger) << "scan found " << found.size() << " device(s), "
                               << out.size() << " matching";

    if (out.empty()) {
        set_state(SessionState::idle, rc);
        return rc;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        session_.device = out.front();
        session_.rssi = out.front().rssi;
    }
    set_state(SessionState::discovered);
    return ErrorCode::ok;
}

ErrorCode TransportSession::connect(const DeviceHandle& device) {
    std::lock_guard<std::timed_mutex> op(op_mutex_);
    cancel_ = false;
    user_disconnect_ = false;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (session_.state == SessionState::ready || session_.state == SessionState::reconnecting) {
            return ErrorCode::device_busy;
        }
        session_.device = device;
        session_.rssi = device.rssi;
        session_.handles.fill(0);
        link_up_ = false;
    }

    VRGLOVE_LOG_INFO(g_logger) << "connecting to " << device.name << " [" << device.address << "]";
    set_state(SessionState::connecting);

    ErrorCode rc = establish(false);
    if (rc != ErrorCode::ok) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            link_up_ = false;
        }
        link_->disconnect();
        if (!user_disconnect_) {
            VRGLOVE_LOG_ERROR(g_logger) << "connect failed: " << to_string(rc);
            set_state(SessionState::idle, rc);
        }
        return rc;
    }

    set_state(SessionState::ready);
    return ErrorCode::ok;
}

ErrorCode TransportSession::establish(bool reconnecting) {
    DeviceHandle device;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        device = session_.device;
    }

    const auto deadline = Clock::now() + options_.connect_timeout;
    ErrorCode rc = ErrorCode::connect_timeout;
    for (int attempt = 1; attempt <= options_.connect_attempts; ++attempt) {
        if (cancel_ || stop_) return ErrorCode::cancelled;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            rc = ErrorCode::connect_timeout;
            break;
        }

        rc = link_->connect(device, remaining);
        if (rc == ErrorCode::ok || rc == ErrorCode::cancelled) break;

        VRGLOVE_LOG_WARN(g_logger) << "connect attempt " << attempt << "/" << options_.connect_attempts
                                   << " failed: " << to_string(rc);
        if (attempt < options_.connect_attempts && !sleep_cancellable(options_.connect_retry_delay)) {
            return ErrorCode::cancelled;
        }
    }
    if (rc == ErrorCode::cancelled || cancel_) return ErrorCode::cancelled;
    if (rc != ErrorCode::ok) {
        return rc == ErrorCode::connect_timeout ? rc : ErrorCode::device_unreachable;
    }

    if (!reconnecting) set_state(SessionState::service_discovery);
    rc = resolve_services();
    if (rc != ErrorCode::ok) {
        link_->disconnect();
        return rc;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        link_up_ = true;
    }

    ReadyHook hook;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        hook = ready_hook_;
    }
    if (hook) {
        ErrorCode hr = hook(reconnecting);
        if (hr != ErrorCode::ok) {
            VRGLOVE_LOG_WARN(g_logger) << "ready hook: " << to_string(hr);
            if (hr == ErrorCode::connection_lost || hr == ErrorCode::not_connected ||
                hr == ErrorCode::cancelled) {
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    link_up_ = false;
                }
                link_->disconnect();
                return hr == ErrorCode::cancelled ? hr : ErrorCode::device_unreachable;
            }
        }
    }

    if (reconnecting) {
        std::set<CharId> subs;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            subs = subscribed_;
        }
        for (CharId id : subs) {
            ErrorCode nr = enable_notify(id, true);
            if (nr != ErrorCode::ok) {
                VRGLOVE_LOG_WARN(g_logger) << "re-enable " << char_info(id).name << ": " << to_string(nr);
                if (char_info(id).required) return nr == ErrorCode::cancelled ? nr : ErrorCode::device_unreachable;
            }
        }
    }
    return ErrorCode::ok;
}

ErrorCode TransportSession::resolve_services() {
    for (int attempt = 1; attempt <= options_.service_check_attempts; ++attempt) {
        if (cancel_ || stop_) return ErrorCode::cancelled;

        std::vector<CharacteristicInfo> chars;
        ErrorCode rc = link_->discover(chars);
        if (rc == ErrorCode::cancelled) return rc;

        if (rc == ErrorCode::ok) {
            std::array<std::uint16_t, kCharCount> handles{};
            for (const CharacteristicInfo& ch : chars) {
                const std::string uuid = normalize_uuid(ch.uuid);
                for (const CharInfo& info : kCharTable) {
                    if (uuid == info.uuid) {
                        handles[static_cast<std::size_t>(info.id)] = ch.handle;
                    }
                }
            }

            std::string missing;
            for (const CharInfo& info : kCharTable) {
                if (info.required && handles[static_cast<std::size_t>(info.id)] == 0) {
                    if (!missing.empty()) missing += ",";
                    missing += info.name;
                }
            }
            if (missing.empty()) {
                std::lock_guard<std::mutex> lock(state_mutex_);
                session_.handles = handles;
                VRGLOVE_LOG_INFO(g_logger) << "service discovery: " << chars.size() << " characteristic(s)";
                return ErrorCode::ok;
            }
            VRGLOVE_LOG_WARN(g_logger) << "service check " << attempt << "/" << options_.service_check_attempts
                                       << " missing: " << missing;
        } else {
            VRGLOVE_LOG_WARN(g_logger) << "service check " << attempt << " failed: " << to_string(rc);
        }

        if (attempt < options_.service_check_attempts && !sleep_cancellable(options_.service_check_delay)) {
            return ErrorCode::cancelled;
        }
    }
    return ErrorCode::device_unreachable;
}

// -----------------------------------------------------------------------------
// Characteristic access
// -----------------------------------------------------------------------------
ErrorCode TransportSession::enable_notify(CharId id, bool enable) {
    const std::uint16_t handle = handle_of(id);
    if (handle == 0) return ErrorCode::invalid_argument;

    ErrorCode rc = ErrorCode::not_connected;
    for (int attempt = 1; attempt <= options_.notify_attempts; ++attempt) {
        rc = link_->set_notify(handle, enable);
        if (rc == ErrorCode::ok || rc == ErrorCode::cancelled) return rc;
        VRGLOVE_LOG_DEBUG(g_logger) << "set_notify " << char_info(id).name << " attempt " << attempt
                                    << ": " << to_string(rc);
        if (attempt < options_.notify_attempts && !sleep_cancellable(options_.notify_retry_delay)) {
            return ErrorCode::cancelled;
        }
    }
    return rc;
}

ErrorCode TransportSession::subscribe(CharId id) {
    if (!char_info(id).notify) return ErrorCode::invalid_argument;
    if (!link_usable()) return ErrorCode::not_connected;
    if (!has_characteristic(id)) {
        VRGLOVE_LOG_WARN(g_logger) << "characteristic " << char_info(id).name << " not offered by device";
        return ErrorCode::invalid_argument;
    }

    ErrorCode rc = enable_notify(id, true);
    if (rc != ErrorCode::ok) {
        VRGLOVE_LOG_ERROR(g_logger) << "subscribe " << char_info(id).name << " failed: " << to_string(rc);
        return rc;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    subscribed_.insert(id);
    return ErrorCode::ok;
}

ErrorCode TransportSession::unsubscribe(CharId id) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (subscribed_.erase(id) == 0) return ErrorCode::ok;
    }
    if (!link_usable()) return ErrorCode::ok;
    return enable_notify(id, false);
}

ErrorCode TransportSession::read(CharId id, std::vector<std::uint8_t>& out) {
    if (!link_usable()) return ErrorCode::not_connected;
    const std::uint16_t handle = handle_of(id);
    if (handle == 0) return ErrorCode::invalid_argument;
    return link_->read(handle, out);
}

ErrorCode TransportSession::write_config(CharId id, const std::vector<std::uint8_t>& bytes,
                                         std::vector<std::uint8_t>& ack) {
    if (!char_info(id).writable) return ErrorCode::invalid_argument;
    if (!link_usable()) return ErrorCode::not_connected;
    const std::uint16_t handle = handle_of(id);
    if (handle == 0) return ErrorCode::invalid_argument;

    ErrorCode rc = link_->write(handle, bytes);
    if (rc != ErrorCode::ok) {
        VRGLOVE_LOG_WARN(g_logger) << "write " << char_info(id).name << " failed: " << to_string(rc);
        return rc;
    }

    // The acknowledged value is whatever the device reports back.
    rc = link_->read(handle, ack);
    if (rc != ErrorCode::ok) {
        VRGLOVE_LOG_WARN(g_logger) << "read-back " << char_info(id).name << " failed: " << to_string(rc);
    }
    return rc;
}

// -----------------------------------------------------------------------------
// Teardown / reconnect
// -----------------------------------------------------------------------------
void TransportSession::disconnect() {
    if (state() == SessionState::idle && !link_->is_connected()) return;

    user_disconnect_ = true;
    cancel_ = true;
    link_->cancel();
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();

    std::unique_lock<std::timed_mutex> op(op_mutex_, std::defer_lock);
    if (!op.try_lock_for(options_.cancel_grace)) {
        VRGLOVE_LOG_WARN(g_logger) << "pending operation still running after "
                                   << options_.cancel_grace.count() << " ms grace";
        link_->cancel();
    }

    std::set<CharId> subs;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        subs.swap(subscribed_);
    }
    if (link_usable()) {
        for (CharId id : subs) {
            const std::uint16_t handle = handle_of(id);
            if (handle == 0) continue;
            ErrorCode rc = link_->set_notify(handle, false);
            if (rc != ErrorCode::ok) {
                VRGLOVE_LOG_DEBUG(g_logger) << "disable " << char_info(id).name << ": " << to_string(rc);
            }
        }
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        link_up_ = false;
    }
    link_->disconnect();

    set_state(SessionState::disconnected);
    set_state(SessionState::idle);
}

ErrorCode TransportSession::reconnect() {
    std::lock_guard<std::timed_mutex> op(op_mutex_);
    cancel_ = false;
    user_disconnect_ = false;

    DeviceHandle target;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        target = session_.device;
        link_up_ = false;
    }
    if (target.address.empty()) return ErrorCode::invalid_argument;

    link_->disconnect();
    set_state(SessionState::scanning);

    std::vector<DeviceHandle> found;
    ErrorCode rc = link_->scan(options_.discovery_timeout, found);
    auto it = std::find_if(found.begin(), found.end(),
                           [&target](const DeviceHandle& d) { return d.address == target.address; });
    if (it == found.end()) {
        if (rc == ErrorCode::ok) rc = ErrorCode::device_unreachable;
        set_state(SessionState::idle, rc);
        return rc;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        session_.device = *it;
        session_.rssi = it->rssi;
    }
    set_state(SessionState::discovered);
    set_state(SessionState::connecting);

    rc = establish(true);
    if (rc != ErrorCode::ok) {
        link_->disconnect();
        if (!user_disconnect_) set_state(SessionState::idle, rc);
        return rc;
    }
    set_state(SessionState::ready);
    return ErrorCode::ok;
}

void TransportSession::run_reconnect() {
    ++n_link_losses_;
    set_state(SessionState::reconnecting, ErrorCode::connection_lost);
    link_->disconnect();

    for (int attempt = 1; attempt <= options_.reconnect_attempts; ++attempt) {
        if (user_disconnect_ || stop_) return;

        VRGLOVE_LOG_INFO(g_logger) << "reconnect attempt " << attempt << "/" << options_.reconnect_attempts;
        ErrorCode rc = establish(true);
        if (rc == ErrorCode::ok) {
            ++n_reconnects_;
            set_state(SessionState::ready);
            return;
        }
        if (rc == ErrorCode::cancelled || user_disconnect_) return;

        VRGLOVE_LOG_WARN(g_logger) << "reconnect attempt " << attempt << " failed: " << to_string(rc);
        if (attempt < options_.reconnect_attempts && !sleep_cancellable(options_.reconnect_interval)) {
            return;
        }
    }

    VRGLOVE_LOG_ERROR(g_logger) << "device lost after " << options_.reconnect_attempts << " reconnect attempts";
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        subscribed_.clear();
    }
    set_state(SessionState::idle, ErrorCode::connection_lost);
}

// -----------------------------------------------------------------------------
// Threads
// -----------------------------------------------------------------------------
void TransportSession::pump() {
    while (!stop_.load()) {
        LinkEvent ev;
        if (!events_->pop(ev, std::chrono::milliseconds(100))) continue;

        if (ev.type == LinkEvent::Type::notification) {
            CharId id;
            if (!char_of(ev.handle, id)) {
                ++n_unknown_;
                continue;
            }
            RawNotification note;
            note.characteristic = id;
            note.payload = std::move(ev.payload);
            note.timestamp = ev.timestamp;
            ++n_notifications_;
            if (notifications_->push_drop_oldest(std::move(note))) {
                ++n_dropped_;
            }
            continue;
        }

        bool was_ready = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            link_up_ = false;
            was_ready = session_.state == SessionState::ready;
        }
        VRGLOVE_LOG_WARN(g_logger) << "link dropped, reason " << ev.reason;
        if (was_ready && !user_disconnect_) {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            link_lost_ = true;
            wake_cv_.notify_all();
        }
    }
}

void TransportSession::supervise() {
    const auto heartbeat = options_.heartbeat_interval;
    auto next_heartbeat = Clock::now() + heartbeat;

    while (!stop_.load()) {
        bool lost = false;
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            const auto wait = heartbeat.count() > 0
                ? std::chrono::duration_cast<std::chrono::milliseconds>(next_heartbeat - Clock::now())
                : std::chrono::milliseconds(100);
            wake_cv_.wait_for(lock, wait, [this] { return stop_.load() || link_lost_; });
            if (stop_) break;
            lost = link_lost_;
            link_lost_ = false;
        }

        if (!lost && heartbeat.count() > 0 && Clock::now() >= next_heartbeat) {
            next_heartbeat = Clock::now() + heartbeat;
            std::unique_lock<std::timed_mutex> op(op_mutex_, std::try_to_lock);
            if (op.owns_lock() && state() == SessionState::ready && !user_disconnect_) {
                std::vector<std::uint8_t> model;
                ErrorCode rc = link_->read(handle_of(CharId::model), model);
                if (rc != ErrorCode::ok && rc != ErrorCode::cancelled) {
                    VRGLOVE_LOG_WARN(g_logger) << "heartbeat failed: " << to_string(rc);
                    lost = true;
                }
            }
        }

        if (lost) {
            std::lock_guard<std::timed_mutex> op(op_mutex_);
            if (state() == SessionState::ready && !user_disconnect_ && !stop_) {
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    link_up_ = false;
                }
                run_reconnect();
            }
            next_heartbeat = Clock::now() + heartbeat;
        }
    }
}

} // namespace vrglove
