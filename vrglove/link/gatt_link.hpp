// vrglove/link/gatt_link.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "../error.h"
#include "../types.hpp"
#include "../util/bounded_queue.hpp"

namespace vrglove {

struct CharacteristicInfo {
    std::uint16_t handle = 0;
    std::string   uuid;           // canonical lowercase
    std::uint8_t  properties = 0;
};

struct LinkEvent {
    enum class Type : std::uint8_t {
        notification,
        disconnected
    };

    Type                        type = Type::notification;
    std::uint16_t               handle = 0;
    std::vector<std::uint8_t>   payload;
    TimePoint                   timestamp;
    int                         reason = 0;
};

using LinkEventQueue = BoundedQueue<LinkEvent>;

// Central-role link to a single peripheral. Blocking calls; events arrive on
// the attached queue from the backend's own receive thread.
class GattLink {
public:
    virtual ~GattLink() = default;

    virtual void attach(std::shared_ptr<LinkEventQueue> events) = 0;

    virtual ErrorCode scan(std::chrono::milliseconds timeout,
                           std::vector<DeviceHandle> &out) = 0;
    virtual ErrorCode connect(const DeviceHandle &device,
                              std::chrono::milliseconds timeout) = 0;
    virtual ErrorCode discover(std::vector<CharacteristicInfo> &out) = 0;
    virtual ErrorCode read(std::uint16_t handle, std::vector<std::uint8_t> &out) = 0;
    virtual ErrorCode write(std::uint16_t handle, const std::vector<std::uint8_t> &data) = 0;
    virtual ErrorCode set_notify(std::uint16_t handle, bool enable) = 0;
    virtual void      disconnect() = 0;

    // Aborts a pending scan/connect/request with ErrorCode::cancelled.
    virtual void      cancel() = 0;
    virtual bool      is_connected() const = 0;
};

} // namespace vrglove
