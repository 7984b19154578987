// vrglove/link/bridge_frame.cpp
#include "bridge_frame.hpp"

#include <algorithm>
#include <cstdio>

namespace vrglove {

bool encode_bridge_frame(const BridgeFrame &frame, std::vector<std::uint8_t> &out) {
    const std::size_t size = frame.payload.size();
    if (size > BridgeProtocol::MAX_PAYLOAD_SIZE) return false;

    out.clear();
    out.reserve(BridgeProtocol::HEADER_SIZE + size + BridgeProtocol::CRC_SIZE);
    out.push_back(BridgeProtocol::HEADER_BYTE);
    out.push_back(static_cast<std::uint8_t>(size & 0xFF));
    out.push_back(static_cast<std::uint8_t>((size >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(frame.type));
    out.insert(out.end(), frame.payload.begin(), frame.payload.end());

    const std::uint16_t crc = crc16(out.data(), out.size());
    out.push_back(static_cast<std::uint8_t>(crc & 0xFF));
    out.push_back(static_cast<std::uint8_t>((crc >> 8) & 0xFF));
    return true;
}

void BridgeFrameParser::reset() {
    buf_.clear();
}

void BridgeFrameParser::feed(const std::uint8_t *data, std::size_t size,
                             std::vector<BridgeFrame> &out)
{
    buf_.insert(buf_.end(), data, data + size);

    while (!buf_.empty()) {
        // 1) sync on header
        auto it = std::find(buf_.begin(), buf_.end(), BridgeProtocol::HEADER_BYTE);
        buf_.erase(buf_.begin(), it);
        if (buf_.size() < BridgeProtocol::HEADER_SIZE) return;

        // 2) length
        const std::size_t length = static_cast<std::size_t>(buf_[1]) |
                                   (static_cast<std::size_t>(buf_[2]) << 8);
        if (length > BridgeProtocol::MAX_PAYLOAD_SIZE) {
            ++crc_errors_;
            buf_.erase(buf_.begin());
            continue;
        }

        const std::size_t total = BridgeProtocol::HEADER_SIZE + length + BridgeProtocol::CRC_SIZE;
        if (buf_.size() < total) return;

        // 3) checksum
        const std::size_t no_crc = total - BridgeProtocol::CRC_SIZE;
        const std::uint16_t expected = static_cast<std::uint16_t>(buf_[no_crc]) |
                                       static_cast<std::uint16_t>(buf_[no_crc + 1] << 8);
        if (crc16(buf_.data(), no_crc) != expected) {
            ++crc_errors_;
            buf_.erase(buf_.begin());
            continue;
        }

        BridgeFrame frame;
        frame.type = static_cast<BridgeProtocol::Type>(buf_[3]);
        frame.payload.assign(buf_.begin() + BridgeProtocol::HEADER_SIZE,
                             buf_.begin() + no_crc);
        out.push_back(std::move(frame));
        buf_.erase(buf_.begin(), buf_.begin() + total);
    }
}

ErrorCode status_to_error(BridgeProtocol::Status status, BridgeProtocol::Type op) {
    switch (status) {
    case BridgeProtocol::Status::ok:
        return ErrorCode::ok;
    case BridgeProtocol::Status::timeout:
        return (op == BridgeProtocol::Type::connect || op == BridgeProtocol::Type::scan)
                   ? ErrorCode::connect_timeout
                   : ErrorCode::connection_lost;
    case BridgeProtocol::Status::not_found:
        return ErrorCode::device_unreachable;
    case BridgeProtocol::Status::rejected:
        return ErrorCode::write_rejected;
    case BridgeProtocol::Status::not_connected:
        return ErrorCode::not_connected;
    case BridgeProtocol::Status::busy:
        return ErrorCode::device_busy;
    }
    return ErrorCode::connection_lost;
}

std::string uuid_to_string(const std::uint8_t *data, std::size_t size) {
    char buf[40];
    if (size == 2) {
        std::snprintf(buf, sizeof(buf), "%04x",
                      static_cast<unsigned>(data[0] | (data[1] << 8)));
        return buf;
    }
    if (size != 16) return std::string();

    // BLE transmits 128-bit UUIDs little-endian.
    std::uint8_t be[16];
    for (int i = 0; i < 16; ++i) be[i] = data[15 - i];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  be[0], be[1], be[2], be[3], be[4], be[5], be[6], be[7],
                  be[8], be[9], be[10], be[11], be[12], be[13], be[14], be[15]);
    return buf;
}

bool parse_scan_result(const std::vector<std::uint8_t> &payload, DeviceHandle &out) {
    if (payload.size() < 2) return false;
    const std::size_t addr_len = payload[1];
    if (payload.size() < 2 + addr_len) return false;

    out.rssi = static_cast<std::int8_t>(payload[0]);
    out.address.assign(payload.begin() + 2, payload.begin() + 2 + addr_len);
    out.name.assign(payload.begin() + 2 + addr_len, payload.end());
    return !out.address.empty();
}

bool parse_discover_payload(const std::uint8_t *data, std::size_t size,
                            std::vector<CharacteristicInfo> &out)
{
    out.clear();
    std::size_t i = 0;
    while (i + 4 <= size) {
        CharacteristicInfo info;
        info.handle     = static_cast<std::uint16_t>(data[i] | (data[i + 1] << 8));
        info.properties = data[i + 2];
        const std::size_t uuid_len = data[i + 3];
        i += 4;
        if (i + uuid_len > size) return false;
        info.uuid = uuid_to_string(data + i, uuid_len);
        if (info.uuid.empty()) return false;
        i += uuid_len;
        out.push_back(std::move(info));
    }
    return i == size;
}

} // namespace vrglove
