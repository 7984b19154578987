// vrglove/link/bridge_frame.hpp
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "gatt_link.hpp"
#include "../util/crc16.h"

namespace vrglove {

// Wire format of the USB CDC central bridge:
//   0xAA | len u16 LE | type u8 | payload[len] | crc16 LE
struct BridgeProtocol {
    enum class Type : std::uint8_t {
        // host -> bridge
        scan          = 0x01,
        connect       = 0x02,
        disconnect    = 0x03,
        discover      = 0x04,
        read          = 0x05,
        write         = 0x06,
        set_notify    = 0x07,
        // bridge -> host
        scan_result   = 0x81,
        response      = 0x90,
        notification  = 0xA0,
        disconnected  = 0xA1
    };

    enum class Status : std::uint8_t {
        ok            = 0,
        timeout       = 1,
        not_found     = 2,
        rejected      = 3,
        not_connected = 4,
        busy          = 5
    };

    static constexpr std::uint8_t HEADER_BYTE      = 0xAA;
    static constexpr std::size_t  HEADER_SIZE      = 4;
    static constexpr std::size_t  CRC_SIZE         = 2;
    static constexpr std::size_t  MAX_PAYLOAD_SIZE = 512;
    static constexpr std::size_t  MAX_PACKET_SIZE  = HEADER_SIZE + MAX_PAYLOAD_SIZE + CRC_SIZE;
};

struct BridgeFrame {
    BridgeProtocol::Type        type = BridgeProtocol::Type::response;
    std::vector<std::uint8_t>   payload;
};

bool encode_bridge_frame(const BridgeFrame &frame, std::vector<std::uint8_t> &out);

// Incremental decoder. Resynchronises on the header byte; frames with a bad
// CRC or an oversize length are discarded and counted.
class BridgeFrameParser {
public:
    void feed(const std::uint8_t *data, std::size_t size, std::vector<BridgeFrame> &out);
    void reset();

    std::uint64_t crc_errors() const { return crc_errors_; }

private:
    std::vector<std::uint8_t> buf_;
    std::uint64_t             crc_errors_ = 0;
};

// ---- payload helpers ----
ErrorCode status_to_error(BridgeProtocol::Status status, BridgeProtocol::Type op);
std::string uuid_to_string(const std::uint8_t *data, std::size_t size);
bool parse_scan_result(const std::vector<std::uint8_t> &payload, DeviceHandle &out);
bool parse_discover_payload(const std::uint8_t *data, std::size_t size,
                            std::vector<CharacteristicInfo> &out);

} // namespace vrglove
