#ifndef __VRGLOVE_CRC16_H__
#define __VRGLOVE_CRC16_H__

#include <cstddef>
#include <cstdint>

namespace vrglove {

// CRC-16/CCITT-FALSE (poly 0x1021, init 0xFFFF)
std::uint16_t crc16(const std::uint8_t *data, std::size_t size);

}

#endif
