#pragma once

#include "transport/Endpoint.h"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace facilitator::transport {

enum class Delivery : std::uint8_t {
    Unreliable = 0,
    ReliableUnordered = 1,
    ReliableOrdered = 2,
};

enum class PacketType : std::uint8_t {
    Data = 0,
    Ack = 1,            // sequence = acknowledged sequence
    ResendRequest = 2,  // sequence = next sequence the receiver can accept
};

// Every datagram starts with this header (big-endian on the wire):
//   u16 magic | u8 version | u8 type | u8 delivery | u8 reserved | u32 sequence
struct PacketHeader {
    static constexpr std::uint16_t kMagic = 0x5646; // "VF"
    static constexpr std::uint8_t kVersion = 1;
    static constexpr std::size_t kSize = 10;

    PacketType type = PacketType::Data;
    Delivery delivery = Delivery::Unreliable;
    std::uint32_t sequence = 0;
};

struct Packet {
    PacketHeader header;
    Bytes payload;
};

const char* to_string(Delivery d) noexcept;
bool is_reliable(Delivery d) noexcept;

Bytes encode_packet(const PacketHeader& header, const std::uint8_t* payload, std::size_t size);
inline Bytes encode_packet(const PacketHeader& header, const Bytes& payload) {
    return encode_packet(header, payload.data(), payload.size());
}

// Returns nullopt for anything that is not one of our datagrams.
std::optional<Packet> decode_packet(const std::uint8_t* data, std::size_t size);

} // namespace facilitator::transport
