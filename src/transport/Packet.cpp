#include "transport/Packet.h"

#include <boost/endian/conversion.hpp>

#include <cstring>

namespace facilitator::transport {

namespace endian = boost::endian;

const char* to_string(Delivery d) noexcept {
    switch (d) {
        case Delivery::Unreliable:        return "unreliable";
        case Delivery::ReliableUnordered: return "reliable-unordered";
        case Delivery::ReliableOrdered:   return "reliable-ordered";
    }
    return "unknown";
}

bool is_reliable(Delivery d) noexcept {
    return d != Delivery::Unreliable;
}

Bytes encode_packet(const PacketHeader& header, const std::uint8_t* payload, std::size_t size) {
    Bytes out(PacketHeader::kSize + size);
    std::uint8_t* p = out.data();

    endian::store_big_u16(p, PacketHeader::kMagic);
    p[2] = PacketHeader::kVersion;
    p[3] = static_cast<std::uint8_t>(header.type);
    p[4] = static_cast<std::uint8_t>(header.delivery);
    p[5] = 0;
    endian::store_big_u32(p + 6, header.sequence);

    if (size > 0) std::memcpy(p + PacketHeader::kSize, payload, size);
    return out;
}

std::optional<Packet> decode_packet(const std::uint8_t* data, std::size_t size) {
    if (size < PacketHeader::kSize) return std::nullopt;
    if (endian::load_big_u16(data) != PacketHeader::kMagic) return std::nullopt;
    if (data[2] != PacketHeader::kVersion) return std::nullopt;
    if (data[3] > static_cast<std::uint8_t>(PacketType::ResendRequest)) return std::nullopt;
    if (data[4] > static_cast<std::uint8_t>(Delivery::ReliableOrdered)) return std::nullopt;

    Packet packet;
    packet.header.type = static_cast<PacketType>(data[3]);
    packet.header.delivery = static_cast<Delivery>(data[4]);
    packet.header.sequence = endian::load_big_u32(data + 6);

    // Unreliable data carries no sequence; reliable data and control packets must.
    if (packet.header.type == PacketType::Data) {
        if (is_reliable(packet.header.delivery) != (packet.header.sequence != 0)) return std::nullopt;
    } else if (!is_reliable(packet.header.delivery) || packet.header.sequence == 0) {
        return std::nullopt;
    }

    packet.payload.assign(data + PacketHeader::kSize, data + size);
    return packet;
}

} // namespace facilitator::transport
