#include "json_packet_encoder.hpp"

namespace roomcast {

std::vector<EncodedPacket> JsonPacketEncoder::encode(const Packet& packet) const {
    std::vector<EncodedPacket> frames;
    auto att = packet.find("attachments");
    if (!packet.is_object() || att == packet.end() || !att->is_array()) {
        frames.push_back(packet.dump());
        return frames;
    }

    Packet header = packet;
    header["attachments"] = att->size();
    frames.reserve(att->size() + 1);
    frames.push_back(header.dump());
    for (const auto& a : *att) {
        frames.push_back(a.is_string() ? a.get<std::string>() : a.dump());
    }
    return frames;
}

} // namespace roomcast
