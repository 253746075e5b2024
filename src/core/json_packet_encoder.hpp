#pragma once

#include "transport.hpp"

namespace roomcast {

/**
 * Default encoder: one compact JSON text frame per packet. A packet holding
 * an "attachments" array of strings gets one extra frame per attachment,
 * with the array replaced by its length in the header frame.
 */
class JsonPacketEncoder : public PacketEncoder {
public:
    std::vector<EncodedPacket> encode(const Packet& packet) const override;
};

} // namespace roomcast
