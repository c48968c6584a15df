#pragma once

#include "filejet/network/peer_connection.hpp"
#include <cstdint>
#include <string>
#include <variant>

namespace filejet::transfer {

// Text payloads on the channel are control messages, binary payloads are
// chunks. The two are never reinterpreted as each other.
struct MetadataMessage {
    std::string name;
    std::uint64_t size = 0;
};

struct ChunkMessage {
    network::BinaryMessage data;
};

struct EofMessage {};

using TransferMessage = std::variant<MetadataMessage, ChunkMessage, EofMessage>;

// {"type":"metadata","name":"...","size":N}
std::string encode_control(const MetadataMessage& message);

// {"type":"eof"}
std::string encode_control(const EofMessage& message);

// Throws std::runtime_error when a text payload is not a known control message.
TransferMessage decode_message(network::ChannelMessage message);

} // namespace filejet::transfer
