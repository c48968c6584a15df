#include "filejet/transfer/transfer_message.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace filejet::transfer {

namespace {
    TransferMessage decode_control(const std::string& text) {
        auto json = nlohmann::json::parse(text, nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            throw std::runtime_error("Control message is not a JSON object");
        }
        
        auto type = json.find("type");
        if (type == json.end() || !type->is_string()) {
            throw std::runtime_error("Control message has no type");
        }
        
        auto kind = type->get<std::string>();
        if (kind == "eof") {
            return EofMessage{};
        }
        
        if (kind == "metadata") {
            auto name = json.find("name");
            auto size = json.find("size");
            if (name == json.end() || !name->is_string()) {
                throw std::runtime_error("Metadata without a file name");
            }
            if (size == json.end() || !size->is_number_unsigned()) {
                throw std::runtime_error("Metadata without a valid file size");
            }
            return MetadataMessage{name->get<std::string>(), size->get<std::uint64_t>()};
        }
        
        throw std::runtime_error("Unknown control message type '" + kind + "'");
    }
}

std::string encode_control(const MetadataMessage& message) {
    nlohmann::json json = {
        {"type", "metadata"},
        {"name", message.name},
        {"size", message.size}
    };
    // File names are not guaranteed to be valid UTF-8.
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string encode_control(const EofMessage&) {
    return nlohmann::json{{"type", "eof"}}.dump();
}

TransferMessage decode_message(network::ChannelMessage message) {
    if (auto* data = std::get_if<network::BinaryMessage>(&message)) {
        return ChunkMessage{std::move(*data)};
    }
    return decode_control(std::get<std::string>(message));
}

} // namespace filejet::transfer
