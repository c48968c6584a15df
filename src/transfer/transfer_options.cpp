#include "filejet/transfer/transfer_options.hpp"
#include <string>

namespace filejet::transfer {

const char* to_string(TransferMode mode) {
    switch (mode) {
        case TransferMode::IDLE:      return "idle";
        case TransferMode::SENDING:   return "sending";
        case TransferMode::RECEIVING: return "receiving";
    }
    return "unknown";
}

core::Result TransferOptions::validate() const {
    if (chunk_size == 0) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Chunk size must be positive");
    }
    if (chunk_size > MAX_CHUNK_SIZE) {
        return core::Result(core::ErrorCode::INVALID_INPUT,
                            "Chunk size must not exceed " + std::to_string(MAX_CHUNK_SIZE) + " bytes");
    }
    if (buffer_low_threshold >= buffer_threshold) {
        return core::Result(core::ErrorCode::INVALID_INPUT,
                            "Low-water mark must be below the buffer threshold");
    }
    if (chunks_per_turn == 0) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Chunks per turn must be positive");
    }
    return core::Result();
}

double progress_percent(std::uint64_t bytes, std::uint64_t total) {
    if (total == 0) {
        return 100.0;
    }
    if (bytes >= total) {
        return 100.0;
    }
    return static_cast<double>(bytes) / static_cast<double>(total) * 100.0;
}

} // namespace filejet::transfer
