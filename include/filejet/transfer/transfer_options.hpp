#pragma once

#include "filejet/core/result.hpp"
#include <cstddef>
#include <cstdint>

namespace filejet::transfer {

constexpr std::size_t DEFAULT_CHUNK_SIZE = 16 * 1024;
constexpr std::size_t DEFAULT_BUFFER_THRESHOLD = 256 * 1024;
constexpr std::size_t DEFAULT_BUFFER_LOW_THRESHOLD = 128 * 1024;

// Largest chunk every substrate carries in one message.
constexpr std::size_t MAX_CHUNK_SIZE = 1024 * 1024;

// Chunks sent in one event loop turn before the sender yields.
constexpr std::size_t DEFAULT_CHUNKS_PER_TURN = 64;

enum class TransferMode {
    IDLE,
    SENDING,
    RECEIVING
};

const char* to_string(TransferMode mode);

struct TransferOptions {
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    std::size_t buffer_threshold = DEFAULT_BUFFER_THRESHOLD;
    std::size_t buffer_low_threshold = DEFAULT_BUFFER_LOW_THRESHOLD;
    std::size_t chunks_per_turn = DEFAULT_CHUNKS_PER_TURN;
    
    core::Result validate() const;
};

// bytes / total * 100, with an empty total counting as complete.
double progress_percent(std::uint64_t bytes, std::uint64_t total);

} // namespace filejet::transfer
