#pragma once

#include "filejet/core/result.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace filejet::crypto {

// libsodium-backed randomness. initialize() must succeed before any generator
// is used; it is safe to call repeatedly.
class SecureRandom {
public:
    static bool initialize();
    
    static core::Result generate_bytes(std::span<std::uint8_t> output);
    static std::uint32_t generate_uniform(std::uint32_t upper_bound);
    
    // Lowercase hex of `byte_count` random bytes.
    static std::string generate_hex(std::size_t byte_count);

private:
    static bool initialized_;
};

} // namespace filejet::crypto
