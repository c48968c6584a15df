#include "filejet/crypto/random.hpp"
#include "filejet/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>

namespace filejet::crypto {

bool SecureRandom::initialized_ = false;

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }
    
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    
    initialized_ = true;
    LOG_DEBUG("Cryptographic random number generator initialized");
    return true;
}

core::Result SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialized_ && !initialize()) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Random generator not initialized");
    }
    
    if (output.empty()) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Output buffer is empty");
    }
    
    randombytes_buf(output.data(), output.size());
    return core::Result();
}

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    if (!initialized_ && !initialize()) {
        throw std::runtime_error("Random generator not initialized");
    }
    return randombytes_uniform(upper_bound);
}

std::string SecureRandom::generate_hex(std::size_t byte_count) {
    std::vector<std::uint8_t> bytes(byte_count);
    auto result = generate_bytes(bytes);
    if (!result.success()) {
        throw std::runtime_error("Failed to generate random bytes: " + result.message);
    }
    
    std::string hex(byte_count * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.resize(byte_count * 2);
    return hex;
}

} // namespace filejet::crypto
