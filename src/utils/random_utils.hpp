#pragma once

#include <openssl/err.h>
#include <openssl/rand.h>

#include <chrono>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace opd {

// Thread-safe random number generation using thread-local generators
class ThreadSafeRandom {
private:
    static thread_local std::mt19937 rng_;
    static thread_local bool initialized_;

    static void ensure_initialized() {
        if (!initialized_) {
            // Seed with a combination of thread ID and high-resolution time
            auto seed = std::hash<std::thread::id>{}(std::this_thread::get_id()) ^
                        static_cast<uint64_t>(
                            std::chrono::high_resolution_clock::now().time_since_epoch().count());
            rng_.seed(static_cast<std::mt19937::result_type>(seed));
            initialized_ = true;
        }
    }

public:
    /**
     * @brief Uniform double in [low, high)
     */
    static double random_double(double low, double high) {
        ensure_initialized();
        std::uniform_real_distribution<double> dist(low, high);
        return dist(rng_);
    }
};

inline thread_local std::mt19937 ThreadSafeRandom::rng_;
inline thread_local bool ThreadSafeRandom::initialized_{false};

inline std::string openssl_error_string() {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return std::string(buf);
}

/**
 * @brief Cryptographically random bytes from OpenSSL
 */
inline std::vector<uint8_t> random_bytes(size_t size) {
    std::vector<uint8_t> bytes(size);
    if (RAND_bytes(bytes.data(), static_cast<int>(size)) != 1) {
        throw std::runtime_error("Failed to generate random bytes: " + openssl_error_string());
    }
    return bytes;
}

inline std::string to_hex(const std::vector<uint8_t>& data) {
    std::string hex;
    hex.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        hex += "0123456789abcdef"[byte >> 4];
        hex += "0123456789abcdef"[byte & 0x0F];
    }
    return hex;
}

/**
 * @brief Opaque identifier such as "tok_3f9a0c..." (prefix + 24 hex chars)
 */
inline std::string generate_id(const std::string& prefix) {
    return prefix + "_" + to_hex(random_bytes(12));
}

} // namespace opd
