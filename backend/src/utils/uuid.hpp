// UUID - connection identifier generation

#pragma once

#include <string>
#include <random>
#include <cctype>


namespace netplay {
/**
 * @brief Random UUID v4 generator.
 *
 * Not thread-safe on its own; generateUUID() keeps one instance per thread.
 *
 * Format: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
 * Where x is any hex digit and y is one of 8, 9, a, or b.
 */
class UUIDGenerator {
public:
    UUIDGenerator()
        : rng_(std::random_device{}())
        , nibble_(0, 15)
        , variant_(8, 11)
    {}

    std::string generate() {
        static constexpr char hex[] = "0123456789abcdef";
        std::string out(36, '-');
        for (size_t i = 0; i < out.size(); ++i) {
            if (isDashPosition(i)) continue;
            out[i] = hex[nibble_(rng_)];
        }
        out[14] = '4';                    // version
        out[19] = hex[variant_(rng_)];    // variant 10xx
        return out;
    }

    static bool isDashPosition(size_t i) {
        return i == 8 || i == 13 || i == 18 || i == 23;
    }

private:
    std::mt19937 rng_;
    std::uniform_int_distribution<int> nibble_;
    std::uniform_int_distribution<int> variant_;
};

/**
 * @brief Generate a UUID v4 string using a thread-local generator.
 *
 * Example:
 *   std::string id = netplay::generateUUID();
 *   // id = "f47ac10b-58cc-4372-a567-0e02b2c3d479"
 */
inline std::string generateUUID() {
    thread_local UUIDGenerator generator;
    return generator.generate();
}

/**
 * @brief Check that a string is a UUID v4 (either hex case accepted).
 */
inline bool isValidUUID(const std::string& uuid) {
    if (uuid.length() != 36) {
        return false;
    }
    for (size_t i = 0; i < uuid.length(); ++i) {
        const bool dash = UUIDGenerator::isDashPosition(i);
        if (dash != (uuid[i] == '-')) {
            return false;
        }
        if (!dash && !std::isxdigit(static_cast<unsigned char>(uuid[i]))) {
            return false;
        }
    }
    if (uuid[14] != '4') {
        return false;
    }
    const char variant = static_cast<char>(std::tolower(static_cast<unsigned char>(uuid[19])));
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

/**
 * @brief Generate a connection ID with prefix.
 * @return Connection ID in format: conn-xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
 *
 * Peers address webrtc-signal messages to this id.
 */
inline std::string generateConnectionId() {
    return "conn-" + generateUUID();
}

} // namespace netplay
