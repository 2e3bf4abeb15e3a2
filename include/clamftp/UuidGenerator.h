/**
 * @file UuidGenerator.h
 * @brief Random identifier generation utility
 *
 * Provides centralized random ID generation for scan sessions and temp
 * scan artifacts.
 */

#pragma once

#include <string>
#include <iomanip>
#include <array>
#include <cstdint>
#include <sstream>
#include <vector>

#include <openssl/rand.h>

namespace ClamFtp {

/**
 * @class UuidGenerator
 * @brief Thread-safe random identifier generator
 *
 * All randomness comes from OpenSSL's CSPRNG (RAND_bytes), which is
 * thread-safe. Returned strings are lowercase hex.
 */
class UuidGenerator {
public:
    /**
     * @brief Generate a prefixed ID (e.g., "conn_xxxx-xxxx-xxxx-xxxx")
     * @param prefix String prefix to prepend
     * @return Prefixed ID string, or empty string if the CSPRNG failed
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        std::array<uint8_t, 8> bytes{};
        if (!fillRandom(bytes.data(), bytes.size())) {
            return {};
        }

        std::ostringstream oss;
        oss << prefix << std::hex << std::setfill('0');

        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 2 || i == 4 || i == 6) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes[i]);
        }

        return oss.str();
    }

    /**
     * @brief Generate an undashed hex ID
     * @param byteCount Number of random bytes (output is twice as long)
     * @return Hex string, or empty string if the CSPRNG failed
     */
    static std::string generateHex(size_t byteCount) {
        if (byteCount == 0) {
            return {};
        }

        std::vector<uint8_t> bytes(byteCount);
        if (!fillRandom(bytes.data(), bytes.size())) {
            return {};
        }

        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (uint8_t b : bytes) {
            oss << std::setw(2) << static_cast<int>(b);
        }
        return oss.str();
    }

private:
    // Private constructor - all methods are static
    UuidGenerator() = delete;

    static bool fillRandom(uint8_t* out, size_t len) {
        if (!out || len == 0) {
            return false;
        }
        return RAND_bytes(out, static_cast<int>(len)) == 1;
    }
};

}  // namespace ClamFtp
