/**
 * @file HashUtils.h
 * @brief SHA-256 hash computation utilities
 */

#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace ClamFtp {

/**
 * @brief SHA-256 hash size in bytes
 */
constexpr size_t HASH_SIZE = 32;

/**
 * @class HashUtils
 * @brief SHA-256 hashing utilities for scan and upload audit records
 *
 * The scan client hashes the bytes it streams to the agent, the agent hashes
 * the bytes it receives, and the orchestrator hashes the bytes it uploads.
 * Comparing the logged digests shows whether the file that was scanned is
 * the file that was stored.
 *
 * Thread Safety:
 * - All methods are thread-safe (no shared state)
 * - Uses OpenSSL's EVP digest API
 */
class HashUtils {
public:
    /**
     * @brief Convert binary hash to hexadecimal string
     * @param hash Binary hash (must be HASH_SIZE bytes)
     * @return Hexadecimal string representation (64 hex characters)
     */
    static std::string hashToString(const unsigned char* hash);

    /**
     * @brief SHA-256 context for incremental hashing
     *
     * Used while streaming a file chunk by chunk over a socket.
     */
    class IncrementalHash {
    public:
        IncrementalHash();
        ~IncrementalHash();

        // Prevent copying (context cannot be copied)
        IncrementalHash(const IncrementalHash&) = delete;
        IncrementalHash& operator=(const IncrementalHash&) = delete;

        // Allow moving (transfers ownership of EVP_MD_CTX)
        IncrementalHash(IncrementalHash&& other) noexcept;
        IncrementalHash& operator=(IncrementalHash&& other) noexcept;

        /**
         * @brief Add data to the hash computation
         * @return true if successful
         */
        bool update(const uint8_t* data, size_t size);

        /**
         * @brief Finalize and get the hash result
         * @param hash Output buffer (must be at least HASH_SIZE bytes)
         * @return true if successful
         *
         * After calling finalize(), you can no longer call update().
         */
        bool finalize(unsigned char* hash);

        /**
         * @brief Finalize and return the digest as hex (empty on failure)
         */
        std::string finalizeHex();

    private:
        void* m_ctx;  ///< Opaque pointer to EVP_MD_CTX
        bool m_finalized;
    };
};

}  // namespace ClamFtp
