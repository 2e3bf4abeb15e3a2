/**
 * @file TransportStream.h
 * @brief Minimal stream abstraction over a connected socket
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>

namespace ClamFtp {

/**
 * @brief Minimal stream interface used by the scan gateway protocol.
 *
 * The scan exchange mixes short unterminated text messages, a raw payload of
 * a declared length and a JSON reply read until the peer closes. All of them
 * are read with recvSome(); tests substitute a stream that fails on demand.
 */
class TransportStream {
public:
    virtual ~TransportStream() = default;
    virtual bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) = 0;

    /**
     * @brief Single read: > 0 bytes, 0 on orderly close, -1 on error
     */
    virtual ssize_t recvSome(uint8_t* buffer, size_t size, std::string& errorMsg) = 0;

    /**
     * @brief Signal end of our outgoing data
     */
    virtual void shutdown() {}

    bool sendText(const std::string& text, std::string& errorMsg) {
        return sendExact(reinterpret_cast<const uint8_t*>(text.data()), text.size(), errorMsg);
    }
};

/**
 * @brief TransportStream over a plain TCP socket (not owned)
 */
class PlainSocketStream final : public TransportStream {
public:
    explicit PlainSocketStream(int socket) : m_socket(socket) {}

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override;
    ssize_t recvSome(uint8_t* buffer, size_t size, std::string& errorMsg) override;
    void shutdown() override;

private:
    int m_socket;
};

}  // namespace ClamFtp
