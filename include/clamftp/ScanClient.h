/**
 * @file ScanClient.h
 * @brief Client side of the scan gateway protocol
 */

#pragma once

#include "ScanProtocol.h"
#include "TransportStream.h"
#include "config.h"

#include <cstdint>
#include <string>

namespace ClamFtp {

/**
 * @class ScanClient
 * @brief Submits one local file to a scan agent and returns its verdict
 *
 * Every failure (connect, unexpected handshake reply, file shorter than
 * declared, unreadable JSON) is reported as ScanStatus::ERROR. INFECTED is
 * only returned when the agent says so.
 */
class ScanClient {
public:
    /**
     * @param host Scan agent host
     * @param port Scan agent port
     * @param timeoutSeconds Connect/read/write timeout
     * @param bufferSize Payload chunk size
     */
    ScanClient(const std::string& host, uint16_t port,
               uint32_t timeoutSeconds = DATA_TIMEOUT_SECONDS_DEFAULT,
               size_t bufferSize = BUFFER_SIZE_DEFAULT);

    /**
     * @brief Connect to the agent and scan @p filePath
     * @param filePath Local file to submit
     * @param declaredName Name sent in FILENAME: (default: file's basename)
     */
    ScanResult scanFile(const std::string& filePath, const std::string& declaredName = "");

    /**
     * @brief Run the exchange over an already connected stream
     */
    ScanResult scanOverStream(TransportStream& stream, const std::string& filePath,
                              const std::string& declaredName = "");

    /**
     * @brief SHA-256 (hex) of the bytes sent by the last exchange
     *
     * Empty if the payload was not sent completely.
     */
    const std::string& lastPayloadDigest() const { return m_lastDigest; }

    const std::string& host() const { return m_host; }
    uint16_t port() const { return m_port; }

private:
    /**
     * @brief Send a control message and require READY
     */
    bool exchangeHandshake(TransportStream& stream, const std::string& message,
                           std::string& errorMsg);

    /**
     * @brief Read the JSON result until the agent closes
     */
    bool readResult(TransportStream& stream, std::string& text, std::string& errorMsg);

    std::string m_host;
    uint16_t m_port;
    uint32_t m_timeoutSeconds;
    size_t m_bufferSize;
    std::string m_lastDigest;
};

}  // namespace ClamFtp
