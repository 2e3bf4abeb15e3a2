/**
 * @file ScanClient.cpp
 * @brief Client side of the scan gateway protocol
 */

#include "clamftp/ScanClient.h"
#include "clamftp/Debug.h"
#include "clamftp/HashUtils.h"
#include "clamftp/SocketUtils.h"
#include "clamftp/ThreadSafeLog.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

namespace ClamFtp {

ScanClient::ScanClient(const std::string& host, uint16_t port,
                       uint32_t timeoutSeconds, size_t bufferSize)
    : m_host(host)
    , m_port(port)
    , m_timeoutSeconds(timeoutSeconds)
    , m_bufferSize(bufferSize == 0 ? BUFFER_SIZE_DEFAULT : bufferSize)
{
}

ScanResult ScanClient::scanFile(const std::string& filePath, const std::string& declaredName)
{
    m_lastDigest.clear();

    std::string errorMsg;
    SocketHandle sock = connectTcp(m_host, m_port, m_timeoutSeconds * 1000, errorMsg);
    if (!sock) {
        LOG_ERROR("Cannot reach scan agent at " << m_host << ":" << m_port << ": " << errorMsg);
        return ScanResult::error("Scan agent unavailable", errorMsg);
    }

    PlainSocketStream stream(sock.get());
    ScanResult result = scanOverStream(stream, filePath, declaredName);

    ThreadSafeLog::log("Scan " + filePath + " -> " + scanStatusToString(result.status) +
                       " (" + result.message + ")" +
                       (m_lastDigest.empty() ? "" : " sha256=" + m_lastDigest));
    return result;
}

ScanResult ScanClient::scanOverStream(TransportStream& stream, const std::string& filePath,
                                      const std::string& declaredName)
{
    m_lastDigest.clear();
    std::error_code ec;

    if (!std::filesystem::is_regular_file(filePath, ec)) {
        return ScanResult::error("File not found", filePath);
    }

    const uint64_t fileSize = static_cast<uint64_t>(std::filesystem::file_size(filePath, ec));
    if (ec) {
        return ScanResult::error("Cannot determine file size", ec.message());
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        return ScanResult::error("Cannot open file", filePath);
    }

    const std::string name = declaredName.empty()
        ? std::filesystem::path(filePath).filename().string()
        : declaredName;

    std::string errorMsg;

    // Steps 1-2: FILENAME / SIZE, each answered READY
    if (!exchangeHandshake(stream, ScanProtocol::buildFilenameMessage(name), errorMsg) ||
        !exchangeHandshake(stream, ScanProtocol::buildSizeMessage(fileSize), errorMsg)) {
        LOG_ERROR("Scan handshake failed: " << errorMsg);
        return ScanResult::error("Scan handshake failed", errorMsg);
    }

    // Step 3: exactly fileSize bytes
    HashUtils::IncrementalHash digest;
    bool digestValid = true;
    std::vector<uint8_t> buffer(m_bufferSize);
    uint64_t sent = 0;

    while (sent < fileSize) {
        const uint64_t remaining = fileSize - sent;
        const size_t toRead = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));

        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(toRead));
        const std::streamsize bytesRead = file.gcount();
        if (bytesRead <= 0) {
            // File shrank after SIZE was sent; the agent will see an early close
            errorMsg = "Local file is shorter than declared (" + std::to_string(sent) +
                       " of " + std::to_string(fileSize) + " bytes)";
            LOG_ERROR(errorMsg);
            return ScanResult::error("File size mismatch", errorMsg);
        }

        if (!stream.sendExact(buffer.data(), static_cast<size_t>(bytesRead), errorMsg)) {
            LOG_ERROR("Sending payload to scan agent failed: " << errorMsg);
            return ScanResult::error("Transfer to scan agent failed", errorMsg);
        }

        if (digestValid && !digest.update(buffer.data(), static_cast<size_t>(bytesRead))) {
            LOG_WARNING("SHA-256 of scan payload unavailable");
            digestValid = false;
        }
        sent += static_cast<uint64_t>(bytesRead);
    }

    if (digestValid) {
        m_lastDigest = digest.finalizeHex();
    }

    // Step 4: JSON verdict, then the agent closes
    std::string text;
    if (!readResult(stream, text, errorMsg)) {
        LOG_ERROR("Reading scan result failed: " << errorMsg);
        return ScanResult::error("No scan result", errorMsg);
    }

    ScanResult result;
    if (!ScanResult::parse(text, result, errorMsg)) {
        LOG_ERROR("Invalid scan result: " << errorMsg);
        return ScanResult::error("Invalid scan result", errorMsg);
    }

    LOG_INFO("Scan of " << name << ": " << scanStatusToString(result.status) << " - " << result.message);
    return result;
}

bool ScanClient::exchangeHandshake(TransportStream& stream, const std::string& message,
                                   std::string& errorMsg)
{
    if (!stream.sendText(message, errorMsg)) {
        return false;
    }

    // Read until we hold READY or something that can no longer become READY
    const std::string ready = SCAN_READY;
    std::string reply;
    while (reply.size() < MAX_SCAN_MESSAGE_SIZE) {
        uint8_t chunk[64];
        ssize_t received = stream.recvSome(chunk, sizeof(chunk), errorMsg);
        if (received < 0) {
            return false;
        }
        if (received == 0) {
            errorMsg = "Agent closed the connection after '" + message + "'";
            return false;
        }
        reply.append(reinterpret_cast<const char*>(chunk), static_cast<size_t>(received));

        const std::string trimmed = ScanProtocol::stripLineEnding(reply);
        if (trimmed == ready) {
            return true;
        }
        if (ready.compare(0, trimmed.size(), trimmed) != 0) {
            break;
        }
    }

    errorMsg = "Unexpected reply to '" + message + "': " + ScanProtocol::stripLineEnding(reply);
    return false;
}

bool ScanClient::readResult(TransportStream& stream, std::string& text, std::string& errorMsg)
{
    text.clear();
    std::vector<uint8_t> chunk(4096);

    for (;;) {
        ssize_t received = stream.recvSome(chunk.data(), chunk.size(), errorMsg);
        if (received < 0) {
            return false;
        }
        if (received == 0) {
            break;
        }
        text.append(reinterpret_cast<const char*>(chunk.data()), static_cast<size_t>(received));
        if (text.size() > MAX_SCAN_RESULT_SIZE) {
            errorMsg = "Scan result exceeds " + std::to_string(MAX_SCAN_RESULT_SIZE) + " bytes";
            return false;
        }
    }

    if (text.empty()) {
        errorMsg = "Agent closed the connection without a result";
        return false;
    }
    return true;
}

}  // namespace ClamFtp
