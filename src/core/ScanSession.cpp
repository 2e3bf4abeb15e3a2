/**
 * @file ScanSession.cpp
 * @brief Agent-side state machine for one scan connection
 */

#include "clamftp/ScanSession.h"
#include "clamftp/Debug.h"
#include "clamftp/HashUtils.h"
#include "clamftp/TempScanFile.h"
#include "clamftp/ThreadSafeLog.h"
#include "clamftp/UuidGenerator.h"

#include <algorithm>
#include <memory>
#include <vector>

namespace ClamFtp {

ScanSession::ScanSession(TransportStream& stream, ScanEngine& engine,
                         const ScanSessionOptions& options, const std::string& peer)
    : m_stream(stream)
    , m_engine(engine)
    , m_options(options)
    , m_peer(peer)
    , m_sessionId(UuidGenerator::generateWithPrefix("conn_"))
    , m_state(ScanSessionState::AWAIT_FILENAME)
{
    if (m_options.bufferSize == 0) {
        m_options.bufferSize = BUFFER_SIZE_DEFAULT;
    }
}

ScanSessionReport ScanSession::run()
{
    ScanSessionReport report;
    report.sessionId = m_sessionId;

    // Reaches CLOSED on every path, after the temp file below is gone
    struct CloseOnExit {
        ScanSession& session;
        ~CloseOnExit() {
            session.m_stream.shutdown();
            session.transition(ScanSessionState::CLOSED);
        }
    } closeOnExit{*this};

    std::unique_ptr<TempScanFile> tempFile;

    LOG_INFO("[" << m_sessionId << "] Client connected: " << m_peer);
    transition(ScanSessionState::AWAIT_FILENAME);

    std::string message;
    std::string errorMsg;

    //-------------------------------------------------------------------------
    // FILENAME:<name>
    //-------------------------------------------------------------------------
    if (!receiveMessage(SCAN_FILENAME_PREFIX, message, errorMsg)) {
        LOG_WARNING("[" << m_sessionId << "] No FILENAME message: " << errorMsg);
        return report;
    }
    if (!ScanProtocol::parseFilenameMessage(message, report.filename)) {
        rejectProtocolViolation(report, "Invalid protocol: expected FILENAME");
        return report;
    }
    LOG_INFO("[" << m_sessionId << "] Receiving file: " << report.filename);

    if (!m_stream.sendText(SCAN_READY, errorMsg)) {
        LOG_WARNING("[" << m_sessionId << "] Client gone before SIZE: " << errorMsg);
        return report;
    }
    transition(ScanSessionState::AWAIT_SIZE);

    //-------------------------------------------------------------------------
    // SIZE:<n>
    //-------------------------------------------------------------------------
    if (!receiveMessage(SCAN_SIZE_PREFIX, message, errorMsg)) {
        LOG_WARNING("[" << m_sessionId << "] No SIZE message: " << errorMsg);
        return report;
    }
    if (!ScanProtocol::parseSizeMessage(message, report.declaredSize)) {
        rejectProtocolViolation(report, "Invalid protocol: expected SIZE");
        return report;
    }
    if (report.declaredSize > m_options.maxFileSize) {
        rejectProtocolViolation(report, "Declared size " + std::to_string(report.declaredSize) +
                                        " exceeds limit of " + std::to_string(m_options.maxFileSize) + " bytes");
        return report;
    }
    LOG_INFO("[" << m_sessionId << "] File size: " << report.declaredSize << " bytes");

    if (!m_stream.sendText(SCAN_READY, errorMsg)) {
        LOG_WARNING("[" << m_sessionId << "] Client gone before payload: " << errorMsg);
        return report;
    }
    transition(ScanSessionState::RECEIVE_PAYLOAD);

    //-------------------------------------------------------------------------
    // Payload: up to declaredSize bytes; an early close is scanned as-is
    //-------------------------------------------------------------------------
    tempFile = std::make_unique<TempScanFile>(m_options.tempDir, report.filename);
    report.tempPath = tempFile->path().string();

    if (!tempFile->create(errorMsg)) {
        LOG_ERROR("[" << m_sessionId << "] " << errorMsg);
        report.result = ScanResult::error("Server error", errorMsg);
        report.responded = respond(report.result);
        return report;
    }

    HashUtils::IncrementalHash digest;
    std::vector<uint8_t> buffer(m_options.bufferSize);
    bool peerClosedEarly = false;

    while (report.bytesReceived < report.declaredSize) {
        const size_t toRead = static_cast<size_t>(
            std::min<uint64_t>(buffer.size(), report.declaredSize - report.bytesReceived));

        ssize_t received = m_stream.recvSome(buffer.data(), toRead, errorMsg);
        if (received <= 0) {
            if (received < 0) {
                LOG_WARNING("[" << m_sessionId << "] Payload read failed: " << errorMsg);
            }
            peerClosedEarly = true;
            break;
        }

        if (!tempFile->write(buffer.data(), static_cast<size_t>(received), errorMsg)) {
            LOG_ERROR("[" << m_sessionId << "] " << errorMsg);
            report.result = ScanResult::error("Server error", errorMsg);
            report.responded = respond(report.result);
            return report;
        }

        if (!digest.update(buffer.data(), static_cast<size_t>(received))) {
            LOG_ERROR("[" << m_sessionId << "] SHA-256 update failed");
            report.result = ScanResult::error("Server error", "Hash computation failed");
            report.responded = respond(report.result);
            return report;
        }
        report.bytesReceived += static_cast<uint64_t>(received);
    }

    if (!tempFile->finish(errorMsg)) {
        LOG_ERROR("[" << m_sessionId << "] " << errorMsg);
        report.result = ScanResult::error("Server error", errorMsg);
        report.responded = respond(report.result);
        return report;
    }

    report.payloadSha256 = digest.finalizeHex();
    LOG_INFO("[" << m_sessionId << "] File received: " << report.bytesReceived << "/"
             << report.declaredSize << " bytes");

    //-------------------------------------------------------------------------
    // Scan
    //-------------------------------------------------------------------------
    transition(ScanSessionState::SCANNING);
    ScanResult verdict = m_engine.scan(tempFile->path().string());

    if (peerClosedEarly) {
        const std::string note = "received " + std::to_string(report.bytesReceived) +
                                 " of " + std::to_string(report.declaredSize) + " bytes";
        verdict.details = verdict.details.empty() ? note : verdict.details + "\n" + note;
    }
    report.result = verdict;

    ThreadSafeLog::log("[" + m_sessionId + "] " + m_peer + " " + report.filename + " (" +
                       std::to_string(report.bytesReceived) + " bytes, sha256=" +
                       report.payloadSha256 + ") -> " + scanStatusToString(report.result.status));

    //-------------------------------------------------------------------------
    // Respond
    //-------------------------------------------------------------------------
    report.responded = respond(report.result);
    if (report.responded) {
        transition(ScanSessionState::RESPONDED);
    }
    LOG_INFO("[" << m_sessionId << "] Scan complete: " << scanStatusToString(report.result.status));

    tempFile.reset();
    return report;
}

bool ScanSession::receiveMessage(const std::string& keyword, std::string& message, std::string& errorMsg)
{
    std::vector<uint8_t> buffer(MAX_SCAN_MESSAGE_SIZE);
    message.clear();

    // A keyword split across segments is reassembled; once the keyword is
    // complete or can no longer match, the bytes read so far are the message
    do {
        ssize_t received = m_stream.recvSome(buffer.data(), buffer.size() - message.size(), errorMsg);
        if (received < 0) {
            return false;
        }
        if (received == 0) {
            errorMsg = message.empty() ? "Connection closed by peer"
                                       : "Connection closed mid-message: '" + message + "'";
            return false;
        }
        message.append(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(received));
    } while (message.size() < keyword.size() &&
             keyword.compare(0, message.size(), message) == 0);

    return true;
}

bool ScanSession::respond(const ScanResult& result)
{
    std::string errorMsg;
    if (!m_stream.sendText(result.serialize(), errorMsg)) {
        LOG_WARNING("[" << m_sessionId << "] Could not send result: " << errorMsg);
        return false;
    }
    return true;
}

void ScanSession::rejectProtocolViolation(ScanSessionReport& report, const std::string& detail)
{
    LOG_ERROR("[" << m_sessionId << "] Protocol violation from " << m_peer << ": " << detail);
    ThreadSafeLog::log("[" + m_sessionId + "] Protocol violation from " + m_peer + ": " + detail);

    report.protocolViolation = true;
    report.result = ScanResult::error("Protocol violation", detail);
    report.responded = respond(report.result);
}

void ScanSession::transition(ScanSessionState state)
{
    m_state.store(state);
    LOG_DEBUG("[" << m_sessionId << "] -> " << scanSessionStateToString(state));
    if (m_observer) {
        m_observer(m_sessionId, state);
    }
}

}  // namespace ClamFtp
