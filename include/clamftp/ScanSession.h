/**
 * @file ScanSession.h
 * @brief Agent-side state machine for one scan connection
 */

#pragma once

#include "ScanEngine.h"
#include "ScanProtocol.h"
#include "TransportStream.h"
#include "config.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace ClamFtp {

//=============================================================================
// Session State
//=============================================================================

/**
 * @brief Per-connection protocol state
 *
 * AWAIT_FILENAME -> AWAIT_SIZE -> RECEIVE_PAYLOAD -> SCANNING -> RESPONDED -> CLOSED.
 * Any state may jump straight to CLOSED on a protocol violation or a
 * transport failure.
 */
enum class ScanSessionState : uint8_t {
    AWAIT_FILENAME,   ///< Waiting for FILENAME:<name>
    AWAIT_SIZE,       ///< Waiting for SIZE:<n>
    RECEIVE_PAYLOAD,  ///< Reading up to n bytes into the temp file
    SCANNING,         ///< Scan engine running
    RESPONDED,        ///< JSON result written
    CLOSED            ///< Temp file deleted, connection finished
};

inline std::string scanSessionStateToString(ScanSessionState state) {
    switch (state) {
        case ScanSessionState::AWAIT_FILENAME:  return "AwaitFilename";
        case ScanSessionState::AWAIT_SIZE:      return "AwaitSize";
        case ScanSessionState::RECEIVE_PAYLOAD: return "ReceivePayload";
        case ScanSessionState::SCANNING:        return "Scanning";
        case ScanSessionState::RESPONDED:       return "Responded";
        case ScanSessionState::CLOSED:          return "Closed";
        default:                                return "Unknown";
    }
}

/**
 * @brief Read-only settings shared by all sessions of one agent
 */
struct ScanSessionOptions {
    std::filesystem::path tempDir = TEMP_DIR_DEFAULT;
    uint64_t maxFileSize = MAX_SCAN_FILE_SIZE_DEFAULT;
    size_t bufferSize = BUFFER_SIZE_DEFAULT;
};

/**
 * @brief What happened in one session (returned by ScanSession::run())
 */
struct ScanSessionReport {
    std::string sessionId;
    std::string filename;          ///< Declared name (empty if never received)
    uint64_t declaredSize = 0;
    uint64_t bytesReceived = 0;
    std::string tempPath;          ///< Temp artifact path (deleted by the time run() returns)
    std::string payloadSha256;     ///< Digest of the received bytes
    bool responded = false;        ///< JSON result written successfully
    bool protocolViolation = false;
    ScanResult result;
};

/**
 * @brief State change notification
 *
 * Invoked on the session's thread. The CLOSED notification is delivered
 * after the temp file has been deleted.
 */
using ScanStateObserver = std::function<void(const std::string& sessionId,
                                             ScanSessionState state)>;

//=============================================================================
// ScanSession Class
//=============================================================================

/**
 * @class ScanSession
 * @brief Runs the FILENAME/SIZE/payload/JSON exchange on one connection
 *
 * The session owns its temp file exclusively and shares nothing mutable
 * with other sessions. It does not own the stream; the caller closes the
 * socket after run() returns. run() shuts down the write side before
 * returning so the client sees end-of-stream after the JSON.
 *
 * Usage:
 * @code
 *   PlainSocketStream stream(clientSocket.get());
 *   ScanSession session(stream, engine, options, "10.0.0.5");
 *   ScanSessionReport report = session.run();
 * @endcode
 */
class ScanSession {
public:
    ScanSession(TransportStream& stream, ScanEngine& engine,
                const ScanSessionOptions& options, const std::string& peer);

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    /**
     * @brief Drive the session to CLOSED
     */
    ScanSessionReport run();

    ScanSessionState getState() const { return m_state.load(); }
    const std::string& getSessionId() const { return m_sessionId; }

    void setStateObserver(ScanStateObserver observer) { m_observer = std::move(observer); }

private:
    /**
     * @brief Read one unterminated control message starting with @p keyword
     *
     * Keeps reading while the bytes so far are a proper prefix of the
     * keyword. The value after the keyword is expected in the same write.
     */
    bool receiveMessage(const std::string& keyword, std::string& message, std::string& errorMsg);

    /**
     * @brief Send a result JSON (best effort; failure is logged)
     */
    bool respond(const ScanResult& result);

    /**
     * @brief ERROR result for a malformed message, then close
     */
    void rejectProtocolViolation(ScanSessionReport& report, const std::string& detail);

    void transition(ScanSessionState state);

    TransportStream& m_stream;
    ScanEngine& m_engine;
    ScanSessionOptions m_options;
    std::string m_peer;
    std::string m_sessionId;
    std::atomic<ScanSessionState> m_state;
    ScanStateObserver m_observer;
};

}  // namespace ClamFtp
