/**
 * @file ControlSession.h
 * @brief FTP control connection: connect, authenticate, command/reply exchange
 */

#pragma once

#include "FtpError.h"
#include "FtpReply.h"
#include "SocketUtils.h"
#include "config.h"

#include <cstdint>
#include <string>

namespace ClamFtp {

/**
 * @brief Representation type used for data transfers (TYPE A / TYPE I)
 */
enum class TransferMode : uint8_t {
    ASCII,
    BINARY
};

inline const char* transferModeToString(TransferMode mode) {
    switch (mode) {
        case TransferMode::ASCII:  return "ascii";
        case TransferMode::BINARY: return "binary";
        default:                   return "unknown";
    }
}

/**
 * @brief Mutable state of one control connection
 *
 * authenticated implies connected. Everything except passiveMode is reset
 * by ControlSession::disconnect(); passiveMode is an operator preference
 * and survives reconnects.
 */
struct SessionState {
    bool connected = false;
    bool authenticated = false;
    bool passiveMode = true;
    TransferMode transferMode = TransferMode::BINARY;
    std::string workingDirectory = "/";
    bool encryptionNegotiated = false;  ///< AUTH TLS accepted; channel is still cleartext
};

/**
 * @class ControlSession
 * @brief Owns the control socket and the session state
 *
 * All operations are synchronous. Failures are reported through the return
 * value and errorMsg; lastErrorKind() tells the caller which category the
 * most recent failure belongs to. Nothing reconnects automatically.
 *
 * Usage:
 * @code
 *   ControlSession session;
 *   FtpReply greeting;
 *   std::string errorMsg;
 *   if (session.connect("ftp.example.org", 21, greeting, errorMsg) &&
 *       session.authenticate("user", "secret", errorMsg)) {
 *       ...
 *   }
 *   session.disconnect();
 * @endcode
 */
class ControlSession {
public:
    /**
     * @param timeoutSeconds Connect and reply-read timeout
     * @param authTlsShim Send the legacy AUTH TLS probe before USER
     */
    explicit ControlSession(uint32_t timeoutSeconds = CONTROL_TIMEOUT_SECONDS,
                            bool authTlsShim = true);
    ~ControlSession();

    ControlSession(const ControlSession&) = delete;
    ControlSession& operator=(const ControlSession&) = delete;

    //=========================================================================
    // Connection lifecycle
    //=========================================================================

    /**
     * @brief Open the control connection and read the greeting
     * @param host Server host name or IPv4 address
     * @param port Server control port
     * @param reply Output: the greeting (if one was read)
     * @param errorMsg Output: error message on failure
     * @return true only if the greeting code is 220
     */
    bool connect(const std::string& host, uint16_t port,
                 FtpReply& reply, std::string& errorMsg);

    /**
     * @brief Log in with USER/PASS
     * @return true if the final reply is 2xx
     */
    bool authenticate(const std::string& username, const std::string& password,
                      std::string& errorMsg);

    /**
     * @brief Send QUIT (if logged in), close the socket and reset state
     *
     * Failures of the QUIT exchange are logged and otherwise ignored.
     */
    void disconnect();

    //=========================================================================
    // Command / reply exchange
    //=========================================================================

    /**
     * @brief Write one command line (CRLF appended)
     */
    bool sendCommand(const std::string& command, std::string& errorMsg);

    /**
     * @brief Read one complete (possibly multi-line) reply
     *
     * A malformed reply is returned successfully with code() == 0; the
     * caller decides how to treat it. Returns false on socket failure,
     * EOF, timeout or an oversized reply.
     */
    bool readReply(FtpReply& reply, std::string& errorMsg);

    /**
     * @brief sendCommand() followed by readReply()
     */
    bool execute(const std::string& command, FtpReply& reply, std::string& errorMsg);

    //=========================================================================
    // Simple commands (require an authenticated session)
    //=========================================================================

    bool setTransferMode(TransferMode mode, FtpReply& reply, std::string& errorMsg);
    bool changeDirectory(const std::string& path, FtpReply& reply, std::string& errorMsg);
    bool printWorkingDirectory(std::string& path, FtpReply& reply, std::string& errorMsg);
    bool makeDirectory(const std::string& path, FtpReply& reply, std::string& errorMsg);
    bool removeDirectory(const std::string& path, FtpReply& reply, std::string& errorMsg);
    bool deleteFile(const std::string& path, FtpReply& reply, std::string& errorMsg);

    /**
     * @brief RNFR (must get 3xx) then RNTO (must get 2xx)
     */
    bool rename(const std::string& from, const std::string& to,
                FtpReply& reply, std::string& errorMsg);

    /**
     * @brief Local toggle; no command is sent
     */
    void setPassiveMode(bool passive) { m_state.passiveMode = passive; }

    //=========================================================================
    // Accessors
    //=========================================================================

    const SessionState& state() const { return m_state; }
    bool isConnected() const { return m_state.connected; }
    bool isAuthenticated() const { return m_state.authenticated; }
    bool isPassiveMode() const { return m_state.passiveMode; }

    /**
     * @brief Category of the most recent failure (NONE after a success)
     */
    FtpErrorKind lastErrorKind() const { return m_lastErrorKind; }

    /**
     * @brief Control socket descriptor (-1 when disconnected)
     *
     * DataChannel binds active-mode listeners to this socket's local address.
     */
    int socket() const { return m_socket.get(); }

    uint32_t timeoutSeconds() const { return m_timeoutSeconds; }
    const std::string& host() const { return m_host; }
    uint16_t port() const { return m_port; }

    void setAuthTlsShimEnabled(bool enabled) { m_authTlsShim = enabled; }

    /**
     * @brief Extract the quoted path from a 257 reply message
     * @return false if the message has no quoted path
     */
    static bool extractQuotedPath(const std::string& message, std::string& path);

private:
    /**
     * @brief Legacy AUTH TLS compatibility shim
     *
     * Some servers (FileZilla Server with "require explicit TLS") reply 503
     * to USER until AUTH has been sent. This sends AUTH TLS and, if the
     * server agrees, records encryptionNegotiated without performing any
     * handshake: the connection stays cleartext. A refusal, error or
     * malformed reply is logged and ignored.
     *
     * @return false only on a transport failure
     */
    bool negotiateLegacyAuthTls(std::string& errorMsg);

    /**
     * @brief USER, then PASS if the server asks for it
     */
    bool sendCredentials(const std::string& username, const std::string& password,
                         FtpReply& reply, std::string& errorMsg);

    /**
     * @brief Execute a command that must be answered 2xx
     */
    bool runSimpleCommand(const std::string& command, FtpReply& reply, std::string& errorMsg);

    bool requireAuthenticated(std::string& errorMsg);

    /**
     * @brief Split one complete reply off the front of m_buffer
     * @return false if the buffer does not hold a complete reply yet
     */
    bool extractReply(std::string& replyText);

    void fail(FtpErrorKind kind) { m_lastErrorKind = kind; }
    void resetState();

    SocketHandle m_socket;
    std::string m_buffer;          ///< Bytes received but not yet consumed
    SessionState m_state;
    FtpErrorKind m_lastErrorKind;
    uint32_t m_timeoutSeconds;
    bool m_authTlsShim;
    std::string m_host;
    uint16_t m_port;
};

}  // namespace ClamFtp
