/**
 * @file ControlSession.cpp
 * @brief FTP control connection implementation
 */

#include "clamftp/ControlSession.h"
#include "clamftp/Debug.h"
#include "clamftp/ThreadSafeLog.h"

namespace ClamFtp {

namespace {

constexpr size_t REPLY_READ_CHUNK = 4096;

std::string stripCarriageReturn(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

bool startsWithReplyCode(const std::string& line) {
    return line.size() >= 3 &&
           line[0] >= '0' && line[0] <= '9' &&
           line[1] >= '0' && line[1] <= '9' &&
           line[2] >= '0' && line[2] <= '9';
}

// Command verb for log and error text ("RETR", "CWD", ...)
std::string commandVerb(const std::string& command) {
    return command.substr(0, command.find(' '));
}

// Never let a password reach a log
std::string maskCredentials(const std::string& command) {
    if (command.compare(0, 5, "PASS ") == 0) {
        return "PASS ****";
    }
    return command;
}

}  // namespace

ControlSession::ControlSession(uint32_t timeoutSeconds, bool authTlsShim)
    : m_lastErrorKind(FtpErrorKind::NONE)
    , m_timeoutSeconds(timeoutSeconds)
    , m_authTlsShim(authTlsShim)
    , m_port(0)
{
}

ControlSession::~ControlSession() {
    disconnect();
}

//=============================================================================
// Connection lifecycle
//=============================================================================

bool ControlSession::connect(const std::string& host, uint16_t port,
                             FtpReply& reply, std::string& errorMsg)
{
    if (m_socket) {
        LOG_INFO("Closing existing connection to " << m_host << ":" << m_port);
        disconnect();
    }

    LOG_INFO("Connecting to " << host << ":" << port);

    m_socket = connectTcp(host, port, m_timeoutSeconds * 1000, errorMsg);
    if (!m_socket) {
        fail(FtpErrorKind::TRANSPORT);
        LOG_ERROR("Connection failed: " << errorMsg);
        ThreadSafeLog::log("Connection to " + host + ":" + std::to_string(port) + " failed: " + errorMsg);
        return false;
    }
    m_buffer.clear();

    if (!readReply(reply, errorMsg)) {
        errorMsg = "No greeting from server: " + errorMsg;
        LOG_ERROR(errorMsg);
        m_socket.close();
        resetState();
        return false;
    }

    if (reply.code() != FTP_SERVICE_READY) {
        fail(reply.isMalformed() ? FtpErrorKind::PROTOCOL : FtpErrorKind::REJECTED);
        errorMsg = "Unexpected server greeting: " + reply.toString();
        LOG_ERROR(errorMsg);
        ThreadSafeLog::log("Connection to " + host + ":" + std::to_string(port) + " refused: " + reply.toString());
        m_socket.close();
        resetState();
        return false;
    }

    m_state.connected = true;
    m_host = host;
    m_port = port;
    m_lastErrorKind = FtpErrorKind::NONE;

    LOG_INFO("Connected to " << host << ":" << port << " - " << reply.message());
    ThreadSafeLog::log("Connected to " + host + ":" + std::to_string(port));
    return true;
}

bool ControlSession::authenticate(const std::string& username, const std::string& password,
                                  std::string& errorMsg)
{
    if (!m_state.connected) {
        fail(FtpErrorKind::NOT_CONNECTED);
        errorMsg = "Not connected to server";
        return false;
    }

    m_state.authenticated = false;

    if (m_authTlsShim && !negotiateLegacyAuthTls(errorMsg)) {
        return false;
    }

    FtpReply reply;
    if (!sendCredentials(username, password, reply, errorMsg)) {
        return false;
    }

    if (reply.code() == FTP_BAD_SEQUENCE) {
        // Server wants AUTH before USER; after the shim it usually accepts a retry
        LOG_WARNING("Server replied " << reply.toString() << " to login, retrying once");
        if (!sendCredentials(username, password, reply, errorMsg)) {
            return false;
        }
    }

    if (!reply.isPositive()) {
        fail(reply.isMalformed() ? FtpErrorKind::PROTOCOL : FtpErrorKind::AUTHENTICATION);
        errorMsg = "Login failed: " + reply.toString();
        LOG_ERROR(errorMsg);
        ThreadSafeLog::log("Login as " + username + " failed: " + reply.toString());
        return false;
    }

    m_state.authenticated = true;
    m_lastErrorKind = FtpErrorKind::NONE;

    LOG_INFO("Logged in as " << username);
    ThreadSafeLog::log("Logged in as " + username + " on " + m_host + ":" + std::to_string(m_port));
    return true;
}

void ControlSession::disconnect()
{
    if (!m_socket) {
        resetState();
        return;
    }

    if (m_state.connected && m_state.authenticated) {
        FtpReply reply;
        std::string errorMsg;
        if (!execute("QUIT", reply, errorMsg)) {
            LOG_WARNING("QUIT failed: " << errorMsg);
        } else {
            LOG_DEBUG("QUIT: " << reply.toString());
        }
    }

    bool wasConnected = m_state.connected;
    m_socket.close();
    m_buffer.clear();
    resetState();

    if (wasConnected) {
        LOG_INFO("Disconnected from " << m_host << ":" << m_port);
        ThreadSafeLog::log("Disconnected from " + m_host + ":" + std::to_string(m_port));
    }
}

void ControlSession::resetState()
{
    bool passive = m_state.passiveMode;
    m_state = SessionState();
    m_state.passiveMode = passive;
}

//=============================================================================
// Command / reply exchange
//=============================================================================

bool ControlSession::sendCommand(const std::string& command, std::string& errorMsg)
{
    if (!m_socket || !m_state.connected) {
        fail(FtpErrorKind::NOT_CONNECTED);
        errorMsg = "Not connected to server";
        return false;
    }

    if (!sendString(m_socket.get(), command + FTP_CRLF, errorMsg)) {
        fail(FtpErrorKind::TRANSPORT);
        errorMsg = "Failed to send " + commandVerb(command) + ": " + errorMsg;
        LOG_ERROR(errorMsg);
        return false;
    }

    LOG_DEBUG("Sent: " << maskCredentials(command));
    return true;
}

bool ControlSession::readReply(FtpReply& reply, std::string& errorMsg)
{
    if (!m_socket) {
        fail(FtpErrorKind::NOT_CONNECTED);
        errorMsg = "Not connected to server";
        return false;
    }

    std::string replyText;
    while (!extractReply(replyText)) {
        if (m_buffer.size() > MAX_REPLY_SIZE) {
            fail(FtpErrorKind::PROTOCOL);
            errorMsg = "Reply exceeds " + std::to_string(MAX_REPLY_SIZE) + " bytes";
            m_buffer.clear();
            return false;
        }

        uint8_t chunk[REPLY_READ_CHUNK];
        ssize_t received = recvSome(m_socket.get(), chunk, sizeof(chunk), errorMsg);
        if (received < 0) {
            fail(FtpErrorKind::TRANSPORT);
            return false;
        }

        if (received == 0) {
            if (!m_buffer.empty()) {
                // Server closed right after an unterminated final line
                replyText.swap(m_buffer);
                m_buffer.clear();
                break;
            }
            fail(FtpErrorKind::TRANSPORT);
            errorMsg = "Control connection closed by server";
            LOG_WARNING(errorMsg);
            m_socket.close();
            resetState();
            return false;
        }

        m_buffer.append(reinterpret_cast<const char*>(chunk), static_cast<size_t>(received));
    }

    reply = FtpReply::parse(replyText);
    m_lastErrorKind = FtpErrorKind::NONE;
    LOG_DEBUG("Received: " << reply.toString());
    return true;
}

bool ControlSession::extractReply(std::string& replyText)
{
    size_t eol = m_buffer.find('\n');
    if (eol == std::string::npos) {
        return false;
    }

    std::string firstLine = stripCarriageReturn(m_buffer.substr(0, eol));
    bool multiLine = startsWithReplyCode(firstLine) && firstLine.size() >= 4 && firstLine[3] == '-';

    size_t end = eol + 1;
    if (multiLine) {
        // RFC 959: ends at a line starting with the same code and a space
        const std::string code = firstLine.substr(0, 3);
        size_t pos = end;
        for (;;) {
            size_t next = m_buffer.find('\n', pos);
            if (next == std::string::npos) {
                return false;
            }
            std::string line = stripCarriageReturn(m_buffer.substr(pos, next - pos));
            pos = next + 1;
            if (line.compare(0, 3, code) == 0 && (line.size() == 3 || line[3] == ' ')) {
                break;
            }
        }
        end = pos;
    }

    replyText = m_buffer.substr(0, end);
    m_buffer.erase(0, end);
    return true;
}

bool ControlSession::execute(const std::string& command, FtpReply& reply, std::string& errorMsg)
{
    return sendCommand(command, errorMsg) && readReply(reply, errorMsg);
}

//=============================================================================
// Authentication helpers
//=============================================================================

bool ControlSession::negotiateLegacyAuthTls(std::string& errorMsg)
{
    FtpReply reply;
    if (!execute("AUTH TLS", reply, errorMsg)) {
        errorMsg = "AUTH TLS exchange failed: " + errorMsg;
        LOG_ERROR(errorMsg);
        return false;
    }

    if (reply.isPositive()) {
        m_state.encryptionNegotiated = true;
        LOG_WARNING("Server accepted AUTH TLS but no TLS handshake is performed; "
                    "the control channel remains CLEARTEXT");
        ThreadSafeLog::log("AUTH TLS accepted by " + m_host + " (compatibility shim, connection is cleartext)");
    } else if (reply.isMalformed()) {
        LOG_WARNING("Malformed reply to AUTH TLS, continuing in cleartext: " << reply.raw());
    } else {
        LOG_INFO("AUTH TLS not accepted (" << reply.toString() << "), continuing in cleartext");
    }
    return true;
}

bool ControlSession::sendCredentials(const std::string& username, const std::string& password,
                                     FtpReply& reply, std::string& errorMsg)
{
    if (!execute("USER " + username, reply, errorMsg)) {
        return false;
    }

    if (reply.code() == FTP_USER_OK_NEED_PASSWORD) {
        return execute("PASS " + password, reply, errorMsg);
    }
    return true;
}

//=============================================================================
// Simple commands
//=============================================================================

bool ControlSession::requireAuthenticated(std::string& errorMsg)
{
    if (!m_state.connected) {
        fail(FtpErrorKind::NOT_CONNECTED);
        errorMsg = "Not connected to server";
        return false;
    }
    if (!m_state.authenticated) {
        fail(FtpErrorKind::NOT_CONNECTED);
        errorMsg = "Not logged in";
        return false;
    }
    return true;
}

bool ControlSession::runSimpleCommand(const std::string& command, FtpReply& reply,
                                      std::string& errorMsg)
{
    if (!requireAuthenticated(errorMsg) || !execute(command, reply, errorMsg)) {
        return false;
    }

    if (!reply.isPositive()) {
        fail(reply.isMalformed() ? FtpErrorKind::PROTOCOL : FtpErrorKind::REJECTED);
        errorMsg = commandVerb(command) + " failed: " + reply.toString();
        return false;
    }

    m_lastErrorKind = FtpErrorKind::NONE;
    return true;
}

bool ControlSession::setTransferMode(TransferMode mode, FtpReply& reply, std::string& errorMsg)
{
    const char* command = (mode == TransferMode::ASCII) ? "TYPE A" : "TYPE I";
    if (!runSimpleCommand(command, reply, errorMsg)) {
        return false;
    }
    m_state.transferMode = mode;
    LOG_INFO("Transfer mode set to " << transferModeToString(mode));
    return true;
}

bool ControlSession::changeDirectory(const std::string& path, FtpReply& reply, std::string& errorMsg)
{
    if (!runSimpleCommand("CWD " + path, reply, errorMsg)) {
        return false;
    }

    std::string current;
    FtpReply pwdReply;
    std::string pwdError;
    if (!printWorkingDirectory(current, pwdReply, pwdError)) {
        // Directory did change; only our record of it is approximate now
        LOG_WARNING("PWD after CWD failed: " << pwdError);
        if (!path.empty() && path[0] == '/') {
            m_state.workingDirectory = path;
        } else {
            std::string base = m_state.workingDirectory;
            if (base.empty() || base.back() != '/') {
                base += '/';
            }
            m_state.workingDirectory = base + path;
        }
        m_lastErrorKind = FtpErrorKind::NONE;
    }
    return true;
}

bool ControlSession::printWorkingDirectory(std::string& path, FtpReply& reply, std::string& errorMsg)
{
    if (!runSimpleCommand("PWD", reply, errorMsg)) {
        return false;
    }

    if (!extractQuotedPath(reply.message(), path)) {
        fail(FtpErrorKind::PROTOCOL);
        errorMsg = "PWD reply has no quoted path: " + reply.toString();
        return false;
    }

    m_state.workingDirectory = path;
    return true;
}

bool ControlSession::makeDirectory(const std::string& path, FtpReply& reply, std::string& errorMsg)
{
    return runSimpleCommand("MKD " + path, reply, errorMsg);
}

bool ControlSession::removeDirectory(const std::string& path, FtpReply& reply, std::string& errorMsg)
{
    return runSimpleCommand("RMD " + path, reply, errorMsg);
}

bool ControlSession::deleteFile(const std::string& path, FtpReply& reply, std::string& errorMsg)
{
    return runSimpleCommand("DELE " + path, reply, errorMsg);
}

bool ControlSession::rename(const std::string& from, const std::string& to,
                            FtpReply& reply, std::string& errorMsg)
{
    if (!requireAuthenticated(errorMsg) || !execute("RNFR " + from, reply, errorMsg)) {
        return false;
    }

    if (!reply.isIntermediate()) {
        fail(reply.isMalformed() ? FtpErrorKind::PROTOCOL : FtpErrorKind::REJECTED);
        errorMsg = "RNFR failed: " + reply.toString();
        return false;
    }

    return runSimpleCommand("RNTO " + to, reply, errorMsg);
}

bool ControlSession::extractQuotedPath(const std::string& message, std::string& path)
{
    size_t start = message.find('"');
    if (start == std::string::npos) {
        return false;
    }

    std::string result;
    for (size_t i = start + 1; i < message.size(); ++i) {
        if (message[i] != '"') {
            result += message[i];
            continue;
        }
        // RFC 959 escapes an embedded quote by doubling it
        if (i + 1 < message.size() && message[i + 1] == '"') {
            result += '"';
            ++i;
            continue;
        }
        path = result;
        return true;
    }
    return false;
}

}  // namespace ClamFtp
