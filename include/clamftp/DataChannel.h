/**
 * @file DataChannel.h
 * @brief PASV/PORT negotiation and the per-transfer data socket
 */

#pragma once

#include "FtpReply.h"
#include "SocketUtils.h"

#include <cstdint>
#include <string>

namespace ClamFtp {

class ControlSession;

/**
 * @brief IPv4 address and port as carried by PASV replies and PORT commands
 */
struct HostPort {
    std::string ip;
    uint16_t port = 0;

    bool operator==(const HostPort& other) const {
        return ip == other.ip && port == other.port;
    }
    bool operator!=(const HostPort& other) const { return !(*this == other); }
};

/**
 * @class DataChannel
 * @brief Establishes the data connection for exactly one transfer
 *
 * Passive mode: sends PASV, parses the server's (h1,h2,h3,h4,p1,p2) and
 * connects to it. Active mode: listens on an ephemeral port on the control
 * connection's local address and announces it with PORT; after the
 * transfer command is answered 1xx, acceptTransferSocket() must be called
 * once before any data flows.
 *
 * Listening and transfer sockets are owned here and closed exactly once,
 * by close() or the destructor.
 */
class DataChannel {
public:
    /**
     * @param control Authenticated control session (must outlive this object)
     * @param timeoutSeconds Connect/accept/read timeout for the data socket
     */
    DataChannel(ControlSession& control, uint32_t timeoutSeconds);
    ~DataChannel() = default;

    DataChannel(const DataChannel&) = delete;
    DataChannel& operator=(const DataChannel&) = delete;

    /**
     * @brief Negotiate using the session's passive/active preference
     * @param reply Output: the PASV or PORT reply
     * @return true if the data channel is ready for the transfer command
     */
    bool open(FtpReply& reply, std::string& errorMsg);

    bool openPassive(FtpReply& reply, std::string& errorMsg);
    bool openActive(FtpReply& reply, std::string& errorMsg);

    /**
     * @brief Accept the server's connection (active mode)
     *
     * No-op in passive mode. Closes the listening socket either way.
     */
    bool acceptTransferSocket(std::string& errorMsg);

    /**
     * @brief Close listening and transfer sockets (idempotent)
     */
    void close();

    bool isPassive() const { return m_passive; }

    /**
     * @brief Transfer socket (-1 until connected/accepted)
     */
    int transferSocket() const { return m_transferSocket.get(); }

    /**
     * @brief Endpoint connected to (passive) or announced (active)
     */
    const HostPort& endpoint() const { return m_endpoint; }

    //=========================================================================
    // Address encoding
    //=========================================================================

    /**
     * @brief Extract the parenthesized sextuple from a PASV reply message
     * @return false if the sextuple is missing or malformed
     */
    static bool parsePassiveReply(const std::string& message, HostPort& endpoint);

    /**
     * @brief "a,b,c,d,p1,p2" with p1 = port / 256 and p2 = port % 256
     * @return Empty string if @p ip is not a dotted-quad IPv4 address
     */
    static std::string encodeHostPort(const std::string& ip, uint16_t port);

    /**
     * @brief Inverse of encodeHostPort()
     */
    static bool decodeHostPort(const std::string& sextuple, HostPort& endpoint);

    /**
     * @brief "PORT a,b,c,d,p1,p2" (empty if @p ip is invalid)
     */
    static std::string buildActiveCommandPayload(const std::string& ip, uint16_t port);

private:
    ControlSession& m_control;
    uint32_t m_timeoutSeconds;
    bool m_passive;
    HostPort m_endpoint;
    SocketHandle m_listenSocket;
    SocketHandle m_transferSocket;
};

}  // namespace ClamFtp
