/**
 * @file SocketUtils.h
 * @brief POSIX socket helpers: RAII handle, exact I/O, timeouts, connect/listen
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>

namespace ClamFtp {

/**
 * @brief Owning wrapper around a socket file descriptor
 *
 * The descriptor is closed exactly once: by close(), reset() or the
 * destructor, whichever comes first. Moving transfers ownership.
 */
class SocketHandle {
public:
    SocketHandle() noexcept : m_fd(-1) {}
    explicit SocketHandle(int fd) noexcept : m_fd(fd) {}
    ~SocketHandle();

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    SocketHandle(SocketHandle&& other) noexcept;
    SocketHandle& operator=(SocketHandle&& other) noexcept;

    int get() const { return m_fd; }
    bool isValid() const { return m_fd >= 0; }
    explicit operator bool() const { return isValid(); }

    /**
     * @brief Give up ownership without closing
     */
    int release() noexcept;

    /**
     * @brief Close the current descriptor (if any) and adopt @p fd
     */
    void reset(int fd = -1) noexcept;

    /**
     * @brief Close the descriptor now; later calls are no-ops
     */
    void close() noexcept { reset(); }

private:
    int m_fd;
};

//=============================================================================
// Exact-length I/O
//=============================================================================

/**
 * @brief Send exact number of bytes
 * @return true if all bytes were sent
 *
 * Uses MSG_NOSIGNAL so a peer reset surfaces as an error instead of SIGPIPE.
 */
bool sendExact(int socket, const uint8_t* data, size_t size, std::string& errorMsg);

/**
 * @brief Send a string verbatim (no terminator is appended)
 */
bool sendString(int socket, const std::string& text, std::string& errorMsg);

/**
 * @brief Single recv() call
 * @return bytes received (> 0), 0 on orderly close, -1 on error or timeout
 */
ssize_t recvSome(int socket, uint8_t* buffer, size_t size, std::string& errorMsg);

//=============================================================================
// Socket options
//=============================================================================

bool setSocketRecvTimeout(int socket, uint32_t timeoutMs);
bool setSocketSendTimeout(int socket, uint32_t timeoutMs);

/**
 * @brief Apply the same send and receive timeout
 */
bool setSocketTimeouts(int socket, uint32_t timeoutMs);

//=============================================================================
// Addressing
//=============================================================================

/**
 * @brief Resolve a host name or dotted quad to an IPv4 dotted quad
 */
bool resolveIpv4(const std::string& host, std::string& ipAddress, std::string& errorMsg);

/**
 * @brief Local address and port a socket is bound to
 */
bool getLocalEndpoint(int socket, std::string& ipAddress, uint16_t& port, std::string& errorMsg);

//=============================================================================
// Connection setup
//=============================================================================

/**
 * @brief Open a TCP connection with a bounded connect time
 * @param host Host name or IPv4 address
 * @param port Remote port
 * @param timeoutMs Connect timeout; also applied as send/recv timeout
 * @param errorMsg Error message output
 * @return Connected socket, or an invalid handle on failure
 */
SocketHandle connectTcp(const std::string& host, uint16_t port,
                        uint32_t timeoutMs, std::string& errorMsg);

/**
 * @brief Create a listening TCP socket
 * @param bindAddress IPv4 address to bind ("0.0.0.0" for all)
 * @param port Port to bind; 0 picks an ephemeral port
 * @param backlog listen() backlog
 * @param errorMsg Error message output
 * @return Listening socket, or an invalid handle on failure
 */
SocketHandle listenTcp(const std::string& bindAddress, uint16_t port,
                       int backlog, std::string& errorMsg);

/**
 * @brief Wait until a socket is readable (or has a pending connection)
 * @return 1 if readable, 0 on timeout, -1 on error
 */
int waitReadable(int socket, uint32_t timeoutMs);

/**
 * @brief accept() bounded by a timeout
 * @return Accepted socket, or an invalid handle on timeout or error
 */
SocketHandle acceptWithTimeout(int listenSocket, uint32_t timeoutMs, std::string& errorMsg);

}  // namespace ClamFtp
