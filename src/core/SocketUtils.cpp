/**
 * @file SocketUtils.cpp
 * @brief POSIX socket helpers
 */

#include "clamftp/SocketUtils.h"
#include "clamftp/TransportStream.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace ClamFtp {

namespace {

std::string errnoText(const char* call, int err) {
    return std::string(call) + " failed: " + std::strerror(err);
}

bool setBlocking(int socket, bool blocking) {
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(socket, F_SETFL, flags) == 0;
}

bool setTimeoutOption(int socket, int option, uint32_t timeoutMs) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeoutMs / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000) * 1000);
    return setsockopt(socket, SOL_SOCKET, option, &tv, sizeof(tv)) == 0;
}

bool endpointFromSockaddr(const sockaddr_in& addr, std::string& ipAddress,
                          uint16_t& port, std::string& errorMsg) {
    char text[INET_ADDRSTRLEN] = {};
    if (!inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text))) {
        errorMsg = errnoText("inet_ntop()", errno);
        return false;
    }
    ipAddress = text;
    port = ntohs(addr.sin_port);
    return true;
}

}  // namespace

//=============================================================================
// SocketHandle
//=============================================================================

SocketHandle::~SocketHandle() {
    reset();
}

SocketHandle::SocketHandle(SocketHandle&& other) noexcept
    : m_fd(other.m_fd)
{
    other.m_fd = -1;
}

SocketHandle& SocketHandle::operator=(SocketHandle&& other) noexcept {
    if (this != &other) {
        reset(other.m_fd);
        other.m_fd = -1;
    }
    return *this;
}

int SocketHandle::release() noexcept {
    int fd = m_fd;
    m_fd = -1;
    return fd;
}

void SocketHandle::reset(int fd) noexcept {
    if (m_fd >= 0 && m_fd != fd) {
        ::close(m_fd);
    }
    m_fd = fd;
}

//=============================================================================
// PlainSocketStream
//=============================================================================

bool PlainSocketStream::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    return ClamFtp::sendExact(m_socket, data, size, errorMsg);
}

ssize_t PlainSocketStream::recvSome(uint8_t* buffer, size_t size, std::string& errorMsg) {
    return ClamFtp::recvSome(m_socket, buffer, size, errorMsg);
}

void PlainSocketStream::shutdown() {
    ::shutdown(m_socket, SHUT_WR);
}

//=============================================================================
// Exact-length I/O
//=============================================================================

bool sendExact(int socket, const uint8_t* data, size_t size, std::string& errorMsg)
{
    if (!data || size == 0) {
        return true;  // Nothing to send
    }

    size_t totalSent = 0;

    while (totalSent < size) {
        ssize_t sendResult = ::send(socket, data + totalSent, size - totalSent, MSG_NOSIGNAL);

        if (sendResult < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                errorMsg = "Send timeout - peer not reading";
            } else {
                errorMsg = errnoText("send()", errno);
            }
            return false;
        }

        if (sendResult == 0) {
            errorMsg = "Connection closed by peer";
            return false;
        }

        totalSent += static_cast<size_t>(sendResult);
    }

    return true;
}

bool sendString(int socket, const std::string& text, std::string& errorMsg)
{
    return sendExact(socket, reinterpret_cast<const uint8_t*>(text.data()), text.size(), errorMsg);
}

ssize_t recvSome(int socket, uint8_t* buffer, size_t size, std::string& errorMsg)
{
    for (;;) {
        ssize_t recvResult = ::recv(socket, buffer, size, 0);
        if (recvResult >= 0) {
            return recvResult;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            errorMsg = "Receive timeout - peer not responding";
        } else {
            errorMsg = errnoText("recv()", errno);
        }
        return -1;
    }
}

//=============================================================================
// Socket options
//=============================================================================

bool setSocketRecvTimeout(int socket, uint32_t timeoutMs) {
    return setTimeoutOption(socket, SO_RCVTIMEO, timeoutMs);
}

bool setSocketSendTimeout(int socket, uint32_t timeoutMs) {
    return setTimeoutOption(socket, SO_SNDTIMEO, timeoutMs);
}

bool setSocketTimeouts(int socket, uint32_t timeoutMs) {
    return setSocketRecvTimeout(socket, timeoutMs) && setSocketSendTimeout(socket, timeoutMs);
}

//=============================================================================
// Addressing
//=============================================================================

bool resolveIpv4(const std::string& host, std::string& ipAddress, std::string& errorMsg)
{
    in_addr literal{};
    if (inet_pton(AF_INET, host.c_str(), &literal) == 1) {
        ipAddress = host;
        return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &results);
    if (rc != 0 || !results) {
        errorMsg = "Cannot resolve host '" + host + "': " + gai_strerror(rc);
        if (results) {
            freeaddrinfo(results);
        }
        return false;
    }

    const auto* addr = reinterpret_cast<const sockaddr_in*>(results->ai_addr);
    uint16_t ignoredPort = 0;
    bool ok = endpointFromSockaddr(*addr, ipAddress, ignoredPort, errorMsg);
    freeaddrinfo(results);
    return ok;
}

bool getLocalEndpoint(int socket, std::string& ipAddress, uint16_t& port, std::string& errorMsg)
{
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(socket, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        errorMsg = errnoText("getsockname()", errno);
        return false;
    }
    return endpointFromSockaddr(addr, ipAddress, port, errorMsg);
}

//=============================================================================
// Connection setup
//=============================================================================

SocketHandle connectTcp(const std::string& host, uint16_t port,
                        uint32_t timeoutMs, std::string& errorMsg)
{
    std::string ipAddress;
    if (!resolveIpv4(host, ipAddress, errorMsg)) {
        return SocketHandle();
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, ipAddress.c_str(), &addr.sin_addr);

    SocketHandle sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock) {
        errorMsg = errnoText("socket()", errno);
        return SocketHandle();
    }

    // Non-blocking connect so the attempt is bounded by timeoutMs
    if (!setBlocking(sock.get(), false)) {
        errorMsg = errnoText("fcntl()", errno);
        return SocketHandle();
    }

    int rc = ::connect(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc != 0 && errno != EINPROGRESS) {
        errorMsg = "Connect to " + ipAddress + ":" + std::to_string(port) +
                   " failed: " + std::strerror(errno);
        return SocketHandle();
    }

    if (rc != 0) {
        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLOUT;

        int ready = 0;
        do {
            ready = ::poll(&pfd, 1, static_cast<int>(timeoutMs));
        } while (ready < 0 && errno == EINTR);

        if (ready == 0) {
            errorMsg = "Connect to " + ipAddress + ":" + std::to_string(port) + " timed out";
            return SocketHandle();
        }
        if (ready < 0) {
            errorMsg = errnoText("poll()", errno);
            return SocketHandle();
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
            errorMsg = "Connect to " + ipAddress + ":" + std::to_string(port) +
                       " failed: " + std::strerror(soError != 0 ? soError : errno);
            return SocketHandle();
        }
    }

    if (!setBlocking(sock.get(), true) || !setSocketTimeouts(sock.get(), timeoutMs)) {
        errorMsg = errnoText("setsockopt()", errno);
        return SocketHandle();
    }

    return sock;
}

SocketHandle listenTcp(const std::string& bindAddress, uint16_t port,
                       int backlog, std::string& errorMsg)
{
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, bindAddress.c_str(), &addr.sin_addr) != 1) {
        errorMsg = "Invalid bind address: " + bindAddress;
        return SocketHandle();
    }

    SocketHandle sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock) {
        errorMsg = errnoText("socket()", errno);
        return SocketHandle();
    }

    int reuse = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
        errorMsg = errnoText("setsockopt(SO_REUSEADDR)", errno);
        return SocketHandle();
    }

    if (::bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        errorMsg = "bind() to " + bindAddress + ":" + std::to_string(port) +
                   " failed: " + std::strerror(errno);
        return SocketHandle();
    }

    if (::listen(sock.get(), backlog) != 0) {
        errorMsg = errnoText("listen()", errno);
        return SocketHandle();
    }

    return sock;
}

int waitReadable(int socket, uint32_t timeoutMs)
{
    pollfd pfd{};
    pfd.fd = socket;
    pfd.events = POLLIN;

    int ready = 0;
    do {
        ready = ::poll(&pfd, 1, static_cast<int>(timeoutMs));
    } while (ready < 0 && errno == EINTR);

    if (ready < 0) {
        return -1;
    }
    if (ready == 0) {
        return 0;
    }
    if (pfd.revents & POLLNVAL) {
        return -1;
    }
    return 1;
}

SocketHandle acceptWithTimeout(int listenSocket, uint32_t timeoutMs, std::string& errorMsg)
{
    int ready = waitReadable(listenSocket, timeoutMs);
    if (ready == 0) {
        errorMsg = "Timed out waiting for incoming connection";
        return SocketHandle();
    }
    if (ready < 0) {
        errorMsg = "Listening socket failed while waiting for a connection";
        return SocketHandle();
    }

    int fd = -1;
    do {
        fd = ::accept4(listenSocket, nullptr, nullptr, SOCK_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        errorMsg = errnoText("accept4()", errno);
        return SocketHandle();
    }

    return SocketHandle(fd);
}

}  // namespace ClamFtp
