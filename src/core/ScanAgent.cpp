/**
 * @file ScanAgent.cpp
 * @brief Multi-threaded scan agent server
 */

#include "clamftp/ScanAgent.h"
#include "clamftp/Debug.h"
#include "clamftp/ThreadSafeLog.h"
#include "clamftp/TransportStream.h"

#include <arpa/inet.h>
#include <exception>
#include <filesystem>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ClamFtp {

//=============================================================================
// Constructor / Destructor
//=============================================================================

ScanAgent::ScanAgent(const ScanAgentConfig& config, ScanEngine& engine)
    : m_config(config)
    , m_engine(engine)
    , m_boundPort(0)
    , m_running(false)
    , m_stopRequested(false)
    , m_activeClientThreadCount(0)
    , m_rejectedConnectionCount(0)
{
    if (m_config.maxConnections == 0) {
        m_config.maxConnections = 1;
    }
}

ScanAgent::~ScanAgent() {
    if (m_running.load()) {
        stop();
    }
}

//=============================================================================
// ScanAgent: start()
//=============================================================================

bool ScanAgent::start(std::string& errorMsg)
{
    if (m_running.load()) {
        errorMsg = "Scan agent is already running";
        return false;
    }

    // Refuse to accept files we could not scan
    std::string versionInfo;
    if (!m_engine.selfCheck(versionInfo, errorMsg)) {
        errorMsg = "Scanner self-check failed: " + errorMsg;
        LOG_ERROR(errorMsg);
        ThreadSafeLog::log(errorMsg);
        return false;
    }
    LOG_INFO("Scanner self-check OK: " << versionInfo);

    std::error_code ec;
    std::filesystem::create_directories(m_config.session.tempDir, ec);
    if (ec) {
        errorMsg = "Cannot create temp directory " + m_config.session.tempDir.string() + ": " + ec.message();
        LOG_ERROR(errorMsg);
        return false;
    }

    m_listenSocket = listenTcp(m_config.host, m_config.port, LISTEN_BACKLOG, errorMsg);
    if (!m_listenSocket) {
        LOG_ERROR("Failed to start scan agent: " << errorMsg);
        return false;
    }

    std::string boundIp;
    if (!getLocalEndpoint(m_listenSocket.get(), boundIp, m_boundPort, errorMsg)) {
        m_listenSocket.close();
        return false;
    }

    m_stopRequested.store(false);
    m_rejectedConnectionCount.store(0);
    m_running.store(true);

    m_listenerThread = std::thread(&ScanAgent::listenerThreadFunc, this);

    LOG_INFO("Scan agent started on " << m_config.host << ":" << m_boundPort
             << " (max " << m_config.maxConnections << " concurrent scans)");
    ThreadSafeLog::log("Scan agent started on " + m_config.host + ":" + std::to_string(m_boundPort));
    return true;
}

//=============================================================================
// ScanAgent: stop()
//=============================================================================

void ScanAgent::stop()
{
    if (!m_running.load()) {
        return;
    }

    LOG_INFO("Stopping scan agent...");
    m_stopRequested.store(true);

    // Listener notices the flag within one poll interval
    if (m_listenerThread.joinable()) {
        m_listenerThread.join();
    }
    m_listenSocket.close();

    // Unblock handler threads sitting in recv()/send()
    {
        std::lock_guard<std::mutex> lock(m_activeClientsMutex);
        for (int s : m_activeClientSockets) {
            ::shutdown(s, SHUT_RDWR);
        }
    }

    // Wait for all detached client handler threads to exit
    {
        std::unique_lock<std::mutex> lock(m_activeClientsCvMutex);
        m_activeClientsCv.wait(lock, [this]() {
            return m_activeClientThreadCount.load(std::memory_order_acquire) == 0;
        });
    }

    m_running.store(false);
    LOG_INFO("Scan agent stopped");
    ThreadSafeLog::log("Scan agent stopped");
}

//=============================================================================
// ScanAgent: listenerThreadFunc()
//=============================================================================

void ScanAgent::listenerThreadFunc()
{
    while (!m_stopRequested.load()) {
        int ready = waitReadable(m_listenSocket.get(), ACCEPT_POLL_INTERVAL_MS);
        if (ready == 0) {
            continue;
        }
        if (ready < 0) {
            LOG_ERROR("Listening socket failed, accept loop exiting");
            break;
        }

        sockaddr_in clientAddr{};
        socklen_t addrLen = sizeof(clientAddr);
        SocketHandle client(::accept4(m_listenSocket.get(),
                                      reinterpret_cast<sockaddr*>(&clientAddr), &addrLen, SOCK_CLOEXEC));
        if (!client) {
            // EINTR, ECONNABORTED and friends: the next poll decides
            continue;
        }

        char ipStr[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &clientAddr.sin_addr, ipStr, sizeof(ipStr));
        const std::string clientIp = std::string(ipStr) + ":" + std::to_string(ntohs(clientAddr.sin_port));

        // Admission gate: close (transport-level) rather than queue
        if (!tryAdmit()) {
            m_rejectedConnectionCount.fetch_add(1);
            LOG_WARNING("Rejected " << clientIp << ": " << m_config.maxConnections
                        << " scans already in progress");
            ThreadSafeLog::log("Rejected connection from " + clientIp + " (admission limit reached)");
            continue;
        }

        if (!setSocketTimeouts(client.get(), m_config.connectionTimeoutMs)) {
            LOG_WARNING("Could not set timeouts for " << clientIp);
        }

        const int clientSocket = client.release();
        {
            std::lock_guard<std::mutex> lock(m_activeClientsMutex);
            m_activeClientSockets.insert(clientSocket);
        }

        // One handler thread per connection; the listener never blocks on a scan
        std::thread clientThread([this, clientSocket, clientIp]() {
            try {
                this->handleClient(clientSocket, clientIp);
            } catch (const std::exception& e) {
                LOG_ERROR("Handler for " << clientIp << " failed: " << e.what());
                ThreadSafeLog::log(std::string("Handler exception: ") + e.what());
            }

            {
                std::lock_guard<std::mutex> lock(m_activeClientsMutex);
                m_activeClientSockets.erase(clientSocket);
            }
            ::close(clientSocket);

            std::lock_guard<std::mutex> lock(m_activeClientsCvMutex);
            m_activeClientThreadCount.fetch_sub(1, std::memory_order_acq_rel);
            m_activeClientsCv.notify_all();
        });
        clientThread.detach();
    }
}

bool ScanAgent::tryAdmit()
{
    size_t prev = m_activeClientThreadCount.load(std::memory_order_relaxed);
    while (true) {
        if (prev >= m_config.maxConnections) {
            return false;
        }
        if (m_activeClientThreadCount.compare_exchange_weak(
                prev,
                prev + 1,
                std::memory_order_acq_rel,
                std::memory_order_relaxed)) {
            return true;
        }
    }
}

//=============================================================================
// ScanAgent: handleClient()
//=============================================================================

void ScanAgent::handleClient(int clientSocket, const std::string& clientIp)
{
    PlainSocketStream stream(clientSocket);
    ScanSession session(stream, m_engine, m_config.session, clientIp);
    if (m_sessionStateCallback) {
        session.setStateObserver(m_sessionStateCallback);
    }
    ScanSessionReport report = session.run();

    LOG_INFO("[" << report.sessionId << "] Client disconnected: " << clientIp);

    if (m_sessionCompletedCallback) {
        m_sessionCompletedCallback(report);
    }
}

}  // namespace ClamFtp
