/**
 * @file ScanAgent.h
 * @brief Multi-threaded scan agent server
 */

#pragma once

#include "config.h"
#include "ScanEngine.h"
#include "ScanSession.h"
#include "SocketUtils.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace ClamFtp {

//=============================================================================
// Configuration and Callback Types
//=============================================================================

/**
 * @brief Listener and session settings for one agent
 */
struct ScanAgentConfig {
    std::string host = ANY_ADDRESS;
    uint16_t port = SCAN_AGENT_PORT_DEFAULT;
    size_t maxConnections = MAX_CONCURRENT_SCANS_DEFAULT;
    uint32_t connectionTimeoutMs = AGENT_CONNECTION_TIMEOUT_MS;
    ScanSessionOptions session;
};

/**
 * @brief Called on the handler thread after a session reaches CLOSED
 */
using SessionCompletedCallback = std::function<void(const ScanSessionReport& report)>;

//=============================================================================
// ScanAgent Class
//=============================================================================

/**
 * @class ScanAgent
 * @brief TCP server that scans files submitted over the scan gateway protocol
 *
 * Architecture:
 * - Single listener thread polling the listening socket
 * - One handler thread per accepted connection, running a ScanSession
 * - Admission gate: at most maxConnections handler threads; connections
 *   accepted beyond that are closed immediately
 *
 * Handlers share only the read-only configuration and the scan engine.
 *
 * Thread Safety:
 * - getActiveSessionCount() and getRejectedConnectionCount() are thread-safe
 * - start() and stop() are NOT thread-safe (call from same thread)
 *
 * Usage:
 * @code
 * ClamScanEngine engine("clamscan", 60);
 * ScanAgent agent(config, engine);
 * std::string errorMsg;
 * if (agent.start(errorMsg)) {
 *     // accepting connections
 *     agent.stop();
 * }
 * @endcode
 */
class ScanAgent {
public:
    /**
     * @param config Listener and session settings
     * @param engine Scanner shared by all sessions (must outlive the agent)
     */
    ScanAgent(const ScanAgentConfig& config, ScanEngine& engine);

    /**
     * @brief Stops the agent if running
     */
    ~ScanAgent();

    ScanAgent(const ScanAgent&) = delete;
    ScanAgent& operator=(const ScanAgent&) = delete;
    ScanAgent(ScanAgent&&) = delete;
    ScanAgent& operator=(ScanAgent&&) = delete;

    //=========================================================================
    // Server Control Methods
    //=========================================================================

    /**
     * @brief Self-check the engine, bind, listen and launch the listener
     * @return false if the scanner is not invokable or the socket setup failed
     */
    bool start(std::string& errorMsg);

    /**
     * @brief Stop accepting, shut down active connections, wait for handlers
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    //=========================================================================
    // Queries
    //=========================================================================

    /**
     * @brief Bound port (differs from config when configured as 0)
     */
    uint16_t getPort() const { return m_boundPort; }

    size_t getActiveSessionCount() const { return m_activeClientThreadCount.load(); }

    /**
     * @brief Connections closed by the admission gate since start()
     */
    uint64_t getRejectedConnectionCount() const { return m_rejectedConnectionCount.load(); }

    const ScanAgentConfig& getConfig() const { return m_config; }

    void setSessionCompletedCallback(SessionCompletedCallback callback) {
        m_sessionCompletedCallback = std::move(callback);
    }

    /**
     * @brief Observe every session's state changes (set before start())
     */
    void setSessionStateCallback(ScanStateObserver callback) {
        m_sessionStateCallback = std::move(callback);
    }

private:
    /**
     * @brief Accept loop; wakes every ACCEPT_POLL_INTERVAL_MS to check for stop
     */
    void listenerThreadFunc();

    /**
     * @brief Run one ScanSession on an accepted connection
     */
    void handleClient(int clientSocket, const std::string& clientIp);

    /**
     * @brief Reserve a handler slot (CAS on the active count)
     * @return false if maxConnections handlers are already running
     */
    bool tryAdmit();

    ScanAgentConfig m_config;
    ScanEngine& m_engine;

    SocketHandle m_listenSocket;
    uint16_t m_boundPort;

    std::thread m_listenerThread;
    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;

    std::atomic<size_t> m_activeClientThreadCount;
    std::atomic<uint64_t> m_rejectedConnectionCount;

    std::mutex m_activeClientsMutex;
    std::unordered_set<int> m_activeClientSockets;

    std::mutex m_activeClientsCvMutex;
    std::condition_variable m_activeClientsCv;

    SessionCompletedCallback m_sessionCompletedCallback;
    ScanStateObserver m_sessionStateCallback;
};

}  // namespace ClamFtp
