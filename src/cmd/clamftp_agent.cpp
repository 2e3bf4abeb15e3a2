/**
 * @file clamftp_agent.cpp
 * @brief ClamAV scan agent server
 *
 * Usage:
 *   clamftp_agent [--config FILE] [--port PORT]
 */

#include "clamftp/ScanAgent.h"
#include "clamftp/ScanEngine.h"
#include "clamftp/Settings.h"
#include "clamftp/ThreadSafeLog.h"
#include "clamftp/config.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace ClamFtp;

//=============================================================================
// Signal Handling
//=============================================================================

static std::atomic<bool> g_running(true);

void signalHandler(int signal) {
    (void)signal;
    g_running.store(false);
}

//=============================================================================
// Main Function
//=============================================================================

int main(int argc, char* argv[]) {
    AgentArgs args;
    AgentSettings settings;
    try {
        args = AgentArgs::parseOrThrow(argc, argv);
        if (args.showHelp) {
            std::cout << AgentArgs::usage();
            return 0;
        }
        settings = AgentSettings::loadOrThrow(args.configPath);
        args.applyTo(settings);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n" << AgentArgs::usage();
        return 2;
    }

    ThreadSafeLog::initialize(settings.logFile);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "========================================\n"
              << "  ClamFtp Scan Agent\n"
              << "========================================\n"
              << "Listen: " << settings.host << ":" << settings.port << "\n"
              << "Scanner: " << settings.scannerCommand << " (timeout " << settings.scanTimeoutSeconds << "s)\n"
              << "Temp directory: " << settings.tempDir << "\n"
              << "Max connections: " << settings.maxConnections << "\n"
              << "========================================\n\n";

    ClamScanEngine engine(settings.scannerCommand, settings.scanTimeoutSeconds);
    ScanAgent agent(settings.toAgentConfig(), engine);

    agent.setSessionCompletedCallback([](const ScanSessionReport& report) {
        std::cout << "[SCAN] " << report.sessionId << " " << report.filename
                  << " (" << report.bytesReceived << " bytes) -> "
                  << scanStatusToString(report.result.status) << ": " << report.result.message << "\n";
    });

    std::string errorMsg;
    if (!agent.start(errorMsg)) {
        std::cerr << "[ERROR] Failed to start scan agent: " << errorMsg << "\n";
        ThreadSafeLog::log("Agent start failed: " + errorMsg);
        return 1;
    }

    std::cout << "[INFO] Listening on port " << agent.getPort() << ". Press Ctrl+C to stop.\n";

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n[INFO] Shutting down gracefully...\n";
    agent.stop();
    std::cout << "[INFO] Rejected connections: " << agent.getRejectedConnectionCount() << "\n";
    return 0;
}
