/**
 * @file Settings.h
 * @brief JSON settings and command-line overrides for the client and agent
 *
 * Settings files are optional: a missing file yields the defaults from
 * config.h. A file that exists but is not valid JSON, or a key with the
 * wrong type or an out-of-range value, is an error (std::runtime_error).
 */

#pragma once

#include "config.h"
#include "ScanAgent.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace ClamFtp {

//=============================================================================
// Client
//=============================================================================

struct FtpServerSettings {
    std::string host = LOCALHOST_IP;
    uint16_t port = FTP_PORT_DEFAULT;
    std::string username;
    std::string password;
};

struct ScanAgentEndpoint {
    std::string host = LOCALHOST_IP;
    uint16_t port = SCAN_AGENT_PORT_DEFAULT;
};

struct ClientSettings {
    FtpServerSettings ftpServer;
    ScanAgentEndpoint scanAgent;

    bool passiveMode = true;
    uint32_t timeoutSeconds = DATA_TIMEOUT_SECONDS_DEFAULT;
    size_t bufferSize = BUFFER_SIZE_DEFAULT;
    bool authTlsShim = true;
    bool prompt = true;
    std::string logFile = CLIENT_LOG_FILE_DEFAULT;

    nlohmann::json toJson() const;

    /// Throws std::runtime_error on a wrong type or out-of-range value
    static ClientSettings fromJson(const nlohmann::json& j);

    /**
     * @brief Load settings from a file
     *
     * Returns defaults when the file does not exist.
     * @throws std::runtime_error if the file is unreadable or invalid
     */
    static ClientSettings loadOrThrow(const std::filesystem::path& path);
};

//=============================================================================
// Agent
//=============================================================================

struct AgentSettings {
    std::string host = ANY_ADDRESS;
    uint16_t port = SCAN_AGENT_PORT_DEFAULT;
    size_t maxConnections = MAX_CONCURRENT_SCANS_DEFAULT;

    std::string scannerCommand = SCANNER_COMMAND_DEFAULT;
    std::string tempDir = TEMP_DIR_DEFAULT;
    uint32_t scanTimeoutSeconds = SCAN_TIMEOUT_SECONDS_DEFAULT;
    uint64_t maxFileSize = MAX_SCAN_FILE_SIZE_DEFAULT;

    std::string logFile = AGENT_LOG_FILE_DEFAULT;

    nlohmann::json toJson() const;
    ScanAgentConfig toAgentConfig() const;

    static AgentSettings fromJson(const nlohmann::json& j);
    static AgentSettings loadOrThrow(const std::filesystem::path& path);
};

//=============================================================================
// Command line
//=============================================================================

struct ClientArgs {
    bool showHelp = false;
    std::string configPath = CLIENT_CONFIG_PATH_DEFAULT;

    std::string host;
    uint16_t port = 0;  ///< 0 = keep the configured port
    std::string user;
    std::string password;
    bool hasPassword = false;

    /// Copy explicit overrides into settings
    void applyTo(ClientSettings& settings) const;

    static ClientArgs parseOrThrow(int argc, const char* const* argv);
    static const char* usage();
};

struct AgentArgs {
    bool showHelp = false;
    std::string configPath = AGENT_CONFIG_PATH_DEFAULT;
    uint16_t port = 0;  ///< 0 = keep the configured port

    void applyTo(AgentSettings& settings) const;

    static AgentArgs parseOrThrow(int argc, const char* const* argv);
    static const char* usage();
};

}  // namespace ClamFtp
