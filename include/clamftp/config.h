/**
 * @file config.h
 * @brief Configuration constants for ClamFtp
 *
 * This file contains all compile-time configuration constants used throughout
 * ClamFtp: default endpoints, timeouts, buffer sizes, FTP reply codes and
 * the scan gateway wire vocabulary.
 *
 * Runtime values (hosts, ports, credentials, scanner command) come from the
 * JSON settings files (see Settings.h). The constants here are the defaults
 * used when a setting is absent, plus hard protocol limits that are not
 * configurable.
 *
 * @note Changes to the scan gateway constants affect wire compatibility with
 *       existing agents.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace ClamFtp
 * @brief ClamFtp namespace containing all public APIs
 */
namespace ClamFtp {

//=========================================================================
// Network Endpoints
//=========================================================================

/** @defgroup Endpoints Default Endpoints
 * @brief Default hosts and ports used when settings omit them
 * @{
 */

/**
 * @brief Default FTP control port (RFC 959).
 */
constexpr uint16_t FTP_PORT_DEFAULT = 21;

/**
 * @brief Default scan agent port.
 *
 * Matches the port used by the reference agent deployment so that existing
 * client configurations keep working.
 */
constexpr uint16_t SCAN_AGENT_PORT_DEFAULT = 9999;

/**
 * @brief Localhost IP address
 */
constexpr const char* LOCALHOST_IP = "127.0.0.1";

/**
 * @brief Bind-all address used by the agent by default
 */
constexpr const char* ANY_ADDRESS = "0.0.0.0";

/** @} */ // end of Endpoints

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @brief Timeouts in seconds or milliseconds as named
 * @{
 */

/**
 * @brief Control connection connect/read timeout.
 *
 * The greeting must arrive within this window, and every subsequent
 * reply read on the control socket is bounded by it.
 */
constexpr uint32_t CONTROL_TIMEOUT_SECONDS = 10;

/**
 * @brief Default data/scan socket timeout (client "timeout" setting).
 *
 * The client waits for the scan verdict with this timeout, so it must not
 * be shorter than SCAN_TIMEOUT_SECONDS_DEFAULT.
 */
constexpr uint32_t DATA_TIMEOUT_SECONDS_DEFAULT = 90;

/**
 * @brief Default scanner subprocess timeout (agent "clamav.timeout").
 */
constexpr uint32_t SCAN_TIMEOUT_SECONDS_DEFAULT = 60;

/**
 * @brief Timeout for the scanner self-check (`--version`) at agent startup.
 */
constexpr uint32_t SCANNER_SELF_CHECK_TIMEOUT_SECONDS = 10;

/**
 * @brief Receive timeout applied to accepted scan connections (ms).
 *
 * A client that stops talking mid-handshake is dropped after this long
 * so handler threads cannot be pinned forever.
 */
constexpr uint32_t AGENT_CONNECTION_TIMEOUT_MS = 30000;

/**
 * @brief Listener poll interval (ms) while waiting for connections.
 *
 * The accept loop wakes at least this often to observe stop requests.
 */
constexpr uint32_t ACCEPT_POLL_INTERVAL_MS = 100;

/** @} */ // end of Timing

//=========================================================================
// Buffer Sizes
//=========================================================================

/** @defgroup BufferSizes Buffer Size Configuration
 * @{
 */

/**
 * @brief Default chunk size for data-channel and scan payload streaming.
 */
constexpr size_t BUFFER_SIZE_DEFAULT = 8192;

/**
 * @brief Upper bound accepted for the "buffer_size" setting.
 */
constexpr size_t BUFFER_SIZE_MAX = 4 * 1024 * 1024;

/**
 * @brief Maximum size of one (possibly multi-line) control reply.
 *
 * Anything longer is treated as a protocol violation rather than
 * buffered without limit.
 */
constexpr size_t MAX_REPLY_SIZE = 64 * 1024;

/**
 * @brief Maximum size of a scan handshake message (FILENAME:/SIZE:/READY).
 */
constexpr size_t MAX_SCAN_MESSAGE_SIZE = 1024;

/**
 * @brief Maximum size of the JSON scan result read by the client.
 */
constexpr size_t MAX_SCAN_RESULT_SIZE = 64 * 1024;

/**
 * @brief Maximum bytes of scanner output kept as result details.
 */
constexpr size_t MAX_SCANNER_OUTPUT_SIZE = 16 * 1024;

/**
 * @brief Default maximum payload the agent accepts for one scan (bytes).
 *
 * Guardrail against a client declaring an absurd SIZE and filling the
 * temp directory. Overridable with "clamav.max_file_size".
 */
constexpr uint64_t MAX_SCAN_FILE_SIZE_DEFAULT = 4ULL * 1024ULL * 1024ULL * 1024ULL;  // 4 GB

/** @} */ // end of BufferSizes

//=========================================================================
// Concurrency
//=========================================================================

/** @defgroup Threading Concurrency Configuration
 * @{
 */

/**
 * @brief Default maximum concurrent scan handler threads.
 *
 * ScanAgent closes connections accepted while this many handlers run.
 */
constexpr size_t MAX_CONCURRENT_SCANS_DEFAULT = 5;

/**
 * @brief Listen backlog for the agent socket.
 */
constexpr int LISTEN_BACKLOG = 16;

/** @} */ // end of Threading

//=========================================================================
// FTP Protocol
//=========================================================================

/** @defgroup FtpProtocol FTP Reply Codes
 * @brief Reply codes the client reacts to explicitly (RFC 959)
 * @{
 */

constexpr int FTP_SERVICE_READY = 220;           ///< Greeting
constexpr int FTP_USER_OK_NEED_PASSWORD = 331;   ///< USER accepted, send PASS
constexpr int FTP_BAD_SEQUENCE = 503;            ///< Bad sequence (e.g. AUTH required first)

/**
 * @brief Line terminator for control commands.
 */
constexpr const char* FTP_CRLF = "\r\n";

/** @} */ // end of FtpProtocol

//=========================================================================
// Scan Gateway Protocol
//=========================================================================

/** @defgroup ScanProtocol Scan Gateway Wire Vocabulary
 * @brief Literal tokens of the FILENAME/SIZE/payload/JSON exchange
 * @{
 */

constexpr const char* SCAN_FILENAME_PREFIX = "FILENAME:";
constexpr const char* SCAN_SIZE_PREFIX = "SIZE:";
constexpr const char* SCAN_READY = "READY";

constexpr const char* SCAN_STATUS_OK = "OK";
constexpr const char* SCAN_STATUS_INFECTED = "INFECTED";
constexpr const char* SCAN_STATUS_ERROR = "ERROR";

/**
 * @brief Default scanner executable.
 */
constexpr const char* SCANNER_COMMAND_DEFAULT = "clamscan";

/**
 * @brief Default temp directory for payloads awaiting a scan.
 */
constexpr const char* TEMP_DIR_DEFAULT = "./temp_files";

/**
 * @brief Prefix of every temp scan artifact.
 */
constexpr const char* TEMP_FILE_PREFIX = "scan_";

/** @} */ // end of ScanProtocol

//=========================================================================
// Files
//=========================================================================

constexpr const char* CLIENT_CONFIG_PATH_DEFAULT = "config/client_config.json";
constexpr const char* AGENT_CONFIG_PATH_DEFAULT = "config/agent_config.json";
constexpr const char* CLIENT_LOG_FILE_DEFAULT = "ftp_client.log";
constexpr const char* AGENT_LOG_FILE_DEFAULT = "clamav_agent.log";

}  // namespace ClamFtp
