/**
 * @file ScanEngine.h
 * @brief Malware scanner abstraction and the clamscan-backed implementation
 */

#pragma once

#include "ScanProtocol.h"
#include "config.h"

#include <cstdint>
#include <string>

namespace ClamFtp {

/**
 * @brief Scanner used by the agent for one file at a time
 *
 * Implementations must be safe to call from several handler threads at
 * once; ScanAgent shares one engine between all sessions.
 */
class ScanEngine {
public:
    virtual ~ScanEngine() = default;

    /**
     * @brief Scan a file on disk
     * @return OK, INFECTED, or ERROR when no verdict could be obtained
     */
    virtual ScanResult scan(const std::string& filePath) = 0;

    /**
     * @brief Verify the scanner can be invoked at all
     * @param versionInfo Output: scanner version text on success
     * @param errorMsg Output: reason on failure
     */
    virtual bool selfCheck(std::string& versionInfo, std::string& errorMsg) = 0;
};

/**
 * @class ClamScanEngine
 * @brief Runs `<command> --no-summary --infected <file>`
 *
 * clamscan exit codes: 0 clean, 1 virus found, anything else an error.
 * A launch failure or a timeout is also an error.
 */
class ClamScanEngine final : public ScanEngine {
public:
    ClamScanEngine(const std::string& command = SCANNER_COMMAND_DEFAULT,
                   uint32_t timeoutSeconds = SCAN_TIMEOUT_SECONDS_DEFAULT);

    ScanResult scan(const std::string& filePath) override;
    bool selfCheck(std::string& versionInfo, std::string& errorMsg) override;

    const std::string& command() const { return m_command; }

private:
    std::string m_command;
    uint32_t m_timeoutSeconds;
};

}  // namespace ClamFtp
