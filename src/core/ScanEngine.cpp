/**
 * @file ScanEngine.cpp
 * @brief clamscan-backed scan engine
 */

#include "clamftp/ScanEngine.h"
#include "clamftp/Debug.h"
#include "clamftp/ProcessRunner.h"

namespace ClamFtp {

namespace {

std::string trimmed(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}  // namespace

ClamScanEngine::ClamScanEngine(const std::string& command, uint32_t timeoutSeconds)
    : m_command(command)
    , m_timeoutSeconds(timeoutSeconds)
{
}

ScanResult ClamScanEngine::scan(const std::string& filePath)
{
    LOG_INFO("Scanning file: " << filePath);

    ProcessResult run = ProcessRunner::run(
        {m_command, "--no-summary", "--infected", filePath}, m_timeoutSeconds);

    if (!run.launched) {
        LOG_ERROR("Scanner launch failed: " << run.errorMsg);
        return ScanResult::error("Scan failed", run.errorMsg);
    }

    if (run.timedOut) {
        LOG_ERROR("Scan timeout: " << filePath);
        return ScanResult::error("Scan timeout",
                                 "Scan took longer than " + std::to_string(m_timeoutSeconds) + " seconds");
    }

    if (run.termSignal != 0) {
        LOG_ERROR("Scanner killed by signal " << run.termSignal);
        return ScanResult::error("Scan failed",
                                 "Scanner terminated by signal " + std::to_string(run.termSignal));
    }

    switch (run.exitCode) {
        case 0:
            LOG_INFO("File clean: " << filePath);
            return ScanResult::ok("File is clean", trimmed(run.stdoutText));
        case 1:
            LOG_WARNING("File infected: " << filePath);
            return ScanResult::infected("Virus detected", trimmed(run.stdoutText));
        default: {
            std::string details = trimmed(run.stderrText);
            if (details.empty()) {
                details = "Scanner exited with code " + std::to_string(run.exitCode);
            }
            LOG_ERROR("Scan error (exit " << run.exitCode << "): " << details);
            return ScanResult::error("Scan failed", details);
        }
    }
}

bool ClamScanEngine::selfCheck(std::string& versionInfo, std::string& errorMsg)
{
    ProcessResult run = ProcessRunner::run({m_command, "--version"}, SCANNER_SELF_CHECK_TIMEOUT_SECONDS);

    if (!run.launched) {
        errorMsg = run.errorMsg;
        return false;
    }
    if (run.timedOut) {
        errorMsg = "'" + m_command + " --version' timed out";
        return false;
    }
    if (run.exitCode != 0) {
        errorMsg = "'" + m_command + " --version' exited with code " + std::to_string(run.exitCode);
        std::string stderrText = trimmed(run.stderrText);
        if (!stderrText.empty()) {
            errorMsg += ": " + stderrText;
        }
        return false;
    }

    versionInfo = trimmed(run.stdoutText);
    return true;
}

}  // namespace ClamFtp
