/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe append-only file log
 *
 * (c) 2026 ClamFtp Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace ClamFtp {

/**
 * @brief Thread-safe logging to the configured log file
 *
 * Every audit-relevant event (scan verdicts, transfers, authentication
 * results) is written here in addition to the console, so an operator can
 * reconstruct what left the machine and what was blocked.
 *
 * Uses a global static mutex to synchronize file access across:
 * - the client's shell thread
 * - ScanAgent (listener thread)
 * - ScanSession (one handler thread per connection)
 *
 * Note: initialize() MUST be called from main() before any worker threads
 * start. Calling log() before initialize() silently does nothing, which keeps
 * unit tests free of log files.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Initialize the log path (call before starting threads)
     * @param logPath Path to the log file (created or appended)
     */
    static void initialize(const std::filesystem::path& logPath);

    /**
     * @brief Log a std::string message
     * @param message Message to log
     *
     * Thread-safe: locks global mutex before writing to file.
     */
    static void log(const std::string& message);

    /**
     * @brief Log a const char* message
     * @param message Message to log
     *
     * This overload prevents ambiguity when passing string literals.
     */
    static void log(const char* message);

private:
    /// Global mutex for synchronizing file access across all threads
    static std::mutex s_mutex;

    /// Log file path (set by initialize(), never changes after that)
    static std::filesystem::path s_logPath;
};

} // namespace ClamFtp
