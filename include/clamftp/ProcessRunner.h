/**
 * @file ProcessRunner.h
 * @brief Run an external command with captured output and a hard timeout
 */

#pragma once

#include "config.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ClamFtp {

/**
 * @brief Outcome of one subprocess run
 */
struct ProcessResult {
    bool launched = false;     ///< execvp() succeeded
    bool timedOut = false;     ///< Killed with SIGKILL after the timeout
    int exitCode = -1;         ///< Exit status if the process exited normally
    int termSignal = 0;        ///< Signal number if it was killed by a signal
    std::string stdoutText;    ///< Captured stdout (truncated to the output limit)
    std::string stderrText;    ///< Captured stderr (truncated to the output limit)
    std::string errorMsg;      ///< Launch or wait failure description

    bool exitedNormally() const { return launched && !timedOut && termSignal == 0 && exitCode >= 0; }
};

/**
 * @class ProcessRunner
 * @brief fork/execvp wrapper used by the scan engine
 *
 * The command is executed directly (no shell), so file names coming from
 * the network are never interpreted. stdout and stderr are drained through
 * pipes while waiting, so a chatty child cannot block on a full pipe.
 */
class ProcessRunner {
public:
    /**
     * @brief Run argv[0] with arguments argv[1..]
     * @param argv Program and arguments (argv[0] is looked up in PATH)
     * @param timeoutSeconds Wall-clock limit; the child is SIGKILLed after it
     * @param maxOutputBytes Bytes kept per stream; the rest is read and dropped
     */
    static ProcessResult run(const std::vector<std::string>& argv,
                             uint32_t timeoutSeconds,
                             size_t maxOutputBytes = MAX_SCANNER_OUTPUT_SIZE);
};

}  // namespace ClamFtp
