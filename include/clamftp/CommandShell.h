/**
 * @file CommandShell.h
 * @brief Interactive command shell over the FTP client core
 */

#pragma once

#include "ControlSession.h"
#include "Settings.h"
#include "TransferOrchestrator.h"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace ClamFtp {

/**
 * @brief Closed set of shell commands
 *
 * Aliases (dir, cwd, del, recv, send, ?, bye, exit) map onto the same kind.
 * Anything else is UNKNOWN; a blank line is EMPTY.
 */
enum class ShellCommandKind : uint8_t {
    EMPTY,
    LS,
    CD,
    PWD,
    MKDIR,
    RMDIR,
    DELETE,
    RENAME,
    GET,
    PUT,
    MGET,
    MPUT,
    OPEN,
    CLOSE,
    ASCII,
    BINARY,
    PASSIVE,
    STATUS,
    PROMPT,
    HELP,
    QUIT,
    UNKNOWN
};

const char* shellCommandKindToString(ShellCommandKind kind);

/**
 * @brief One parsed input line
 */
struct ShellCommand {
    ShellCommandKind kind = ShellCommandKind::EMPTY;
    std::string name;               ///< Command word as typed (lowercased)
    std::vector<std::string> args;

    /**
     * @brief Split a line into command and arguments
     *
     * Arguments are separated by whitespace; double quotes group an
     * argument containing spaces.
     */
    static ShellCommand parse(const std::string& line);

    static ShellCommandKind kindFromName(const std::string& name);
};

/**
 * @brief Reads commands from an input stream and drives the client
 *
 * All user-facing output goes to the output stream; yes/no questions
 * (prompt mode, uploads without a clean scan) and credentials are read
 * from the input stream.
 */
class CommandShell {
public:
    CommandShell(ControlSession& control, TransferOrchestrator& transfers,
                 const ClientSettings& settings, std::istream& in, std::ostream& out);

    CommandShell(const CommandShell&) = delete;
    CommandShell& operator=(const CommandShell&) = delete;

    /**
     * @brief Execute one line
     * @return false once the user asked to quit
     */
    bool execute(const std::string& line);

    /**
     * @brief Dispatch an already parsed command
     */
    bool dispatch(const ShellCommand& command);

    /**
     * @brief Read-eval loop until quit or end of input
     */
    void run();

    /**
     * @brief Connect and log in with the configured or given credentials
     *
     * Empty user prompts for credentials on the input stream.
     */
    bool openSession(const std::string& host, uint16_t port,
                     const std::string& user, const std::string& password);

    bool isPromptMode() const { return m_promptMode; }

private:
    void cmdList(const ShellCommand& command);
    void cmdChangeDirectory(const ShellCommand& command);
    void cmdPrintWorkingDirectory();
    void cmdMakeDirectory(const ShellCommand& command);
    void cmdRemoveDirectory(const ShellCommand& command);
    void cmdDelete(const ShellCommand& command);
    void cmdRename(const ShellCommand& command);
    void cmdGet(const ShellCommand& command);
    void cmdPut(const ShellCommand& command);
    void cmdMultiGet(const ShellCommand& command);
    void cmdMultiPut(const ShellCommand& command);
    void cmdOpen(const ShellCommand& command);
    void cmdClose();
    void cmdTransferMode(TransferMode mode);
    void cmdPassive();
    void cmdStatus();
    void cmdPrompt();
    void cmdHelp();

    bool checkSession();
    bool askYesNo(const std::string& question);
    std::string readLine(const std::string& prompt);
    void printResult(const TransferResult& result, const char* verb);
    void printBatchSummary(const BatchResult& results, const char* verb);

    ControlSession& m_control;
    TransferOrchestrator& m_transfers;
    ClientSettings m_settings;
    std::istream& m_in;
    std::ostream& m_out;

    bool m_promptMode;
    std::string m_user;  ///< User of the current session, for status
};

}  // namespace ClamFtp
