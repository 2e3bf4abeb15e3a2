/**
 * @file CommandShell.cpp
 * @brief Interactive command shell implementation
 */

#include "clamftp/CommandShell.h"
#include "clamftp/Debug.h"
#include "clamftp/ThreadSafeLog.h"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace ClamFtp {

namespace {

struct CommandAlias {
    const char* name;
    ShellCommandKind kind;
};

const CommandAlias kCommandAliases[] = {
    {"ls", ShellCommandKind::LS},
    {"dir", ShellCommandKind::LS},
    {"cd", ShellCommandKind::CD},
    {"cwd", ShellCommandKind::CD},
    {"pwd", ShellCommandKind::PWD},
    {"mkdir", ShellCommandKind::MKDIR},
    {"rmdir", ShellCommandKind::RMDIR},
    {"delete", ShellCommandKind::DELETE},
    {"del", ShellCommandKind::DELETE},
    {"rename", ShellCommandKind::RENAME},
    {"get", ShellCommandKind::GET},
    {"recv", ShellCommandKind::GET},
    {"put", ShellCommandKind::PUT},
    {"send", ShellCommandKind::PUT},
    {"mget", ShellCommandKind::MGET},
    {"mput", ShellCommandKind::MPUT},
    {"open", ShellCommandKind::OPEN},
    {"close", ShellCommandKind::CLOSE},
    {"ascii", ShellCommandKind::ASCII},
    {"binary", ShellCommandKind::BINARY},
    {"passive", ShellCommandKind::PASSIVE},
    {"status", ShellCommandKind::STATUS},
    {"prompt", ShellCommandKind::PROMPT},
    {"help", ShellCommandKind::HELP},
    {"?", ShellCommandKind::HELP},
    {"quit", ShellCommandKind::QUIT},
    {"bye", ShellCommandKind::QUIT},
    {"exit", ShellCommandKind::QUIT},
};

const char* kHelpText =
    "File & directory operations:\n"
    "  ls [path]              List files and directories\n"
    "  cd <directory>         Change directory\n"
    "  pwd                    Show current directory\n"
    "  mkdir <directory>      Create directory\n"
    "  rmdir <directory>      Remove directory\n"
    "  delete <file>          Delete file\n"
    "  rename <old> <new>     Rename file\n"
    "\n"
    "Upload & download:\n"
    "  get <remote> [local]   Download file\n"
    "  put <local> [remote]   Upload file (scanned first)\n"
    "  mget <pattern>...      Download multiple files\n"
    "  mput <pattern>...      Upload multiple files (each scanned first)\n"
    "\n"
    "Session:\n"
    "  open [host] [port]     Connect to FTP server\n"
    "  close                  Disconnect from server\n"
    "  ascii                  Set ASCII transfer mode\n"
    "  binary                 Set binary transfer mode\n"
    "  passive                Toggle passive/active mode\n"
    "  status                 Show connection status\n"
    "  prompt                 Toggle mget/mput prompting\n"
    "\n"
    "  help, ?                Show this help\n"
    "  quit, bye, exit        Exit program\n"
    "\n"
    "Every upload is scanned by the ClamAV agent; infected files are never sent.\n";

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}  // namespace

const char* shellCommandKindToString(ShellCommandKind kind) {
    switch (kind) {
        case ShellCommandKind::EMPTY:   return "EMPTY";
        case ShellCommandKind::LS:      return "LS";
        case ShellCommandKind::CD:      return "CD";
        case ShellCommandKind::PWD:     return "PWD";
        case ShellCommandKind::MKDIR:   return "MKDIR";
        case ShellCommandKind::RMDIR:   return "RMDIR";
        case ShellCommandKind::DELETE:  return "DELETE";
        case ShellCommandKind::RENAME:  return "RENAME";
        case ShellCommandKind::GET:     return "GET";
        case ShellCommandKind::PUT:     return "PUT";
        case ShellCommandKind::MGET:    return "MGET";
        case ShellCommandKind::MPUT:    return "MPUT";
        case ShellCommandKind::OPEN:    return "OPEN";
        case ShellCommandKind::CLOSE:   return "CLOSE";
        case ShellCommandKind::ASCII:   return "ASCII";
        case ShellCommandKind::BINARY:  return "BINARY";
        case ShellCommandKind::PASSIVE: return "PASSIVE";
        case ShellCommandKind::STATUS:  return "STATUS";
        case ShellCommandKind::PROMPT:  return "PROMPT";
        case ShellCommandKind::HELP:    return "HELP";
        case ShellCommandKind::QUIT:    return "QUIT";
        case ShellCommandKind::UNKNOWN: return "UNKNOWN";
        default:                        return "UNKNOWN";
    }
}

//=============================================================================
// Parsing
//=============================================================================

ShellCommandKind ShellCommand::kindFromName(const std::string& name) {
    const std::string lowered = toLower(name);
    for (const auto& alias : kCommandAliases) {
        if (lowered == alias.name) {
            return alias.kind;
        }
    }
    return ShellCommandKind::UNKNOWN;
}

ShellCommand ShellCommand::parse(const std::string& line) {
    ShellCommand command;
    std::vector<std::string> words;
    std::string current;
    bool inQuotes = false;
    bool haveWord = false;

    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
            haveWord = true;
            continue;
        }
        if (!inQuotes && std::isspace(static_cast<unsigned char>(c))) {
            if (haveWord) {
                words.push_back(current);
                current.clear();
                haveWord = false;
            }
            continue;
        }
        current += c;
        haveWord = true;
    }
    if (haveWord) {
        words.push_back(current);
    }

    if (words.empty()) {
        command.kind = ShellCommandKind::EMPTY;
        return command;
    }

    command.name = toLower(words.front());
    command.kind = kindFromName(command.name);
    command.args.assign(words.begin() + 1, words.end());
    return command;
}

//=============================================================================
// Shell
//=============================================================================

CommandShell::CommandShell(ControlSession& control, TransferOrchestrator& transfers,
                           const ClientSettings& settings, std::istream& in, std::ostream& out)
    : m_control(control)
    , m_transfers(transfers)
    , m_settings(settings)
    , m_in(in)
    , m_out(out)
    , m_promptMode(settings.prompt)
{
    m_transfers.setScanErrorConfirmation([this](const std::string& localPath, const ScanResult& scan) {
        m_out << "Virus scan error for " << localPath << ": " << scan.message;
        if (!scan.details.empty()) {
            m_out << " (" << scan.details << ")";
        }
        m_out << "\n";
        return askYesNo("Upload anyway without a clean scan?");
    });

    m_transfers.setFileConfirmation([this](const std::string& path) {
        if (!m_promptMode) {
            return true;
        }
        return askYesNo("Transfer " + path + "?");
    });
}

bool CommandShell::execute(const std::string& line) {
    return dispatch(ShellCommand::parse(line));
}

bool CommandShell::dispatch(const ShellCommand& command) {
    if (command.kind != ShellCommandKind::EMPTY) {
        LOG_DEBUG("Shell command: " << shellCommandKindToString(command.kind));
    }

    switch (command.kind) {
        case ShellCommandKind::EMPTY:   break;
        case ShellCommandKind::LS:      cmdList(command); break;
        case ShellCommandKind::CD:      cmdChangeDirectory(command); break;
        case ShellCommandKind::PWD:     cmdPrintWorkingDirectory(); break;
        case ShellCommandKind::MKDIR:   cmdMakeDirectory(command); break;
        case ShellCommandKind::RMDIR:   cmdRemoveDirectory(command); break;
        case ShellCommandKind::DELETE:  cmdDelete(command); break;
        case ShellCommandKind::RENAME:  cmdRename(command); break;
        case ShellCommandKind::GET:     cmdGet(command); break;
        case ShellCommandKind::PUT:     cmdPut(command); break;
        case ShellCommandKind::MGET:    cmdMultiGet(command); break;
        case ShellCommandKind::MPUT:    cmdMultiPut(command); break;
        case ShellCommandKind::OPEN:    cmdOpen(command); break;
        case ShellCommandKind::CLOSE:   cmdClose(); break;
        case ShellCommandKind::ASCII:   cmdTransferMode(TransferMode::ASCII); break;
        case ShellCommandKind::BINARY:  cmdTransferMode(TransferMode::BINARY); break;
        case ShellCommandKind::PASSIVE: cmdPassive(); break;
        case ShellCommandKind::STATUS:  cmdStatus(); break;
        case ShellCommandKind::PROMPT:  cmdPrompt(); break;
        case ShellCommandKind::HELP:    cmdHelp(); break;
        case ShellCommandKind::QUIT:
            if (m_control.isConnected()) {
                cmdClose();
            }
            m_out << "Goodbye!\n";
            return false;
        case ShellCommandKind::UNKNOWN:
            m_out << "Unknown command: " << command.name << "\n"
                  << "Type 'help' for available commands\n";
            break;
    }
    return true;
}

void CommandShell::run() {
    m_out << "ClamFtp client: uploads are scanned by ClamAV before transfer\n"
          << "Type 'help' for commands or 'quit' to exit\n";

    std::string line;
    for (;;) {
        m_out << "ftp> " << std::flush;
        if (!std::getline(m_in, line)) {
            m_out << "\n";
            if (m_control.isConnected()) {
                cmdClose();
            }
            break;
        }
        if (!execute(line)) {
            break;
        }
    }
}

bool CommandShell::openSession(const std::string& host, uint16_t port,
                               const std::string& user, const std::string& password) {
    FtpReply greeting;
    std::string errorMsg;

    m_out << "Connecting to " << host << ":" << port << "...\n";
    if (!m_control.connect(host, port, greeting, errorMsg)) {
        m_out << "Connection failed: " << errorMsg << "\n";
        return false;
    }
    m_out << greeting.toString() << "\n";

    std::string username = user;
    std::string pass = password;
    if (username.empty()) {
        username = readLine("Username: ");
        if (username.empty()) {
            username = "anonymous";
        }
        pass = (username == "anonymous") ? "anonymous@example.com" : readLine("Password: ");
    }

    if (!m_control.authenticate(username, pass, errorMsg)) {
        m_out << "Login failed: " << errorMsg << "\n";
        return false;
    }

    m_user = username;
    m_out << "Logged in as " << username << "\n";
    ThreadSafeLog::log("Logged in to " + host + ":" + std::to_string(port) + " as " + username);
    return true;
}

//=============================================================================
// Directory commands
//=============================================================================

void CommandShell::cmdList(const ShellCommand& command) {
    if (!checkSession()) {
        return;
    }

    std::string listing;
    TransferResult result = m_transfers.list(command.args.empty() ? "" : command.args[0], listing);
    if (!result.success) {
        m_out << "LIST failed: " << result.error.toString() << "\n";
        return;
    }

    if (listing.empty()) {
        m_out << "Directory is empty\n";
    } else {
        m_out << listing;
        if (listing.back() != '\n') {
            m_out << "\n";
        }
    }
}

void CommandShell::cmdChangeDirectory(const ShellCommand& command) {
    if (command.args.size() != 1) {
        m_out << "Usage: cd <directory>\n";
        return;
    }

    FtpReply reply;
    std::string errorMsg;
    if (!m_control.changeDirectory(command.args[0], reply, errorMsg)) {
        m_out << errorMsg << "\n";
        return;
    }
    m_out << "Changed to directory: " << m_control.state().workingDirectory << "\n";
}

void CommandShell::cmdPrintWorkingDirectory() {
    FtpReply reply;
    std::string errorMsg;
    std::string path;
    if (!m_control.printWorkingDirectory(path, reply, errorMsg)) {
        m_out << errorMsg << "\n";
        return;
    }
    m_out << "Current directory: " << path << "\n";
}

void CommandShell::cmdMakeDirectory(const ShellCommand& command) {
    if (command.args.size() != 1) {
        m_out << "Usage: mkdir <directory>\n";
        return;
    }

    FtpReply reply;
    std::string errorMsg;
    if (!m_control.makeDirectory(command.args[0], reply, errorMsg)) {
        m_out << errorMsg << "\n";
        return;
    }
    m_out << "Directory created: " << command.args[0] << "\n";
}

void CommandShell::cmdRemoveDirectory(const ShellCommand& command) {
    if (command.args.size() != 1) {
        m_out << "Usage: rmdir <directory>\n";
        return;
    }

    FtpReply reply;
    std::string errorMsg;
    if (!m_control.removeDirectory(command.args[0], reply, errorMsg)) {
        m_out << errorMsg << "\n";
        return;
    }
    m_out << "Directory removed: " << command.args[0] << "\n";
}

void CommandShell::cmdDelete(const ShellCommand& command) {
    if (command.args.size() != 1) {
        m_out << "Usage: delete <filename>\n";
        return;
    }

    FtpReply reply;
    std::string errorMsg;
    if (!m_control.deleteFile(command.args[0], reply, errorMsg)) {
        m_out << errorMsg << "\n";
        return;
    }
    m_out << "File deleted: " << command.args[0] << "\n";
}

void CommandShell::cmdRename(const ShellCommand& command) {
    if (command.args.size() != 2) {
        m_out << "Usage: rename <old_name> <new_name>\n";
        return;
    }

    FtpReply reply;
    std::string errorMsg;
    if (!m_control.rename(command.args[0], command.args[1], reply, errorMsg)) {
        m_out << errorMsg << "\n";
        return;
    }
    m_out << "File renamed: " << command.args[0] << " -> " << command.args[1] << "\n";
}

//=============================================================================
// Transfers
//=============================================================================

void CommandShell::cmdGet(const ShellCommand& command) {
    if (command.args.empty() || command.args.size() > 2) {
        m_out << "Usage: get <remote_file> [local_file]\n";
        return;
    }
    if (!checkSession()) {
        return;
    }

    m_out << "Downloading " << command.args[0] << "...\n";
    TransferResult result = m_transfers.download(command.args[0],
                                                 command.args.size() > 1 ? command.args[1] : "");
    printResult(result, "Downloaded");
}

void CommandShell::cmdPut(const ShellCommand& command) {
    if (command.args.empty() || command.args.size() > 2) {
        m_out << "Usage: put <local_file> [remote_file]\n";
        return;
    }
    if (!checkSession()) {
        return;
    }

    m_out << "Scanning " << command.args[0] << " for viruses...\n";
    TransferResult result = m_transfers.upload(command.args[0],
                                               command.args.size() > 1 ? command.args[1] : "");
    printResult(result, "Uploaded");
}

void CommandShell::cmdMultiGet(const ShellCommand& command) {
    if (command.args.empty()) {
        m_out << "Usage: mget <pattern1> [pattern2] ...\n";
        return;
    }
    if (!checkSession()) {
        return;
    }

    std::vector<std::string> names;
    for (const auto& pattern : command.args) {
        std::vector<std::string> matched;
        FtpError error;
        if (!m_transfers.expandRemotePattern(pattern, matched, error)) {
            m_out << "Cannot list files for " << pattern << ": " << error.toString() << "\n";
            continue;
        }
        if (matched.empty()) {
            m_out << "No files match pattern: " << pattern << "\n";
            continue;
        }
        names.insert(names.end(), matched.begin(), matched.end());
    }

    if (names.empty()) {
        return;
    }
    printBatchSummary(m_transfers.downloadBatch(names), "Downloaded");
}

void CommandShell::cmdMultiPut(const ShellCommand& command) {
    if (command.args.empty()) {
        m_out << "Usage: mput <pattern1> [pattern2] ...\n";
        return;
    }
    if (!checkSession()) {
        return;
    }

    std::vector<std::string> files;
    for (const auto& pattern : command.args) {
        std::vector<std::string> matched = TransferOrchestrator::expandLocalPattern(pattern);
        if (matched.empty()) {
            m_out << "No files match pattern: " << pattern << "\n";
            continue;
        }
        files.insert(files.end(), matched.begin(), matched.end());
    }

    if (files.empty()) {
        return;
    }
    printBatchSummary(m_transfers.uploadBatch(files), "Uploaded");
}

//=============================================================================
// Session commands
//=============================================================================

void CommandShell::cmdOpen(const ShellCommand& command) {
    std::string host = m_settings.ftpServer.host;
    uint16_t port = m_settings.ftpServer.port;

    if (!command.args.empty()) {
        host = command.args[0];
        port = FTP_PORT_DEFAULT;
    }
    if (command.args.size() > 1) {
        const std::string& text = command.args[1];
        unsigned long value = 0;
        bool valid = !text.empty() && text.size() <= 5 &&
                     text.find_first_not_of("0123456789") == std::string::npos;
        if (valid) {
            value = std::stoul(text);
            valid = value > 0 && value <= 65535;
        }
        if (!valid) {
            m_out << "Invalid port number\n";
            return;
        }
        port = static_cast<uint16_t>(value);
    }

    // Configured credentials only apply to the configured server
    const bool configuredServer = host == m_settings.ftpServer.host && port == m_settings.ftpServer.port;
    openSession(host, port,
                configuredServer ? m_settings.ftpServer.username : std::string(),
                configuredServer ? m_settings.ftpServer.password : std::string());
}

void CommandShell::cmdClose() {
    if (!m_control.isConnected()) {
        m_out << "Not connected\n";
        return;
    }
    m_control.disconnect();
    m_user.clear();
    m_out << "Disconnected from server\n";
}

void CommandShell::cmdTransferMode(TransferMode mode) {
    FtpReply reply;
    std::string errorMsg;
    if (!m_control.setTransferMode(mode, reply, errorMsg)) {
        m_out << errorMsg << "\n";
        return;
    }
    m_out << "Transfer mode set to " << transferModeToString(mode) << "\n";
}

void CommandShell::cmdPassive() {
    m_control.setPassiveMode(!m_control.isPassiveMode());
    m_out << "Passive mode " << (m_control.isPassiveMode() ? "ON" : "OFF") << "\n";
}

void CommandShell::cmdStatus() {
    const SessionState& state = m_control.state();

    m_out << "=== FTP Client Status ===\n"
          << "Connected: " << (state.connected ? "Yes" : "No") << "\n"
          << "Logged in: " << (state.authenticated ? "Yes" : "No") << "\n";

    if (state.connected) {
        m_out << "Server: " << m_control.host() << ":" << m_control.port() << "\n"
              << "User: " << (m_user.empty() ? "-" : m_user) << "\n"
              << "Encryption: " << (state.encryptionNegotiated ? "AUTH TLS accepted (cleartext)" : "none") << "\n";
    }

    m_out << "Mode: " << (state.passiveMode ? "Passive" : "Active") << "\n"
          << "Transfer: " << transferModeToString(state.transferMode) << "\n";

    if (state.connected) {
        m_out << "Current dir: " << state.workingDirectory << "\n";
    }

    m_out << "Prompt: " << (m_promptMode ? "ON" : "OFF") << "\n"
          << "ClamAV agent: " << m_settings.scanAgent.host << ":" << m_settings.scanAgent.port << "\n"
          << "=========================\n";
}

void CommandShell::cmdPrompt() {
    m_promptMode = !m_promptMode;
    m_out << "Interactive mode " << (m_promptMode ? "ON" : "OFF") << "\n";
}

void CommandShell::cmdHelp() {
    m_out << kHelpText;
}

//=============================================================================
// Helpers
//=============================================================================

bool CommandShell::checkSession() {
    if (!m_control.isConnected()) {
        m_out << "Not connected to server. Use 'open' command.\n";
        return false;
    }
    if (!m_control.isAuthenticated()) {
        m_out << "Not logged in.\n";
        return false;
    }
    return true;
}

bool CommandShell::askYesNo(const std::string& question) {
    std::string answer = toLower(readLine(question + " (y/n): "));
    return answer == "y" || answer == "yes";
}

std::string CommandShell::readLine(const std::string& prompt) {
    m_out << prompt << std::flush;
    std::string line;
    if (!std::getline(m_in, line)) {
        return std::string();
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

void CommandShell::printResult(const TransferResult& result, const char* verb) {
    if (result.skipped) {
        m_out << "Skipped: " << (result.localPath.empty() ? result.remotePath : result.localPath) << "\n";
        return;
    }

    if (result.scanned) {
        if (result.scan.isInfected()) {
            m_out << "VIRUS DETECTED: " << result.scan.message << "\n";
            if (!result.scan.details.empty()) {
                m_out << "   Details: " << result.scan.details << "\n";
            }
            m_out << "Upload BLOCKED\n";
            return;
        }
        if (result.scan.isClean()) {
            m_out << "File is clean\n";
        }
    }

    if (!result.success) {
        m_out << result.error.toString() << "\n";
        return;
    }

    const bool upload = !result.sha256.empty() || result.scanned;
    m_out << verb << ": "
          << (upload ? result.localPath : result.remotePath) << " -> "
          << (upload ? result.remotePath : result.localPath)
          << " (" << result.bytesTransferred << " bytes)\n";
}

void CommandShell::printBatchSummary(const BatchResult& results, const char* verb) {
    size_t succeeded = 0;
    size_t skipped = 0;
    for (const auto& result : results) {
        printResult(result, verb);
        if (result.success) {
            ++succeeded;
        } else if (result.skipped) {
            ++skipped;
        }
    }
    m_out << succeeded << " of " << results.size() << " file(s) transferred";
    if (skipped > 0) {
        m_out << ", " << skipped << " skipped";
    }
    m_out << "\n";
}

}  // namespace ClamFtp
