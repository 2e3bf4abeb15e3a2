/**
 * @file Settings.cpp
 * @brief JSON settings loading and argument parsing
 */

#include "clamftp/Settings.h"
#include "clamftp/Debug.h"

#include <fstream>
#include <limits>

namespace ClamFtp {

namespace {

const nlohmann::json* section(const nlohmann::json& j, const char* name) {
    if (!j.contains(name)) {
        return nullptr;
    }
    const auto& value = j[name];
    if (!value.is_object()) {
        throw std::runtime_error(std::string("Config section '") + name + "' must be an object");
    }
    return &value;
}

void readString(const nlohmann::json& obj, const std::string& context, const char* key, std::string& out) {
    if (!obj.contains(key)) {
        return;
    }
    if (!obj[key].is_string()) {
        throw std::runtime_error(context + "." + key + " must be a string");
    }
    out = obj[key].get<std::string>();
}

void readBool(const nlohmann::json& obj, const std::string& context, const char* key, bool& out) {
    if (!obj.contains(key)) {
        return;
    }
    if (!obj[key].is_boolean()) {
        throw std::runtime_error(context + "." + key + " must be a boolean");
    }
    out = obj[key].get<bool>();
}

uint64_t readUnsigned(const nlohmann::json& obj, const std::string& context, const char* key,
                      uint64_t current, uint64_t minValue, uint64_t maxValue) {
    if (!obj.contains(key)) {
        return current;
    }
    const auto& value = obj[key];
    if (!value.is_number_integer()) {
        throw std::runtime_error(context + "." + key + " must be an integer");
    }
    if (value.is_number_unsigned()) {
        uint64_t v = value.get<uint64_t>();
        if (v >= minValue && v <= maxValue) {
            return v;
        }
    } else {
        int64_t v = value.get<int64_t>();
        if (v >= 0 && static_cast<uint64_t>(v) >= minValue && static_cast<uint64_t>(v) <= maxValue) {
            return static_cast<uint64_t>(v);
        }
    }
    throw std::runtime_error(context + "." + key + " out of range [" + std::to_string(minValue) +
                             ", " + std::to_string(maxValue) + "]");
}

uint16_t readPort(const nlohmann::json& obj, const std::string& context, uint16_t current) {
    return static_cast<uint16_t>(readUnsigned(obj, context, "port", current, 1, 65535));
}

nlohmann::json loadJsonFile(const std::filesystem::path& path, bool& exists) {
    std::error_code ec;
    exists = std::filesystem::exists(path, ec);
    if (!exists) {
        return nlohmann::json::object();
    }

    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error("Invalid JSON in config file: " + path.string());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config file must contain a JSON object: " + path.string());
    }
    return j;
}

uint16_t parsePortArg(const std::string& flag, const std::string& value) {
    if (value.empty() || value.size() > 5 ||
        value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("Invalid value for " + flag + ": " + value);
    }
    unsigned long port = std::stoul(value);
    if (port == 0 || port > 65535) {
        throw std::runtime_error("Invalid value for " + flag + ": " + value);
    }
    return static_cast<uint16_t>(port);
}

}  // namespace

//=============================================================================
// ClientSettings
//=============================================================================

nlohmann::json ClientSettings::toJson() const {
    nlohmann::json out;
    out["ftp_server"] = {
        {"host", ftpServer.host},
        {"port", ftpServer.port},
        {"username", ftpServer.username},
        {"password", ftpServer.password},
    };
    out["clamav_agent"] = {
        {"host", scanAgent.host},
        {"port", scanAgent.port},
    };
    out["client"] = {
        {"passive_mode", passiveMode},
        {"timeout", timeoutSeconds},
        {"buffer_size", bufferSize},
        {"auth_tls_shim", authTlsShim},
        {"prompt", prompt},
        {"log_file", logFile},
    };
    return out;
}

ClientSettings ClientSettings::fromJson(const nlohmann::json& j) {
    ClientSettings s;
    if (!j.is_object()) {
        throw std::runtime_error("Client config must be a JSON object");
    }

    if (const auto* ftp = section(j, "ftp_server")) {
        readString(*ftp, "ftp_server", "host", s.ftpServer.host);
        s.ftpServer.port = readPort(*ftp, "ftp_server", s.ftpServer.port);
        readString(*ftp, "ftp_server", "username", s.ftpServer.username);
        readString(*ftp, "ftp_server", "password", s.ftpServer.password);
    }

    if (const auto* agent = section(j, "clamav_agent")) {
        readString(*agent, "clamav_agent", "host", s.scanAgent.host);
        s.scanAgent.port = readPort(*agent, "clamav_agent", s.scanAgent.port);
    }

    if (const auto* client = section(j, "client")) {
        readBool(*client, "client", "passive_mode", s.passiveMode);
        s.timeoutSeconds = static_cast<uint32_t>(
            readUnsigned(*client, "client", "timeout", s.timeoutSeconds, 1, 3600));
        s.bufferSize = static_cast<size_t>(
            readUnsigned(*client, "client", "buffer_size", s.bufferSize, 1, BUFFER_SIZE_MAX));
        readBool(*client, "client", "auth_tls_shim", s.authTlsShim);
        readBool(*client, "client", "prompt", s.prompt);
        readString(*client, "client", "log_file", s.logFile);
    }

    if (s.ftpServer.host.empty() || s.scanAgent.host.empty()) {
        throw std::runtime_error("Host names must not be empty");
    }
    return s;
}

ClientSettings ClientSettings::loadOrThrow(const std::filesystem::path& path) {
    bool exists = false;
    nlohmann::json j = loadJsonFile(path, exists);
    if (!exists) {
        LOG_INFO("Config file " << path.string() << " not found, using defaults");
        return ClientSettings();
    }
    LOG_INFO("Loaded client config from " << path.string());
    return fromJson(j);
}

//=============================================================================
// AgentSettings
//=============================================================================

nlohmann::json AgentSettings::toJson() const {
    nlohmann::json out;
    out["server"] = {
        {"host", host},
        {"port", port},
        {"max_connections", maxConnections},
    };
    out["clamav"] = {
        {"command", scannerCommand},
        {"temp_dir", tempDir},
        {"timeout", scanTimeoutSeconds},
        {"max_file_size", maxFileSize},
    };
    out["log_file"] = logFile;
    return out;
}

ScanAgentConfig AgentSettings::toAgentConfig() const {
    ScanAgentConfig config;
    config.host = host;
    config.port = port;
    config.maxConnections = maxConnections;
    config.session.tempDir = tempDir;
    config.session.maxFileSize = maxFileSize;
    return config;
}

AgentSettings AgentSettings::fromJson(const nlohmann::json& j) {
    AgentSettings s;
    if (!j.is_object()) {
        throw std::runtime_error("Agent config must be a JSON object");
    }

    if (const auto* server = section(j, "server")) {
        readString(*server, "server", "host", s.host);
        s.port = readPort(*server, "server", s.port);
        s.maxConnections = static_cast<size_t>(
            readUnsigned(*server, "server", "max_connections", s.maxConnections, 1, 1024));
    }

    if (const auto* clamav = section(j, "clamav")) {
        readString(*clamav, "clamav", "command", s.scannerCommand);
        readString(*clamav, "clamav", "temp_dir", s.tempDir);
        s.scanTimeoutSeconds = static_cast<uint32_t>(
            readUnsigned(*clamav, "clamav", "timeout", s.scanTimeoutSeconds, 1, 86400));
        s.maxFileSize = readUnsigned(*clamav, "clamav", "max_file_size", s.maxFileSize, 1,
                                     std::numeric_limits<uint64_t>::max());
    }

    if (j.contains("log_file")) {
        if (!j["log_file"].is_string()) {
            throw std::runtime_error("log_file must be a string");
        }
        s.logFile = j["log_file"].get<std::string>();
    }

    if (s.scannerCommand.empty()) {
        throw std::runtime_error("clamav.command must not be empty");
    }
    if (s.tempDir.empty()) {
        throw std::runtime_error("clamav.temp_dir must not be empty");
    }
    return s;
}

AgentSettings AgentSettings::loadOrThrow(const std::filesystem::path& path) {
    bool exists = false;
    nlohmann::json j = loadJsonFile(path, exists);
    if (!exists) {
        LOG_INFO("Config file " << path.string() << " not found, using defaults");
        return AgentSettings();
    }
    LOG_INFO("Loaded agent config from " << path.string());
    return fromJson(j);
}

//=============================================================================
// ClientArgs
//=============================================================================

ClientArgs ClientArgs::parseOrThrow(int argc, const char* const* argv) {
    ClientArgs out;

    auto valueFor = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc || !argv[i + 1]) {
            throw std::runtime_error("Missing value for " + flag);
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? std::string(argv[i]) : std::string();

        if (a == "--help" || a == "-h") {
            out.showHelp = true;
            continue;
        }

        if (a == "--config") {
            out.configPath = valueFor(i, a);
            continue;
        }

        if (a == "--host") {
            out.host = valueFor(i, a);
            if (out.host.empty()) {
                throw std::runtime_error("Empty value for --host");
            }
            continue;
        }

        if (a == "--port") {
            out.port = parsePortArg(a, valueFor(i, a));
            continue;
        }

        if (a == "--user") {
            out.user = valueFor(i, a);
            continue;
        }

        if (a == "--password") {
            out.password = valueFor(i, a);
            out.hasPassword = true;
            continue;
        }

        throw std::runtime_error("Unknown argument: " + a);
    }

    return out;
}

void ClientArgs::applyTo(ClientSettings& settings) const {
    if (!host.empty()) {
        settings.ftpServer.host = host;
    }
    if (port != 0) {
        settings.ftpServer.port = port;
    }
    if (!user.empty()) {
        settings.ftpServer.username = user;
    }
    if (hasPassword) {
        settings.ftpServer.password = password;
    }
}

const char* ClientArgs::usage() {
    return "Usage: clamftp_client [--config <file>] [--host <host>] [--port <port>]\n"
           "                      [--user <name>] [--password <password>]\n";
}

//=============================================================================
// AgentArgs
//=============================================================================

AgentArgs AgentArgs::parseOrThrow(int argc, const char* const* argv) {
    AgentArgs out;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? std::string(argv[i]) : std::string();

        if (a == "--help" || a == "-h") {
            out.showHelp = true;
            continue;
        }

        if (a == "--config" || a == "--port") {
            if (i + 1 >= argc || !argv[i + 1]) {
                throw std::runtime_error("Missing value for " + a);
            }
            const std::string value(argv[++i]);
            if (a == "--config") {
                out.configPath = value;
            } else {
                out.port = parsePortArg(a, value);
            }
            continue;
        }

        throw std::runtime_error("Unknown argument: " + a);
    }

    return out;
}

void AgentArgs::applyTo(AgentSettings& settings) const {
    if (port != 0) {
        settings.port = port;
    }
}

const char* AgentArgs::usage() {
    return "Usage: clamftp_agent [--config <file>] [--port <port>]\n";
}

}  // namespace ClamFtp
