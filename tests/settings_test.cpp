/**
 * @file settings_test.cpp
 * @brief Unit tests for JSON settings and argument parsing
 */

#include "clamftp/Settings.h"
#include "test_support.h"
#include <gtest/gtest.h>

using namespace ClamFtp;

//=============================================================================
// ClientSettings
//=============================================================================

TEST(ClientSettingsTest, MissingFileYieldsDefaults) {
    ClamFtpTest::TempDir dir;
    ClientSettings s = ClientSettings::loadOrThrow(dir.path() / "absent.json");

    EXPECT_EQ(s.ftpServer.host, "127.0.0.1");
    EXPECT_EQ(s.ftpServer.port, 21);
    EXPECT_EQ(s.scanAgent.port, 9999);
    EXPECT_TRUE(s.passiveMode);
    EXPECT_EQ(s.timeoutSeconds, 90u);
    EXPECT_EQ(s.bufferSize, 8192u);
    EXPECT_TRUE(s.authTlsShim);
}

TEST(ClientSettingsTest, DefaultTimeoutOutlastsDefaultScan) {
    ClientSettings client;
    AgentSettings agent;
    EXPECT_GE(client.timeoutSeconds, agent.scanTimeoutSeconds);
}

TEST(ClientSettingsTest, LoadsAllSections) {
    ClamFtpTest::TempDir dir;
    auto path = dir.writeFile("client.json", R"({
        "ftp_server": {"host": "ftp.example.com", "port": 2121, "username": "alice", "password": "pw"},
        "clamav_agent": {"host": "10.0.0.2", "port": 9000},
        "client": {"passive_mode": false, "timeout": 45, "buffer_size": 4096,
                   "auth_tls_shim": false, "prompt": false, "log_file": "c.log"}
    })");

    ClientSettings s = ClientSettings::loadOrThrow(path);

    EXPECT_EQ(s.ftpServer.host, "ftp.example.com");
    EXPECT_EQ(s.ftpServer.port, 2121);
    EXPECT_EQ(s.ftpServer.username, "alice");
    EXPECT_EQ(s.ftpServer.password, "pw");
    EXPECT_EQ(s.scanAgent.host, "10.0.0.2");
    EXPECT_EQ(s.scanAgent.port, 9000);
    EXPECT_FALSE(s.passiveMode);
    EXPECT_EQ(s.timeoutSeconds, 45u);
    EXPECT_EQ(s.bufferSize, 4096u);
    EXPECT_FALSE(s.authTlsShim);
    EXPECT_FALSE(s.prompt);
    EXPECT_EQ(s.logFile, "c.log");
}

TEST(ClientSettingsTest, PartialFileKeepsOtherDefaults) {
    ClientSettings s = ClientSettings::fromJson(nlohmann::json::parse(R"({"client": {"timeout": 5}})"));

    EXPECT_EQ(s.timeoutSeconds, 5u);
    EXPECT_EQ(s.ftpServer.port, 21);
    EXPECT_TRUE(s.passiveMode);
}

TEST(ClientSettingsTest, WrongTypesThrow) {
    EXPECT_THROW(ClientSettings::fromJson(nlohmann::json::parse(R"({"ftp_server": {"port": "21"}})")),
                 std::runtime_error);
    EXPECT_THROW(ClientSettings::fromJson(nlohmann::json::parse(R"({"client": {"passive_mode": 1}})")),
                 std::runtime_error);
    EXPECT_THROW(ClientSettings::fromJson(nlohmann::json::parse(R"({"clamav_agent": []})")),
                 std::runtime_error);
    EXPECT_THROW(ClientSettings::fromJson(nlohmann::json::parse(R"({"ftp_server": {"host": 7}})")),
                 std::runtime_error);
}

TEST(ClientSettingsTest, OutOfRangeValuesThrow) {
    EXPECT_THROW(ClientSettings::fromJson(nlohmann::json::parse(R"({"ftp_server": {"port": 70000}})")),
                 std::runtime_error);
    EXPECT_THROW(ClientSettings::fromJson(nlohmann::json::parse(R"({"ftp_server": {"port": 0}})")),
                 std::runtime_error);
    EXPECT_THROW(ClientSettings::fromJson(nlohmann::json::parse(R"({"client": {"buffer_size": -1}})")),
                 std::runtime_error);
    EXPECT_THROW(ClientSettings::fromJson(nlohmann::json::parse(R"({"client": {"timeout": 0}})")),
                 std::runtime_error);
}

TEST(ClientSettingsTest, InvalidJsonFileThrows) {
    ClamFtpTest::TempDir dir;
    auto path = dir.writeFile("broken.json", "{ \"ftp_server\": ");

    EXPECT_THROW(ClientSettings::loadOrThrow(path), std::runtime_error);
}

TEST(ClientSettingsTest, ToJsonRoundTripsThroughFromJson) {
    ClientSettings original;
    original.ftpServer.host = "h";
    original.ftpServer.username = "u";
    original.passiveMode = false;
    original.bufferSize = 1234;

    ClientSettings copy = ClientSettings::fromJson(original.toJson());

    EXPECT_EQ(copy.ftpServer.host, "h");
    EXPECT_EQ(copy.ftpServer.username, "u");
    EXPECT_FALSE(copy.passiveMode);
    EXPECT_EQ(copy.bufferSize, 1234u);
}

//=============================================================================
// AgentSettings
//=============================================================================

TEST(AgentSettingsTest, LoadsAndMapsToAgentConfig) {
    AgentSettings s = AgentSettings::fromJson(nlohmann::json::parse(R"({
        "server": {"host": "127.0.0.1", "port": 9100, "max_connections": 2},
        "clamav": {"command": "/usr/bin/clamdscan", "temp_dir": "/tmp/scan", "timeout": 15,
                   "max_file_size": 1024},
        "log_file": "agent.log"
    })"));

    EXPECT_EQ(s.scannerCommand, "/usr/bin/clamdscan");
    EXPECT_EQ(s.scanTimeoutSeconds, 15u);
    EXPECT_EQ(s.logFile, "agent.log");

    ScanAgentConfig config = s.toAgentConfig();
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 9100);
    EXPECT_EQ(config.maxConnections, 2u);
    EXPECT_EQ(config.session.tempDir, std::filesystem::path("/tmp/scan"));
    EXPECT_EQ(config.session.maxFileSize, 1024u);
}

TEST(AgentSettingsTest, DefaultsMatchReferenceDeployment) {
    AgentSettings s;

    EXPECT_EQ(s.host, "0.0.0.0");
    EXPECT_EQ(s.port, 9999);
    EXPECT_EQ(s.maxConnections, 5u);
    EXPECT_EQ(s.scannerCommand, "clamscan");
    EXPECT_EQ(s.tempDir, "./temp_files");
    EXPECT_EQ(s.scanTimeoutSeconds, 60u);
}

TEST(AgentSettingsTest, RejectsEmptyCommandAndZeroConnections) {
    EXPECT_THROW(AgentSettings::fromJson(nlohmann::json::parse(R"({"clamav": {"command": ""}})")),
                 std::runtime_error);
    EXPECT_THROW(AgentSettings::fromJson(nlohmann::json::parse(R"({"server": {"max_connections": 0}})")),
                 std::runtime_error);
}

//=============================================================================
// Arguments
//=============================================================================

TEST(ClientArgsTest, ParsesOverrides) {
    const char* argv[] = {"clamftp_client", "--config", "c.json", "--host", "ftp.local",
                          "--port", "2121", "--user", "bob", "--password", ""};
    ClientArgs args = ClientArgs::parseOrThrow(11, argv);

    EXPECT_EQ(args.configPath, "c.json");
    EXPECT_EQ(args.host, "ftp.local");
    EXPECT_EQ(args.port, 2121);
    EXPECT_EQ(args.user, "bob");
    EXPECT_TRUE(args.hasPassword);

    ClientSettings s;
    s.ftpServer.password = "old";
    args.applyTo(s);
    EXPECT_EQ(s.ftpServer.host, "ftp.local");
    EXPECT_EQ(s.ftpServer.port, 2121);
    EXPECT_EQ(s.ftpServer.username, "bob");
    EXPECT_EQ(s.ftpServer.password, "");
}

TEST(ClientArgsTest, NoArgumentsKeepsSettings) {
    const char* argv[] = {"clamftp_client"};
    ClientArgs args = ClientArgs::parseOrThrow(1, argv);

    ClientSettings s;
    s.ftpServer.username = "keep";
    args.applyTo(s);
    EXPECT_EQ(s.ftpServer.username, "keep");
    EXPECT_EQ(s.ftpServer.port, 21);
}

TEST(ClientArgsTest, RejectsUnknownAndIncompleteArguments) {
    const char* unknown[] = {"clamftp_client", "--verbose"};
    EXPECT_THROW(ClientArgs::parseOrThrow(2, unknown), std::runtime_error);

    const char* missing[] = {"clamftp_client", "--host"};
    EXPECT_THROW(ClientArgs::parseOrThrow(2, missing), std::runtime_error);

    const char* badPort[] = {"clamftp_client", "--port", "99999"};
    EXPECT_THROW(ClientArgs::parseOrThrow(3, badPort), std::runtime_error);
}

TEST(AgentArgsTest, ParsesPortAndHelp) {
    const char* argv[] = {"clamftp_agent", "--port", "9200", "--help"};
    AgentArgs args = AgentArgs::parseOrThrow(4, argv);

    EXPECT_TRUE(args.showHelp);
    EXPECT_EQ(args.port, 9200);

    AgentSettings s;
    args.applyTo(s);
    EXPECT_EQ(s.port, 9200);
}

TEST(AgentArgsTest, RejectsNonNumericPort) {
    const char* argv[] = {"clamftp_agent", "--port", "abc"};
    EXPECT_THROW(AgentArgs::parseOrThrow(3, argv), std::runtime_error);
}
