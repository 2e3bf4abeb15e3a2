/**
 * @file command_shell_test.cpp
 * @brief Command parsing and shell dispatch through string streams
 */

#include "clamftp/CommandShell.h"
#include "clamftp/ScanAgent.h"
#include "test_support.h"
#include <gtest/gtest.h>

#include <memory>
#include <sstream>

using namespace ClamFtp;
using ClamFtpTest::FakeFtpServer;
using ClamFtpTest::FakeScanEngine;
using ClamFtpTest::TempDir;

//=============================================================================
// Parsing
//=============================================================================

TEST(ShellCommandTest, SplitsWordsAndLowercasesCommand) {
    ShellCommand command = ShellCommand::parse("  PUT   local.txt  remote.txt ");
    EXPECT_EQ(command.kind, ShellCommandKind::PUT);
    EXPECT_EQ(command.name, "put");
    ASSERT_EQ(command.args.size(), 2u);
    EXPECT_EQ(command.args[0], "local.txt");
    EXPECT_EQ(command.args[1], "remote.txt");
}

TEST(ShellCommandTest, QuotesGroupArguments) {
    ShellCommand command = ShellCommand::parse("rename \"old name.txt\" \"\"");
    EXPECT_EQ(command.kind, ShellCommandKind::RENAME);
    ASSERT_EQ(command.args.size(), 2u);
    EXPECT_EQ(command.args[0], "old name.txt");
    EXPECT_EQ(command.args[1], "");
}

TEST(ShellCommandTest, EmptyAndUnknown) {
    EXPECT_EQ(ShellCommand::parse("").kind, ShellCommandKind::EMPTY);
    EXPECT_EQ(ShellCommand::parse(" \t ").kind, ShellCommandKind::EMPTY);

    ShellCommand unknown = ShellCommand::parse("frobnicate now");
    EXPECT_EQ(unknown.kind, ShellCommandKind::UNKNOWN);
    EXPECT_EQ(unknown.name, "frobnicate");
}

TEST(ShellCommandTest, Aliases) {
    EXPECT_EQ(ShellCommand::kindFromName("dir"), ShellCommandKind::LS);
    EXPECT_EQ(ShellCommand::kindFromName("cwd"), ShellCommandKind::CD);
    EXPECT_EQ(ShellCommand::kindFromName("del"), ShellCommandKind::DELETE);
    EXPECT_EQ(ShellCommand::kindFromName("recv"), ShellCommandKind::GET);
    EXPECT_EQ(ShellCommand::kindFromName("send"), ShellCommandKind::PUT);
    EXPECT_EQ(ShellCommand::kindFromName("?"), ShellCommandKind::HELP);
    EXPECT_EQ(ShellCommand::kindFromName("bye"), ShellCommandKind::QUIT);
    EXPECT_EQ(ShellCommand::kindFromName("EXIT"), ShellCommandKind::QUIT);
}

//=============================================================================
// Dispatch
//=============================================================================

namespace {

class CommandShellTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(server.start());

        engine = std::make_unique<FakeScanEngine>();
        ScanAgentConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.connectionTimeoutMs = 5000;
        config.session.tempDir = dir.path() / "scans";
        agent = std::make_unique<ScanAgent>(config, *engine);
        std::string errorMsg;
        ASSERT_TRUE(agent->start(errorMsg)) << errorMsg;

        settings.ftpServer.host = "127.0.0.1";
        settings.ftpServer.port = server.port();
        settings.ftpServer.username = "alice";
        settings.ftpServer.password = "s3cret";
        settings.scanAgent.host = "127.0.0.1";
        settings.scanAgent.port = agent->getPort();
        settings.prompt = false;

        control = std::make_unique<ControlSession>(5, false);
        scanner = std::make_unique<ScanClient>("127.0.0.1", agent->getPort(), 5, 1024);
        transfers = std::make_unique<TransferOrchestrator>(*control, *scanner, 1024, 5);
        shell = std::make_unique<CommandShell>(*control, *transfers, settings, in, out);
    }

    void TearDown() override {
        shell.reset();
        transfers.reset();
        control.reset();
        if (agent) {
            agent->stop();
        }
    }

    std::string run(const std::string& line) {
        out.str("");
        EXPECT_TRUE(shell->execute(line));
        return out.str();
    }

    void feed(const std::string& input) {
        in.clear();
        in.str(input);
    }

    static bool contains(const std::string& text, const std::string& needle) {
        return text.find(needle) != std::string::npos;
    }

    FakeFtpServer server;
    TempDir dir;
    std::unique_ptr<FakeScanEngine> engine;
    std::unique_ptr<ScanAgent> agent;
    ClientSettings settings;
    std::unique_ptr<ControlSession> control;
    std::unique_ptr<ScanClient> scanner;
    std::unique_ptr<TransferOrchestrator> transfers;
    std::istringstream in;
    std::ostringstream out;
    std::unique_ptr<CommandShell> shell;
};

}  // namespace

TEST_F(CommandShellTest, UnknownCommandHint) {
    std::string output = run("frobnicate");
    EXPECT_TRUE(contains(output, "Unknown command: frobnicate"));
    EXPECT_TRUE(contains(output, "Type 'help'"));
}

TEST_F(CommandShellTest, HelpListsCommands) {
    std::string output = run("help");
    EXPECT_TRUE(contains(output, "mput <pattern>"));
    EXPECT_TRUE(contains(output, "passive"));
}

TEST_F(CommandShellTest, TogglesAreLocal) {
    EXPECT_TRUE(contains(run("passive"), "Passive mode OFF"));
    EXPECT_FALSE(control->isPassiveMode());
    EXPECT_TRUE(contains(run("passive"), "Passive mode ON"));

    EXPECT_TRUE(contains(run("prompt"), "Interactive mode ON"));
    EXPECT_TRUE(shell->isPromptMode());
    EXPECT_TRUE(server.commands().empty());
}

TEST_F(CommandShellTest, CommandsNeedSession) {
    EXPECT_TRUE(contains(run("ls"), "Not connected to server. Use 'open' command."));
    EXPECT_TRUE(contains(run("put file.txt"), "Not connected"));
    EXPECT_TRUE(contains(run("close"), "Not connected"));
}

TEST_F(CommandShellTest, UsageMessages) {
    EXPECT_TRUE(contains(run("cd"), "Usage: cd <directory>"));
    EXPECT_TRUE(contains(run("rename onlyone"), "Usage: rename"));
    EXPECT_TRUE(contains(run("get"), "Usage: get"));
    EXPECT_TRUE(contains(run("mput"), "Usage: mput"));
    EXPECT_TRUE(contains(run("open 127.0.0.1 99999"), "Invalid port number"));
}

TEST_F(CommandShellTest, StatusWhenDisconnected) {
    std::string output = run("status");
    EXPECT_TRUE(contains(output, "Connected: No"));
    EXPECT_TRUE(contains(output, "Mode: Passive"));
    EXPECT_TRUE(contains(output, "ClamAV agent: 127.0.0.1:" + std::to_string(agent->getPort())));
    EXPECT_FALSE(contains(output, "Current dir"));
}

TEST_F(CommandShellTest, QuitReturnsFalse) {
    out.str("");
    EXPECT_FALSE(shell->execute("bye"));
    EXPECT_TRUE(contains(out.str(), "Goodbye!"));
}

TEST_F(CommandShellTest, OpenUsesConfiguredCredentials) {
    std::string output = run("open");
    EXPECT_TRUE(contains(output, "Logged in as alice")) << output;
    EXPECT_TRUE(control->isAuthenticated());
    EXPECT_TRUE(server.sawVerb("PASS"));

    output = run("status");
    EXPECT_TRUE(contains(output, "Connected: Yes"));
    EXPECT_TRUE(contains(output, "User: alice"));
    EXPECT_TRUE(contains(output, "Current dir: /"));
}

TEST_F(CommandShellTest, OpenOtherHostPromptsForCredentials) {
    // Same server, but reached as "localhost" so the configured login is not used
    feed("bob\nhunter2\n");
    std::string output = run("open localhost " + std::to_string(server.port()));
    EXPECT_TRUE(contains(output, "Username: "));
    EXPECT_TRUE(contains(output, "Password: "));
    EXPECT_TRUE(contains(output, "Logged in as bob")) << output;

    auto commands = server.commands();
    ASSERT_GE(commands.size(), 2u);
    EXPECT_EQ(commands[0], "USER bob");
    EXPECT_EQ(commands[1], "PASS hunter2");
}

TEST_F(CommandShellTest, DirectoryCommands) {
    server.putFile("old.txt", "x");
    ASSERT_TRUE(shell->openSession(settings.ftpServer.host, settings.ftpServer.port, "alice", "s3cret"));

    EXPECT_TRUE(contains(run("cd pub"), "Changed to directory: /pub"));
    EXPECT_TRUE(contains(run("pwd"), "Current directory: /pub"));
    EXPECT_TRUE(contains(run("cd missing"), "CWD failed"));
    EXPECT_TRUE(contains(run("mkdir incoming"), "Directory created: incoming"));
    EXPECT_TRUE(contains(run("rmdir incoming"), "Directory removed: incoming"));
    EXPECT_TRUE(contains(run("rename old.txt new.txt"), "File renamed: old.txt -> new.txt"));
    EXPECT_TRUE(contains(run("delete new.txt"), "File deleted: new.txt"));
    EXPECT_TRUE(contains(run("ascii"), "Transfer mode set to ascii"));
}

TEST_F(CommandShellTest, PutScansThenUploads) {
    ASSERT_TRUE(shell->openSession(settings.ftpServer.host, settings.ftpServer.port, "alice", "s3cret"));
    auto local = dir.writeFile("hello.txt", "hello world");

    std::string output = run("put " + local.string());
    EXPECT_TRUE(contains(output, "File is clean")) << output;
    EXPECT_TRUE(contains(output, "Uploaded: " + local.string() + " -> hello.txt (11 bytes)")) << output;
    EXPECT_EQ(server.file("hello.txt"), "hello world");
    EXPECT_EQ(engine->scannedPaths().size(), 1u);

    output = run("ls");
    EXPECT_TRUE(contains(output, "hello.txt"));
}

TEST_F(CommandShellTest, MputPromptsPerFile) {
    ASSERT_TRUE(shell->openSession(settings.ftpServer.host, settings.ftpServer.port, "alice", "s3cret"));
    dir.writeFile("a.txt", "a");
    dir.writeFile("b.txt", "b");

    run("prompt");
    feed("y\nn\n");
    std::string output = run("mput " + (dir.path() / "*.txt").string());
    EXPECT_TRUE(contains(output, "1 of 2 file(s) transferred, 1 skipped")) << output;
    EXPECT_TRUE(server.hasFile("a.txt"));
    EXPECT_FALSE(server.hasFile("b.txt"));

    output = run("mput " + (dir.path() / "*.none").string());
    EXPECT_TRUE(contains(output, "No files match pattern"));
}

TEST_F(CommandShellTest, MgetDownloadsMatches) {
    server.putFile("r1.log", "one");
    server.putFile("r2.log", "two");
    server.putFile("keep.txt", "three");
    ASSERT_TRUE(shell->openSession(settings.ftpServer.host, settings.ftpServer.port, "alice", "s3cret"));

    const auto previous = std::filesystem::current_path();
    std::filesystem::current_path(dir.path());
    std::string output = run("mget *.log");
    std::filesystem::current_path(previous);

    EXPECT_TRUE(contains(output, "2 of 2 file(s) transferred")) << output;
    EXPECT_EQ(ClamFtpTest::readFile(dir.path() / "r1.log"), "one");
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "keep.txt"));
}

TEST_F(CommandShellTest, RunLoopStopsAtEndOfInput) {
    feed("passive\nstatus\n");
    shell->run();
    EXPECT_TRUE(contains(out.str(), "ftp> "));
    EXPECT_TRUE(contains(out.str(), "Mode: Active"));
}
