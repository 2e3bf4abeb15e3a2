/**
 * @file scan_agent_test.cpp
 * @brief Loopback tests for the scan agent and its per-connection sessions
 */

#include "clamftp/ScanAgent.h"
#include "clamftp/SocketUtils.h"
#include "test_support.h"
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <thread>
#include <vector>

using namespace ClamFtp;
using ClamFtpTest::FakeScanEngine;
using ClamFtpTest::TempDir;

namespace {

/**
 * @brief Collects session reports delivered on handler threads
 */
class ReportSink {
public:
    void add(const ScanSessionReport& report) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_reports.push_back(report);
        m_cv.notify_all();
    }

    bool waitFor(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [&]() { return m_reports.size() >= count; });
    }

    ScanSessionReport at(size_t index) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_reports.at(index);
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<ScanSessionReport> m_reports;
};

/**
 * @brief Raw scan-protocol client speaking directly to the socket
 */
class RawScanConnection {
public:
    explicit RawScanConnection(uint16_t port) {
        std::string errorMsg;
        m_socket = connectTcp("127.0.0.1", port, 5000, errorMsg);
    }

    bool isOpen() const { return m_socket.isValid(); }

    bool send(const std::string& text) {
        std::string errorMsg;
        return sendString(m_socket.get(), text, errorMsg);
    }

    // Reads one burst (handshake replies are single short writes)
    std::string receive() {
        uint8_t buffer[1024];
        std::string errorMsg;
        ssize_t received = recvSome(m_socket.get(), buffer, sizeof(buffer), errorMsg);
        return received > 0 ? std::string(reinterpret_cast<char*>(buffer), static_cast<size_t>(received))
                            : std::string();
    }

    std::string receiveUntilEof() {
        std::string out;
        uint8_t buffer[1024];
        std::string errorMsg;
        ssize_t received = 0;
        while ((received = recvSome(m_socket.get(), buffer, sizeof(buffer), errorMsg)) > 0) {
            out.append(reinterpret_cast<char*>(buffer), static_cast<size_t>(received));
        }
        return out;
    }

    void close() { m_socket.close(); }

private:
    SocketHandle m_socket;
};

/**
 * @brief Records session state changes; at CLOSED also lists the temp dir
 */
class StateRecorder {
public:
    explicit StateRecorder(std::filesystem::path dir) : m_dir(std::move(dir)) {}

    void record(ScanSessionState state) {
        std::vector<std::string> files;
        if (state == ScanSessionState::CLOSED) {
            std::error_code ec;
            for (auto it = std::filesystem::directory_iterator(m_dir, ec);
                 !ec && it != std::filesystem::directory_iterator(); ++it) {
                files.push_back(it->path().string());
            }
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_states.push_back(state);
        if (state == ScanSessionState::CLOSED) {
            m_filesAtClose = files;
        }
    }

    std::vector<ScanSessionState> states() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_states;
    }

    std::vector<std::string> filesAtClose() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_filesAtClose;
    }

private:
    std::filesystem::path m_dir;
    std::mutex m_mutex;
    std::vector<ScanSessionState> m_states;
    std::vector<std::string> m_filesAtClose;
};

ScanResult parseResult(const std::string& text) {
    ScanResult result;
    std::string errorMsg;
    EXPECT_TRUE(ScanResult::parse(text, result, errorMsg)) << errorMsg << " in '" << text << "'";
    return result;
}

class ScanAgentTest : public ::testing::Test {
protected:
    void startAgent(ScanResult verdict = ScanResult::ok("File is clean"), size_t maxConnections = 5,
                    uint64_t maxFileSize = MAX_SCAN_FILE_SIZE_DEFAULT) {
        engine = std::make_unique<FakeScanEngine>(verdict);

        ScanAgentConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.maxConnections = maxConnections;
        config.connectionTimeoutMs = 5000;
        config.session.tempDir = tempDir.path() / "scans";
        config.session.maxFileSize = maxFileSize;

        agent = std::make_unique<ScanAgent>(config, *engine);
        agent->setSessionCompletedCallback([this](const ScanSessionReport& r) { reports.add(r); });
        agent->setSessionStateCallback([this](const std::string&, ScanSessionState state) {
            recorder.record(state);
        });

        std::string errorMsg;
        ASSERT_TRUE(agent->start(errorMsg)) << errorMsg;
        ASSERT_NE(agent->getPort(), 0);
    }

    void TearDown() override {
        if (agent) {
            agent->stop();
        }
    }

    size_t tempFileCount() const {
        size_t count = 0;
        std::error_code ec;
        for (auto it = std::filesystem::directory_iterator(tempDir.path() / "scans", ec);
             !ec && it != std::filesystem::directory_iterator(); ++it) {
            ++count;
        }
        return count;
    }

    TempDir tempDir;
    std::unique_ptr<FakeScanEngine> engine;
    std::unique_ptr<ScanAgent> agent;
    ReportSink reports;
    StateRecorder recorder{tempDir.path() / "scans"};
};

}  // namespace

//=============================================================================
// Full exchanges
//=============================================================================

TEST_F(ScanAgentTest, CleanFileScenario) {
    startAgent();
    const std::string payload = "just some harmless text\n";

    RawScanConnection conn(agent->getPort());
    ASSERT_TRUE(conn.isOpen());
    ASSERT_TRUE(conn.send("FILENAME:notes.txt"));
    EXPECT_EQ(conn.receive(), "READY");
    ASSERT_TRUE(conn.send("SIZE:" + std::to_string(payload.size())));
    EXPECT_EQ(conn.receive(), "READY");
    ASSERT_TRUE(conn.send(payload));

    ScanResult result = parseResult(conn.receiveUntilEof());
    EXPECT_EQ(result.status, ScanStatus::OK);
    EXPECT_EQ(result.message, "File is clean");

    ASSERT_TRUE(reports.waitFor(1));
    ScanSessionReport report = reports.at(0);
    EXPECT_EQ(report.filename, "notes.txt");
    EXPECT_EQ(report.declaredSize, payload.size());
    EXPECT_EQ(report.bytesReceived, payload.size());
    EXPECT_TRUE(report.responded);
    EXPECT_FALSE(report.protocolViolation);

    ASSERT_EQ(engine->scannedContents().size(), 1u);
    EXPECT_EQ(engine->scannedContents()[0], payload);
    EXPECT_FALSE(std::filesystem::exists(report.tempPath));
    EXPECT_EQ(tempFileCount(), 0u);
}

TEST_F(ScanAgentTest, InfectedFileScenario) {
    startAgent(ScanResult::infected("Virus detected", "eicar.com: Eicar-Signature FOUND"));

    RawScanConnection conn(agent->getPort());
    ASSERT_TRUE(conn.send("FILENAME:eicar.com"));
    EXPECT_EQ(conn.receive(), "READY");
    ASSERT_TRUE(conn.send("SIZE:4"));
    EXPECT_EQ(conn.receive(), "READY");
    ASSERT_TRUE(conn.send("EVIL"));

    ScanResult result = parseResult(conn.receiveUntilEof());
    EXPECT_EQ(result.status, ScanStatus::INFECTED);
    EXPECT_EQ(result.message, "Virus detected");
    EXPECT_NE(result.details.find("FOUND"), std::string::npos);

    ASSERT_TRUE(reports.waitFor(1));
    EXPECT_EQ(tempFileCount(), 0u);
}

TEST_F(ScanAgentTest, ReadsExactlyDeclaredBytesInChunks) {
    startAgent();
    std::string payload(100000, '\0');
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>(i % 251);
    }

    RawScanConnection conn(agent->getPort());
    ASSERT_TRUE(conn.send("FILENAME:blob.bin\r\n"));
    EXPECT_EQ(conn.receive(), "READY");
    ASSERT_TRUE(conn.send("SIZE:" + std::to_string(payload.size()) + "\n"));
    EXPECT_EQ(conn.receive(), "READY");
    ASSERT_TRUE(conn.send(payload));

    EXPECT_EQ(parseResult(conn.receiveUntilEof()).status, ScanStatus::OK);
    ASSERT_EQ(engine->scannedContents().size(), 1u);
    EXPECT_EQ(engine->scannedContents()[0], payload);
}

TEST_F(ScanAgentTest, EmptyFileIsScanned) {
    startAgent();

    RawScanConnection conn(agent->getPort());
    ASSERT_TRUE(conn.send("FILENAME:empty.txt"));
    EXPECT_EQ(conn.receive(), "READY");
    ASSERT_TRUE(conn.send("SIZE:0"));
    EXPECT_EQ(conn.receive(), "READY");

    EXPECT_EQ(parseResult(conn.receiveUntilEof()).status, ScanStatus::OK);
    ASSERT_EQ(engine->scannedContents().size(), 1u);
    EXPECT_TRUE(engine->scannedContents()[0].empty());
}

TEST_F(ScanAgentTest, MidStreamDisconnectScansPartialAndDeletesTempFile) {
    startAgent();

    {
        RawScanConnection conn(agent->getPort());
        ASSERT_TRUE(conn.send("FILENAME:partial.bin"));
        EXPECT_EQ(conn.receive(), "READY");
        ASSERT_TRUE(conn.send("SIZE:1000"));
        EXPECT_EQ(conn.receive(), "READY");
        ASSERT_TRUE(conn.send(std::string(100, 'p')));
        conn.close();
    }

    ASSERT_TRUE(reports.waitFor(1));
    ScanSessionReport report = reports.at(0);
    EXPECT_EQ(report.bytesReceived, 100u);
    EXPECT_EQ(report.declaredSize, 1000u);
    EXPECT_NE(report.result.details.find("received 100 of 1000 bytes"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(report.tempPath));
    EXPECT_EQ(tempFileCount(), 0u);
}

TEST_F(ScanAgentTest, KeywordSplitAcrossWritesIsReassembled) {
    startAgent();

    RawScanConnection conn(agent->getPort());
    ASSERT_TRUE(conn.send("FILE"));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_TRUE(conn.send("NAME:split.txt"));
    EXPECT_EQ(conn.receive(), "READY");
    ASSERT_TRUE(conn.send("SI"));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_TRUE(conn.send("ZE:3"));
    EXPECT_EQ(conn.receive(), "READY");
    ASSERT_TRUE(conn.send("abc"));

    EXPECT_EQ(parseResult(conn.receiveUntilEof()).status, ScanStatus::OK);
    ASSERT_TRUE(reports.waitFor(1));
    EXPECT_EQ(reports.at(0).filename, "split.txt");
    EXPECT_FALSE(reports.at(0).protocolViolation);
}

TEST_F(ScanAgentTest, SameFilenameConcurrentSessionsUseDistinctTempFiles) {
    startAgent();

    RawScanConnection a(agent->getPort());
    RawScanConnection b(agent->getPort());
    for (RawScanConnection* conn : {&a, &b}) {
        ASSERT_TRUE(conn->send("FILENAME:same.txt"));
        EXPECT_EQ(conn->receive(), "READY");
        ASSERT_TRUE(conn->send("SIZE:1"));
        EXPECT_EQ(conn->receive(), "READY");
    }
    ASSERT_TRUE(a.send("A"));
    ASSERT_TRUE(b.send("B"));
    a.receiveUntilEof();
    b.receiveUntilEof();

    ASSERT_TRUE(reports.waitFor(2));
    EXPECT_NE(reports.at(0).tempPath, reports.at(1).tempPath);
}

//=============================================================================
// Protocol violations
//=============================================================================

TEST_F(ScanAgentTest, WrongFirstMessageIsProtocolViolation) {
    startAgent();

    RawScanConnection conn(agent->getPort());
    ASSERT_TRUE(conn.send("HELLO"));

    ScanResult result = parseResult(conn.receiveUntilEof());
    EXPECT_EQ(result.status, ScanStatus::ERROR);
    EXPECT_EQ(result.message, "Protocol violation");

    ASSERT_TRUE(reports.waitFor(1));
    EXPECT_TRUE(reports.at(0).protocolViolation);
    EXPECT_TRUE(engine->scannedPaths().empty());
}

TEST_F(ScanAgentTest, NonNumericSizeIsProtocolViolation) {
    startAgent();

    RawScanConnection conn(agent->getPort());
    ASSERT_TRUE(conn.send("FILENAME:x.txt"));
    EXPECT_EQ(conn.receive(), "READY");
    ASSERT_TRUE(conn.send("SIZE:twelve"));

    ScanResult result = parseResult(conn.receiveUntilEof());
    EXPECT_EQ(result.status, ScanStatus::ERROR);
    EXPECT_NE(result.details.find("expected SIZE"), std::string::npos);
    EXPECT_TRUE(engine->scannedPaths().empty());
}

TEST_F(ScanAgentTest, OversizedDeclarationIsRejected) {
    startAgent(ScanResult::ok("File is clean"), 5, 10);

    RawScanConnection conn(agent->getPort());
    ASSERT_TRUE(conn.send("FILENAME:big.iso"));
    EXPECT_EQ(conn.receive(), "READY");
    ASSERT_TRUE(conn.send("SIZE:11"));

    ScanResult result = parseResult(conn.receiveUntilEof());
    EXPECT_EQ(result.status, ScanStatus::ERROR);
    EXPECT_NE(result.details.find("exceeds limit"), std::string::npos);
    EXPECT_EQ(tempFileCount(), 0u);
}

//=============================================================================
// Session state sequence
//=============================================================================

TEST_F(ScanAgentTest, CleanSessionWalksEveryState) {
    startAgent();

    RawScanConnection conn(agent->getPort());
    ASSERT_TRUE(conn.send("FILENAME:walk.txt"));
    EXPECT_EQ(conn.receive(), "READY");
    ASSERT_TRUE(conn.send("SIZE:4"));
    EXPECT_EQ(conn.receive(), "READY");
    ASSERT_TRUE(conn.send("walk"));
    EXPECT_EQ(parseResult(conn.receiveUntilEof()).status, ScanStatus::OK);

    ASSERT_TRUE(reports.waitFor(1));
    const std::vector<ScanSessionState> expected = {
        ScanSessionState::AWAIT_FILENAME, ScanSessionState::AWAIT_SIZE,
        ScanSessionState::RECEIVE_PAYLOAD, ScanSessionState::SCANNING,
        ScanSessionState::RESPONDED, ScanSessionState::CLOSED};
    EXPECT_EQ(recorder.states(), expected);

    // CLOSED is reported only once the temp file is gone
    const std::string tempPath = reports.at(0).tempPath;
    ASSERT_FALSE(tempPath.empty());
    auto files = recorder.filesAtClose();
    EXPECT_EQ(std::find(files.begin(), files.end(), tempPath), files.end());
    EXPECT_FALSE(std::filesystem::exists(tempPath));
}

TEST_F(ScanAgentTest, ProtocolViolationClosesWithoutResponded) {
    startAgent();

    RawScanConnection conn(agent->getPort());
    ASSERT_TRUE(conn.send("SIZE:10"));
    EXPECT_EQ(parseResult(conn.receiveUntilEof()).message, "Protocol violation");

    ASSERT_TRUE(reports.waitFor(1));
    const std::vector<ScanSessionState> expected = {
        ScanSessionState::AWAIT_FILENAME, ScanSessionState::CLOSED};
    EXPECT_EQ(recorder.states(), expected);
}

TEST_F(ScanAgentTest, MidStreamDisconnectStillScansBeforeClosing) {
    startAgent();

    {
        RawScanConnection conn(agent->getPort());
        ASSERT_TRUE(conn.send("FILENAME:cut.bin"));
        EXPECT_EQ(conn.receive(), "READY");
        ASSERT_TRUE(conn.send("SIZE:500"));
        EXPECT_EQ(conn.receive(), "READY");
        ASSERT_TRUE(conn.send(std::string(20, 'c')));
        conn.close();
    }

    ASSERT_TRUE(reports.waitFor(1));
    auto states = recorder.states();
    ASSERT_GE(states.size(), 5u);
    const std::vector<ScanSessionState> prefix = {
        ScanSessionState::AWAIT_FILENAME, ScanSessionState::AWAIT_SIZE,
        ScanSessionState::RECEIVE_PAYLOAD, ScanSessionState::SCANNING};
    EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), states.begin()));
    EXPECT_EQ(states.back(), ScanSessionState::CLOSED);
    // RESPONDED depends on whether the write to the closed peer went through
    EXPECT_LE(states.size(), 6u);

    const std::string tempPath = reports.at(0).tempPath;
    auto files = recorder.filesAtClose();
    EXPECT_EQ(std::find(files.begin(), files.end(), tempPath), files.end());
}

//=============================================================================
// Lifecycle and admission
//=============================================================================

TEST_F(ScanAgentTest, StartFailsWhenScannerSelfCheckFails) {
    FakeScanEngine broken;
    broken.selfCheckOk = false;

    ScanAgentConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.session.tempDir = tempDir.path() / "scans";

    ScanAgent failing(config, broken);
    std::string errorMsg;
    EXPECT_FALSE(failing.start(errorMsg));
    EXPECT_NE(errorMsg.find("self-check"), std::string::npos);
    EXPECT_FALSE(failing.isRunning());
}

TEST_F(ScanAgentTest, AdmissionGateClosesExcessConnections) {
    startAgent(ScanResult::ok("File is clean"), 1);

    RawScanConnection first(agent->getPort());
    ASSERT_TRUE(first.send("FILENAME:slow.txt"));
    EXPECT_EQ(first.receive(), "READY");
    EXPECT_EQ(agent->getActiveSessionCount(), 1u);

    RawScanConnection second(agent->getPort());
    ASSERT_TRUE(second.isOpen());
    EXPECT_EQ(second.receiveUntilEof(), "");
    EXPECT_GE(agent->getRejectedConnectionCount(), 1u);

    // The admitted session is unaffected
    ASSERT_TRUE(first.send("SIZE:2"));
    EXPECT_EQ(first.receive(), "READY");
    ASSERT_TRUE(first.send("ok"));
    EXPECT_EQ(parseResult(first.receiveUntilEof()).status, ScanStatus::OK);
}

TEST_F(ScanAgentTest, StopUnblocksIdleSessions) {
    startAgent();

    RawScanConnection idle(agent->getPort());
    ASSERT_TRUE(idle.isOpen());
    for (int i = 0; i < 50 && agent->getActiveSessionCount() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_EQ(agent->getActiveSessionCount(), 1u);

    const auto start = std::chrono::steady_clock::now();
    agent->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
    EXPECT_FALSE(agent->isRunning());
    EXPECT_EQ(agent->getActiveSessionCount(), 0u);
}
