/**
 * @file clamftp_client.cpp
 * @brief Interactive FTP client with ClamAV-gated uploads
 *
 * Usage:
 *   clamftp_client [--config FILE] [--host HOST] [--port PORT]
 *                  [--user NAME] [--password PASSWORD]
 */

#include "clamftp/CommandShell.h"
#include "clamftp/ControlSession.h"
#include "clamftp/ScanClient.h"
#include "clamftp/Settings.h"
#include "clamftp/ThreadSafeLog.h"
#include "clamftp/TransferOrchestrator.h"

#include <csignal>
#include <iostream>

using namespace ClamFtp;

int main(int argc, char* argv[]) {
    ClientArgs args;
    ClientSettings settings;
    try {
        args = ClientArgs::parseOrThrow(argc, argv);
        if (args.showHelp) {
            std::cout << ClientArgs::usage();
            return 0;
        }
        settings = ClientSettings::loadOrThrow(args.configPath);
        args.applyTo(settings);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n" << ClientArgs::usage();
        return 2;
    }

    ThreadSafeLog::initialize(settings.logFile);
    std::signal(SIGPIPE, SIG_IGN);

    ControlSession control(CONTROL_TIMEOUT_SECONDS, settings.authTlsShim);
    control.setPassiveMode(settings.passiveMode);

    ScanClient scanner(settings.scanAgent.host, settings.scanAgent.port,
                       settings.timeoutSeconds, settings.bufferSize);
    TransferOrchestrator transfers(control, scanner, settings.bufferSize, settings.timeoutSeconds);

    CommandShell shell(control, transfers, settings, std::cin, std::cout);

    if (!settings.ftpServer.host.empty()) {
        shell.openSession(settings.ftpServer.host, settings.ftpServer.port,
                          settings.ftpServer.username, settings.ftpServer.password);
    }

    shell.run();
    ThreadSafeLog::log("Client exited");
    return 0;
}
