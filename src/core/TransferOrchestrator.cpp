/**
 * @file TransferOrchestrator.cpp
 * @brief Upload/download/list workflows
 */

#include "clamftp/TransferOrchestrator.h"
#include "clamftp/Debug.h"
#include "clamftp/HashUtils.h"
#include "clamftp/SocketUtils.h"
#include "clamftp/ThreadSafeLog.h"

#include <filesystem>
#include <fnmatch.h>
#include <fstream>
#include <glob.h>
#include <sstream>

namespace ClamFtp {

namespace {

std::string baseName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool hasWildcard(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

void removePartialFile(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::remove(path, ec)) {
        LOG_INFO("Removed partial file: " << path);
    } else if (ec) {
        LOG_ERROR("Could not remove partial file " << path << ": " << ec.message());
    }
}

}  // namespace

TransferOrchestrator::TransferOrchestrator(ControlSession& control, ScanClient& scanner,
                                           size_t bufferSize, uint32_t dataTimeoutSeconds)
    : m_control(control)
    , m_scanner(scanner)
    , m_bufferSize(bufferSize == 0 ? BUFFER_SIZE_DEFAULT : bufferSize)
    , m_dataTimeoutSeconds(dataTimeoutSeconds)
{
}

//=============================================================================
// Upload
//=============================================================================

TransferResult TransferOrchestrator::upload(const std::string& localPath, const std::string& remotePath)
{
    m_cancel.reset();
    return uploadFile(localPath, remotePath);
}

TransferResult TransferOrchestrator::uploadFile(const std::string& localPath, const std::string& remotePath)
{
    TransferResult result;
    result.localPath = localPath;
    result.remotePath = remotePath.empty() ? std::filesystem::path(localPath).filename().string() : remotePath;

    if (!requireSession(result.error)) {
        return result;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(localPath, ec)) {
        result.error = FtpError(FtpErrorKind::FILE_NOT_FOUND, "Local file not found: " + localPath);
        return result;
    }
    const uint64_t totalBytes = static_cast<uint64_t>(std::filesystem::file_size(localPath, ec));

    //-------------------------------------------------------------------------
    // Scan gate: nothing reaches the server before a verdict
    //-------------------------------------------------------------------------
    LOG_INFO("Scanning " << localPath << " before upload");
    result.scan = m_scanner.scanFile(localPath);
    result.scanned = true;

    switch (result.scan.status) {
        case ScanStatus::INFECTED:
            result.error = FtpError(FtpErrorKind::SCAN_BLOCKED,
                                    result.scan.message + " in " + localPath +
                                    (result.scan.details.empty() ? "" : ": " + result.scan.details));
            LOG_WARNING("Upload blocked: " << result.error.message);
            ThreadSafeLog::log("Upload of " + localPath + " BLOCKED: " + result.scan.message);
            return result;

        case ScanStatus::ERROR:
            if (!m_scanErrorConfirmation || !m_scanErrorConfirmation(localPath, result.scan)) {
                result.error = FtpError(FtpErrorKind::SCAN_UNAVAILABLE,
                                        "No clean scan for " + localPath + ": " + result.scan.message +
                                        (result.scan.details.empty() ? "" : " (" + result.scan.details + ")"));
                LOG_WARNING("Upload aborted: " << result.error.message);
                return result;
            }
            LOG_WARNING("Uploading " << localPath << " WITHOUT a clean scan (operator confirmed)");
            ThreadSafeLog::log("Upload of " + localPath + " confirmed without clean scan: " + result.scan.message);
            break;

        case ScanStatus::OK:
            break;
    }

    std::ifstream file(localPath, std::ios::binary);
    if (!file) {
        result.error = FtpError(FtpErrorKind::LOCAL_IO, "Cannot open " + localPath);
        return result;
    }

    //-------------------------------------------------------------------------
    // Data channel + STOR
    //-------------------------------------------------------------------------
    DataChannel channel(m_control, m_dataTimeoutSeconds);
    FtpReply preliminary;
    if (!openDataChannel(channel, result.error) ||
        !startTransfer(channel, "STOR " + result.remotePath, preliminary, result.error)) {
        return result;
    }

    HashUtils::IncrementalHash digest;
    std::vector<uint8_t> buffer(m_bufferSize);
    std::string errorMsg;

    while (file) {
        if (m_cancel.isCancelled()) {
            channel.close();
            drainCompletionReply();
            result.error = FtpError(FtpErrorKind::CANCELLED, "Upload cancelled after " +
                                    std::to_string(result.bytesTransferred) + " bytes");
            return result;
        }

        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize bytesRead = file.gcount();
        if (bytesRead <= 0) {
            break;
        }

        if (!sendExact(channel.transferSocket(), buffer.data(), static_cast<size_t>(bytesRead), errorMsg)) {
            channel.close();
            drainCompletionReply();
            result.error = FtpError(FtpErrorKind::PARTIAL_TRANSFER,
                                    "Upload interrupted after " + std::to_string(result.bytesTransferred) +
                                    " bytes: " + errorMsg);
            LOG_ERROR(result.error.message);
            return result;
        }

        if (!digest.update(buffer.data(), static_cast<size_t>(bytesRead))) {
            channel.close();
            drainCompletionReply();
            result.error = FtpError(FtpErrorKind::LOCAL_IO, "SHA-256 computation failed for " + localPath);
            return result;
        }
        result.bytesTransferred += static_cast<uint64_t>(bytesRead);
        if (m_progress) {
            m_progress(result.bytesTransferred, totalBytes);
        }
    }

    if (file.bad()) {
        channel.close();
        drainCompletionReply();
        result.error = FtpError(FtpErrorKind::LOCAL_IO, "Error reading " + localPath);
        return result;
    }

    // Closing the data socket marks end-of-file for STOR
    channel.close();
    if (!finishTransfer("STOR", result.error)) {
        if (result.error.kind == FtpErrorKind::REJECTED) {
            result.error.kind = FtpErrorKind::PARTIAL_TRANSFER;
        }
        return result;
    }

    result.sha256 = digest.finalizeHex();
    result.success = true;

    LOG_INFO("Uploaded " << localPath << " -> " << result.remotePath << " ("
             << result.bytesTransferred << " bytes, sha256 " << result.sha256 << ")");
    ThreadSafeLog::log("Uploaded " + localPath + " -> " + result.remotePath + " (" +
                       std::to_string(result.bytesTransferred) + " bytes, sha256=" + result.sha256 + ")");

    const std::string& scannedDigest = m_scanner.lastPayloadDigest();
    if (result.scan.isClean() && !scannedDigest.empty() && scannedDigest != result.sha256) {
        LOG_WARNING(localPath << " changed between scan and upload (scanned sha256 "
                    << scannedDigest << ")");
        ThreadSafeLog::log("WARNING: " + localPath + " changed between scan and upload");
    }
    return result;
}

//=============================================================================
// Download
//=============================================================================

TransferResult TransferOrchestrator::download(const std::string& remotePath, const std::string& localPath)
{
    m_cancel.reset();
    return downloadFile(remotePath, localPath);
}

TransferResult TransferOrchestrator::downloadFile(const std::string& remotePath, const std::string& localPath)
{
    TransferResult result;
    result.remotePath = remotePath;
    result.localPath = localPath.empty() ? baseName(remotePath) : localPath;

    if (!requireSession(result.error)) {
        return result;
    }

    DataChannel channel(m_control, m_dataTimeoutSeconds);
    FtpReply preliminary;
    if (!openDataChannel(channel, result.error) ||
        !startTransfer(channel, "RETR " + remotePath, preliminary, result.error)) {
        return result;
    }

    const uint64_t totalBytes = parseAnnouncedSize(preliminary.message());

    // Created only after the server agreed to send
    std::ofstream out(result.localPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        channel.close();
        drainCompletionReply();
        result.error = FtpError(FtpErrorKind::LOCAL_IO, "Cannot create " + result.localPath);
        return result;
    }

    std::vector<uint8_t> buffer(m_bufferSize);
    std::string errorMsg;
    FtpError failure;

    for (;;) {
        if (m_cancel.isCancelled()) {
            failure = FtpError(FtpErrorKind::CANCELLED, "Download cancelled after " +
                               std::to_string(result.bytesTransferred) + " bytes");
            break;
        }

        ssize_t received = recvSome(channel.transferSocket(), buffer.data(), buffer.size(), errorMsg);
        if (received == 0) {
            break;  // Server closed the data connection: end of file
        }
        if (received < 0) {
            failure = FtpError(FtpErrorKind::PARTIAL_TRANSFER, "Download interrupted after " +
                               std::to_string(result.bytesTransferred) + " bytes: " + errorMsg);
            break;
        }

        out.write(reinterpret_cast<const char*>(buffer.data()), received);
        if (!out) {
            failure = FtpError(FtpErrorKind::LOCAL_IO, "Write to " + result.localPath + " failed");
            break;
        }

        result.bytesTransferred += static_cast<uint64_t>(received);
        if (m_progress) {
            m_progress(result.bytesTransferred, totalBytes);
        }
    }

    channel.close();
    out.close();

    if (failure.isError()) {
        drainCompletionReply();
        removePartialFile(result.localPath);
        result.error = failure;
        LOG_ERROR(result.error.message);
        return result;
    }

    if (!finishTransfer("RETR", result.error)) {
        removePartialFile(result.localPath);
        if (result.error.kind == FtpErrorKind::REJECTED) {
            result.error.kind = FtpErrorKind::PARTIAL_TRANSFER;
        }
        return result;
    }

    result.success = true;
    LOG_INFO("Downloaded " << remotePath << " -> " << result.localPath << " ("
             << result.bytesTransferred << " bytes)");
    ThreadSafeLog::log("Downloaded " + remotePath + " -> " + result.localPath + " (" +
                       std::to_string(result.bytesTransferred) + " bytes)");
    return result;
}

//=============================================================================
// Listing
//=============================================================================

TransferResult TransferOrchestrator::list(const std::string& path, std::string& listing, bool namesOnly)
{
    TransferResult result;
    result.remotePath = path;
    listing.clear();

    if (!requireSession(result.error)) {
        return result;
    }

    std::string command = namesOnly ? "NLST" : "LIST";
    if (!path.empty()) {
        command += " " + path;
    }

    DataChannel channel(m_control, m_dataTimeoutSeconds);
    FtpReply preliminary;
    if (!openDataChannel(channel, result.error) ||
        !startTransfer(channel, command, preliminary, result.error)) {
        return result;
    }

    std::vector<uint8_t> buffer(m_bufferSize);
    std::string errorMsg;
    for (;;) {
        ssize_t received = recvSome(channel.transferSocket(), buffer.data(), buffer.size(), errorMsg);
        if (received == 0) {
            break;
        }
        if (received < 0) {
            channel.close();
            drainCompletionReply();
            result.error = FtpError(FtpErrorKind::PARTIAL_TRANSFER, "Listing interrupted: " + errorMsg);
            return result;
        }
        listing.append(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(received));
        result.bytesTransferred += static_cast<uint64_t>(received);
    }

    channel.close();
    if (!finishTransfer(namesOnly ? "NLST" : "LIST", result.error)) {
        return result;
    }

    result.success = true;
    return result;
}

//=============================================================================
// Batch
//=============================================================================

BatchResult TransferOrchestrator::uploadBatch(const std::vector<std::string>& localPaths)
{
    BatchResult results;
    results.reserve(localPaths.size());
    m_cancel.reset();

    for (const auto& localPath : localPaths) {
        if (m_cancel.isCancelled()) {
            break;
        }
        if (m_fileConfirmation && !m_fileConfirmation(localPath)) {
            TransferResult skipped;
            skipped.skipped = true;
            skipped.localPath = localPath;
            results.push_back(skipped);
            continue;
        }
        results.push_back(uploadFile(localPath, ""));
    }
    return results;
}

BatchResult TransferOrchestrator::downloadBatch(const std::vector<std::string>& remotePaths)
{
    BatchResult results;
    results.reserve(remotePaths.size());
    m_cancel.reset();

    for (const auto& remotePath : remotePaths) {
        if (m_cancel.isCancelled()) {
            break;
        }
        if (m_fileConfirmation && !m_fileConfirmation(remotePath)) {
            TransferResult skipped;
            skipped.skipped = true;
            skipped.remotePath = remotePath;
            results.push_back(skipped);
            continue;
        }
        results.push_back(downloadFile(remotePath, ""));
    }
    return results;
}

std::vector<std::string> TransferOrchestrator::expandLocalPattern(const std::string& pattern)
{
    std::vector<std::string> files;

    glob_t matches{};
    int rc = ::glob(pattern.c_str(), 0, nullptr, &matches);
    if (rc == 0) {
        for (size_t i = 0; i < matches.gl_pathc; ++i) {
            std::error_code ec;
            if (std::filesystem::is_regular_file(matches.gl_pathv[i], ec)) {
                files.emplace_back(matches.gl_pathv[i]);
            }
        }
    } else if (rc != GLOB_NOMATCH) {
        LOG_WARNING("glob(" << pattern << ") failed with code " << rc);
    }
    globfree(&matches);

    return files;
}

bool TransferOrchestrator::expandRemotePattern(const std::string& pattern, std::vector<std::string>& names,
                                               FtpError& error)
{
    names.clear();
    if (!hasWildcard(pattern)) {
        names.push_back(pattern);
        return true;
    }

    std::string listing;
    TransferResult listed = list("", listing, true);
    if (!listed.success) {
        error = listed.error;
        return false;
    }

    names = matchNames(listing, pattern);
    return true;
}

std::vector<std::string> TransferOrchestrator::matchNames(const std::string& listing, const std::string& pattern)
{
    std::vector<std::string> names;
    std::istringstream lines(listing);
    std::string line;

    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        if (::fnmatch(pattern.c_str(), line.c_str(), 0) == 0 ||
            ::fnmatch(pattern.c_str(), baseName(line).c_str(), 0) == 0) {
            names.push_back(line);
        }
    }
    return names;
}

//=============================================================================
// Helpers
//=============================================================================

bool TransferOrchestrator::requireSession(FtpError& error) const
{
    if (!m_control.isConnected()) {
        error = FtpError(FtpErrorKind::NOT_CONNECTED, "Not connected to server");
        return false;
    }
    if (!m_control.isAuthenticated()) {
        error = FtpError(FtpErrorKind::NOT_CONNECTED, "Not logged in");
        return false;
    }
    return true;
}

bool TransferOrchestrator::openDataChannel(DataChannel& channel, FtpError& error)
{
    FtpReply reply;
    std::string errorMsg;
    if (channel.open(reply, errorMsg)) {
        return true;
    }

    if (m_control.lastErrorKind() != FtpErrorKind::NONE) {
        error = controlError(channel.isPassive() ? "PASV" : "PORT", errorMsg);
    } else if (!reply.isPositive()) {
        error = replyError(channel.isPassive() ? "PASV" : "PORT", reply);
    } else {
        HostPort unused;
        const bool parseFailed = channel.isPassive() && !DataChannel::parsePassiveReply(reply.message(), unused);
        error = FtpError(parseFailed ? FtpErrorKind::PROTOCOL : FtpErrorKind::TRANSPORT, errorMsg);
    }
    LOG_ERROR("Data channel: " << error.message);
    return false;
}

bool TransferOrchestrator::startTransfer(DataChannel& channel, const std::string& command,
                                         FtpReply& preliminary, FtpError& error)
{
    std::string errorMsg;
    const std::string verb = command.substr(0, command.find(' '));

    if (!m_control.execute(command, preliminary, errorMsg)) {
        channel.close();
        error = controlError(verb, errorMsg);
        return false;
    }

    if (!preliminary.isPreliminary()) {
        channel.close();
        error = replyError(verb, preliminary);
        LOG_ERROR(error.message);
        return false;
    }

    if (!channel.acceptTransferSocket(errorMsg)) {
        channel.close();
        drainCompletionReply();
        error = FtpError(FtpErrorKind::TRANSPORT, errorMsg);
        LOG_ERROR(error.message);
        return false;
    }
    return true;
}

bool TransferOrchestrator::finishTransfer(const std::string& what, FtpError& error)
{
    FtpReply completion;
    std::string errorMsg;
    if (!m_control.readReply(completion, errorMsg)) {
        error = controlError(what + " completion", errorMsg);
        LOG_ERROR(error.message);
        return false;
    }
    if (!completion.isPositive()) {
        error = replyError(what, completion);
        LOG_ERROR(error.message);
        return false;
    }
    return true;
}

void TransferOrchestrator::drainCompletionReply()
{
    FtpReply reply;
    std::string errorMsg;
    if (m_control.readReply(reply, errorMsg)) {
        LOG_DEBUG("After aborted transfer: " << reply.toString());
    } else {
        LOG_WARNING("No reply after aborted transfer: " << errorMsg);
    }
}

FtpError TransferOrchestrator::controlError(const std::string& context, const std::string& errorMsg) const
{
    FtpErrorKind kind = m_control.lastErrorKind();
    if (kind == FtpErrorKind::NONE) {
        kind = FtpErrorKind::TRANSPORT;
    }
    return FtpError(kind, context + ": " + errorMsg);
}

FtpError TransferOrchestrator::replyError(const std::string& context, const FtpReply& reply)
{
    if (reply.isMalformed()) {
        return FtpError(FtpErrorKind::PROTOCOL, context + ": malformed reply '" + reply.raw() + "'");
    }
    return FtpError(FtpErrorKind::REJECTED, context + " failed: " + reply.toString());
}

uint64_t TransferOrchestrator::parseAnnouncedSize(const std::string& message)
{
    // e.g. "Opening BINARY mode data connection for a.bin (12345 bytes)"
    size_t bytesPos = message.rfind(" bytes)");
    if (bytesPos == std::string::npos) {
        return 0;
    }
    size_t open = message.rfind('(', bytesPos);
    if (open == std::string::npos) {
        return 0;
    }

    uint64_t value = 0;
    for (size_t i = open + 1; i < bytesPos; ++i) {
        if (message[i] < '0' || message[i] > '9') {
            return 0;
        }
        value = value * 10 + static_cast<uint64_t>(message[i] - '0');
    }
    return value;
}

}  // namespace ClamFtp
