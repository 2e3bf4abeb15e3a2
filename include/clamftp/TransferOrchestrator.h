/**
 * @file TransferOrchestrator.h
 * @brief Upload/download/list workflows over a control session
 */

#pragma once

#include "ControlSession.h"
#include "DataChannel.h"
#include "FtpError.h"
#include "ScanClient.h"
#include "ScanProtocol.h"
#include "config.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ClamFtp {

//=============================================================================
// Result and Callback Types
//=============================================================================

/**
 * @brief Outcome of one file operation
 */
struct TransferResult {
    bool success = false;
    bool skipped = false;          ///< Batch item declined by the file confirmation
    FtpError error;
    uint64_t bytesTransferred = 0;
    bool scanned = false;          ///< scan holds a verdict for this upload
    ScanResult scan;
    std::string localPath;
    std::string remotePath;
    std::string sha256;            ///< Digest of the uploaded bytes (uploads only)
};

/**
 * @brief Per-file outcomes of a batch, in request order
 */
using BatchResult = std::vector<TransferResult>;

/**
 * @brief Progress callback: bytes so far and total (0 if unknown)
 */
using ProgressCallback = std::function<void(uint64_t bytesTransferred, uint64_t totalBytes)>;

/**
 * @brief Asked when the scan gateway could not produce a verdict
 * @return true to upload anyway
 */
using ScanErrorConfirmation = std::function<bool(const std::string& localPath,
                                                 const ScanResult& result)>;

/**
 * @brief Asked per file in batch operations (interactive prompt mode)
 * @return false to skip the file
 */
using FileConfirmation = std::function<bool(const std::string& path)>;

/**
 * @brief Cooperative cancellation flag, checked between chunks
 *
 * Cleared when a top-level upload, download or batch starts, so cancel()
 * only affects the operation in progress.
 */
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    void reset() { m_cancelled.store(false); }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

//=============================================================================
// TransferOrchestrator Class
//=============================================================================

/**
 * @class TransferOrchestrator
 * @brief Composes ControlSession, DataChannel and ScanClient
 *
 * Upload is gated on the scan verdict: an INFECTED file never causes a
 * data channel to be opened or STOR to be sent. A scan ERROR aborts unless
 * the ScanErrorConfirmation callback explicitly allows the upload.
 *
 * Every operation is synchronous and returns a TransferResult; nothing is
 * retried automatically.
 */
class TransferOrchestrator {
public:
    /**
     * @param control Authenticated control session
     * @param scanner Scan gateway client used for every upload
     * @param bufferSize Data channel chunk size
     * @param dataTimeoutSeconds Data socket connect/accept/read timeout
     */
    TransferOrchestrator(ControlSession& control, ScanClient& scanner,
                         size_t bufferSize = BUFFER_SIZE_DEFAULT,
                         uint32_t dataTimeoutSeconds = DATA_TIMEOUT_SECONDS_DEFAULT);

    TransferOrchestrator(const TransferOrchestrator&) = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

    //=========================================================================
    // Single-file workflows
    //=========================================================================

    /**
     * @brief Scan, then STOR a local file
     * @param remotePath Remote name (default: local basename)
     */
    TransferResult upload(const std::string& localPath, const std::string& remotePath = "");

    /**
     * @brief RETR a remote file; a partial local file is removed on failure
     * @param localPath Local name (default: remote basename)
     */
    TransferResult download(const std::string& remotePath, const std::string& localPath = "");

    /**
     * @brief LIST (or NLST when namesOnly) into @p listing
     */
    TransferResult list(const std::string& path, std::string& listing, bool namesOnly = false);

    //=========================================================================
    // Batch workflows (independent per file, no rollback)
    //=========================================================================

    BatchResult uploadBatch(const std::vector<std::string>& localPaths);
    BatchResult downloadBatch(const std::vector<std::string>& remotePaths);

    /**
     * @brief Expand a local glob(3) pattern to regular files
     */
    static std::vector<std::string> expandLocalPattern(const std::string& pattern);

    /**
     * @brief Expand a remote wildcard against an NLST listing
     *
     * A pattern without wildcard characters is returned unchanged.
     */
    bool expandRemotePattern(const std::string& pattern, std::vector<std::string>& names,
                             FtpError& error);

    /**
     * @brief Names from an NLST listing that match an fnmatch(3) pattern
     *
     * A name matches if either the full entry or its final path component
     * matches.
     */
    static std::vector<std::string> matchNames(const std::string& listing, const std::string& pattern);

    //=========================================================================
    // Configuration
    //=========================================================================

    void setProgressCallback(ProgressCallback callback) { m_progress = std::move(callback); }
    void setScanErrorConfirmation(ScanErrorConfirmation callback) { m_scanErrorConfirmation = std::move(callback); }
    void setFileConfirmation(FileConfirmation callback) { m_fileConfirmation = std::move(callback); }
    void setBufferSize(size_t bufferSize) { m_bufferSize = bufferSize == 0 ? BUFFER_SIZE_DEFAULT : bufferSize; }

    CancellationToken& cancellationToken() { return m_cancel; }

private:
    /**
     * @brief Negotiate the data channel
     */
    bool openDataChannel(DataChannel& channel, FtpError& error);

    /**
     * @brief Send the transfer command, require 1xx, accept (active mode)
     * @param preliminary Output: the 1xx reply
     */
    bool startTransfer(DataChannel& channel, const std::string& command,
                       FtpReply& preliminary, FtpError& error);

    /**
     * @brief Read the completion reply and require 2xx
     */
    bool finishTransfer(const std::string& what, FtpError& error);

    /**
     * @brief Consume the reply the server sends after an aborted transfer
     */
    void drainCompletionReply();

    bool requireSession(FtpError& error) const;

    // Single transfers without touching the cancellation token
    TransferResult uploadFile(const std::string& localPath, const std::string& remotePath);
    TransferResult downloadFile(const std::string& remotePath, const std::string& localPath);

    FtpError controlError(const std::string& context, const std::string& errorMsg) const;
    static FtpError replyError(const std::string& context, const FtpReply& reply);

    /**
     * @brief "(12345 bytes)" from a 150 reply, or 0
     */
    static uint64_t parseAnnouncedSize(const std::string& message);

    ControlSession& m_control;
    ScanClient& m_scanner;
    size_t m_bufferSize;
    uint32_t m_dataTimeoutSeconds;

    ProgressCallback m_progress;
    ScanErrorConfirmation m_scanErrorConfirmation;
    FileConfirmation m_fileConfirmation;
    CancellationToken m_cancel;
};

}  // namespace ClamFtp
