/**
 * @file FtpError.h
 * @brief Error taxonomy shared by the client workflows
 */

#pragma once

#include "ErrorCodes.h"
#include <cstdint>
#include <string>

namespace ClamFtp {

/**
 * @brief Category of a failed operation
 *
 * Every failure is scoped to the operation that produced it; none of these
 * is fatal to the process.
 */
enum class FtpErrorKind : uint8_t {
    NONE,              ///< No error
    TRANSPORT,         ///< Connect/read/write failure; never retried automatically
    PROTOCOL,          ///< Malformed or unexpected reply / handshake message
    AUTHENTICATION,    ///< Non-positive reply to the credential exchange
    NOT_CONNECTED,     ///< Operation requires a connected/authenticated session
    FILE_NOT_FOUND,    ///< Local source file missing
    LOCAL_IO,          ///< Local file could not be created/read/written
    SCAN_BLOCKED,      ///< Scan verdict INFECTED; upload aborted
    SCAN_UNAVAILABLE,  ///< Scan verdict ERROR and the operator did not confirm
    PARTIAL_TRANSFER,  ///< Data channel closed or failed mid-stream
    REJECTED,          ///< Server answered a well-formed negative reply
    CANCELLED          ///< Cancelled through the CancellationToken
};

/**
 * @brief Convert FtpErrorKind to string
 */
inline const char* errorKindToString(FtpErrorKind kind) {
    switch (kind) {
        case FtpErrorKind::NONE:             return "None";
        case FtpErrorKind::TRANSPORT:        return "TransportError";
        case FtpErrorKind::PROTOCOL:         return "ProtocolViolation";
        case FtpErrorKind::AUTHENTICATION:   return "AuthenticationFailure";
        case FtpErrorKind::NOT_CONNECTED:    return "NotConnected";
        case FtpErrorKind::FILE_NOT_FOUND:   return "FileNotFound";
        case FtpErrorKind::LOCAL_IO:         return "LocalIoError";
        case FtpErrorKind::SCAN_BLOCKED:     return "ScanBlocked";
        case FtpErrorKind::SCAN_UNAVAILABLE: return "ScanUnavailable";
        case FtpErrorKind::PARTIAL_TRANSFER: return "PartialTransfer";
        case FtpErrorKind::REJECTED:         return "Rejected";
        case FtpErrorKind::CANCELLED:        return "Cancelled";
        default:                             return "Unknown";
    }
}

/**
 * @brief Stable error code for a kind (see ErrorCodes.h)
 */
inline const char* errorKindToCode(FtpErrorKind kind) {
    switch (kind) {
        case FtpErrorKind::TRANSPORT:        return ErrorCodes::TRANSPORT_ERROR;
        case FtpErrorKind::PROTOCOL:         return ErrorCodes::PROTOCOL_VIOLATION;
        case FtpErrorKind::AUTHENTICATION:   return ErrorCodes::AUTHENTICATION_FAILED;
        case FtpErrorKind::NOT_CONNECTED:    return ErrorCodes::NOT_CONNECTED;
        case FtpErrorKind::FILE_NOT_FOUND:   return ErrorCodes::FILE_NOT_FOUND;
        case FtpErrorKind::LOCAL_IO:         return ErrorCodes::LOCAL_IO_ERROR;
        case FtpErrorKind::SCAN_BLOCKED:     return ErrorCodes::SCAN_BLOCKED;
        case FtpErrorKind::SCAN_UNAVAILABLE: return ErrorCodes::SCAN_UNAVAILABLE;
        case FtpErrorKind::PARTIAL_TRANSFER: return ErrorCodes::PARTIAL_TRANSFER;
        case FtpErrorKind::REJECTED:         return ErrorCodes::REPLY_REJECTED;
        case FtpErrorKind::CANCELLED:        return ErrorCodes::TRANSFER_CANCELLED;
        default:                             return "";
    }
}

/**
 * @brief Error value carried by workflow results
 */
struct FtpError {
    FtpErrorKind kind = FtpErrorKind::NONE;
    std::string message;

    FtpError() = default;
    FtpError(FtpErrorKind k, const std::string& msg) : kind(k), message(msg) {}

    bool isError() const { return kind != FtpErrorKind::NONE; }

    /**
     * @brief "[CFTP-SCAN-1400] ScanBlocked: Virus detected" style text
     */
    std::string toString() const {
        if (!isError()) {
            return "OK";
        }
        return std::string("[") + errorKindToCode(kind) + "] " +
               errorKindToString(kind) + ": " + message;
    }
};

}  // namespace ClamFtp
