/**
 * @file ErrorCodes.h
 * @brief Stable, user-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

namespace ClamFtp {
namespace ErrorCodes {

// Transport (connect/read/write failures on any socket)
inline constexpr const char* TRANSPORT_ERROR = "CFTP-NET-1000";
inline constexpr const char* NOT_CONNECTED = "CFTP-NET-1001";

// FTP / scan gateway protocol violations
inline constexpr const char* PROTOCOL_VIOLATION = "CFTP-PROTO-1100";
inline constexpr const char* REPLY_REJECTED = "CFTP-PROTO-1101";

// Authentication
inline constexpr const char* AUTHENTICATION_FAILED = "CFTP-AUTH-1200";

// Local filesystem
inline constexpr const char* FILE_NOT_FOUND = "CFTP-FILE-1300";
inline constexpr const char* LOCAL_IO_ERROR = "CFTP-FILE-1301";

// Scan gateway verdicts that stop an upload
inline constexpr const char* SCAN_BLOCKED = "CFTP-SCAN-1400";
inline constexpr const char* SCAN_UNAVAILABLE = "CFTP-SCAN-1401";

// Transfers
inline constexpr const char* PARTIAL_TRANSFER = "CFTP-XFER-1500";
inline constexpr const char* TRANSFER_CANCELLED = "CFTP-XFER-1501";

}  // namespace ErrorCodes
}  // namespace ClamFtp
