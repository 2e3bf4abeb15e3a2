/**
 * @file ScanProtocol.h
 * @brief Scan gateway wire format and the ScanResult value
 *
 * One TCP connection per scan request:
 *
 *   client: FILENAME:<name>      agent: READY
 *   client: SIZE:<n>             agent: READY
 *   client: <exactly n raw bytes>
 *   agent:  {"status":"OK|INFECTED|ERROR","message":"...","details":"..."}
 *   agent closes the connection
 *
 * Control messages carry no terminator. Receivers strip a trailing CR/LF
 * so line-oriented peers interoperate.
 */

#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace ClamFtp {

/**
 * @brief Scan verdict
 */
enum class ScanStatus : uint8_t {
    OK,         ///< Scanner ran and found nothing
    INFECTED,   ///< Scanner reported a signature match
    ERROR       ///< No verdict (scanner failure, timeout, protocol or transport error)
};

/**
 * @brief Wire string for a status ("OK", "INFECTED", "ERROR")
 */
const char* scanStatusToString(ScanStatus status);

/**
 * @brief Parse a wire status string (exact, case-sensitive)
 */
bool scanStatusFromString(const std::string& text, ScanStatus& status);

/**
 * @brief Outcome of one scan request
 *
 * Built once through the factory functions and not modified afterwards.
 * A default-constructed result is ERROR so that a missing verdict can never
 * be mistaken for a clean one.
 */
struct ScanResult {
    ScanStatus status = ScanStatus::ERROR;
    std::string message;
    std::string details;

    static ScanResult ok(const std::string& message, const std::string& details = "");
    static ScanResult infected(const std::string& message, const std::string& details = "");
    static ScanResult error(const std::string& message, const std::string& details = "");

    bool isClean() const { return status == ScanStatus::OK; }
    bool isInfected() const { return status == ScanStatus::INFECTED; }

    nlohmann::json toJson() const;

    /**
     * @brief Strict conversion: "status" must be a known string, "message"
     *        and "details" must be strings when present
     */
    static bool fromJson(const nlohmann::json& j, ScanResult& result, std::string& errorMsg);

    /**
     * @brief Serialized JSON object as sent on the wire
     */
    std::string serialize() const;

    /**
     * @brief Parse wire text into a result
     * @return false on invalid JSON or schema mismatch
     */
    static bool parse(const std::string& text, ScanResult& result, std::string& errorMsg);
};

/**
 * @namespace ScanProtocol
 * @brief Builders and parsers for the handshake messages
 */
namespace ScanProtocol {

std::string buildFilenameMessage(const std::string& filename);
std::string buildSizeMessage(uint64_t sizeBytes);

/**
 * @brief Remove any trailing CR/LF characters
 */
std::string stripLineEnding(const std::string& message);

/**
 * @brief Parse "FILENAME:<name>"
 * @return false if the prefix is missing or the name is empty
 */
bool parseFilenameMessage(const std::string& message, std::string& filename);

/**
 * @brief Parse "SIZE:<decimal>"
 * @return false if the prefix is missing, the count is not plain decimal
 *         digits, or it overflows 64 bits
 */
bool parseSizeMessage(const std::string& message, uint64_t& sizeBytes);

/**
 * @brief True if @p message (after stripping CR/LF) is exactly READY
 */
bool isReadyMessage(const std::string& message);

}  // namespace ScanProtocol

}  // namespace ClamFtp
