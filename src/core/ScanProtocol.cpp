/**
 * @file ScanProtocol.cpp
 * @brief Scan gateway wire format implementation
 */

#include "clamftp/ScanProtocol.h"
#include "clamftp/config.h"

#include <cstring>
#include <limits>

namespace ClamFtp {

const char* scanStatusToString(ScanStatus status) {
    switch (status) {
        case ScanStatus::OK:       return SCAN_STATUS_OK;
        case ScanStatus::INFECTED: return SCAN_STATUS_INFECTED;
        case ScanStatus::ERROR:    return SCAN_STATUS_ERROR;
        default:                   return SCAN_STATUS_ERROR;
    }
}

bool scanStatusFromString(const std::string& text, ScanStatus& status) {
    if (text == SCAN_STATUS_OK) {
        status = ScanStatus::OK;
    } else if (text == SCAN_STATUS_INFECTED) {
        status = ScanStatus::INFECTED;
    } else if (text == SCAN_STATUS_ERROR) {
        status = ScanStatus::ERROR;
    } else {
        return false;
    }
    return true;
}

//=============================================================================
// ScanResult
//=============================================================================

ScanResult ScanResult::ok(const std::string& message, const std::string& details) {
    ScanResult result;
    result.status = ScanStatus::OK;
    result.message = message;
    result.details = details;
    return result;
}

ScanResult ScanResult::infected(const std::string& message, const std::string& details) {
    ScanResult result;
    result.status = ScanStatus::INFECTED;
    result.message = message;
    result.details = details;
    return result;
}

ScanResult ScanResult::error(const std::string& message, const std::string& details) {
    ScanResult result;
    result.status = ScanStatus::ERROR;
    result.message = message;
    result.details = details;
    return result;
}

nlohmann::json ScanResult::toJson() const {
    nlohmann::json out = nlohmann::json::object();
    out["status"] = scanStatusToString(status);
    out["message"] = message;
    out["details"] = details;
    return out;
}

bool ScanResult::fromJson(const nlohmann::json& j, ScanResult& result, std::string& errorMsg) {
    if (!j.is_object()) {
        errorMsg = "Scan result is not a JSON object";
        return false;
    }

    if (!j.contains("status") || !j["status"].is_string()) {
        errorMsg = "Scan result has no status";
        return false;
    }

    ScanResult parsed;
    const std::string statusText = j["status"].get<std::string>();
    if (!scanStatusFromString(statusText, parsed.status)) {
        errorMsg = "Unknown scan status: " + statusText;
        return false;
    }

    if (j.contains("message")) {
        if (!j["message"].is_string()) {
            errorMsg = "Scan result message is not a string";
            return false;
        }
        parsed.message = j["message"].get<std::string>();
    }
    if (j.contains("details")) {
        if (!j["details"].is_string()) {
            errorMsg = "Scan result details is not a string";
            return false;
        }
        parsed.details = j["details"].get<std::string>();
    }

    result = std::move(parsed);
    return true;
}

std::string ScanResult::serialize() const {
    // Scanner output is not guaranteed to be UTF-8
    return toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool ScanResult::parse(const std::string& text, ScanResult& result, std::string& errorMsg) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        errorMsg = "Scan result is not valid JSON";
        return false;
    }
    return fromJson(j, result, errorMsg);
}

//=============================================================================
// Handshake messages
//=============================================================================

namespace ScanProtocol {

std::string buildFilenameMessage(const std::string& filename) {
    return std::string(SCAN_FILENAME_PREFIX) + filename;
}

std::string buildSizeMessage(uint64_t sizeBytes) {
    return std::string(SCAN_SIZE_PREFIX) + std::to_string(sizeBytes);
}

std::string stripLineEnding(const std::string& message) {
    std::string result = message;
    while (!result.empty() && (result.back() == '\r' || result.back() == '\n')) {
        result.pop_back();
    }
    return result;
}

bool parseFilenameMessage(const std::string& message, std::string& filename) {
    const std::string text = stripLineEnding(message);
    const size_t prefixLen = std::strlen(SCAN_FILENAME_PREFIX);
    if (text.compare(0, prefixLen, SCAN_FILENAME_PREFIX) != 0 || text.size() == prefixLen) {
        return false;
    }
    filename = text.substr(prefixLen);
    return true;
}

bool parseSizeMessage(const std::string& message, uint64_t& sizeBytes) {
    const std::string text = stripLineEnding(message);
    const size_t prefixLen = std::strlen(SCAN_SIZE_PREFIX);
    if (text.compare(0, prefixLen, SCAN_SIZE_PREFIX) != 0 || text.size() == prefixLen) {
        return false;
    }

    uint64_t value = 0;
    for (size_t i = prefixLen; i < text.size(); ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }

    sizeBytes = value;
    return true;
}

bool isReadyMessage(const std::string& message) {
    return stripLineEnding(message) == SCAN_READY;
}

}  // namespace ScanProtocol

}  // namespace ClamFtp
