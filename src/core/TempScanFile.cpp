/**
 * @file TempScanFile.cpp
 * @brief Scoped temp file holding one scan payload
 */

#include "clamftp/TempScanFile.h"
#include "clamftp/Debug.h"
#include "clamftp/UuidGenerator.h"
#include "clamftp/config.h"

#include <chrono>

namespace ClamFtp {

namespace {

constexpr size_t MAX_SANITIZED_NAME_LENGTH = 128;
constexpr size_t TEMP_ID_BYTES = 8;

bool isSafeNameChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '-';
}

}  // namespace

TempScanFile::TempScanFile(const std::filesystem::path& tempDir, const std::string& declaredName)
    : m_dir(tempDir)
    , m_bytesWritten(0)
    , m_created(false)
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::string uniqueId = UuidGenerator::generateHex(TEMP_ID_BYTES);
    if (uniqueId.empty()) {
        // CSPRNG failure: fall back to the object address, still unique among live sessions
        uniqueId = std::to_string(reinterpret_cast<uintptr_t>(this));
    }
    m_path = m_dir / buildFileName(declaredName, now, uniqueId);
}

TempScanFile::~TempScanFile() {
    remove();
}

bool TempScanFile::create(std::string& errorMsg)
{
    std::error_code ec;
    std::filesystem::create_directories(m_dir, ec);
    if (ec) {
        errorMsg = "Cannot create temp directory " + m_dir.string() + ": " + ec.message();
        return false;
    }

    m_stream.open(m_path, std::ios::binary | std::ios::trunc);
    if (!m_stream) {
        errorMsg = "Cannot create temp file " + m_path.string();
        return false;
    }

    m_created = true;
    LOG_DEBUG("Temp file created: " << m_path.string());
    return true;
}

bool TempScanFile::write(const uint8_t* data, size_t size, std::string& errorMsg)
{
    if (!m_stream.is_open()) {
        errorMsg = "Temp file is not open";
        return false;
    }

    m_stream.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!m_stream) {
        errorMsg = "Write to temp file failed: " + m_path.string();
        return false;
    }

    m_bytesWritten += size;
    return true;
}

bool TempScanFile::finish(std::string& errorMsg)
{
    if (!m_stream.is_open()) {
        errorMsg = "Temp file is not open";
        return false;
    }

    m_stream.flush();
    const bool ok = static_cast<bool>(m_stream);
    m_stream.close();
    if (!ok) {
        errorMsg = "Flushing temp file failed: " + m_path.string();
    }
    return ok;
}

bool TempScanFile::remove()
{
    if (m_stream.is_open()) {
        m_stream.close();
    }

    if (!m_created) {
        return true;
    }

    std::error_code ec;
    std::filesystem::remove(m_path, ec);
    if (ec) {
        LOG_ERROR("Could not delete temp file " << m_path.string() << ": " << ec.message());
        return false;
    }

    m_created = false;
    LOG_DEBUG("Temp file deleted: " << m_path.string());
    return true;
}

std::string TempScanFile::sanitizeName(const std::string& declaredName)
{
    std::string name = declaredName;
    size_t slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }

    for (char& c : name) {
        if (!isSafeNameChar(c)) {
            c = '_';
        }
    }

    if (name.size() > MAX_SANITIZED_NAME_LENGTH) {
        name = name.substr(name.size() - MAX_SANITIZED_NAME_LENGTH);
    }

    if (name.empty() || name == "." || name == "..") {
        name = "unnamed";
    }
    return name;
}

std::string TempScanFile::buildFileName(const std::string& declaredName,
                                        std::time_t timestamp,
                                        const std::string& uniqueId)
{
    return std::string(TEMP_FILE_PREFIX) + std::to_string(static_cast<long long>(timestamp)) +
           "_" + uniqueId + "_" + sanitizeName(declaredName);
}

}  // namespace ClamFtp
