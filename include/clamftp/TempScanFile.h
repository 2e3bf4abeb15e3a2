/**
 * @file TempScanFile.h
 * @brief Scoped temp file holding one scan payload
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>

namespace ClamFtp {

/**
 * @class TempScanFile
 * @brief Payload file owned by exactly one scan session
 *
 * Named scan_<unix-seconds>_<16 hex random>_<sanitized name> inside the
 * temp directory. The random component makes concurrent uploads of the same
 * name in the same second land in distinct files.
 *
 * The destructor closes and deletes the file on every exit path. A failed
 * deletion is logged, never thrown.
 */
class TempScanFile {
public:
    /**
     * @param tempDir Directory for scan artifacts (created by create() if missing)
     * @param declaredName Name as declared by the client (untrusted)
     */
    TempScanFile(const std::filesystem::path& tempDir, const std::string& declaredName);
    ~TempScanFile();

    TempScanFile(const TempScanFile&) = delete;
    TempScanFile& operator=(const TempScanFile&) = delete;

    /**
     * @brief Create the file for writing
     */
    bool create(std::string& errorMsg);

    /**
     * @brief Append payload bytes
     */
    bool write(const uint8_t* data, size_t size, std::string& errorMsg);

    /**
     * @brief Flush and close so the scanner sees every byte
     */
    bool finish(std::string& errorMsg);

    /**
     * @brief Close and delete now (idempotent)
     * @return true if the file is gone afterwards
     */
    bool remove();

    const std::filesystem::path& path() const { return m_path; }
    uint64_t bytesWritten() const { return m_bytesWritten; }

    /**
     * @brief Reduce an untrusted name to a safe final path component
     *
     * Directory parts are dropped and characters outside [A-Za-z0-9._-]
     * become '_'. Never returns "", "." or "..".
     */
    static std::string sanitizeName(const std::string& declaredName);

    /**
     * @brief scan_<timestamp>_<uniqueId>_<sanitized declaredName>
     */
    static std::string buildFileName(const std::string& declaredName,
                                     std::time_t timestamp,
                                     const std::string& uniqueId);

private:
    std::filesystem::path m_dir;
    std::filesystem::path m_path;
    std::ofstream m_stream;
    uint64_t m_bytesWritten;
    bool m_created;
};

}  // namespace ClamFtp
