/**
 * @file FtpReply.h
 * @brief Parsed FTP control-channel reply and its classification
 */

#pragma once

#include <string>

namespace ClamFtp {

/**
 * @class FtpReply
 * @brief One server reply: numeric code, message text and raw bytes
 *
 * Only the leading 3-digit code of the first line is authoritative.
 * Continuation lines of a multi-line reply are kept in raw() but never
 * influence classification.
 *
 * A reply whose first line does not start with three ASCII digits has
 * code() == 0 ("absent"). Such a reply is malformed: every classification
 * predicate returns false and callers must treat it as a protocol
 * violation, never as success.
 */
class FtpReply {
public:
    /**
     * @brief Absent reply (code 0, malformed)
     */
    FtpReply() : m_code(0) {}

    /**
     * @brief Parse reply text
     * @param text Reply as received (one or more CRLF-terminated lines)
     * @return Parsed reply; code 0 if the first line has no leading code
     */
    static FtpReply parse(const std::string& text);

    int code() const { return m_code; }
    const std::string& message() const { return m_message; }
    const std::string& raw() const { return m_raw; }

    bool hasCode() const { return m_code != 0; }

    /// 1xx: action started, expect another reply
    bool isPreliminary() const { return m_code >= 100 && m_code < 200; }
    /// 2xx: action completed
    bool isPositive() const { return m_code >= 200 && m_code < 300; }
    /// 3xx: command accepted, more input needed
    bool isIntermediate() const { return m_code >= 300 && m_code < 400; }
    /// 4xx transient or 5xx permanent failure
    bool isError() const { return m_code >= 400 && m_code < 600; }
    bool isMalformed() const { return m_code == 0; }

    /**
     * @brief "227 Entering Passive Mode (...)" style text for logs/users
     */
    std::string toString() const;

private:
    int m_code;
    std::string m_message;
    std::string m_raw;
};

}  // namespace ClamFtp
