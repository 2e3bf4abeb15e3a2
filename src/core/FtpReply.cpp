/**
 * @file FtpReply.cpp
 * @brief FTP reply parsing
 */

#include "clamftp/FtpReply.h"

namespace ClamFtp {

namespace {

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

}  // namespace

FtpReply FtpReply::parse(const std::string& text)
{
    FtpReply reply;
    reply.m_raw = text;

    // First line only, without its terminator
    std::string firstLine = text.substr(0, text.find('\n'));
    if (!firstLine.empty() && firstLine.back() == '\r') {
        firstLine.pop_back();
    }

    if (firstLine.size() < 3 ||
        !isAsciiDigit(firstLine[0]) || !isAsciiDigit(firstLine[1]) || !isAsciiDigit(firstLine[2])) {
        reply.m_message = firstLine;
        return reply;
    }

    int code = (firstLine[0] - '0') * 100 + (firstLine[1] - '0') * 10 + (firstLine[2] - '0');
    if (code < 100 || code > 599) {
        // Three digits but outside the RFC 959 reply range
        reply.m_message = firstLine;
        return reply;
    }

    reply.m_code = code;
    // Separator at index 3 is ' ' (final line) or '-' (multi-line start)
    reply.m_message = firstLine.size() > 4 ? firstLine.substr(4) : std::string();
    return reply;
}

std::string FtpReply::toString() const
{
    if (m_code == 0) {
        return "<malformed reply> " + m_message;
    }
    return std::to_string(m_code) + " " + m_message;
}

}  // namespace ClamFtp
