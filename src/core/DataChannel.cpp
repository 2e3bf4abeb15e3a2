/**
 * @file DataChannel.cpp
 * @brief PASV/PORT negotiation implementation
 */

#include "clamftp/DataChannel.h"
#include "clamftp/ControlSession.h"
#include "clamftp/Debug.h"

#include <arpa/inet.h>
#include <sstream>
#include <vector>

namespace ClamFtp {

namespace {

// Parse a decimal 0-255 field; no sign, no empty field
bool parseByteField(const std::string& text, int& value) {
    std::string field = text;
    size_t first = field.find_first_not_of(" \t");
    size_t last = field.find_last_not_of(" \t");
    if (first == std::string::npos) {
        return false;
    }
    field = field.substr(first, last - first + 1);
    if (field.empty() || field.size() > 3) {
        return false;
    }
    int result = 0;
    for (char c : field) {
        if (c < '0' || c > '9') {
            return false;
        }
        result = result * 10 + (c - '0');
    }
    if (result > 255) {
        return false;
    }
    value = result;
    return true;
}

}  // namespace

DataChannel::DataChannel(ControlSession& control, uint32_t timeoutSeconds)
    : m_control(control)
    , m_timeoutSeconds(timeoutSeconds)
    , m_passive(control.isPassiveMode())
{
}

//=============================================================================
// Negotiation
//=============================================================================

bool DataChannel::open(FtpReply& reply, std::string& errorMsg)
{
    m_passive = m_control.isPassiveMode();
    return m_passive ? openPassive(reply, errorMsg) : openActive(reply, errorMsg);
}

bool DataChannel::openPassive(FtpReply& reply, std::string& errorMsg)
{
    m_passive = true;

    if (!m_control.execute("PASV", reply, errorMsg)) {
        return false;
    }

    if (!reply.isPositive()) {
        errorMsg = "PASV failed: " + reply.toString();
        return false;
    }

    if (!parsePassiveReply(reply.message(), m_endpoint)) {
        errorMsg = "Cannot parse PASV reply: " + reply.toString();
        return false;
    }

    m_transferSocket = connectTcp(m_endpoint.ip, m_endpoint.port, m_timeoutSeconds * 1000, errorMsg);
    if (!m_transferSocket) {
        errorMsg = "Data connection failed: " + errorMsg;
        return false;
    }

    LOG_DEBUG("Passive data connection: " << m_endpoint.ip << ":" << m_endpoint.port);
    return true;
}

bool DataChannel::openActive(FtpReply& reply, std::string& errorMsg)
{
    m_passive = false;

    std::string localIp;
    uint16_t controlPort = 0;
    if (!getLocalEndpoint(m_control.socket(), localIp, controlPort, errorMsg)) {
        errorMsg = "Cannot determine local address: " + errorMsg;
        return false;
    }

    m_listenSocket = listenTcp(localIp, 0, 1, errorMsg);
    if (!m_listenSocket) {
        errorMsg = "Cannot listen for data connection: " + errorMsg;
        return false;
    }

    std::string boundIp;
    uint16_t boundPort = 0;
    if (!getLocalEndpoint(m_listenSocket.get(), boundIp, boundPort, errorMsg)) {
        m_listenSocket.close();
        return false;
    }

    m_endpoint.ip = localIp;
    m_endpoint.port = boundPort;

    if (!m_control.execute(buildActiveCommandPayload(localIp, boundPort), reply, errorMsg)) {
        m_listenSocket.close();
        return false;
    }

    if (!reply.isPositive()) {
        m_listenSocket.close();
        errorMsg = "PORT failed: " + reply.toString();
        return false;
    }

    LOG_DEBUG("Active data connection: listening on " << localIp << ":" << boundPort);
    return true;
}

bool DataChannel::acceptTransferSocket(std::string& errorMsg)
{
    if (m_passive) {
        if (!m_transferSocket) {
            errorMsg = "Data connection is not open";
            return false;
        }
        return true;
    }

    if (!m_listenSocket) {
        errorMsg = "Active data channel is not listening";
        return false;
    }

    m_transferSocket = acceptWithTimeout(m_listenSocket.get(), m_timeoutSeconds * 1000, errorMsg);
    m_listenSocket.close();

    if (!m_transferSocket) {
        errorMsg = "Server did not open the data connection: " + errorMsg;
        return false;
    }

    setSocketTimeouts(m_transferSocket.get(), m_timeoutSeconds * 1000);
    return true;
}

void DataChannel::close()
{
    m_listenSocket.close();
    m_transferSocket.close();
}

//=============================================================================
// Address encoding
//=============================================================================

bool DataChannel::parsePassiveReply(const std::string& message, HostPort& endpoint)
{
    size_t open = message.find('(');
    if (open == std::string::npos) {
        return false;
    }
    size_t close = message.find(')', open + 1);
    if (close == std::string::npos) {
        return false;
    }
    return decodeHostPort(message.substr(open + 1, close - open - 1), endpoint);
}

std::string DataChannel::encodeHostPort(const std::string& ip, uint16_t port)
{
    in_addr addr{};
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
        return "";
    }

    const auto* octets = reinterpret_cast<const unsigned char*>(&addr.s_addr);
    std::ostringstream oss;
    oss << static_cast<int>(octets[0]) << ','
        << static_cast<int>(octets[1]) << ','
        << static_cast<int>(octets[2]) << ','
        << static_cast<int>(octets[3]) << ','
        << (port / 256) << ',' << (port % 256);
    return oss.str();
}

bool DataChannel::decodeHostPort(const std::string& sextuple, HostPort& endpoint)
{
    std::vector<int> fields;
    std::string::size_type start = 0;
    for (;;) {
        std::string::size_type comma = sextuple.find(',', start);
        std::string part = sextuple.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        int value = 0;
        if (!parseByteField(part, value)) {
            return false;
        }
        fields.push_back(value);
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }

    if (fields.size() != 6) {
        return false;
    }

    endpoint.ip = std::to_string(fields[0]) + "." + std::to_string(fields[1]) + "." +
                  std::to_string(fields[2]) + "." + std::to_string(fields[3]);
    endpoint.port = static_cast<uint16_t>(fields[4] * 256 + fields[5]);
    return true;
}

std::string DataChannel::buildActiveCommandPayload(const std::string& ip, uint16_t port)
{
    std::string encoded = encodeHostPort(ip, port);
    if (encoded.empty()) {
        return "";
    }
    return "PORT " + encoded;
}

}  // namespace ClamFtp
