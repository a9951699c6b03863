/**
 * @file doip_client.cpp
 * @brief DoIP Client Implementation for SHC
 */

#include "doip_client.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

void putU16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint16_t getU16(const uint8_t* in) {
    return static_cast<uint16_t>((in[0] << 8) | in[1]);
}

std::string hex16(uint16_t value) {
    std::ostringstream out;
    out << "0x" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << value;
    return out.str();
}

}  // namespace

/*******************************************************************************
 * Frame codec
 ******************************************************************************/

std::vector<uint8_t> encodeDoIPMessage(const DoIPMessage& message)
{
    std::vector<uint8_t> frame;
    frame.reserve(DOIP_HEADER_SIZE + message.payload.size());

    frame.push_back(DOIP_PROTOCOL_VERSION);
    frame.push_back(DOIP_INVERSE_VERSION);
    putU16(frame, static_cast<uint16_t>(message.type));

    uint32_t length = static_cast<uint32_t>(message.payload.size());
    putU16(frame, static_cast<uint16_t>(length >> 16));
    putU16(frame, static_cast<uint16_t>(length & 0xFFFF));

    frame.insert(frame.end(), message.payload.begin(), message.payload.end());
    return frame;
}

bool decodeDoIPHeader(const uint8_t* header, DoIPPayloadType& type, uint32_t& length)
{
    if (header[0] != DOIP_PROTOCOL_VERSION || header[1] != DOIP_INVERSE_VERSION) {
        return false;
    }

    type = static_cast<DoIPPayloadType>(getU16(&header[2]));
    length = (static_cast<uint32_t>(getU16(&header[4])) << 16) | getU16(&header[6]);
    return length <= DOIP_MAX_PAYLOAD;
}

/*******************************************************************************
 * DoIPClient Constructor/Destructor
 ******************************************************************************/

DoIPClient::DoIPClient(const std::string& zgw_ip, uint16_t zgw_port, uint16_t target_address)
    : zgw_ip_(zgw_ip)
    , zgw_port_(zgw_port)
    , target_address_(target_address)
    , socket_fd_(-1)
    , state_(DoIPClientState::IDLE)
    , trace_(false)
{
    std::cout << "[DoIP] Client initialized for ZGW " << zgw_ip_ << ":" << zgw_port_
              << " (logical " << hex16(target_address_) << ")" << std::endl;
}

DoIPClient::~DoIPClient()
{
    disconnect();
}

/*******************************************************************************
 * Connection Management
 ******************************************************************************/

bool DoIPClient::connect()
{
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (state_ == DoIPClientState::ACTIVE) {
        return true;
    }
    closeSocket();

    struct sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(zgw_port_);

    if (inet_pton(AF_INET, zgw_ip_.c_str(), &server_addr.sin_addr) <= 0) {
        std::cerr << "[DoIP] Invalid ZGW IP address: " << zgw_ip_ << std::endl;
        state_ = DoIPClientState::ERROR;
        return false;
    }

    socket_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd_ < 0) {
        std::cerr << "[DoIP] Failed to create socket: " << strerror(errno) << std::endl;
        state_ = DoIPClientState::ERROR;
        return false;
    }

    struct timeval tv;
    tv.tv_sec = DOIP_TIMEOUT_CONNECTION / 1000;
    tv.tv_usec = (DOIP_TIMEOUT_CONNECTION % 1000) * 1000;
    setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    state_ = DoIPClientState::CONNECTING;

    if (::connect(socket_fd_, reinterpret_cast<struct sockaddr*>(&server_addr),
                  sizeof(server_addr)) < 0) {
        std::cerr << "[DoIP] Connection to " << zgw_ip_ << " failed: " << strerror(errno) << std::endl;
        fail();
        return false;
    }

    state_ = DoIPClientState::CONNECTED;

    if (!activateRouting()) {
        fail();
        return false;
    }

    std::cout << "[DoIP] ✓ Routing active on " << zgw_ip_ << std::endl;
    state_ = DoIPClientState::ACTIVE;
    return true;
}

void DoIPClient::disconnect()
{
    std::lock_guard<std::mutex> lock(io_mutex_);
    closeSocket();
    state_ = DoIPClientState::IDLE;
}

void DoIPClient::closeSocket()
{
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        std::cout << "[DoIP] Disconnected" << std::endl;
    }
}

void DoIPClient::fail()
{
    closeSocket();
    state_ = DoIPClientState::ERROR;
}

bool DoIPClient::isActive() const
{
    return state_ == DoIPClientState::ACTIVE;
}

DoIPClientState DoIPClient::getState() const
{
    return state_;
}

/*******************************************************************************
 * Routing Activation
 ******************************************************************************/

bool DoIPClient::activateRouting()
{
    // SA(2) + ActivationType(1) + Reserved(4)
    DoIPMessage request;
    request.type = DoIPPayloadType::ROUTING_ACTIVATION_REQUEST;
    putU16(request.payload, DOIP_SHC_ADDRESS);
    request.payload.resize(7, 0x00);

    if (!sendMessage(request)) {
        return false;
    }

    DoIPMessage response;
    if (!receiveMessage(response, DOIP_TIMEOUT_ROUTING)) {
        std::cerr << "[DoIP] No routing activation response" << std::endl;
        return false;
    }

    // SA(2) + TA(2) + ResponseCode(1) + Reserved(4)
    if (response.type != DoIPPayloadType::ROUTING_ACTIVATION_RESPONSE ||
        response.payload.size() < 9) {
        std::cerr << "[DoIP] Invalid routing activation response" << std::endl;
        return false;
    }

    uint8_t code = response.payload[4];
    if (code != DOIP_ROUTING_SUCCESS) {
        std::cerr << "[DoIP] Routing activation denied (code 0x" << std::hex
                  << static_cast<int>(code) << std::dec << ")" << std::endl;
        return false;
    }
    return true;
}

/*******************************************************************************
 * UDS
 ******************************************************************************/

std::vector<uint8_t> DoIPClient::sendDiagnosticMessage(uint8_t service_id,
                                                         const std::vector<uint8_t>& data)
{
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (state_ != DoIPClientState::ACTIVE) {
        std::cerr << "[DoIP] Not active - cannot send diagnostic message" << std::endl;
        return {};
    }

    // SA(2) + TA(2) + UDS
    DoIPMessage request;
    request.type = DoIPPayloadType::DIAGNOSTIC_MESSAGE;
    putU16(request.payload, DOIP_SHC_ADDRESS);
    putU16(request.payload, target_address_);
    request.payload.push_back(service_id);
    request.payload.insert(request.payload.end(), data.begin(), data.end());

    if (!sendMessage(request)) {
        fail();
        return {};
    }

    DoIPMessage response;
    do {
        if (!receiveMessage(response, DOIP_TIMEOUT_DIAGNOSTIC)) {
            std::cerr << "[DoIP] No diagnostic response (SID 0x" << std::hex
                      << static_cast<int>(service_id) << std::dec << ")" << std::endl;
            fail();
            return {};
        }
    } while (response.type == DoIPPayloadType::DIAGNOSTIC_MESSAGE_ACK);

    if (response.type == DoIPPayloadType::DIAGNOSTIC_MESSAGE_NACK) {
        std::cerr << "[DoIP] Diagnostic message rejected (NACK)" << std::endl;
        return {};
    }

    if (response.type != DoIPPayloadType::DIAGNOSTIC_MESSAGE || response.payload.size() < 5) {
        std::cerr << "[DoIP] Unexpected diagnostic response" << std::endl;
        return {};
    }

    return std::vector<uint8_t>(response.payload.begin() + 4, response.payload.end());
}

bool DoIPClient::dataIdentifierRequest(UDSService service, uint16_t did,
                                       const std::vector<uint8_t>& data,
                                       std::vector<uint8_t>& record)
{
    const uint8_t sid = static_cast<uint8_t>(service);
    const char* name = service == UDSService::READ_DATA_BY_ID ? "ReadDataByIdentifier"
                                                              : "WriteDataByIdentifier";

    std::vector<uint8_t> request;
    putU16(request, did);
    request.insert(request.end(), data.begin(), data.end());

    std::vector<uint8_t> response = sendDiagnosticMessage(sid, request);
    if (response.empty()) {
        return false;
    }

    if (response[0] == static_cast<uint8_t>(UDSService::NEGATIVE_RESPONSE)) {
        int nrc = response.size() > 2 ? response[2] : 0;
        std::cerr << "[DoIP] " << name << " " << hex16(did) << " negative response (NRC 0x"
                  << std::hex << nrc << std::dec << ")" << std::endl;
        return false;
    }

    const uint8_t positive = sid + static_cast<uint8_t>(UDSService::POSITIVE_RESPONSE);
    if (response.size() < 3 || response[0] != positive || getU16(&response[1]) != did) {
        std::cerr << "[DoIP] " << name << " " << hex16(did) << " unexpected response" << std::endl;
        return false;
    }

    record.assign(response.begin() + 3, response.end());
    return true;
}

bool DoIPClient::readDataByIdentifier(uint16_t did, std::vector<uint8_t>& data)
{
    return dataIdentifierRequest(UDSService::READ_DATA_BY_ID, did, {}, data);
}

bool DoIPClient::writeDataByIdentifier(uint16_t did, const std::vector<uint8_t>& data)
{
    std::vector<uint8_t> echo;
    return dataIdentifierRequest(UDSService::WRITE_DATA_BY_ID, did, data, echo);
}

/*******************************************************************************
 * Socket I/O
 ******************************************************************************/

bool DoIPClient::sendMessage(const DoIPMessage& message)
{
    if (socket_fd_ < 0) {
        return false;
    }

    std::vector<uint8_t> frame = encodeDoIPMessage(message);
    size_t sent = 0;

    while (sent < frame.size()) {
        ssize_t n = send(socket_fd_, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[DoIP] Send failed: " << strerror(errno) << std::endl;
            return false;
        }
        sent += static_cast<size_t>(n);
    }

    if (trace_) {
        std::cout << "[DoIP] TX type " << hex16(static_cast<uint16_t>(message.type))
                  << " (" << message.payload.size() << " bytes)" << std::endl;
    }
    return true;
}

bool DoIPClient::receiveMessage(DoIPMessage& message, int timeout_ms)
{
    uint8_t header[DOIP_HEADER_SIZE];
    if (!receiveExact(header, sizeof(header), timeout_ms)) {
        return false;
    }

    uint32_t length = 0;
    if (!decodeDoIPHeader(header, message.type, length)) {
        std::cerr << "[DoIP] Invalid DoIP header" << std::endl;
        return false;
    }

    message.payload.assign(length, 0);
    if (length > 0 && !receiveExact(message.payload.data(), length, timeout_ms)) {
        return false;
    }

    if (trace_) {
        std::cout << "[DoIP] RX type " << hex16(static_cast<uint16_t>(message.type))
                  << " (" << length << " bytes)" << std::endl;
    }
    return true;
}

bool DoIPClient::receiveExact(uint8_t* buffer, size_t size, int timeout_ms)
{
    size_t received = 0;

    while (received < size) {
        if (socket_fd_ < 0) {
            return false;
        }

        struct pollfd pfd;
        pfd.fd = socket_fd_;
        pfd.events = POLLIN;

        int ret = poll(&pfd, 1, timeout_ms);
        if (ret == 0) {
            std::cerr << "[DoIP] Receive timeout (" << timeout_ms << "ms)" << std::endl;
            return false;
        }
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[DoIP] Poll error: " << strerror(errno) << std::endl;
            return false;
        }

        ssize_t n = recv(socket_fd_, buffer + received, size - received, 0);
        if (n == 0) {
            std::cerr << "[DoIP] Connection closed by peer" << std::endl;
            return false;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[DoIP] Receive error: " << strerror(errno) << std::endl;
            return false;
        }
        received += static_cast<size_t>(n);
    }

    return true;
}
