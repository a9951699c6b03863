/**
 * @file doip_client.hpp
 * @brief DoIP Client for SHC (Diagnostics over IP)
 *
 * SHC → ZGW communication using DoIP/UDS
 * ISO 13400 (DoIP) + ISO 14229 (UDS)
 *
 * Used for vehicle signal reads (ignition, temperatures) and
 * seat heater level read/write via ReadDataByIdentifier / WriteDataByIdentifier.
 */

#ifndef DOIP_CLIENT_HPP
#define DOIP_CLIENT_HPP

#include <atomic>
#include <string>
#include <vector>
#include <cstdint>
#include <mutex>

/*******************************************************************************
 * DoIP Protocol Constants (ISO 13400-2)
 ******************************************************************************/

constexpr uint8_t DOIP_PROTOCOL_VERSION = 0x02;
constexpr uint8_t DOIP_INVERSE_VERSION = 0xFD;
constexpr size_t DOIP_HEADER_SIZE = 8;
constexpr uint32_t DOIP_MAX_PAYLOAD = 4096;     // Larger frames are treated as corrupt

// Logical Addresses
constexpr uint16_t DOIP_SHC_ADDRESS = 0x0E80;  // Tester (SHC) logical address
constexpr uint16_t DOIP_ZGW_ADDRESS = 0x0100;  // Default ZGW logical address

// Timeouts (milliseconds)
constexpr int DOIP_TIMEOUT_CONNECTION = 3000;
constexpr int DOIP_TIMEOUT_ROUTING = 2000;
constexpr int DOIP_TIMEOUT_DIAGNOSTIC = 2000;

constexpr uint8_t DOIP_ROUTING_SUCCESS = 0x10;

enum class DoIPPayloadType : uint16_t {
    GENERIC_NACK = 0x0000,
    ROUTING_ACTIVATION_REQUEST = 0x0005,
    ROUTING_ACTIVATION_RESPONSE = 0x0006,
    DIAGNOSTIC_MESSAGE = 0x8001,
    DIAGNOSTIC_MESSAGE_ACK = 0x8002,
    DIAGNOSTIC_MESSAGE_NACK = 0x8003
};

/*******************************************************************************
 * UDS Service IDs (ISO 14229)
 ******************************************************************************/

enum class UDSService : uint8_t {
    READ_DATA_BY_ID = 0x22,
    WRITE_DATA_BY_ID = 0x2E,

    POSITIVE_RESPONSE = 0x40,   // Added to the request SID
    NEGATIVE_RESPONSE = 0x7F
};

enum class DoIPClientState {
    IDLE,
    CONNECTING,
    CONNECTED,      // TCP up, routing not yet active
    ACTIVE,
    ERROR
};

/*******************************************************************************
 * Frame codec
 ******************************************************************************/

struct DoIPMessage {
    DoIPPayloadType type = DoIPPayloadType::GENERIC_NACK;
    std::vector<uint8_t> payload;
};

/**
 * @brief Serialize header + payload
 */
std::vector<uint8_t> encodeDoIPMessage(const DoIPMessage& message);

/**
 * @brief Validate an 8-byte header
 * @param header At least DOIP_HEADER_SIZE bytes
 * @param type Output: payload type
 * @param length Output: payload length
 * @return false on version mismatch or oversize payload
 */
bool decodeDoIPHeader(const uint8_t* header, DoIPPayloadType& type, uint32_t& length);

/*******************************************************************************
 * @class DoIPClient
 * @brief DoIP/UDS Client for SHC
 *
 * Thread-safe: one request/response exchange at a time.
 ******************************************************************************/

class DoIPClient {
public:
    /**
     * @brief Constructor
     * @param zgw_ip ZGW IP address
     * @param zgw_port ZGW DoIP port (default: 13400)
     * @param target_address ZGW logical address
     */
    DoIPClient(const std::string& zgw_ip, uint16_t zgw_port = 13400,
               uint16_t target_address = DOIP_ZGW_ADDRESS);

    ~DoIPClient();

    /**
     * @brief Connect to ZGW and activate routing
     * @return true if connected and routing activated
     */
    bool connect();

    void disconnect();

    bool isActive() const;
    DoIPClientState getState() const;

    /**
     * @brief Log every TX/RX frame
     */
    void setTraceEnabled(bool enabled) { trace_ = enabled; }

    /**
     * @brief UDS 0x22 ReadDataByIdentifier
     * @param did Data identifier
     * @param data Output: record data (without SID/DID echo)
     * @return true on positive response (0x62)
     */
    bool readDataByIdentifier(uint16_t did, std::vector<uint8_t>& data);

    /**
     * @brief UDS 0x2E WriteDataByIdentifier
     * @return true on positive response (0x6E)
     */
    bool writeDataByIdentifier(uint16_t did, const std::vector<uint8_t>& data);

    /**
     * @brief Send UDS request in a diagnostic message (0x8001)
     * @return UDS response starting with the response SID, empty on failure
     */
    std::vector<uint8_t> sendDiagnosticMessage(uint8_t service_id,
                                                const std::vector<uint8_t>& data);

private:
    std::string zgw_ip_;
    uint16_t zgw_port_;
    uint16_t target_address_;
    int socket_fd_;
    std::atomic<DoIPClientState> state_;
    std::atomic<bool> trace_;
    std::mutex io_mutex_;

    bool activateRouting();

    /**
     * @brief Close socket without taking the I/O lock
     */
    void closeSocket();

    /**
     * @brief Close socket and enter ERROR (caller holds the I/O lock)
     */
    void fail();

    /**
     * @brief Shared 0x22 / 0x2E exchange with positive-response check
     * @param record Output: bytes after the DID echo
     */
    bool dataIdentifierRequest(UDSService service, uint16_t did,
                               const std::vector<uint8_t>& data,
                               std::vector<uint8_t>& record);

    bool sendMessage(const DoIPMessage& message);
    bool receiveMessage(DoIPMessage& message, int timeout_ms);
    bool receiveExact(uint8_t* buffer, size_t size, int timeout_ms);
};

#endif // DOIP_CLIENT_HPP
