/**
 * @file BLETypes.h
 * @brief BAB session transport types, constants, and common structures
 *
 * Core types shared by every component of the BLE session transport:
 * the GATT service layout, framing constants, enumerations, and the data
 * structures exchanged between the platform layer, the connection managers,
 * and the game engine.
 */
#pragma once

#include "Bytes.h"
#include "Log.h"

#include <functional>
#include <memory>
#include <string>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace BAB { namespace BLE {

using Bytes = RNS::Bytes;

/// Opaque logical peer identifier handed to the game engine
using PeerId = std::string;

//=============================================================================
// GATT Service and Characteristic UUIDs
//=============================================================================

namespace UUID {
    // Game session service
    static constexpr const char* SERVICE = "BAB10000-1A46-0001-0000-000000000001";

    // Notify channel - host to joiner (unicast and broadcast)
    static constexpr const char* NOTIFY_CHAR = "BAB10000-1A46-0001-0000-000000000002";

    // Write channel - joiner to host
    static constexpr const char* WRITE_CHAR = "BAB10000-1A46-0001-0000-000000000003";

    // Info channel - player metadata (read host name, write joiner name)
    static constexpr const char* INFO_CHAR = "BAB10000-1A46-0001-0000-000000000005";
}

//=============================================================================
// MTU Constants
//=============================================================================

namespace MTU {
    static constexpr uint16_t REQUESTED = 517;      // Request maximum MTU (BLE 5.0)
    static constexpr uint16_t MINIMUM = 23;         // BLE 4.0 minimum MTU
    static constexpr uint16_t ATT_OVERHEAD = 3;     // ATT protocol header overhead
}

//=============================================================================
// Timing Constants
//=============================================================================

namespace Timing {
    static constexpr double REASSEMBLY_TIMEOUT = 30.0;        // Seconds to complete reassembly
    static constexpr double CONNECTION_TIMEOUT = 30.0;        // Seconds to establish connection
    static constexpr double SCAN_DURATION = 15.0;             // Default scan window
    static constexpr double INTER_FRAGMENT_DELAY = 0.010;     // Seconds between fragment writes
    static constexpr double MAINTENANCE_INTERVAL = 1.0;       // Seconds between maintenance
}

//=============================================================================
// Session Limits
//=============================================================================

namespace Limits {
    static constexpr size_t MAX_PEERS = 4;                    // Host capacity
    static constexpr size_t MAX_FRAGMENTS = 255;              // fragmentCount is one byte
    static constexpr size_t MAX_DISPLAY_NAME = 32;            // Bytes kept from info channel
    static constexpr size_t ADVERTISED_NAME_CHARS = 8;        // Host name chars in advertisement
    static constexpr size_t MAC_SIZE = 6;
    static constexpr const char* ADVERTISED_NAME_PREFIX = "BAB-";
}

//=============================================================================
// Fragment Header Constants
//=============================================================================

namespace Fragment {
    // packetId (u16 BE) + fragmentIndex (u8) + fragmentCount (u8)
    static constexpr size_t HEADER_SIZE = 4;

    // Smallest MTU that still carries one payload byte
    static constexpr size_t MIN_MTU = HEADER_SIZE + 1;
}

//=============================================================================
// HCI Disconnect Reasons
//=============================================================================

namespace Reason {
    static constexpr uint8_t SUPERVISION_TIMEOUT = 0x08;
    static constexpr uint8_t CONNECTION_LIMIT = 0x09;
    static constexpr uint8_t REMOTE_USER_TERMINATED = 0x13;
    static constexpr uint8_t LOW_RESOURCES = 0x14;            // Host full
    static constexpr uint8_t POWER_OFF = 0x15;
    static constexpr uint8_t LOCAL_HOST_TERMINATED = 0x16;
    static constexpr uint8_t CONNECTION_FAILED = 0x3E;
}

//=============================================================================
// Enumerations
//=============================================================================

/**
 * @brief Platform type for compile-time selection
 */
enum class PlatformType {
    NONE,
    NIMBLE_ARDUINO,     // ESP32 with NimBLE-Arduino library
    LOOPBACK            // In-process radio shared by several platforms
};

/**
 * @brief BLE role in a connection
 */
enum class Role : uint8_t {
    NONE       = 0x00,
    CENTRAL    = 0x01,   // Initiates connections (GATT client) - joiner
    PERIPHERAL = 0x02    // Accepts connections (GATT server) - host
};

/**
 * @brief Role of the remote side of a session link
 */
enum class PeerRole : uint8_t {
    HOST,
    JOINER
};

/**
 * @brief Local Bluetooth radio availability
 */
enum class RadioState : uint8_t {
    UNKNOWN,
    UNSUPPORTED,
    UNAUTHORIZED,
    POWERED_OFF,
    POWERED_ON
};

/**
 * @brief Connection state machine states
 */
enum class ConnectionState : uint8_t {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    DISCOVERING_SERVICES,
    SUBSCRIBING,         // Exchanging info and enabling notifications
    READY,               // Subscribed, peer registered
    DISCONNECTING
};

/**
 * @brief Outcome of GATT service discovery on a connection
 */
enum class DiscoveryResult : uint8_t {
    SUCCESS,
    SERVICE_NOT_FOUND,
    CHANNEL_NOT_FOUND,
    FAILED
};

/**
 * @brief GATT operation result codes
 */
enum class OperationResult : uint8_t {
    SUCCESS,
    PENDING,
    TIMEOUT,
    DISCONNECTED,
    NOT_FOUND,
    BUSY,
    ERROR
};

/**
 * @brief Transport error taxonomy reported to the engine
 */
enum class TransportError : uint8_t {
    NONE,
    RADIO_UNAVAILABLE,
    CONNECTION_FAILED,
    CONNECTION_TIMEOUT,
    CAPACITY_EXCEEDED,
    MALFORMED_FRAGMENT,
    PACKET_ID_WRAPAROUND,
    SERVICE_NOT_FOUND,
    CHANNEL_NOT_FOUND,
    WRITE_FAILURE,
    UNKNOWN_PEER,
    REASSEMBLY_TIMEOUT
};

/**
 * @brief Scan mode
 */
enum class ScanMode : uint8_t {
    PASSIVE,
    ACTIVE
};

//=============================================================================
// Data Structures
//=============================================================================

/**
 * @brief BLE address (6 bytes + type)
 */
struct BLEAddress {
    uint8_t addr[6] = {0};
    uint8_t type = 0;  // 0 = public, 1 = random

    BLEAddress() = default;

    BLEAddress(const uint8_t* address, uint8_t addr_type = 0) : type(addr_type) {
        if (address) {
            memcpy(addr, address, 6);
        }
    }

    bool operator==(const BLEAddress& other) const {
        return memcmp(addr, other.addr, 6) == 0 && type == other.type;
    }

    bool operator!=(const BLEAddress& other) const {
        return !(*this == other);
    }

    bool operator<(const BLEAddress& other) const {
        int cmp = memcmp(addr, other.addr, 6);
        if (cmp != 0) return cmp < 0;
        return type < other.type;
    }

    /**
     * @brief Convert to colon-separated hex string (XX:XX:XX:XX:XX:XX)
     * addr[0] is MSB (first displayed), addr[5] is LSB (last displayed)
     */
    std::string toString() const {
        char buf[18];
        snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                 addr[0], addr[1], addr[2], addr[3], addr[4], addr[5]);
        return std::string(buf);
    }

    /**
     * @brief Parse from colon-separated hex string
     */
    static BLEAddress fromString(const std::string& str) {
        BLEAddress result;
        if (str.length() >= 17) {
            unsigned int values[6];
            if (sscanf(str.c_str(), "%02X:%02X:%02X:%02X:%02X:%02X",
                       &values[0], &values[1], &values[2],
                       &values[3], &values[4], &values[5]) == 6) {
                for (int i = 0; i < 6; i++) {
                    result.addr[i] = static_cast<uint8_t>(values[i]);
                }
            }
        }
        return result;
    }

    Bytes toBytes() const {
        return Bytes(addr, 6);
    }

    bool isZero() const {
        for (int i = 0; i < 6; i++) {
            if (addr[i] != 0) return false;
        }
        return true;
    }
};

/**
 * @brief Scan result from BLE discovery
 */
struct ScanResult {
    BLEAddress address;
    std::string name;
    int8_t rssi = 0;
    bool connectable = false;
    bool has_session_service = false;   // Pre-filtered for our service UUID
};

/**
 * @brief A discovered host, as surfaced to the engine while scanning
 */
struct HostDescriptor {
    BLEAddress address;                 // Platform identifier
    std::string name;                   // Advertised name ("BAB-xxxxxxxx")
    int8_t rssi = 0;
    double discovered_at = 0;
};

/**
 * @brief Connection handle with associated state
 */
struct ConnectionHandle {
    uint16_t handle = 0xFFFF;           // Platform-specific connection handle
    BLEAddress peer_address;
    Role local_role = Role::NONE;       // Our role in this connection
    ConnectionState state = ConnectionState::DISCONNECTED;
    uint16_t mtu = MTU::MINIMUM;        // Usable MTU for one fragment

    bool isValid() const { return handle != 0xFFFF; }

    void reset() {
        handle = 0xFFFF;
        peer_address = BLEAddress();
        local_role = Role::NONE;
        state = ConnectionState::DISCONNECTED;
        mtu = MTU::MINIMUM;
    }
};

/**
 * @brief Handle for a published session service
 */
struct ServiceHandle {
    uint16_t id = 0;
    std::string advertised_name;

    bool isValid() const { return id != 0; }
};

/**
 * @brief A connected session peer
 *
 * role is the role of the other side, seen from this device.
 */
struct Peer {
    PeerId id;
    std::string display_name;
    PeerRole role = PeerRole::JOINER;
    double connected_at = 0;

    // Link details
    uint16_t conn_handle = 0xFFFF;
    BLEAddress address;
    uint16_t mtu = MTU::MINIMUM;

    // Statistics
    uint32_t packets_sent = 0;
    uint32_t packets_received = 0;
};

/**
 * @brief Engine-level unit of data
 *
 * An empty target_peer_id means broadcast (host only).
 */
struct Packet {
    PeerId target_peer_id;
    Bytes payload;

    bool isBroadcast() const { return target_peer_id.empty(); }
};

/**
 * @brief Platform configuration
 */
struct PlatformConfig {
    Role role = Role::PERIPHERAL;

    // Advertising parameters (host)
    uint16_t adv_interval_min_ms = 100;
    uint16_t adv_interval_max_ms = 200;
    std::string device_name = "BAB-Session";

    // Scan parameters (joiner)
    uint16_t scan_interval_ms = 120;
    uint16_t scan_window_ms = 60;
    ScanMode scan_mode = ScanMode::ACTIVE;  // Active scan picks up the name in the scan response

    // Connection parameters
    uint16_t conn_interval_min_ms = 15;
    uint16_t conn_interval_max_ms = 30;
    uint16_t conn_latency = 0;
    uint16_t supervision_timeout_ms = 4000;

    // MTU
    uint16_t preferred_mtu = MTU::REQUESTED;

    // Limits
    uint8_t max_connections = Limits::MAX_PEERS;
};

/**
 * @brief Session-level transport configuration
 */
struct TransportConfig {
    size_t max_peers = Limits::MAX_PEERS;
    double reassembly_timeout = Timing::REASSEMBLY_TIMEOUT;
    double connection_timeout = Timing::CONNECTION_TIMEOUT;
    double scan_duration = Timing::SCAN_DURATION;
    double inter_fragment_delay = Timing::INTER_FRAGMENT_DELAY;
    uint16_t preferred_mtu = MTU::REQUESTED;
    std::string display_name = "Player";
};

//=============================================================================
// Callback Type Definitions
//=============================================================================

namespace Callbacks {
    // Radio
    using OnRadioStateChanged = std::function<void(RadioState state)>;

    // Scan callbacks
    using OnScanResult = std::function<void(const ScanResult& result)>;
    using OnScanComplete = std::function<void()>;

    // Connection callbacks (central mode - we initiated)
    using OnConnected = std::function<void(const ConnectionHandle& conn)>;
    using OnConnectFailed = std::function<void(const BLEAddress& address, uint8_t reason)>;
    using OnDisconnected = std::function<void(const ConnectionHandle& conn, uint8_t reason)>;
    using OnMTUChanged = std::function<void(const ConnectionHandle& conn, uint16_t mtu)>;
    using OnServicesDiscovered = std::function<void(const ConnectionHandle& conn, DiscoveryResult result)>;
    using OnInfoRead = std::function<void(OperationResult result, const Bytes& data)>;

    // Data callbacks
    using OnDataReceived = std::function<void(const ConnectionHandle& conn, const Bytes& data)>;
    using OnNotifyEnabled = std::function<void(const ConnectionHandle& conn, bool enabled)>;

    // Peripheral-mode callbacks (they connected to us)
    using OnCentralConnected = std::function<void(const ConnectionHandle& conn)>;
    using OnCentralDisconnected = std::function<void(const ConnectionHandle& conn, uint8_t reason)>;
    using OnWriteReceived = std::function<void(const ConnectionHandle& conn, const Bytes& data)>;
    using OnInfoWritten = std::function<void(const ConnectionHandle& conn, const Bytes& data)>;

    // Engine-facing callbacks
    using OnPeerConnected = std::function<void(const PeerId& peer_id, const std::string& display_name)>;
    using OnPeerDisconnected = std::function<void(const PeerId& peer_id)>;
    using OnPeerData = std::function<void(const PeerId& peer_id, const Bytes& data)>;
    using OnTransportError = std::function<void(TransportError error, const std::string& detail)>;
    using OnHostDiscovered = std::function<void(const HostDescriptor& host)>;
    using OnConnectionFailed = std::function<void(const HostDescriptor& host, TransportError reason)>;
}

//=============================================================================
// Utility Functions
//=============================================================================

/**
 * @brief Get the payload size for a given MTU
 * @param mtu The negotiated MTU
 * @return Maximum payload size per fragment
 */
inline size_t getPayloadSize(uint16_t mtu) {
    return (mtu > Fragment::HEADER_SIZE) ? (mtu - Fragment::HEADER_SIZE) : 0;
}

/**
 * @brief Build the advertised name for a host
 */
inline std::string advertisedName(const std::string& host_name) {
    return std::string(Limits::ADVERTISED_NAME_PREFIX) +
           host_name.substr(0, Limits::ADVERTISED_NAME_CHARS);
}

/**
 * @brief Check whether an error is a terminal connection-setup failure
 */
inline bool isConnectionFailure(TransportError error) {
    switch (error) {
        case TransportError::RADIO_UNAVAILABLE:
        case TransportError::CONNECTION_FAILED:
        case TransportError::CONNECTION_TIMEOUT:
        case TransportError::CAPACITY_EXCEEDED:
        case TransportError::SERVICE_NOT_FOUND:
        case TransportError::CHANNEL_NOT_FOUND:
            return true;
        default:
            return false;
    }
}

inline const char* roleToString(Role role) {
    switch (role) {
        case Role::NONE:       return "NONE";
        case Role::CENTRAL:    return "CENTRAL";
        case Role::PERIPHERAL: return "PERIPHERAL";
        default:               return "UNKNOWN";
    }
}

inline const char* peerRoleToString(PeerRole role) {
    return role == PeerRole::HOST ? "HOST" : "JOINER";
}

inline const char* radioStateToString(RadioState state) {
    switch (state) {
        case RadioState::UNKNOWN:      return "UNKNOWN";
        case RadioState::UNSUPPORTED:  return "UNSUPPORTED";
        case RadioState::UNAUTHORIZED: return "UNAUTHORIZED";
        case RadioState::POWERED_OFF:  return "POWERED_OFF";
        case RadioState::POWERED_ON:   return "POWERED_ON";
        default:                       return "UNKNOWN";
    }
}

inline const char* stateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED:         return "DISCONNECTED";
        case ConnectionState::CONNECTING:           return "CONNECTING";
        case ConnectionState::CONNECTED:            return "CONNECTED";
        case ConnectionState::DISCOVERING_SERVICES: return "DISCOVERING_SERVICES";
        case ConnectionState::SUBSCRIBING:          return "SUBSCRIBING";
        case ConnectionState::READY:                return "READY";
        case ConnectionState::DISCONNECTING:        return "DISCONNECTING";
        default:                                    return "UNKNOWN";
    }
}

inline const char* errorToString(TransportError error) {
    switch (error) {
        case TransportError::NONE:                 return "NONE";
        case TransportError::RADIO_UNAVAILABLE:    return "RADIO_UNAVAILABLE";
        case TransportError::CONNECTION_FAILED:    return "CONNECTION_FAILED";
        case TransportError::CONNECTION_TIMEOUT:   return "CONNECTION_TIMEOUT";
        case TransportError::CAPACITY_EXCEEDED:    return "CAPACITY_EXCEEDED";
        case TransportError::MALFORMED_FRAGMENT:   return "MALFORMED_FRAGMENT";
        case TransportError::PACKET_ID_WRAPAROUND: return "PACKET_ID_WRAPAROUND";
        case TransportError::SERVICE_NOT_FOUND:    return "SERVICE_NOT_FOUND";
        case TransportError::CHANNEL_NOT_FOUND:    return "CHANNEL_NOT_FOUND";
        case TransportError::WRITE_FAILURE:        return "WRITE_FAILURE";
        case TransportError::UNKNOWN_PEER:         return "UNKNOWN_PEER";
        case TransportError::REASSEMBLY_TIMEOUT:   return "REASSEMBLY_TIMEOUT";
        default:                                   return "UNKNOWN";
    }
}

/**
 * @brief User-facing message for a radio state that blocks operation
 */
inline const char* radioStateDescription(RadioState state) {
    switch (state) {
        case RadioState::UNSUPPORTED:  return "Bluetooth is not available on this device";
        case RadioState::UNAUTHORIZED: return "Bluetooth access not authorized. Please enable in Settings.";
        case RadioState::POWERED_OFF:  return "Bluetooth is turned off. Please enable Bluetooth.";
        case RadioState::POWERED_ON:   return "Bluetooth is ready";
        default:                       return "Bluetooth is not ready";
    }
}

/**
 * @brief User-facing message for a transport error
 */
inline const char* errorDescription(TransportError error) {
    switch (error) {
        case TransportError::NONE:                 return "No error";
        case TransportError::RADIO_UNAVAILABLE:    return "Bluetooth is not available";
        case TransportError::CONNECTION_FAILED:    return "Failed to connect to the host";
        case TransportError::CONNECTION_TIMEOUT:   return "Connection timed out";
        case TransportError::CAPACITY_EXCEEDED:    return "Maximum number of players reached";
        case TransportError::MALFORMED_FRAGMENT:   return "Received invalid data from peer";
        case TransportError::PACKET_ID_WRAPAROUND: return "Incomplete message replaced by a newer one";
        case TransportError::SERVICE_NOT_FOUND:    return "Game service not found on host";
        case TransportError::CHANNEL_NOT_FOUND:    return "Required characteristic not found";
        case TransportError::WRITE_FAILURE:        return "Failed to send data to peer";
        case TransportError::UNKNOWN_PEER:         return "Unknown player";
        case TransportError::REASSEMBLY_TIMEOUT:   return "Incomplete message from peer expired";
        default:                                   return "Unknown error";
    }
}

}} // namespace BAB::BLE
