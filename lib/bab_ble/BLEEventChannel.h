/**
 * @file BLEEventChannel.h
 * @brief Single-consumer event channel between callers and a manager loop
 *
 * Platform callbacks (BLE host task) and engine calls (any thread) never
 * touch manager state directly. They post a TransportEvent here, and the
 * manager's loop() drains the channel and applies events one at a time.
 */
#pragma once

#include "BLETypes.h"
#include "Bytes.h"

#include <deque>
#include <mutex>

namespace BAB { namespace BLE {

/**
 * @brief A platform notification or an engine command
 *
 * Only the fields relevant to the type are set.
 */
struct TransportEvent {
    enum class Type : uint8_t {
        // Platform -> manager
        RADIO_STATE,            // radio_state
        SCAN_RESULT,            // scan
        SCAN_COMPLETE,
        CONNECTED,              // conn
        CONNECT_FAILED,         // address, reason
        DISCONNECTED,           // conn, reason
        MTU_CHANGED,            // conn, value = mtu
        SERVICES_DISCOVERED,    // conn, discovery
        INFO_READ,              // conn, result, data
        NOTIFICATION,           // conn, data
        CENTRAL_CONNECTED,      // conn
        CENTRAL_DISCONNECTED,   // conn, reason
        SUBSCRIPTION,           // conn, enabled
        WRITE_RECEIVED,         // conn, data
        INFO_WRITTEN,           // conn, data

        // Engine -> manager
        START_ADVERTISING,      // text = local name, value = service id
        STOP_ADVERTISING,
        START_SCAN,             // number = duration seconds
        STOP_SCAN,
        CONNECT,                // host
        DISCONNECT,
        SEND                    // peer_id = target, data = payload
    };

    Type type = Type::RADIO_STATE;
    ConnectionHandle conn;
    BLEAddress address;
    RadioState radio_state = RadioState::UNKNOWN;
    ScanResult scan;
    HostDescriptor host;
    DiscoveryResult discovery = DiscoveryResult::SUCCESS;
    OperationResult result = OperationResult::SUCCESS;
    PeerId peer_id;
    Bytes data;
    std::string text;
    uint32_t value = 0;
    uint8_t reason = 0;
    bool enabled = false;
    double number = 0;

    bool isData() const {
        return type == Type::NOTIFICATION || type == Type::WRITE_RECEIVED;
    }

    explicit TransportEvent(Type t) : type(t) {}
};

const char* eventTypeToString(TransportEvent::Type type);

class BLEEventChannel {
public:
    static constexpr size_t MAX_PENDING_DATA = 512;

    BLEEventChannel() = default;

    /**
     * @brief Post an event from any thread
     *
     * Data events beyond MAX_PENDING_DATA are dropped; the sender's
     * incomplete packet is then reclaimed by the reassembly timeout.
     * Other events are never dropped.
     *
     * @return true if the event was queued
     */
    bool post(TransportEvent event);

    /**
     * @brief Move every queued event into out (consumer side)
     *
     * Events posted while the caller processes the batch wait for the next
     * drain.
     *
     * @return Number of events taken
     */
    size_t drain(std::deque<TransportEvent>& out);

    size_t size() const;
    bool empty() const { return size() == 0; }
    size_t droppedCount() const;
    void clear();

private:
    mutable std::mutex _mutex;
    std::deque<TransportEvent> _events;
    size_t _pending_data = 0;
    size_t _dropped = 0;
};

}} // namespace BAB::BLE
