/**
 * @file BLESessionTransport.h
 * @brief Machinery shared by the host and joiner connection managers
 *
 * A session transport owns one platform, one peer registry, one reassembler
 * and one paced write queue. Everything that mutates that state runs inside
 * loop(): platform callbacks and engine calls only post TransportEvents to
 * the manager's event channel.
 *
 * Usage (host side, joiner is symmetric):
 *   BLEHostManager host(platform, config);
 *   host.setOnPeerConnected(...);
 *   host.setOnDataReceived(...);
 *   host.start();
 *   host.startAdvertising("Alice");
 *   for (;;) host.loop();          // or host.start_task() on ESP32
 */
#pragma once

#include "BLETypes.h"
#include "BLEPlatform.h"
#include "BLEFragmenter.h"
#include "BLEReassembler.h"
#include "BLEPeerRegistry.h"
#include "BLERadioMonitor.h"
#include "BLEEventChannel.h"
#include "BLEWriteQueue.h"
#include "Bytes.h"

#include <map>
#include <mutex>
#include <vector>

#ifdef ARDUINO
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#endif

namespace BAB { namespace BLE {

class BLESessionTransport : protected BLEWriteQueue {
public:
    BLESessionTransport(const char* name, Role local_role, IBLEPlatform::Ptr platform,
                        const TransportConfig& config);
    virtual ~BLESessionTransport();

    //=========================================================================
    // Configuration (call before start())
    //=========================================================================

    void setDisplayName(const std::string& name);
    const TransportConfig& getConfig() const { return _config; }

    //=========================================================================
    // Engine Callbacks
    //=========================================================================

    void setOnPeerConnected(Callbacks::OnPeerConnected callback) { _on_peer_connected = callback; }
    void setOnPeerDisconnected(Callbacks::OnPeerDisconnected callback) { _on_peer_disconnected = callback; }
    void setOnDataReceived(Callbacks::OnPeerData callback) { _on_data_received = callback; }
    void setOnTransportError(Callbacks::OnTransportError callback) { _on_transport_error = callback; }
    void setOnRadioStateChanged(Callbacks::OnRadioStateChanged callback) { _on_radio_state_changed = callback; }

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Initialize the platform and start accepting events
     * @return true if the platform initialized
     */
    bool start();

    /**
     * @brief Tear down the session and shut the platform down
     *
     * Live peers are reported through onPeerDisconnected first.
     */
    void stop();

    /**
     * @brief Pump the platform, apply queued events, emit paced fragments
     */
    void loop();

    bool isStarted() const { return _started; }

    /**
     * @brief Run loop() on its own FreeRTOS task
     *
     * @param priority Task priority (default 1)
     * @param core Core to pin the task to (default 0, where BT controller runs)
     * @return true if task started successfully
     */
    bool start_task(int priority = 1, int core = 0);

    bool is_task_running() const;

    //=========================================================================
    // Data
    //=========================================================================

    /**
     * @brief Queue a packet for delivery; returns immediately
     */
    void send(const Packet& packet);

    //=========================================================================
    // Status
    //=========================================================================

    RadioState radioState() const { return _radio.getState(); }
    size_t peerCount() const;
    std::vector<Peer> peers() const;
    bool hasPendingReassembly(const PeerId& peer_id) const;
    size_t pendingEvents() const;
    size_t queuedFragments() const;

    std::string toString() const;

protected:
    //=========================================================================
    // Hooks for the role-specific managers
    //=========================================================================

    /**
     * @brief Apply one event; runs inside loop() with the mutex held
     */
    virtual void handleEvent(const TransportEvent& event) = 0;

    /**
     * @brief The radio left POWERED_ON; fail every live peer
     */
    virtual void onRadioLost(RadioState state) = 0;

    /**
     * @brief Release the session; called from stop()
     */
    virtual void onStop() = 0;

    /**
     * @brief Per-iteration deadline checks
     */
    virtual void onLoop(double now) { (void)now; }

    virtual PlatformConfig platformConfig() const = 0;

    //=========================================================================
    // Shared Helpers
    //=========================================================================

    void postCommand(TransportEvent event);

    /**
     * @brief Fragment a payload for one peer and queue the fragments
     * @param via_notify true on the host (notify channel), false on a joiner
     */
    bool queuePacket(Peer& peer, const Bytes& payload, bool via_notify);

    /**
     * @brief Feed one received fragment through the reassembler
     */
    void handleIncomingFragment(const Peer& peer, const Bytes& fragment);

    /**
     * @brief Drop a peer with its buffers and queued fragments
     * @param notify_engine Invoke onPeerDisconnected
     * @return true if the peer was registered
     */
    bool releasePeer(const PeerId& peer_id, bool notify_engine);

    void releaseAllPeers(bool notify_engine);

    void reportError(TransportError error, const std::string& detail);

    /**
     * @brief Query the link's current MTU from the platform
     */
    uint16_t currentMTU(Peer& peer);

    /**
     * @brief Request a radio operation, reporting RADIO_UNAVAILABLE if deferred
     */
    void requestRadio(BLERadioMonitor::Operation op, const std::string& label);

    static std::string bytesToName(const Bytes& data);
    static Bytes nameToBytes(const std::string& name);

    // BLEWriteQueue
    bool executeWrite(const OutgoingFragment& fragment) override;
    void onWriteFailed(const OutgoingFragment& fragment) override;

    //=========================================================================
    // Components
    //=========================================================================

    std::string _name;
    Role _local_role;
    TransportConfig _config;

    IBLEPlatform::Ptr _platform;
    BLEEventChannel _events;
    BLERadioMonitor _radio;
    BLEPeerRegistry _registry;
    BLEReassembler _reassembler;

    // Per-peer fragmenters (keyed by peer id)
    std::map<PeerId, BLEFragmenter> _fragmenters;

    // Engine callbacks
    Callbacks::OnPeerConnected _on_peer_connected = nullptr;
    Callbacks::OnPeerDisconnected _on_peer_disconnected = nullptr;
    Callbacks::OnPeerData _on_data_received = nullptr;
    Callbacks::OnTransportError _on_transport_error = nullptr;
    Callbacks::OnRadioStateChanged _on_radio_state_changed = nullptr;

    // Held by loop() and by status queries; recursive because engine
    // callbacks run inside loop() and may query status
    mutable std::recursive_mutex _mutex;

private:
    void setupCallbacks();
    void clearCallbacks();
    void processEvents();
    void performMaintenance();

    bool _started = false;
    double _last_maintenance = 0;

#ifdef ARDUINO
    TaskHandle_t _task_handle = nullptr;
    static void ble_task(void* param);
#endif
};

}} // namespace BAB::BLE
