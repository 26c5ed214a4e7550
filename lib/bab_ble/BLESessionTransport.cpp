/**
 * @file BLESessionTransport.cpp
 * @brief Shared session machinery for the host and joiner managers
 */

#include "BLESessionTransport.h"
#include "Log.h"
#include "Utilities/OS.h"

#include <algorithm>

#ifdef ARDUINO
#include <Arduino.h>
#endif

using namespace RNS;

namespace BAB { namespace BLE {

BLESessionTransport::BLESessionTransport(const char* name, Role local_role,
                                         IBLEPlatform::Ptr platform,
                                         const TransportConfig& config)
    : _name(name),
      _local_role(local_role),
      _config(config),
      _platform(platform),
      _registry(config.max_peers)
{
    _reassembler.setTimeout(_config.reassembly_timeout);
    setInterFragmentDelay(_config.inter_fragment_delay);

    _reassembler.setDiscardCallback(
        [this](const PeerId& peer_id, uint16_t packet_id, TransportError reason) {
            reportError(reason, peer_id + " packet " + std::to_string(packet_id));
        });

    _radio.setRadioLostHook([this](RadioState state) {
        onRadioLost(state);
    });
}

BLESessionTransport::~BLESessionTransport() {
    // Derived managers call stop() from their own destructors
    if (_platform) {
        if (_platform->isInitialized()) {
            _platform->shutdown();
        }
        clearCallbacks();
    }
}

void BLESessionTransport::setDisplayName(const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _config.display_name = name.substr(0, Limits::MAX_DISPLAY_NAME);
}

//=============================================================================
// Lifecycle
//=============================================================================

bool BLESessionTransport::start() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (_started) {
        return true;
    }

    if (!_platform) {
        _platform = BLEPlatformFactory::create();
    }
    if (!_platform) {
        ERROR(_name + ": No BLE platform available");
        return false;
    }

    setupCallbacks();

    if (!_platform->initialize(platformConfig())) {
        ERROR(_name + ": Failed to initialize " + _platform->getPlatformName());
        return false;
    }

    // Initial radio state is applied by loop() like any later transition
    TransportEvent event(TransportEvent::Type::RADIO_STATE);
    event.radio_state = _platform->getRadioState();
    _events.post(event);

    _started = true;
    _last_maintenance = Utilities::OS::time();

    INFO(_name + ": Started on " + _platform->getPlatformName() + " as " +
         roleToString(_local_role) + ", local address " +
         _platform->getLocalAddress().toString());
    return true;
}

void BLESessionTransport::stop() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (!_started) {
        return;
    }

#ifdef ARDUINO
    // The task blocks on _mutex while we hold it
    if (_task_handle != nullptr) {
        vTaskDelete(_task_handle);
        _task_handle = nullptr;
    }
#endif

    onStop();

    _radio.cancelPending();
    releaseAllPeers(true);
    _reassembler.clearAll();
    BLEWriteQueue::clear();
    _fragmenters.clear();

    // Shutdown reports the dropped links; none of that may reach a later start()
    _platform->shutdown();
    clearCallbacks();
    _events.clear();
    _started = false;

    INFO(_name + ": Stopped");
}

void BLESessionTransport::loop() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (!_started) {
        return;
    }

    double now = Utilities::OS::time();

    _platform->loop();

    processEvents();

    onLoop(now);

    BLEWriteQueue::process(now);

    if (now - _last_maintenance >= Timing::MAINTENANCE_INTERVAL) {
        performMaintenance();
        _last_maintenance = now;
    }
}

//=============================================================================
// Data
//=============================================================================

void BLESessionTransport::send(const Packet& packet) {
    TransportEvent event(TransportEvent::Type::SEND);
    event.peer_id = packet.target_peer_id;
    event.data = packet.payload;
    postCommand(event);
}

//=============================================================================
// Status
//=============================================================================

size_t BLESessionTransport::peerCount() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _registry.count();
}

std::vector<Peer> BLESessionTransport::peers() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _registry.snapshot();
}

bool BLESessionTransport::hasPendingReassembly(const PeerId& peer_id) const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _reassembler.hasPending(peer_id);
}

size_t BLESessionTransport::pendingEvents() const {
    return _events.size();
}

size_t BLESessionTransport::queuedFragments() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return depth();
}

std::string BLESessionTransport::toString() const {
    return _name + "[" + roleToString(_local_role) + "/" + _config.display_name + "]";
}

//=============================================================================
// Shared Helpers
//=============================================================================

void BLESessionTransport::postCommand(TransportEvent event) {
    _events.post(std::move(event));
}

bool BLESessionTransport::queuePacket(Peer& peer, const Bytes& payload, bool via_notify) {
    auto it = _fragmenters.find(peer.id);
    if (it == _fragmenters.end()) {
        it = _fragmenters.emplace(peer.id, BLEFragmenter(peer.mtu)).first;
    }

    // MTU can change on a live link
    BLEFragmenter& fragmenter = it->second;
    fragmenter.setMTU(currentMTU(peer));

    uint16_t packet_id = fragmenter.nextPacketId();
    std::vector<Bytes> fragments = fragmenter.fragment(payload, packet_id);
    if (fragments.empty()) {
        reportError(TransportError::WRITE_FAILURE,
                    peer.id + ": " + std::to_string(payload.size()) + " byte packet exceeds " +
                    std::to_string(fragmenter.getMaxMessageSize()) + " bytes");
        return false;
    }

    double now = Utilities::OS::time();
    uint8_t count = static_cast<uint8_t>(fragments.size());
    for (size_t i = 0; i < fragments.size(); i++) {
        OutgoingFragment out;
        out.peer_id = peer.id;
        out.conn_handle = peer.conn_handle;
        out.packet_id = packet_id;
        out.index = static_cast<uint8_t>(i);
        out.count = count;
        out.notify = via_notify;
        out.data = fragments[i];
        out.queued_at = now;
        enqueue(std::move(out));
    }

    _registry.recordPacketSent(peer.id);

    DEBUG(_name + ": Queued packet " + std::to_string(packet_id) + " (" +
          std::to_string(payload.size()) + " bytes, " + std::to_string(fragments.size()) +
          " frags, mtu " + std::to_string(fragmenter.getMTU()) + ") for " + peer.id);
    return true;
}

void BLESessionTransport::handleIncomingFragment(const Peer& peer, const Bytes& fragment) {
    // Copy: engine callbacks may remove the peer
    PeerId peer_id = peer.id;

    Bytes packet;
    ReassemblyResult result = _reassembler.processFragment(peer_id, fragment, packet);

    switch (result) {
        case ReassemblyResult::COMPLETE:
            _registry.recordPacketReceived(peer_id);
            TRACE(_name + ": Packet of " + std::to_string(packet.size()) + " bytes from " + peer_id);
            if (_on_data_received) {
                _on_data_received(peer_id, packet);
            }
            break;

        case ReassemblyResult::MALFORMED:
            reportError(TransportError::MALFORMED_FRAGMENT,
                        peer_id + ": " + std::to_string(fragment.size()) + " byte fragment");
            break;

        case ReassemblyResult::POOL_FULL:
            WARNING(_name + ": Reassembly pool full, dropped fragment from " + peer_id);
            break;

        case ReassemblyResult::DUPLICATE:
        case ReassemblyResult::STALE:
            TRACE(_name + ": " + reassemblyResultToString(result) + " fragment from " + peer_id);
            break;

        case ReassemblyResult::INCOMPLETE:
        default:
            break;
    }
}

bool BLESessionTransport::releasePeer(const PeerId& peer_id, bool notify_engine) {
    Peer* peer = _registry.getPeerById(peer_id);
    if (!peer) {
        return false;
    }

    PeerId id = peer_id;
    uint16_t handle = peer->conn_handle;

    _reassembler.clearForPeer(id);
    size_t dropped = clearForConnection(handle);
    _fragmenters.erase(id);
    _registry.removePeer(id);

    INFO(_name + ": Peer " + id + " disconnected" +
         (dropped > 0 ? " (" + std::to_string(dropped) + " queued frags dropped)" : ""));

    if (notify_engine && _on_peer_disconnected) {
        _on_peer_disconnected(id);
    }
    return true;
}

void BLESessionTransport::releaseAllPeers(bool notify_engine) {
    for (const Peer& peer : _registry.snapshot()) {
        releasePeer(peer.id, notify_engine);
    }
}

void BLESessionTransport::reportError(TransportError error, const std::string& detail) {
    WARNING(_name + ": " + errorToString(error) + " (" + detail + ")");
    if (_on_transport_error) {
        _on_transport_error(error, detail);
    }
}

uint16_t BLESessionTransport::currentMTU(Peer& peer) {
    ConnectionHandle conn = _platform->getConnection(peer.conn_handle);
    if (conn.isValid() && conn.mtu != peer.mtu) {
        DEBUG(_name + ": MTU for " + peer.id + " now " + std::to_string(conn.mtu));
        peer.mtu = conn.mtu;
    }
    return peer.mtu;
}

void BLESessionTransport::requestRadio(BLERadioMonitor::Operation op, const std::string& label) {
    if (!_radio.requestWhenReady(op, label)) {
        RadioState state = _radio.getState();
        INFO(_name + ": Radio " + radioStateToString(state) + ", " + label +
             " will start when powered on");
        reportError(TransportError::RADIO_UNAVAILABLE, radioStateDescription(state));
    }
}

std::string BLESessionTransport::bytesToName(const Bytes& data) {
    size_t len = std::min(data.size(), Limits::MAX_DISPLAY_NAME);
    return std::string(reinterpret_cast<const char*>(data.data()), len);
}

Bytes BLESessionTransport::nameToBytes(const std::string& name) {
    return Bytes(reinterpret_cast<const uint8_t*>(name.data()), name.size());
}

//=============================================================================
// Write Queue
//=============================================================================

bool BLESessionTransport::executeWrite(const OutgoingFragment& fragment) {
    if (fragment.notify) {
        return _platform->notify(fragment.conn_handle, fragment.data);
    }
    return _platform->write(fragment.conn_handle, fragment.data, false);
}

void BLESessionTransport::onWriteFailed(const OutgoingFragment& fragment) {
    reportError(TransportError::WRITE_FAILURE,
                fragment.peer_id + " packet " + std::to_string(fragment.packet_id) +
                " frag " + std::to_string(fragment.index) + "/" + std::to_string(fragment.count));
}

//=============================================================================
// Event Processing
//=============================================================================

void BLESessionTransport::setupCallbacks() {
    using Type = TransportEvent::Type;

    _platform->setOnRadioStateChanged([this](RadioState state) {
        TransportEvent event(Type::RADIO_STATE);
        event.radio_state = state;
        _events.post(event);
    });

    _platform->setOnScanResult([this](const ScanResult& result) {
        TransportEvent event(Type::SCAN_RESULT);
        event.scan = result;
        _events.post(event);
    });

    _platform->setOnScanComplete([this]() {
        _events.post(TransportEvent(Type::SCAN_COMPLETE));
    });

    _platform->setOnConnected([this](const ConnectionHandle& conn) {
        TransportEvent event(Type::CONNECTED);
        event.conn = conn;
        _events.post(event);
    });

    _platform->setOnConnectFailed([this](const BLEAddress& address, uint8_t reason) {
        TransportEvent event(Type::CONNECT_FAILED);
        event.address = address;
        event.reason = reason;
        _events.post(event);
    });

    _platform->setOnDisconnected([this](const ConnectionHandle& conn, uint8_t reason) {
        TransportEvent event(Type::DISCONNECTED);
        event.conn = conn;
        event.reason = reason;
        _events.post(event);
    });

    _platform->setOnMTUChanged([this](const ConnectionHandle& conn, uint16_t mtu) {
        TransportEvent event(Type::MTU_CHANGED);
        event.conn = conn;
        event.value = mtu;
        _events.post(event);
    });

    _platform->setOnServicesDiscovered([this](const ConnectionHandle& conn, DiscoveryResult result) {
        TransportEvent event(Type::SERVICES_DISCOVERED);
        event.conn = conn;
        event.discovery = result;
        _events.post(event);
    });

    _platform->setOnDataReceived([this](const ConnectionHandle& conn, const Bytes& data) {
        TransportEvent event(Type::NOTIFICATION);
        event.conn = conn;
        event.data = data;
        _events.post(event);
    });

    _platform->setOnCentralConnected([this](const ConnectionHandle& conn) {
        TransportEvent event(Type::CENTRAL_CONNECTED);
        event.conn = conn;
        _events.post(event);
    });

    _platform->setOnCentralDisconnected([this](const ConnectionHandle& conn, uint8_t reason) {
        TransportEvent event(Type::CENTRAL_DISCONNECTED);
        event.conn = conn;
        event.reason = reason;
        _events.post(event);
    });

    _platform->setOnNotifyEnabled([this](const ConnectionHandle& conn, bool enabled) {
        TransportEvent event(Type::SUBSCRIPTION);
        event.conn = conn;
        event.enabled = enabled;
        _events.post(event);
    });

    _platform->setOnWriteReceived([this](const ConnectionHandle& conn, const Bytes& data) {
        TransportEvent event(Type::WRITE_RECEIVED);
        event.conn = conn;
        event.data = data;
        _events.post(event);
    });

    _platform->setOnInfoWritten([this](const ConnectionHandle& conn, const Bytes& data) {
        TransportEvent event(Type::INFO_WRITTEN);
        event.conn = conn;
        event.data = data;
        _events.post(event);
    });
}

void BLESessionTransport::clearCallbacks() {
    _platform->setOnRadioStateChanged(nullptr);
    _platform->setOnScanResult(nullptr);
    _platform->setOnScanComplete(nullptr);
    _platform->setOnConnected(nullptr);
    _platform->setOnConnectFailed(nullptr);
    _platform->setOnDisconnected(nullptr);
    _platform->setOnMTUChanged(nullptr);
    _platform->setOnServicesDiscovered(nullptr);
    _platform->setOnDataReceived(nullptr);
    _platform->setOnCentralConnected(nullptr);
    _platform->setOnCentralDisconnected(nullptr);
    _platform->setOnNotifyEnabled(nullptr);
    _platform->setOnWriteReceived(nullptr);
    _platform->setOnInfoWritten(nullptr);
}

void BLESessionTransport::processEvents() {
    std::deque<TransportEvent> batch;
    if (_events.drain(batch) == 0) {
        return;
    }

    for (const TransportEvent& event : batch) {
        TRACE(_name + ": Event " + eventTypeToString(event.type));

        switch (event.type) {
            case TransportEvent::Type::RADIO_STATE: {
                RadioState old_state = _radio.getState();
                if (old_state != event.radio_state) {
                    INFO(_name + ": Radio " + radioStateToString(old_state) + " -> " +
                         radioStateToString(event.radio_state));
                }
                // May run onRadioLost() or the deferred operation
                _radio.setState(event.radio_state);
                if (old_state != event.radio_state && _on_radio_state_changed) {
                    _on_radio_state_changed(event.radio_state);
                }
                break;
            }

            case TransportEvent::Type::MTU_CHANGED:
                if (_registry.setPeerMTU(event.conn.handle, static_cast<uint16_t>(event.value))) {
                    DEBUG(_name + ": MTU on handle " + std::to_string(event.conn.handle) +
                          " now " + std::to_string(event.value));
                }
                handleEvent(event);
                break;

            default:
                handleEvent(event);
                break;
        }
    }
}

void BLESessionTransport::performMaintenance() {
    size_t expired = _reassembler.checkTimeouts();
    if (expired > 0) {
        DEBUG(_name + ": Expired " + std::to_string(expired) + " incomplete packets");
    }

    size_t dropped = _events.droppedCount();
    if (dropped > 0) {
        TRACE(_name + ": " + std::to_string(dropped) + " data events dropped so far");
    }
}

//=============================================================================
// FreeRTOS Task Support
//=============================================================================

#ifdef ARDUINO

void BLESessionTransport::ble_task(void* param) {
    BLESessionTransport* self = static_cast<BLESessionTransport*>(param);
    Serial.printf("BLE session task started on core %d\n", xPortGetCoreID());

    while (true) {
        self->loop();

        // Yield to other tasks
        vTaskDelay(pdMS_TO_TICKS(5));
    }
}

bool BLESessionTransport::start_task(int priority, int core) {
    if (_task_handle != nullptr) {
        WARNING(_name + ": Task already running");
        return true;
    }

    BaseType_t result = xTaskCreatePinnedToCore(
        ble_task,
        "bab_ble",
        8192,           // 8KB stack
        this,
        priority,
        &_task_handle,
        core
    );

    if (result != pdPASS) {
        ERROR(_name + ": Failed to create BLE task");
        return false;
    }

    Serial.printf("BLE session task created with priority %d on core %d\n", priority, core);
    return true;
}

bool BLESessionTransport::is_task_running() const {
    return _task_handle != nullptr;
}

#else

// Non-Arduino stub
bool BLESessionTransport::start_task(int priority, int core) {
    (void)priority;
    (void)core;
    WARNING(_name + ": Task mode not supported on this platform");
    return false;
}

bool BLESessionTransport::is_task_running() const {
    return false;
}

#endif

}} // namespace BAB::BLE
