/**
 * @file BLEJoinManager.cpp
 * @brief Joiner (central) side of a session
 */

#include "BLEJoinManager.h"
#include "Log.h"
#include "Utilities/OS.h"

using namespace RNS;

namespace BAB { namespace BLE {

BLEJoinManager::BLEJoinManager(IBLEPlatform::Ptr platform, const TransportConfig& config)
    : BLESessionTransport("BLEJoinManager", Role::CENTRAL, platform, config)
{
}

BLEJoinManager::~BLEJoinManager() {
    stop();
}

PlatformConfig BLEJoinManager::platformConfig() const {
    PlatformConfig config;
    config.role = Role::CENTRAL;
    config.device_name = _config.display_name;
    config.preferred_mtu = _config.preferred_mtu;
    config.max_connections = 1;
    return config;
}

TransportError BLEJoinManager::failureForReason(uint8_t reason) {
    if (reason == Reason::LOW_RESOURCES || reason == Reason::CONNECTION_LIMIT) {
        return TransportError::CAPACITY_EXCEEDED;
    }
    return TransportError::CONNECTION_FAILED;
}

//=============================================================================
// Engine API
//=============================================================================

void BLEJoinManager::startScanning(double duration) {
    TransportEvent event(TransportEvent::Type::START_SCAN);
    event.number = duration > 0 ? duration : _config.scan_duration;
    postCommand(event);
}

void BLEJoinManager::stopScanning() {
    postCommand(TransportEvent(TransportEvent::Type::STOP_SCAN));
}

bool BLEJoinManager::isScanning() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _scanning;
}

std::vector<HostDescriptor> BLEJoinManager::discoveredHosts() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _discovered;
}

void BLEJoinManager::connect(const HostDescriptor& host) {
    TransportEvent event(TransportEvent::Type::CONNECT);
    event.host = host;
    postCommand(event);
}

void BLEJoinManager::disconnect() {
    postCommand(TransportEvent(TransportEvent::Type::DISCONNECT));
}

ConnectionState BLEJoinManager::connectionState() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _state;
}

PeerId BLEJoinManager::hostPeerId() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _host_peer_id;
}

//=============================================================================
// Event Dispatch
//=============================================================================

void BLEJoinManager::handleEvent(const TransportEvent& event) {
    using Type = TransportEvent::Type;

    switch (event.type) {
        case Type::START_SCAN: {
            double duration = event.number;
            requestRadio([this, duration]() { doStartScan(duration); }, "scan");
            break;
        }

        case Type::STOP_SCAN:
            _radio.cancelPending();
            doStopScan();
            break;

        case Type::CONNECT:
            doConnect(event.host);
            break;

        case Type::DISCONNECT:
            doDisconnect();
            break;

        case Type::SEND:
            sendPacket(event.data);
            break;

        case Type::SCAN_RESULT:
            onScanResult(event.scan);
            break;

        case Type::SCAN_COMPLETE:
            onScanComplete();
            break;

        case Type::CONNECTED:
            onConnected(event.conn);
            break;

        case Type::CONNECT_FAILED:
            onConnectFailed(event.address, event.reason);
            break;

        case Type::DISCONNECTED:
            onDisconnected(event.conn, event.reason);
            break;

        case Type::SERVICES_DISCOVERED:
            onServicesDiscovered(event.conn, event.discovery);
            break;

        case Type::INFO_READ:
            onInfoRead(event.conn.handle, event.result, event.data);
            break;

        case Type::NOTIFICATION:
            onNotification(event.conn, event.data);
            break;

        case Type::MTU_CHANGED:
            if (_conn.isValid() && event.conn.handle == _conn.handle) {
                _conn.mtu = static_cast<uint16_t>(event.value);
            }
            break;

        default:
            TRACE("BLEJoinManager: Ignoring " + std::string(eventTypeToString(event.type)));
            break;
    }
}

void BLEJoinManager::onLoop(double now) {
    if (_scanning && now >= _scan_deadline) {
        DEBUG("BLEJoinManager: Scan window elapsed");
        doStopScan();
    }

    if (isSettingUp() && now >= _connect_deadline) {
        failConnection(TransportError::CONNECTION_TIMEOUT);
    }
}

//=============================================================================
// Discovery
//=============================================================================

void BLEJoinManager::doStartScan(double duration) {
    if (_scanning) {
        _platform->stopScan();
        _scanning = false;
    }
    _discovered.clear();

    uint32_t duration_ms = static_cast<uint32_t>(duration * 1000);
    if (!_platform->startScan(duration_ms)) {
        ERROR("BLEJoinManager: Failed to start scan");
        reportError(TransportError::RADIO_UNAVAILABLE, "Failed to start scan");
        return;
    }

    _scanning = true;
    _scan_deadline = Utilities::OS::time() + duration;
    INFO("BLEJoinManager: Scanning for " + std::to_string(duration_ms) + " ms");
}

void BLEJoinManager::doStopScan() {
    if (!_scanning) {
        return;
    }

    _platform->stopScan();
    _scanning = false;

    INFO("BLEJoinManager: Scan stopped, " + std::to_string(_discovered.size()) + " hosts found");
    if (_on_scan_complete) {
        _on_scan_complete();
    }
}

void BLEJoinManager::onScanResult(const ScanResult& result) {
    if (!_scanning || !result.has_session_service) {
        return;
    }

    for (HostDescriptor& host : _discovered) {
        if (host.address == result.address) {
            host.rssi = result.rssi;
            return;
        }
    }

    HostDescriptor host;
    host.address = result.address;
    host.name = result.name;
    host.rssi = result.rssi;
    host.discovered_at = Utilities::OS::time();
    _discovered.push_back(host);

    INFO("BLEJoinManager: Found host " + host.name + " at " + host.address.toString() +
         " rssi " + std::to_string(host.rssi));

    if (_on_host_discovered) {
        _on_host_discovered(host);
    }
}

void BLEJoinManager::onScanComplete() {
    // Platform ended the scan on its own
    if (!_scanning) {
        return;
    }
    _scanning = false;

    INFO("BLEJoinManager: Scan complete, " + std::to_string(_discovered.size()) + " hosts found");
    if (_on_scan_complete) {
        _on_scan_complete();
    }
}

//=============================================================================
// Connection Setup
//=============================================================================

bool BLEJoinManager::isSettingUp() const {
    return _state == ConnectionState::CONNECTING ||
           _state == ConnectionState::DISCOVERING_SERVICES ||
           _state == ConnectionState::SUBSCRIBING;
}

void BLEJoinManager::doConnect(const HostDescriptor& host) {
    if (!_radio.isReady()) {
        WARNING("BLEJoinManager: Cannot connect to " + host.name + ", radio " +
                radioStateToString(_radio.getState()));
        if (_on_connection_failed) {
            _on_connection_failed(host, TransportError::RADIO_UNAVAILABLE);
        }
        return;
    }

    if (_state != ConnectionState::DISCONNECTED) {
        WARNING("BLEJoinManager: Already " + std::string(stateToString(_state)) +
                ", ignoring connect to " + host.name);
        if (_on_connection_failed) {
            _on_connection_failed(host, TransportError::CONNECTION_FAILED);
        }
        return;
    }

    doStopScan();

    _target = host;
    _state = ConnectionState::CONNECTING;
    _connect_deadline = Utilities::OS::time() + _config.connection_timeout;

    INFO("BLEJoinManager: Connecting to " + host.name + " at " + host.address.toString());

    uint32_t timeout_ms = static_cast<uint32_t>(_config.connection_timeout * 1000);
    if (!_platform->connect(host.address, timeout_ms)) {
        failConnection(TransportError::CONNECTION_FAILED);
    }
}

void BLEJoinManager::onConnected(const ConnectionHandle& conn) {
    if (_state != ConnectionState::CONNECTING || conn.peer_address != _target.address) {
        WARNING("BLEJoinManager: Unexpected link to " + conn.peer_address.toString() +
                ", disconnecting");
        _platform->disconnect(conn.handle, Reason::LOCAL_HOST_TERMINATED);
        return;
    }

    _conn = conn;
    _state = ConnectionState::DISCOVERING_SERVICES;

    DEBUG("BLEJoinManager: Link up to " + _target.name + " (handle " +
          std::to_string(conn.handle) + ", mtu " + std::to_string(conn.mtu) + ")");

    if (!_platform->discoverServices(conn.handle)) {
        failConnection(TransportError::CONNECTION_FAILED);
    }
}

void BLEJoinManager::onConnectFailed(const BLEAddress& address, uint8_t reason) {
    if (_state != ConnectionState::CONNECTING || address != _target.address) {
        return;
    }

    char buf[64];
    snprintf(buf, sizeof(buf), "BLEJoinManager: Connect refused (reason 0x%02X)", reason);
    DEBUG(buf);

    failConnection(failureForReason(reason));
}

void BLEJoinManager::onServicesDiscovered(const ConnectionHandle& conn, DiscoveryResult result) {
    if (_state != ConnectionState::DISCOVERING_SERVICES || conn.handle != _conn.handle) {
        return;
    }

    switch (result) {
        case DiscoveryResult::SUCCESS:
            break;
        case DiscoveryResult::SERVICE_NOT_FOUND:
            failConnection(TransportError::SERVICE_NOT_FOUND);
            return;
        case DiscoveryResult::CHANNEL_NOT_FOUND:
            failConnection(TransportError::CHANNEL_NOT_FOUND);
            return;
        default:
            failConnection(TransportError::CONNECTION_FAILED);
            return;
    }

    _state = ConnectionState::SUBSCRIBING;

    uint16_t handle = conn.handle;
    bool reading = _platform->readInfo(handle,
        [this, handle](OperationResult read_result, const Bytes& data) {
            TransportEvent event(TransportEvent::Type::INFO_READ);
            event.conn.handle = handle;
            event.result = read_result;
            event.data = data;
            _events.post(event);
        });

    if (!reading) {
        DEBUG("BLEJoinManager: Info channel not readable, using advertised name");
        subscribe();
    }
}

void BLEJoinManager::onInfoRead(uint16_t conn_handle, OperationResult result, const Bytes& data) {
    if (_state != ConnectionState::SUBSCRIBING || conn_handle != _conn.handle) {
        return;
    }

    if (result == OperationResult::SUCCESS && data.size() > 0) {
        _host_display_name = bytesToName(data);
    }
    subscribe();
}

void BLEJoinManager::subscribe() {
    uint16_t handle = _conn.handle;

    if (!_platform->writeInfo(handle, nameToBytes(_config.display_name))) {
        WARNING("BLEJoinManager: Could not publish display name to host");
    }

    if (!_platform->enableNotifications(handle, true)) {
        failConnection(TransportError::CHANNEL_NOT_FOUND);
        return;
    }

    if (_host_display_name.empty()) {
        _host_display_name = _target.name;
    }

    ConnectionHandle current = _platform->getConnection(handle);
    uint16_t mtu = current.isValid() ? current.mtu : _conn.mtu;

    PeerId peer_id = _registry.allocatePeerId(PeerRole::HOST);
    Peer* peer = _registry.registerPeer(peer_id, handle, _target.address,
                                        _host_display_name, PeerRole::HOST, mtu);
    if (!peer) {
        ERROR("BLEJoinManager: Failed to register host " + _target.name);
        failConnection(TransportError::CONNECTION_FAILED);
        return;
    }
    _fragmenters[peer_id] = BLEFragmenter(mtu);

    _host_peer_id = peer_id;
    _state = ConnectionState::READY;

    INFO("BLEJoinManager: Joined " + _host_display_name + " as " + _config.display_name +
         " (peer " + peer_id + ", mtu " + std::to_string(mtu) + ")");

    if (_on_peer_connected) {
        _on_peer_connected(peer_id, _host_display_name);
    }
}

void BLEJoinManager::failConnection(TransportError reason) {
    HostDescriptor host = _target;

    WARNING("BLEJoinManager: Connection to " + host.name + " failed in " +
            stateToString(_state) + ": " + errorDescription(reason));

    if (_conn.isValid()) {
        _platform->disconnect(_conn.handle, Reason::LOCAL_HOST_TERMINATED);
    }
    resetLink();

    if (_on_connection_failed) {
        _on_connection_failed(host, reason);
    }
}

void BLEJoinManager::resetLink() {
    if (!_host_peer_id.empty()) {
        releasePeer(_host_peer_id, false);
    }
    _state = ConnectionState::DISCONNECTED;
    _target = HostDescriptor();
    _conn.reset();
    _host_display_name.clear();
    _host_peer_id.clear();
    _connect_deadline = 0;
    _reassembler.clearAll();
    BLEWriteQueue::clear();
}

//=============================================================================
// Live Link
//=============================================================================

void BLEJoinManager::onDisconnected(const ConnectionHandle& conn, uint8_t reason) {
    bool ours = _conn.isValid() ? conn.handle == _conn.handle
                                : (_state == ConnectionState::CONNECTING &&
                                   conn.peer_address == _target.address);
    if (!ours) {
        TRACE("BLEJoinManager: Stale disconnect for handle " + std::to_string(conn.handle));
        return;
    }

    char buf[80];
    snprintf(buf, sizeof(buf), "BLEJoinManager: Host link down in %s (reason 0x%02X)",
             stateToString(_state), reason);
    DEBUG(buf);

    if (_state == ConnectionState::READY) {
        PeerId peer_id = _host_peer_id;
        releasePeer(peer_id, true);
        _host_peer_id.clear();
        resetLink();
        if (reason == Reason::LOW_RESOURCES) {
            reportError(TransportError::CAPACITY_EXCEEDED, conn.peer_address.toString());
        }
        return;
    }

    // Link already gone; nothing to disconnect
    _conn.reset();
    failConnection(failureForReason(reason));
}

void BLEJoinManager::doDisconnect() {
    if (_state == ConnectionState::DISCONNECTED) {
        return;
    }

    if (_state == ConnectionState::READY) {
        PeerId peer_id = _host_peer_id;
        uint16_t handle = _conn.handle;

        // Engine cleanup first, then the link goes down
        releasePeer(peer_id, true);
        _host_peer_id.clear();
        _platform->disconnect(handle, Reason::REMOTE_USER_TERMINATED);
        INFO("BLEJoinManager: Left session");
    } else {
        DEBUG("BLEJoinManager: Abandoned connection in " + std::string(stateToString(_state)));
        if (_conn.isValid()) {
            _platform->disconnect(_conn.handle, Reason::REMOTE_USER_TERMINATED);
        }
    }

    resetLink();
}

void BLEJoinManager::onNotification(const ConnectionHandle& conn, const Bytes& data) {
    if (_state != ConnectionState::READY || conn.handle != _conn.handle) {
        TRACE("BLEJoinManager: Dropped notification outside session");
        return;
    }

    const Peer* peer = _registry.getPeerById(_host_peer_id);
    if (peer) {
        handleIncomingFragment(*peer, data);
    }
}

void BLEJoinManager::sendPacket(const Bytes& payload) {
    if (_state != ConnectionState::READY) {
        reportError(TransportError::WRITE_FAILURE, "Not connected to a host");
        return;
    }

    Peer* peer = _registry.getPeerById(_host_peer_id);
    if (!peer) {
        reportError(TransportError::UNKNOWN_PEER, _host_peer_id);
        return;
    }
    queuePacket(*peer, payload, false);
}

//=============================================================================
// Radio / Shutdown
//=============================================================================

void BLEJoinManager::onRadioLost(RadioState state) {
    WARNING("BLEJoinManager: Radio lost (" + std::string(radioStateToString(state)) + ")");

    doStopScan();

    if (_state == ConnectionState::READY) {
        releasePeer(_host_peer_id, true);
        _host_peer_id.clear();
        resetLink();
    } else if (isSettingUp()) {
        _conn.reset();
        failConnection(TransportError::RADIO_UNAVAILABLE);
        return;
    }

    reportError(TransportError::RADIO_UNAVAILABLE, radioStateDescription(state));
}

void BLEJoinManager::onStop() {
    _radio.cancelPending();
    doStopScan();
    doDisconnect();
}

}} // namespace BAB::BLE
