/**
 * @file BLEHostManager.cpp
 * @brief Host (peripheral) side of a session
 */

#include "BLEHostManager.h"
#include "Log.h"
#include "Utilities/OS.h"

using namespace RNS;

namespace BAB { namespace BLE {

BLEHostManager::BLEHostManager(IBLEPlatform::Ptr platform, const TransportConfig& config)
    : BLESessionTransport("BLEHostManager", Role::PERIPHERAL, platform, config)
{
}

BLEHostManager::~BLEHostManager() {
    stop();
}

PlatformConfig BLEHostManager::platformConfig() const {
    PlatformConfig config;
    config.role = Role::PERIPHERAL;
    config.device_name = advertisedName(_config.display_name);
    config.preferred_mtu = _config.preferred_mtu;
    config.max_connections = static_cast<uint8_t>(_config.max_peers);
    return config;
}

//=============================================================================
// Engine API
//=============================================================================

ServiceHandle BLEHostManager::startAdvertising(const std::string& local_name) {
    ServiceHandle handle;
    handle.id = _next_service_id++;
    if (handle.id == 0) {
        handle.id = _next_service_id++;
    }
    handle.advertised_name = advertisedName(local_name);

    TransportEvent event(TransportEvent::Type::START_ADVERTISING);
    event.text = local_name;
    event.value = handle.id;
    postCommand(event);

    return handle;
}

void BLEHostManager::stopAdvertising() {
    postCommand(TransportEvent(TransportEvent::Type::STOP_ADVERTISING));
}

bool BLEHostManager::isAdvertising() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _advertising;
}

ServiceHandle BLEHostManager::serviceHandle() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _service;
}

//=============================================================================
// Event Dispatch
//=============================================================================

void BLEHostManager::handleEvent(const TransportEvent& event) {
    using Type = TransportEvent::Type;

    switch (event.type) {
        case Type::START_ADVERTISING: {
            std::string name = event.text;
            uint16_t id = static_cast<uint16_t>(event.value);
            requestRadio([this, name, id]() { doStartAdvertising(name, id); }, "advertising");
            break;
        }

        case Type::STOP_ADVERTISING:
            doStopAdvertising();
            break;

        case Type::SEND:
            sendPacket(event.peer_id, event.data);
            break;

        case Type::CENTRAL_CONNECTED:
            onCentralConnected(event.conn);
            break;

        case Type::CENTRAL_DISCONNECTED:
            onCentralDisconnected(event.conn, event.reason);
            break;

        case Type::SUBSCRIPTION:
            onSubscription(event.conn, event.enabled);
            break;

        case Type::WRITE_RECEIVED:
            onWriteReceived(event.conn, event.data);
            break;

        case Type::INFO_WRITTEN:
            onInfoWritten(event.conn, event.data);
            break;

        case Type::MTU_CHANGED:
            onMTUChanged(event.conn, static_cast<uint16_t>(event.value));
            break;

        default:
            TRACE("BLEHostManager: Ignoring " + std::string(eventTypeToString(event.type)));
            break;
    }
}

//=============================================================================
// Advertising
//=============================================================================

void BLEHostManager::doStartAdvertising(const std::string& local_name, uint16_t service_id) {
    std::string advertised = advertisedName(local_name);

    if (_advertising) {
        DEBUG("BLEHostManager: Re-publishing as " + advertised);
        _platform->stopAdvertising();
        _advertising = false;
    }

    _platform->setInfoData(nameToBytes(local_name.substr(0, Limits::MAX_DISPLAY_NAME)));

    if (!_platform->startAdvertising(advertised)) {
        ERROR("BLEHostManager: Failed to start advertising as " + advertised);
        reportError(TransportError::RADIO_UNAVAILABLE, "Failed to start advertising");
        return;
    }

    _advertising = true;
    _local_name = local_name;
    _service.id = service_id;
    _service.advertised_name = advertised;

    INFO("BLEHostManager: Advertising as " + advertised + " (service " +
         std::to_string(service_id) + ")");
}

void BLEHostManager::doStopAdvertising() {
    bool cancelled = _radio.cancelPending();
    if (cancelled) {
        DEBUG("BLEHostManager: Cancelled deferred advertising request");
    }

    if (!_advertising && _links.empty() && _registry.count() == 0) {
        return;
    }

    _platform->stopAdvertising();
    _advertising = false;

    // Engine cleanup first, then the links go down
    releaseAllPeers(true);
    for (const auto& entry : _links) {
        _platform->disconnect(entry.first, Reason::LOCAL_HOST_TERMINATED);
    }

    resetSession();
    INFO("BLEHostManager: Advertising stopped");
}

void BLEHostManager::resetSession() {
    _links.clear();
    _reassembler.clearAll();
    BLEWriteQueue::clear();
    _fragmenters.clear();
    _service = ServiceHandle();
    _local_name.clear();
}

void BLEHostManager::onRadioLost(RadioState state) {
    WARNING("BLEHostManager: Radio lost (" + std::string(radioStateToString(state)) +
            "), dropping " + std::to_string(_registry.count()) + " peers");

    _advertising = false;
    releaseAllPeers(true);
    _platform->disconnectAll();
    resetSession();

    reportError(TransportError::RADIO_UNAVAILABLE, radioStateDescription(state));
}

void BLEHostManager::onStop() {
    doStopAdvertising();
}

//=============================================================================
// Links
//=============================================================================

void BLEHostManager::onCentralConnected(const ConnectionHandle& conn) {
    if (!_advertising) {
        DEBUG("BLEHostManager: Link from " + conn.peer_address.toString() +
              " while not advertising, disconnecting");
        _platform->disconnect(conn.handle, Reason::LOCAL_HOST_TERMINATED);
        return;
    }

    Link link;
    link.conn = conn;
    link.connected_at = Utilities::OS::time();
    _links[conn.handle] = link;

    DEBUG("BLEHostManager: Link up from " + conn.peer_address.toString() +
          " (handle " + std::to_string(conn.handle) + ", mtu " + std::to_string(conn.mtu) + ")");
}

void BLEHostManager::onCentralDisconnected(const ConnectionHandle& conn, uint8_t reason) {
    _links.erase(conn.handle);

    Peer* peer = _registry.getPeerByHandle(conn.handle);
    if (!peer) {
        TRACE("BLEHostManager: Unregistered link " + std::to_string(conn.handle) + " closed");
        return;
    }

    char buf[64];
    snprintf(buf, sizeof(buf), " (reason 0x%02X)", reason);
    DEBUG("BLEHostManager: Link to " + peer->id + " closed" + buf);

    releasePeer(peer->id, true);
}

void BLEHostManager::onSubscription(const ConnectionHandle& conn, bool enabled) {
    Peer* existing = _registry.getPeerByHandle(conn.handle);

    if (!enabled) {
        if (existing) {
            DEBUG("BLEHostManager: " + existing->id + " unsubscribed");
            releasePeer(existing->id, true);
        }
        return;
    }

    if (existing) {
        TRACE("BLEHostManager: " + existing->id + " already subscribed");
        return;
    }

    auto it = _links.find(conn.handle);
    if (it == _links.end()) {
        WARNING("BLEHostManager: Subscription on unknown link " + std::to_string(conn.handle));
        return;
    }

    if (!_registry.canAcceptPeer()) {
        WARNING("BLEHostManager: Session full (" + std::to_string(_registry.count()) +
                " peers), rejecting " + conn.peer_address.toString());
        _links.erase(it);
        _platform->disconnect(conn.handle, Reason::LOW_RESOURCES);
        reportError(TransportError::CAPACITY_EXCEEDED, conn.peer_address.toString());
        return;
    }

    const Link& link = it->second;
    std::string name = link.display_name.empty() ? link.conn.peer_address.toString()
                                                 : link.display_name;

    ConnectionHandle current = _platform->getConnection(conn.handle);
    uint16_t mtu = current.isValid() ? current.mtu : link.conn.mtu;

    PeerId peer_id = _registry.allocatePeerId(PeerRole::JOINER);
    Peer* peer = _registry.registerPeer(peer_id, conn.handle, link.conn.peer_address,
                                        name, PeerRole::JOINER, mtu);
    if (!peer) {
        ERROR("BLEHostManager: Failed to register " + link.conn.peer_address.toString());
        _links.erase(it);
        _platform->disconnect(conn.handle, Reason::LOCAL_HOST_TERMINATED);
        return;
    }
    peer->connected_at = link.connected_at;
    _fragmenters[peer_id] = BLEFragmenter(mtu);

    INFO("BLEHostManager: Peer " + peer_id + " (" + name + ") joined, mtu " +
         std::to_string(mtu) + ", " + std::to_string(_registry.count()) + "/" +
         std::to_string(_registry.getMaxPeers()) + " peers");

    if (_on_peer_connected) {
        _on_peer_connected(peer_id, name);
    }
}

void BLEHostManager::onWriteReceived(const ConnectionHandle& conn, const Bytes& data) {
    Peer* peer = _registry.getPeerByHandle(conn.handle);
    if (!peer) {
        TRACE("BLEHostManager: Dropped write from unsubscribed link " +
              std::to_string(conn.handle));
        return;
    }
    handleIncomingFragment(*peer, data);
}

void BLEHostManager::onInfoWritten(const ConnectionHandle& conn, const Bytes& data) {
    std::string name = bytesToName(data);

    auto it = _links.find(conn.handle);
    if (it != _links.end()) {
        it->second.display_name = name;
    }

    Peer* peer = _registry.getPeerByHandle(conn.handle);
    if (peer) {
        peer->display_name = name;
    }

    DEBUG("BLEHostManager: Handle " + std::to_string(conn.handle) + " is \"" + name + "\"");
}

void BLEHostManager::onMTUChanged(const ConnectionHandle& conn, uint16_t mtu) {
    auto it = _links.find(conn.handle);
    if (it != _links.end()) {
        it->second.conn.mtu = mtu;
    }
}

//=============================================================================
// Data
//=============================================================================

void BLEHostManager::sendPacket(const PeerId& target, const Bytes& payload) {
    if (!target.empty()) {
        Peer* peer = _registry.getPeerById(target);
        if (!peer) {
            reportError(TransportError::UNKNOWN_PEER, target);
            return;
        }
        queuePacket(*peer, payload, true);
        return;
    }

    std::vector<Peer*> peers = _registry.getPeers();
    if (peers.empty()) {
        TRACE("BLEHostManager: Broadcast with no peers dropped");
        return;
    }
    for (Peer* peer : peers) {
        queuePacket(*peer, payload, true);
    }
}

}} // namespace BAB::BLE
