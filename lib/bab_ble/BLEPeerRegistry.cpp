/**
 * @file BLEPeerRegistry.cpp
 * @brief Session peer registry implementation
 */

#include "BLEPeerRegistry.h"
#include "Log.h"

using namespace RNS;

namespace BAB { namespace BLE {

BLEPeerRegistry::BLEPeerRegistry(size_t max_peers) {
    setMaxPeers(max_peers);

    // Distinguishes ids of successive sessions on the same device
    uint64_t now_ms = Utilities::OS::ltime();
    _session_tag = static_cast<uint32_t>(now_ms ^ (now_ms >> 32) ^
                                         reinterpret_cast<uintptr_t>(this));

    for (size_t i = 0; i < PEERS_POOL_SIZE; i++) {
        _peers_pool[i].clear();
    }
}

void BLEPeerRegistry::setMaxPeers(size_t max_peers) {
    if (max_peers > PEERS_POOL_SIZE) {
        WARNING("BLEPeerRegistry: max_peers " + std::to_string(max_peers) +
                " exceeds pool, clamping to " + std::to_string(PEERS_POOL_SIZE));
        max_peers = PEERS_POOL_SIZE;
    }
    _max_peers = max_peers;
}

//=============================================================================
// Registration
//=============================================================================

PeerId BLEPeerRegistry::allocatePeerId(PeerRole role) {
    char buf[24];
    snprintf(buf, sizeof(buf), "%c-%08x-%04x", role == PeerRole::HOST ? 'H' : 'J',
             static_cast<unsigned int>(_session_tag),
             static_cast<unsigned int>(_next_serial++));
    return PeerId(buf);
}

Peer* BLEPeerRegistry::registerPeer(const PeerId& peer_id, uint16_t conn_handle, const BLEAddress& address,
                                    const std::string& display_name, PeerRole role, uint16_t mtu) {
    if (peer_id.empty()) {
        ERROR("BLEPeerRegistry: Refusing empty peer id");
        return nullptr;
    }

    if (findSlot(peer_id)) {
        WARNING("BLEPeerRegistry: Peer " + peer_id + " already registered");
        return nullptr;
    }

    if (findSlotByHandle(conn_handle)) {
        WARNING("BLEPeerRegistry: Connection " + std::to_string(conn_handle) + " already has a peer");
        return nullptr;
    }

    if (isFull()) {
        WARNING("BLEPeerRegistry: Full (" + std::to_string(_max_peers) + " peers), rejecting " +
                address.toString());
        return nullptr;
    }

    for (size_t i = 0; i < PEERS_POOL_SIZE; i++) {
        if (!_peers_pool[i].in_use) {
            PeerSlot& slot = _peers_pool[i];
            slot.in_use = true;
            slot.peer = Peer();
            slot.peer.id = peer_id;
            slot.peer.display_name = display_name;
            slot.peer.role = role;
            slot.peer.connected_at = Utilities::OS::time();
            slot.peer.conn_handle = conn_handle;
            slot.peer.address = address;
            slot.peer.mtu = mtu;

            DEBUG("BLEPeerRegistry: Registered " + peer_id + " (" + display_name + ") on handle " +
                  std::to_string(conn_handle));
            return &slot.peer;
        }
    }

    return nullptr;
}

bool BLEPeerRegistry::removePeer(const PeerId& peer_id) {
    PeerSlot* slot = findSlot(peer_id);
    if (!slot) {
        return false;
    }
    DEBUG("BLEPeerRegistry: Removed " + peer_id);
    slot->clear();
    return true;
}

PeerId BLEPeerRegistry::removeByHandle(uint16_t conn_handle) {
    PeerSlot* slot = findSlotByHandle(conn_handle);
    if (!slot) {
        return PeerId();
    }
    PeerId peer_id = slot->peer.id;
    DEBUG("BLEPeerRegistry: Removed " + peer_id + " from handle " + std::to_string(conn_handle));
    slot->clear();
    return peer_id;
}

void BLEPeerRegistry::clear() {
    for (size_t i = 0; i < PEERS_POOL_SIZE; i++) {
        _peers_pool[i].clear();
    }
}

//=============================================================================
// Lookup
//=============================================================================

BLEPeerRegistry::PeerSlot* BLEPeerRegistry::findSlot(const PeerId& peer_id) {
    for (size_t i = 0; i < PEERS_POOL_SIZE; i++) {
        if (_peers_pool[i].in_use && _peers_pool[i].peer.id == peer_id) {
            return &_peers_pool[i];
        }
    }
    return nullptr;
}

const BLEPeerRegistry::PeerSlot* BLEPeerRegistry::findSlot(const PeerId& peer_id) const {
    for (size_t i = 0; i < PEERS_POOL_SIZE; i++) {
        if (_peers_pool[i].in_use && _peers_pool[i].peer.id == peer_id) {
            return &_peers_pool[i];
        }
    }
    return nullptr;
}

BLEPeerRegistry::PeerSlot* BLEPeerRegistry::findSlotByHandle(uint16_t conn_handle) {
    for (size_t i = 0; i < PEERS_POOL_SIZE; i++) {
        if (_peers_pool[i].in_use && _peers_pool[i].peer.conn_handle == conn_handle) {
            return &_peers_pool[i];
        }
    }
    return nullptr;
}

const BLEPeerRegistry::PeerSlot* BLEPeerRegistry::findSlotByHandle(uint16_t conn_handle) const {
    for (size_t i = 0; i < PEERS_POOL_SIZE; i++) {
        if (_peers_pool[i].in_use && _peers_pool[i].peer.conn_handle == conn_handle) {
            return &_peers_pool[i];
        }
    }
    return nullptr;
}

Peer* BLEPeerRegistry::getPeerById(const PeerId& peer_id) {
    PeerSlot* slot = findSlot(peer_id);
    return slot ? &slot->peer : nullptr;
}

const Peer* BLEPeerRegistry::getPeerById(const PeerId& peer_id) const {
    const PeerSlot* slot = findSlot(peer_id);
    return slot ? &slot->peer : nullptr;
}

Peer* BLEPeerRegistry::getPeerByHandle(uint16_t conn_handle) {
    PeerSlot* slot = findSlotByHandle(conn_handle);
    return slot ? &slot->peer : nullptr;
}

const Peer* BLEPeerRegistry::getPeerByHandle(uint16_t conn_handle) const {
    const PeerSlot* slot = findSlotByHandle(conn_handle);
    return slot ? &slot->peer : nullptr;
}

std::vector<Peer*> BLEPeerRegistry::getPeers() {
    std::vector<Peer*> result;
    result.reserve(PEERS_POOL_SIZE);
    for (size_t i = 0; i < PEERS_POOL_SIZE; i++) {
        if (_peers_pool[i].in_use) {
            result.push_back(&_peers_pool[i].peer);
        }
    }
    return result;
}

std::vector<Peer> BLEPeerRegistry::snapshot() const {
    std::vector<Peer> result;
    for (size_t i = 0; i < PEERS_POOL_SIZE; i++) {
        if (_peers_pool[i].in_use) {
            result.push_back(_peers_pool[i].peer);
        }
    }
    return result;
}

size_t BLEPeerRegistry::count() const {
    size_t n = 0;
    for (size_t i = 0; i < PEERS_POOL_SIZE; i++) {
        if (_peers_pool[i].in_use) {
            n++;
        }
    }
    return n;
}

//=============================================================================
// Link Updates
//=============================================================================

bool BLEPeerRegistry::setPeerMTU(uint16_t conn_handle, uint16_t mtu) {
    PeerSlot* slot = findSlotByHandle(conn_handle);
    if (!slot) {
        return false;
    }
    slot->peer.mtu = mtu;
    return true;
}

void BLEPeerRegistry::recordPacketSent(const PeerId& peer_id) {
    PeerSlot* slot = findSlot(peer_id);
    if (slot) {
        slot->peer.packets_sent++;
    }
}

void BLEPeerRegistry::recordPacketReceived(const PeerId& peer_id) {
    PeerSlot* slot = findSlot(peer_id);
    if (slot) {
        slot->peer.packets_received++;
    }
}

}} // namespace BAB::BLE
