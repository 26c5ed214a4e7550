/**
 * @file BLEPeerRegistry.h
 * @brief Maps platform connection handles to logical session peers
 *
 * Owned by exactly one connection manager. A host registers one Peer per
 * subscribed joiner; a joiner registers exactly one Peer for its host.
 *
 * Peer ids are built from a per-registry session tag and a serial number,
 * so an id is never handed out twice within a session, even when the same
 * device reconnects on the same connection handle.
 *
 * Uses a fixed-size pool instead of STL containers.
 */
#pragma once

#include "BLETypes.h"
#include "Bytes.h"
#include "Utilities/OS.h"

#include <vector>
#include <cstdint>

namespace BAB { namespace BLE {

class BLEPeerRegistry {
public:
    static constexpr size_t PEERS_POOL_SIZE = 8;

    struct PeerSlot {
        bool in_use = false;
        Peer peer;

        void clear() {
            in_use = false;
            peer = Peer();
        }
    };

    explicit BLEPeerRegistry(size_t max_peers = Limits::MAX_PEERS);

    /**
     * @brief Set the number of peers accepted (clamped to the pool size)
     */
    void setMaxPeers(size_t max_peers);
    size_t getMaxPeers() const { return _max_peers; }

    //=========================================================================
    // Registration
    //=========================================================================

    /**
     * @brief Produce a fresh peer id, never returned before by this registry
     */
    PeerId allocatePeerId(PeerRole role);

    /**
     * @brief Register a peer on a connection handle
     *
     * @return Pointer to the stored peer, or nullptr if the registry is full
     *         or the handle is already registered
     */
    Peer* registerPeer(const PeerId& peer_id, uint16_t conn_handle, const BLEAddress& address,
                       const std::string& display_name, PeerRole role, uint16_t mtu);

    /**
     * @brief Remove a peer
     * @return true if the peer was registered
     */
    bool removePeer(const PeerId& peer_id);

    /**
     * @brief Remove whichever peer uses a connection handle
     * @return The removed peer's id, or empty if none
     */
    PeerId removeByHandle(uint16_t conn_handle);

    void clear();

    //=========================================================================
    // Lookup
    //=========================================================================

    Peer* getPeerById(const PeerId& peer_id);
    const Peer* getPeerById(const PeerId& peer_id) const;

    Peer* getPeerByHandle(uint16_t conn_handle);
    const Peer* getPeerByHandle(uint16_t conn_handle) const;

    std::vector<Peer*> getPeers();
    std::vector<Peer> snapshot() const;

    size_t count() const;
    bool isFull() const { return count() >= _max_peers; }
    bool canAcceptPeer() const { return !isFull(); }

    //=========================================================================
    // Link Updates
    //=========================================================================

    bool setPeerMTU(uint16_t conn_handle, uint16_t mtu);
    void recordPacketSent(const PeerId& peer_id);
    void recordPacketReceived(const PeerId& peer_id);

private:
    PeerSlot* findSlot(const PeerId& peer_id);
    const PeerSlot* findSlot(const PeerId& peer_id) const;
    PeerSlot* findSlotByHandle(uint16_t conn_handle);
    const PeerSlot* findSlotByHandle(uint16_t conn_handle) const;

    PeerSlot _peers_pool[PEERS_POOL_SIZE];
    size_t _max_peers;

    uint32_t _session_tag;
    uint32_t _next_serial = 1;
};

}} // namespace BAB::BLE
