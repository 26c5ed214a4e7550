/**
 * @file BLEReassembler.h
 * @brief Session fragment reassembler (decode side of the packet framer)
 *
 * Reassembles incoming fragments into complete logical messages. Buffers are
 * keyed by (sender peer id, packet id), so a sender may interleave several
 * packets and fragments of one packet may arrive in any order.
 *
 * Per sender the 16-bit packet ids are unwrapped into a 32-bit sequence.
 * That lets the reassembler tell a genuinely new packet that reuses an old
 * id (wraparound) from a late fragment, and remember recently completed
 * packets so duplicated fragments never complete a packet twice.
 *
 * Uses fixed-size pools instead of STL containers to bound memory on
 * embedded systems.
 */
#pragma once

#include "BLETypes.h"
#include "BLEFragmenter.h"
#include "Bytes.h"
#include "Utilities/OS.h"

#include <functional>
#include <cstdint>
#include <cstring>

namespace BAB { namespace BLE {

// Pool sizing constants for fixed-size allocations
static constexpr size_t MAX_PENDING_PER_SENDER = 2;
static constexpr size_t MAX_PENDING_REASSEMBLIES = Limits::MAX_PEERS * MAX_PENDING_PER_SENDER;
static constexpr size_t MAX_TRACKED_SENDERS = 8;
static constexpr uint32_t COMPLETED_WINDOW = 64;

/**
 * @brief Outcome of feeding one fragment to the reassembler
 */
enum class ReassemblyResult : uint8_t {
    INCOMPLETE,      // Stored, packet still missing fragments
    COMPLETE,        // Packet fully reassembled
    DUPLICATE,       // Belongs to a packet that already completed
    MALFORMED,       // Bad header or fragment count mismatch, dropped
    STALE,           // Older than any open or recent packet, dropped
    POOL_FULL        // No buffer available, dropped
};

inline const char* reassemblyResultToString(ReassemblyResult result) {
    switch (result) {
        case ReassemblyResult::INCOMPLETE: return "INCOMPLETE";
        case ReassemblyResult::COMPLETE:   return "COMPLETE";
        case ReassemblyResult::DUPLICATE:  return "DUPLICATE";
        case ReassemblyResult::MALFORMED:  return "MALFORMED";
        case ReassemblyResult::STALE:      return "STALE";
        case ReassemblyResult::POOL_FULL:  return "POOL_FULL";
        default:                           return "UNKNOWN";
    }
}

class BLEReassembler {
public:
    /**
     * @brief Callback for buffers discarded before completion
     * @param peer_id The sending peer
     * @param packet_id The packet whose buffer was dropped
     * @param reason REASSEMBLY_TIMEOUT or PACKET_ID_WRAPAROUND
     */
    using DiscardCallback = std::function<void(const PeerId& peer_id, uint16_t packet_id,
                                               TransportError reason)>;

public:
    BLEReassembler();

    void setDiscardCallback(DiscardCallback callback);

    /**
     * @brief Set the reassembly timeout
     * @param timeout_seconds Seconds an incomplete buffer may stay open
     */
    void setTimeout(double timeout_seconds);
    double getTimeout() const { return _timeout_seconds; }

    /**
     * @brief Process an incoming fragment
     *
     * A duplicate fragment index for an open buffer overwrites the stored
     * payload (last write wins). A fragment whose count disagrees with the
     * open buffer is rejected and the buffer is left untouched.
     *
     * Each sender holds at most MAX_PENDING_PER_SENDER open buffers. A new
     * packet past that quota evicts the sender's least recently active
     * buffer (reported as REASSEMBLY_TIMEOUT), never another sender's.
     *
     * @param peer_id The sending peer
     * @param fragment The received fragment with header
     * @param packet Output: the complete message when COMPLETE is returned
     */
    ReassemblyResult processFragment(const PeerId& peer_id, const Bytes& fragment, Bytes& packet);

    /**
     * @brief Drop incomplete buffers older than the timeout
     *
     * Should be called periodically from the manager loop().
     * @return Number of buffers discarded
     */
    size_t checkTimeouts();
    size_t checkTimeouts(double now);

    size_t pendingCount() const;

    /**
     * @brief Clear all buffers and sequence history for a peer
     */
    void clearForPeer(const PeerId& peer_id);

    void clearAll();

    bool hasPending(const PeerId& peer_id) const;
    bool hasPending(const PeerId& peer_id, uint16_t packet_id) const;

private:
    /**
     * @brief State for a pending (incomplete) packet
     */
    struct PendingReassembly {
        bool in_use = false;
        PeerId peer_id;
        uint16_t packet_id = 0;
        uint32_t sequence = 0;          // Unwrapped packet id
        uint8_t fragment_count = 0;
        uint16_t received_count = 0;
        Bytes fragments[Limits::MAX_FRAGMENTS];
        bool received[Limits::MAX_FRAGMENTS] = {false};
        double started_at = 0.0;
        double last_activity = 0.0;

        void clear() {
            for (size_t i = 0; i < fragment_count; i++) {
                fragments[i] = Bytes();
                received[i] = false;
            }
            in_use = false;
            peer_id.clear();
            packet_id = 0;
            sequence = 0;
            fragment_count = 0;
            received_count = 0;
            started_at = 0.0;
            last_activity = 0.0;
        }
    };

    /**
     * @brief Packet id history for one sender
     */
    struct SenderHistory {
        bool in_use = false;
        PeerId peer_id;
        uint32_t latest = 0;            // Newest unwrapped packet id seen
        uint64_t completed_mask = 0;    // Bit n set: (latest - n) completed

        void clear() {
            in_use = false;
            peer_id.clear();
            latest = 0;
            completed_mask = 0;
        }
    };

    PendingReassembly* findSlot(const PeerId& peer_id, uint16_t packet_id);
    const PendingReassembly* findSlot(const PeerId& peer_id, uint16_t packet_id) const;
    PendingReassembly* startReassembly(const PeerId& peer_id, uint16_t packet_id,
                                       uint32_t sequence, uint8_t fragment_count, double now);
    void evictIdlest(const PeerId& peer_id);
    size_t pendingCount(const PeerId& peer_id) const;

    SenderHistory* findSender(const PeerId& peer_id);
    SenderHistory* allocateSender(const PeerId& peer_id, uint16_t packet_id);

    /**
     * @brief Map a 16-bit packet id onto the sender's 32-bit sequence
     *
     * Ids within half the id space ahead of the newest are treated as newer
     * and advance it.
     */
    uint32_t unwrap(SenderHistory& sender, uint16_t packet_id);
    bool isCompleted(const SenderHistory& sender, uint32_t sequence) const;
    void markCompleted(SenderHistory& sender, uint32_t sequence);

    Bytes assembleFragments(const PendingReassembly& reassembly);

    PendingReassembly _pending_pool[MAX_PENDING_REASSEMBLIES];
    SenderHistory _senders[MAX_TRACKED_SENDERS];

    DiscardCallback _discard_callback = nullptr;

    double _timeout_seconds = Timing::REASSEMBLY_TIMEOUT;
};

}} // namespace BAB::BLE
