/**
 * @file BLEReassembler.cpp
 * @brief Session fragment reassembler implementation
 *
 * Uses fixed-size pools instead of STL containers to bound memory.
 */

#include "BLEReassembler.h"
#include "Log.h"

using namespace RNS;

namespace BAB { namespace BLE {

BLEReassembler::BLEReassembler() {
    for (size_t i = 0; i < MAX_PENDING_REASSEMBLIES; i++) {
        _pending_pool[i].clear();
    }
    for (size_t i = 0; i < MAX_TRACKED_SENDERS; i++) {
        _senders[i].clear();
    }
}

void BLEReassembler::setDiscardCallback(DiscardCallback callback) {
    _discard_callback = callback;
}

void BLEReassembler::setTimeout(double timeout_seconds) {
    _timeout_seconds = timeout_seconds;
}

//=============================================================================
// Pool Lookup
//=============================================================================

BLEReassembler::PendingReassembly* BLEReassembler::findSlot(const PeerId& peer_id, uint16_t packet_id) {
    for (size_t i = 0; i < MAX_PENDING_REASSEMBLIES; i++) {
        if (_pending_pool[i].in_use && _pending_pool[i].packet_id == packet_id &&
            _pending_pool[i].peer_id == peer_id) {
            return &_pending_pool[i];
        }
    }
    return nullptr;
}

const BLEReassembler::PendingReassembly* BLEReassembler::findSlot(const PeerId& peer_id,
                                                                  uint16_t packet_id) const {
    for (size_t i = 0; i < MAX_PENDING_REASSEMBLIES; i++) {
        if (_pending_pool[i].in_use && _pending_pool[i].packet_id == packet_id &&
            _pending_pool[i].peer_id == peer_id) {
            return &_pending_pool[i];
        }
    }
    return nullptr;
}

BLEReassembler::SenderHistory* BLEReassembler::findSender(const PeerId& peer_id) {
    for (size_t i = 0; i < MAX_TRACKED_SENDERS; i++) {
        if (_senders[i].in_use && _senders[i].peer_id == peer_id) {
            return &_senders[i];
        }
    }
    return nullptr;
}

BLEReassembler::SenderHistory* BLEReassembler::allocateSender(const PeerId& peer_id, uint16_t packet_id) {
    for (size_t i = 0; i < MAX_TRACKED_SENDERS; i++) {
        if (!_senders[i].in_use) {
            _senders[i].in_use = true;
            _senders[i].peer_id = peer_id;
            // Offset by one id space so older ids never underflow
            _senders[i].latest = 0x10000u + packet_id;
            _senders[i].completed_mask = 0;
            return &_senders[i];
        }
    }
    return nullptr;
}

//=============================================================================
// Sequence Tracking
//=============================================================================

uint32_t BLEReassembler::unwrap(SenderHistory& sender, uint16_t packet_id) {
    uint16_t latest_id = static_cast<uint16_t>(sender.latest & 0xFFFF);
    uint16_t ahead = static_cast<uint16_t>(packet_id - latest_id);

    if (ahead == 0) {
        return sender.latest;
    }

    if (ahead < 0x8000) {
        sender.completed_mask = (ahead >= COMPLETED_WINDOW) ? 0 : (sender.completed_mask << ahead);
        sender.latest += ahead;
        return sender.latest;
    }

    uint32_t behind = 0x10000u - ahead;
    return sender.latest - behind;
}

bool BLEReassembler::isCompleted(const SenderHistory& sender, uint32_t sequence) const {
    if (sequence > sender.latest) return false;
    uint32_t back = sender.latest - sequence;
    if (back >= COMPLETED_WINDOW) return false;
    return (sender.completed_mask >> back) & 1u;
}

void BLEReassembler::markCompleted(SenderHistory& sender, uint32_t sequence) {
    if (sequence > sender.latest) return;
    uint32_t back = sender.latest - sequence;
    if (back >= COMPLETED_WINDOW) return;
    sender.completed_mask |= (static_cast<uint64_t>(1) << back);
}

//=============================================================================
// Fragment Processing
//=============================================================================

ReassemblyResult BLEReassembler::processFragment(const PeerId& peer_id, const Bytes& fragment,
                                                 Bytes& packet) {
    uint16_t packet_id;
    uint8_t index;
    uint8_t count;
    if (!BLEFragmenter::parseHeader(fragment, packet_id, index, count)) {
        TRACE("BLEReassembler: Invalid fragment header from " + peer_id);
        return ReassemblyResult::MALFORMED;
    }

    double now = Utilities::OS::time();

    SenderHistory* sender = findSender(peer_id);
    if (!sender) {
        sender = allocateSender(peer_id, packet_id);
        if (!sender) {
            WARNING("BLEReassembler: Sender table full, dropping fragment from " + peer_id);
            return ReassemblyResult::POOL_FULL;
        }
    }

    uint32_t sequence = unwrap(*sender, packet_id);

    if (isCompleted(*sender, sequence)) {
        char buf[80];
        snprintf(buf, sizeof(buf), "BLEReassembler: Fragment %u of completed packet %u ignored",
                 index, packet_id);
        TRACE(buf);
        return ReassemblyResult::DUPLICATE;
    }

    PendingReassembly* slot = findSlot(peer_id, packet_id);

    if (slot && slot->sequence != sequence) {
        if (slot->sequence < sequence) {
            // Same 16-bit id, newer packet: the old buffer can never complete
            char buf[96];
            snprintf(buf, sizeof(buf), "BLEReassembler: Packet id %u wrapped with %u/%u fragments pending",
                     packet_id, slot->received_count, slot->fragment_count);
            WARNING(buf);
            slot->clear();
            slot = nullptr;
            if (_discard_callback) {
                _discard_callback(peer_id, packet_id, TransportError::PACKET_ID_WRAPAROUND);
            }
        } else {
            TRACE("BLEReassembler: Late fragment for superseded packet from " + peer_id);
            return ReassemblyResult::STALE;
        }
    }

    if (!slot) {
        if (sender->latest - sequence >= COMPLETED_WINDOW) {
            TRACE("BLEReassembler: Stale fragment from " + peer_id);
            return ReassemblyResult::STALE;
        }
        slot = startReassembly(peer_id, packet_id, sequence, count, now);
        if (!slot) {
            return ReassemblyResult::POOL_FULL;
        }
    }
    else if (count != slot->fragment_count) {
        char buf[80];
        snprintf(buf, sizeof(buf), "BLEReassembler: Fragment count mismatch, expected %u got %u",
                 slot->fragment_count, count);
        TRACE(buf);
        return ReassemblyResult::MALFORMED;
    }

    // Duplicate index overwrites the earlier payload
    slot->fragments[index] = BLEFragmenter::extractPayload(fragment);
    if (!slot->received[index]) {
        slot->received[index] = true;
        slot->received_count++;
    }
    slot->last_activity = now;

    {
        char buf[64];
        snprintf(buf, sizeof(buf), "BLEReassembler: Packet %u fragment %u/%u",
                 packet_id, index + 1, slot->fragment_count);
        TRACE(buf);
    }

    if (slot->received_count < slot->fragment_count) {
        return ReassemblyResult::INCOMPLETE;
    }

    packet = assembleFragments(*slot);
    markCompleted(*sender, sequence);

    {
        char buf[64];
        snprintf(buf, sizeof(buf), "BLEReassembler: Completed packet %u, %zu bytes",
                 packet_id, packet.size());
        TRACE(buf);
    }

    slot->clear();
    return ReassemblyResult::COMPLETE;
}

size_t BLEReassembler::checkTimeouts() {
    return checkTimeouts(Utilities::OS::time());
}

size_t BLEReassembler::checkTimeouts(double now) {
    size_t expired = 0;

    for (size_t i = 0; i < MAX_PENDING_REASSEMBLIES; i++) {
        PendingReassembly& reassembly = _pending_pool[i];
        if (!reassembly.in_use) {
            continue;
        }

        double age = now - reassembly.started_at;
        if (age > _timeout_seconds) {
            {
                char buf[96];
                snprintf(buf, sizeof(buf), "BLEReassembler: Timeout on packet %u, received %u/%u",
                         reassembly.packet_id, reassembly.received_count, reassembly.fragment_count);
                WARNING(buf);
            }

            PeerId peer_id = reassembly.peer_id;
            uint16_t packet_id = reassembly.packet_id;
            reassembly.clear();
            expired++;

            // Invoke after clearing (callback might feed new data)
            if (_discard_callback) {
                _discard_callback(peer_id, packet_id, TransportError::REASSEMBLY_TIMEOUT);
            }
        }
    }

    return expired;
}

size_t BLEReassembler::pendingCount() const {
    size_t count = 0;
    for (size_t i = 0; i < MAX_PENDING_REASSEMBLIES; i++) {
        if (_pending_pool[i].in_use) {
            count++;
        }
    }
    return count;
}

void BLEReassembler::clearForPeer(const PeerId& peer_id) {
    size_t cleared = 0;
    for (size_t i = 0; i < MAX_PENDING_REASSEMBLIES; i++) {
        if (_pending_pool[i].in_use && _pending_pool[i].peer_id == peer_id) {
            _pending_pool[i].clear();
            cleared++;
        }
    }

    SenderHistory* sender = findSender(peer_id);
    if (sender) {
        sender->clear();
    }

    if (cleared > 0) {
        TRACE("BLEReassembler: Discarded " + std::to_string(cleared) + " pending packets for " + peer_id);
    }
}

void BLEReassembler::clearAll() {
    char buf[64];
    snprintf(buf, sizeof(buf), "BLEReassembler: Clearing all pending reassemblies (%zu)", pendingCount());
    TRACE(buf);
    for (size_t i = 0; i < MAX_PENDING_REASSEMBLIES; i++) {
        _pending_pool[i].clear();
    }
    for (size_t i = 0; i < MAX_TRACKED_SENDERS; i++) {
        _senders[i].clear();
    }
}

bool BLEReassembler::hasPending(const PeerId& peer_id) const {
    for (size_t i = 0; i < MAX_PENDING_REASSEMBLIES; i++) {
        if (_pending_pool[i].in_use && _pending_pool[i].peer_id == peer_id) {
            return true;
        }
    }
    return false;
}

bool BLEReassembler::hasPending(const PeerId& peer_id, uint16_t packet_id) const {
    return findSlot(peer_id, packet_id) != nullptr;
}

BLEReassembler::PendingReassembly* BLEReassembler::startReassembly(const PeerId& peer_id, uint16_t packet_id,
                                                                   uint32_t sequence, uint8_t fragment_count,
                                                                   double now) {
    if (pendingCount(peer_id) >= MAX_PENDING_PER_SENDER) {
        evictIdlest(peer_id);
    }

    PendingReassembly* slot = nullptr;
    for (size_t i = 0; i < MAX_PENDING_REASSEMBLIES; i++) {
        if (!_pending_pool[i].in_use) {
            slot = &_pending_pool[i];
            break;
        }
    }
    if (!slot) {
        WARNING("BLEReassembler: Pool full, cannot start new reassembly");
        return nullptr;
    }

    slot->in_use = true;
    slot->peer_id = peer_id;
    slot->packet_id = packet_id;
    slot->sequence = sequence;
    slot->fragment_count = fragment_count;
    slot->received_count = 0;
    slot->started_at = now;
    slot->last_activity = now;

    char buf[64];
    snprintf(buf, sizeof(buf), "BLEReassembler: Starting packet %u, %u fragments", packet_id, fragment_count);
    TRACE(buf);
    return slot;
}

size_t BLEReassembler::pendingCount(const PeerId& peer_id) const {
    size_t count = 0;
    for (size_t i = 0; i < MAX_PENDING_REASSEMBLIES; i++) {
        if (_pending_pool[i].in_use && _pending_pool[i].peer_id == peer_id) {
            count++;
        }
    }
    return count;
}

void BLEReassembler::evictIdlest(const PeerId& peer_id) {
    PendingReassembly* idlest = nullptr;
    for (size_t i = 0; i < MAX_PENDING_REASSEMBLIES; i++) {
        PendingReassembly& reassembly = _pending_pool[i];
        if (!reassembly.in_use || reassembly.peer_id != peer_id) {
            continue;
        }
        if (!idlest || reassembly.last_activity < idlest->last_activity ||
            (reassembly.last_activity == idlest->last_activity && reassembly.sequence < idlest->sequence)) {
            idlest = &reassembly;
        }
    }
    if (!idlest) {
        return;
    }

    char buf[96];
    snprintf(buf, sizeof(buf), "BLEReassembler: Evicting packet %u (%u/%u fragments) from ",
             idlest->packet_id, idlest->received_count, idlest->fragment_count);
    WARNING(std::string(buf) + peer_id);

    uint16_t packet_id = idlest->packet_id;
    idlest->clear();

    if (_discard_callback) {
        _discard_callback(peer_id, packet_id, TransportError::REASSEMBLY_TIMEOUT);
    }
}

Bytes BLEReassembler::assembleFragments(const PendingReassembly& reassembly) {
    size_t total_size = 0;
    for (size_t i = 0; i < reassembly.fragment_count; i++) {
        total_size += reassembly.fragments[i].size();
    }

    Bytes result(total_size);
    if (total_size == 0) {
        return result;
    }
    uint8_t* ptr = result.writable(total_size);
    result.resize(total_size);

    size_t offset = 0;
    for (size_t i = 0; i < reassembly.fragment_count; i++) {
        const Bytes& frag = reassembly.fragments[i];
        if (frag.size() > 0) {
            memcpy(ptr + offset, frag.data(), frag.size());
            offset += frag.size();
        }
    }

    return result;
}

}} // namespace BAB::BLE
