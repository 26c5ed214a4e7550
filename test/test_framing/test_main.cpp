/**
 * @file test_main.cpp
 * @brief Unit tests for the session framing and bookkeeping components
 *
 * Covers:
 * - BLETypes: constants, names, address helpers
 * - BLEFragmenter: header layout, fragment sizing, limits
 * - BLEReassembler: ordering, duplicates, mismatches, wraparound, timeouts
 * - BLERadioMonitor: deferred request slot and radio-lost hook
 * - BLEPeerRegistry: ids, capacity, lookups
 * - BLEEventChannel: data back-pressure
 * - BLEWriteQueue: pacing and failure handling
 */

#include <unity.h>

#include <Utilities/OS.h>
#include "BLETypes.h"
#include "BLEFragmenter.h"
#include "BLEReassembler.h"
#include "BLERadioMonitor.h"
#include "BLEPeerRegistry.h"
#include "BLEEventChannel.h"
#include "BLEWriteQueue.h"
#include "Bytes.h"
#include "Log.h"

#include <set>
#include <utility>
#include <vector>
#include <cstring>

using namespace BAB::BLE;

// Discard callback capture
static std::vector<TransportError> g_discards;
static std::vector<uint16_t> g_discarded_ids;

static RNS::Bytes makePayload(size_t size, uint8_t seed = 0) {
    RNS::Bytes data(size);
    uint8_t* ptr = data.writable(size);
    data.resize(size);
    for (size_t i = 0; i < size; i++) {
        ptr[i] = static_cast<uint8_t>((i * 31 + seed) & 0xFF);
    }
    return data;
}

static void recordDiscard(const PeerId& peer_id, uint16_t packet_id, TransportError reason) {
    (void)peer_id;
    g_discards.push_back(reason);
    g_discarded_ids.push_back(packet_id);
}

//=============================================================================
// BLETypes
//=============================================================================

void testSessionConstants() {
    TEST_ASSERT_EQUAL_size_t(4, Fragment::HEADER_SIZE);
    TEST_ASSERT_EQUAL_size_t(4, Limits::MAX_PEERS);
    TEST_ASSERT_EQUAL_size_t(255, Limits::MAX_FRAGMENTS);
    TEST_ASSERT_EQUAL_size_t(32, Limits::MAX_DISPLAY_NAME);
    TEST_ASSERT_FLOAT_WITHIN(0.001, 30.0, Timing::REASSEMBLY_TIMEOUT);
    TEST_ASSERT_FLOAT_WITHIN(0.001, 30.0, Timing::CONNECTION_TIMEOUT);
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 0.010, Timing::INTER_FRAGMENT_DELAY);
    TEST_ASSERT_EQUAL_size_t(181, getPayloadSize(185));
    TEST_ASSERT_EQUAL_size_t(0, getPayloadSize(3));
}

void testAdvertisedName() {
    TEST_ASSERT_EQUAL_STRING("BAB-Alice", advertisedName("Alice").c_str());
    TEST_ASSERT_EQUAL_STRING("BAB-Alexande", advertisedName("Alexander the Great").c_str());
    TEST_ASSERT_EQUAL_STRING("BAB-", advertisedName("").c_str());
}

void testBLEAddressString() {
    uint8_t raw[] = {0xC0, 0xBA, 0xB0, 0x00, 0x01, 0x2F};
    BLEAddress addr(raw, 1);
    TEST_ASSERT_EQUAL_STRING("C0:BA:B0:00:01:2F", addr.toString().c_str());

    BLEAddress parsed = BLEAddress::fromString("C0:BA:B0:00:01:2F");
    TEST_ASSERT_EQUAL_MEMORY(raw, parsed.addr, 6);
    TEST_ASSERT_TRUE(BLEAddress().isZero());
    TEST_ASSERT_FALSE(addr.isZero());
}

void testConnectionFailureClassification() {
    TEST_ASSERT_TRUE(isConnectionFailure(TransportError::CAPACITY_EXCEEDED));
    TEST_ASSERT_TRUE(isConnectionFailure(TransportError::SERVICE_NOT_FOUND));
    TEST_ASSERT_TRUE(isConnectionFailure(TransportError::CONNECTION_TIMEOUT));
    TEST_ASSERT_FALSE(isConnectionFailure(TransportError::MALFORMED_FRAGMENT));
    TEST_ASSERT_FALSE(isConnectionFailure(TransportError::WRITE_FAILURE));
    TEST_ASSERT_EQUAL_STRING("Maximum number of players reached",
                             errorDescription(TransportError::CAPACITY_EXCEEDED));
}

//=============================================================================
// BLEFragmenter
//=============================================================================

void testFragmentHeaderFormat() {
    RNS::Bytes frag = BLEFragmenter::createFragment(0x1234, 2, 5, RNS::Bytes("abc"));

    TEST_ASSERT_EQUAL_size_t(7, frag.size());
    TEST_ASSERT_EQUAL_UINT8(0x12, frag.data()[0]);  // packet id, big-endian
    TEST_ASSERT_EQUAL_UINT8(0x34, frag.data()[1]);
    TEST_ASSERT_EQUAL_UINT8(2, frag.data()[2]);
    TEST_ASSERT_EQUAL_UINT8(5, frag.data()[3]);
    TEST_ASSERT_EQUAL_MEMORY("abc", frag.data() + 4, 3);

    uint16_t packet_id;
    uint8_t index, count;
    TEST_ASSERT_TRUE(BLEFragmenter::parseHeader(frag, packet_id, index, count));
    TEST_ASSERT_EQUAL_UINT16(0x1234, packet_id);
    TEST_ASSERT_EQUAL_UINT8(2, index);
    TEST_ASSERT_EQUAL_UINT8(5, count);

    RNS::Bytes payload = BLEFragmenter::extractPayload(frag);
    TEST_ASSERT_EQUAL_size_t(3, payload.size());
}

void testFragmentValidation() {
    // Too short
    TEST_ASSERT_FALSE(BLEFragmenter::isValidFragment(RNS::Bytes("abc")));
    // Zero count
    TEST_ASSERT_FALSE(BLEFragmenter::isValidFragment(
        BLEFragmenter::createFragment(1, 0, 0, RNS::Bytes("x"))));
    // Index beyond count
    TEST_ASSERT_FALSE(BLEFragmenter::isValidFragment(
        BLEFragmenter::createFragment(1, 3, 3, RNS::Bytes("x"))));
    // Header only is a valid empty fragment
    TEST_ASSERT_TRUE(BLEFragmenter::isValidFragment(
        BLEFragmenter::createFragment(1, 0, 1, RNS::Bytes())));
}

void testFragmenterLargeMessage() {
    BLEFragmenter fragmenter(185);
    TEST_ASSERT_EQUAL_size_t(181, fragmenter.getPayloadSize());

    RNS::Bytes data = makePayload(10000);
    std::vector<RNS::Bytes> fragments = fragmenter.fragment(data, 7);

    TEST_ASSERT_EQUAL_size_t(56, fragments.size());
    size_t total = 0;
    for (size_t i = 0; i < fragments.size(); i++) {
        TEST_ASSERT_TRUE(fragments[i].size() <= 185);

        uint16_t packet_id;
        uint8_t index, count;
        TEST_ASSERT_TRUE(BLEFragmenter::parseHeader(fragments[i], packet_id, index, count));
        TEST_ASSERT_EQUAL_UINT16(7, packet_id);
        TEST_ASSERT_EQUAL_UINT8(i, index);
        TEST_ASSERT_EQUAL_UINT8(56, count);
        total += fragments[i].size() - Fragment::HEADER_SIZE;
    }
    TEST_ASSERT_EQUAL_size_t(10000, total);

    // Last fragment carries the remainder
    TEST_ASSERT_EQUAL_size_t(45 + Fragment::HEADER_SIZE, fragments.back().size());
}

void testFragmenterEmptyMessage() {
    BLEFragmenter fragmenter(185);
    std::vector<RNS::Bytes> fragments = fragmenter.fragment(RNS::Bytes(), 3);

    TEST_ASSERT_EQUAL_size_t(1, fragments.size());
    TEST_ASSERT_EQUAL_size_t(Fragment::HEADER_SIZE, fragments[0].size());
    TEST_ASSERT_EQUAL_UINT8(0, fragments[0].data()[2]);
    TEST_ASSERT_EQUAL_UINT8(1, fragments[0].data()[3]);
}

void testFragmenterRejectsOversizedMessage() {
    BLEFragmenter fragmenter(MTU::MINIMUM);
    TEST_ASSERT_EQUAL_size_t(19 * 255, fragmenter.getMaxMessageSize());

    TEST_ASSERT_EQUAL_size_t(255, fragmenter.fragment(makePayload(19 * 255), 1).size());
    TEST_ASSERT_TRUE(fragmenter.fragment(makePayload(19 * 255 + 1), 1).empty());
}

void testFragmenterMTUClamp() {
    BLEFragmenter fragmenter(185);
    fragmenter.setMTU(2);
    TEST_ASSERT_EQUAL_size_t(Fragment::MIN_MTU, fragmenter.getMTU());
    TEST_ASSERT_EQUAL_size_t(1, fragmenter.getPayloadSize());

    fragmenter.setMTU(100);
    TEST_ASSERT_EQUAL_size_t(96, fragmenter.getPayloadSize());
    TEST_ASSERT_EQUAL_size_t(2, fragmenter.calculateFragmentCount(97));
    TEST_ASSERT_FALSE(fragmenter.needsFragmentation(makePayload(96)));
    TEST_ASSERT_TRUE(fragmenter.needsFragmentation(makePayload(97)));
}

void testPacketIdWraps() {
    BLEFragmenter fragmenter;
    for (uint32_t i = 0; i < 0xFFFF; i++) {
        fragmenter.nextPacketId();
    }
    TEST_ASSERT_EQUAL_UINT16(0xFFFF, fragmenter.nextPacketId());
    TEST_ASSERT_EQUAL_UINT16(0, fragmenter.nextPacketId());
}

//=============================================================================
// BLEReassembler
//=============================================================================

void testReassemblerOutOfOrder() {
    BLEReassembler reassembler;
    BLEFragmenter fragmenter(100);

    RNS::Bytes data = makePayload(1000, 5);
    std::vector<RNS::Bytes> fragments = fragmenter.fragment(data, 42);
    TEST_ASSERT_EQUAL_size_t(11, fragments.size());

    RNS::Bytes packet;
    for (size_t i = fragments.size(); i-- > 1;) {
        TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE,
                          reassembler.processFragment("J-1", fragments[i], packet));
    }
    TEST_ASSERT_TRUE(reassembler.hasPending("J-1", 42));

    TEST_ASSERT_EQUAL(ReassemblyResult::COMPLETE,
                      reassembler.processFragment("J-1", fragments[0], packet));
    TEST_ASSERT_EQUAL_size_t(1000, packet.size());
    TEST_ASSERT_EQUAL_MEMORY(data.data(), packet.data(), 1000);
    TEST_ASSERT_EQUAL_size_t(0, reassembler.pendingCount());
}

void testReassemblerAnyOrderRoundTrip() {
    const uint16_t mtus[] = {5, 23, 64, 185};
    const size_t sizes[] = {200, 1000, 3000, 10000};

    uint32_t seed = 12345;
    for (size_t m = 0; m < 4; m++) {
        BLEReassembler reassembler;
        BLEFragmenter fragmenter(mtus[m]);

        RNS::Bytes data = makePayload(sizes[m], static_cast<uint8_t>(m));
        std::vector<RNS::Bytes> fragments = fragmenter.fragment(data, static_cast<uint16_t>(m + 1));
        TEST_ASSERT_EQUAL_size_t(fragmenter.calculateFragmentCount(sizes[m]), fragments.size());

        // Deterministic shuffle
        for (size_t i = fragments.size(); i > 1; i--) {
            seed = seed * 1103515245u + 12345u;
            size_t j = (seed >> 16) % i;
            std::swap(fragments[i - 1], fragments[j]);
        }

        RNS::Bytes packet;
        for (size_t i = 0; i + 1 < fragments.size(); i++) {
            TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE,
                              reassembler.processFragment("H-1", fragments[i], packet));
        }
        TEST_ASSERT_EQUAL(ReassemblyResult::COMPLETE,
                          reassembler.processFragment("H-1", fragments.back(), packet));
        TEST_ASSERT_EQUAL_size_t(sizes[m], packet.size());
        TEST_ASSERT_EQUAL_MEMORY(data.data(), packet.data(), sizes[m]);
    }
}

void testReassemblerInterleavedPackets() {
    BLEReassembler reassembler;

    RNS::Bytes a0 = BLEFragmenter::createFragment(1, 0, 2, RNS::Bytes("AA"));
    RNS::Bytes a1 = BLEFragmenter::createFragment(1, 1, 2, RNS::Bytes("aa"));
    RNS::Bytes b0 = BLEFragmenter::createFragment(2, 0, 2, RNS::Bytes("BB"));
    RNS::Bytes b1 = BLEFragmenter::createFragment(2, 1, 2, RNS::Bytes("bb"));

    RNS::Bytes packet;
    TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE, reassembler.processFragment("J-1", a0, packet));
    TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE, reassembler.processFragment("J-1", b0, packet));
    // Same packet id from another sender is a separate buffer
    TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE, reassembler.processFragment("J-2", a0, packet));
    TEST_ASSERT_EQUAL_size_t(3, reassembler.pendingCount());

    TEST_ASSERT_EQUAL(ReassemblyResult::COMPLETE, reassembler.processFragment("J-1", b1, packet));
    TEST_ASSERT_EQUAL_MEMORY("BBbb", packet.data(), 4);
    TEST_ASSERT_EQUAL(ReassemblyResult::COMPLETE, reassembler.processFragment("J-1", a1, packet));
    TEST_ASSERT_EQUAL_MEMORY("AAaa", packet.data(), 4);

    TEST_ASSERT_TRUE(reassembler.hasPending("J-2"));
    TEST_ASSERT_FALSE(reassembler.hasPending("J-1"));
}

void testReassemblerDuplicates() {
    BLEReassembler reassembler;

    RNS::Bytes f0 = BLEFragmenter::createFragment(9, 0, 2, RNS::Bytes("xx"));
    RNS::Bytes f0_again = BLEFragmenter::createFragment(9, 0, 2, RNS::Bytes("HE"));
    RNS::Bytes f1 = BLEFragmenter::createFragment(9, 1, 2, RNS::Bytes("LO"));

    RNS::Bytes packet;
    TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE, reassembler.processFragment("H-1", f0, packet));
    // Repeated index overwrites and does not count twice
    TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE, reassembler.processFragment("H-1", f0_again, packet));
    TEST_ASSERT_EQUAL(ReassemblyResult::COMPLETE, reassembler.processFragment("H-1", f1, packet));
    TEST_ASSERT_EQUAL_size_t(4, packet.size());
    TEST_ASSERT_EQUAL_MEMORY("HELO", packet.data(), 4);

    // Late copy of a delivered packet never delivers again
    TEST_ASSERT_EQUAL(ReassemblyResult::DUPLICATE, reassembler.processFragment("H-1", f1, packet));
    TEST_ASSERT_EQUAL(ReassemblyResult::DUPLICATE, reassembler.processFragment("H-1", f0, packet));
    TEST_ASSERT_EQUAL_size_t(0, reassembler.pendingCount());
}

void testReassemblerRejectsMalformed() {
    BLEReassembler reassembler;
    RNS::Bytes packet;

    TEST_ASSERT_EQUAL(ReassemblyResult::MALFORMED,
                      reassembler.processFragment("J-1", RNS::Bytes("ab"), packet));
    TEST_ASSERT_EQUAL(ReassemblyResult::MALFORMED,
                      reassembler.processFragment("J-1", BLEFragmenter::createFragment(4, 2, 2, RNS::Bytes("z")), packet));

    // Count disagrees with the open buffer; buffer left untouched
    TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE,
                      reassembler.processFragment("J-1", BLEFragmenter::createFragment(5, 0, 3, RNS::Bytes("a")), packet));
    TEST_ASSERT_EQUAL(ReassemblyResult::MALFORMED,
                      reassembler.processFragment("J-1", BLEFragmenter::createFragment(5, 1, 4, RNS::Bytes("b")), packet));
    TEST_ASSERT_TRUE(reassembler.hasPending("J-1", 5));

    TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE,
                      reassembler.processFragment("J-1", BLEFragmenter::createFragment(5, 1, 3, RNS::Bytes("b")), packet));
    TEST_ASSERT_EQUAL(ReassemblyResult::COMPLETE,
                      reassembler.processFragment("J-1", BLEFragmenter::createFragment(5, 2, 3, RNS::Bytes("c")), packet));
    TEST_ASSERT_EQUAL_MEMORY("abc", packet.data(), 3);
}

void testReassemblerPacketIdWraparound() {
    BLEReassembler reassembler;
    reassembler.setDiscardCallback(recordDiscard);
    RNS::Bytes packet;

    // Packet 5 stays incomplete
    TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE,
                      reassembler.processFragment("J-1", BLEFragmenter::createFragment(5, 0, 2, RNS::Bytes("old")), packet));

    // The sender moves through the whole id space
    TEST_ASSERT_EQUAL(ReassemblyResult::COMPLETE,
                      reassembler.processFragment("J-1", BLEFragmenter::createFragment(0x7005, 0, 1, RNS::Bytes("1")), packet));
    TEST_ASSERT_EQUAL(ReassemblyResult::COMPLETE,
                      reassembler.processFragment("J-1", BLEFragmenter::createFragment(0xE005, 0, 1, RNS::Bytes("2")), packet));

    // Id 5 again is a new packet; the stale buffer is discarded
    TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE,
                      reassembler.processFragment("J-1", BLEFragmenter::createFragment(5, 0, 2, RNS::Bytes("ne")), packet));
    TEST_ASSERT_EQUAL_size_t(1, g_discards.size());
    TEST_ASSERT_EQUAL(TransportError::PACKET_ID_WRAPAROUND, g_discards[0]);
    TEST_ASSERT_EQUAL_UINT16(5, g_discarded_ids[0]);

    TEST_ASSERT_EQUAL(ReassemblyResult::COMPLETE,
                      reassembler.processFragment("J-1", BLEFragmenter::createFragment(5, 1, 2, RNS::Bytes("w")), packet));
    TEST_ASSERT_EQUAL_size_t(3, packet.size());
    TEST_ASSERT_EQUAL_MEMORY("new", packet.data(), 3);
}

void testReassemblerTimeout() {
    BLEReassembler reassembler;
    reassembler.setTimeout(5.0);
    reassembler.setDiscardCallback(recordDiscard);

    RNS::Bytes packet;
    reassembler.processFragment("J-1", BLEFragmenter::createFragment(3, 0, 3, RNS::Bytes("partial")), packet);
    TEST_ASSERT_EQUAL_size_t(1, reassembler.pendingCount());

    double now = RNS::Utilities::OS::time();
    TEST_ASSERT_EQUAL_size_t(0, reassembler.checkTimeouts(now + 1.0));
    TEST_ASSERT_EQUAL_size_t(1, reassembler.pendingCount());

    TEST_ASSERT_EQUAL_size_t(1, reassembler.checkTimeouts(now + 10.0));
    TEST_ASSERT_EQUAL_size_t(0, reassembler.pendingCount());
    TEST_ASSERT_EQUAL_size_t(1, g_discards.size());
    TEST_ASSERT_EQUAL(TransportError::REASSEMBLY_TIMEOUT, g_discards[0]);
}

void testReassemblerStalledSenderDoesNotBlockOthers() {
    BLEReassembler reassembler;
    reassembler.setDiscardCallback(recordDiscard);
    RNS::Bytes packet;

    // J-A starts eight packets and never finishes any of them
    for (uint16_t id = 0; id < 8; id++) {
        TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE,
                          reassembler.processFragment("J-A", BLEFragmenter::createFragment(id, 0, 2, RNS::Bytes("a")), packet));
    }
    TEST_ASSERT_EQUAL_size_t(MAX_PENDING_PER_SENDER, reassembler.pendingCount());
    TEST_ASSERT_EQUAL_size_t(8 - MAX_PENDING_PER_SENDER, g_discards.size());
    for (size_t i = 0; i < g_discards.size(); i++) {
        TEST_ASSERT_EQUAL(TransportError::REASSEMBLY_TIMEOUT, g_discards[i]);
        TEST_ASSERT_EQUAL_UINT16(i, g_discarded_ids[i]);
    }
    TEST_ASSERT_TRUE(reassembler.hasPending("J-A", 6));
    TEST_ASSERT_TRUE(reassembler.hasPending("J-A", 7));

    // Other senders are unaffected
    TEST_ASSERT_EQUAL(ReassemblyResult::COMPLETE,
                      reassembler.processFragment("J-B", BLEFragmenter::createFragment(0, 0, 1, RNS::Bytes("hello")), packet));
    TEST_ASSERT_EQUAL_MEMORY("hello", packet.data(), 5);

    const char* others[] = {"J-B", "J-C", "J-D"};
    for (size_t p = 0; p < 3; p++) {
        for (uint16_t id = 10; id < 10 + MAX_PENDING_PER_SENDER; id++) {
            TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE,
                              reassembler.processFragment(others[p], BLEFragmenter::createFragment(id, 0, 2, RNS::Bytes("x")), packet));
        }
    }
    TEST_ASSERT_EQUAL_size_t(MAX_PENDING_REASSEMBLIES, reassembler.pendingCount());
    TEST_ASSERT_EQUAL_size_t(8 - MAX_PENDING_PER_SENDER, g_discards.size());

    // A stalled sender still completes its own newest packet
    TEST_ASSERT_EQUAL(ReassemblyResult::COMPLETE,
                      reassembler.processFragment("J-A", BLEFragmenter::createFragment(7, 1, 2, RNS::Bytes("b")), packet));
    TEST_ASSERT_EQUAL_MEMORY("ab", packet.data(), 2);
    TEST_ASSERT_EQUAL(ReassemblyResult::COMPLETE,
                      reassembler.processFragment("J-C", BLEFragmenter::createFragment(11, 1, 2, RNS::Bytes("y")), packet));
    TEST_ASSERT_EQUAL_MEMORY("xy", packet.data(), 2);
}

void testReassemblerClearForPeer() {
    BLEReassembler reassembler;
    RNS::Bytes packet;

    reassembler.processFragment("J-1", BLEFragmenter::createFragment(1, 0, 2, RNS::Bytes("A")), packet);
    reassembler.processFragment("J-2", BLEFragmenter::createFragment(1, 0, 2, RNS::Bytes("B")), packet);
    TEST_ASSERT_EQUAL_size_t(2, reassembler.pendingCount());

    reassembler.clearForPeer("J-1");
    TEST_ASSERT_EQUAL_size_t(1, reassembler.pendingCount());
    TEST_ASSERT_FALSE(reassembler.hasPending("J-1"));
    TEST_ASSERT_TRUE(reassembler.hasPending("J-2"));

    // The rest of J-1's packet starts a fresh buffer that cannot complete alone
    TEST_ASSERT_EQUAL(ReassemblyResult::INCOMPLETE,
                      reassembler.processFragment("J-1", BLEFragmenter::createFragment(1, 1, 2, RNS::Bytes("a")), packet));
}

//=============================================================================
// BLERadioMonitor
//=============================================================================

void testRadioMonitorReplaysLatestRequest() {
    BLERadioMonitor monitor;
    std::vector<std::string> ran;

    TEST_ASSERT_FALSE(monitor.requestWhenReady([&ran]() { ran.push_back("first"); }, "first"));
    TEST_ASSERT_FALSE(monitor.requestWhenReady([&ran]() { ran.push_back("second"); }, "second"));
    TEST_ASSERT_TRUE(monitor.hasPending());
    TEST_ASSERT_EQUAL_STRING("second", monitor.pendingLabel().c_str());

    monitor.setState(RadioState::POWERED_OFF);
    TEST_ASSERT_TRUE(ran.empty());

    monitor.setState(RadioState::POWERED_ON);
    TEST_ASSERT_EQUAL_size_t(1, ran.size());
    TEST_ASSERT_EQUAL_STRING("second", ran[0].c_str());
    TEST_ASSERT_FALSE(monitor.hasPending());

    // Ready: runs immediately
    TEST_ASSERT_TRUE(monitor.requestWhenReady([&ran]() { ran.push_back("now"); }, "now"));
    TEST_ASSERT_EQUAL_size_t(2, ran.size());
}

void testRadioMonitorLostHook() {
    BLERadioMonitor monitor;
    std::vector<RadioState> lost;
    monitor.setRadioLostHook([&lost](RadioState state) { lost.push_back(state); });

    monitor.setState(RadioState::POWERED_OFF);
    TEST_ASSERT_TRUE(lost.empty());

    monitor.setState(RadioState::POWERED_ON);
    monitor.setState(RadioState::POWERED_ON);
    TEST_ASSERT_TRUE(lost.empty());

    monitor.setState(RadioState::UNAUTHORIZED);
    TEST_ASSERT_EQUAL_size_t(1, lost.size());
    TEST_ASSERT_EQUAL(RadioState::UNAUTHORIZED, lost[0]);
    TEST_ASSERT_FALSE(monitor.isReady());
}

void testRadioMonitorCancel() {
    BLERadioMonitor monitor;
    bool ran = false;

    monitor.requestWhenReady([&ran]() { ran = true; }, "scan");
    TEST_ASSERT_TRUE(monitor.cancelPending());
    TEST_ASSERT_FALSE(monitor.cancelPending());

    monitor.setState(RadioState::POWERED_ON);
    TEST_ASSERT_FALSE(ran);
}

//=============================================================================
// BLEPeerRegistry
//=============================================================================

void testRegistryUniqueIds() {
    BLEPeerRegistry registry;
    std::set<PeerId> ids;

    for (int i = 0; i < 50; i++) {
        PeerId id = registry.allocatePeerId(i % 2 ? PeerRole::HOST : PeerRole::JOINER);
        TEST_ASSERT_FALSE(id.empty());
        ids.insert(id);
    }
    TEST_ASSERT_EQUAL_size_t(50, ids.size());

    // Another registry (another session) never collides
    BLEPeerRegistry other;
    TEST_ASSERT_EQUAL_size_t(0, ids.count(other.allocatePeerId(PeerRole::JOINER)));
}

void testRegistryCapacity() {
    BLEPeerRegistry registry(4);
    BLEAddress addr;

    for (uint16_t handle = 1; handle <= 4; handle++) {
        PeerId id = registry.allocatePeerId(PeerRole::JOINER);
        TEST_ASSERT_NOT_NULL(registry.registerPeer(id, handle, addr, "P", PeerRole::JOINER, 185));
    }
    TEST_ASSERT_TRUE(registry.isFull());
    TEST_ASSERT_FALSE(registry.canAcceptPeer());

    PeerId fifth = registry.allocatePeerId(PeerRole::JOINER);
    TEST_ASSERT_NULL(registry.registerPeer(fifth, 5, addr, "P5", PeerRole::JOINER, 185));
    TEST_ASSERT_EQUAL_size_t(4, registry.count());

    PeerId removed = registry.removeByHandle(2);
    TEST_ASSERT_FALSE(removed.empty());
    TEST_ASSERT_NULL(registry.getPeerById(removed));
    TEST_ASSERT_NOT_NULL(registry.registerPeer(fifth, 5, addr, "P5", PeerRole::JOINER, 185));

    registry.setMaxPeers(100);
    TEST_ASSERT_EQUAL_size_t(BLEPeerRegistry::PEERS_POOL_SIZE, registry.getMaxPeers());
}

void testRegistryLookupAndUpdates() {
    BLEPeerRegistry registry;
    uint8_t raw[] = {1, 2, 3, 4, 5, 6};
    BLEAddress addr(raw);

    PeerId id = registry.allocatePeerId(PeerRole::HOST);
    TEST_ASSERT_NOT_NULL(registry.registerPeer(id, 7, addr, "Alice", PeerRole::HOST, 185));

    // Same id or same handle twice is refused
    TEST_ASSERT_NULL(registry.registerPeer(id, 8, addr, "Alice", PeerRole::HOST, 185));
    TEST_ASSERT_NULL(registry.registerPeer(registry.allocatePeerId(PeerRole::HOST), 7, addr, "X",
                                           PeerRole::HOST, 185));

    Peer* peer = registry.getPeerByHandle(7);
    TEST_ASSERT_NOT_NULL(peer);
    TEST_ASSERT_EQUAL_STRING("Alice", peer->display_name.c_str());
    TEST_ASSERT_TRUE(peer->address == addr);

    TEST_ASSERT_TRUE(registry.setPeerMTU(7, 100));
    TEST_ASSERT_FALSE(registry.setPeerMTU(9, 100));
    registry.recordPacketSent(id);
    registry.recordPacketReceived(id);
    registry.recordPacketReceived(id);

    std::vector<Peer> snapshot = registry.snapshot();
    TEST_ASSERT_EQUAL_size_t(1, snapshot.size());
    TEST_ASSERT_EQUAL_UINT16(100, snapshot[0].mtu);
    TEST_ASSERT_EQUAL_UINT32(1, snapshot[0].packets_sent);
    TEST_ASSERT_EQUAL_UINT32(2, snapshot[0].packets_received);

    TEST_ASSERT_TRUE(registry.removePeer(id));
    TEST_ASSERT_FALSE(registry.removePeer(id));
}

//=============================================================================
// BLEEventChannel
//=============================================================================

void testEventChannelBoundsData() {
    BLEEventChannel channel;

    for (size_t i = 0; i < BLEEventChannel::MAX_PENDING_DATA + 10; i++) {
        TransportEvent event(TransportEvent::Type::NOTIFICATION);
        event.data = RNS::Bytes("x");
        channel.post(event);
    }
    TEST_ASSERT_EQUAL_size_t(BLEEventChannel::MAX_PENDING_DATA, channel.size());
    TEST_ASSERT_EQUAL_size_t(10, channel.droppedCount());

    // Control events are never dropped
    TEST_ASSERT_TRUE(channel.post(TransportEvent(TransportEvent::Type::DISCONNECTED)));

    std::deque<TransportEvent> batch;
    TEST_ASSERT_EQUAL_size_t(BLEEventChannel::MAX_PENDING_DATA + 1, channel.drain(batch));
    TEST_ASSERT_TRUE(channel.empty());
    TEST_ASSERT_EQUAL(TransportEvent::Type::DISCONNECTED, batch.back().type);

    // Room again after the drain
    TransportEvent event(TransportEvent::Type::WRITE_RECEIVED);
    TEST_ASSERT_TRUE(channel.post(event));
}

//=============================================================================
// BLEWriteQueue
//=============================================================================

class RecordingWriteQueue : public BLEWriteQueue {
public:
    std::vector<OutgoingFragment> written;
    std::vector<OutgoingFragment> failed;
    uint16_t fail_packet = 0xFFFF;

protected:
    bool executeWrite(const OutgoingFragment& fragment) override {
        if (fragment.packet_id == fail_packet) {
            return false;
        }
        written.push_back(fragment);
        return true;
    }

    void onWriteFailed(const OutgoingFragment& fragment) override {
        failed.push_back(fragment);
    }
};

static OutgoingFragment makeOutgoing(uint16_t handle, uint16_t packet_id, uint8_t index, uint8_t count) {
    OutgoingFragment fragment;
    fragment.peer_id = "J-" + std::to_string(handle);
    fragment.conn_handle = handle;
    fragment.packet_id = packet_id;
    fragment.index = index;
    fragment.count = count;
    fragment.data = BLEFragmenter::createFragment(packet_id, index, count, RNS::Bytes("d"));
    return fragment;
}

void testWriteQueuePacing() {
    RecordingWriteQueue queue;
    queue.setInterFragmentDelay(0.010);

    for (uint8_t i = 0; i < 3; i++) {
        queue.enqueue(makeOutgoing(1, 10, i, 3));
    }

    TEST_ASSERT_EQUAL_size_t(1, queue.process(100.0));
    TEST_ASSERT_EQUAL_size_t(0, queue.process(100.005));
    TEST_ASSERT_EQUAL_size_t(1, queue.process(100.011));
    TEST_ASSERT_EQUAL_size_t(1, queue.process(100.030));
    TEST_ASSERT_TRUE(queue.isIdle());

    TEST_ASSERT_EQUAL_size_t(3, queue.written.size());
    for (uint8_t i = 0; i < 3; i++) {
        TEST_ASSERT_EQUAL_UINT8(i, queue.written[i].index);
    }
}

void testWriteQueuePacesAcrossConnections() {
    RecordingWriteQueue queue;
    queue.setInterFragmentDelay(0.010);

    // Two links share one local radio buffer
    queue.enqueue(makeOutgoing(1, 10, 0, 2));
    queue.enqueue(makeOutgoing(2, 30, 0, 1));
    queue.enqueue(makeOutgoing(1, 10, 1, 2));

    TEST_ASSERT_EQUAL_size_t(1, queue.process(50.0));
    TEST_ASSERT_EQUAL_size_t(0, queue.process(50.005));
    TEST_ASSERT_EQUAL_size_t(1, queue.process(50.011));
    TEST_ASSERT_EQUAL_size_t(0, queue.process(50.015));
    TEST_ASSERT_EQUAL_size_t(1, queue.process(50.022));

    TEST_ASSERT_EQUAL_size_t(3, queue.written.size());
    TEST_ASSERT_EQUAL_UINT16(1, queue.written[0].conn_handle);
    TEST_ASSERT_EQUAL_UINT16(2, queue.written[1].conn_handle);
    TEST_ASSERT_EQUAL_UINT16(1, queue.written[2].conn_handle);
    TEST_ASSERT_EQUAL_UINT8(1, queue.written[2].index);
}

void testWriteQueueFlushWithoutDelay() {
    RecordingWriteQueue queue;
    queue.setInterFragmentDelay(0);

    for (uint8_t i = 0; i < 5; i++) {
        queue.enqueue(makeOutgoing(1, 10, i, 5));
    }
    TEST_ASSERT_EQUAL_size_t(5, queue.process(1.0));
    TEST_ASSERT_EQUAL_size_t(0, queue.depth());
}

void testWriteQueueFailureDropsPacket() {
    RecordingWriteQueue queue;
    queue.setInterFragmentDelay(0);
    queue.fail_packet = 20;

    for (uint8_t i = 0; i < 3; i++) {
        queue.enqueue(makeOutgoing(1, 20, i, 3));
    }
    queue.enqueue(makeOutgoing(1, 21, 0, 1));
    queue.enqueue(makeOutgoing(2, 20, 0, 1));

    queue.process(1.0);

    // Packet 20 on handle 1 dropped after its first failure; other traffic continues
    TEST_ASSERT_EQUAL_size_t(2, queue.failed.size());
    TEST_ASSERT_EQUAL_UINT16(1, queue.failed[0].conn_handle);
    TEST_ASSERT_EQUAL_UINT16(2, queue.failed[1].conn_handle);
    TEST_ASSERT_EQUAL_size_t(1, queue.written.size());
    TEST_ASSERT_EQUAL_UINT16(21, queue.written[0].packet_id);
    TEST_ASSERT_TRUE(queue.isIdle());
}

void testWriteQueueClearForConnection() {
    RecordingWriteQueue queue;
    queue.enqueue(makeOutgoing(1, 1, 0, 1));
    queue.enqueue(makeOutgoing(2, 1, 0, 1));
    queue.enqueue(makeOutgoing(1, 2, 0, 1));

    TEST_ASSERT_EQUAL_size_t(2, queue.clearForConnection(1));
    TEST_ASSERT_EQUAL_size_t(1, queue.depth());
}

//=============================================================================
// Test Runner
//=============================================================================

void setUp(void) {
    g_discards.clear();
    g_discarded_ids.clear();
}

void tearDown(void) {
}

int runUnityTests(void) {
    UNITY_BEGIN();

    // BLETypes tests
    RUN_TEST(testSessionConstants);
    RUN_TEST(testAdvertisedName);
    RUN_TEST(testBLEAddressString);
    RUN_TEST(testConnectionFailureClassification);

    // BLEFragmenter tests
    RUN_TEST(testFragmentHeaderFormat);
    RUN_TEST(testFragmentValidation);
    RUN_TEST(testFragmenterLargeMessage);
    RUN_TEST(testFragmenterEmptyMessage);
    RUN_TEST(testFragmenterRejectsOversizedMessage);
    RUN_TEST(testFragmenterMTUClamp);
    RUN_TEST(testPacketIdWraps);

    // BLEReassembler tests
    RUN_TEST(testReassemblerOutOfOrder);
    RUN_TEST(testReassemblerAnyOrderRoundTrip);
    RUN_TEST(testReassemblerInterleavedPackets);
    RUN_TEST(testReassemblerDuplicates);
    RUN_TEST(testReassemblerRejectsMalformed);
    RUN_TEST(testReassemblerPacketIdWraparound);
    RUN_TEST(testReassemblerTimeout);
    RUN_TEST(testReassemblerStalledSenderDoesNotBlockOthers);
    RUN_TEST(testReassemblerClearForPeer);

    // BLERadioMonitor tests
    RUN_TEST(testRadioMonitorReplaysLatestRequest);
    RUN_TEST(testRadioMonitorLostHook);
    RUN_TEST(testRadioMonitorCancel);

    // BLEPeerRegistry tests
    RUN_TEST(testRegistryUniqueIds);
    RUN_TEST(testRegistryCapacity);
    RUN_TEST(testRegistryLookupAndUpdates);

    // BLEEventChannel tests
    RUN_TEST(testEventChannelBoundsData);

    // BLEWriteQueue tests
    RUN_TEST(testWriteQueuePacing);
    RUN_TEST(testWriteQueuePacesAcrossConnections);
    RUN_TEST(testWriteQueueFlushWithoutDelay);
    RUN_TEST(testWriteQueueFailureDropsPacket);
    RUN_TEST(testWriteQueueClearForConnection);

    return UNITY_END();
}

// For native dev-platform or for some embedded frameworks
int main(void) {
    return runUnityTests();
}

#ifdef ARDUINO
// For Arduino framework
void setup() {
    // Wait ~2 seconds before the Unity test runner
    // establishes connection with a board Serial interface
    delay(2000);
    runUnityTests();
}
void loop() {}
#endif
