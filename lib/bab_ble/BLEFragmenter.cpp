/**
 * @file BLEFragmenter.cpp
 * @brief Session packet fragmenter implementation
 */

#include "BLEFragmenter.h"
#include "Log.h"

using namespace RNS;

namespace BAB { namespace BLE {

BLEFragmenter::BLEFragmenter(size_t mtu) {
    setMTU(mtu);
}

void BLEFragmenter::setMTU(size_t mtu) {
    if (mtu < Fragment::MIN_MTU) {
        WARNING("BLEFragmenter: MTU " + std::to_string(mtu) + " too small, clamping to " +
                std::to_string(Fragment::MIN_MTU));
        mtu = Fragment::MIN_MTU;
    }
    _mtu = mtu;
    _payload_size = _mtu - Fragment::HEADER_SIZE;
}

bool BLEFragmenter::needsFragmentation(const Bytes& data) const {
    return data.size() > _payload_size;
}

size_t BLEFragmenter::calculateFragmentCount(size_t data_size) const {
    if (data_size == 0) return 1;  // Empty message still produces one fragment
    return (data_size + _payload_size - 1) / _payload_size;
}

std::vector<Bytes> BLEFragmenter::fragment(const Bytes& data, uint16_t packet_id) const {
    std::vector<Bytes> fragments;

    size_t total_fragments = calculateFragmentCount(data.size());
    if (total_fragments > Limits::MAX_FRAGMENTS) {
        char buf[96];
        snprintf(buf, sizeof(buf), "BLEFragmenter: %zu bytes needs %zu fragments at MTU %zu (max %zu)",
                 data.size(), total_fragments, _mtu, Limits::MAX_FRAGMENTS);
        ERROR(buf);
        return fragments;
    }

    fragments.reserve(total_fragments);

    if (data.size() == 0) {
        fragments.push_back(createFragment(packet_id, 0, 1, Bytes()));
        return fragments;
    }

    size_t offset = 0;
    for (size_t i = 0; i < total_fragments; i++) {
        size_t remaining = data.size() - offset;
        size_t chunk_size = (remaining < _payload_size) ? remaining : _payload_size;

        Bytes payload(data.data() + offset, chunk_size);
        offset += chunk_size;

        fragments.push_back(createFragment(packet_id, static_cast<uint8_t>(i),
                                           static_cast<uint8_t>(total_fragments), payload));
    }

    {
        char buf[80];
        snprintf(buf, sizeof(buf), "BLEFragmenter: Packet %u, %zu bytes into %zu fragments",
                 packet_id, data.size(), fragments.size());
        TRACE(buf);
    }

    return fragments;
}

Bytes BLEFragmenter::createFragment(uint16_t packet_id, uint8_t index,
                                    uint8_t count, const Bytes& payload) {
    size_t total_size = Fragment::HEADER_SIZE + payload.size();
    Bytes fragment(total_size);
    uint8_t* ptr = fragment.writable(total_size);
    fragment.resize(total_size);

    // Bytes 0-1: Packet id (big-endian)
    ptr[0] = static_cast<uint8_t>((packet_id >> 8) & 0xFF);
    ptr[1] = static_cast<uint8_t>(packet_id & 0xFF);

    ptr[2] = index;
    ptr[3] = count;

    if (payload.size() > 0) {
        memcpy(ptr + Fragment::HEADER_SIZE, payload.data(), payload.size());
    }

    return fragment;
}

bool BLEFragmenter::parseHeader(const Bytes& fragment, uint16_t& packet_id,
                                uint8_t& index, uint8_t& count) {
    if (fragment.size() < Fragment::HEADER_SIZE) {
        return false;
    }

    const uint8_t* ptr = fragment.data();

    packet_id = (static_cast<uint16_t>(ptr[0]) << 8) | static_cast<uint16_t>(ptr[1]);
    index = ptr[2];
    count = ptr[3];

    if (count == 0) {
        return false;
    }

    if (index >= count) {
        return false;
    }

    return true;
}

Bytes BLEFragmenter::extractPayload(const Bytes& fragment) {
    if (fragment.size() <= Fragment::HEADER_SIZE) {
        return Bytes();
    }

    return Bytes(fragment.data() + Fragment::HEADER_SIZE,
                 fragment.size() - Fragment::HEADER_SIZE);
}

bool BLEFragmenter::isValidFragment(const Bytes& fragment) {
    uint16_t packet_id;
    uint8_t index, count;
    return parseHeader(fragment, packet_id, index, count);
}

}} // namespace BAB::BLE
