/**
 * @file BLEFragmenter.h
 * @brief Session packet fragmenter (encode side of the packet framer)
 *
 * Splits an outgoing logical message into fragments that fit one GATT write
 * or notification at the connection's MTU. Has no radio dependencies and is
 * used unchanged by host and joiner.
 *
 * Fragment Header Format (4 bytes):
 *   Bytes 0-1:  Packet id (big-endian uint16_t, per-sender counter)
 *   Byte 2:     Fragment index (0-based)
 *   Byte 3:     Fragment count (>= 1)
 *   Bytes 4+:   Payload data (up to MTU - 4 bytes)
 */
#pragma once

#include "BLETypes.h"
#include "Bytes.h"

#include <vector>
#include <cstdint>

namespace BAB { namespace BLE {

class BLEFragmenter {
public:
    /**
     * @brief Construct a fragmenter with specified MTU
     * @param mtu The usable MTU of the link (default: minimum BLE MTU of 23)
     */
    explicit BLEFragmenter(size_t mtu = MTU::MINIMUM);

    /**
     * @brief Set the MTU for fragmentation calculations
     *
     * Call this before each packet with the MTU queried from the connection.
     * Values below Fragment::MIN_MTU are clamped.
     */
    void setMTU(size_t mtu);

    size_t getMTU() const { return _mtu; }

    /**
     * @brief Get the maximum payload size per fragment (MTU - HEADER_SIZE)
     */
    size_t getPayloadSize() const { return _payload_size; }

    /**
     * @brief Largest logical message that fits in MAX_FRAGMENTS fragments
     */
    size_t getMaxMessageSize() const { return _payload_size * Limits::MAX_FRAGMENTS; }

    bool needsFragmentation(const Bytes& data) const;

    /**
     * @brief Calculate number of fragments needed for a packet
     * @param data_size Size of the data to fragment
     * @return Number of fragments needed (minimum 1, empty data included)
     */
    size_t calculateFragmentCount(size_t data_size) const;

    /**
     * @brief Allocate the next outgoing packet id for this link
     *
     * Monotonically increasing, wraps at 65536.
     */
    uint16_t nextPacketId() { return _next_packet_id++; }

    /**
     * @brief Fragment a logical message into MTU-sized chunks
     *
     * @param data The complete message
     * @param packet_id Packet id stamped into every fragment header
     * @return Fragments in index order, or an empty vector if the message
     *         would need more than MAX_FRAGMENTS fragments
     */
    std::vector<Bytes> fragment(const Bytes& data, uint16_t packet_id) const;

    /**
     * @brief Create a single fragment with proper header
     */
    static Bytes createFragment(uint16_t packet_id, uint8_t index,
                                uint8_t count, const Bytes& payload);

    /**
     * @brief Parse the header from a received fragment
     *
     * @param fragment The received fragment data
     * @param packet_id Output: packet id
     * @param index Output: fragment index
     * @param count Output: fragment count
     * @return true if the header is present and consistent
     *         (count >= 1, index < count)
     */
    static bool parseHeader(const Bytes& fragment, uint16_t& packet_id,
                            uint8_t& index, uint8_t& count);

    /**
     * @brief Extract payload from a fragment (removes header)
     */
    static Bytes extractPayload(const Bytes& fragment);

    static bool isValidFragment(const Bytes& fragment);

private:
    size_t _mtu;
    size_t _payload_size;
    uint16_t _next_packet_id = 0;
};

}} // namespace BAB::BLE
