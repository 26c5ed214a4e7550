/**
 * @file BLEWriteQueue.h
 * @brief Paced queue of outgoing fragments
 *
 * The local radio has a small outgoing buffer, so fragments are not written
 * back to back from the caller's context. They are queued here and emitted
 * from the owner's loop(), at most one per inter-fragment delay across all
 * links, since every link drains into the same local buffer. Fragments
 * leave in the order they were queued, so the fragments of one packet always
 * go out in index order.
 *
 * Owners inherit from this class and implement executeWrite() to perform
 * the actual write or notification.
 */
#pragma once

#include "BLETypes.h"
#include "Bytes.h"
#include "Utilities/OS.h"

#include <deque>

namespace BAB { namespace BLE {

/**
 * @brief One fragment waiting to be written to a link
 */
struct OutgoingFragment {
    PeerId peer_id;
    uint16_t conn_handle = 0xFFFF;
    uint16_t packet_id = 0;
    uint8_t index = 0;
    uint8_t count = 0;
    bool notify = false;                // true: notify channel, false: write channel
    Bytes data;
    double queued_at = 0;
};

class BLEWriteQueue {
public:
    BLEWriteQueue() = default;
    virtual ~BLEWriteQueue() = default;

    void enqueue(OutgoingFragment fragment);

    /**
     * @brief Emit queued fragments - call from loop()
     *
     * With a zero delay the whole queue is flushed; otherwise at most one
     * fragment is written per call, and only once the delay has elapsed.
     *
     * @return Number of fragments written successfully
     */
    size_t process();
    size_t process(double now);

    /**
     * @brief Drop queued fragments for a connection
     */
    size_t clearForConnection(uint16_t conn_handle);

    /**
     * @brief Drop the remaining fragments of one packet
     */
    size_t dropPacket(uint16_t conn_handle, uint16_t packet_id);

    void clear();

    size_t depth() const { return _queue.size(); }
    bool isIdle() const { return _queue.empty(); }

    void setInterFragmentDelay(double seconds) { _inter_fragment_delay = seconds; }
    double getInterFragmentDelay() const { return _inter_fragment_delay; }

protected:
    /**
     * @brief Write a single fragment - implement in subclass
     * @return true if the platform accepted the write
     */
    virtual bool executeWrite(const OutgoingFragment& fragment) = 0;

    /**
     * @brief Called after a failed write, once the packet's remaining
     *        fragments have been dropped
     */
    virtual void onWriteFailed(const OutgoingFragment& fragment) { (void)fragment; }

private:
    std::deque<OutgoingFragment> _queue;
    double _inter_fragment_delay = Timing::INTER_FRAGMENT_DELAY;
    double _last_write_at = 0;
    bool _has_written = false;
};

}} // namespace BAB::BLE
