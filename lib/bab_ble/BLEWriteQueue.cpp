/**
 * @file BLEWriteQueue.cpp
 * @brief Paced fragment queue implementation
 */

#include "BLEWriteQueue.h"
#include "Log.h"

using namespace RNS;

namespace BAB { namespace BLE {

void BLEWriteQueue::enqueue(OutgoingFragment fragment) {
    fragment.queued_at = Utilities::OS::time();
    _queue.push_back(std::move(fragment));
}

size_t BLEWriteQueue::process() {
    return process(Utilities::OS::time());
}

size_t BLEWriteQueue::process(double now) {
    size_t written = 0;

    while (!_queue.empty()) {
        if (_inter_fragment_delay > 0 && _has_written &&
            (now - _last_write_at) < _inter_fragment_delay) {
            break;
        }

        OutgoingFragment fragment = std::move(_queue.front());
        _queue.pop_front();

        bool ok = executeWrite(fragment);
        _last_write_at = now;
        _has_written = true;

        if (ok) {
            written++;
        } else {
            char buf[96];
            snprintf(buf, sizeof(buf), "BLEWriteQueue: Write failed on handle %u, packet %u fragment %u/%u",
                     fragment.conn_handle, fragment.packet_id, fragment.index + 1, fragment.count);
            WARNING(buf);
            dropPacket(fragment.conn_handle, fragment.packet_id);
            onWriteFailed(fragment);
        }

        if (_inter_fragment_delay > 0) {
            break;
        }
    }

    return written;
}

size_t BLEWriteQueue::clearForConnection(uint16_t conn_handle) {
    size_t before = _queue.size();
    for (auto it = _queue.begin(); it != _queue.end();) {
        if (it->conn_handle == conn_handle) {
            it = _queue.erase(it);
        } else {
            ++it;
        }
    }
    size_t dropped = before - _queue.size();
    if (dropped > 0) {
        TRACE("BLEWriteQueue: Dropped " + std::to_string(dropped) + " fragments for handle " +
              std::to_string(conn_handle));
    }
    return dropped;
}

size_t BLEWriteQueue::dropPacket(uint16_t conn_handle, uint16_t packet_id) {
    size_t before = _queue.size();
    for (auto it = _queue.begin(); it != _queue.end();) {
        if (it->conn_handle == conn_handle && it->packet_id == packet_id) {
            it = _queue.erase(it);
        } else {
            ++it;
        }
    }
    return before - _queue.size();
}

void BLEWriteQueue::clear() {
    if (!_queue.empty()) {
        TRACE("BLEWriteQueue: Cleared " + std::to_string(_queue.size()) + " fragments");
    }
    _queue.clear();
}

}} // namespace BAB::BLE
