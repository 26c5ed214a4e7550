/**
 * @file BLEEventChannel.cpp
 * @brief Single-consumer event channel implementation
 */

#include "BLEEventChannel.h"
#include "Log.h"

using namespace RNS;

namespace BAB { namespace BLE {

const char* eventTypeToString(TransportEvent::Type type) {
    using Type = TransportEvent::Type;
    switch (type) {
        case Type::RADIO_STATE:          return "RADIO_STATE";
        case Type::SCAN_RESULT:          return "SCAN_RESULT";
        case Type::SCAN_COMPLETE:        return "SCAN_COMPLETE";
        case Type::CONNECTED:            return "CONNECTED";
        case Type::CONNECT_FAILED:       return "CONNECT_FAILED";
        case Type::DISCONNECTED:         return "DISCONNECTED";
        case Type::MTU_CHANGED:          return "MTU_CHANGED";
        case Type::SERVICES_DISCOVERED:  return "SERVICES_DISCOVERED";
        case Type::INFO_READ:            return "INFO_READ";
        case Type::NOTIFICATION:         return "NOTIFICATION";
        case Type::CENTRAL_CONNECTED:    return "CENTRAL_CONNECTED";
        case Type::CENTRAL_DISCONNECTED: return "CENTRAL_DISCONNECTED";
        case Type::SUBSCRIPTION:         return "SUBSCRIPTION";
        case Type::WRITE_RECEIVED:       return "WRITE_RECEIVED";
        case Type::INFO_WRITTEN:         return "INFO_WRITTEN";
        case Type::START_ADVERTISING:    return "START_ADVERTISING";
        case Type::STOP_ADVERTISING:     return "STOP_ADVERTISING";
        case Type::START_SCAN:           return "START_SCAN";
        case Type::STOP_SCAN:            return "STOP_SCAN";
        case Type::CONNECT:              return "CONNECT";
        case Type::DISCONNECT:           return "DISCONNECT";
        case Type::SEND:                 return "SEND";
        default:                         return "UNKNOWN";
    }
}

bool BLEEventChannel::post(TransportEvent event) {
    std::lock_guard<std::mutex> lock(_mutex);

    if (event.isData()) {
        if (_pending_data >= MAX_PENDING_DATA) {
            _dropped++;
            WARNING("BLEEventChannel: Pending data queue full, dropping " +
                    std::string(eventTypeToString(event.type)));
            return false;
        }
        _pending_data++;
    }

    _events.push_back(std::move(event));
    return true;
}

size_t BLEEventChannel::drain(std::deque<TransportEvent>& out) {
    std::lock_guard<std::mutex> lock(_mutex);
    size_t taken = _events.size();
    for (auto& event : _events) {
        out.push_back(std::move(event));
    }
    _events.clear();
    _pending_data = 0;
    return taken;
}

size_t BLEEventChannel::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _events.size();
}

size_t BLEEventChannel::droppedCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _dropped;
}

void BLEEventChannel::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _events.clear();
    _pending_data = 0;
}

}} // namespace BAB::BLE
