/**
 * @file BLERadioMonitor.cpp
 * @brief Local radio availability tracking implementation
 */

#include "BLERadioMonitor.h"
#include "Log.h"

using namespace RNS;

namespace BAB { namespace BLE {

RadioState BLERadioMonitor::getState() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
}

bool BLERadioMonitor::requestWhenReady(Operation op, const std::string& label) {
    if (!op) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_state != RadioState::POWERED_ON) {
            if (_pending) {
                DEBUG("BLERadioMonitor: Replacing pending " + _pending_label + " with " + label);
            }
            _pending = op;
            _pending_label = label;
            INFO("BLERadioMonitor: Radio " + std::string(radioStateToString(_state)) +
                 ", " + label + " deferred until powered on");
            return false;
        }
    }

    op();
    return true;
}

bool BLERadioMonitor::cancelPending() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_pending) {
        return false;
    }
    DEBUG("BLERadioMonitor: Cancelled pending " + _pending_label);
    _pending = nullptr;
    _pending_label.clear();
    return true;
}

bool BLERadioMonitor::hasPending() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return static_cast<bool>(_pending);
}

std::string BLERadioMonitor::pendingLabel() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pending_label;
}

void BLERadioMonitor::setState(RadioState state) {
    RadioState old_state;
    Operation ready_op;
    std::string ready_label;

    {
        std::lock_guard<std::mutex> lock(_mutex);
        old_state = _state;
        if (old_state == state) {
            return;
        }
        _state = state;

        if (state == RadioState::POWERED_ON && _pending) {
            ready_op = std::move(_pending);
            ready_label = std::move(_pending_label);
            _pending = nullptr;
            _pending_label.clear();
        }
    }

    INFO("BLERadioMonitor: " + std::string(radioStateToString(old_state)) + " -> " +
         std::string(radioStateToString(state)));

    if (old_state == RadioState::POWERED_ON && _radio_lost_hook) {
        _radio_lost_hook(state);
    }

    if (ready_op) {
        DEBUG("BLERadioMonitor: Replaying " + ready_label);
        ready_op();
    }
}

}} // namespace BAB::BLE
