/**
 * @file BLERadioMonitor.h
 * @brief Local radio availability tracking with a single pending request
 *
 * Gates radio operations on RadioState::POWERED_ON. An advertise or scan
 * request issued while the radio is not ready is parked in a single slot
 * (a newer request replaces the older one) and replayed on the next
 * transition into POWERED_ON. Leaving POWERED_ON fires the radio-lost hook
 * so the owning manager can tear down its links.
 *
 * The state check and the slot update happen under one lock, so a request
 * racing with the radio becoming ready is either executed or replayed,
 * never lost.
 */
#pragma once

#include "BLETypes.h"

#include <functional>
#include <mutex>
#include <string>

namespace BAB { namespace BLE {

class BLERadioMonitor {
public:
    using Operation = std::function<void()>;
    using RadioLostHook = std::function<void(RadioState new_state)>;

public:
    BLERadioMonitor() = default;

    RadioState getState() const;
    bool isReady() const { return getState() == RadioState::POWERED_ON; }

    /**
     * @brief Run an operation now, or park it until the radio is ready
     *
     * @param op The operation
     * @param label Name used in log messages
     * @return true if op ran immediately, false if it was parked
     */
    bool requestWhenReady(Operation op, const std::string& label = "operation");

    /**
     * @brief Drop the parked operation, if any
     * @return true if an operation was dropped
     */
    bool cancelPending();

    bool hasPending() const;
    std::string pendingLabel() const;

    /**
     * @brief Apply a radio state reported by the platform
     *
     * Into POWERED_ON: the parked operation is removed and then invoked.
     * Out of POWERED_ON: the radio-lost hook is invoked.
     */
    void setState(RadioState state);

    void setRadioLostHook(RadioLostHook hook) { _radio_lost_hook = hook; }

private:
    mutable std::mutex _mutex;
    RadioState _state = RadioState::UNKNOWN;
    Operation _pending;
    std::string _pending_label;

    RadioLostHook _radio_lost_hook = nullptr;
};

}} // namespace BAB::BLE
