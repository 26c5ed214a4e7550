/**
 * @file BLEPlatform.h
 * @brief BLE Hardware Abstraction Layer (HAL) interface
 *
 * Platform-agnostic view of the radio used by the session managers. A
 * backend (NimBLE on ESP32, the in-process loopback radio) implements this
 * interface; the managers never include a BLE stack header.
 *
 * The HAL abstracts:
 * - BLE stack initialization, lifecycle and radio state
 * - Scanning and advertising of the session service
 * - Connection management
 * - Session channel operations (write, notify, info read/write)
 * - Callback handling
 *
 * Callbacks may fire on the BLE stack's own task. Implementations must not
 * hold internal locks while invoking them.
 */
#pragma once

#include "BLETypes.h"
#include "Bytes.h"

#include <memory>
#include <vector>

namespace BAB { namespace BLE {

class IBLEPlatform {
public:
    using Ptr = std::shared_ptr<IBLEPlatform>;

    virtual ~IBLEPlatform() = default;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Initialize the BLE stack with configuration
     * @return true if initialization successful
     */
    virtual bool initialize(const PlatformConfig& config) = 0;

    /**
     * @brief Main loop processing - must be called periodically
     */
    virtual void loop() = 0;

    /**
     * @brief Shutdown and cleanup the BLE stack
     */
    virtual void shutdown() = 0;

    virtual bool isInitialized() const = 0;

    /**
     * @brief Current radio availability
     */
    virtual RadioState getRadioState() const = 0;

    //=========================================================================
    // Central Mode - Scanning
    //=========================================================================

    /**
     * @brief Start scanning for session hosts
     *
     * @param duration_ms Scan duration in milliseconds (0 = until stopScan)
     * @return true if scan started successfully
     */
    virtual bool startScan(uint32_t duration_ms = 0) = 0;

    virtual void stopScan() = 0;

    virtual bool isScanning() const = 0;

    //=========================================================================
    // Central Mode - Connections
    //=========================================================================

    /**
     * @brief Connect to a host
     *
     * Completion is reported through OnConnected or OnConnectFailed.
     *
     * @return true if connection attempt started
     */
    virtual bool connect(const BLEAddress& address, uint32_t timeout_ms) = 0;

    /**
     * @brief Disconnect from a peer
     *
     * @param conn_handle Connection handle
     * @param reason HCI reason sent to the remote side
     * @return true if disconnect initiated
     */
    virtual bool disconnect(uint16_t conn_handle, uint8_t reason = Reason::REMOTE_USER_TERMINATED) = 0;

    virtual void disconnectAll() = 0;

    /**
     * @brief Discover the session service and its channels
     *
     * The result is reported through OnServicesDiscovered.
     *
     * @return true if discovery ran; false if the handle is unknown
     */
    virtual bool discoverServices(uint16_t conn_handle) = 0;

    //=========================================================================
    // Peripheral Mode - Advertising
    //=========================================================================

    /**
     * @brief Publish the session service and advertise it
     *
     * @param local_name Name placed in the advertisement
     * @return true if advertising started
     */
    virtual bool startAdvertising(const std::string& local_name) = 0;

    /**
     * @brief Stop advertising and withdraw the session service
     */
    virtual void stopAdvertising() = 0;

    virtual bool isAdvertising() const = 0;

    /**
     * @brief Set the value served on the info channel
     */
    virtual void setInfoData(const Bytes& info) = 0;

    //=========================================================================
    // Channel Operations
    //=========================================================================

    /**
     * @brief Write to the host's write channel (central mode)
     *
     * @param response true for write with response
     * @return true if the write was accepted
     */
    virtual bool write(uint16_t conn_handle, const Bytes& data, bool response = false) = 0;

    /**
     * @brief Write to the host's info channel (central mode)
     */
    virtual bool writeInfo(uint16_t conn_handle, const Bytes& data) = 0;

    /**
     * @brief Read the host's info channel (central mode)
     * @return true if the read was started; callback fires exactly once
     */
    virtual bool readInfo(uint16_t conn_handle, Callbacks::OnInfoRead callback) = 0;

    /**
     * @brief Subscribe to or unsubscribe from the notify channel (central mode)
     * @return true if the subscription state was changed
     */
    virtual bool enableNotifications(uint16_t conn_handle, bool enable) = 0;

    /**
     * @brief Notify one subscribed central (peripheral mode)
     * @return true if the notification was sent
     */
    virtual bool notify(uint16_t conn_handle, const Bytes& data) = 0;

    //=========================================================================
    // Connection Management
    //=========================================================================

    virtual std::vector<ConnectionHandle> getConnections() const = 0;

    /**
     * @brief Get connection by handle (invalid handle if unknown)
     *
     * mtu is the current usable MTU and may change after connection.
     */
    virtual ConnectionHandle getConnection(uint16_t handle) const = 0;

    virtual size_t getConnectionCount() const = 0;

    virtual bool isConnectedTo(const BLEAddress& address) const = 0;

    //=========================================================================
    // Callback Registration
    //=========================================================================

    virtual void setOnRadioStateChanged(Callbacks::OnRadioStateChanged callback) = 0;
    virtual void setOnScanResult(Callbacks::OnScanResult callback) = 0;
    virtual void setOnScanComplete(Callbacks::OnScanComplete callback) = 0;
    virtual void setOnConnected(Callbacks::OnConnected callback) = 0;
    virtual void setOnConnectFailed(Callbacks::OnConnectFailed callback) = 0;
    virtual void setOnDisconnected(Callbacks::OnDisconnected callback) = 0;
    virtual void setOnMTUChanged(Callbacks::OnMTUChanged callback) = 0;
    virtual void setOnServicesDiscovered(Callbacks::OnServicesDiscovered callback) = 0;

    /**
     * @brief Set callback for data received via notification (central mode)
     */
    virtual void setOnDataReceived(Callbacks::OnDataReceived callback) = 0;

    /**
     * @brief Set callback for subscription changes (peripheral mode)
     */
    virtual void setOnNotifyEnabled(Callbacks::OnNotifyEnabled callback) = 0;

    virtual void setOnCentralConnected(Callbacks::OnCentralConnected callback) = 0;
    virtual void setOnCentralDisconnected(Callbacks::OnCentralDisconnected callback) = 0;

    /**
     * @brief Set callback for data received via write (peripheral mode)
     */
    virtual void setOnWriteReceived(Callbacks::OnWriteReceived callback) = 0;

    /**
     * @brief Set callback for info channel writes (peripheral mode)
     */
    virtual void setOnInfoWritten(Callbacks::OnInfoWritten callback) = 0;

    //=========================================================================
    // Platform Info
    //=========================================================================

    virtual PlatformType getPlatformType() const = 0;
    virtual std::string getPlatformName() const = 0;
    virtual BLEAddress getLocalAddress() const = 0;
};

/**
 * @brief Factory for creating platform-specific BLE implementations
 */
class BLEPlatformFactory {
public:
    /**
     * @brief Create platform instance based on compile-time detection
     * @return Shared pointer to platform instance, or nullptr if no platform available
     */
    static IBLEPlatform::Ptr create();

    /**
     * @brief Create specific platform
     *
     * LOOPBACK platforms share a LoopbackAir and are constructed directly.
     */
    static IBLEPlatform::Ptr create(PlatformType type);

    static PlatformType getDetectedPlatform();
};

}} // namespace BAB::BLE
