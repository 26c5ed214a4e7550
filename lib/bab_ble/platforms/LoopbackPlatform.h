/**
 * @file LoopbackPlatform.h
 * @brief In-memory BLE platform for host builds and tests
 *
 * Platforms attached to the same LoopbackAir see each other's advertisements
 * and exchange writes and notifications synchronously through the registered
 * callbacks. The negotiated MTU of a link is the smaller of the two
 * preferred ATT MTUs, less the ATT header.
 *
 * Not thread-safe: drive every platform on one air from a single thread.
 */
#pragma once

#include "../BLEPlatform.h"

#include <map>
#include <vector>

namespace BAB { namespace BLE {

class LoopbackPlatform;

/**
 * @brief Shared medium for loopback platforms
 */
class LoopbackAir {
public:
    LoopbackAir() = default;

    void attach(LoopbackPlatform* platform);
    void detach(LoopbackPlatform* platform);

    LoopbackPlatform* find(const BLEAddress& address) const;
    const std::vector<LoopbackPlatform*>& platforms() const { return _platforms; }

    BLEAddress allocateAddress();
    uint16_t allocateHandle();

private:
    std::vector<LoopbackPlatform*> _platforms;
    uint16_t _next_handle = 1;
    uint16_t _next_address = 1;
};

class LoopbackPlatform : public IBLEPlatform {
public:
    static constexpr int8_t LOOPBACK_RSSI = -50;

    LoopbackPlatform(LoopbackAir& air, const std::string& label);
    ~LoopbackPlatform() override;

    //=========================================================================
    // Test Controls
    //=========================================================================

    /**
     * @brief Change the radio state; leaving POWERED_ON drops every link
     */
    void setRadioState(RadioState state);

    /**
     * @brief Serve the session service without its channels
     */
    void setExposeChannels(bool expose) { _expose_channels = expose; }

    /**
     * @brief Renegotiate the MTU of a live link on both ends
     */
    bool setLinkMTU(uint16_t conn_handle, uint16_t mtu);

    const std::string& label() const { return _label; }
    const std::string& advertisedName() const { return _adv_name; }

    //=========================================================================
    // IBLEPlatform
    //=========================================================================

    bool initialize(const PlatformConfig& config) override;
    void loop() override;
    void shutdown() override;
    bool isInitialized() const override { return _initialized; }
    RadioState getRadioState() const override { return _radio_state; }

    bool startScan(uint32_t duration_ms = 0) override;
    void stopScan() override;
    bool isScanning() const override { return _scanning; }

    bool connect(const BLEAddress& address, uint32_t timeout_ms) override;
    bool disconnect(uint16_t conn_handle, uint8_t reason = Reason::REMOTE_USER_TERMINATED) override;
    void disconnectAll() override;
    bool discoverServices(uint16_t conn_handle) override;

    bool startAdvertising(const std::string& local_name) override;
    void stopAdvertising() override;
    bool isAdvertising() const override { return _advertising; }
    void setInfoData(const Bytes& info) override { _info = info; }

    bool write(uint16_t conn_handle, const Bytes& data, bool response = false) override;
    bool writeInfo(uint16_t conn_handle, const Bytes& data) override;
    bool readInfo(uint16_t conn_handle, Callbacks::OnInfoRead callback) override;
    bool enableNotifications(uint16_t conn_handle, bool enable) override;
    bool notify(uint16_t conn_handle, const Bytes& data) override;

    std::vector<ConnectionHandle> getConnections() const override;
    ConnectionHandle getConnection(uint16_t handle) const override;
    size_t getConnectionCount() const override { return _links.size(); }
    bool isConnectedTo(const BLEAddress& address) const override;

    void setOnRadioStateChanged(Callbacks::OnRadioStateChanged callback) override { _on_radio_state_changed = callback; }
    void setOnScanResult(Callbacks::OnScanResult callback) override { _on_scan_result = callback; }
    void setOnScanComplete(Callbacks::OnScanComplete callback) override { _on_scan_complete = callback; }
    void setOnConnected(Callbacks::OnConnected callback) override { _on_connected = callback; }
    void setOnConnectFailed(Callbacks::OnConnectFailed callback) override { _on_connect_failed = callback; }
    void setOnDisconnected(Callbacks::OnDisconnected callback) override { _on_disconnected = callback; }
    void setOnMTUChanged(Callbacks::OnMTUChanged callback) override { _on_mtu_changed = callback; }
    void setOnServicesDiscovered(Callbacks::OnServicesDiscovered callback) override { _on_services_discovered = callback; }
    void setOnDataReceived(Callbacks::OnDataReceived callback) override { _on_data_received = callback; }
    void setOnNotifyEnabled(Callbacks::OnNotifyEnabled callback) override { _on_notify_enabled = callback; }
    void setOnCentralConnected(Callbacks::OnCentralConnected callback) override { _on_central_connected = callback; }
    void setOnCentralDisconnected(Callbacks::OnCentralDisconnected callback) override { _on_central_disconnected = callback; }
    void setOnWriteReceived(Callbacks::OnWriteReceived callback) override { _on_write_received = callback; }
    void setOnInfoWritten(Callbacks::OnInfoWritten callback) override { _on_info_written = callback; }

    PlatformType getPlatformType() const override { return PlatformType::LOOPBACK; }
    std::string getPlatformName() const override { return "Loopback(" + _label + ")"; }
    BLEAddress getLocalAddress() const override { return _address; }

private:
    struct Link {
        ConnectionHandle conn;
        LoopbackPlatform* remote = nullptr;
        bool subscribed = false;        // Peripheral side: remote enabled notifications
    };

    Link* findLink(uint16_t conn_handle);
    const Link* findLink(uint16_t conn_handle) const;

    bool isPublished() const { return _advertising && _radio_state == RadioState::POWERED_ON; }
    bool hasRoomForLink() const { return _links.size() < _config.max_connections; }

    // Remote end went away
    void linkLost(uint16_t conn_handle, uint8_t reason);
    void fireDisconnected(const ConnectionHandle& conn, uint8_t reason);

    LoopbackAir& _air;
    std::string _label;
    BLEAddress _address;
    PlatformConfig _config;

    bool _initialized = false;
    RadioState _radio_state = RadioState::POWERED_ON;
    bool _expose_channels = true;

    bool _advertising = false;
    std::string _adv_name;
    Bytes _info;

    bool _scanning = false;
    double _scan_until = 0;

    std::map<uint16_t, Link> _links;

    Callbacks::OnRadioStateChanged _on_radio_state_changed = nullptr;
    Callbacks::OnScanResult _on_scan_result = nullptr;
    Callbacks::OnScanComplete _on_scan_complete = nullptr;
    Callbacks::OnConnected _on_connected = nullptr;
    Callbacks::OnConnectFailed _on_connect_failed = nullptr;
    Callbacks::OnDisconnected _on_disconnected = nullptr;
    Callbacks::OnMTUChanged _on_mtu_changed = nullptr;
    Callbacks::OnServicesDiscovered _on_services_discovered = nullptr;
    Callbacks::OnDataReceived _on_data_received = nullptr;
    Callbacks::OnNotifyEnabled _on_notify_enabled = nullptr;
    Callbacks::OnCentralConnected _on_central_connected = nullptr;
    Callbacks::OnCentralDisconnected _on_central_disconnected = nullptr;
    Callbacks::OnWriteReceived _on_write_received = nullptr;
    Callbacks::OnInfoWritten _on_info_written = nullptr;
};

}} // namespace BAB::BLE
