/**
 * @file NimBLEPlatform.h
 * @brief NimBLE-Arduino implementation of IBLEPlatform for ESP32
 *
 * Runs either as a session host (GATT server with the notify, write and
 * info characteristics) or as a joiner (scanner plus one GATT client).
 * NimBLE callbacks arrive on the NimBLE host task; everything they touch
 * is guarded by _conn_mutex or _state_mux, and the session managers only
 * queue events from them.
 */
#pragma once

#include "../BLEPlatform.h"

// Only compile for ESP32 with NimBLE
#if defined(ESP32) && (defined(USE_NIMBLE) || defined(CONFIG_BT_NIMBLE_ENABLED))

#include <NimBLEDevice.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

// Undefine NimBLE's backward compatibility macros to avoid conflict with our types
#undef BLEAddress

#include <map>
#include <vector>

namespace BAB { namespace BLE {

class NimBLEPlatform : public IBLEPlatform,
                       public NimBLEServerCallbacks,
                       public NimBLECharacteristicCallbacks,
                       public NimBLEClientCallbacks,
                       public NimBLEScanCallbacks {
public:
    NimBLEPlatform();
    virtual ~NimBLEPlatform();

    //=========================================================================
    // IBLEPlatform Implementation
    //=========================================================================

    // Lifecycle
    bool initialize(const PlatformConfig& config) override;
    void loop() override;
    void shutdown() override;
    bool isInitialized() const override { return _initialized; }
    RadioState getRadioState() const override;

    // Central mode - Scanning
    bool startScan(uint32_t duration_ms = 0) override;
    void stopScan() override;
    bool isScanning() const override;

    // Central mode - Connections
    bool connect(const BLEAddress& address, uint32_t timeout_ms) override;
    bool disconnect(uint16_t conn_handle, uint8_t reason = Reason::REMOTE_USER_TERMINATED) override;
    void disconnectAll() override;
    bool discoverServices(uint16_t conn_handle) override;

    // Peripheral mode
    bool startAdvertising(const std::string& local_name) override;
    void stopAdvertising() override;
    bool isAdvertising() const override;
    void setInfoData(const Bytes& info) override;

    // GATT Operations
    bool write(uint16_t conn_handle, const Bytes& data, bool response = false) override;
    bool writeInfo(uint16_t conn_handle, const Bytes& data) override;
    bool readInfo(uint16_t conn_handle, Callbacks::OnInfoRead callback) override;
    bool enableNotifications(uint16_t conn_handle, bool enable) override;
    bool notify(uint16_t conn_handle, const Bytes& data) override;

    // Connection management
    std::vector<ConnectionHandle> getConnections() const override;
    ConnectionHandle getConnection(uint16_t handle) const override;
    size_t getConnectionCount() const override;
    bool isConnectedTo(const BLEAddress& address) const override;

    // Callback registration
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

    // Platform info
    PlatformType getPlatformType() const override { return PlatformType::NIMBLE_ARDUINO; }
    std::string getPlatformName() const override { return "NimBLE-Arduino"; }
    BLEAddress getLocalAddress() const override;

    //=========================================================================
    // NimBLEServerCallbacks (Peripheral mode)
    //=========================================================================

    void onConnect(NimBLEServer* pServer, NimBLEConnInfo& connInfo) override;
    void onDisconnect(NimBLEServer* pServer, NimBLEConnInfo& connInfo, int reason) override;
    void onMTUChange(uint16_t MTU, NimBLEConnInfo& connInfo) override;

    //=========================================================================
    // NimBLECharacteristicCallbacks
    //=========================================================================

    void onWrite(NimBLECharacteristic* pCharacteristic, NimBLEConnInfo& connInfo) override;
    void onSubscribe(NimBLECharacteristic* pCharacteristic, NimBLEConnInfo& connInfo,
                     uint16_t subValue) override;

    //=========================================================================
    // NimBLEClientCallbacks (Central mode)
    //=========================================================================

    void onConnect(NimBLEClient* pClient) override;
    void onConnectFail(NimBLEClient* pClient, int reason) override;
    void onDisconnect(NimBLEClient* pClient, int reason) override;

    //=========================================================================
    // NimBLEScanCallbacks (Scanning)
    //=========================================================================

    void onResult(const NimBLEAdvertisedDevice* advertisedDevice) override;
    void onScanEnd(const NimBLEScanResults& results, int reason) override;

private:
    // Setup methods
    bool setupServer();
    bool setupAdvertising();
    bool setupScan();

    // Address conversion
    static BLEAddress fromNimBLE(const NimBLEAddress& addr);
    static NimBLEAddress toNimBLE(const BLEAddress& addr);

    // NimBLE reports HCI reasons offset by BLE_HS_ERR_HCI_BASE
    static uint8_t toReason(int nimble_reason);

    NimBLEClient* findClient(uint16_t conn_handle);
    NimBLERemoteCharacteristic* findRemoteChar(uint16_t conn_handle, const char* uuid);

    void addConnection(const ConnectionHandle& conn);
    bool removeConnection(uint16_t conn_handle, ConnectionHandle& removed);
    void updateConnectionMTU(uint16_t conn_handle, uint16_t mtu);

    void setRadioState(RadioState state);

    //=========================================================================
    // State
    //=========================================================================

    // Scan / advertising flags (protected by spinlock)
    mutable portMUX_TYPE _state_mux = portMUX_INITIALIZER_UNLOCKED;
    bool _scanning = false;
    bool _advertising = false;
    bool _service_published = false;
    RadioState _radio_state = RadioState::UNKNOWN;

    // Mutex for connection map access
    SemaphoreHandle_t _conn_mutex = nullptr;

    PlatformConfig _config;
    bool _initialized = false;
    unsigned long _scan_stop_time = 0;  // millis() when to stop the scan
    Bytes _info_data;

    // NimBLE objects
    NimBLEServer* _server = nullptr;
    NimBLEService* _service = nullptr;
    NimBLECharacteristic* _notify_char = nullptr;
    NimBLECharacteristic* _write_char = nullptr;
    NimBLECharacteristic* _info_char = nullptr;
    NimBLEScan* _scan = nullptr;
    NimBLEAdvertising* _advertising_obj = nullptr;

    // Client connections (as central)
    std::map<uint16_t, NimBLEClient*> _clients;

    // Connection tracking
    std::map<uint16_t, ConnectionHandle> _connections;

    // Callbacks
    Callbacks::OnRadioStateChanged _on_radio_state_changed;
    Callbacks::OnScanResult _on_scan_result;
    Callbacks::OnScanComplete _on_scan_complete;
    Callbacks::OnConnected _on_connected;
    Callbacks::OnConnectFailed _on_connect_failed;
    Callbacks::OnDisconnected _on_disconnected;
    Callbacks::OnMTUChanged _on_mtu_changed;
    Callbacks::OnServicesDiscovered _on_services_discovered;
    Callbacks::OnDataReceived _on_data_received;
    Callbacks::OnNotifyEnabled _on_notify_enabled;
    Callbacks::OnCentralConnected _on_central_connected;
    Callbacks::OnCentralDisconnected _on_central_disconnected;
    Callbacks::OnWriteReceived _on_write_received;
    Callbacks::OnInfoWritten _on_info_written;
};

}} // namespace BAB::BLE

#endif // ESP32 && USE_NIMBLE
