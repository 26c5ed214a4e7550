/**
 * @file NimBLEPlatform.cpp
 * @brief NimBLE-Arduino implementation for ESP32
 */

#include "NimBLEPlatform.h"

#if defined(ESP32) && (defined(USE_NIMBLE) || defined(CONFIG_BT_NIMBLE_ENABLED))

#include "Log.h"
#include <algorithm>

extern "C" {
    #include "nimble/nimble/host/include/host/ble_gap.h"
    #include "nimble/nimble/host/include/host/ble_hs.h"

    int ble_gap_adv_active(void);
    int ble_gap_disc_active(void);
}

using namespace RNS;

namespace BAB { namespace BLE {

//=============================================================================
// Constructor / Destructor
//=============================================================================

NimBLEPlatform::NimBLEPlatform() {
    _conn_mutex = xSemaphoreCreateMutex();
}

NimBLEPlatform::~NimBLEPlatform() {
    shutdown();
    if (_conn_mutex) {
        vSemaphoreDelete(_conn_mutex);
        _conn_mutex = nullptr;
    }
}

//=============================================================================
// Lifecycle
//=============================================================================

bool NimBLEPlatform::initialize(const PlatformConfig& config) {
    if (_initialized) {
        WARNING("NimBLEPlatform: Already initialized");
        return true;
    }

    _config = config;

    if (!NimBLEDevice::init(_config.device_name)) {
        ERROR("NimBLEPlatform: NimBLE init failed");
        setRadioState(RadioState::UNSUPPORTED);
        return false;
    }

    // BLE_OWN_ADDR_PUBLIC fails client connections on ESP32-S3
    NimBLEDevice::setOwnAddrType(BLE_OWN_ADDR_RANDOM);
    NimBLEDevice::setPower(ESP_PWR_LVL_P9);
    NimBLEDevice::setMTU(_config.preferred_mtu);

    if (_config.role == Role::PERIPHERAL) {
        if (!setupServer()) {
            ERROR("NimBLEPlatform: Failed to setup server");
            return false;
        }
    } else if (!setupScan()) {
        ERROR("NimBLEPlatform: Failed to setup scan");
        return false;
    }

    _initialized = true;
    setRadioState(RadioState::POWERED_ON);

    INFO("NimBLEPlatform: Initialized, role: " + std::string(roleToString(_config.role)));
    return true;
}

void NimBLEPlatform::loop() {
    if (!_initialized) {
        return;
    }

    portENTER_CRITICAL(&_state_mux);
    bool scanning = _scanning;
    portEXIT_CRITICAL(&_state_mux);

    if (scanning && _scan_stop_time > 0 && millis() >= _scan_stop_time) {
        DEBUG("NimBLEPlatform: Stopping scan after timeout");
        stopScan();

        if (_on_scan_complete) {
            _on_scan_complete();
        }
    }
}

void NimBLEPlatform::shutdown() {
    if (!_initialized) {
        return;
    }

    INFO("NimBLEPlatform: Shutting down");

    stopScan();
    stopAdvertising();
    disconnectAll();

    if (xSemaphoreTake(_conn_mutex, pdMS_TO_TICKS(1000))) {
        for (auto& kv : _clients) {
            if (kv.second) {
                NimBLEDevice::deleteClient(kv.second);
            }
        }
        _clients.clear();
        _connections.clear();
        xSemaphoreGive(_conn_mutex);
    } else {
        WARNING("NimBLEPlatform: Could not acquire mutex for cleanup - forcing cleanup");
        _clients.clear();
        _connections.clear();
    }

    NimBLEDevice::deinit(true);
    _initialized = false;

    _server = nullptr;
    _service = nullptr;
    _notify_char = nullptr;
    _write_char = nullptr;
    _info_char = nullptr;
    _scan = nullptr;
    _advertising_obj = nullptr;
    _service_published = false;

    setRadioState(RadioState::POWERED_OFF);
    INFO("NimBLEPlatform: Shutdown complete");
}

RadioState NimBLEPlatform::getRadioState() const {
    portENTER_CRITICAL(&_state_mux);
    RadioState state = _radio_state;
    portEXIT_CRITICAL(&_state_mux);
    return state;
}

void NimBLEPlatform::setRadioState(RadioState state) {
    portENTER_CRITICAL(&_state_mux);
    bool changed = _radio_state != state;
    _radio_state = state;
    portEXIT_CRITICAL(&_state_mux);

    if (changed && _on_radio_state_changed) {
        _on_radio_state_changed(state);
    }
}

//=============================================================================
// Central Mode - Scanning
//=============================================================================

bool NimBLEPlatform::startScan(uint32_t duration_ms) {
    if (!_scan) {
        ERROR("NimBLEPlatform: Scan not initialized");
        return false;
    }

    if (isScanning()) {
        return true;
    }

    _scan->clearResults();
    _scan->setActiveScan(_config.scan_mode == ScanMode::ACTIVE);
    _scan->setInterval(_config.scan_interval_ms);
    _scan->setWindow(_config.scan_window_ms);

    // NimBLE 2.x: 0 scans until stopped; loop() enforces the duration
    if (!_scan->start(0, false)) {
        ERROR("NimBLEPlatform: Failed to start scan");
        return false;
    }

    portENTER_CRITICAL(&_state_mux);
    _scanning = true;
    portEXIT_CRITICAL(&_state_mux);

    _scan_stop_time = duration_ms > 0 ? millis() + duration_ms : 0;
    DEBUG("NimBLEPlatform: Scan started, will stop in " + std::to_string(duration_ms) + "ms");
    return true;
}

void NimBLEPlatform::stopScan() {
    portENTER_CRITICAL(&_state_mux);
    bool was_scanning = _scanning;
    _scanning = false;
    portEXIT_CRITICAL(&_state_mux);

    if (!was_scanning) {
        return;
    }

    if (_scan) {
        _scan->stop();
    }

    uint32_t start = millis();
    while (ble_gap_disc_active() && millis() - start < 1000) {
        // Wait for the controller to leave discovery, bounded at 1 s
        delay(10);
    }

    _scan_stop_time = 0;
    DEBUG("NimBLEPlatform: Scan stopped");
}

bool NimBLEPlatform::isScanning() const {
    portENTER_CRITICAL(&_state_mux);
    bool scanning = _scanning;
    portEXIT_CRITICAL(&_state_mux);
    return scanning;
}

//=============================================================================
// Central Mode - Connections
//=============================================================================

bool NimBLEPlatform::connect(const BLEAddress& address, uint32_t timeout_ms) {
    if (isConnectedTo(address)) {
        WARNING("NimBLEPlatform: Already connected to " + address.toString());
        return false;
    }

    if (getConnectionCount() >= _config.max_connections) {
        WARNING("NimBLEPlatform: Connection limit reached");
        return false;
    }

    stopScan();

    NimBLEAddress nimAddr = toNimBLE(address);

    // Delete any existing clients for this address to ensure clean state
    NimBLEClient* existing = NimBLEDevice::getClientByPeerAddress(nimAddr);
    while (existing) {
        if (existing->isConnected()) {
            existing->disconnect();
        }
        NimBLEDevice::deleteClient(existing);
        existing = NimBLEDevice::getClientByPeerAddress(nimAddr);
    }

    NimBLEClient* client = NimBLEDevice::createClient();
    if (!client) {
        ERROR("NimBLEPlatform: Failed to create client");
        return false;
    }

    client->setClientCallbacks(this, false);
    client->setConnectTimeout(timeout_ms);
    client->setConnectionParams(
        _config.conn_interval_min_ms * 1000 / 1250,     // 1.25ms units
        _config.conn_interval_max_ms * 1000 / 1250,
        _config.conn_latency,
        _config.supervision_timeout_ms / 10);           // 10ms units

    DEBUG("NimBLEPlatform: Connecting to " + address.toString() +
          " timeout=" + std::to_string(timeout_ms) + "ms");

    // Async: completion arrives through onConnect / onConnectFail
    if (!client->connect(nimAddr, true, true, true)) {
        ERROR("NimBLEPlatform: Connection request failed for " + address.toString());
        NimBLEDevice::deleteClient(client);
        return false;
    }

    return true;
}

bool NimBLEPlatform::disconnect(uint16_t conn_handle, uint8_t reason) {
    ConnectionHandle conn = getConnection(conn_handle);
    if (!conn.isValid()) {
        return false;
    }

    if (conn.local_role == Role::CENTRAL) {
        NimBLEClient* client = findClient(conn_handle);
        if (client) {
            return client->disconnect(reason) == 0;
        }
        return false;
    }

    if (_server) {
        return _server->disconnect(conn_handle, reason);
    }
    return false;
}

void NimBLEPlatform::disconnectAll() {
    for (const ConnectionHandle& conn : getConnections()) {
        disconnect(conn.handle, Reason::REMOTE_USER_TERMINATED);
    }
}

bool NimBLEPlatform::discoverServices(uint16_t conn_handle) {
    NimBLEClient* client = findClient(conn_handle);
    if (!client) {
        return false;
    }

    DiscoveryResult result = DiscoveryResult::SUCCESS;

    NimBLERemoteService* service = client->getService(UUID::SERVICE);
    if (!service) {
        WARNING("NimBLEPlatform: Session service not found");
        result = DiscoveryResult::SERVICE_NOT_FOUND;
    } else if (!service->getCharacteristic(UUID::NOTIFY_CHAR) ||
               !service->getCharacteristic(UUID::WRITE_CHAR)) {
        WARNING("NimBLEPlatform: Session channels not found");
        result = DiscoveryResult::CHANNEL_NOT_FOUND;
    } else {
        DEBUG("NimBLEPlatform: Services discovered for " + std::to_string(conn_handle));
    }

    if (_on_services_discovered) {
        _on_services_discovered(getConnection(conn_handle), result);
    }
    return true;
}

//=============================================================================
// Peripheral Mode
//=============================================================================

bool NimBLEPlatform::startAdvertising(const std::string& local_name) {
    if (!_server || !_advertising_obj) {
        ERROR("NimBLEPlatform: Server not initialized");
        return false;
    }

    if (isAdvertising()) {
        _advertising_obj->stop();
    }

    if (!_service_published) {
        _server->addService(_service);
        _service_published = true;
    }

    _advertising_obj->setName(local_name);

    if (!_advertising_obj->start()) {
        ERROR("NimBLEPlatform: Failed to start advertising");
        return false;
    }

    portENTER_CRITICAL(&_state_mux);
    _advertising = true;
    portEXIT_CRITICAL(&_state_mux);

    DEBUG("NimBLEPlatform: Advertising started as " + local_name);
    return true;
}

void NimBLEPlatform::stopAdvertising() {
    portENTER_CRITICAL(&_state_mux);
    bool was_advertising = _advertising;
    _advertising = false;
    portEXIT_CRITICAL(&_state_mux);

    if (was_advertising && _advertising_obj) {
        _advertising_obj->stop();

        uint32_t start = millis();
        while (ble_gap_adv_active() && millis() - start < 1000) {
            // Bounded wait for the controller to stop advertising
            delay(10);
        }
    }

    // Withdraw the service so connected centrals no longer see it
    if (_server && _service && _service_published) {
        _server->removeService(_service, false);
        _service_published = false;
    }

    DEBUG("NimBLEPlatform: Advertising stopped");
}

bool NimBLEPlatform::isAdvertising() const {
    portENTER_CRITICAL(&_state_mux);
    bool advertising = _advertising;
    portEXIT_CRITICAL(&_state_mux);
    return advertising;
}

void NimBLEPlatform::setInfoData(const Bytes& info) {
    _info_data = info;
    if (_info_char) {
        _info_char->setValue(info.data(), info.size());
    }
}

//=============================================================================
// GATT Operations
//=============================================================================

bool NimBLEPlatform::write(uint16_t conn_handle, const Bytes& data, bool response) {
    NimBLERemoteCharacteristic* chr = findRemoteChar(conn_handle, UUID::WRITE_CHAR);
    if (!chr) {
        return false;
    }
    return chr->writeValue(data.data(), data.size(), response);
}

bool NimBLEPlatform::writeInfo(uint16_t conn_handle, const Bytes& data) {
    NimBLERemoteCharacteristic* chr = findRemoteChar(conn_handle, UUID::INFO_CHAR);
    if (!chr) {
        return false;
    }
    return chr->writeValue(data.data(), data.size(), true);
}

bool NimBLEPlatform::readInfo(uint16_t conn_handle, Callbacks::OnInfoRead callback) {
    NimBLERemoteCharacteristic* chr = findRemoteChar(conn_handle, UUID::INFO_CHAR);
    if (!chr || !chr->canRead()) {
        return false;
    }

    NimBLEAttValue value = chr->readValue();
    if (callback) {
        callback(OperationResult::SUCCESS, Bytes(value.data(), value.size()));
    }
    return true;
}

bool NimBLEPlatform::enableNotifications(uint16_t conn_handle, bool enable) {
    NimBLERemoteCharacteristic* chr = findRemoteChar(conn_handle, UUID::NOTIFY_CHAR);
    if (!chr) {
        return false;
    }

    if (!enable) {
        return chr->unsubscribe();
    }

    auto notifyCb = [this, conn_handle](NimBLERemoteCharacteristic* pChar,
                                         uint8_t* pData, size_t length, bool isNotify) {
        if (_on_data_received) {
            _on_data_received(getConnection(conn_handle), Bytes(pData, length));
        }
    };
    return chr->subscribe(true, notifyCb);
}

bool NimBLEPlatform::notify(uint16_t conn_handle, const Bytes& data) {
    if (!_notify_char) {
        return false;
    }
    return _notify_char->notify(data.data(), data.size(), conn_handle);
}

//=============================================================================
// Connection Management
//=============================================================================

std::vector<ConnectionHandle> NimBLEPlatform::getConnections() const {
    std::vector<ConnectionHandle> result;
    if (xSemaphoreTake(_conn_mutex, pdMS_TO_TICKS(100))) {
        for (const auto& kv : _connections) {
            result.push_back(kv.second);
        }
        xSemaphoreGive(_conn_mutex);
    }
    return result;
}

ConnectionHandle NimBLEPlatform::getConnection(uint16_t handle) const {
    ConnectionHandle result;
    if (xSemaphoreTake(_conn_mutex, pdMS_TO_TICKS(100))) {
        auto it = _connections.find(handle);
        if (it != _connections.end()) {
            result = it->second;
        }
        xSemaphoreGive(_conn_mutex);
    }
    return result;
}

size_t NimBLEPlatform::getConnectionCount() const {
    size_t count = 0;
    if (xSemaphoreTake(_conn_mutex, pdMS_TO_TICKS(100))) {
        count = _connections.size();
        xSemaphoreGive(_conn_mutex);
    }
    return count;
}

bool NimBLEPlatform::isConnectedTo(const BLEAddress& address) const {
    for (const ConnectionHandle& conn : getConnections()) {
        if (conn.peer_address == address) {
            return true;
        }
    }
    return false;
}

void NimBLEPlatform::addConnection(const ConnectionHandle& conn) {
    if (xSemaphoreTake(_conn_mutex, pdMS_TO_TICKS(100))) {
        _connections[conn.handle] = conn;
        xSemaphoreGive(_conn_mutex);
    } else {
        WARNING("NimBLEPlatform: conn_mutex timeout adding " + std::to_string(conn.handle));
    }
}

bool NimBLEPlatform::removeConnection(uint16_t conn_handle, ConnectionHandle& removed) {
    bool found = false;
    if (xSemaphoreTake(_conn_mutex, pdMS_TO_TICKS(100))) {
        auto it = _connections.find(conn_handle);
        if (it != _connections.end()) {
            removed = it->second;
            _connections.erase(it);
            found = true;
        }
        xSemaphoreGive(_conn_mutex);
    }
    return found;
}

void NimBLEPlatform::updateConnectionMTU(uint16_t conn_handle, uint16_t mtu) {
    if (xSemaphoreTake(_conn_mutex, pdMS_TO_TICKS(100))) {
        auto it = _connections.find(conn_handle);
        if (it != _connections.end()) {
            it->second.mtu = mtu;
        }
        xSemaphoreGive(_conn_mutex);
    }
}

BLEAddress NimBLEPlatform::getLocalAddress() const {
    return fromNimBLE(NimBLEDevice::getAddress());
}

//=============================================================================
// NimBLE Server Callbacks (Peripheral mode)
//=============================================================================

void NimBLEPlatform::onConnect(NimBLEServer* pServer, NimBLEConnInfo& connInfo) {
    uint16_t conn_handle = connInfo.getConnHandle();

    if (getConnectionCount() >= _config.max_connections) {
        WARNING("NimBLEPlatform: Refusing central, connection limit reached");
        pServer->disconnect(conn_handle, Reason::LOW_RESOURCES);
        return;
    }

    ConnectionHandle conn;
    conn.handle = conn_handle;
    conn.peer_address = fromNimBLE(connInfo.getAddress());
    conn.local_role = Role::PERIPHERAL;
    conn.state = ConnectionState::CONNECTED;
    conn.mtu = connInfo.getMTU() - MTU::ATT_OVERHEAD;
    addConnection(conn);

    DEBUG("NimBLEPlatform: Central connected: " + conn.peer_address.toString());

    if (_on_central_connected) {
        _on_central_connected(conn);
    }

    // Keep advertising while there is room for more joiners
    if (isAdvertising() && getConnectionCount() < _config.max_connections) {
        _advertising_obj->start();
    }
}

void NimBLEPlatform::onDisconnect(NimBLEServer* pServer, NimBLEConnInfo& connInfo, int reason) {
    ConnectionHandle conn;
    if (!removeConnection(connInfo.getConnHandle(), conn)) {
        return;
    }

    DEBUG("NimBLEPlatform: Central disconnected: " + conn.peer_address.toString() +
          " reason: " + std::to_string(reason));

    if (_on_central_disconnected) {
        _on_central_disconnected(conn, toReason(reason));
    }

    if (isAdvertising()) {
        _advertising_obj->start();
    }
}

void NimBLEPlatform::onMTUChange(uint16_t MTU, NimBLEConnInfo& connInfo) {
    uint16_t conn_handle = connInfo.getConnHandle();
    uint16_t usable = MTU - MTU::ATT_OVERHEAD;
    updateConnectionMTU(conn_handle, usable);

    DEBUG("NimBLEPlatform: MTU changed to " + std::to_string(MTU) +
          " for connection " + std::to_string(conn_handle));

    if (_on_mtu_changed) {
        _on_mtu_changed(getConnection(conn_handle), usable);
    }
}

//=============================================================================
// NimBLE Characteristic Callbacks
//=============================================================================

void NimBLEPlatform::onWrite(NimBLECharacteristic* pCharacteristic, NimBLEConnInfo& connInfo) {
    NimBLEAttValue value = pCharacteristic->getValue();
    Bytes data(value.data(), value.size());
    ConnectionHandle conn = getConnection(connInfo.getConnHandle());

    if (pCharacteristic == _info_char) {
        // Restore our own name for the next reader
        _info_char->setValue(_info_data.data(), _info_data.size());
        if (_on_info_written) {
            _on_info_written(conn, data);
        }
        return;
    }

    if (_on_write_received) {
        _on_write_received(conn, data);
    }
}

void NimBLEPlatform::onSubscribe(NimBLECharacteristic* pCharacteristic, NimBLEConnInfo& connInfo,
                                  uint16_t subValue) {
    if (pCharacteristic != _notify_char) {
        return;
    }

    uint16_t conn_handle = connInfo.getConnHandle();
    bool enabled = (subValue > 0);

    DEBUG("NimBLEPlatform: Notifications " + std::string(enabled ? "enabled" : "disabled") +
          " for connection " + std::to_string(conn_handle));

    if (_on_notify_enabled) {
        _on_notify_enabled(getConnection(conn_handle), enabled);
    }
}

//=============================================================================
// NimBLE Client Callbacks (Central mode)
//=============================================================================

void NimBLEPlatform::onConnect(NimBLEClient* pClient) {
    uint16_t conn_handle = pClient->getConnHandle();

    ConnectionHandle conn;
    conn.handle = conn_handle;
    conn.peer_address = fromNimBLE(pClient->getPeerAddress());
    conn.local_role = Role::CENTRAL;
    conn.state = ConnectionState::CONNECTED;
    conn.mtu = pClient->getMTU() - MTU::ATT_OVERHEAD;
    addConnection(conn);

    if (xSemaphoreTake(_conn_mutex, pdMS_TO_TICKS(100))) {
        _clients[conn_handle] = pClient;
        xSemaphoreGive(_conn_mutex);
    }

    DEBUG("NimBLEPlatform: Connected to peripheral: " + conn.peer_address.toString() +
          " handle=" + std::to_string(conn_handle) + " mtu=" + std::to_string(conn.mtu));

    if (_on_connected) {
        _on_connected(conn);
    }
}

void NimBLEPlatform::onConnectFail(NimBLEClient* pClient, int reason) {
    BLEAddress peer_addr = fromNimBLE(pClient->getPeerAddress());
    ERROR("NimBLEPlatform: onConnectFail to " + peer_addr.toString() +
          " reason=" + std::to_string(reason));

    NimBLEDevice::deleteClient(pClient);

    if (_on_connect_failed) {
        _on_connect_failed(peer_addr, toReason(reason));
    }
}

void NimBLEPlatform::onDisconnect(NimBLEClient* pClient, int reason) {
    uint16_t conn_handle = pClient->getConnHandle();

    ConnectionHandle conn;
    bool known = removeConnection(conn_handle, conn);

    if (xSemaphoreTake(_conn_mutex, pdMS_TO_TICKS(100))) {
        _clients.erase(conn_handle);
        xSemaphoreGive(_conn_mutex);
    }

    if (known) {
        DEBUG("NimBLEPlatform: Disconnected from peripheral: " + conn.peer_address.toString() +
              " reason: " + std::to_string(reason));
        if (_on_disconnected) {
            _on_disconnected(conn, toReason(reason));
        }
    }

    NimBLEDevice::deleteClient(pClient);
}

//=============================================================================
// NimBLE Scan Callbacks
//=============================================================================

void NimBLEPlatform::onResult(const NimBLEAdvertisedDevice* advertisedDevice) {
    if (!advertisedDevice->isAdvertisingService(NimBLEUUID(UUID::SERVICE))) {
        return;
    }

    TRACE("NimBLEPlatform: Session host " +
          std::string(advertisedDevice->getAddress().toString().c_str()) +
          " RSSI=" + std::to_string(advertisedDevice->getRSSI()) +
          " name=" + advertisedDevice->getName());

    if (_on_scan_result) {
        ScanResult result;
        result.address = fromNimBLE(advertisedDevice->getAddress());
        result.name = advertisedDevice->getName();
        result.rssi = advertisedDevice->getRSSI();
        result.connectable = advertisedDevice->isConnectable();
        result.has_session_service = true;
        _on_scan_result(result);
    }
}

void NimBLEPlatform::onScanEnd(const NimBLEScanResults& results, int reason) {
    portENTER_CRITICAL(&_state_mux);
    bool was_scanning = _scanning;
    _scanning = false;
    portEXIT_CRITICAL(&_state_mux);

    _scan_stop_time = 0;

    DEBUG("NimBLEPlatform: onScanEnd, reason=" + std::to_string(reason) +
          " found=" + std::to_string(results.getCount()) + " devices");

    // Spurious after stopScan()
    if (!was_scanning) {
        return;
    }

    if (_on_scan_complete) {
        _on_scan_complete();
    }
}

//=============================================================================
// Private Methods
//=============================================================================

bool NimBLEPlatform::setupServer() {
    _server = NimBLEDevice::createServer();
    if (!_server) {
        ERROR("NimBLEPlatform: Failed to create server");
        return false;
    }

    _server->setCallbacks(this);

    _service = _server->createService(UUID::SERVICE);
    if (!_service) {
        ERROR("NimBLEPlatform: Failed to create service");
        return false;
    }

    // Host -> joiner
    _notify_char = _service->createCharacteristic(
        UUID::NOTIFY_CHAR,
        NIMBLE_PROPERTY::READ | NIMBLE_PROPERTY::NOTIFY
    );
    _notify_char->setCallbacks(this);

    // Joiner -> host
    _write_char = _service->createCharacteristic(
        UUID::WRITE_CHAR,
        NIMBLE_PROPERTY::WRITE | NIMBLE_PROPERTY::WRITE_NR
    );
    _write_char->setCallbacks(this);

    // Display names, both directions
    _info_char = _service->createCharacteristic(
        UUID::INFO_CHAR,
        NIMBLE_PROPERTY::READ | NIMBLE_PROPERTY::WRITE
    );
    _info_char->setCallbacks(this);

    _service->start();

    // Published by startAdvertising()
    _server->removeService(_service, false);
    _service_published = false;

    return setupAdvertising();
}

bool NimBLEPlatform::setupAdvertising() {
    _advertising_obj = NimBLEDevice::getAdvertising();
    if (!_advertising_obj) {
        ERROR("NimBLEPlatform: Failed to get advertising");
        return false;
    }

    // Without a reset the advertising data may not update on ESP32-S3
    _advertising_obj->reset();

    _advertising_obj->setMinInterval(_config.adv_interval_min_ms * 1000 / 625);  // 0.625ms units
    _advertising_obj->setMaxInterval(_config.adv_interval_max_ms * 1000 / 625);
    _advertising_obj->addServiceUUID(NimBLEUUID(UUID::SERVICE));
    _advertising_obj->enableScanResponse(true);

    DEBUG("NimBLEPlatform: Advertising configured with service UUID: " + std::string(UUID::SERVICE));
    return true;
}

bool NimBLEPlatform::setupScan() {
    _scan = NimBLEDevice::getScan();
    if (!_scan) {
        ERROR("NimBLEPlatform: Failed to get scan");
        return false;
    }

    _scan->setScanCallbacks(this, false);
    _scan->setActiveScan(_config.scan_mode == ScanMode::ACTIVE);
    _scan->setInterval(_config.scan_interval_ms);
    _scan->setWindow(_config.scan_window_ms);
    _scan->setFilterPolicy(BLE_HCI_SCAN_FILT_NO_WL);

    DEBUG("NimBLEPlatform: Scan configured - interval=" + std::to_string(_config.scan_interval_ms) +
          " window=" + std::to_string(_config.scan_window_ms));
    return true;
}

BLEAddress NimBLEPlatform::fromNimBLE(const NimBLEAddress& addr) {
    BLEAddress result;
    const ble_addr_t* base = addr.getBase();
    if (base) {
        // NimBLE stores val[0]=LSB; BLEAddress stores addr[0]=MSB
        for (int i = 0; i < 6; i++) {
            result.addr[i] = base->val[5 - i];
        }
    }
    result.type = addr.getType();
    return result;
}

NimBLEAddress NimBLEPlatform::toNimBLE(const BLEAddress& addr) {
    std::string addrStr = addr.toString();
    return NimBLEAddress(addrStr.c_str(), addr.type);
}

uint8_t NimBLEPlatform::toReason(int nimble_reason) {
    if (nimble_reason >= BLE_HS_ERR_HCI_BASE) {
        return static_cast<uint8_t>(nimble_reason - BLE_HS_ERR_HCI_BASE);
    }
    return Reason::CONNECTION_FAILED;
}

NimBLEClient* NimBLEPlatform::findClient(uint16_t conn_handle) {
    NimBLEClient* client = nullptr;
    if (xSemaphoreTake(_conn_mutex, pdMS_TO_TICKS(100))) {
        auto it = _clients.find(conn_handle);
        if (it != _clients.end()) {
            client = it->second;
        }
        xSemaphoreGive(_conn_mutex);
    }
    return client;
}

NimBLERemoteCharacteristic* NimBLEPlatform::findRemoteChar(uint16_t conn_handle, const char* uuid) {
    NimBLEClient* client = findClient(conn_handle);
    if (!client) {
        return nullptr;
    }
    NimBLERemoteService* service = client->getService(UUID::SERVICE);
    if (!service) {
        return nullptr;
    }
    return service->getCharacteristic(uuid);
}

}} // namespace BAB::BLE

#endif // ESP32 && USE_NIMBLE
