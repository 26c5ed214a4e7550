/**
 * @file LoopbackPlatform.cpp
 * @brief In-memory BLE platform for host builds and tests
 */

#include "LoopbackPlatform.h"
#include "Log.h"
#include "Utilities/OS.h"

#include <algorithm>

using namespace RNS;

namespace BAB { namespace BLE {

//=============================================================================
// LoopbackAir
//=============================================================================

void LoopbackAir::attach(LoopbackPlatform* platform) {
    if (std::find(_platforms.begin(), _platforms.end(), platform) == _platforms.end()) {
        _platforms.push_back(platform);
    }
}

void LoopbackAir::detach(LoopbackPlatform* platform) {
    _platforms.erase(std::remove(_platforms.begin(), _platforms.end(), platform),
                     _platforms.end());
}

LoopbackPlatform* LoopbackAir::find(const BLEAddress& address) const {
    for (LoopbackPlatform* platform : _platforms) {
        if (platform->getLocalAddress() == address) {
            return platform;
        }
    }
    return nullptr;
}

BLEAddress LoopbackAir::allocateAddress() {
    // Static random address: top two bits set
    uint8_t addr[6] = {0xC0, 0xBA, 0xB0, 0x00, 0x00, 0x00};
    addr[4] = static_cast<uint8_t>(_next_address >> 8);
    addr[5] = static_cast<uint8_t>(_next_address & 0xFF);
    _next_address++;
    return BLEAddress(addr, 1);
}

uint16_t LoopbackAir::allocateHandle() {
    uint16_t handle = _next_handle++;
    if (_next_handle == 0xFFFF) {
        _next_handle = 1;
    }
    return handle;
}

//=============================================================================
// Lifecycle
//=============================================================================

LoopbackPlatform::LoopbackPlatform(LoopbackAir& air, const std::string& label)
    : _air(air),
      _label(label),
      _address(air.allocateAddress())
{
    _air.attach(this);
}

LoopbackPlatform::~LoopbackPlatform() {
    shutdown();
    _air.detach(this);
}

bool LoopbackPlatform::initialize(const PlatformConfig& config) {
    _config = config;
    _initialized = true;
    DEBUG("LoopbackPlatform: " + _label + " initialized at " + _address.toString() +
          " (" + roleToString(config.role) + ", mtu " + std::to_string(config.preferred_mtu) + ")");
    return true;
}

void LoopbackPlatform::loop() {
    if (!_initialized || !_scanning) {
        return;
    }

    if (_scan_until > 0 && Utilities::OS::time() >= _scan_until) {
        _scanning = false;
        _scan_until = 0;
        if (_on_scan_complete) {
            _on_scan_complete();
        }
        return;
    }

    // Every scan window reports every advertiser again, like a real radio
    // without duplicate filtering
    for (LoopbackPlatform* other : _air.platforms()) {
        if (other == this || !other->isPublished()) {
            continue;
        }
        ScanResult result;
        result.address = other->_address;
        result.name = other->_adv_name;
        result.rssi = LOOPBACK_RSSI;
        result.connectable = other->hasRoomForLink();
        result.has_session_service = true;
        if (_on_scan_result) {
            _on_scan_result(result);
        }
    }
}

void LoopbackPlatform::shutdown() {
    if (!_initialized) {
        return;
    }
    disconnectAll();
    _advertising = false;
    _scanning = false;
    _initialized = false;
}

void LoopbackPlatform::setRadioState(RadioState state) {
    if (state == _radio_state) {
        return;
    }

    RadioState old_state = _radio_state;
    _radio_state = state;

    if (old_state == RadioState::POWERED_ON) {
        std::vector<uint16_t> handles;
        for (const auto& entry : _links) {
            handles.push_back(entry.first);
        }
        for (uint16_t handle : handles) {
            Link* link = findLink(handle);
            if (!link) {
                continue;
            }
            ConnectionHandle conn = link->conn;
            LoopbackPlatform* remote = link->remote;
            _links.erase(handle);
            if (remote) {
                remote->linkLost(handle, Reason::SUPERVISION_TIMEOUT);
            }
            fireDisconnected(conn, Reason::POWER_OFF);
        }
        _advertising = false;
        _scanning = false;
    }

    DEBUG("LoopbackPlatform: " + _label + " radio " + radioStateToString(state));
    if (_on_radio_state_changed) {
        _on_radio_state_changed(state);
    }
}

//=============================================================================
// Central Mode
//=============================================================================

bool LoopbackPlatform::startScan(uint32_t duration_ms) {
    if (!_initialized || _radio_state != RadioState::POWERED_ON) {
        return false;
    }
    _scanning = true;
    _scan_until = duration_ms > 0 ? Utilities::OS::time() + duration_ms / 1000.0 : 0;
    return true;
}

void LoopbackPlatform::stopScan() {
    _scanning = false;
    _scan_until = 0;
}

bool LoopbackPlatform::connect(const BLEAddress& address, uint32_t timeout_ms) {
    (void)timeout_ms;

    if (!_initialized || _radio_state != RadioState::POWERED_ON) {
        return false;
    }

    LoopbackPlatform* remote = _air.find(address);
    if (!remote || remote == this || !remote->_initialized ||
        remote->_radio_state != RadioState::POWERED_ON) {
        if (_on_connect_failed) {
            _on_connect_failed(address, Reason::CONNECTION_FAILED);
        }
        return true;
    }

    if (!remote->hasRoomForLink()) {
        DEBUG("LoopbackPlatform: " + remote->_label + " refused " + _label + ", no free links");
        if (_on_connect_failed) {
            _on_connect_failed(address, Reason::LOW_RESOURCES);
        }
        return true;
    }

    uint16_t att_mtu = std::min(_config.preferred_mtu, remote->_config.preferred_mtu);
    uint16_t mtu = static_cast<uint16_t>(std::max<uint16_t>(MTU::MINIMUM, att_mtu) - MTU::ATT_OVERHEAD);
    uint16_t handle = _air.allocateHandle();

    Link local;
    local.conn.handle = handle;
    local.conn.peer_address = remote->_address;
    local.conn.local_role = Role::CENTRAL;
    local.conn.state = ConnectionState::CONNECTED;
    local.conn.mtu = mtu;
    local.remote = remote;
    _links[handle] = local;

    Link peer;
    peer.conn.handle = handle;
    peer.conn.peer_address = _address;
    peer.conn.local_role = Role::PERIPHERAL;
    peer.conn.state = ConnectionState::CONNECTED;
    peer.conn.mtu = mtu;
    peer.remote = this;
    remote->_links[handle] = peer;

    if (remote->_on_central_connected) {
        remote->_on_central_connected(peer.conn);
    }
    if (_on_connected) {
        _on_connected(local.conn);
    }
    return true;
}

bool LoopbackPlatform::disconnect(uint16_t conn_handle, uint8_t reason) {
    Link* link = findLink(conn_handle);
    if (!link) {
        return false;
    }

    ConnectionHandle conn = link->conn;
    LoopbackPlatform* remote = link->remote;
    _links.erase(conn_handle);

    if (remote) {
        remote->linkLost(conn_handle, reason);
    }
    fireDisconnected(conn, Reason::LOCAL_HOST_TERMINATED);
    return true;
}

void LoopbackPlatform::disconnectAll() {
    std::vector<uint16_t> handles;
    for (const auto& entry : _links) {
        handles.push_back(entry.first);
    }
    for (uint16_t handle : handles) {
        disconnect(handle, Reason::REMOTE_USER_TERMINATED);
    }
}

bool LoopbackPlatform::discoverServices(uint16_t conn_handle) {
    Link* link = findLink(conn_handle);
    if (!link || !link->remote) {
        return false;
    }

    DiscoveryResult result = DiscoveryResult::SUCCESS;
    if (!link->remote->_advertising) {
        result = DiscoveryResult::SERVICE_NOT_FOUND;
    } else if (!link->remote->_expose_channels) {
        result = DiscoveryResult::CHANNEL_NOT_FOUND;
    }

    if (_on_services_discovered) {
        _on_services_discovered(link->conn, result);
    }
    return true;
}

//=============================================================================
// Peripheral Mode
//=============================================================================

bool LoopbackPlatform::startAdvertising(const std::string& local_name) {
    if (!_initialized || _radio_state != RadioState::POWERED_ON) {
        return false;
    }
    _adv_name = local_name;
    _advertising = true;
    return true;
}

void LoopbackPlatform::stopAdvertising() {
    _advertising = false;
}

//=============================================================================
// Channels
//=============================================================================

bool LoopbackPlatform::write(uint16_t conn_handle, const Bytes& data, bool response) {
    (void)response;

    Link* link = findLink(conn_handle);
    if (!link || !link->remote || data.size() > link->conn.mtu) {
        return false;
    }

    LoopbackPlatform* remote = link->remote;
    const Link* remote_link = remote->findLink(conn_handle);
    if (!remote_link || !remote->_expose_channels) {
        return false;
    }
    if (remote->_on_write_received) {
        remote->_on_write_received(remote_link->conn, data);
    }
    return true;
}

bool LoopbackPlatform::writeInfo(uint16_t conn_handle, const Bytes& data) {
    Link* link = findLink(conn_handle);
    if (!link || !link->remote) {
        return false;
    }

    LoopbackPlatform* remote = link->remote;
    const Link* remote_link = remote->findLink(conn_handle);
    if (!remote_link || !remote->_expose_channels) {
        return false;
    }
    if (remote->_on_info_written) {
        remote->_on_info_written(remote_link->conn, data);
    }
    return true;
}

bool LoopbackPlatform::readInfo(uint16_t conn_handle, Callbacks::OnInfoRead callback) {
    Link* link = findLink(conn_handle);
    if (!link || !link->remote) {
        return false;
    }

    if (!link->remote->_expose_channels) {
        callback(OperationResult::NOT_FOUND, Bytes());
    } else {
        callback(OperationResult::SUCCESS, link->remote->_info);
    }
    return true;
}

bool LoopbackPlatform::enableNotifications(uint16_t conn_handle, bool enable) {
    Link* link = findLink(conn_handle);
    if (!link || !link->remote) {
        return false;
    }

    LoopbackPlatform* remote = link->remote;
    Link* remote_link = remote->findLink(conn_handle);
    if (!remote_link || !remote->_expose_channels) {
        return false;
    }

    remote_link->subscribed = enable;
    if (remote->_on_notify_enabled) {
        remote->_on_notify_enabled(remote_link->conn, enable);
    }
    return true;
}

bool LoopbackPlatform::notify(uint16_t conn_handle, const Bytes& data) {
    Link* link = findLink(conn_handle);
    if (!link || !link->remote || !link->subscribed || data.size() > link->conn.mtu) {
        return false;
    }

    LoopbackPlatform* remote = link->remote;
    const Link* remote_link = remote->findLink(conn_handle);
    if (!remote_link) {
        return false;
    }
    if (remote->_on_data_received) {
        remote->_on_data_received(remote_link->conn, data);
    }
    return true;
}

bool LoopbackPlatform::setLinkMTU(uint16_t conn_handle, uint16_t mtu) {
    Link* link = findLink(conn_handle);
    if (!link) {
        return false;
    }

    link->conn.mtu = mtu;
    if (_on_mtu_changed) {
        _on_mtu_changed(link->conn, mtu);
    }

    if (link->remote) {
        Link* remote_link = link->remote->findLink(conn_handle);
        if (remote_link) {
            remote_link->conn.mtu = mtu;
            if (link->remote->_on_mtu_changed) {
                link->remote->_on_mtu_changed(remote_link->conn, mtu);
            }
        }
    }
    return true;
}

//=============================================================================
// Connection Management
//=============================================================================

std::vector<ConnectionHandle> LoopbackPlatform::getConnections() const {
    std::vector<ConnectionHandle> result;
    for (const auto& entry : _links) {
        result.push_back(entry.second.conn);
    }
    return result;
}

ConnectionHandle LoopbackPlatform::getConnection(uint16_t handle) const {
    const Link* link = findLink(handle);
    return link ? link->conn : ConnectionHandle();
}

bool LoopbackPlatform::isConnectedTo(const BLEAddress& address) const {
    for (const auto& entry : _links) {
        if (entry.second.conn.peer_address == address) {
            return true;
        }
    }
    return false;
}

LoopbackPlatform::Link* LoopbackPlatform::findLink(uint16_t conn_handle) {
    auto it = _links.find(conn_handle);
    return it != _links.end() ? &it->second : nullptr;
}

const LoopbackPlatform::Link* LoopbackPlatform::findLink(uint16_t conn_handle) const {
    auto it = _links.find(conn_handle);
    return it != _links.end() ? &it->second : nullptr;
}

void LoopbackPlatform::linkLost(uint16_t conn_handle, uint8_t reason) {
    Link* link = findLink(conn_handle);
    if (!link) {
        return;
    }
    ConnectionHandle conn = link->conn;
    _links.erase(conn_handle);
    fireDisconnected(conn, reason);
}

void LoopbackPlatform::fireDisconnected(const ConnectionHandle& conn, uint8_t reason) {
    if (conn.local_role == Role::CENTRAL) {
        if (_on_disconnected) {
            _on_disconnected(conn, reason);
        }
    } else if (_on_central_disconnected) {
        _on_central_disconnected(conn, reason);
    }
}

}} // namespace BAB::BLE
