/**
 * @file BLEJoinManager.h
 * @brief Joiner (central) side of a session
 *
 * Scans for hosts advertising the session service and holds at most one
 * host link. Connection setup runs
 *
 *   CONNECTING -> DISCOVERING_SERVICES -> SUBSCRIBING -> READY
 *
 * and any failure on the way is reported once through onConnectionFailed
 * with the link released. The whole setup is bounded by
 * TransportConfig::connection_timeout.
 */
#pragma once

#include "BLESessionTransport.h"

#include <vector>

namespace BAB { namespace BLE {

class BLEJoinManager : public BLESessionTransport {
public:
    explicit BLEJoinManager(IBLEPlatform::Ptr platform = nullptr,
                            const TransportConfig& config = TransportConfig());
    ~BLEJoinManager() override;

    //=========================================================================
    // Discovery
    //=========================================================================

    /**
     * @brief Begin discovery; clears previously discovered hosts
     * @param duration Seconds to scan, 0 for TransportConfig::scan_duration
     */
    void startScanning(double duration = 0);

    /**
     * @brief End discovery; idempotent
     */
    void stopScanning();

    bool isScanning() const;
    std::vector<HostDescriptor> discoveredHosts() const;

    //=========================================================================
    // Connection
    //=========================================================================

    void connect(const HostDescriptor& host);

    /**
     * @brief Leave the session or abandon a connection attempt; idempotent
     */
    void disconnect();

    ConnectionState connectionState() const;
    PeerId hostPeerId() const;

    //=========================================================================
    // Callbacks
    //=========================================================================

    void setOnHostDiscovered(Callbacks::OnHostDiscovered callback) { _on_host_discovered = callback; }
    void setOnScanComplete(Callbacks::OnScanComplete callback) { _on_scan_complete = callback; }
    void setOnConnectionFailed(Callbacks::OnConnectionFailed callback) { _on_connection_failed = callback; }

protected:
    void handleEvent(const TransportEvent& event) override;
    void onRadioLost(RadioState state) override;
    void onStop() override;
    void onLoop(double now) override;
    PlatformConfig platformConfig() const override;

private:
    void doStartScan(double duration);
    void doStopScan();
    void doConnect(const HostDescriptor& host);
    void doDisconnect();

    void onScanResult(const ScanResult& result);
    void onScanComplete();
    void onConnected(const ConnectionHandle& conn);
    void onConnectFailed(const BLEAddress& address, uint8_t reason);
    void onDisconnected(const ConnectionHandle& conn, uint8_t reason);
    void onServicesDiscovered(const ConnectionHandle& conn, DiscoveryResult result);
    void onInfoRead(uint16_t conn_handle, OperationResult result, const Bytes& data);
    void onNotification(const ConnectionHandle& conn, const Bytes& data);
    void sendPacket(const Bytes& payload);

    void subscribe();
    void failConnection(TransportError reason);
    void resetLink();
    bool isSettingUp() const;

    static TransportError failureForReason(uint8_t reason);

    // Discovery
    std::vector<HostDescriptor> _discovered;
    bool _scanning = false;
    double _scan_deadline = 0;

    // Host link
    ConnectionState _state = ConnectionState::DISCONNECTED;
    HostDescriptor _target;
    ConnectionHandle _conn;
    std::string _host_display_name;
    PeerId _host_peer_id;
    double _connect_deadline = 0;

    Callbacks::OnHostDiscovered _on_host_discovered = nullptr;
    Callbacks::OnScanComplete _on_scan_complete = nullptr;
    Callbacks::OnConnectionFailed _on_connection_failed = nullptr;
};

}} // namespace BAB::BLE
