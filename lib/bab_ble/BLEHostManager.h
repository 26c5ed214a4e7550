/**
 * @file BLEHostManager.h
 * @brief Host (peripheral) side of a session
 *
 * Publishes the session service, admits up to max_peers joiners, and moves
 * packets to them over the notify channel. A joiner becomes a peer when it
 * subscribes to the notify channel, not when the link comes up; a subscriber
 * beyond capacity is disconnected with reason LOW_RESOURCES.
 */
#pragma once

#include "BLESessionTransport.h"

#include <atomic>
#include <map>

namespace BAB { namespace BLE {

class BLEHostManager : public BLESessionTransport {
public:
    explicit BLEHostManager(IBLEPlatform::Ptr platform = nullptr,
                            const TransportConfig& config = TransportConfig());
    ~BLEHostManager() override;

    /**
     * @brief Publish the session service under "BAB-" + localName[0..8]
     *
     * Returns at once. If the radio is not powered on, the request is
     * remembered and replayed on power-on; a later request replaces it.
     *
     * @param local_name Host name, also served on the info channel
     * @return Handle identifying the publication
     */
    ServiceHandle startAdvertising(const std::string& local_name);

    /**
     * @brief Withdraw the service and drop every joiner; idempotent
     */
    void stopAdvertising();

    bool isAdvertising() const;
    ServiceHandle serviceHandle() const;

protected:
    void handleEvent(const TransportEvent& event) override;
    void onRadioLost(RadioState state) override;
    void onStop() override;
    PlatformConfig platformConfig() const override;

private:
    // A central link, subscribed or not
    struct Link {
        ConnectionHandle conn;
        std::string display_name;
        double connected_at = 0;
    };

    void doStartAdvertising(const std::string& local_name, uint16_t service_id);
    void doStopAdvertising();
    void resetSession();

    void onCentralConnected(const ConnectionHandle& conn);
    void onCentralDisconnected(const ConnectionHandle& conn, uint8_t reason);
    void onSubscription(const ConnectionHandle& conn, bool enabled);
    void onWriteReceived(const ConnectionHandle& conn, const Bytes& data);
    void onInfoWritten(const ConnectionHandle& conn, const Bytes& data);
    void onMTUChanged(const ConnectionHandle& conn, uint16_t mtu);
    void sendPacket(const PeerId& target, const Bytes& payload);

    std::map<uint16_t, Link> _links;
    ServiceHandle _service;
    bool _advertising = false;
    std::string _local_name;

    std::atomic<uint16_t> _next_service_id{1};
};

}} // namespace BAB::BLE
