#pragma once

#include "chunkswarm/network/tcp_server.hpp"
#include "chunkswarm/tracker/tracker.hpp"
#include "chunkswarm/tracker/tracker_service.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace chunkswarm::tracker {

// Serves the Tracker over framed TCP. Each session must start with a hello
// binding it to a device; the live session table doubles as the presence
// signal, and a closed session is a Disconnect of its device.
class TrackerServer : public TrackerNotifier, public PresenceOracle {
public:
    TrackerServer(Tracker& tracker, std::uint16_t port, const std::string& bind_address = "0.0.0.0");
    ~TrackerServer() override;

    TrackerServer(const TrackerServer&) = delete;
    TrackerServer& operator=(const TrackerServer&) = delete;

    bool start();
    void stop();
    bool is_running() const { return server_.is_running(); }
    std::uint16_t port() const { return server_.port(); }

    void notify(const core::DeviceKey& target, const TrackerNotification& notification) override;
    bool is_online(const core::DeviceKey& device) const override;

    size_t session_count() const;

private:
    void on_message(std::shared_ptr<network::Connection> connection,
                    const network::MessageHeader& header,
                    std::vector<std::uint8_t> payload);
    void on_closed(std::shared_ptr<network::Connection> connection);
    void on_hello(const std::shared_ptr<network::Connection>& connection,
                  const network::MessageHeader& header,
                  const HelloMessage& hello);

    Tracker& tracker_;
    TrackerService service_;
    network::TcpServer server_;

    mutable std::mutex sessions_mutex_;
    std::map<const network::Connection*, core::DeviceKey> sessions_;
    std::map<core::DeviceKey, std::weak_ptr<network::Connection>> devices_;
};

}
