#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

// LAN discovery over UDP broadcast.
//   client -> broadcast  DISCOVER_LAN_FILE_SERVER_REQ
//   server -> client     DISCOVER_LAN_FILE_SERVER_RES:<identity>:<tcp-port>

class DiscoveryResponder {
public:
    DiscoveryResponder(std::string identity, uint16_t tcp_port, uint16_t udp_port);
    ~DiscoveryResponder();

    DiscoveryResponder(const DiscoveryResponder&) = delete;
    DiscoveryResponder& operator=(const DiscoveryResponder&) = delete;

    // Binds the UDP socket and starts answering. Throws std::system_error.
    void start();
    void stop();

    uint16_t udp_port() const { return udp_port_; }

private:
    void loop();

    std::string identity_;
    uint16_t tcp_port_;
    uint16_t udp_port_;
    int sockfd_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

struct DiscoveredServer {
    std::string identity;
    std::string address;
    uint16_t port;
};

// Sends one probe to `target` (broadcast by default) and collects
// answers for `window_ms`.
std::vector<DiscoveredServer> discover_servers(uint16_t udp_port, int window_ms,
                                               const std::string& target = "255.255.255.255");
