#pragma once

// ============================================================
// discovery.hpp -- UDP beacon for finding LanShare servers
//
// A sharing device announces itself once per interval with a
// datagram "LANSHARE1 <port> <name>". Listeners report each peer
// the first time it is seen and whenever its name or port changes.
// ============================================================

#include "platform.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

static constexpr u16 DISCOVERY_PORT = 53317;
static constexpr const char* DISCOVERY_MAGIC = "LANSHARE1";

struct PeerRecord {
    std::string name;
    std::string host;    // sender address of the beacon
    u16         port{0}; // HTTP port announced in the beacon
};

struct DiscoveryConfig {
    std::string beacon_addr{"255.255.255.255"};
    u16         beacon_port{DISCOVERY_PORT};   // 0 = ephemeral (listener only)
    u64         interval_ms{1000};
};

using PeerCallback = std::function<void(const PeerRecord& peer)>;

class DiscoveryService {
public:
    explicit DiscoveryService(DiscoveryConfig config = DiscoveryConfig());
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    // Start announcing. Throws NetworkError if the UDP socket cannot be
    // created, ConcurrencyError if already announcing.
    void broadcast(const std::string& name, u16 port);

    // Start listening. Throws BindError if the beacon port is taken,
    // ConcurrencyError if already listening.
    void discover(PeerCallback on_peer);

    // Port the listener is bound to; 0 before discover()
    u16 listen_port() const { return listen_port_.load(); }

    void stop();

    static std::string format_beacon(const std::string& name, u16 port);

    // Parses a beacon datagram; false for anything that is not one
    static bool parse_beacon(const std::string& datagram, const std::string& sender,
                             PeerRecord& out);

private:
    void broadcast_loop(int fd, std::string payload);
    void listen_loop(int fd, PeerCallback on_peer);

    DiscoveryConfig config_;

    std::atomic<bool> stopping_{false};
    std::atomic<u16>  listen_port_{0};
    std::mutex        mutex_;
    std::condition_variable stop_cv_;
    std::thread       broadcast_thread_;
    std::thread       listen_thread_;

    std::map<std::string, PeerRecord> known_;   // keyed by host
};
