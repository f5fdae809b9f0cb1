// ============================================================
// discovery.cpp -- UDP beacon sender and listener
// ============================================================

#include "discovery.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <algorithm>
#include <sys/time.h>

// Listener wakes at least this often to notice stop()
static constexpr int LISTEN_POLL_MS = 200;
static constexpr size_t MAX_DATAGRAM = 1024;

static int open_udp_socket() {
    int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) {
        throw NetworkError("UDP socket() failed: " + socket_error_str(last_socket_error()));
    }
    int on = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#ifdef SO_REUSEPORT
    setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &on, sizeof(on));
#endif
    return fd;
}

DiscoveryService::DiscoveryService(DiscoveryConfig config)
    : config_(std::move(config))
{}

DiscoveryService::~DiscoveryService() {
    stop();
}

std::string DiscoveryService::format_beacon(const std::string& name, u16 port) {
    return std::string(DISCOVERY_MAGIC) + " " + std::to_string(port) + " " + name;
}

bool DiscoveryService::parse_beacon(const std::string& datagram, const std::string& sender,
                                    PeerRecord& out)
{
    std::string magic = std::string(DISCOVERY_MAGIC) + " ";
    if (datagram.compare(0, magic.size(), magic) != 0) return false;

    size_t port_begin = magic.size();
    size_t space = datagram.find(' ', port_begin);
    if (space == std::string::npos) return false;

    u64 port = 0;
    if (!utils::parse_u64(datagram.substr(port_begin, space - port_begin), port)) return false;
    if (!utils::validate_port((int)std::min<u64>(port, 70000))) return false;

    std::string name = utils::trim(datagram.substr(space + 1));
    if (name.empty()) return false;

    out.name = name;
    out.host = sender;
    out.port = (u16)port;
    return true;
}

// ---------------------------------------------------------------
// broadcast
// ---------------------------------------------------------------
void DiscoveryService::broadcast(const std::string& name, u16 port) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (broadcast_thread_.joinable()) throw ConcurrencyError("Already broadcasting");

    int fd = open_udp_socket();
    int on = 1;
    setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on));

    stopping_.store(false);
    LOG_INFO("Announcing '" + name + "' (port " + std::to_string(port) + ") to " +
             config_.beacon_addr + ":" + std::to_string(config_.beacon_port));
    broadcast_thread_ = std::thread(&DiscoveryService::broadcast_loop, this, fd,
                                    format_beacon(name, port));
}

void DiscoveryService::broadcast_loop(int fd, std::string payload) {
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port   = htons(config_.beacon_port);
    if (inet_pton(AF_INET, config_.beacon_addr.c_str(), &dest.sin_addr) != 1) {
        LOG_ERROR("Invalid beacon address: " + config_.beacon_addr);
        CLOSE_SOCKET(fd);
        return;
    }

    bool warned = false;
    std::unique_lock<std::mutex> lk(mutex_);
    while (!stopping_.load()) {
        lk.unlock();
        ssize_t n = ::sendto(fd, payload.data(), payload.size(), 0,
                             reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
        if (n < 0 && !warned) {
            LOG_WARN("Beacon send failed: " + socket_error_str(last_socket_error()));
            warned = true;
        }
        lk.lock();
        stop_cv_.wait_for(lk, std::chrono::milliseconds(config_.interval_ms),
                          [this] { return stopping_.load(); });
    }
    lk.unlock();
    CLOSE_SOCKET(fd);
}

// ---------------------------------------------------------------
// discover
// ---------------------------------------------------------------
void DiscoveryService::discover(PeerCallback on_peer) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (listen_thread_.joinable()) throw ConcurrencyError("Already listening for peers");

    int fd = open_udp_socket();
    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_port        = htons(config_.beacon_port);
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        std::string err = socket_error_str(last_socket_error());
        CLOSE_SOCKET(fd);
        throw BindError("Cannot bind beacon port " + std::to_string(config_.beacon_port) +
                        ": " + err);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len);
    listen_port_.store(ntohs(bound.sin_port));

    timeval tv{};
    tv.tv_sec  = LISTEN_POLL_MS / 1000;
    tv.tv_usec = (LISTEN_POLL_MS % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    stopping_.store(false);
    known_.clear();
    LOG_INFO("Listening for LanShare peers on UDP port " + std::to_string(listen_port_.load()));
    listen_thread_ = std::thread(&DiscoveryService::listen_loop, this, fd, std::move(on_peer));
}

void DiscoveryService::listen_loop(int fd, PeerCallback on_peer) {
    char buf[MAX_DATAGRAM];
    while (!stopping_.load()) {
        sockaddr_in from{};
        socklen_t from_len = sizeof(from);
        ssize_t n = ::recvfrom(fd, buf, sizeof(buf), 0,
                               reinterpret_cast<sockaddr*>(&from), &from_len);
        if (n < 0) {
            int err = last_socket_error();
            if (would_block(err) || err == EINTR) continue;
            LOG_ERROR("Beacon receive failed: " + socket_error_str(err));
            break;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip));

        PeerRecord peer;
        if (!parse_beacon(std::string(buf, (size_t)n), ip, peer)) {
            LOG_DEBUG(std::string("Ignoring non-beacon datagram from ") + ip);
            continue;
        }

        bool changed = false;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            auto it = known_.find(peer.host);
            if (it == known_.end() || it->second.name != peer.name ||
                it->second.port != peer.port) {
                known_[peer.host] = peer;
                changed = true;
            }
        }
        if (changed) {
            LOG_DEBUG("Peer " + peer.name + " at " + peer.host + ":" + std::to_string(peer.port));
            if (on_peer) on_peer(peer);
        }
    }
    CLOSE_SOCKET(fd);
}

// ---------------------------------------------------------------
// stop
// ---------------------------------------------------------------
void DiscoveryService::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stopping_.store(true);
    }
    stop_cv_.notify_all();
    if (broadcast_thread_.joinable()) broadcast_thread_.join();
    if (listen_thread_.joinable()) listen_thread_.join();
    listen_port_.store(0);
}
