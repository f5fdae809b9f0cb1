// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "errors.hpp"
#include <cstring>
#include <string>
#include <poll.h>
#include <sys/time.h>

// 1 MB send/receive buffers: large enough for LAN bursts without
// pinning much kernel memory per connection.
static constexpr int SOCKET_BUF_SIZE = 1024 * 1024;

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw NetworkError("socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    int on = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    &sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    &rcvbuf,    sizeof(rcvbuf));
}

static bool resolve_ipv4(const std::string& host, in_addr& out) {
    if (inet_pton(AF_INET, host.c_str(), &out) == 1) return true;

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res) {
        return false;
    }
    out = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return true;
}

void TcpSocket::connect(const std::string& host, u16 port, int timeout_ms) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!resolve_ipv4(host, addr.sin_addr)) {
        throw NetworkError("Cannot resolve host: " + host);
    }

    if (timeout_ms <= 0) {
        if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
            throw NetworkError("connect() failed: " + socket_error_str(last_socket_error()));
        }
        tune();
        return;
    }

    // Non-blocking connect + poll so an unreachable peer fails in bounded time
    int flags = fcntl(fd_, F_GETFL, 0);
    fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd_, (sockaddr*)&addr, sizeof(addr));
    if (rc == SOCKET_ERROR_VAL && errno != EINPROGRESS) {
        int err = last_socket_error();
        fcntl(fd_, F_SETFL, flags);
        throw NetworkError("connect() failed: " + socket_error_str(err));
    }
    if (rc != 0) {
        pollfd pfd{};
        pfd.fd     = fd_;
        pfd.events = POLLOUT;
        int pr;
        do {
            pr = ::poll(&pfd, 1, timeout_ms);
        } while (pr < 0 && errno == EINTR);
        if (pr == 0) {
            fcntl(fd_, F_SETFL, flags);
            throw NetworkError("connect() timed out: " + host + ":" + std::to_string(port));
        }
        int so_err = 0;
        socklen_t len = sizeof(so_err);
        getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_err, &len);
        if (pr < 0 || so_err != 0) {
            fcntl(fd_, F_SETFL, flags);
            throw NetworkError("connect() failed: " +
                               socket_error_str(pr < 0 ? errno : so_err));
        }
    }
    fcntl(fd_, F_SETFL, flags);
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw BindError("Invalid listen address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw BindError("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw BindError("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    socket_t client;
    do {
        client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    } while (client == INVALID_SOCKET_VAL && errno == EINTR);
    if (client == INVALID_SOCKET_VAL) {
        throw NetworkError("accept() failed: " + socket_error_str(last_socket_error()));
    }
    return TcpSocket(client);
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent == 0) {
                throw NetworkError("Connection closed during send");
            }
            int err = last_socket_error();
            if (err == EINTR) continue;
            if (would_block(err)) {
                throw NetworkError("send() timed out");
            }
            throw NetworkError("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

size_t TcpSocket::recv_some(void* buf, size_t len) {
    for (;;) {
        ssize_t received = ::recv(fd_, buf, len, 0);
        if (received >= 0) return static_cast<size_t>(received);
        int err = last_socket_error();
        if (err == EINTR) continue;
        if (would_block(err)) {
            throw NetworkError("recv() timed out");
        }
        throw NetworkError("recv() failed: " + socket_error_str(err));
    }
}

u16 TcpSocket::local_port() const {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) return 0;
    return ntohs(local.sin_port);
}

void TcpSocket::shutdown() {
    if (fd_ != INVALID_SOCKET_VAL) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

std::string TcpSocket::peer_ip() const {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf);
        }
    }
    return "unknown";
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

static void set_timeout(socket_t fd, int opt, int ms) {
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, opt, &tv, sizeof(tv));
}

void TcpSocket::set_recv_timeout_ms(int ms) {
    set_timeout(fd_, SO_RCVTIMEO, ms);
}

void TcpSocket::set_send_timeout_ms(int ms) {
    set_timeout(fd_, SO_SNDTIMEO, ms);
}
