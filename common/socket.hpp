#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include <string>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote host (dotted quad or resolvable name).
    // timeout_ms == 0 blocks until the kernel gives up. Throws NetworkError.
    void connect(const std::string& host, u16 port, int timeout_ms = 0);

    // Server: bind + listen. port 0 picks an ephemeral port. Throws BindError.
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 64);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws NetworkError on error or peer close
    void send_all(const void* buf, size_t len);
    void send_all(const std::string& s) { send_all(s.data(), s.size()); }

    // Receive up to 'len' bytes. Returns 0 on clean close.
    // Throws NetworkError on error or receive timeout.
    size_t recv_some(void* buf, size_t len);

    void tune();

    // Port the socket is bound to (after bind_and_listen / connect)
    u16 local_port() const;

    // Disable further sends and receives without releasing the fd.
    // Safe to call from another thread to unblock a pending recv/accept.
    void shutdown();

    void close();

    std::string peer_addr() const;  // "ip:port"
    std::string peer_ip() const;

    // 0 = infinite
    void set_recv_timeout_ms(int ms);
    void set_send_timeout_ms(int ms);

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
};
