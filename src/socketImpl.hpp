/**
 * @file socketImpl.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 */

#pragma once

#include <string>

#include "socket/types.hpp"

namespace ll {
namespace net {

namespace internal {

/** OS socket wrapper.
 * Methods returning int follow the OS convention, 0 on success.
 * The wrapper does not own the descriptor: call close() before destruction.
 */
class Socket {
 private:
    enum STATUS { INVALID, UNCONNECTED, OPEN, CLOSED };
    STATUS status_;
    socket_t fd_;
    int family_;

 public:
    Socket(int domain, int type, int protocol);
    ~Socket();

    Socket() : status_(STATUS::INVALID), fd_(-1), family_(-1) {}

    Socket(const Socket &) = delete;
    Socket &operator=(const Socket &) = delete;
    Socket(Socket &&other) noexcept;
    Socket &operator=(Socket &&other) noexcept;

    bool is_valid() const;
    bool is_open() const;
    bool is_closed() const;

    ssize_t recv(char *buffer, size_t len, int flags);
    ssize_t send(const char* buffer, size_t len, int flags);

    int bind(const SocketAddress&);

    int listen(int backlog);

    Socket accept(SocketAddress&);

    int connect(const SocketAddress&);

    /** Connect with timeout in seconds. Implemented by changing the socket
     * temporarily to non-blocking mode and using select().
     */
    int connect(const SocketAddress& addr, int timeout);

    /// Close socket (if open). Multiple calls are safe.
    bool close();

    void set_blocking(bool val);

    /** Limit blocking recv() and send() calls, in seconds. */
    bool set_timeout(int seconds);

    std::string get_error_string(int code = 0);

    SocketAddress getsockname();

    int setsockopt(int level, int optname, const void *optval, socklen_t optlen);
    int getsockopt(int level, int optname, void *optval, socklen_t *optlen);
};

Socket create_tcp_socket();

/// resolve address: get SocketAddress from hostname port
bool resolve_inet_address(const std::string &hostname, int port, SocketAddress& address);

int get_port(const SocketAddress& address);

}  // namespace internal
}  // namespace net
}  // namespace ll
