/**
 * @file socket.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

// TCP sockets (POSIX)

#include <unistd.h>
#include <sys/types.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>

#include <loguru.hpp>
#include <ll/exception.hpp>

#include "../socketImpl.hpp"

using ll::net::internal::Socket;
using ll::net::internal::SocketAddress;

/// resolve address for OS socket calls, return true on success
bool ll::net::internal::resolve_inet_address(const std::string &hostname, int port, SocketAddress &address) {
    addrinfo hints = {}, *addrs = nullptr;

    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    auto rc = getaddrinfo(hostname.c_str(), std::to_string(port).c_str(), &hints, &addrs);
    if (rc != 0 || addrs == nullptr) {
        VLOG(1) << "getaddrinfo(" << hostname << "): " << gai_strerror(rc);
        return false;
    }

    bool ok = addrs->ai_addrlen <= sizeof(address.addr);
    if (ok) {
        address.len = static_cast<socklen_t>(addrs->ai_addrlen);
        memcpy(&address.addr, addrs->ai_addr, address.len);
    }
    freeaddrinfo(addrs);
    return ok;
}

// Socket

Socket::Socket(int domain, int type, int protocol) :
        status_(STATUS::UNCONNECTED), fd_(-1), family_(domain) {
    int retval = socket(domain, type, protocol);

    if (retval >= 0) {
        fd_ = retval;
    } else {
        LOG(ERROR) << ("socket() failed");
        throw LL_Error("socket: " << get_error_string());
    }
}

Socket::~Socket() {
    LOG_IF(ERROR, is_open() || status_ == STATUS::UNCONNECTED) << "socket wrapper destroyed before socket is closed";
}

Socket::Socket(Socket &&other) noexcept :
        status_(other.status_), fd_(other.fd_), family_(other.family_) {
    other.status_ = STATUS::INVALID;
    other.fd_ = -1;
}

Socket &Socket::operator=(Socket &&other) noexcept {
    if (this != &other) {
        if (is_valid() && status_ != STATUS::CLOSED) ::close(fd_);
        status_ = other.status_;
        fd_ = other.fd_;
        family_ = other.family_;
        other.status_ = STATUS::INVALID;
        other.fd_ = -1;
    }
    return *this;
}

bool Socket::is_valid() const { return status_ != STATUS::INVALID; }

bool Socket::is_open() const { return status_ == STATUS::OPEN; }

bool Socket::is_closed() const { return status_ == STATUS::CLOSED; }

ssize_t Socket::recv(char *buffer, size_t len, int flags) {
    return ::recv(fd_, buffer, len, flags);
}

ssize_t Socket::send(const char* buffer, size_t len, int flags) {
    return ::send(fd_, buffer, len, flags | MSG_NOSIGNAL);
}

int Socket::bind(const SocketAddress &addr) {
    int reuse = 1;
    setsockopt(SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    return ::bind(fd_, reinterpret_cast<const sockaddr*>(&addr.addr), addr.len);
}

int Socket::listen(int backlog) {
    auto retval = ::listen(fd_, backlog);
    if (retval == 0) {
        status_ = STATUS::OPEN;
    }
    return retval;
}

Socket Socket::accept(SocketAddress &addr) {
    addr.len = sizeof(addr.addr);
    Socket socket;
    int retval = ::accept(fd_, reinterpret_cast<sockaddr*>(&(addr.addr)), &(addr.len));
    if (retval >= 0) {
        socket.status_ = STATUS::OPEN;
        socket.fd_ = retval;
        socket.family_ = family_;
    } else {
        LOG(ERROR) << "accept returned error: " << strerror(errno);
        socket.status_ = STATUS::INVALID;
    }
    return socket;
}

int Socket::connect(const SocketAddress& address) {
    if (status_ != STATUS::UNCONNECTED) return -1;

    int err = ::connect(fd_, reinterpret_cast<const sockaddr*>(&address.addr), address.len);
    if (err == 0) {
        status_ = STATUS::OPEN;
    } else if (errno == EINPROGRESS) {
        status_ = STATUS::OPEN;     // completed by select() in connect with timeout
    }
    return err;
}

int Socket::connect(const SocketAddress &address, int timeout) {
    if (timeout <= 0) {
        return connect(address);
    }

    set_blocking(false);

    auto rc = connect(address);
    if (rc < 0 && errno == EINPROGRESS) {
        fd_set wset;
        FD_ZERO(&wset);
        FD_SET(fd_, &wset);

        struct timeval tv;
        tv.tv_sec = timeout;
        tv.tv_usec = 0;

        rc = select(fd_ + 1, NULL, &wset, NULL, &tv);
        if (rc == 0) {
            errno = ETIMEDOUT;
            rc = -1;
        } else if (rc > 0) {
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                errno = so_error;
                rc = -1;
            } else {
                rc = 0;
            }
        }
    }

    set_blocking(true);

    if (rc < 0) {
        int err = errno;
        LOG(ERROR) << "socket error: " << strerror(err);
        close();
        errno = err;
        return rc;
    }

    status_ = STATUS::OPEN;
    return 0;
}

/// Close socket (if open). Multiple calls are safe.
bool Socket::close() {
    if (is_valid() && status_ != STATUS::CLOSED) {
        status_ = STATUS::CLOSED;
        return ::close(fd_) == 0;
    } else if (status_ != STATUS::CLOSED) {
        LOG(INFO) << "close() on non-valid socket";
    }
    return false;
}

int Socket::setsockopt(int level, int optname, const void *optval, socklen_t optlen) {
    return ::setsockopt(fd_, level, optname, optval, optlen);
}

int Socket::getsockopt(int level, int optname, void *optval, socklen_t *optlen) {
    return ::getsockopt(fd_, level, optname, optval, optlen);
}

void Socket::set_blocking(bool val) {
    auto arg = fcntl(fd_, F_GETFL, NULL);
    arg = val ? (arg & ~O_NONBLOCK) : (arg | O_NONBLOCK);
    fcntl(fd_, F_SETFL, arg);
}

bool Socket::set_timeout(int seconds) {
    struct timeval tv;
    tv.tv_sec = seconds;
    tv.tv_usec = 0;
    return setsockopt(SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
        setsockopt(SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

std::string Socket::get_error_string(int code) {
    return strerror((code != 0) ? code : errno);
}

SocketAddress Socket::getsockname() {
    SocketAddress addr;
    auto* a = reinterpret_cast<struct sockaddr*>(&(addr.addr));
    ::getsockname(fd_, a, &(addr.len));
    return addr;
}

// TCP socket

Socket ll::net::internal::create_tcp_socket() {
    return Socket(AF_INET, SOCK_STREAM, 0);
}

int ll::net::internal::get_port(const SocketAddress& addr) {
    return ntohs(addr.addr.sin_port);
}
