/**
 * @file types.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <sys/socket.h>
#include <netinet/in.h>

namespace ll {
namespace net {
namespace internal {

typedef int socket_t;

struct SocketAddress {
    socklen_t len = sizeof(struct sockaddr_in);
    struct sockaddr_in addr;
};

}  // namespace internal
}  // namespace net
}  // namespace ll
