/**
 * @file request.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <cstdio>
#include <ll/exception.hpp>
#include <ll/profiler.hpp>

#include <loguru.hpp>

#include "request.hpp"
#include "../socketImpl.hpp"

using ll::net::HttpResponse;
using ll::net::HeaderMap;
using ll::net::internal::Socket;
using ll::net::internal::SocketAddress;
using ll::net::internal::create_tcp_socket;
using ll::net::internal::resolve_inet_address;

namespace {

constexpr size_t kMaxLine = 1024;

// Read up to and including CRLF, the line is returned without it.
std::string readLine(Socket &sock) {
    std::string line;
    char c;
    while (line.size() < kMaxLine) {
        auto rc = sock.recv(&c, 1, 0);
        if (rc == 0) {
            throw LL_Error("Connection closed by remote");
        } else if (rc < 0) {
            throw LL_Error("recv() error: " << sock.get_error_string());
        }
        line += c;
        if (line.size() >= 2 && line[line.size() - 2] == '\r' && c == '\n') {
            line.resize(line.size() - 2);
            return line;
        }
    }
    throw LL_Error("HTTP line too long");
}

void sendAll(Socket &sock, const std::string &data) {
    size_t sent = 0;
    while (sent < data.size()) {
        auto rc = sock.send(data.c_str() + sent, data.size() - sent, 0);
        if (rc <= 0) {
            throw LL_Error("Could not send HTTP request (" << sock.get_error_string() << ")");
        }
        sent += static_cast<size_t>(rc);
    }
}

HttpResponse exchange(Socket &sock, const ll::URI &uri, int port, const HeaderMap &headers) {
    std::string path = uri.getPath();
    if (path.empty()) path = "/";
    auto query = uri.getQuery();
    if (!query.empty()) path += "?" + query;

    std::string http = "";
    http += "GET " + path + " HTTP/1.1\r\n";
    if (port == 80) {
        http += "Host: " + uri.getHost() + "\r\n";
    } else {
        http += "Host: " + uri.getHost() + ":" + std::to_string(port) + "\r\n";
    }
    for (const auto &h : headers) {
        http += h.first + ": " + h.second + "\r\n";
    }
    http += "Connection: close\r\n";
    http += "\r\n";

    sendAll(sock, http);

    HttpResponse response;
    auto status = readLine(sock);
    if (sscanf(status.c_str(), "HTTP/%*d.%*d %d", &response.status) != 1) {
        throw LL_Error("Got invalid status line from " << uri.getHost() << ": " << status);
    }

    while (true) {
        auto line = readLine(sock);
        if (line.empty()) break;

        const auto ix = line.find(':');
        if (ix == std::string::npos) continue;
        auto value = line.substr(ix + 1);
        const auto start = value.find_first_not_of(' ');
        response.headers[line.substr(0, ix)] = (start == std::string::npos) ? "" : value.substr(start);
    }

    return response;
}

}  // namespace

HttpResponse ll::net::httpGet(const ll::URI &uri, const HeaderMap &headers, int timeout) {
    LL_PROFILE_SCOPE("httpGet");

    if (!uri.isValid() || uri.getScheme() != ll::URI::SCHEME_HTTP) {
        throw LL_Error("Not an http URI: " << uri.to_string());
    }

    int port = (uri.getPort() > 0) ? uri.getPort() : 80;

    SocketAddress addr;
    if (!resolve_inet_address(uri.getHost(), port, addr)) {
        throw LL_Error("could not resolve hostname: " << uri.getHost());
    }

    Socket sock = create_tcp_socket();
    if (sock.connect(addr, timeout) != 0) {
        throw LL_Error("connect() error: " << sock.get_error_string());
    }
    if (!sock.set_timeout(timeout)) {
        LOG(WARNING) << "Setting socket timeout failed: " << sock.get_error_string();
    }

    HttpResponse response;
    try {
        response = exchange(sock, uri, port, headers);
    } catch (const ll::exception &) {
        sock.close();
        throw;
    }
    sock.close();

    VLOG(1) << "GET " << uri.to_string() << " -> " << response.status;
    return response;
}
