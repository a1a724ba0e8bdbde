/**
 * @file request.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <string>
#include <unordered_map>
#include <ll/uri.hpp>

namespace ll {
namespace net {

using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpResponse {
    int status = 0;
    HeaderMap headers;
};

/**
 * @brief Minimal HTTP/1.1 GET over plain TCP. The response body is not read,
 * the connection is closed once the headers have arrived.
 *
 * @param uri Must be an http URI
 * @param headers Extra request headers
 * @param timeout Connect and receive timeout in seconds
 * @return HttpResponse
 * @throws ll::exception on resolve, connect or protocol errors
 */
HttpResponse httpGet(const ll::URI &uri, const HeaderMap &headers, int timeout);

}  // namespace net
}  // namespace ll
