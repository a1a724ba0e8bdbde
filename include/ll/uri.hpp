/**
 * @file uri.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 */

#pragma once

#include <uriparser/Uri.h>
#include <string>
#include <vector>
#include <map>

namespace ll {

typedef const char * uri_t;

/**
 * Universal Resource Identifier. Parse and represent the URIs used to reach
 * the camera web services.
 */
class URI {
 public:
    /**
     * @brief Construct a new invalid URI object.
     *
     */
    URI(): m_valid(false) {}

    /**
     * @brief Construct from a C string.
     *
     * @param puri
     */
    explicit URI(uri_t puri);

    /**
     * @brief Construct from a C++ STL string.
     *
     * @param puri
     */
    explicit URI(const std::string &puri);

    URI(const URI &c) = default;
    URI &operator=(const URI &c) = default;

    /**
     * @brief The URI protocol scheme.
     *
     */
    enum scheme_t : int {
        SCHEME_NONE,
        SCHEME_TCP,
        SCHEME_HTTP,
        SCHEME_HTTPS,
        SCHEME_WS,
        SCHEME_WSS,
        SCHEME_FILE,
        SCHEME_OTHER
    };

    /**
     * @brief Check if the URI was valid.
     *
     * @return true
     * @return false
     */
    bool isValid() const { return m_valid; }

    /**
     * @brief Get the host component.
     *
     * @return const std::string&
     */
    const std::string &getHost() const { return m_host; }

    /**
     * @brief Get the port component, 0 if not given.
     *
     * @return int
     */
    int getPort() const { return m_port; }

    /**
     * @brief Get the protocol component.
     *
     * @return scheme_t
     */
    scheme_t getScheme() const { return m_proto; }

    /**
     * @brief Get the path component.
     *
     * @return const std::string&
     */
    const std::string &getPath() const { return m_path; }

    /**
     * @brief Get an individual path segment.
     *
     * @param n from 0 to N, or negative from the end.
     * @return std::string
     */
    std::string getPathSegment(int n) const;

    inline size_t getPathLength() const { return m_pathseg.size(); }

    /**
     * @brief Get any query component (after ?).
     *
     * @return std::string
     */
    std::string getQuery() const;

    /**
     * @brief Get the URI without fragment or query string.
     *
     * @return const std::string&
     */
    const std::string &getBaseURI() const { return m_base; }

    /**
     * @brief Get a query string attribute, empty if missing.
     *
     * @param key
     * @return std::string
     */
    std::string getAttribute(const std::string &key) const;

    bool hasAttribute(const std::string &a) const { return m_qmap.count(a) > 0; }

    /**
     * @brief Convert back to a URI string.
     *
     * @return std::string
     */
    std::string to_string() const;

 private:
    void _parse(uri_t puri);

    bool m_valid;
    std::string m_host;
    std::string m_path;
    std::string m_base;
    std::vector<std::string> m_pathseg;
    int m_port = 0;
    scheme_t m_proto = scheme_t::SCHEME_NONE;
    std::string m_protostr;
    std::map<std::string, std::string> m_qmap;
};

}  // namespace ll
