/**
 * @file uri.cpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 */

#include <string>
#include <unordered_map>
#include <ll/config.h>
#include <ll/uri.hpp>

#include <loguru.hpp>

using ll::URI;
using ll::uri_t;
using std::string;

static const std::unordered_map<std::string, ll::URI::scheme_t> schemeMap = {
    {"tcp", URI::SCHEME_TCP},
    {"http", URI::SCHEME_HTTP},
    {"https", URI::SCHEME_HTTPS},
    {"ws", URI::SCHEME_WS},
    {"wss", URI::SCHEME_WSS},
    {"file", URI::SCHEME_FILE}
};

URI::URI(uri_t puri) {
    _parse(puri);
}

URI::URI(const std::string &puri) {
    _parse(puri.c_str());
}

void URI::_parse(uri_t puri) {
    UriUriA uri;

    std::string suri = (puri) ? puri : "";

#ifdef HAVE_URIPARSESINGLE
    const char *errpos;
    if (uriParseSingleUriA(&uri, suri.c_str(), &errpos) != URI_SUCCESS) {
#else
    UriParserStateA uris;
    uris.uri = &uri;
    if (uriParseUriA(&uris, suri.c_str()) != URI_SUCCESS) {
#endif
        m_valid = false;
        m_host = "none";
        m_port = -1;
        m_proto = SCHEME_NONE;
        m_base = suri;
        m_path = "";
        return;
    }

    m_host = std::string(uri.hostText.first, uri.hostText.afterLast - uri.hostText.first);

    std::string prototext = std::string(uri.scheme.first, uri.scheme.afterLast - uri.scheme.first);
    if (prototext == "") {
        m_proto = SCHEME_NONE;
    } else {
        auto protoIt = schemeMap.find(prototext);
        m_proto = (protoIt == schemeMap.end()) ? SCHEME_OTHER : protoIt->second;
    }
    m_protostr = prototext;

    bool port_ok = true;
    std::string porttext = std::string(uri.portText.first, uri.portText.afterLast - uri.portText.first);
    try {
        m_port = (porttext.size() > 0) ? std::stoi(porttext) : 0;
        if (m_port < 0 || m_port >= 65535) {
            port_ok = false;
        }
    } catch (const std::exception &e) {
        port_ok = false;
    }

    for (auto h = uri.pathHead; h != NULL; h = h->next) {
        auto pstr = std::string(h->text.first, h->text.afterLast - h->text.first);

        m_path += "/";
        m_path += pstr;
        m_pathseg.push_back(pstr);
    }

    if (uri.query.afterLast - uri.query.first > 0) {
        UriQueryListA *queryList;
        int itemCount;
        if (uriDissectQueryMallocA(&queryList, &itemCount, uri.query.first,
                uri.query.afterLast) == URI_SUCCESS) {
            UriQueryListA *item = queryList;
            while (item) {
                m_qmap[item->key] = (item->value) ? item->value : "";
                item = item->next;
            }
            uriFreeQueryListA(queryList);
        } else {
            LOG(WARNING) << "Could not parse URI query: " << suri;
        }
    }

    m_valid = port_ok && m_proto != SCHEME_NONE && m_host.size() > 0;

    m_base = m_protostr + "://" + m_host;
    if (m_port > 0) m_base += ":" + std::to_string(m_port);
    m_base += m_path;

    uriFreeUriMembersA(&uri);
}

string URI::to_string() const {
    return (m_qmap.size() > 0) ? m_base + "?" + getQuery() : m_base;
}

string URI::getPathSegment(int n) const {
    size_t N = (n < 0) ? m_pathseg.size()+n : n;
    if (N >= m_pathseg.size()) return "";
    else
        return m_pathseg[N];
}

string URI::getQuery() const {
    string q;
    for (const auto &x : m_qmap) {
        if (q.length() > 0) q += "&";
        q += x.first + "=" + x.second;
    }
    return q;
}

string URI::getAttribute(const std::string &key) const {
    auto i = m_qmap.find(key);
    return (i != m_qmap.end()) ? i->second : "";
}
