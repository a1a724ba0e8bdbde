#include "catch.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <ll/camera.hpp>
#include <ll/exception.hpp>

#include "../src/socketImpl.hpp"
#include "../src/http/request.hpp"

using ll::net::internal::Socket;
using ll::net::internal::SocketAddress;
using ll::net::internal::create_tcp_socket;
using ll::net::internal::resolve_inet_address;
using ll::net::internal::get_port;
using std::string;

/** Accepts one connection, records the request and replies with a status. */
class TestServer {
 public:
    explicit TestServer(const string &reply) : reply_(reply) {
        sock_ = create_tcp_socket();
        SocketAddress addr;
        REQUIRE( resolve_inet_address("127.0.0.1", 0, addr) );
        REQUIRE( sock_.bind(addr) == 0 );
        REQUIRE( sock_.listen(1) == 0 );
        // Bound accept() when no client comes
        REQUIRE( sock_.set_timeout(5) );
        port_ = get_port(sock_.getsockname());

        thread_ = std::thread([this]() {
            SocketAddress client;
            auto conn = sock_.accept(client);
            if (!conn.is_valid()) return;

            char c;
            while (request_.find("\r\n\r\n") == string::npos && conn.recv(&c, 1, 0) == 1) {
                request_ += c;
            }
            conn.send(reply_.c_str(), reply_.size(), 0);
            conn.close();
            done_ = true;
        });
    }

    ~TestServer() {
        if (thread_.joinable()) thread_.join();
        sock_.close();
    }

    inline int port() const { return port_; }

    /** Wait for the connection to finish and get the request text. */
    const string &request() {
        if (thread_.joinable()) thread_.join();
        return request_;
    }

    /** Poll until a request has been answered, or the time runs out. */
    bool waitForRequest(int ms) {
        auto end = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
        while (!done_ && std::chrono::steady_clock::now() < end) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return done_;
    }

    string uri() const {
        return "http://127.0.0.1:" + std::to_string(port_) + "/capturesnapshot";
    }

 private:
    Socket sock_;
    int port_ = 0;
    string reply_;
    string request_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

SCENARIO( "HTTP GET requests", "[http]" ) {
    GIVEN( "a server replying 200" ) {
        TestServer server("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 0\r\n\r\n");

        auto res = ll::net::httpGet(ll::URI(server.uri()), {{"X-Test", "1"}}, 2);
        REQUIRE( res.status == 200 );
        REQUIRE( res.headers.at("Content-Type") == "text/plain" );

        const auto &req = server.request();
        REQUIRE( req.rfind("GET /capturesnapshot HTTP/1.1\r\n", 0) == 0 );
        REQUIRE( req.find("Host: 127.0.0.1:" + std::to_string(server.port()) + "\r\n") != string::npos );
        REQUIRE( req.find("X-Test: 1\r\n") != string::npos );
        REQUIRE( req.find("Connection: close\r\n") != string::npos );
    }

    GIVEN( "a server that closes early" ) {
        TestServer server("");
        REQUIRE_THROWS_AS( ll::net::httpGet(ll::URI(server.uri()), {}, 2), ll::exception );
    }

    GIVEN( "a server with a bad status line" ) {
        TestServer server("garbage\r\n\r\n");
        REQUIRE_THROWS_AS( ll::net::httpGet(ll::URI(server.uri()), {}, 2), ll::exception );
    }

    GIVEN( "a non http uri" ) {
        REQUIRE_THROWS_AS( ll::net::httpGet(ll::URI("ws://127.0.0.1:80/"), {}, 2), ll::exception );
    }
}

SCENARIO( "Snapshot requests", "[http]" ) {
    GIVEN( "a named snapshot accepted by the camera" ) {
        TestServer server("HTTP/1.1 200 OK\r\n\r\n");

        REQUIRE( ll::Camera::requestSnapshot(ll::URI(server.uri()), "match-12") );
        REQUIRE( server.request().find("snapname: match-12\r\n") != string::npos );
    }

    GIVEN( "a snapshot requested without waiting" ) {
        TestServer server("HTTP/1.1 200 OK\r\n\r\n");

        {
            ll::URI uri(server.uri());
            string name = "match-13";
            ll::Camera::requestSnapshotAsync(uri, name);
        }

        REQUIRE( server.waitForRequest(5000) );
        const auto &req = server.request();
        REQUIRE( req.rfind("GET /capturesnapshot HTTP/1.1\r\n", 0) == 0 );
        REQUIRE( req.find("snapname: match-13\r\n") != string::npos );
    }

    GIVEN( "a snapshot without a name" ) {
        TestServer server("HTTP/1.1 200 OK\r\n\r\n");

        REQUIRE( ll::Camera::requestSnapshot(ll::URI(server.uri()), "") );
        REQUIRE( server.request().find("snapname") == string::npos );
    }

    GIVEN( "a camera that refuses the request" ) {
        TestServer server("HTTP/1.1 500 Internal Server Error\r\n\r\n");
        REQUIRE( !ll::Camera::requestSnapshot(ll::URI(server.uri()), "x") );
    }

    GIVEN( "no server listening" ) {
        int port = 0;
        {
            TestServer server("HTTP/1.1 200 OK\r\n\r\n");
            port = server.port();
            REQUIRE( ll::Camera::requestSnapshot(ll::URI(server.uri()), "") );
        }
        ll::URI uri("http://127.0.0.1:" + std::to_string(port) + "/capturesnapshot");
        REQUIRE( !ll::Camera::requestSnapshot(uri, "") );
    }

    GIVEN( "an invalid uri" ) {
        REQUIRE( !ll::Camera::requestSnapshot(ll::URI("http://bad name/"), "") );
    }
}

SCENARIO( "Socket options", "[http]" ) {
    GIVEN( "a socket that was never opened" ) {
        Socket sock;
        REQUIRE( !sock.set_timeout(1) );
    }
}
