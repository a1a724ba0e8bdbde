#include "catch.hpp"
#include <ll/uri.hpp>

using ll::URI;

SCENARIO( "URI parsing", "[uri]" ) {
    GIVEN( "an http address with port and path" ) {
        URI uri("http://limelight.local:5807/capturesnapshot");

        REQUIRE( uri.isValid() );
        REQUIRE( uri.getScheme() == URI::SCHEME_HTTP );
        REQUIRE( uri.getHost() == "limelight.local" );
        REQUIRE( uri.getPort() == 5807 );
        REQUIRE( uri.getPath() == "/capturesnapshot" );
        REQUIRE( uri.getPathLength() == 1 );
        REQUIRE( uri.getPathSegment(0) == "capturesnapshot" );
        REQUIRE( uri.getPathSegment(-1) == "capturesnapshot" );
        REQUIRE( uri.getPathSegment(1) == "" );
    }

    GIVEN( "an address without a port" ) {
        URI uri("http://10.0.0.11/results");
        REQUIRE( uri.isValid() );
        REQUIRE( uri.getPort() == 0 );
        REQUIRE( uri.getHost() == "10.0.0.11" );
    }

    GIVEN( "a query" ) {
        URI uri(std::string("http://limelight.local:5807/upload?name=a&mode=b"));
        REQUIRE( uri.isValid() );
        REQUIRE( uri.hasAttribute("name") );
        REQUIRE( uri.getAttribute("name") == "a" );
        REQUIRE( !uri.hasAttribute("other") );
        REQUIRE( uri.getBaseURI() == "http://limelight.local:5807/upload" );
    }

    GIVEN( "a missing scheme" ) {
        URI uri("limelight.local");
        REQUIRE( !uri.isValid() );
    }

    GIVEN( "an unparseable address" ) {
        URI uri("http://bad name.local:5807/");
        REQUIRE( !uri.isValid() );
    }

    GIVEN( "a port out of range" ) {
        URI uri("http://limelight.local:70000/");
        REQUIRE( !uri.isValid() );
    }

    GIVEN( "a default constructed uri" ) {
        URI uri;
        REQUIRE( !uri.isValid() );
    }
}
