#include "catch.hpp"
#include <cmath>
#include <limits>
#include <ll/codec/arrays.hpp>

using ll::codec::decodeRawFiducials;
using ll::codec::decodeRawDetections;
using ll::codec::extractArrayEntry;
using ll::codec::toIntSaturating;
using std::vector;

SCENARIO( "Safe array extraction", "[arrays]" ) {
    vector<double> data = {1.0, 2.0, 3.0};

    GIVEN( "an index in range" ) {
        REQUIRE( extractArrayEntry(data, 0) == 1.0 );
        REQUIRE( extractArrayEntry(data, 2) == 3.0 );
    }

    GIVEN( "an index out of range" ) {
        REQUIRE( extractArrayEntry(data, 3) == 0.0 );
        REQUIRE( extractArrayEntry({}, 0) == 0.0 );
    }
}

SCENARIO( "Integer conversion of wire values", "[arrays]" ) {
    GIVEN( "values in range" ) {
        REQUIRE( toIntSaturating(7.0) == 7 );
        REQUIRE( toIntSaturating(-3.9) == -3 );
        REQUIRE( toIntSaturating<int64_t>(5e9) == 5000000000LL );
    }

    GIVEN( "not a number" ) {
        REQUIRE( toIntSaturating(NAN) == 0 );
        REQUIRE( toIntSaturating<int64_t>(NAN) == 0 );
    }

    GIVEN( "values out of range" ) {
        REQUIRE( toIntSaturating(1e12) == std::numeric_limits<int>::max() );
        REQUIRE( toIntSaturating(-1e12) == std::numeric_limits<int>::min() );
        REQUIRE( toIntSaturating(INFINITY) == std::numeric_limits<int>::max() );
        REQUIRE( toIntSaturating<int64_t>(1e30) == std::numeric_limits<int64_t>::max() );
        REQUIRE( toIntSaturating<int64_t>(-1e30) == std::numeric_limits<int64_t>::min() );
    }

    GIVEN( "tags with broken ids" ) {
        vector<double> data = {
            NAN, 1.5, -2.5, 0.4, 2.1, 2.3, 0.05,
            1e12, 0, 0, 0, 0, 0, 0
        };

        auto tags = decodeRawFiducials(data);
        REQUIRE( tags.size() == 2 );
        REQUIRE( tags[0].id == 0 );
        REQUIRE( tags[0].txnc == 1.5 );
        REQUIRE( tags[1].id == std::numeric_limits<int>::max() );
    }

    GIVEN( "a detection with a broken class" ) {
        vector<double> data(12, 0.0);
        data[0] = -1e12;

        auto dets = decodeRawDetections(data);
        REQUIRE( dets.size() == 1 );
        REQUIRE( dets[0].classId == std::numeric_limits<int>::min() );
    }
}

SCENARIO( "Decoding raw fiducials", "[arrays]" ) {
    GIVEN( "two complete tags" ) {
        vector<double> data = {
            3, 1.5, -2.5, 0.4, 2.1, 2.3, 0.05,
            7, -4.0, 1.0, 0.2, 3.5, 3.7, 0.3
        };

        auto tags = decodeRawFiducials(data);
        REQUIRE( tags.size() == 2 );

        REQUIRE( tags[0].id == 3 );
        REQUIRE( tags[0].txnc == 1.5 );
        REQUIRE( tags[0].tync == -2.5 );
        REQUIRE( tags[0].ta == 0.4 );
        REQUIRE( tags[0].distToCamera == 2.1 );
        REQUIRE( tags[0].distToRobot == 2.3 );
        REQUIRE( tags[0].ambiguity == 0.05 );

        REQUIRE( tags[1].id == 7 );
        REQUIRE( tags[1].txnc == -4.0 );
        REQUIRE( tags[1].ambiguity == 0.3 );
    }

    GIVEN( "an empty array" ) {
        REQUIRE( decodeRawFiducials({}).empty() );
    }

    GIVEN( "a partial tag" ) {
        vector<double> data(10, 1.0);
        REQUIRE( decodeRawFiducials(data).empty() );
    }
}

SCENARIO( "Decoding raw detections", "[arrays]" ) {
    GIVEN( "one complete detection" ) {
        vector<double> data = {2, 10.0, -5.0, 1.2, 0, 1, 2, 3, 4, 5, 6, 7};

        auto dets = decodeRawDetections(data);
        REQUIRE( dets.size() == 1 );
        REQUIRE( dets[0].classId == 2 );
        REQUIRE( dets[0].txnc == 10.0 );
        REQUIRE( dets[0].tync == -5.0 );
        REQUIRE( dets[0].ta == 1.2 );
        REQUIRE( dets[0].corner0_X == 0 );
        REQUIRE( dets[0].corner0_Y == 1 );
        REQUIRE( dets[0].corner1_X == 2 );
        REQUIRE( dets[0].corner1_Y == 3 );
        REQUIRE( dets[0].corner2_X == 4 );
        REQUIRE( dets[0].corner2_Y == 5 );
        REQUIRE( dets[0].corner3_X == 6 );
        REQUIRE( dets[0].corner3_Y == 7 );
    }

    GIVEN( "three detections" ) {
        vector<double> data(36, 0.0);
        data[24] = 9;
        auto dets = decodeRawDetections(data);
        REQUIRE( dets.size() == 3 );
        REQUIRE( dets[2].classId == 9 );
    }

    GIVEN( "a fiducial sized array" ) {
        vector<double> data(14, 0.0);
        REQUIRE( decodeRawDetections(data).empty() );
    }
}

SCENARIO( "Pose arrays", "[arrays]" ) {
    GIVEN( "a full pose array" ) {
        vector<double> data = {1.0, 2.0, 3.0, 0.0, 0.0, 90.0};

        auto p3 = ll::codec::toPose3d(data);
        REQUIRE( p3.x() == 1.0 );
        REQUIRE( p3.y() == 2.0 );
        REQUIRE( p3.z() == 3.0 );
        REQUIRE( p3.rotation().z() == Approx(EIGEN_PI / 2.0) );

        auto p2 = ll::codec::toPose2d(data);
        REQUIRE( p2.x == 1.0 );
        REQUIRE( p2.y == 2.0 );
        REQUIRE( p2.heading == Approx(EIGEN_PI / 2.0) );

        auto back = ll::codec::pose3dToArray(p3);
        REQUIRE( back.size() == 6 );
        REQUIRE( back[0] == 1.0 );
        REQUIRE( back[5] == Approx(90.0) );
    }

    GIVEN( "a short array" ) {
        vector<double> data = {1.0, 2.0, 3.0};

        auto p3 = ll::codec::toPose3d(data);
        REQUIRE( p3.x() == 0.0 );
        REQUIRE( p3.y() == 0.0 );
        REQUIRE( p3.z() == 0.0 );

        auto p2 = ll::codec::toPose2d(data);
        REQUIRE( p2.x == 0.0 );
        REQUIRE( p2.heading == 0.0 );
    }

    GIVEN( "a translation" ) {
        auto a = ll::codec::translation3dToArray({0.1, 0.2, 0.3});
        REQUIRE( a == vector<double>{0.1, 0.2, 0.3} );
    }
}
