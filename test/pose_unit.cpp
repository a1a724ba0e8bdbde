#include "catch.hpp"
#include <cmath>
#include <limits>
#include <ll/pose_estimate.hpp>
#include <ll/pose_estimator.hpp>
#include <ll/nt/memory.hpp>

using ll::codec::decodePoseEstimate;
using ll::PoseEstimator;
using ll::PoseEstimators;
using std::vector;

static vector<double> twoTagPose() {
    return {
        1, 2, 3, 0, 0, 0, 50, 2, 3.0, 1.5, 0.2,
        4, 1.0, 2.0, 0.5, 1.4, 1.6, 0.1,
        5, -1.0, -2.0, 0.3, 1.6, 1.8, 0.2
    };
}

SCENARIO( "Decoding a pose estimate", "[pose]" ) {
    GIVEN( "a two tag array" ) {
        auto est = decodePoseEstimate(twoTagPose(), 5000000, false);

        REQUIRE( est.has_value() );
        REQUIRE( est->timestampSeconds == Approx(4.95) );
        REQUIRE( est->latency == 50.0 );
        REQUIRE( est->tagCount == 2 );
        REQUIRE( est->tagSpan == 3.0 );
        REQUIRE( est->avgTagDist == 1.5 );
        REQUIRE( est->avgTagArea == 0.2 );
        REQUIRE( est->rawFiducials.size() == 2 );
        REQUIRE( est->rawFiducials[0].id == 4 );
        REQUIRE( est->rawFiducials[1].id == 5 );
        REQUIRE( est->rawFiducials[1].ambiguity == 0.2 );
        REQUIRE( est->pose.x() == 1.0 );
        REQUIRE( est->pose.y() == 2.0 );
        REQUIRE( est->pose.z() == 3.0 );
        REQUIRE( !est->isMegaTag2 );
    }

    GIVEN( "a tag count that does not match the length" ) {
        vector<double> data = {1, 2, 3, 0, 0, 0, 50, 2, 3.0, 1.5, 0.2, 4, 1.0, 2.0, 0.5, 1.4, 1.6, 0.1};
        auto est = decodePoseEstimate(data, 5000000, true);

        REQUIRE( est.has_value() );
        REQUIRE( est->tagCount == 2 );
        REQUIRE( est->tagSpan == 3.0 );
        REQUIRE( est->avgTagDist == 1.5 );
        REQUIRE( est->rawFiducials.empty() );
        REQUIRE( est->isMegaTag2 );
    }

    GIVEN( "an empty array" ) {
        auto est = decodePoseEstimate({}, 5000000, false);
        REQUIRE( !est.has_value() );
    }

    GIVEN( "a header without tags" ) {
        vector<double> data = {1, 2, 3, 0, 0, 0, 20, 0, 0, 0, 0};
        auto est = decodePoseEstimate(data, 1000000, false);
        REQUIRE( est.has_value() );
        REQUIRE( est->timestampSeconds == Approx(0.98) );
        REQUIRE( est->rawFiducials.empty() );
    }

    GIVEN( "a tag count that is not a number" ) {
        vector<double> data = {1, 2, 3, 0, 0, 0, 50, NAN, 0, 0, 0};
        auto est = decodePoseEstimate(data, 5000000, false);

        REQUIRE( est.has_value() );
        REQUIRE( est->tagCount == 0 );
        REQUIRE( est->timestampSeconds == Approx(4.95) );
        REQUIRE( est->rawFiducials.empty() );
    }

    GIVEN( "a tag count too large for an int" ) {
        vector<double> data = {1, 2, 3, 0, 0, 0, 50, 1e12, 0, 0, 0};
        auto est = decodePoseEstimate(data, 5000000, false);

        REQUIRE( est.has_value() );
        REQUIRE( est->tagCount == std::numeric_limits<int>::max() );
        REQUIRE( est->rawFiducials.empty() );
    }

    GIVEN( "a report" ) {
        auto est = decodePoseEstimate(twoTagPose(), 5000000, false);
        auto text = est->to_string();
        REQUIRE( text.find("Tag Count: 2") != std::string::npos );
        REQUIRE( text.find("Fiducial #2") != std::string::npos );
    }
}

SCENARIO( "Pose estimate validity", "[pose]" ) {
    GIVEN( "no estimate" ) {
        REQUIRE( !PoseEstimator::validPoseEstimate(std::nullopt) );
    }

    GIVEN( "an estimate without tags" ) {
        ll::PoseEstimate est;
        est.tagCount = 2;
        REQUIRE( !PoseEstimator::validPoseEstimate(est) );
    }

    GIVEN( "an estimate with tags" ) {
        auto est = decodePoseEstimate(twoTagPose(), 5000000, false);
        REQUIRE( PoseEstimator::validPoseEstimate(est) );
    }
}

SCENARIO( "Pose estimator entries", "[pose]" ) {
    REQUIRE( ll::entryName(PoseEstimators::kRed) == "botpose_wpired" );
    REQUIRE( ll::entryName(PoseEstimators::kRedMegaTag2) == "botpose_orb_wpired" );
    REQUIRE( ll::entryName(PoseEstimators::kBlue) == "botpose_wpiblue" );
    REQUIRE( ll::entryName(PoseEstimators::kBlueMegaTag2) == "botpose_orb_wpiblue" );
    REQUIRE( !ll::isMegaTag2(PoseEstimators::kBlue) );
    REQUIRE( ll::isMegaTag2(PoseEstimators::kBlueMegaTag2) );
}

SCENARIO( "Reading queued pose estimates", "[pose]" ) {
    auto table = std::make_shared<ll::nt::MemoryTable>("limelight");
    PoseEstimator estimator(table, PoseEstimators::kBlueMegaTag2);

    GIVEN( "nothing published" ) {
        REQUIRE( estimator.getBotPoseEstimates().empty() );
    }

    GIVEN( "samples published between reads" ) {
        table->set("botpose_orb_wpiblue", twoTagPose(), 5000000);
        table->set("botpose_orb_wpiblue", vector<double>{}, 6000000);
        table->set("botpose_wpiblue", twoTagPose(), 7000000);

        auto estimates = estimator.getBotPoseEstimates();
        REQUIRE( estimates.size() == 2 );
        REQUIRE( estimates[0].has_value() );
        REQUIRE( estimates[0]->timestampSeconds == Approx(4.95) );
        REQUIRE( estimates[0]->isMegaTag2 );
        REQUIRE( !estimates[1].has_value() );

        WHEN( "read again" ) {
            REQUIRE( estimator.getBotPoseEstimates().empty() );
        }
    }

    GIVEN( "raw fiducials" ) {
        table->set("rawfiducials", vector<double>{8, 1, 2, 3, 4, 5, 6});
        auto tags = estimator.getRawFiducialTargets();
        REQUIRE( tags.size() == 1 );
        REQUIRE( tags[0].id == 8 );
    }
}
