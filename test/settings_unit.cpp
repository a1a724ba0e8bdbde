#include "catch.hpp"
#include <ll/settings.hpp>
#include <ll/nt/memory.hpp>

using ll::Settings;
using std::vector;

SCENARIO( "Writing settings", "[settings]" ) {
    auto table = std::make_shared<ll::nt::MemoryTable>("limelight");
    Settings settings(table);

    GIVEN( "a pipeline index" ) {
        settings.withPipelineIndex(3);

        REQUIRE( table->getDouble("pipeline") == 3.0 );
        REQUIRE( table->type("pipeline") == ll::nt::EntryType::kDouble );
        REQUIRE( table->keys().size() == 1 );
    }

    GIVEN( "chained settings" ) {
        settings.withLimelightLEDMode(ll::LEDMode::kForceBlink)
            .withPriorityTagId(4)
            .withStreamMode(ll::StreamMode::kPictureInPictureSecondary)
            .withImuMode(ll::ImuMode::kMT1AssistInternalImu)
            .withImuAssistAlpha(0.01)
            .withProcessedFrameFrequency(100)
            .withFiducialDownscalingOverride(ll::DownscalingOverride::kQuadrupleDownscale)
            .save();

        REQUIRE( table->getDouble("ledMode") == 2.0 );
        REQUIRE( table->getDouble("priorityid") == 4.0 );
        REQUIRE( table->getDouble("stream") == 2.0 );
        REQUIRE( table->getDouble("imumode_set") == 3.0 );
        REQUIRE( table->getDouble("imuassistalpha_set") == 0.01 );
        REQUIRE( table->getDouble("throttle_set") == 100.0 );
        REQUIRE( table->getDouble("fiducial_downscale_set") == 5.0 );
        REQUIRE( table->flushCount() == 1 );
    }

    GIVEN( "array settings" ) {
        settings.withCropWindow(-1.0, 1.0, -0.5, 0.5)
            .withAprilTagOffset({0.1, 0.2, 0.3})
            .withAprilTagIdFilter({1, 2, 7})
            .withCameraOffset(ll::Pose3d({0.3, 0.0, 0.5}, ll::Rotation3d::fromDegrees(0.0, 20.0, 0.0)));

        REQUIRE( table->getDoubleArray("crop") == vector<double>{-1.0, 1.0, -0.5, 0.5} );
        REQUIRE( table->getDoubleArray("fiducial_offset_set") == vector<double>{0.1, 0.2, 0.3} );
        REQUIRE( table->getDoubleArray("fiducial_id_filters_set") == vector<double>{1, 2, 7} );

        auto cam = table->getDoubleArray("camerapose_robotspace_set");
        REQUIRE( cam.size() == 6 );
        REQUIRE( cam[0] == 0.3 );
        REQUIRE( cam[2] == 0.5 );
        REQUIRE( cam[3] == Approx(0.0).margin(1e-9) );
        REQUIRE( cam[4] == Approx(20.0) );
        REQUIRE( cam[5] == Approx(0.0).margin(1e-9) );
    }
}
