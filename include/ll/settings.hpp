/**
 * @file settings.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <memory>
#include <vector>
#include <ll/nt/table.hpp>
#include <ll/geometry.hpp>

namespace ll {

/** LED behaviour. */
enum struct LEDMode {
    kPipelineControl = 0,
    kForceOff = 1,
    kForceBlink = 2,
    kForceOn = 3
};

/** Layout of the video stream when a USB camera is attached. */
enum struct StreamMode {
    kStandard = 0,
    kPictureInPictureMain = 1,
    kPictureInPictureSecondary = 2
};

/** AprilTag detection resolution, overriding the pipeline value. */
enum struct DownscalingOverride {
    kPipeline = 0,
    kNoDownscale = 1,
    kHalfDownscale = 2,
    kDoubleDownscale = 3,
    kTripleDownscale = 4,
    kQuadrupleDownscale = 5
};

/** Source of the robot orientation used by MegaTag2. */
enum struct ImuMode {
    kExternalImu = 0,
    kSyncInternalImu = 1,
    kInternalImu = 2,
    kMT1AssistInternalImu = 3,
    kExternalAssistInternalIMU = 4
};

/**
 * @brief Write-only camera settings. Each `with` call is published straight
 * away and returns the same object so calls can be chained. Nothing is read
 * back or cached.
 *
 * @code
 * camera.getSettings()
 *     .withPipelineIndex(1)
 *     .withLimelightLEDMode(ll::LEDMode::kForceOff)
 *     .save();
 * @endcode
 */
class Settings {
 public:
    explicit Settings(const ll::nt::TablePtr &table);

    Settings &withLimelightLEDMode(LEDMode mode);
    Settings &withPipelineIndex(int index);

    /** Tag to prefer for tx and ty targeting, -1 for none. */
    Settings &withPriorityTagId(int id);

    Settings &withStreamMode(StreamMode mode);

    /**
     * @brief Crop the image, values from -1 to 1. The pipeline must use the
     * default crop rectangle in the web interface.
     *
     */
    Settings &withCropWindow(double minX, double maxX, double minY, double maxY);

    Settings &withImuMode(ImuMode mode);

    /** Complementary filter weight for the IMU assist modes. */
    Settings &withImuAssistAlpha(double alpha);

    /**
     * @brief Process one frame in every (skippedFrames + 1). Use to reduce
     * temperature when targeting is not needed.
     *
     */
    Settings &withProcessedFrameFrequency(int skippedFrames);

    Settings &withFiducialDownscalingOverride(DownscalingOverride downscale);

    /** Point of interest offset from the tag center, meters. */
    Settings &withAprilTagOffset(const ll::Translation3d &offset);

    /** Only track tags with these ids. */
    Settings &withAprilTagIdFilter(const std::vector<double> &ids);

    /** Camera pose relative to the robot center. */
    Settings &withCameraOffset(const ll::Pose3d &offset);

    /** Flush the table so that all settings are sent now. */
    void save();

 private:
    ll::nt::TablePtr table_;
};

using SettingsPtr = std::shared_ptr<Settings>;

}  // namespace ll
