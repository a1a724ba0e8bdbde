/**
 * @file data_collator.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <ll/nt/table.hpp>
#include <ll/geometry.hpp>
#include <ll/pipeline_result.hpp>
#include <ll/targets/raw.hpp>

namespace ll {

/**
 * @brief Read access to everything the current pipeline publishes. Every call
 * reads the table again, nothing is cached.
 *
 */
class PipelineDataCollator {
 public:
    explicit PipelineDataCollator(const ll::nt::TablePtr &table);

    std::vector<ll::targets::RawDetection> getRawDetections() const;
    std::vector<ll::targets::RawFiducialTarget> getRawFiducialTargets() const;

    /**
     * @brief Decode the full results document. Decode failures do not throw,
     * they are reported in `PipelineResult::error` prefixed with
     * "lljson error: ".
     *
     * @param showParseTime Log the time taken to decode.
     * @return PipelineResult with `latency_jsonParse` set.
     */
    ll::PipelineResult getLatestResults(bool showParseTime = false) const;

    /** Is there a valid target. */
    bool getTV() const;

    /** Horizontal offset from crosshair to target in degrees. */
    double getTX() const;
    /** Vertical offset from crosshair to target in degrees. */
    double getTY() const;
    /** Horizontal offset from principal pixel to target in degrees. */
    double getTXNC() const;
    /** Vertical offset from principal pixel to target in degrees. */
    double getTYNC() const;
    /** Target area, 0% to 100% of image. */
    double getTA() const;

    /**
     * @brief All basic targeting values in one array: [valid, count, latency,
     * capture latency, tx, ty, txnc, tync, ta, tid, classifier class,
     * detector class, long side, short side, horizontal extent,
     * vertical extent, skew].
     *
     * @return std::vector<double>
     */
    std::vector<double> getT2DArray() const;

    int getTargetCount() const;
    int getClassifierClassIndex() const;
    int getDetectorClassIndex() const;

    std::string getClassifierClass() const;
    std::string getDetectorClass() const;

    double getLatencyPipeline() const;
    double getLatencyCapture() const;

    double getCurrentPipelineIndex() const;
    std::string getCurrentPipelineType() const;

    /** Undecoded results document. */
    std::string getJSONDump() const;

    ll::Pose3d getBotPose3dTargetSpace() const;
    ll::Pose3d getCameraPose3dTargetSpace() const;
    ll::Pose3d getTargetPose3dCameraSpace() const;
    ll::Pose3d getTargetPose3dRobotSpace() const;
    ll::Pose3d getCameraPose3dRobotSpace() const;

    /** MegaTag standard deviations [MT1 x, y, z, roll, pitch, yaw, MT2 x, ...]. */
    std::vector<double> getStandardDeviations() const;

    /** Average HSV color underneath the crosshair region. */
    std::vector<double> getTargetColor() const;

    double getFiducialID() const;
    std::string getNeuralClassID() const;
    std::vector<std::string> getRawBarcodeData() const;

    /** [fps, cpu temp, ram usage, temp] */
    std::vector<double> getHardwareMetrics() const;
    double getFps() const;
    double getCpuTemperature() const;
    double getRamUsage() const;
    double getTemperature() const;

 private:
    ll::nt::TablePtr table_;
};

using PipelineDataCollatorPtr = std::shared_ptr<PipelineDataCollator>;

}  // namespace ll
