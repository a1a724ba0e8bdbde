/**
 * @file pipeline_result.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <string>
#include <vector>
#include <ll/geometry.hpp>
#include <ll/targets/fiducial.hpp>
#include <ll/targets/neural.hpp>
#include <ll/targets/barcode.hpp>

namespace ll {

/**
 * @brief Everything a pipeline reported for one frame, decoded from the
 * `json` entry. A result that failed to decode has `error` set and otherwise
 * holds default values.
 *
 */
struct PipelineResult {
    std::string error;              // Empty unless decoding failed

    double pipelineID = 0.0;
    double latency_pipeline = 0.0;  // ms
    double latency_capture = 0.0;   // ms
    double latency_jsonParse = 0.0; // ms, measured locally

    double timestamp_LIMELIGHT_publish = 0.0;
    double timestamp_RIOFPGA_capture = 0.0;

    bool valid = false;

    /** Pose arrays are [x, y, z, roll, pitch, yaw] in meters and degrees. */
    std::vector<double> botpose = std::vector<double>(6, 0.0);
    std::vector<double> botpose_wpired = std::vector<double>(6, 0.0);
    std::vector<double> botpose_wpiblue = std::vector<double>(6, 0.0);

    double botpose_tagcount = 0.0;
    double botpose_span = 0.0;
    double botpose_avgdist = 0.0;
    double botpose_avgarea = 0.0;

    std::vector<double> camerapose_robotspace = std::vector<double>(6, 0.0);

    std::vector<ll::targets::RetroreflectiveTarget> targets_Retro;
    std::vector<ll::targets::FiducialTarget> targets_Fiducials;
    std::vector<ll::targets::ClassifierTarget> targets_Classifier;
    std::vector<ll::targets::DetectorTarget> targets_Detector;
    std::vector<ll::targets::BarcodeTarget> targets_Barcode;

    ll::Pose3d getBotPose3d() const;
    ll::Pose3d getBotPose3d_wpiRed() const;
    ll::Pose3d getBotPose3d_wpiBlue() const;

    ll::Pose2d getBotPose2d() const;
    ll::Pose2d getBotPose2d_wpiRed() const;
    ll::Pose2d getBotPose2d_wpiBlue() const;
};

}  // namespace ll
