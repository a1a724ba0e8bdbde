/**
 * @file fiducial.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <string>
#include <vector>
#include <ll/geometry.hpp>

namespace ll {
namespace targets {

/**
 * @brief A color or retroreflective target from the JSON results. The pose
 * arrays are [x, y, z, roll, pitch, yaw] with angles in degrees and are only
 * filled in by 3D capable pipelines.
 *
 */
struct RetroreflectiveTarget {
    std::vector<double> cameraPose_TargetSpace = std::vector<double>(6, 0.0);
    std::vector<double> robotPose_FieldSpace = std::vector<double>(6, 0.0);
    std::vector<double> robotPose_TargetSpace = std::vector<double>(6, 0.0);
    std::vector<double> targetPose_CameraSpace = std::vector<double>(6, 0.0);
    std::vector<double> targetPose_RobotSpace = std::vector<double>(6, 0.0);

    double ta = 0.0;
    double tx = 0.0;
    double ty = 0.0;
    double tx_pixels = 0.0;
    double ty_pixels = 0.0;
    double tx_nocrosshair = 0.0;
    double ty_nocrosshair = 0.0;
    double ts = 0.0;

    ll::Pose3d getCameraPose_TargetSpace() const;
    ll::Pose3d getRobotPose_FieldSpace() const;
    ll::Pose3d getRobotPose_TargetSpace() const;
    ll::Pose3d getTargetPose_CameraSpace() const;
    ll::Pose3d getTargetPose_RobotSpace() const;

    ll::Pose2d getCameraPose_TargetSpace2D() const;
    ll::Pose2d getRobotPose_FieldSpace2D() const;
    ll::Pose2d getRobotPose_TargetSpace2D() const;
    ll::Pose2d getTargetPose_CameraSpace2D() const;
    ll::Pose2d getTargetPose_RobotSpace2D() const;
};

/**
 * @brief An AprilTag target from the JSON results.
 *
 */
struct FiducialTarget : public RetroreflectiveTarget {
    double fiducialID = 0.0;
    std::string fiducialFamily;
};

}  // namespace targets
}  // namespace ll
