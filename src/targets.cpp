/**
 * @file targets.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <ll/targets/fiducial.hpp>
#include <ll/codec/arrays.hpp>

using ll::targets::RetroreflectiveTarget;
using ll::codec::toPose3d;
using ll::codec::toPose2d;

ll::Pose3d RetroreflectiveTarget::getCameraPose_TargetSpace() const { return toPose3d(cameraPose_TargetSpace); }
ll::Pose3d RetroreflectiveTarget::getRobotPose_FieldSpace() const { return toPose3d(robotPose_FieldSpace); }
ll::Pose3d RetroreflectiveTarget::getRobotPose_TargetSpace() const { return toPose3d(robotPose_TargetSpace); }
ll::Pose3d RetroreflectiveTarget::getTargetPose_CameraSpace() const { return toPose3d(targetPose_CameraSpace); }
ll::Pose3d RetroreflectiveTarget::getTargetPose_RobotSpace() const { return toPose3d(targetPose_RobotSpace); }

ll::Pose2d RetroreflectiveTarget::getCameraPose_TargetSpace2D() const { return toPose2d(cameraPose_TargetSpace); }
ll::Pose2d RetroreflectiveTarget::getRobotPose_FieldSpace2D() const { return toPose2d(robotPose_FieldSpace); }
ll::Pose2d RetroreflectiveTarget::getRobotPose_TargetSpace2D() const { return toPose2d(robotPose_TargetSpace); }
ll::Pose2d RetroreflectiveTarget::getTargetPose_CameraSpace2D() const { return toPose2d(targetPose_CameraSpace); }
ll::Pose2d RetroreflectiveTarget::getTargetPose_RobotSpace2D() const { return toPose2d(targetPose_RobotSpace); }
