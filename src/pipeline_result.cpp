/**
 * @file pipeline_result.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <ll/pipeline_result.hpp>
#include <ll/codec/arrays.hpp>

using ll::PipelineResult;
using ll::codec::toPose3d;
using ll::codec::toPose2d;

ll::Pose3d PipelineResult::getBotPose3d() const { return toPose3d(botpose); }
ll::Pose3d PipelineResult::getBotPose3d_wpiRed() const { return toPose3d(botpose_wpired); }
ll::Pose3d PipelineResult::getBotPose3d_wpiBlue() const { return toPose3d(botpose_wpiblue); }

ll::Pose2d PipelineResult::getBotPose2d() const { return toPose2d(botpose); }
ll::Pose2d PipelineResult::getBotPose2d_wpiRed() const { return toPose2d(botpose_wpired); }
ll::Pose2d PipelineResult::getBotPose2d_wpiBlue() const { return toPose2d(botpose_wpiblue); }
