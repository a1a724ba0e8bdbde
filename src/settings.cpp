/**
 * @file settings.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <ll/settings.hpp>
#include <ll/codec/arrays.hpp>
#include <ll/exception.hpp>

using ll::Settings;
using std::vector;

// All numeric settings go out as doubles.
template <typename E>
static double wireValue(E e) {
    return static_cast<double>(static_cast<int>(e));
}

Settings::Settings(const ll::nt::TablePtr &table) : table_(table) {
    if (!table_) throw LL_Error("No table for settings");
}

Settings &Settings::withLimelightLEDMode(LEDMode mode) {
    table_->set("ledMode", wireValue(mode));
    return *this;
}

Settings &Settings::withPipelineIndex(int index) {
    table_->set("pipeline", static_cast<double>(index));
    return *this;
}

Settings &Settings::withPriorityTagId(int id) {
    table_->set("priorityid", static_cast<double>(id));
    return *this;
}

Settings &Settings::withStreamMode(StreamMode mode) {
    table_->set("stream", wireValue(mode));
    return *this;
}

Settings &Settings::withCropWindow(double minX, double maxX, double minY, double maxY) {
    table_->set("crop", vector<double>{minX, maxX, minY, maxY});
    return *this;
}

Settings &Settings::withImuMode(ImuMode mode) {
    table_->set("imumode_set", wireValue(mode));
    return *this;
}

Settings &Settings::withImuAssistAlpha(double alpha) {
    table_->set("imuassistalpha_set", alpha);
    return *this;
}

Settings &Settings::withProcessedFrameFrequency(int skippedFrames) {
    table_->set("throttle_set", static_cast<double>(skippedFrames));
    return *this;
}

Settings &Settings::withFiducialDownscalingOverride(DownscalingOverride downscale) {
    table_->set("fiducial_downscale_set", wireValue(downscale));
    return *this;
}

Settings &Settings::withAprilTagOffset(const ll::Translation3d &offset) {
    table_->set("fiducial_offset_set", ll::codec::translation3dToArray(offset));
    return *this;
}

Settings &Settings::withAprilTagIdFilter(const vector<double> &ids) {
    table_->set("fiducial_id_filters_set", ids);
    return *this;
}

Settings &Settings::withCameraOffset(const ll::Pose3d &offset) {
    table_->set("camerapose_robotspace_set", ll::codec::pose3dToArray(offset));
    return *this;
}

void Settings::save() {
    table_->flush();
}
