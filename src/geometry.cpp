/**
 * @file geometry.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <algorithm>
#include <cmath>
#include <ll/geometry.hpp>

using ll::Rotation3d;
using ll::Pose3d;
using ll::Pose2d;

Rotation3d::Rotation3d(double roll, double pitch, double yaw) {
    q_ = Eigen::AngleAxisd(yaw, Eigen::Vector3d::UnitZ())
        * Eigen::AngleAxisd(pitch, Eigen::Vector3d::UnitY())
        * Eigen::AngleAxisd(roll, Eigen::Vector3d::UnitX());
}

Rotation3d Rotation3d::fromDegrees(double roll, double pitch, double yaw) {
    return Rotation3d(degreesToRadians(roll), degreesToRadians(pitch), degreesToRadians(yaw));
}

double Rotation3d::x() const {
    const double w = q_.w(), x = q_.x(), y = q_.y(), z = q_.z();
    return std::atan2(2.0 * (w * x + y * z), 1.0 - 2.0 * (x * x + y * y));
}

double Rotation3d::y() const {
    const double w = q_.w(), x = q_.x(), y = q_.y(), z = q_.z();
    // Clamp for numerical drift at +/-90 degrees
    return std::asin(std::clamp(2.0 * (w * y - z * x), -1.0, 1.0));
}

double Rotation3d::z() const {
    const double w = q_.w(), x = q_.x(), y = q_.y(), z = q_.z();
    return std::atan2(2.0 * (w * z + x * y), 1.0 - 2.0 * (y * y + z * z));
}

Pose2d Pose3d::toPose2d() const {
    Pose2d p;
    p.x = translation_.x;
    p.y = translation_.y;
    p.heading = rotation_.z();
    return p;
}

Eigen::Isometry3d Pose3d::matrix() const {
    Eigen::Isometry3d m = Eigen::Isometry3d::Identity();
    m.linear() = rotation_.matrix();
    m.translation() = translation_.vector();
    return m;
}
