/**
 * @file geometry.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <Eigen/Core>
#include <Eigen/Geometry>

namespace ll {

inline double degreesToRadians(double d) { return d * EIGEN_PI / 180.0; }
inline double radiansToDegrees(double r) { return r * 180.0 / EIGEN_PI; }

/**
 * @brief Position in meters.
 *
 */
struct Translation3d {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    inline Eigen::Vector3d vector() const { return Eigen::Vector3d(x, y, z); }
};

/**
 * @brief An orientation in 3D space, stored as a unit quaternion. Euler angles
 * are extrinsic rotations about X (roll), then Y (pitch), then Z (yaw).
 *
 */
class Rotation3d {
 public:
    Rotation3d() : q_(Eigen::Quaterniond::Identity()) {}

    /**
     * @brief Construct from Euler angles in radians.
     *
     * @param roll Rotation about X
     * @param pitch Rotation about Y
     * @param yaw Rotation about Z
     */
    Rotation3d(double roll, double pitch, double yaw);

    explicit Rotation3d(const Eigen::Quaterniond &q) : q_(q.normalized()) {}

    static Rotation3d fromDegrees(double roll, double pitch, double yaw);

    /** Roll in radians. */
    double x() const;
    /** Pitch in radians. */
    double y() const;
    /** Yaw in radians. */
    double z() const;

    inline const Eigen::Quaterniond &quaternion() const { return q_; }
    inline Eigen::Matrix3d matrix() const { return q_.toRotationMatrix(); }

 private:
    Eigen::Quaterniond q_;
};

/**
 * @brief Position and heading on the field plane.
 *
 */
struct Pose2d {
    double x = 0.0;
    double y = 0.0;
    double heading = 0.0;  // Radians
};

/**
 * @brief Position and orientation in 3D space.
 *
 */
class Pose3d {
 public:
    Pose3d() {}
    Pose3d(const Translation3d &t, const Rotation3d &r) : translation_(t), rotation_(r) {}

    inline const Translation3d &translation() const { return translation_; }
    inline const Rotation3d &rotation() const { return rotation_; }

    inline double x() const { return translation_.x; }
    inline double y() const { return translation_.y; }
    inline double z() const { return translation_.z; }

    /**
     * @brief Project onto the XY plane, keeping the yaw as heading.
     *
     * @return Pose2d
     */
    Pose2d toPose2d() const;

    /** Homogeneous transform of this pose. */
    Eigen::Isometry3d matrix() const;

 private:
    Translation3d translation_;
    Rotation3d rotation_;
};

}  // namespace ll
