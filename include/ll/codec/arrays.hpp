/**
 * @file arrays.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 *
 * Decoding of the flat number arrays published by the camera.
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>
#include <ll/geometry.hpp>
#include <ll/targets/raw.hpp>

namespace ll {
namespace codec {

/// Values per tag in `rawfiducials` and in pose estimate arrays.
static constexpr size_t kFiducialStride = 7;
/// Values per detection in `rawdetections`.
static constexpr size_t kDetectionStride = 12;
/// Values before the per tag data in a pose estimate array.
static constexpr size_t kPoseHeaderSize = 11;

/**
 * @brief Convert a wire number to an integer. NaN gives 0 and values outside
 * the range of T are clamped.
 *
 * @tparam T Integer type
 * @param v
 * @return T
 */
template <typename T = int>
inline T toIntSaturating(double v) {
    if (std::isnan(v)) return 0;
    if (v >= static_cast<double>(std::numeric_limits<T>::max())) return std::numeric_limits<T>::max();
    if (v <= static_cast<double>(std::numeric_limits<T>::min())) return std::numeric_limits<T>::min();
    return static_cast<T>(v);
}

/**
 * @brief Read one array element, giving 0 when the index is out of range.
 *
 * @param data
 * @param index
 * @return double
 */
inline double extractArrayEntry(const std::vector<double> &data, size_t index) {
    return (index < data.size()) ? data[index] : 0.0;
}

/**
 * @brief Decode fiducials from a stride 7 array:
 * [id, txnc, tync, ta, distToCamera, distToRobot, ambiguity] per tag.
 *
 * @param data
 * @return Decoded tags, empty if the length is not a multiple of the stride.
 */
std::vector<ll::targets::RawFiducialTarget> decodeRawFiducials(const std::vector<double> &data);

/**
 * @brief Decode neural detections from a stride 12 array:
 * [classId, txnc, tync, ta, x0, y0, x1, y1, x2, y2, x3, y3] per detection.
 *
 * @param data
 * @return Decoded detections, empty if the length is not a multiple of the stride.
 */
std::vector<ll::targets::RawDetection> decodeRawDetections(const std::vector<double> &data);

/**
 * @brief Build a pose from [x, y, z, roll, pitch, yaw] with the angles in
 * degrees. Arrays shorter than 6 give the identity pose.
 *
 * @param data
 * @return Pose3d
 */
ll::Pose3d toPose3d(const std::vector<double> &data);

/**
 * @brief Build a field pose from [x, y, z, roll, pitch, yaw] using x, y and
 * yaw. Arrays shorter than 6 give the zero pose.
 *
 * @param data
 * @return Pose2d
 */
ll::Pose2d toPose2d(const std::vector<double> &data);

/**
 * @brief Inverse of toPose3d(), angles in degrees.
 *
 */
std::vector<double> pose3dToArray(const ll::Pose3d &pose);

std::vector<double> translation3dToArray(const ll::Translation3d &t);

}  // namespace codec
}  // namespace ll
