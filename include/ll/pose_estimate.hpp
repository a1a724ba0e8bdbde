/**
 * @file pose_estimate.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>
#include <ll/geometry.hpp>
#include <ll/targets/raw.hpp>

namespace ll {

/**
 * @brief A robot pose estimated from AprilTags, with the tags that were used.
 *
 */
struct PoseEstimate {
    ll::Pose3d pose;

    /** Capture time in seconds: publish time minus latency. */
    double timestampSeconds = 0.0;

    /** Pipeline latency in milliseconds. */
    double latency = 0.0;

    int tagCount = 0;

    /** Largest distance between the tags used, in meters. */
    double tagSpan = 0.0;

    /** Average tag distance in meters. */
    double avgTagDist = 0.0;

    /** Average tag area in percent of image. */
    double avgTagArea = 0.0;

    /** Tags used for the estimate, empty if the array was inconsistent. */
    std::vector<ll::targets::RawFiducialTarget> rawFiducials;

    /** Computed by MegaTag2 rather than MegaTag1. */
    bool isMegaTag2 = false;

    inline const ll::Pose3d &getPose3d() const { return pose; }
    inline ll::Pose2d getPose2d() const { return pose.toPose2d(); }
    inline const std::vector<ll::targets::RawFiducialTarget> &getDetectedTags() const { return rawFiducials; }
    inline double getTimestampSeconds() const { return timestampSeconds; }
    inline int getTagCount() const { return tagCount; }

    /**
     * @brief A multi-line human readable report including each tag.
     *
     * @return std::string
     */
    std::string to_string() const;

    /** Log to_string() at INFO level. */
    void print() const;
};

namespace codec {

/**
 * @brief Decode a pose estimate array:
 * [x, y, z, roll, pitch, yaw, latency, tagCount, tagSpan, avgTagDist,
 *  avgTagArea] followed by 7 values per tag.
 *
 * The timestamp is corrected for latency:
 * `timestampMicros / 1e6 - latency / 1e3` seconds. Tags are only decoded if
 * the array length is exactly `11 + 7 * tagCount`, otherwise the estimate is
 * returned without tags.
 *
 * @param data Array as published
 * @param timestampMicros Server time of the publish
 * @param isMegaTag2 Which estimator produced the array
 * @return Empty if the array is empty.
 */
std::optional<ll::PoseEstimate> decodePoseEstimate(const std::vector<double> &data, int64_t timestampMicros, bool isMegaTag2);

}  // namespace codec
}  // namespace ll
