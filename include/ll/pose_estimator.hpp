/**
 * @file pose_estimator.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <ll/nt/table.hpp>
#include <ll/pose_estimate.hpp>

namespace ll {

/**
 * @brief Pose estimators available on the camera. The blue alliance
 * estimators are the recommended ones.
 *
 */
enum struct PoseEstimators {
    kRed,               // botpose_wpired
    kRedMegaTag2,       // botpose_orb_wpired
    kBlue,              // botpose_wpiblue
    kBlueMegaTag2       // botpose_orb_wpiblue
};

/**
 * @brief Table entry that an estimator publishes to.
 *
 */
std::string entryName(PoseEstimators e);

bool isMegaTag2(PoseEstimators e);

/**
 * @brief Reads pose estimates from one of the camera's estimators. Every
 * sample published since construction (or the previous read) is kept until
 * getBotPoseEstimates() is called.
 *
 */
class PoseEstimator {
 public:
    PoseEstimator(const ll::nt::TablePtr &table, PoseEstimators estimator);
    ~PoseEstimator();

    PoseEstimator(const PoseEstimator &) = delete;
    PoseEstimator &operator=(const PoseEstimator &) = delete;

    /**
     * @brief Decode all samples queued since the last call, oldest first. An
     * empty sample gives an empty optional in its place.
     *
     * @return std::vector<std::optional<PoseEstimate>>
     */
    std::vector<std::optional<ll::PoseEstimate>> getBotPoseEstimates();

    /**
     * @brief Latest tag detections from `rawfiducials`.
     *
     * @return std::vector<ll::targets::RawFiducialTarget>
     */
    std::vector<ll::targets::RawFiducialTarget> getRawFiducialTargets() const;

    /**
     * @brief Check if an estimate can be used for localisation. Estimates
     * without any tags are not valid even though they decoded.
     *
     * @param estimate
     * @return true if present and has at least one tag.
     */
    static bool validPoseEstimate(const std::optional<ll::PoseEstimate> &estimate);

    inline PoseEstimators estimator() const { return estimator_; }

 private:
    ll::nt::TablePtr table_;
    PoseEstimators estimator_;
    std::unique_ptr<ll::nt::DoubleArraySubscriber> subscriber_;
};

using PoseEstimatorPtr = std::shared_ptr<PoseEstimator>;

}  // namespace ll
