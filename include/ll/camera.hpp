/**
 * @file camera.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <memory>
#include <string>
#include <ll/nt/table.hpp>
#include <ll/geometry.hpp>
#include <ll/uri.hpp>
#include <ll/settings.hpp>
#include <ll/data_collator.hpp>
#include <ll/pose_estimator.hpp>

namespace ll {

/**
 * @brief A single Limelight camera, identified by its hostname. Gives access
 * to the camera table, its settings and its results.
 *
 * @code
 * ll::Camera camera("limelight-front");
 * camera.setRobotOrientation(ll::Rotation3d(0.0, 0.0, gyroYaw));
 * auto estimator = camera.makePoseEstimator(ll::PoseEstimators::kBlueMegaTag2);
 * for (const auto &e : estimator->getBotPoseEstimates()) {
 *     if (ll::PoseEstimator::validPoseEstimate(e)) ...
 * }
 * @endcode
 */
class Camera {
 public:
    /**
     * @param name Camera hostname, an empty name is replaced by "limelight".
     */
    explicit Camera(const std::string &name);

    Camera(const std::string &name, const ll::nt::InstancePtr &instance);

    Camera(const Camera &) = delete;
    Camera &operator=(const Camera &) = delete;

    inline const std::string &name() const { return name_; }

    inline const ll::nt::TablePtr &getTable() const { return table_; }

    inline ll::Settings &getSettings() { return settings_; }

    inline const ll::PipelineDataCollator &getDataCollator() const { return collator_; }

    /**
     * @brief Send the robot heading for MegaTag2 and flush. Must be called
     * every control loop, angles from the rotation are sent in degrees.
     *
     * @param rotation Robot orientation on the field
     */
    void setRobotOrientation(const ll::Rotation3d &rotation);

    ll::PoseEstimatorPtr makePoseEstimator(ll::PoseEstimators estimator);

    /**
     * @brief Address of a camera web request,
     * `http://<name>.local:5807/<request>`.
     *
     * @param request
     * @return ll::URI, invalid if the name does not give a usable URL.
     */
    ll::URI getLimelightURLString(const std::string &request) const;

    /**
     * @brief Ask the camera to save a snapshot, without waiting for it.
     *
     * @param snapname Name of the snapshot, may be empty.
     */
    void snapshot(const std::string &snapname);

    /**
     * @brief Ask the camera to save a snapshot and wait for the reply.
     *
     * @param snapname Name of the snapshot, may be empty.
     * @return true if the camera replied with status 200.
     */
    bool snapshotSynchronous(const std::string &snapname);

    /**
     * @brief Send a snapshot request to a given address. Errors are logged.
     *
     * @param uri
     * @param snapname Sent in the `snapname` header if not empty.
     * @return true if the server replied with status 200.
     */
    static bool requestSnapshot(const ll::URI &uri, const std::string &snapname);

    /**
     * @brief Run requestSnapshot() on the shared thread pool. The address and
     * name are copied into the job.
     *
     */
    static void requestSnapshotAsync(const ll::URI &uri, const std::string &snapname);

    /** Replace an empty camera name with the default. */
    static std::string sanitizeName(const std::string &name);

 private:
    std::string name_;
    ll::nt::TablePtr table_;
    ll::Settings settings_;
    ll::PipelineDataCollator collator_;
};

}  // namespace ll
