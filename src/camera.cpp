/**
 * @file camera.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <ll/camera.hpp>
#include <ll/config.h>
#include <ll/exception.hpp>
#include <ll/threads.hpp>

#include <loguru.hpp>

#include "http/request.hpp"

using ll::Camera;
using ll::URI;
using std::string;

string Camera::sanitizeName(const string &name) {
    return (name.empty()) ? LL_DEFAULT_NAME : name;
}

Camera::Camera(const string &name) : Camera(name, ll::nt::getDefaultInstance()) {}

Camera::Camera(const string &name, const ll::nt::InstancePtr &instance) :
        name_(sanitizeName(name)),
        table_(instance->getTable(name_)),
        settings_(table_),
        collator_(table_) {}

void Camera::setRobotOrientation(const ll::Rotation3d &rotation) {
    std::vector<double> orientation = {
        ll::radiansToDegrees(rotation.z()), 0.0,
        ll::radiansToDegrees(rotation.y()), 0.0,
        ll::radiansToDegrees(rotation.x()), 0.0
    };
    table_->set("robot_orientation_set", orientation);
    table_->flush();
}

ll::PoseEstimatorPtr Camera::makePoseEstimator(ll::PoseEstimators estimator) {
    return std::make_shared<ll::PoseEstimator>(table_, estimator);
}

URI Camera::getLimelightURLString(const string &request) const {
    URI uri("http://" + name_ + LL_HOST_SUFFIX + ":" + std::to_string(LL_SNAPSHOT_PORT) + "/" + request);
    if (!uri.isValid()) {
        LOG(ERROR) << "bad LL URL: " << uri.to_string();
    }
    return uri;
}

void Camera::snapshot(const string &snapname) {
    requestSnapshotAsync(getLimelightURLString(LL_SNAPSHOT_REQUEST), snapname);
}

void Camera::requestSnapshotAsync(const URI &uri, const string &snapname) {
    ll::pool.push([uri, snapname](int id) {
        ll::set_thread_name("ll/snapshot");
        requestSnapshot(uri, snapname);
    });
}

bool Camera::snapshotSynchronous(const string &snapname) {
    return requestSnapshot(getLimelightURLString(LL_SNAPSHOT_REQUEST), snapname);
}

bool Camera::requestSnapshot(const URI &uri, const string &snapname) {
    if (!uri.isValid()) return false;

    ll::net::HeaderMap headers;
    if (!snapname.empty()) {
        headers["snapname"] = snapname;
    }

    try {
        auto response = ll::net::httpGet(uri, headers, LL_HTTP_TIMEOUT);
        if (response.status == 200) {
            return true;
        }
        LOG(ERROR) << "Bad LL Request: " << uri.to_string() << " (" << response.status << ")";
    } catch (const ll::exception &e) {
        LOG(ERROR) << e.what();
    }
    return false;
}
