/**
 * @file arrays.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <ll/codec/arrays.hpp>

#include <loguru.hpp>

using ll::codec::extractArrayEntry;
using ll::codec::toIntSaturating;
using ll::targets::RawFiducialTarget;
using ll::targets::RawDetection;
using std::vector;

vector<RawFiducialTarget> ll::codec::decodeRawFiducials(const vector<double> &data) {
    if (data.size() % kFiducialStride != 0) {
        return {};
    }

    size_t count = data.size() / kFiducialStride;
    vector<RawFiducialTarget> result(count);

    for (size_t i = 0; i < count; ++i) {
        size_t base = i * kFiducialStride;
        auto &f = result[i];
        f.id = toIntSaturating(extractArrayEntry(data, base));
        f.txnc = extractArrayEntry(data, base + 1);
        f.tync = extractArrayEntry(data, base + 2);
        f.ta = extractArrayEntry(data, base + 3);
        f.distToCamera = extractArrayEntry(data, base + 4);
        f.distToRobot = extractArrayEntry(data, base + 5);
        f.ambiguity = extractArrayEntry(data, base + 6);
    }

    return result;
}

vector<RawDetection> ll::codec::decodeRawDetections(const vector<double> &data) {
    if (data.size() % kDetectionStride != 0) {
        return {};
    }

    size_t count = data.size() / kDetectionStride;
    vector<RawDetection> result(count);

    for (size_t i = 0; i < count; ++i) {
        size_t base = i * kDetectionStride;
        auto &d = result[i];
        d.classId = toIntSaturating(extractArrayEntry(data, base));
        d.txnc = extractArrayEntry(data, base + 1);
        d.tync = extractArrayEntry(data, base + 2);
        d.ta = extractArrayEntry(data, base + 3);
        d.corner0_X = extractArrayEntry(data, base + 4);
        d.corner0_Y = extractArrayEntry(data, base + 5);
        d.corner1_X = extractArrayEntry(data, base + 6);
        d.corner1_Y = extractArrayEntry(data, base + 7);
        d.corner2_X = extractArrayEntry(data, base + 8);
        d.corner2_Y = extractArrayEntry(data, base + 9);
        d.corner3_X = extractArrayEntry(data, base + 10);
        d.corner3_Y = extractArrayEntry(data, base + 11);
    }

    return result;
}

ll::Pose3d ll::codec::toPose3d(const vector<double> &data) {
    if (data.size() < 6) {
        VLOG(1) << "Bad 3D pose data, " << data.size() << " values";
        return ll::Pose3d();
    }

    return ll::Pose3d(
        {data[0], data[1], data[2]},
        ll::Rotation3d::fromDegrees(data[3], data[4], data[5]));
}

ll::Pose2d ll::codec::toPose2d(const vector<double> &data) {
    if (data.size() < 6) {
        VLOG(1) << "Bad 2D pose data, " << data.size() << " values";
        return ll::Pose2d();
    }

    ll::Pose2d p;
    p.x = data[0];
    p.y = data[1];
    p.heading = ll::degreesToRadians(data[5]);
    return p;
}

vector<double> ll::codec::pose3dToArray(const ll::Pose3d &pose) {
    const auto &r = pose.rotation();
    return {
        pose.x(), pose.y(), pose.z(),
        ll::radiansToDegrees(r.x()),
        ll::radiansToDegrees(r.y()),
        ll::radiansToDegrees(r.z())
    };
}

vector<double> ll::codec::translation3dToArray(const ll::Translation3d &t) {
    return {t.x, t.y, t.z};
}
