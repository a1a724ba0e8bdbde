/**
 * @file pose_estimate.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <iomanip>
#include <sstream>
#include <ll/pose_estimate.hpp>
#include <ll/codec/arrays.hpp>

#include <loguru.hpp>

using ll::PoseEstimate;
using ll::codec::extractArrayEntry;
using ll::codec::kFiducialStride;
using ll::codec::kPoseHeaderSize;
using std::vector;

std::optional<PoseEstimate> ll::codec::decodePoseEstimate(const vector<double> &data, int64_t timestampMicros, bool isMegaTag2) {
    if (data.empty()) {
        return std::nullopt;
    }

    PoseEstimate est;
    est.pose = toPose3d(data);
    est.latency = extractArrayEntry(data, 6);
    est.tagCount = toIntSaturating(extractArrayEntry(data, 7));
    est.tagSpan = extractArrayEntry(data, 8);
    est.avgTagDist = extractArrayEntry(data, 9);
    est.avgTagArea = extractArrayEntry(data, 10);
    est.isMegaTag2 = isMegaTag2;

    est.timestampSeconds = (static_cast<double>(timestampMicros) / 1000000.0) - (est.latency / 1000.0);

    if (est.tagCount > 0 && data.size() == kPoseHeaderSize + kFiducialStride * static_cast<size_t>(est.tagCount)) {
        est.rawFiducials = decodeRawFiducials(vector<double>(data.begin() + kPoseHeaderSize, data.end()));
    }

    return est;
}

std::string PoseEstimate::to_string() const {
    std::stringstream ss;
    ss << std::fixed;
    ss << "Pose Estimate Information:\n";
    ss << std::setprecision(3);
    ss << "Timestamp (Seconds): " << timestampSeconds << "\n";
    ss << "Latency: " << latency << " ms\n";
    ss << "Tag Count: " << tagCount << "\n";
    ss << std::setprecision(2);
    ss << "Tag Span: " << tagSpan << " meters\n";
    ss << "Average Tag Distance: " << avgTagDist << " meters\n";
    ss << "Average Tag Area: " << avgTagArea << "% of image\n";
    ss << "Is MegaTag2: " << (isMegaTag2 ? "true" : "false") << "\n";

    if (rawFiducials.empty()) {
        ss << "No RawFiducials data available.\n";
        return ss.str();
    }

    ss << "Raw Fiducials Details:\n";
    for (size_t i = 0; i < rawFiducials.size(); ++i) {
        const auto &f = rawFiducials[i];
        ss << " Fiducial #" << (i + 1) << ":\n";
        ss << "  ID: " << f.id << "\n";
        ss << "  TXNC: " << f.txnc << "\n";
        ss << "  TYNC: " << f.tync << "\n";
        ss << "  TA: " << f.ta << "\n";
        ss << "  Distance to Camera: " << f.distToCamera << " meters\n";
        ss << "  Distance to Robot: " << f.distToRobot << " meters\n";
        ss << "  Ambiguity: " << f.ambiguity << "\n";
    }
    return ss.str();
}

void PoseEstimate::print() const {
    LOG(INFO) << to_string();
}
