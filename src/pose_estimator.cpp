/**
 * @file pose_estimator.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <ll/pose_estimator.hpp>
#include <ll/codec/arrays.hpp>

#include <loguru.hpp>

using ll::PoseEstimator;
using ll::PoseEstimators;
using ll::PoseEstimate;
using ll::targets::RawFiducialTarget;
using std::vector;
using std::optional;

std::string ll::entryName(PoseEstimators e) {
    switch (e) {
    case PoseEstimators::kRed:          return "botpose_wpired";
    case PoseEstimators::kRedMegaTag2:  return "botpose_orb_wpired";
    case PoseEstimators::kBlue:         return "botpose_wpiblue";
    case PoseEstimators::kBlueMegaTag2: return "botpose_orb_wpiblue";
    }
    return "";
}

bool ll::isMegaTag2(PoseEstimators e) {
    return e == PoseEstimators::kRedMegaTag2 || e == PoseEstimators::kBlueMegaTag2;
}

PoseEstimator::PoseEstimator(const ll::nt::TablePtr &table, PoseEstimators estimator)
        : table_(table), estimator_(estimator) {
    subscriber_ = std::make_unique<ll::nt::DoubleArraySubscriber>(table_, entryName(estimator_));
}

PoseEstimator::~PoseEstimator() {}

vector<optional<PoseEstimate>> PoseEstimator::getBotPoseEstimates() {
    auto samples = subscriber_->readQueue();
    bool mt2 = isMegaTag2(estimator_);

    vector<optional<PoseEstimate>> result;
    result.reserve(samples.size());
    for (const auto &s : samples) {
        result.push_back(ll::codec::decodePoseEstimate(s.value, s.timestamp, mt2));
    }
    return result;
}

vector<RawFiducialTarget> PoseEstimator::getRawFiducialTargets() const {
    return ll::codec::decodeRawFiducials(table_->getDoubleArray("rawfiducials"));
}

bool PoseEstimator::validPoseEstimate(const optional<PoseEstimate> &estimate) {
    return estimate.has_value() && !estimate->rawFiducials.empty();
}
