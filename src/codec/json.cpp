/**
 * @file json.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <ll/codec/json.hpp>
#include <ll/exception.hpp>
#include <ll/profiler.hpp>

#include <nlohmann/json.hpp>

using nlohmann::json;
using ll::PipelineResult;
using ll::targets::RetroreflectiveTarget;
using ll::targets::FiducialTarget;
using ll::targets::ClassifierTarget;
using ll::targets::DetectorTarget;
using ll::targets::BarcodeTarget;

namespace {

// Copy a field if present, leave the default otherwise.
template <typename T>
void read(const json &j, const char *key, T &field) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        it->get_to(field);
    }
}

void readRetro(const json &j, RetroreflectiveTarget &t) {
    read(j, "t6c_ts", t.cameraPose_TargetSpace);
    read(j, "t6r_fs", t.robotPose_FieldSpace);
    read(j, "t6r_ts", t.robotPose_TargetSpace);
    read(j, "t6t_cs", t.targetPose_CameraSpace);
    read(j, "t6t_rs", t.targetPose_RobotSpace);
    read(j, "ta", t.ta);
    read(j, "tx", t.tx);
    read(j, "ty", t.ty);
    read(j, "txp", t.tx_pixels);
    read(j, "typ", t.ty_pixels);
    read(j, "tx_nocross", t.tx_nocrosshair);
    read(j, "ty_nocross", t.ty_nocrosshair);
    read(j, "ts", t.ts);
}

}  // namespace

void ll::targets::from_json(const json &j, RetroreflectiveTarget &t) {
    readRetro(j, t);
}

void ll::targets::from_json(const json &j, FiducialTarget &t) {
    readRetro(j, t);
    read(j, "fID", t.fiducialID);
    read(j, "fam", t.fiducialFamily);
}

void ll::targets::from_json(const json &j, ClassifierTarget &t) {
    read(j, "class", t.className);
    read(j, "classID", t.classID);
    read(j, "conf", t.confidence);
    read(j, "zone", t.zone);
    read(j, "tx", t.tx);
    read(j, "txp", t.tx_pixels);
    read(j, "ty", t.ty);
    read(j, "typ", t.ty_pixels);
}

void ll::targets::from_json(const json &j, DetectorTarget &t) {
    read(j, "class", t.className);
    read(j, "classID", t.classID);
    read(j, "conf", t.confidence);
    read(j, "ta", t.ta);
    read(j, "tx", t.tx);
    read(j, "ty", t.ty);
    read(j, "txp", t.tx_pixels);
    read(j, "typ", t.ty_pixels);
    read(j, "tx_nocross", t.tx_nocrosshair);
    read(j, "ty_nocross", t.ty_nocrosshair);
}

void ll::targets::from_json(const json &j, BarcodeTarget &t) {
    read(j, "fam", t.family);
    read(j, "data", t.data);
    read(j, "txp", t.tx_pixels);
    read(j, "typ", t.ty_pixels);
    read(j, "tx", t.tx);
    read(j, "ty", t.ty);
    read(j, "tx_nocross", t.tx_nocrosshair);
    read(j, "ty_nocross", t.ty_nocrosshair);
    read(j, "ta", t.ta);
    read(j, "pts", t.corners);
}

void ll::from_json(const json &j, PipelineResult &r) {
    read(j, "pID", r.pipelineID);
    read(j, "tl", r.latency_pipeline);
    read(j, "cl", r.latency_capture);
    read(j, "ts", r.timestamp_LIMELIGHT_publish);
    read(j, "ts_rio", r.timestamp_RIOFPGA_capture);

    // Validity is sent as 0/1 but accept a boolean too
    auto v = j.find("v");
    if (v != j.end()) {
        if (v->is_boolean()) {
            r.valid = v->get<bool>();
        } else if (v->is_number()) {
            r.valid = v->get<double>() != 0.0;
        }
    }

    read(j, "botpose", r.botpose);
    read(j, "botpose_wpired", r.botpose_wpired);
    read(j, "botpose_wpiblue", r.botpose_wpiblue);
    read(j, "botpose_tagcount", r.botpose_tagcount);
    read(j, "botpose_span", r.botpose_span);
    read(j, "botpose_avgdist", r.botpose_avgdist);
    read(j, "botpose_avgarea", r.botpose_avgarea);
    read(j, "t6c_rs", r.camerapose_robotspace);

    read(j, "Retro", r.targets_Retro);
    read(j, "Fiducial", r.targets_Fiducials);
    read(j, "Classifier", r.targets_Classifier);
    read(j, "Detector", r.targets_Detector);
    read(j, "Barcode", r.targets_Barcode);
}

PipelineResult ll::codec::parseResults(const std::string &text) {
    LL_PROFILE_SCOPE("parseResults");

    auto j = json::parse(text);
    if (!j.is_object()) {
        throw LL_Error("Results are not a JSON object");
    }

    return j.get<PipelineResult>();
}
