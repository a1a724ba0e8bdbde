/**
 * @file data_collator.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <chrono>
#include <ll/data_collator.hpp>
#include <ll/codec/arrays.hpp>
#include <ll/codec/json.hpp>
#include <ll/exception.hpp>

#include <nlohmann/json.hpp>
#include <loguru.hpp>

using ll::PipelineDataCollator;
using ll::PipelineResult;
using ll::codec::extractArrayEntry;
using ll::codec::toIntSaturating;
using ll::codec::toPose3d;
using std::string;
using std::vector;

namespace {
// Number of values in a complete t2d array
constexpr size_t kT2DSize = 17;
}

PipelineDataCollator::PipelineDataCollator(const ll::nt::TablePtr &table) : table_(table) {
    if (!table_) throw LL_Error("No table for data collator");
}

vector<ll::targets::RawDetection> PipelineDataCollator::getRawDetections() const {
    return ll::codec::decodeRawDetections(table_->getDoubleArray("rawdetections"));
}

vector<ll::targets::RawFiducialTarget> PipelineDataCollator::getRawFiducialTargets() const {
    return ll::codec::decodeRawFiducials(table_->getDoubleArray("rawfiducials"));
}

PipelineResult PipelineDataCollator::getLatestResults(bool showParseTime) const {
    auto start = std::chrono::steady_clock::now();

    PipelineResult result;
    try {
        result = ll::codec::parseResults(getJSONDump());
    } catch (const nlohmann::json::exception &e) {
        result = PipelineResult();
        result.error = string("lljson error: ") + e.what();
    } catch (const ll::exception &e) {
        result = PipelineResult();
        result.error = string("lljson error: ") + e.what();
    }

    auto end = std::chrono::steady_clock::now();
    result.latency_jsonParse = std::chrono::duration<double, std::milli>(end - start).count();

    if (showParseTime) {
        LOG_F(INFO, "lljson: %.2f", result.latency_jsonParse);
    }
    return result;
}

bool PipelineDataCollator::getTV() const {
    return table_->getInteger("tv") == 1;
}

double PipelineDataCollator::getTX() const { return table_->getDouble("tx"); }
double PipelineDataCollator::getTY() const { return table_->getDouble("ty"); }
double PipelineDataCollator::getTXNC() const { return table_->getDouble("txnc"); }
double PipelineDataCollator::getTYNC() const { return table_->getDouble("tync"); }
double PipelineDataCollator::getTA() const { return table_->getDouble("ta"); }

vector<double> PipelineDataCollator::getT2DArray() const {
    return table_->getDoubleArray("t2d");
}

int PipelineDataCollator::getTargetCount() const {
    auto t2d = getT2DArray();
    if (t2d.size() == kT2DSize) {
        return toIntSaturating(t2d[1]);
    }
    return 0;
}

int PipelineDataCollator::getClassifierClassIndex() const {
    auto t2d = getT2DArray();
    if (t2d.size() == kT2DSize) {
        return toIntSaturating(t2d[10]);
    }
    return 0;
}

int PipelineDataCollator::getDetectorClassIndex() const {
    auto t2d = getT2DArray();
    if (t2d.size() == kT2DSize) {
        return toIntSaturating(t2d[11]);
    }
    return 0;
}

string PipelineDataCollator::getClassifierClass() const { return table_->getString("tcclass"); }
string PipelineDataCollator::getDetectorClass() const { return table_->getString("tdclass"); }

double PipelineDataCollator::getLatencyPipeline() const { return table_->getDouble("tl"); }
double PipelineDataCollator::getLatencyCapture() const { return table_->getDouble("cl"); }

double PipelineDataCollator::getCurrentPipelineIndex() const {
    return static_cast<double>(table_->getInteger("getpipe"));
}

string PipelineDataCollator::getCurrentPipelineType() const { return table_->getString("getpipetype"); }
string PipelineDataCollator::getJSONDump() const { return table_->getString("json"); }

ll::Pose3d PipelineDataCollator::getBotPose3dTargetSpace() const {
    return toPose3d(table_->getDoubleArray("botpose_targetspace"));
}

ll::Pose3d PipelineDataCollator::getCameraPose3dTargetSpace() const {
    return toPose3d(table_->getDoubleArray("camerapose_targetspace"));
}

ll::Pose3d PipelineDataCollator::getTargetPose3dCameraSpace() const {
    return toPose3d(table_->getDoubleArray("targetpose_cameraspace"));
}

ll::Pose3d PipelineDataCollator::getTargetPose3dRobotSpace() const {
    return toPose3d(table_->getDoubleArray("targetpose_robotspace"));
}

ll::Pose3d PipelineDataCollator::getCameraPose3dRobotSpace() const {
    return toPose3d(table_->getDoubleArray("camerapose_robotspace"));
}

vector<double> PipelineDataCollator::getStandardDeviations() const { return table_->getDoubleArray("stddevs"); }
vector<double> PipelineDataCollator::getTargetColor() const { return table_->getDoubleArray("tc"); }

double PipelineDataCollator::getFiducialID() const {
    return static_cast<double>(table_->getInteger("tid"));
}

string PipelineDataCollator::getNeuralClassID() const { return table_->getString("tclass"); }

vector<string> PipelineDataCollator::getRawBarcodeData() const {
    return table_->getStringArray("rawbarcodes");
}

vector<double> PipelineDataCollator::getHardwareMetrics() const { return table_->getDoubleArray("hw"); }

double PipelineDataCollator::getFps() const { return extractArrayEntry(getHardwareMetrics(), 0); }
double PipelineDataCollator::getCpuTemperature() const { return extractArrayEntry(getHardwareMetrics(), 1); }
double PipelineDataCollator::getRamUsage() const { return extractArrayEntry(getHardwareMetrics(), 2); }
double PipelineDataCollator::getTemperature() const { return extractArrayEntry(getHardwareMetrics(), 3); }
