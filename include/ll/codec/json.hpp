/**
 * @file json.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 *
 * JSON conversion of pipeline results. Missing fields keep their default
 * values and unknown fields are ignored.
 */

#pragma once

#include <string>
#include <nlohmann/json_fwd.hpp>
#include <ll/pipeline_result.hpp>

namespace ll {

void from_json(const nlohmann::json &j, ll::PipelineResult &r);

namespace targets {

void from_json(const nlohmann::json &j, RetroreflectiveTarget &t);
void from_json(const nlohmann::json &j, FiducialTarget &t);
void from_json(const nlohmann::json &j, ClassifierTarget &t);
void from_json(const nlohmann::json &j, DetectorTarget &t);
void from_json(const nlohmann::json &j, BarcodeTarget &t);

}  // namespace targets

namespace codec {

/**
 * @brief Decode a results document.
 *
 * @param json Text of the `json` table entry
 * @return PipelineResult
 * @throws nlohmann::json::exception on malformed JSON or mistyped fields
 * @throws ll::exception if the document is not an object
 */
ll::PipelineResult parseResults(const std::string &json);

}  // namespace codec
}  // namespace ll
