/**
 * @file limelight.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 *
 * Limelight vision camera client.
 */

#pragma once

#include <string>
#include <ll/config.h>
#include <ll/camera.hpp>
#include <ll/data_collator.hpp>
#include <ll/pose_estimator.hpp>
#include <ll/settings.hpp>
#include <ll/nt/memory.hpp>

namespace ll {

/** Library version string. */
std::string version();

}  // namespace ll
