/**
 * @file neural.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <string>

namespace ll {
namespace targets {

/**
 * @brief Result of a neural classifier pipeline.
 *
 */
struct ClassifierTarget {
    std::string className;
    double classID = 0.0;
    double confidence = 0.0;
    double zone = 0.0;
    double tx = 0.0;
    double ty = 0.0;
    double tx_pixels = 0.0;
    double ty_pixels = 0.0;
};

/**
 * @brief One object found by a neural detector pipeline.
 *
 */
struct DetectorTarget {
    std::string className;
    double classID = 0.0;
    double confidence = 0.0;
    double ta = 0.0;
    double tx = 0.0;
    double ty = 0.0;
    double tx_pixels = 0.0;
    double ty_pixels = 0.0;
    double tx_nocrosshair = 0.0;
    double ty_nocrosshair = 0.0;
};

}  // namespace targets
}  // namespace ll
