/**
 * @file barcode.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <string>
#include <vector>

namespace ll {
namespace targets {

/**
 * @brief A decoded barcode or QR code.
 *
 */
struct BarcodeTarget {
    std::string family;
    std::string data;
    double tx_pixels = 0.0;
    double ty_pixels = 0.0;
    double tx = 0.0;
    double ty = 0.0;
    double tx_nocrosshair = 0.0;
    double ty_nocrosshair = 0.0;
    double ta = 0.0;
    std::vector<std::vector<double>> corners;  // Pixel [x, y] per corner
};

}  // namespace targets
}  // namespace ll
