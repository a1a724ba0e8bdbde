/**
 * @file raw.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

namespace ll {
namespace targets {

/**
 * @brief One AprilTag detection from the `rawfiducials` entry or from the tail
 * of a pose estimate array.
 *
 */
struct RawFiducialTarget {
    int id = 0;
    double txnc = 0.0;          // Horizontal offset from principal pixel, degrees
    double tync = 0.0;          // Vertical offset from principal pixel, degrees
    double ta = 0.0;            // Area, percent of image
    double distToCamera = 0.0;  // Meters
    double distToRobot = 0.0;   // Meters
    double ambiguity = 0.0;
};

/**
 * @brief One neural detector result from the `rawdetections` entry. Corners
 * are in pixels.
 *
 */
struct RawDetection {
    int classId = 0;
    double txnc = 0.0;
    double tync = 0.0;
    double ta = 0.0;
    double corner0_X = 0.0;
    double corner0_Y = 0.0;
    double corner1_X = 0.0;
    double corner1_Y = 0.0;
    double corner2_X = 0.0;
    double corner2_Y = 0.0;
    double corner3_X = 0.0;
    double corner3_Y = 0.0;
};

}  // namespace targets
}  // namespace ll
