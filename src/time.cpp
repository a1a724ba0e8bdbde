/**
 * @file time.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <chrono>
#include <ll/time.hpp>

using std::chrono::time_point_cast;
using std::chrono::microseconds;
using std::chrono::high_resolution_clock;

int64_t ll::time::get_time_micro() {
    return time_point_cast<microseconds>(high_resolution_clock::now()).time_since_epoch().count();
}
