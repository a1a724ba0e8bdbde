/**
 * @file time.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <cinttypes>

namespace ll {
namespace time {

/**
 * Get current time in microseconds. Table entries are stamped with this
 * clock when no explicit server time is given.
 */
int64_t get_time_micro();

}  // namespace time
}  // namespace ll
