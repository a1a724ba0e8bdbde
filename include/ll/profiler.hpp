/**
 * @file profiler.hpp
 * @copyright Copyright (c) 2020-2022 University of Turku, MIT License
 */

#pragma once

#include <ll/config.h>

#ifdef TRACY_ENABLE

#include <tracy/Tracy.hpp>

#define LL_PROFILE_SCOPE(LABEL) ZoneScopedN(LABEL)

#else  // TRACY_ENABLE

#define LL_PROFILE_SCOPE(LABEL) {}

#endif  // TRACY_ENABLE
