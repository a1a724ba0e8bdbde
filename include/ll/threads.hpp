/**
 * @file threads.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 */

#pragma once

#include <mutex>
#include <shared_mutex>
#include <string>
#include <ctpl_stl.h>

/// consider using DECLARE_MUTEX(name) which allows (optional) profiling
#define MUTEX std::mutex
/// consider using DECLARE_SHARED_MUTEX(name) which allows (optional) profiling
#define SHARED_MUTEX std::shared_mutex

#if defined(TRACY_ENABLE) && defined(DEBUG_LOCKS)

#include <type_traits>
#include <tracy/Tracy.hpp>

#define DECLARE_MUTEX(varname) TracyLockable(MUTEX, varname)
#define DECLARE_SHARED_MUTEX(varname) TracySharedLockable(SHARED_MUTEX, varname)

#define UNIQUE_LOCK(M, L) std::unique_lock<std::remove_reference<decltype(M)>::type> L(M)
#define SHARED_LOCK(M, L) std::shared_lock<std::remove_reference<decltype(M)>::type> L(M)

#else

/// mutex with optional profiling (and debugging) when built with DEBUG_LOCKS.
#define DECLARE_MUTEX(varname) MUTEX varname
/// shared mutex with optional profiling (and debugging) when built with DEBUG_LOCKS
#define DECLARE_SHARED_MUTEX(varname) SHARED_MUTEX varname

#define UNIQUE_LOCK(M, L) std::unique_lock<std::remove_reference<decltype(M)>::type> L(M)
#define SHARED_LOCK(M, L) std::shared_lock<std::remove_reference<decltype(M)>::type> L(M)

#endif  // TRACY_ENABLE

namespace ll {

void set_thread_name(const std::string &name);

/**
 * @brief Shared worker threads for background jobs such as asynchronous
 * snapshot requests. Jobs receive the worker index as their only argument.
 */
extern ctpl::thread_pool pool;

}  // namespace ll
