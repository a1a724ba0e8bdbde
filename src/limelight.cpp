/**
 * @file limelight.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <ll/limelight.hpp>
#include <ll/threads.hpp>

#include <loguru.hpp>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

ctpl::thread_pool ll::pool(LL_POOL_SIZE);

void ll::set_thread_name(const std::string& name) {
    #if TRACY_ENABLE
    tracy::SetThreadName(name.c_str());
    #else
    loguru::set_thread_name(name.c_str());
    #endif
}

std::string ll::version() {
    return LL_VERSION;
}
