#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include <ll/threads.hpp>

/** Stop thread pool before main() returns. */
int main(int argc, char** argv) {
    try {
        auto retval = Catch::Session().run(argc, argv);
        ll::pool.stop();
        return retval;
    }
    catch (const std::exception& ex) {
        return -1;
    }
}
