/**
 * @file main.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <ll/limelight.hpp>
#include <ll/threads.hpp>
#include <loguru.hpp>

int main(int argc, char *argv[]) {
    loguru::init(argc, argv);

    if (argc < 2 || argc > 3) {
        LOG(ERROR) << "Usage: take-snapshot <camera> [snapname]";
        return -1;
    }

    ll::Camera camera(argv[1]);
    std::string snapname = (argc == 3) ? argv[2] : "";

    LOG(INFO) << "limelight " << ll::version() << ", requesting snapshot from "
        << camera.getLimelightURLString(LL_SNAPSHOT_REQUEST).to_string();

    if (!camera.snapshotSynchronous(snapname)) return -1;

    LOG(INFO) << "Snapshot saved";
    ll::pool.stop();
    return 0;
}
