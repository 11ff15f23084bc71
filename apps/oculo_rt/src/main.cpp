#include "oculo_rt/app.hpp"
#include <cstdlib>
#include <exception>
#include <spdlog/spdlog.h>

int main(int argc, char **argv) {
    try {
        oculo_rt::App app(argc, argv);
        app.Launch();
    } catch (const std::exception &e) {
        spdlog::critical("Uncaught exception: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
