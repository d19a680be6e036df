#include "hubtrace/app.hpp"

#include <cstdio>
#include <exception>

int main(int argc, char *argv[]) {
    try {
        hubtrace::App app;
        return app.run(argc, argv);
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[hubtrace] Fatal: %s\n", e.what());
        return 1;
    }
}
