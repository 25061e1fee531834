#include "execguard/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    execguard::cli::App app;
    return app.run(argc, argv);
}
