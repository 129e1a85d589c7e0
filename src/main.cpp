#include "steenbok/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    steenbok::cli::App app;
    return app.run(argc, argv);
}
