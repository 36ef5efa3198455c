#include "nekrobox/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    nekrobox::cli::App app;
    return app.run(argc, argv);
}
