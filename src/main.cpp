#include "llmgate/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    llmgate::cli::App app;
    return app.run(argc, argv);
}
