#include "shellguard/cli/app.hpp"

int main(int argc, char** argv) {
    shellguard::cli::App app;
    return app.run(argc, argv);
}
