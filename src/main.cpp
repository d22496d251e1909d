#include "ssrflab/cli/app.hpp"

int main(int argc, char** argv) {
    ssrflab::cli::App app;
    return app.run(argc, argv);
}
