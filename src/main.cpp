#include "chatwarden/cli/app.hpp"

int main(int argc, char** argv) {
    chatwarden::cli::App app;
    return app.run(argc, argv);
}
