// Auroscuro - Entry Point
// Parses command-line arguments and runs the requested command

#include <auroscuro/cli.h>

int main(int argc, char** argv) {
    return auroscuro::cli::handleCommand(argc, argv);
}
