// Turtle - Entry Point
// Parses command-line arguments and runs the selected subcommand

#include "cli.h"

int main(int argc, char** argv) {
    return turtle::cli::handleCommand(argc, argv);
}
