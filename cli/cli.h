// Turtle CLI Commands
// Handles: turtle run, turtle color, turtle rgb, turtle commands, turtle --version

#pragma once

#include <string>

namespace turtle::cli {

// Version info
constexpr const char* VERSION = "0.1.0";

// Options for 'turtle run'
struct RunConfig {
    std::string programPath;  // JSON program to replay
    std::string outputPath;   // Export JSON destination (empty = stdout)
    std::string svgPath;      // Optional SVG destination
    int indent = 2;           // JSON indent (-1 = compact)
    bool verbose = false;     // Log failing commands
};

// Parse arguments and run the selected subcommand
// Returns the process exit code
int handleCommand(int argc, char** argv);

// Replay a program and write its export
int runProgramFile(const RunConfig& config);

// Print the normalized form of a color token
int printColor(const std::string& token);

// Print the hex color of three components in [0, 1]
int printRgb(double r, double g, double b);

// List registered commands and their aliases
int printCommands(bool asJson);

} // namespace turtle::cli
