// Turtle CLI Commands
// Handles: turtle run, turtle color, turtle rgb, turtle commands, turtle --help, turtle --version

#include "cli.h"
#include <turtle/turtle.h>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <vector>

using json = nlohmann::json;

namespace turtle::cli {

static bool writeTextFile(const std::string& path, const std::string& text) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[turtle] Failed to write: " << path << "\n";
        return false;
    }
    file << text;
    if (!file) {
        std::cerr << "[turtle] Write error: " << path << "\n";
        return false;
    }
    return true;
}

int runProgramFile(const RunConfig& config) {
    std::ifstream file(config.programPath);
    if (!file.is_open()) {
        std::cerr << "[turtle] Failed to open: " << config.programPath << "\n";
        return 1;
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        std::cerr << "[turtle] Parse error in " << config.programPath << ": " << e.what() << "\n";
        return 1;
    }

    Session session(config.programPath);
    Canvas canvas(session);
    CommandTable commands(canvas);
    commands.setVerbose(config.verbose);

    try {
        auto program = loadProgram(document);
        size_t executed = runProgram(commands, program);
        if (config.verbose) {
            std::cerr << "[turtle] Executed " << executed << " commands, "
                      << canvas.moves().size() << " moves\n";
        }
    } catch (const TurtleError& e) {
        std::cerr << "[turtle] " << errorKindName(e.kind()) << ": " << e.what() << "\n";
        return 1;
    }

    DrawingExport drawing = canvas.exportDrawing();
    std::string exported = toJson(drawing).dump(config.indent) + "\n";

    if (config.outputPath.empty()) {
        std::cout << exported;
    } else {
        if (!writeTextFile(config.outputPath, exported)) return 1;
        std::cout << "[turtle] Wrote " << config.outputPath << "\n";
    }

    if (!config.svgPath.empty()) {
        if (!writeTextFile(config.svgPath, toSvg(drawing))) return 1;
        std::cout << "[turtle] Wrote " << config.svgPath << "\n";
    }
    return 0;
}

int printColor(const std::string& token) {
    try {
        std::cout << resolveColor(token) << "\n";
        return 0;
    } catch (const InvalidColorError& e) {
        std::cerr << "[turtle] " << e.what() << "\n";
        return 1;
    }
}

int printRgb(double r, double g, double b) {
    try {
        std::cout << rgbHex(r, g, b) << "\n";
        return 0;
    } catch (const DomainRangeError& e) {
        std::cerr << "[turtle] " << e.what() << "\n";
        return 1;
    }
}

int printCommands(bool asJson) {
    Session session;
    Canvas canvas(session);
    CommandTable commands(canvas);

    if (asJson) {
        json out = json::array();
        for (const auto& name : commands.names()) {
            const CommandSpec* spec = commands.find(name);
            out.push_back(json{
                {"name", spec->name},
                {"aliases", spec->aliases},
                {"minArgs", spec->minArgs},
                {"maxArgs", spec->maxArgs},
                {"description", spec->description},
            });
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    auto names = commands.names();
    std::cout << "Available commands (" << names.size() << "):\n\n";
    for (const auto& name : names) {
        const CommandSpec* spec = commands.find(name);
        std::cout << "  " << spec->name;
        for (const auto& alias : spec->aliases) {
            std::cout << ", " << alias;
        }
        std::cout << " - " << spec->description << "\n";
    }
    return 0;
}

int handleCommand(int argc, char** argv) {
    CLI::App app{"Turtle - vector path recorder for turtle graphics programs"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");
    app.require_subcommand(1);

    // 'run' subcommand
    RunConfig runConfig;
    auto* runCmd = app.add_subcommand("run", "Replay a JSON program and export the drawing");
    runCmd->add_option("program", runConfig.programPath, "Program file (JSON array of commands)")
          ->required()
          ->check(CLI::ExistingFile);
    runCmd->add_option("-o,--output", runConfig.outputPath, "Export JSON path (default: stdout)");
    runCmd->add_option("--svg", runConfig.svgPath, "Also write an SVG document");
    runCmd->add_option("--indent", runConfig.indent, "JSON indent, -1 for compact")
          ->default_val(2);
    runCmd->add_flag("--verbose", runConfig.verbose, "Log failing commands");

    // 'color' subcommand
    std::string colorToken;
    auto* colorCmd = app.add_subcommand("color", "Normalize a named or hex color");
    colorCmd->add_option("token", colorToken, "Color name or #rgb/#rrggbb")->required();

    // 'rgb' subcommand
    std::vector<double> rgb;
    auto* rgbCmd = app.add_subcommand("rgb", "Compose a hex color from components in [0, 1]");
    rgbCmd->add_option("components", rgb, "Red, green and blue")->required()->expected(3);

    // 'commands' subcommand
    bool commandsJson = false;
    auto* commandsCmd = app.add_subcommand("commands", "List available commands");
    commandsCmd->add_flag("--json", commandsJson, "Output as JSON");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (runCmd->parsed()) {
        return runProgramFile(runConfig);
    }
    if (colorCmd->parsed()) {
        return printColor(colorToken);
    }
    if (rgbCmd->parsed()) {
        return printRgb(rgb[0], rgb[1], rgb[2]);
    }
    if (commandsCmd->parsed()) {
        return printCommands(commandsJson);
    }
    return 0;
}

} // namespace turtle::cli
