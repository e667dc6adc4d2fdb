#pragma once

/**
 * @file drawing_io.h
 * @brief JSON/SVG serialization of drawings and JSON command programs
 *
 * Export JSON shape:
 * @code
 * {
 *   "path": [ { "seq": "M 0 0 L 0 -100", "stroke": "black", "fill": "transparent" } ],
 *   "bgColor": "#ffffff"
 * }
 * @endcode
 *
 * A program is a JSON array of commands, each an array whose first element is
 * the command name and whose remaining elements are operands:
 * @code
 * [ ["color", "red"], ["fd", 100], ["rt", 90], ["fd", 100] ]
 * @endcode
 */

#include <turtle/canvas.h>
#include <turtle/command_table.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace turtle {

/// @brief One command of a program
struct ProgramStep {
    std::string name;
    std::vector<Value> args;
};

/// @brief Export snapshot as JSON
nlohmann::json toJson(const DrawingExport& drawing);

/**
 * @brief Export snapshot as a standalone SVG document
 * @param size Side of the square viewBox, centered on the origin
 */
std::string toSvg(const DrawingExport& drawing, double size = Canvas::SIZE);

/**
 * @brief Parse a program from JSON
 * @throw TypeMismatchError if the document is not an array of
 *        ["name", number|string...] arrays
 */
std::vector<ProgramStep> loadProgram(const nlohmann::json& program);

/**
 * @brief Execute every step in order
 *
 * Stops at the first failing step and rethrows its error. Results of
 * value-producing commands are discarded.
 * @return Number of steps executed
 */
size_t runProgram(CommandTable& commands, const std::vector<ProgramStep>& program);

} // namespace turtle
