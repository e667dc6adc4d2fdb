#pragma once

/**
 * @file path.h
 * @brief Path actions and their SVG-compatible text form
 */

#include <string>
#include <vector>

namespace turtle {

/// @brief Path action opcodes (absolute coordinates only)
enum class PathActionType {
    MoveTo,   ///< "M x y"
    LineTo,   ///< "L x y"
    ClosePath ///< "Z"
};

/// @brief A single path action with its parameters
struct PathAction {
    PathActionType type;
    std::vector<double> params;

    static PathAction moveTo(double x, double y) { return {PathActionType::MoveTo, {x, y}}; }
    static PathAction lineTo(double x, double y) { return {PathActionType::LineTo, {x, y}}; }
    static PathAction closePath() { return {PathActionType::ClosePath, {}}; }

    bool operator==(const PathAction& other) const {
        return type == other.type && params == other.params;
    }
};

/// @brief Opcode letter for an action type ('M', 'L' or 'Z')
char opcode(PathActionType type);

/**
 * @brief Format a path parameter
 *
 * Shortest decimal text that round-trips to the same double, produced by
 * std::to_chars so the output never depends on the C locale. Integral values
 * print without a fractional part ("100"), very small magnitudes may use
 * exponent form ("1e-14"), and negative zero prints as "0".
 */
std::string formatNumber(double value);

/// @brief Token text of one action: "<opcode> <param> <param>"
std::string formatAction(const PathAction& action);

/// @brief Space-joined tokens of a sequence of actions
std::string joinActions(const std::vector<PathAction>& actions);

} // namespace turtle
