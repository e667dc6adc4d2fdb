#pragma once

/**
 * @file command_table.h
 * @brief Named turtle commands bound to a Canvas
 *
 * The command table is the dispatch layer in front of a Canvas: it resolves
 * command names and aliases ("fd" -> "forward"), checks operand count and
 * types, resolves color operands, and calls one Canvas method per command.
 *
 * @par Example
 * @code
 * Session session;
 * Canvas canvas(session);
 * CommandTable commands(canvas);
 * commands.execute("fd", {100.0});
 * commands.execute("color", {std::string("red")});
 * auto hex = commands.execute("rgb", {1.0, 0.0, 0.0});  // "#FF0000"
 * @endcode
 */

#include <turtle/canvas.h>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace turtle {

/// @brief Operand or result of a command
using Value = std::variant<double, std::string>;

/// @brief Text form of a value, for diagnostics
std::string valueToString(const Value& value);

/**
 * @brief Metadata and handler for one command
 */
struct CommandSpec {
    std::string name;                  ///< Primary name (e.g., "forward")
    std::vector<std::string> aliases;  ///< Alternative names (e.g., "fd")
    size_t minArgs = 0;
    size_t maxArgs = 0;
    std::string description;

    /// Called with operands whose count is already checked
    std::function<std::optional<Value>(const std::vector<Value>&)> handler;
};

class CommandTable {
public:
    /// @brief Create a table with every built-in turtle command registered
    explicit CommandTable(Canvas& canvas);

    CommandTable(const CommandTable&) = delete;
    CommandTable& operator=(const CommandTable&) = delete;

    /**
     * @brief Register a command
     *
     * Any existing command whose name or alias equals the new name or one of
     * the new aliases is removed entirely, together with all of its aliases.
     * The new command takes the position of the earliest removed command in
     * names(), or is appended when nothing collides.
     */
    void registerCommand(CommandSpec spec);

    /**
     * @brief Run a command by name or alias
     * @return Result for value-producing commands (rgb, screen_width), else nullopt
     * @throw UnknownCommandError, ArityError, TypeMismatchError, or any error
     *        raised by the Canvas or the color resolver
     */
    std::optional<Value> execute(const std::string& name, const std::vector<Value>& args);

    /// @brief True if name is a registered command or alias
    bool has(const std::string& name) const;

    /// @brief Find a command by name or alias
    const CommandSpec* find(const std::string& name) const;

    /// @brief Primary names of all commands, in registration order
    std::vector<std::string> names() const;

    /// @brief Log failing commands to stderr
    void setVerbose(bool verbose) { m_verbose = verbose; }

    Canvas& canvas() { return m_canvas; }

private:
    void registerBuiltins();
    void rebuildIndex();

    Canvas& m_canvas;
    std::vector<CommandSpec> m_commands;
    std::unordered_map<std::string, size_t> m_index;  ///< name or alias -> m_commands slot
    bool m_verbose = false;
};

/// @brief Operand i as a number
/// @throw TypeMismatchError if it is a string
double numberArg(const std::vector<Value>& args, size_t i);

/// @brief Operand i as a string
/// @throw TypeMismatchError if it is a number
const std::string& stringArg(const std::vector<Value>& args, size_t i);

} // namespace turtle
