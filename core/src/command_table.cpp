// Command Table Implementation
// Built-in turtle commands, aliases and operand checks

#include <turtle/command_table.h>
#include <turtle/errors.h>
#include <turtle/path.h>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iostream>

namespace turtle {

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::string valueToString(const Value& value) {
    if (const double* d = std::get_if<double>(&value)) {
        return formatNumber(*d);
    }
    return "\"" + std::get<std::string>(value) + "\"";
}

double numberArg(const std::vector<Value>& args, size_t i) {
    const Value& v = args.at(i);
    if (const double* d = std::get_if<double>(&v)) {
        return *d;
    }
    throw TypeMismatchError("Expected operand to be Number, not " + valueToString(v));
}

const std::string& stringArg(const std::vector<Value>& args, size_t i) {
    const Value& v = args.at(i);
    if (const std::string* s = std::get_if<std::string>(&v)) {
        return *s;
    }
    throw TypeMismatchError("Expected a String or Symbol, received " + valueToString(v));
}

// -------------------------------------------------------------------------
// CommandTable
// -------------------------------------------------------------------------

CommandTable::CommandTable(Canvas& canvas)
    : m_canvas(canvas)
{
    registerBuiltins();
}

void CommandTable::registerCommand(CommandSpec spec) {
    spec.name = toLower(spec.name);
    for (auto& alias : spec.aliases) {
        alias = toLower(alias);
    }

    // Every existing command that owns one of the new names is replaced
    std::vector<size_t> replaced;
    auto collect = [&](const std::string& key) {
        auto it = m_index.find(key);
        if (it != m_index.end() &&
            std::find(replaced.begin(), replaced.end(), it->second) == replaced.end()) {
            replaced.push_back(it->second);
        }
    };
    collect(spec.name);
    for (const auto& alias : spec.aliases) {
        collect(alias);
    }

    if (replaced.empty()) {
        m_commands.push_back(std::move(spec));
        size_t slot = m_commands.size() - 1;
        const CommandSpec& stored = m_commands[slot];
        m_index[stored.name] = slot;
        for (const auto& alias : stored.aliases) {
            m_index[alias] = slot;
        }
        return;
    }

    // The new command takes the earliest replaced slot; the rest are dropped
    std::sort(replaced.begin(), replaced.end());
    if (m_verbose) {
        for (size_t slot : replaced) {
            std::cerr << "[turtle] replacing command '" << m_commands[slot].name
                      << "' with '" << spec.name << "'\n";
        }
    }
    m_commands[replaced.front()] = std::move(spec);
    for (auto it = replaced.rbegin(); it != replaced.rend() - 1; ++it) {
        m_commands.erase(m_commands.begin() + static_cast<std::ptrdiff_t>(*it));
    }
    rebuildIndex();
}

void CommandTable::rebuildIndex() {
    m_index.clear();
    for (size_t slot = 0; slot < m_commands.size(); ++slot) {
        m_index[m_commands[slot].name] = slot;
        for (const auto& alias : m_commands[slot].aliases) {
            m_index[alias] = slot;
        }
    }
}

const CommandSpec* CommandTable::find(const std::string& name) const {
    auto it = m_index.find(toLower(name));
    if (it == m_index.end()) {
        return nullptr;
    }
    return &m_commands[it->second];
}

bool CommandTable::has(const std::string& name) const {
    return find(name) != nullptr;
}

std::vector<std::string> CommandTable::names() const {
    std::vector<std::string> out;
    out.reserve(m_commands.size());
    for (const auto& cmd : m_commands) {
        out.push_back(cmd.name);
    }
    return out;
}

std::optional<Value> CommandTable::execute(const std::string& name, const std::vector<Value>& args) {
    const CommandSpec* cmd = find(name);
    if (!cmd) {
        if (m_verbose) {
            std::cerr << "[turtle] Unknown command '" << name << "'\n";
        }
        throw UnknownCommandError(name);
    }

    try {
        if (cmd->minArgs == cmd->maxArgs && args.size() != cmd->minArgs) {
            throw ArityError(cmd->name + " expected " + std::to_string(cmd->minArgs) +
                             " operands, received " + std::to_string(args.size()) + ".");
        }
        if (args.size() < cmd->minArgs) {
            throw ArityError(cmd->name + " expected at least " + std::to_string(cmd->minArgs) +
                             " operands, received " + std::to_string(args.size()) + ".");
        }
        if (args.size() > cmd->maxArgs) {
            throw ArityError(cmd->name + " expected at most " + std::to_string(cmd->maxArgs) +
                             " operands, received " + std::to_string(args.size()) + ".");
        }
        return cmd->handler(args);
    } catch (const TurtleError& e) {
        if (m_verbose) {
            std::cerr << "[turtle] " << cmd->name << " failed (" << errorKindName(e.kind())
                      << "): " << e.what() << "\n";
        }
        throw;
    }
}

// -------------------------------------------------------------------------
// Built-in commands
// -------------------------------------------------------------------------

void CommandTable::registerBuiltins() {
    auto none = [](auto&& fn) {
        return [fn](const std::vector<Value>& args) -> std::optional<Value> {
            fn(args);
            return std::nullopt;
        };
    };

    // --- Motion ---
    registerCommand({"forward", {"fd"}, 1, 1, "Move forward along the heading",
        none([&c = m_canvas](const auto& a) { c.forward(numberArg(a, 0)); })});
    registerCommand({"backward", {"back", "bk"}, 1, 1, "Move backward along the heading",
        none([&c = m_canvas](const auto& a) { c.forward(-numberArg(a, 0)); })});
    registerCommand({"left", {"lt"}, 1, 1, "Turn left by degrees",
        none([&c = m_canvas](const auto& a) { c.rotateBy(numberArg(a, 0)); })});
    registerCommand({"right", {"rt"}, 1, 1, "Turn right by degrees",
        none([&c = m_canvas](const auto& a) { c.rotateBy(-numberArg(a, 0)); })});
    registerCommand({"setheading", {"seth"}, 1, 1, "Set the compass heading (0 = up, clockwise)",
        none([&c = m_canvas](const auto& a) { c.rotateTo(numberArg(a, 0)); })});
    registerCommand({"setposition", {"setpos", "goto"}, 2, 2, "Move to an absolute position",
        none([&c = m_canvas](const auto& a) {
            double x = numberArg(a, 0);
            double y = numberArg(a, 1);
            c.moveTo(x, y);
        })});

    // --- Pen ---
    registerCommand({"pendown", {"pd"}, 0, 0, "Lower the pen",
        none([&c = m_canvas](const auto&) { c.penDown(); })});
    registerCommand({"penup", {"pu"}, 0, 0, "Raise the pen",
        none([&c = m_canvas](const auto&) { c.penUp(); })});
    registerCommand({"color", {}, 1, 1, "Start a new path in the given stroke color",
        none([&c = m_canvas](const auto& a) { c.setColor(resolveColor(stringArg(a, 0))); })});
    registerCommand({"bgcolor", {}, 1, 1, "Set the background color",
        none([&c = m_canvas](const auto& a) { c.setBackground(resolveColor(stringArg(a, 0))); })});
    registerCommand({"pixelsize", {}, 1, 1, "Set the size unit",
        none([&c = m_canvas](const auto& a) { c.setPixelSize(numberArg(a, 0)); })});
    registerCommand({"clear", {}, 0, 0, "Reset the canvas",
        none([&c = m_canvas](const auto&) { c.reset(); })});

    // --- Region fill (reserved) ---
    registerCommand({"pixel", {}, 3, 3, "Fill a pixel (not implemented)",
        none([&c = m_canvas](const auto& a) {
            double x = numberArg(a, 0);
            double y = numberArg(a, 1);
            c.fillRect(x, y, resolveColor(stringArg(a, 2)));
        })});
    registerCommand({"begin_fill", {}, 0, 0, "Begin a filled region (not implemented)",
        none([&c = m_canvas](const auto&) { c.beginFill(); })});
    registerCommand({"end_fill", {}, 0, 0, "End a filled region (not implemented)",
        none([&c = m_canvas](const auto&) { c.endFill(); })});
    registerCommand({"circle", {}, 1, 2, "Draw a circle or arc (not implemented)",
        none([&c = m_canvas](const auto& a) {
            double radius = numberArg(a, 0);
            double extent = a.size() > 1 ? numberArg(a, 1) : 360.0;
            c.circle(radius, extent);
        })});

    // --- Values ---
    registerCommand({"rgb", {}, 3, 3, "Compose a hex color from components in [0, 1]",
        [](const std::vector<Value>& a) -> std::optional<Value> {
            return Value(rgbHex(numberArg(a, 0), numberArg(a, 1), numberArg(a, 2)));
        }});
    registerCommand({"screen_width", {}, 0, 0, "Width of the drawing surface",
        [](const std::vector<Value>&) -> std::optional<Value> {
            return Value(Canvas::screenWidth());
        }});
    registerCommand({"screen_height", {}, 0, 0, "Height of the drawing surface",
        [](const std::vector<Value>&) -> std::optional<Value> {
            return Value(Canvas::screenHeight());
        }});
}

} // namespace turtle
