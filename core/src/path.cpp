// Turtle - Path Implementation

#include <turtle/path.h>
#include <charconv>

namespace turtle {

char opcode(PathActionType type) {
    switch (type) {
        case PathActionType::MoveTo:    return 'M';
        case PathActionType::LineTo:    return 'L';
        case PathActionType::ClosePath: return 'Z';
    }
    return '?';
}

std::string formatNumber(double value) {
    if (value == 0.0) {
        return "0";  // also covers -0.0
    }

    // Shortest round-trip form of a double is at most 24 chars
    char buf[32];
    auto result = std::to_chars(buf, buf + sizeof(buf), value);
    return std::string(buf, result.ptr);
}

std::string formatAction(const PathAction& action) {
    std::string out(1, opcode(action.type));
    for (double p : action.params) {
        out += ' ';
        out += formatNumber(p);
    }
    return out;
}

std::string joinActions(const std::vector<PathAction>& actions) {
    std::string out;
    for (size_t i = 0; i < actions.size(); ++i) {
        if (i > 0) out += ' ';
        out += formatAction(actions[i]);
    }
    return out;
}

} // namespace turtle
