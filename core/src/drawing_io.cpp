// Drawing I/O Implementation
// JSON/SVG export and JSON program loading

#include <turtle/drawing_io.h>
#include <turtle/errors.h>
#include <turtle/path.h>
#include <sstream>

namespace turtle {

using json = nlohmann::json;

json toJson(const DrawingExport& drawing) {
    json path = json::array();
    for (const auto& move : drawing.path) {
        path.push_back(json{
            {"seq", move.seq},
            {"stroke", move.stroke.str()},
            {"fill", move.fill.str()},
        });
    }
    return json{
        {"path", path},
        {"bgColor", drawing.bgColor.str()},
    };
}

std::string toSvg(const DrawingExport& drawing, double size) {
    std::string half = formatNumber(-size / 2.0);
    std::string side = formatNumber(size);

    std::ostringstream svg;
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\""
        << half << " " << half << " " << side << " " << side << "\""
        << " width=\"" << side << "\" height=\"" << side << "\">\n";
    svg << "  <rect x=\"" << half << "\" y=\"" << half << "\" width=\"" << side
        << "\" height=\"" << side << "\" fill=\"" << drawing.bgColor.str() << "\"/>\n";
    for (const auto& move : drawing.path) {
        // Colors and path text never contain markup characters
        svg << "  <path d=\"" << move.seq << "\" stroke=\"" << move.stroke.str()
            << "\" fill=\"" << move.fill.str() << "\"/>\n";
    }
    svg << "</svg>\n";
    return svg.str();
}

std::vector<ProgramStep> loadProgram(const json& program) {
    if (!program.is_array()) {
        throw TypeMismatchError("Program must be a JSON array of commands");
    }

    std::vector<ProgramStep> steps;
    steps.reserve(program.size());
    for (size_t i = 0; i < program.size(); ++i) {
        const json& entry = program[i];
        if (!entry.is_array() || entry.empty() || !entry[0].is_string()) {
            throw TypeMismatchError("Step " + std::to_string(i) +
                                    ": expected [\"name\", operands...], received " + entry.dump());
        }

        ProgramStep step;
        step.name = entry[0].get<std::string>();
        for (size_t j = 1; j < entry.size(); ++j) {
            const json& operand = entry[j];
            if (operand.is_number()) {
                step.args.emplace_back(operand.get<double>());
            } else if (operand.is_string()) {
                step.args.emplace_back(operand.get<std::string>());
            } else {
                throw TypeMismatchError("Step " + std::to_string(i) + " (" + step.name +
                                        "): unsupported operand " + operand.dump());
            }
        }
        steps.push_back(std::move(step));
    }
    return steps;
}

size_t runProgram(CommandTable& commands, const std::vector<ProgramStep>& program) {
    size_t executed = 0;
    for (const auto& step : program) {
        commands.execute(step.name, step.args);
        ++executed;
    }
    return executed;
}

} // namespace turtle
