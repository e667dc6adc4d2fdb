#pragma once

/**
 * @file move.h
 * @brief One contiguous path drawn with a single style
 */

#include <turtle/color.h>
#include <turtle/path.h>
#include <string>
#include <vector>

namespace turtle {

/// @brief Exported form of a Move: path text plus style
struct MoveExport {
    std::string seq;
    Color stroke;
    Color fill;

    bool operator==(const MoveExport& other) const {
        return seq == other.seq && stroke == other.stroke && fill == other.fill;
    }
};

/**
 * @brief A styled run of path actions
 *
 * Style is fixed when the Move is created. Canvas only overwrites the stroke
 * of a Move it has just created, before anything is appended past the seed.
 */
class Move {
public:
    Move(const Color& stroke, const Color& fill, double thickness)
        : m_stroke(stroke), m_fill(fill), m_thickness(thickness) {}

    const Color& stroke() const { return m_stroke; }
    const Color& fill() const { return m_fill; }
    double thickness() const { return m_thickness; }
    const std::vector<PathAction>& actions() const { return m_actions; }

    void append(PathAction action) { m_actions.push_back(std::move(action)); }

    /// @brief Space-joined action tokens in emission order
    std::string pathString() const { return joinActions(m_actions); }

    MoveExport exportMove() const { return {pathString(), m_stroke, m_fill}; }

private:
    friend class Canvas;

    Color m_stroke;
    Color m_fill;
    double m_thickness;
    std::vector<PathAction> m_actions;
};

} // namespace turtle
