// Turtle - Canvas Implementation
// Pen state machine that records moves as path actions

#include <turtle/canvas.h>
#include <turtle/errors.h>
#include <cmath>
#include <string>

namespace turtle {

static constexpr double PI = 3.14159265358979323846;

double normalizeAngle(double degrees) {
    double a = std::fmod(degrees, 360.0);
    if (a < 0.0) {
        a += 360.0;
    }
    // -1e-15 + 360 rounds to 360
    if (a >= 360.0) {
        a = 0.0;
    }
    return a;
}

Canvas::Canvas(const Session& session)
    : m_session(session)
{
    resetState();
}

// -------------------------------------------------------------------------
// Guards
// -------------------------------------------------------------------------

void Canvas::requireMutable(const char* operation) const {
    if (m_session.isFragile()) {
        throw IrreversibleOperationError(operation);
    }
}

void Canvas::requireFinite(const char* operation, double value) {
    if (!std::isfinite(value)) {
        throw TypeMismatchError(std::string(operation) + ": expected a finite number, not " +
                                std::to_string(value));
    }
}

// -------------------------------------------------------------------------
// Style
// -------------------------------------------------------------------------

void Canvas::setColor(const Color& color) {
    requireMutable("color");
    Move move = seededMove();
    move.m_stroke = color;
    m_moves.push_back(std::move(move));
}

void Canvas::setBackground(const Color& color) {
    requireMutable("bgcolor");
    m_background = color;
}

void Canvas::penDown() {
    requireMutable("pendown");
    m_penDown = true;
}

void Canvas::penUp() {
    requireMutable("penup");
    m_penDown = false;
}

void Canvas::setPixelSize(double size) {
    requireMutable("pixelsize");
    requireFinite("pixelsize", size);
    m_pixelSize = size;
}

// -------------------------------------------------------------------------
// Motion
// -------------------------------------------------------------------------

void Canvas::moveTo(double x, double y) {
    requireMutable("setposition");
    requireFinite("setposition", x);
    requireFinite("setposition", y);
    appendPosition(x, y);
}

void Canvas::forward(double distance) {
    requireMutable("forward");
    requireFinite("forward", distance);
    double radians = m_angle / 360.0 * 2.0 * PI;
    appendPosition(m_position.x + distance * std::cos(radians),
                   m_position.y + distance * std::sin(radians));
}

void Canvas::rotateBy(double degrees) {
    requireMutable("rotate");
    requireFinite("rotate", degrees);
    m_angle = normalizeAngle(m_angle - degrees);
}

void Canvas::rotateTo(double heading) {
    requireMutable("setheading");
    requireFinite("setheading", heading);
    m_angle = normalizeAngle(heading - 90.0);
}

void Canvas::reset() {
    requireMutable("clear");
    resetState();
}

void Canvas::appendPosition(double x, double y) {
    if (m_penDown) {
        m_moves.back().append(PathAction::lineTo(x, y));
    } else {
        m_moves.back().append(PathAction::moveTo(x, y));
    }
    m_position = {x, y};
}

void Canvas::resetState() {
    m_position = {0.0, 0.0};
    m_angle = DEFAULT_ANGLE;
    m_background = Color::white();
    m_penDown = true;
    m_pixelSize = 1.0;
    m_moves.clear();
    m_moves.push_back(seededMove());
}

Move Canvas::seededMove() const {
    Move move(Color::black(), Color::transparent(), DEFAULT_THICKNESS);
    move.append(PathAction::moveTo(m_position.x, m_position.y));
    return move;
}

// -------------------------------------------------------------------------
// Region fill
// -------------------------------------------------------------------------

void Canvas::fillRect(double, double, const Color&) {
    requireMutable("pixel");
    throw NotImplementedError("pixel");
}

void Canvas::beginFill() {
    requireMutable("begin_fill");
    throw NotImplementedError("fill");
}

void Canvas::endFill() {
    requireMutable("end_fill");
    throw NotImplementedError("fill");
}

void Canvas::circle(double, double) {
    requireMutable("circle");
    throw NotImplementedError("circle");
}

// -------------------------------------------------------------------------
// Export
// -------------------------------------------------------------------------

DrawingExport Canvas::exportDrawing() const {
    DrawingExport out{{}, m_background};
    out.path.reserve(m_moves.size());
    for (const auto& move : m_moves) {
        out.path.push_back(move.exportMove());
    }
    return out;
}

} // namespace turtle
