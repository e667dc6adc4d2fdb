#pragma once

/**
 * @file canvas.h
 * @brief Turtle canvas: pen state machine that records vector paths
 *
 * Canvas tracks a turtle (position, heading, pen state) and records every
 * position change as a path action in the current Move. Nothing is
 * rasterized; exportDrawing() returns an SVG-path-compatible description
 * that any renderer can draw.
 *
 * Coordinates are origin-relative with +y pointing down the screen, as in
 * SVG. Headings are stored in degrees in [0, 360) with 0 along +x; a freshly
 * reset turtle faces -y (270).
 *
 * @par Example
 * @code
 * Session session;
 * Canvas canvas(session);
 * canvas.forward(100);                 // L 0 -100 (approximately)
 * canvas.rotateBy(-90);                // turn right
 * canvas.setColor(resolveColor("red"));
 * canvas.forward(50);
 * DrawingExport drawing = canvas.exportDrawing();
 * @endcode
 */

#include <turtle/color.h>
#include <turtle/move.h>
#include <turtle/session.h>
#include <glm/glm.hpp>
#include <vector>

namespace turtle {

/// @brief Renderer-facing snapshot of a Canvas
struct DrawingExport {
    std::vector<MoveExport> path;
    Color bgColor;
};

class Canvas {
public:
    /// Side length of the square drawing surface
    static constexpr double SIZE = 1000.0;
    /// Heading after reset(), in degrees
    static constexpr double DEFAULT_ANGLE = 270.0;
    static constexpr double DEFAULT_THICKNESS = 1.0;

    /**
     * @brief Create a canvas bound to a session, in its reset state
     *
     * The session must outlive the canvas. Construction does not consult the
     * fragile flag.
     */
    explicit Canvas(const Session& session);

    Canvas(const Canvas&) = delete;
    Canvas& operator=(const Canvas&) = delete;

    // -------------------------------------------------------------------------
    // Style
    // -------------------------------------------------------------------------

    /**
     * @brief Start a new Move with the given stroke color
     *
     * The new Move is seeded with a move-to at the current position, so each
     * Move is drawn in exactly one color.
     */
    void setColor(const Color& color);

    /// @brief Set the background color (no effect on moves)
    void setBackground(const Color& color);

    void penDown();
    void penUp();

    /// @brief Set the size unit ("pixelsize"). Stored only.
    void setPixelSize(double size);

    // -------------------------------------------------------------------------
    // Motion
    // -------------------------------------------------------------------------

    /**
     * @brief Move to an absolute position
     *
     * Appends "L x y" when the pen is down and "M x y" when it is up. The
     * action is appended even if the position does not change.
     */
    void moveTo(double x, double y);

    /// @brief Move along the current heading (negative distance moves backward)
    void forward(double distance);

    /// @brief Subtract degrees from the heading. Positive values turn left on screen.
    void rotateBy(double degrees);

    /**
     * @brief Set an absolute compass heading
     *
     * 0 faces up the screen (the reset heading) and headings grow clockwise,
     * so 90 faces +x. Stored internally as (heading - 90) mod 360.
     */
    void rotateTo(double heading);

    /// @brief Restore every default and replace all moves with one seeded Move
    void reset();

    // -------------------------------------------------------------------------
    // Region fill (reserved)
    // -------------------------------------------------------------------------

    /// @throw NotImplementedError always (after the fragile check)
    void fillRect(double x, double y, const Color& color);
    /// @throw NotImplementedError always (after the fragile check)
    void beginFill();
    /// @throw NotImplementedError always (after the fragile check)
    void endFill();
    /// @throw NotImplementedError always (after the fragile check)
    void circle(double radius, double extent = 360.0);

    // -------------------------------------------------------------------------
    // Export and queries
    // -------------------------------------------------------------------------

    /// @brief Copy of every Move's path and style plus the background color
    DrawingExport exportDrawing() const;

    glm::dvec2 position() const { return m_position; }
    double x() const { return m_position.x; }
    double y() const { return m_position.y; }
    double angle() const { return m_angle; }
    bool isPenDown() const { return m_penDown; }
    const Color& backgroundColor() const { return m_background; }
    double pixelSize() const { return m_pixelSize; }
    const std::vector<Move>& moves() const { return m_moves; }
    const Move& activeMove() const { return m_moves.back(); }
    const Session& session() const { return m_session; }

    static constexpr double screenWidth() { return SIZE; }
    static constexpr double screenHeight() { return SIZE; }

private:
    // Throws IrreversibleOperationError when the session is fragile
    void requireMutable(const char* operation) const;
    static void requireFinite(const char* operation, double value);

    void resetState();
    void appendPosition(double x, double y);
    Move seededMove() const;

    const Session& m_session;

    glm::dvec2 m_position{0.0, 0.0};
    double m_angle = DEFAULT_ANGLE;
    Color m_background = Color::white();
    bool m_penDown = true;
    double m_pixelSize = 1.0;
    std::vector<Move> m_moves;
};

/// @brief Normalize degrees into [0, 360)
double normalizeAngle(double degrees);

} // namespace turtle
