#pragma once

/**
 * @file color.h
 * @brief Validated color tokens, named/hex resolution and RGB composition
 *
 * A Color holds a normalized lowercase color string: either a CSS named color
 * ("red", "rebeccapurple", "transparent") or a 3/6 digit hex string ("#abc",
 * "#ff7f50"). The only way to obtain one from text is resolveColor(), so a
 * Color that exists is always valid.
 *
 * @par Example
 * @code
 * Color c = resolveColor("RED");        // "red"
 * Color h = resolveColor("#ABC");       // "#abc"
 * std::string s = rgbHex(1.0, 0.5, 0);  // "#FF7F00"
 * Color o = resolveColor(s);            // "#ff7f00"
 * @endcode
 */

#include <string>
#include <string_view>
#include <ostream>

namespace turtle {

class Color;

/**
 * @brief Resolve a textual color token
 * @param token Named CSS color or "#rgb"/"#rrggbb" hex string, any case
 * @return Normalized (lowercase) color
 * @throw InvalidColorError if the token is neither
 */
Color resolveColor(std::string_view token);

/**
 * @brief Compose a hex color from three components in [0, 1]
 * @return "#RRGGBB" with uppercase digits; each channel is trunc(c * 255)
 * @throw DomainRangeError if any component is outside [0, 1] or NaN
 */
std::string rgbHex(double r, double g, double b);

/// @brief True if the lowercase name is in the CSS named color table
bool isNamedColor(std::string_view lowercaseName);

/// @brief True if the token is '#' followed by exactly 3 or 6 hex digits
bool isHexColor(std::string_view token);

/**
 * @brief Normalized color string
 */
class Color {
public:
    // Well-known colors used as canvas defaults. Function-local statics, so
    // they are safe to use while initializing other globals.
    static const Color& black();
    static const Color& white();
    static const Color& transparent();

    const std::string& str() const { return m_value; }

    /// @brief True for "#rgb" / "#rrggbb" colors, false for named colors
    bool isHex() const { return !m_value.empty() && m_value[0] == '#'; }

    bool operator==(const Color& other) const { return m_value == other.m_value; }
    bool operator!=(const Color& other) const { return m_value != other.m_value; }

private:
    explicit Color(std::string value) : m_value(std::move(value)) {}

    friend Color resolveColor(std::string_view token);

    std::string m_value;
};

inline std::ostream& operator<<(std::ostream& os, const Color& color) {
    return os << color.str();
}

} // namespace turtle
