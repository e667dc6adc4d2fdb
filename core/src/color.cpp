// Turtle - Color Implementation
// Named/hex color resolution and RGB composition

#include <turtle/color.h>
#include <turtle/errors.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace turtle {

// CSS/X11 named colors (CSS Color Module Level 4) plus "transparent".
// Kept sorted for binary search.
static constexpr std::array<std::string_view, 149> NAMED_COLORS = {
    "aliceblue", "antiquewhite", "aqua", "aquamarine", "azure",
    "beige", "bisque", "black", "blanchedalmond", "blue",
    "blueviolet", "brown", "burlywood", "cadetblue", "chartreuse",
    "chocolate", "coral", "cornflowerblue", "cornsilk", "crimson",
    "cyan", "darkblue", "darkcyan", "darkgoldenrod", "darkgray",
    "darkgreen", "darkgrey", "darkkhaki", "darkmagenta", "darkolivegreen",
    "darkorange", "darkorchid", "darkred", "darksalmon", "darkseagreen",
    "darkslateblue", "darkslategray", "darkslategrey", "darkturquoise", "darkviolet",
    "deeppink", "deepskyblue", "dimgray", "dimgrey", "dodgerblue",
    "firebrick", "floralwhite", "forestgreen", "fuchsia", "gainsboro",
    "ghostwhite", "gold", "goldenrod", "gray", "green",
    "greenyellow", "grey", "honeydew", "hotpink", "indianred",
    "indigo", "ivory", "khaki", "lavender", "lavenderblush",
    "lawngreen", "lemonchiffon", "lightblue", "lightcoral", "lightcyan",
    "lightgoldenrodyellow", "lightgray", "lightgreen", "lightgrey", "lightpink",
    "lightsalmon", "lightseagreen", "lightskyblue", "lightslategray", "lightslategrey",
    "lightsteelblue", "lightyellow", "lime", "limegreen", "linen",
    "magenta", "maroon", "mediumaquamarine", "mediumblue", "mediumorchid",
    "mediumpurple", "mediumseagreen", "mediumslateblue", "mediumspringgreen", "mediumturquoise",
    "mediumvioletred", "midnightblue", "mintcream", "mistyrose", "moccasin",
    "navajowhite", "navy", "oldlace", "olive", "olivedrab",
    "orange", "orangered", "orchid", "palegoldenrod", "palegreen",
    "paleturquoise", "palevioletred", "papayawhip", "peachpuff", "peru",
    "pink", "plum", "powderblue", "purple", "rebeccapurple",
    "red", "rosybrown", "royalblue", "saddlebrown", "salmon",
    "sandybrown", "seagreen", "seashell", "sienna", "silver",
    "skyblue", "slateblue", "slategray", "slategrey", "snow",
    "springgreen", "steelblue", "tan", "teal", "thistle",
    "tomato", "transparent", "turquoise", "violet", "wheat",
    "white", "whitesmoke", "yellow", "yellowgreen",
};

const Color& Color::black() {
    static const Color color{"black"};
    return color;
}

const Color& Color::white() {
    static const Color color{"#ffffff"};
    return color;
}

const Color& Color::transparent() {
    static const Color color{"transparent"};
    return color;
}

bool isNamedColor(std::string_view lowercaseName) {
    return std::binary_search(NAMED_COLORS.begin(), NAMED_COLORS.end(), lowercaseName);
}

bool isHexColor(std::string_view token) {
    if (token.size() != 4 && token.size() != 7) return false;
    if (token[0] != '#') return false;
    return std::all_of(token.begin() + 1, token.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

Color resolveColor(std::string_view token) {
    std::string lower(token);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (isNamedColor(lower) || isHexColor(lower)) {
        return Color(std::move(lower));
    }
    throw InvalidColorError(std::string(token));
}

std::string rgbHex(double r, double g, double b) {
    const double components[3] = {r, g, b};
    for (double c : components) {
        // NaN fails both comparisons
        if (!(c >= 0.0 && c <= 1.0)) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%g", c);
            throw DomainRangeError(std::string("RGB values must be between 0 and 1, not ") + buf);
        }
    }

    char hex[8];
    std::snprintf(hex, sizeof(hex), "#%02X%02X%02X",
                  static_cast<unsigned>(r * 255.0),
                  static_cast<unsigned>(g * 255.0),
                  static_cast<unsigned>(b * 255.0));
    return hex;
}

} // namespace turtle
