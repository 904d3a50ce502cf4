#ifndef IDW_COLOR_COLOR_PARSER_HPP_
#define IDW_COLOR_COLOR_PARSER_HPP_

#include "idw/color/gradient.hpp"
#include <string>

namespace idw
{
namespace color
{

/**
 * Parses a CSS-style color string into RGB.
 *
 * Accepted forms: "#rgb", "#rgba", "#rrggbb", "#rrggbbaa" (the leading '#'
 * is optional), "rgb(r, g, b)", "rgba(r, g, b, a)" and the common CSS color
 * names. Alpha components are accepted and ignored. Matching is
 * case-insensitive and surrounding whitespace is ignored.
 */
bool parseColor(const std::string& text, Rgb& out, std::string& error_message);

std::string toHexString(const Rgb& color);

}
}

#endif
