#include "idw/color/color_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unordered_map>
#include <vector>

namespace idw
{
namespace color
{

namespace
{

const std::unordered_map<std::string, uint32_t>& namedColors()
{
  static const std::unordered_map<std::string, uint32_t> colors =
  {
    {"black", 0x000000}, {"white", 0xffffff}, {"red", 0xff0000},
    {"green", 0x008000}, {"lime", 0x00ff00}, {"blue", 0x0000ff},
    {"yellow", 0xffff00}, {"cyan", 0x00ffff}, {"aqua", 0x00ffff},
    {"magenta", 0xff00ff}, {"fuchsia", 0xff00ff}, {"orange", 0xffa500},
    {"purple", 0x800080}, {"navy", 0x000080}, {"teal", 0x008080},
    {"maroon", 0x800000}, {"olive", 0x808000}, {"gray", 0x808080},
    {"grey", 0x808080}, {"silver", 0xc0c0c0}, {"brown", 0xa52a2a},
    {"pink", 0xffc0cb}, {"gold", 0xffd700}, {"indigo", 0x4b0082},
    {"violet", 0xee82ee}, {"darkblue", 0x00008b}, {"darkred", 0x8b0000},
    {"darkgreen", 0x006400}, {"lightblue", 0xadd8e6}, {"lightgreen", 0x90ee90},
    {"orangered", 0xff4500}, {"crimson", 0xdc143c}, {"turquoise", 0x40e0d0},
    {"skyblue", 0x87ceeb}, {"royalblue", 0x4169e1}, {"steelblue", 0x4682b4},
    {"yellowgreen", 0x9acd32}, {"greenyellow", 0xadff2f}, {"tomato", 0xff6347},
    {"coral", 0xff7f50}, {"khaki", 0xf0e68c}, {"beige", 0xf5f5dc},
    {"darkorange", 0xff8c00}, {"deepskyblue", 0x00bfff}, {"dodgerblue", 0x1e90ff},
    {"firebrick", 0xb22222}, {"forestgreen", 0x228b22}, {"chartreuse", 0x7fff00},
    {"midnightblue", 0x191970}, {"slategray", 0x708090}, {"darkgray", 0xa9a9a9},
    {"lightgray", 0xd3d3d3}, {"salmon", 0xfa8072}, {"tan", 0xd2b48c},
  };
  return colors;
}

Rgb fromPacked(uint32_t packed)
{
  return Rgb(static_cast<uint8_t>((packed >> 16) & 0xff),
             static_cast<uint8_t>((packed >> 8) & 0xff),
             static_cast<uint8_t>(packed & 0xff));
}

int hexDigit(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

bool parseHex(const std::string& hex, Rgb& out)
{
  for (char c : hex)
  {
    if (hexDigit(c) < 0)
    {
      return false;
    }
  }

  if (hex.size() == 3 || hex.size() == 4)
  {
    for (int i = 0; i < 3; ++i)
    {
      int d = hexDigit(hex[i]);
      out[i] = static_cast<uint8_t>(d * 16 + d);
    }
    return true;
  }

  if (hex.size() == 6 || hex.size() == 8)
  {
    for (int i = 0; i < 3; ++i)
    {
      out[i] = static_cast<uint8_t>(hexDigit(hex[2 * i]) * 16 + hexDigit(hex[2 * i + 1]));
    }
    return true;
  }

  return false;
}

bool parseFunctional(const std::string& args, size_t expected, Rgb& out)
{
  std::vector<double> values;
  const char* cursor = args.c_str();

  while (*cursor != '\0')
  {
    while (*cursor == ' ' || *cursor == ',')
    {
      ++cursor;
    }
    if (*cursor == '\0')
    {
      break;
    }

    // Plain decimal only; strtod would also take nan, inf and hex.
    const char* token_end = cursor;
    while (*token_end != '\0' && *token_end != ',' && *token_end != ' ')
    {
      if (std::strchr("0123456789.+-e", *token_end) == nullptr)
      {
        return false;
      }
      ++token_end;
    }

    char* end = nullptr;
    double value = std::strtod(cursor, &end);
    if (end != token_end || !std::isfinite(value))
    {
      return false;
    }
    values.push_back(value);
    cursor = end;
  }

  if (values.size() != expected)
  {
    return false;
  }

  if (expected == 4 && (values[3] < 0.0 || values[3] > 1.0))
  {
    return false;
  }

  for (int i = 0; i < 3; ++i)
  {
    if (values[i] < 0.0 || values[i] > 255.0)
    {
      return false;
    }
    out[i] = static_cast<uint8_t>(std::lround(values[i]));
  }
  return true;
}

}

bool parseColor(const std::string& text, Rgb& out, std::string& error_message)
{
  std::string s;
  s.reserve(text.size());
  for (char c : text)
  {
    if (!std::isspace(static_cast<unsigned char>(c)))
    {
      s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }

  bool ok = false;

  auto named = namedColors().find(s);
  if (named != namedColors().end())
  {
    out = fromPacked(named->second);
    ok = true;
  }
  else if (!s.empty() && s[0] == '#')
  {
    ok = parseHex(s.substr(1), out);
  }
  else if (s.rfind("rgba(", 0) == 0 && s.back() == ')')
  {
    ok = parseFunctional(s.substr(5, s.size() - 6), 4, out);
  }
  else if (s.rfind("rgb(", 0) == 0 && s.back() == ')')
  {
    ok = parseFunctional(s.substr(4, s.size() - 5), 3, out);
  }
  else
  {
    ok = parseHex(s, out);
  }

  if (!ok)
  {
    error_message = "Unrecognized color: '" + text + "'";
  }
  return ok;
}

std::string toHexString(const Rgb& color)
{
  char buffer[8];
  std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x",
                color[0], color[1], color[2]);
  return buffer;
}

}
}
