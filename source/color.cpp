#include <procmux/color.hpp>

#include <array>

namespace procmux {

static constexpr std::array<Color, kColorCount> kTable = {
    Color::Cyan, Color::Magenta, Color::Red, Color::Green, Color::Yellow};

Color pick_color(std::size_t index) { return kTable[index % kTable.size()]; }

std::string_view ansi_code(Color c) {
  switch (c) {
  case Color::Cyan:
    return "\033[0;36m";
  case Color::Magenta:
    return "\033[0;35m";
  case Color::Red:
    return "\033[0;31m";
  case Color::Green:
    return "\033[0;32m";
  case Color::Yellow:
    return "\033[0;33m";
  }
  return kAnsiReset;
}

std::string_view color_name(Color c) {
  switch (c) {
  case Color::Cyan:
    return "cyan";
  case Color::Magenta:
    return "magenta";
  case Color::Red:
    return "red";
  case Color::Green:
    return "green";
  case Color::Yellow:
    return "yellow";
  }
  return "unknown";
}

} // namespace procmux
