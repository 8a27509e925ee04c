#pragma once
#include <cstddef>
#include <string_view>

namespace procmux {

enum class Color { Cyan, Magenta, Red, Green, Yellow };

inline constexpr std::size_t kColorCount = 5;
inline constexpr std::string_view kAnsiReset = "\033[0m";

Color pick_color(std::size_t index);
std::string_view ansi_code(Color c);
std::string_view color_name(Color c);

} // namespace procmux
