#include <catch2/catch_all.hpp>
#include <procmux/color.hpp>

using namespace procmux;

TEST_CASE("color picker cycles through five colors") {
  CHECK(pick_color(0) == Color::Cyan);
  CHECK(pick_color(1) == Color::Magenta);
  CHECK(pick_color(2) == Color::Red);
  CHECK(pick_color(3) == Color::Green);
  CHECK(pick_color(4) == Color::Yellow);
  for (std::size_t i = 0; i < 23; i++)
    CHECK(pick_color(i) == pick_color(i % kColorCount));
}

TEST_CASE("ansi codes") {
  CHECK(ansi_code(Color::Cyan) == "\033[0;36m");
  CHECK(ansi_code(Color::Yellow) == "\033[0;33m");
  CHECK(kAnsiReset == "\033[0m");
  CHECK(color_name(Color::Magenta) == "magenta");
}
