#include <catch2/catch_all.hpp>
#include <procmux/format.hpp>

#include <regex>

using namespace procmux;

TEST_CASE("pad width is the longest name") {
  std::vector<ProcessDefinition> defs{{"web", "x"}, {"worker", "y"}};
  CHECK(compute_pad_width(defs) == 6);
  CHECK(compute_pad_width({}) == 0);
}

TEST_CASE("prefixes share one column") {
  CHECK(make_prefix("web", 6) == "web    |");
  CHECK(make_prefix("worker", 6) == "worker |");
  CHECK(make_prefix("web", 6).size() == make_prefix("worker", 6).size());
  // имя длиннее ширины: хотя бы один пробел
  CHECK(make_prefix("longer", 3) == "longer |");
}

TEST_CASE("backslashes are doubled") {
  CHECK(escape_backslashes("a\\nb") == "a\\\\nb");
  CHECK(escape_backslashes("\\") == "\\\\");
  CHECK(escape_backslashes("plain") == "plain");
}

TEST_CASE("format_line layout") {
  std::time_t t = 1700000000;
  auto s = format_line("web    |", Color::Red, "hello  ", t);
  std::regex re("^\033\\[0;31m[0-2][0-9]:[0-5][0-9]:[0-5][0-9] web    \\|\033\\[0m hello  $");
  CHECK(std::regex_match(s, re));
}

TEST_CASE("LineFormatter stamps current time") {
  LineFormatter f("w |", Color::Green);
  auto s = f("x\\y");
  CHECK(s.rfind("\033[0;32m", 0) == 0);
  CHECK(s.find(" w |\033[0m x\\\\y") != std::string::npos);
}
