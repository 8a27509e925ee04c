#pragma once
#include "color.hpp"
#include "procfile.hpp"

#include <cstddef>
#include <ctime>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace procmux {

std::size_t compute_pad_width(const std::vector<ProcessDefinition> &defs);

// "web" при ширине 6 -> "web    |"
std::string make_prefix(const std::string &name, std::size_t pad_width);

std::string escape_backslashes(std::string_view line);

std::string format_line(std::string_view prefix, Color color,
                        std::string_view line, std::time_t when);

class LineFormatter {
public:
  LineFormatter(std::string prefix, Color color)
      : prefix_(std::move(prefix)), color_(color) {}

  std::string operator()(std::string_view line) const;

private:
  std::string prefix_;
  Color color_;
};

} // namespace procmux
