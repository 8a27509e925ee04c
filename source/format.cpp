#include <procmux/format.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>

namespace procmux {

std::size_t compute_pad_width(const std::vector<ProcessDefinition> &defs) {
  std::size_t w = 0;
  for (const auto &d : defs)
    w = std::max(w, d.name.size());
  return w;
}

std::string make_prefix(const std::string &name, std::size_t pad_width) {
  std::size_t pad = pad_width > name.size() ? pad_width - name.size() : 0;
  std::string out = name;
  out.append(pad + 1, ' ');
  out.push_back('|');
  return out;
}

std::string escape_backslashes(std::string_view line) {
  std::string out;
  out.reserve(line.size());
  for (char c : line) {
    if (c == '\\')
      out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

std::string format_line(std::string_view prefix, Color color,
                        std::string_view line, std::time_t when) {
  return fmt::format("{}{:%H:%M:%S} {}{} {}", ansi_code(color),
                     fmt::localtime(when), prefix, kAnsiReset,
                     escape_backslashes(line));
}

std::string LineFormatter::operator()(std::string_view line) const {
  return format_line(prefix_, color_, line, std::time(nullptr));
}

} // namespace procmux
