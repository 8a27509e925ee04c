#include <procmux/config.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <string>

namespace procmux {

bool parse_flag(std::string_view value) {
  std::string v;
  for (char c : value) {
    if (c == ' ' || c == '\t')
      continue;
    v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (v.empty() || v == "0" || v == "false" || v == "no" || v == "off")
    return false;
  return true;
}

Settings Settings::from_env() {
  Settings s{};
  if (const char *env = ::getenv(kSelectiveKillEnv)) {
    if (parse_flag(env))
      s.termination = TerminationMode::Selective;
  }
  spdlog::debug("[config] termination={}", to_string(s.termination));
  return s;
}

} // namespace procmux
