#pragma once
#include <procmux/shutdown.hpp>

#include <string_view>

namespace procmux {

inline constexpr const char *kSelectiveKillEnv = "PROCMUX_SELECTIVE_KILL";

bool parse_flag(std::string_view value);

struct Settings {
  TerminationMode termination = TerminationMode::WholeGroup;

  static Settings from_env();
};

} // namespace procmux
