#include <catch2/catch_all.hpp>
#include <procmux/config.hpp>

#include <cstdlib>

using namespace procmux;

TEST_CASE("flag parsing") {
  CHECK_FALSE(parse_flag(""));
  CHECK_FALSE(parse_flag("0"));
  CHECK_FALSE(parse_flag("false"));
  CHECK_FALSE(parse_flag("No"));
  CHECK_FALSE(parse_flag("off"));
  CHECK(parse_flag("1"));
  CHECK(parse_flag("yes"));
  CHECK(parse_flag("true"));
}

TEST_CASE("termination mode from environment") {
  ::unsetenv(kSelectiveKillEnv);
  CHECK(Settings::from_env().termination == TerminationMode::WholeGroup);

  ::setenv(kSelectiveKillEnv, "", 1);
  CHECK(Settings::from_env().termination == TerminationMode::WholeGroup);

  ::setenv(kSelectiveKillEnv, "1", 1);
  CHECK(Settings::from_env().termination == TerminationMode::Selective);
  ::unsetenv(kSelectiveKillEnv);
}
