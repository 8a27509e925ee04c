#include <procmux/cli.hpp>

#include <string_view>

namespace procmux {

static bool eq(std::string_view a, std::string_view b) { return a == b; }

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  if (argc < 2) {
    r.error = "missing command";
    return r;
  }

  std::string cmd = argv[1];
  if (eq(cmd, "--help") || eq(cmd, "help")) {
    r.cmd = CmdHelp{};
    return r;
  }
  if (eq(cmd, "--version") || eq(cmd, "version")) {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "start") {
    if (argc > 4) {
      r.error = "start: too many arguments";
      return r;
    }
    CmdStart c{};
    if (argc > 2)
      c.procfile = argv[2];
    if (argc > 3)
      c.env_file = argv[3];
    r.cmd = c;
    return r;
  }

  if (cmd == "exec") {
    if (argc < 3) {
      r.error = "exec: command required";
      return r;
    }
    CmdExec c{};
    for (int i = 2; i < argc; i++)
      c.argv.emplace_back(argv[i]);
    r.cmd = c;
    return r;
  }

  if (cmd == "source") {
    r.cmd = CmdSource{};
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace procmux
