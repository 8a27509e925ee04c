#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace procmux {

struct CmdStart {
  std::filesystem::path procfile = "Procfile";
  std::filesystem::path env_file = ".env";
};

struct CmdExec {
  std::vector<std::string> argv;
};

struct CmdSource {};
struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdStart, CmdExec, CmdSource, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace procmux
