#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace procmux {

using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

std::optional<std::string> getenv_lookup(const std::string &name);

// $NAME, ${NAME}, ${NAME:-default} from the environment; names that are not
// set (shell-local variables) are left for sh, as are '...' and \$
std::string expand_parameters(const std::string &command,
                              const EnvLookup &lookup = getenv_lookup);

// /bin/sh -f -c <command>
std::vector<std::string> shell_argv(const std::string &command);

} // namespace procmux
