#include <catch2/catch_all.hpp>
#include <procmux/shell.hpp>

#include <map>

using namespace procmux;

static EnvLookup from(std::map<std::string, std::string> m) {
  return [m](const std::string& k) -> std::optional<std::string> {
    auto it = m.find(k);
    if (it == m.end()) return std::nullopt;
    return it->second;
  };
}

TEST_CASE("plain and braced parameters") {
  auto env = from({{"PORT", "5000"}, {"HOST", "localhost"}});
  CHECK(expand_parameters("serve --port $PORT", env) == "serve --port 5000");
  CHECK(expand_parameters("http://${HOST}:${PORT}/", env) ==
        "http://localhost:5000/");
  CHECK(expand_parameters("$PORT$HOST", env) == "5000localhost");
}

TEST_CASE("unset parameters are left for the shell") {
  auto env = from({{"EMPTY", ""}, {"SET", "v"}});
  CHECK(expand_parameters("a${NOPE}b", env) == "a${NOPE}b");
  CHECK(expand_parameters("$NOPE-x", env) == "$NOPE-x");
  CHECK(expand_parameters("for i in 1 2; do echo $i; done", env) ==
        "for i in 1 2; do echo $i; done");
  CHECK(expand_parameters("${NOPE:-3000}", env) == "${NOPE:-3000}");
  CHECK(expand_parameters("${EMPTY:-d}", env) == "d");
  CHECK(expand_parameters("${SET:-d}", env) == "v");
}

TEST_CASE("quoting and escapes are left to the shell") {
  auto env = from({{"X", "1"}});
  CHECK(expand_parameters("echo '$X'", env) == "echo '$X'");
  CHECK(expand_parameters("echo \"$X it's\"", env) == "echo \"1 it's\"");
  CHECK(expand_parameters("echo \\$X", env) == "echo \\$X");
  CHECK(expand_parameters("echo $ $1 $$ $", env) == "echo $ $1 $$ $");
  CHECK(expand_parameters("echo ${unclosed", env) == "echo ${unclosed");
}

TEST_CASE("shell argv disables globbing") {
  auto argv = shell_argv("echo *");
  REQUIRE(argv.size() == 4);
  CHECK(argv[0] == "/bin/sh");
  CHECK(argv[1] == "-f");
  CHECK(argv[2] == "-c");
  CHECK(argv[3] == "echo *");
}
