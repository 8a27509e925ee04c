#include <catch2/catch_all.hpp>
#include <procmux/error.hpp>
#include <procmux/format.hpp>
#include <procmux/procfile.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace procmux;
namespace fs = std::filesystem;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("procmux_pf_")+name);
  fs::create_directories(d);
  return d;
}

TEST_CASE("procfile: definitions in file order") {
  std::istringstream in(
"web: sleep 1 && echo up\n"
"worker: echo busy\n"
"web: echo again\n");
  auto defs = parse_procfile(in);
  REQUIRE(defs.size() == 3);
  CHECK(defs[0].name == "web");
  CHECK(defs[0].command == "sleep 1 && echo up");
  CHECK(defs[1].name == "worker");
  CHECK(defs[1].command == "echo busy");
  // дубликаты допустимы
  CHECK(defs[2].name == "web");
}

TEST_CASE("procfile: comments and blank lines are skipped") {
  std::istringstream in(
"# leading comment\n"
"\n"
"   \n"
"a: echo a # trailing comment\n"
"#averyveryverylongcommentedname: echo x\n"
"bb: echo b\n");
  auto defs = parse_procfile(in);
  REQUIRE(defs.size() == 2);
  CHECK(defs[0].command == "echo a ");
  CHECK(defs[1].name == "bb");
  CHECK(compute_pad_width(defs) == 2);
}

TEST_CASE("procfile: split at first colon") {
  std::istringstream in("api:node server.js --url http://x:80\n");
  auto defs = parse_procfile(in);
  REQUIRE(defs.size() == 1);
  CHECK(defs[0].name == "api");
  CHECK(defs[0].command == "node server.js --url http://x:80");
}

TEST_CASE("procfile: malformed lines are skipped") {
  std::istringstream in(
"no colon here\n"
": echo nameless\n"
"empty:   \n"
"ok: true\n");
  auto defs = parse_procfile(in);
  REQUIRE(defs.size() == 1);
  CHECK(defs[0].name == "ok");
}

TEST_CASE("procfile: missing file is a configuration error") {
  auto d = mkd("missing");
  REQUIRE_THROWS_AS(load_procfile(d / "Procfile.none"), ConfigurationError);
}

TEST_CASE("procfile: load from disk") {
  auto d = mkd("load");
  {
    std::ofstream o(d / "Procfile");
    o << "one: echo 1\ntwo: echo 2\n";
  }
  auto defs = load_procfile(d / "Procfile");
  REQUIRE(defs.size() == 2);
  CHECK(defs[1].command == "echo 2");
}

TEST_CASE("env: assignments, comments and lines without '='") {
  std::istringstream in(
"# comment\n"
"PORT=5000\n"
"just a line\n"
"NAME=\"quoted value\" # trailing\n"
"EMPTY=\n"
"URL=http://host/?a=b\n");
  auto ov = parse_env(in);
  REQUIRE(ov.size() == 4);
  CHECK(ov[0].key == "PORT");
  CHECK(ov[0].value == "5000");
  CHECK(ov[1].key == "NAME");
  CHECK(ov[1].value == "quoted value");
  CHECK(ov[2].key == "EMPTY");
  CHECK(ov[2].value.empty());
  CHECK(ov[3].value == "http://host/?a=b");
}

TEST_CASE("env: later entry for the same key wins") {
  std::istringstream in(
"PROCMUX_TEST_DUP=first\n"
"PROCMUX_TEST_DUP=second\n");
  auto ov = parse_env(in);
  REQUIRE(ov.size() == 2);
  apply_overrides(ov);
  REQUIRE(std::getenv("PROCMUX_TEST_DUP") != nullptr);
  CHECK(std::string(std::getenv("PROCMUX_TEST_DUP")) == "second");
  ::unsetenv("PROCMUX_TEST_DUP");
}

TEST_CASE("env: missing env file yields no overrides") {
  auto d = mkd("env_missing");
  CHECK(load_env_file(d / ".env.none").empty());
}
