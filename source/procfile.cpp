#include <procmux/error.hpp>
#include <procmux/procfile.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

namespace procmux {

static std::string strip_comment(const std::string &line) {
  auto pos = line.find('#');
  return pos == std::string::npos ? line : line.substr(0, pos);
}

static bool is_blank(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static std::string trim(std::string s) {
  while (!s.empty() && is_blank(s.back()))
    s.pop_back();
  size_t i = 0;
  while (i < s.size() && is_blank(s[i]))
    ++i;
  return s.substr(i);
}

static std::string unquote(const std::string &v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') &&
      v.back() == v.front())
    return v.substr(1, v.size() - 2);
  return v;
}

std::vector<ProcessDefinition> parse_procfile(std::istream &in) {
  std::vector<ProcessDefinition> out;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    line = strip_comment(line);
    if (trim(line).empty())
      continue;

    auto colon = line.find(':');
    if (colon == std::string::npos) {
      spdlog::warn("[procfile] line {}: missing ':', skipped", lineno);
      continue;
    }
    // имя берём как есть, у команды срезаем только ведущие пробелы
    std::string name = line.substr(0, colon);
    std::string cmd = line.substr(colon + 1);
    size_t i = 0;
    while (i < cmd.size() && (cmd[i] == ' ' || cmd[i] == '\t'))
      ++i;
    cmd = cmd.substr(i);
    if (!cmd.empty() && cmd.back() == '\r')
      cmd.pop_back();

    if (name.empty() || trim(cmd).empty()) {
      spdlog::warn("[procfile] line {}: empty name or command, skipped",
                   lineno);
      continue;
    }
    out.push_back({std::move(name), std::move(cmd)});
  }
  return out;
}

std::vector<ProcessDefinition> load_procfile(const fs::path &p) {
  std::error_code ec;
  if (!fs::is_regular_file(p, ec))
    throw ConfigurationError("procfile not found: " + p.string());
  std::ifstream in(p);
  if (!in)
    throw ConfigurationError("cannot open procfile: " + p.string());
  return parse_procfile(in);
}

std::vector<EnvironmentOverride> parse_env(std::istream &in) {
  std::vector<EnvironmentOverride> out;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    auto s = trim(strip_comment(line));
    auto eq = s.find('=');
    if (eq == std::string::npos)
      continue;
    auto key = s.substr(0, eq);
    if (key.empty() || key.find_first_of(" \t") != std::string::npos) {
      spdlog::warn("[env] line {}: bad variable name '{}', skipped", lineno,
                   key);
      continue;
    }
    out.push_back({std::move(key), unquote(s.substr(eq + 1))});
  }
  return out;
}

std::vector<EnvironmentOverride> load_env_file(const fs::path &p) {
  std::ifstream in(p);
  if (!in)
    return {};
  return parse_env(in);
}

void apply_overrides(const std::vector<EnvironmentOverride> &overrides) {
  for (const auto &o : overrides) {
    if (::setenv(o.key.c_str(), o.value.c_str(), 1) != 0)
      spdlog::warn("[env] setenv {} failed", o.key);
  }
}

} // namespace procmux
