#pragma once
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace procmux {

struct ProcessDefinition {
  std::string name;
  std::string command;
};

struct EnvironmentOverride {
  std::string key;
  std::string value;
};

std::vector<ProcessDefinition> parse_procfile(std::istream &in);
// throws ConfigurationError when the file is missing
std::vector<ProcessDefinition> load_procfile(const std::filesystem::path &p);

std::vector<EnvironmentOverride> parse_env(std::istream &in);
// missing file -> empty list
std::vector<EnvironmentOverride> load_env_file(const std::filesystem::path &p);

void apply_overrides(const std::vector<EnvironmentOverride> &overrides);

} // namespace procmux
