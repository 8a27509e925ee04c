#pragma once
#include <stdexcept>
#include <string>

namespace procmux {

// Procfile отсутствует или не читается
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string &what)
      : std::runtime_error(what) {}
};

class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace procmux
