#include <procmux/shell.hpp>

#include <cctype>
#include <cstdlib>

namespace procmux {

std::optional<std::string> getenv_lookup(const std::string &name) {
  if (const char *v = ::getenv(name.c_str()))
    return std::string(v);
  return std::nullopt;
}

static bool name_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
static bool name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string expand_parameters(const std::string &command,
                              const EnvLookup &lookup) {
  std::string out;
  out.reserve(command.size());
  bool in_single = false, in_double = false;
  const size_t n = command.size();

  for (size_t i = 0; i < n; ++i) {
    char c = command[i];
    if (in_single) {
      if (c == '\'')
        in_single = false;
      out.push_back(c);
      continue;
    }
    if (c == '\'' && !in_double) {
      in_single = true;
      out.push_back(c);
      continue;
    }
    if (c == '"')
      in_double = !in_double;
    if (c == '\\' && i + 1 < n) {
      // экранирование оставляем shell'у
      out.push_back(c);
      out.push_back(command[++i]);
      continue;
    }
    if (c != '$' || i + 1 >= n) {
      out.push_back(c);
      continue;
    }

    char next = command[i + 1];
    if (next == '{') {
      auto close = command.find('}', i + 2);
      if (close == std::string::npos) {
        out.push_back(c);
        continue;
      }
      std::string body = command.substr(i + 2, close - i - 2);
      std::string name = body, fallback;
      bool has_default = false;
      if (auto pos = body.find(":-"); pos != std::string::npos) {
        name = body.substr(0, pos);
        fallback = body.substr(pos + 2);
        has_default = true;
      }
      if (name.empty() || !name_start(name[0])) {
        out.append(command, i, close - i + 1);
        i = close;
        continue;
      }
      auto v = lookup(name);
      if (!v)
        out.append(command, i, close - i + 1); // не из окружения: оставляем sh
      else if (has_default && v->empty())
        out += fallback;
      else
        out += *v;
      i = close;
    } else if (name_start(next)) {
      size_t j = i + 1;
      while (j < n && name_char(command[j]))
        ++j;
      if (auto v = lookup(command.substr(i + 1, j - i - 1)))
        out += *v;
      else
        out.append(command, i, j - i);
      i = j - 1;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::vector<std::string> shell_argv(const std::string &command) {
  return {"/bin/sh", "-f", "-c", command};
}

} // namespace procmux
