#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace procmux {

using LineFormat = std::function<std::string(std::string_view line)>;

class LogMultiplexer {
public:
  // throws UsageError when format is empty
  LogMultiplexer(int in_fd, int out_fd, LineFormat format);

  // читает до EOF; возвращает число записанных строк
  std::size_t run();
  // то же, но после stop вычитывает уже доступное и выходит
  std::size_t run(const std::atomic_bool &stop);

private:
  void emit(std::string_view line);

  int in_fd_;
  int out_fd_;
  LineFormat format_;
  bool sink_ok_{true};
  std::size_t emitted_{0};
};

} // namespace procmux
