#include <procmux/signals.hpp>

#include <spdlog/spdlog.h>

#include <pthread.h>

#include <cerrno>
#include <cstring>
#include <ctime>

namespace procmux {

SignalWatcher::SignalWatcher(std::initializer_list<int> signals,
                             Handler handler)
    : handler_(std::move(handler)) {
  sigemptyset(&set_);
  for (int s : signals)
    sigaddset(&set_, s);
  int rc = ::pthread_sigmask(SIG_BLOCK, &set_, &old_mask_);
  if (rc != 0)
    spdlog::warn("[signals] pthread_sigmask failed: {}", std::strerror(rc));
  thread_ = std::thread([this] { loop(); });
}

SignalWatcher::~SignalWatcher() {
  stop_ = true;
  if (thread_.joinable())
    thread_.join();
  ::pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
}

void SignalWatcher::loop() {
  const timespec period{0, 100 * 1000 * 1000};
  while (!stop_.load()) {
    siginfo_t info{};
    int sig = ::sigtimedwait(&set_, &info, &period);
    if (sig < 0) {
      if (errno != EAGAIN && errno != EINTR)
        spdlog::warn("[signals] sigtimedwait: {}", std::strerror(errno));
      continue;
    }
    spdlog::debug("[signals] caught {} from pid {}", sig, info.si_pid);
    if (handler_)
      handler_(sig);
  }
}

} // namespace procmux
