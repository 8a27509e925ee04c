#pragma once
#include <signal.h>

#include <atomic>
#include <functional>
#include <initializer_list>
#include <thread>

namespace procmux {

class SignalWatcher {
public:
  using Handler = std::function<void(int signo)>;

  // blocks the signals in the calling thread before starting the watcher
  // thread, so every thread created afterwards inherits the mask
  SignalWatcher(std::initializer_list<int> signals, Handler handler);
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher &) = delete;
  SignalWatcher &operator=(const SignalWatcher &) = delete;

private:
  void loop();

  sigset_t set_{};
  sigset_t old_mask_{};
  Handler handler_;
  std::atomic_bool stop_{false};
  std::thread thread_;
};

} // namespace procmux
