#pragma once
#include <sys/types.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>
#include <vector>

namespace procmux {

enum class TerminationMode { WholeGroup, Selective };

enum class StopReason { Completed, Requested, Signal };

std::string_view to_string(TerminationMode m);
std::string_view to_string(StopReason r);

class KillStrategy {
public:
  virtual ~KillStrategy() = default;
  virtual void terminate(const std::vector<pid_t> &tracked) = 0;
  virtual TerminationMode mode() const = 0;
};

// SIGTERM всей группе процессов, кроме нас самих
class GroupKill : public KillStrategy {
public:
  void terminate(const std::vector<pid_t> &tracked) override;
  TerminationMode mode() const override { return TerminationMode::WholeGroup; }
};

// SIGTERM только отслеживаемым pid
class SelectiveKill : public KillStrategy {
public:
  void terminate(const std::vector<pid_t> &tracked) override;
  TerminationMode mode() const override { return TerminationMode::Selective; }
};

std::unique_ptr<KillStrategy> make_kill_strategy(TerminationMode mode);

class Shutdown {
public:
  using Listener = std::function<void()>;

  explicit Shutdown(std::unique_ptr<KillStrategy> strategy);

  Shutdown(const Shutdown &) = delete;
  Shutdown &operator=(const Shutdown &) = delete;

  // false if the shutdown already fired; the pid is then killed right away
  bool track(pid_t pid, Listener on_stop);
  void untrack(pid_t pid);

  // one-shot: only the first call kills and notifies
  bool trigger(StopReason reason, int signo = 0);

  bool triggered() const { return fired_.load(); }
  StopReason reason() const { return reason_.load(); }
  int signal() const { return signo_.load(); }
  TerminationMode mode() const { return strategy_->mode(); }

  std::vector<pid_t> tracked() const;

private:
  std::unique_ptr<KillStrategy> strategy_;
  mutable std::mutex mu_;
  std::vector<std::pair<pid_t, Listener>> entries_;
  std::atomic_bool fired_{false};
  std::atomic<StopReason> reason_{StopReason::Completed};
  std::atomic_int signo_{0};
};

} // namespace procmux
