#pragma once
#include <procmux/color.hpp>
#include <procmux/procfile.hpp>
#include <procmux/shutdown.hpp>
#include <procmux/worker.hpp>

#include <sys/types.h>
#include <unistd.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace procmux {

struct RunningProcess {
  ProcessDefinition definition;
  Color color;
  pid_t pid = -1;
};

struct SupervisorOptions {
  TerminationMode mode = TerminationMode::WholeGroup;
  int out_fd = STDOUT_FILENO;
};

struct RunResult {
  std::size_t launched = 0;
  std::size_t failed = 0;
  int signal = 0; // 0 — штатное завершение
};

class Supervisor {
public:
  explicit Supervisor(SupervisorOptions opts = {});
  ~Supervisor();

  Supervisor(const Supervisor &) = delete;
  Supervisor &operator=(const Supervisor &) = delete;

  // blocks until every spawned process has exited
  RunResult run(const std::vector<ProcessDefinition> &defs,
                const std::vector<EnvironmentOverride> &overrides = {});

  void request_stop();

  std::size_t pad_width() const { return pad_width_; }
  std::vector<RunningProcess> processes() const;
  TerminationMode mode() const { return shutdown_.mode(); }

private:
  SupervisorOptions opts_;
  Shutdown shutdown_;
  std::size_t pad_width_{0};
  std::size_t launch_counter_{0};
  bool ran_{false};

  mutable std::mutex mu_;
  std::vector<RunningProcess> procs_;
  std::vector<std::unique_ptr<Worker>> workers_;
};

} // namespace procmux
