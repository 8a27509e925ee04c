#pragma once
#include "color.hpp"
#include "shutdown.hpp"

#include <sys/types.h>
#include <unistd.h>

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>

namespace procmux {

struct WorkerConfig {
  std::string name;
  std::string command;
  Color color = Color::Cyan;
  std::size_t pad_width = 0;
  int out_fd = STDOUT_FILENO;
};

class Worker {
public:
  Worker(WorkerConfig cfg, Shutdown &shutdown);
  ~Worker();

  Worker(const Worker &) = delete;
  Worker &operator=(const Worker &) = delete;

  // fork + exec; throws std::system_error
  pid_t start();
  // returns once the process is reaped; output may still be forwarded
  void wait_exit();
  // wait_exit, then a bounded drain of what the process left in the pipe;
  // background grandchildren holding the pipe do not keep it open
  void join();

  // вызывается координатором остановки
  void request_stop();

  pid_t pid() const { return pid_; }
  bool exited() const { return exited_.load(); }
  // exit code or 128 + signal; -1 while running
  int exit_code() const { return exit_code_.load(); }
  // non-zero exit that was not caused by a shutdown
  bool failed() const { return failed_.load(); }

private:
  pid_t spawn(int out_write);
  void wait_loop();
  void log_loop();

  WorkerConfig cfg_;
  Shutdown &shutdown_;
  pid_t pid_{-1};
  int out_read_{-1};

  std::atomic_bool stopping_{false};
  std::atomic_bool exited_{false};
  std::atomic_bool log_stop_{false};
  std::atomic_int exit_code_{-1};
  std::atomic_bool failed_{false};

  std::thread waiter_;
  std::thread logger_;
};

} // namespace procmux
