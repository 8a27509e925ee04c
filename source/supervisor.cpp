#include <procmux/format.hpp>
#include <procmux/signals.hpp>
#include <procmux/supervisor.hpp>

#include <spdlog/spdlog.h>

#include <signal.h>

#include <stdexcept>
#include <system_error>

namespace procmux {

Supervisor::Supervisor(SupervisorOptions opts)
    : opts_(opts), shutdown_(make_kill_strategy(opts.mode)) {}

Supervisor::~Supervisor() {
  // run() уже всех дождался; здесь только на случай исключения в run()
  if (!workers_.empty())
    request_stop();
  workers_.clear();
}

void Supervisor::request_stop() {
  (void)shutdown_.trigger(StopReason::Requested);
}

std::vector<RunningProcess> Supervisor::processes() const {
  std::lock_guard<std::mutex> lk(mu_);
  return procs_;
}

RunResult Supervisor::run(const std::vector<ProcessDefinition> &defs,
                          const std::vector<EnvironmentOverride> &overrides) {
  if (ran_)
    throw std::logic_error("Supervisor::run called twice");
  ran_ = true;

  apply_overrides(overrides);
  pad_width_ = compute_pad_width(defs);

  RunResult res{};

  // обработчик ставим до первого fork: сигнал во время запуска не потеряется
  SignalWatcher watcher({SIGINT, SIGTERM}, [this](int signo) {
    (void)shutdown_.trigger(StopReason::Signal, signo);
  });

  spdlog::info("[supervisor] {} definition(s), width={}, mode={}", defs.size(),
               pad_width_, to_string(shutdown_.mode()));

  for (std::size_t i = 0; i < defs.size(); ++i) {
    const auto &def = defs[i];
    if (shutdown_.triggered()) {
      spdlog::info("[supervisor] stop requested; {} definition(s) not started",
                   defs.size() - i);
      break;
    }
    WorkerConfig cfg{def.name, def.command, pick_color(launch_counter_++),
                     pad_width_, opts_.out_fd};
    auto w = std::make_unique<Worker>(cfg, shutdown_);
    pid_t pid = -1;
    try {
      pid = w->start();
    } catch (const std::system_error &e) {
      spdlog::error("[proc={}] spawn failed: {}", def.name, e.what());
      ++res.failed;
      continue;
    }
    {
      std::lock_guard<std::mutex> lk(mu_);
      procs_.push_back({def, cfg.color, pid});
      workers_.push_back(std::move(w));
    }
    ++res.launched;
  }

  // единственная точка ожидания: выход самих процессов, не их внуков
  for (auto &w : workers_) {
    w->wait_exit();
    if (w->failed())
      ++res.failed;
  }

  // в режиме группы добивает осиротевших внуков, пока pipe ещё читается
  (void)shutdown_.trigger(StopReason::Completed);
  for (auto &w : workers_)
    w->join();
  if (shutdown_.reason() == StopReason::Signal)
    res.signal = shutdown_.signal();

  spdlog::info("[supervisor] all processes exited (launched={}, failed={})",
               res.launched, res.failed);
  return res;
}

} // namespace procmux
