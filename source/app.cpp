#include <procmux/app.hpp>
#include <procmux/cli.hpp>
#include <procmux/config.hpp>
#include <procmux/error.hpp>
#include <procmux/procfile.hpp>
#include <procmux/signals.hpp>
#include <procmux/supervisor.hpp>
#include <procmux/worker.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <signal.h>
#include <unistd.h>

#include <csignal>
#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>

#ifndef PROCMUX_VERSION
#define PROCMUX_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace procmux {

static void print_usage(std::FILE *out) {
  fmt::print(out, "usage: procmux start [procfile] [env_file]\n"
                  "       procmux exec <command...> | source | help | version\n");
}

// завершаемся тем же сигналом, что получили
static int reraise(int signo) {
  spdlog::shutdown();
  std::signal(signo, SIG_DFL);
  sigset_t s;
  sigemptyset(&s);
  sigaddset(&s, signo);
  ::pthread_sigmask(SIG_UNBLOCK, &s, nullptr);
  ::raise(signo);
  return 128 + signo;
}

static int run_start(const CmdStart &c) {
  std::vector<ProcessDefinition> defs;
  try {
    defs = load_procfile(c.procfile);
  } catch (const ConfigurationError &e) {
    fmt::print(stderr, "procmux: {}\n", e.what());
    print_usage(stderr);
    return 2;
  }
  auto overrides = load_env_file(c.env_file);
  if (!overrides.empty())
    spdlog::info("[supervisor] {} override(s) from {}", overrides.size(),
                 c.env_file.string());

  const auto settings = Settings::from_env();
  Supervisor sup(SupervisorOptions{settings.termination, STDOUT_FILENO});
  auto res = sup.run(defs, overrides);
  if (res.signal != 0)
    return reraise(res.signal);
  return 0;
}

static int run_exec(const CmdExec &c) {
  std::string cmd;
  for (const auto &a : c.argv) {
    if (!cmd.empty())
      cmd.push_back(' ');
    cmd += a;
  }
  std::string name = fs::path(c.argv.front()).filename().string();

  Shutdown shutdown(make_kill_strategy(TerminationMode::Selective));
  int code = 0;
  {
    SignalWatcher watcher({SIGINT, SIGTERM}, [&shutdown](int signo) {
      (void)shutdown.trigger(StopReason::Signal, signo);
    });
    Worker w(WorkerConfig{name, cmd, pick_color(0), name.size(), STDOUT_FILENO},
             shutdown);
    try {
      w.start();
    } catch (const std::system_error &e) {
      spdlog::error("[proc={}] spawn failed: {}", name, e.what());
      return 127;
    }
    w.join();
    code = w.exit_code();  }
  return code < 0 ? 1 : code;
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    fmt::print(stderr, "procmux: {}\n", pr.error);
    print_usage(stderr);
    return 2;
  }

  // stdout может оказаться закрытым pipe; ошибку записи обработает мультиплексор
  std::signal(SIGPIPE, SIG_IGN);

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_usage(stdout);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          fmt::print("procmux {}\n", PROCMUX_VERSION);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdSource>) {
          return 0;

        } else if constexpr (std::is_same_v<T, CmdStart>) {
          return run_start(c);

        } else {
          return run_exec(c);
        }
      },
      *pr.cmd);
}

} // namespace procmux
