#include <procmux/format.hpp>
#include <procmux/multiplexer.hpp>
#include <procmux/shell.hpp>
#include <procmux/worker.hpp>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

namespace procmux {

static int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0)
    return 0;
#endif
  if (::pipe(pfd) != 0)
    return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

static int decode_status(int st) {
  if (WIFEXITED(st))
    return WEXITSTATUS(st);
  if (WIFSIGNALED(st))
    return 128 + WTERMSIG(st);
  return -1;
}

Worker::Worker(WorkerConfig cfg, Shutdown &shutdown)
    : cfg_(std::move(cfg)), shutdown_(shutdown) {}

Worker::~Worker() {
  if (pid_ > 0 && !exited_.load())
    ::kill(pid_, SIGTERM);
  join();
  if (out_read_ >= 0)
    ::close(out_read_);
}

pid_t Worker::spawn(int out_write) {
  const auto expanded = expand_parameters(cfg_.command);
  const auto args = shell_argv(expanded);
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);

  int errp[2];
  if (make_cloexec_pipe(errp) != 0)
    throw std::system_error(errno, std::generic_category(), "pipe");

  sigset_t empty;
  sigemptyset(&empty);
  struct sigaction dfl {};
  dfl.sa_handler = SIG_DFL;
  sigemptyset(&dfl.sa_mask);

  pid_t pid = ::fork();
  if (pid < 0) {
    int err = errno;
    ::close(errp[0]);
    ::close(errp[1]);
    throw std::system_error(err, std::generic_category(), "fork");
  }

  if (pid == 0) {
    // только async-signal-safe вызовы до exec
    ::close(errp[0]);
    ::dup2(out_write, STDOUT_FILENO);
    ::dup2(out_write, STDERR_FILENO);
    if (out_write > STDERR_FILENO)
      ::close(out_write);

    ::sigaction(SIGINT, &dfl, nullptr);
    ::sigaction(SIGTERM, &dfl, nullptr);
    ::sigaction(SIGPIPE, &dfl, nullptr);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);

    ::execv(argv[0], argv.data());

    int err = errno;
    (void)!::write(errp[1], &err, sizeof(err));
    ::close(errp[1]);
    _exit(127);
  }

  ::close(errp[1]);
  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(errp[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(errp[0]);

  if (n > 0) {
    int st = 0;
    ::waitpid(pid, &st, 0);
    throw std::system_error(child_errno, std::generic_category(),
                            "exec " + args[0]);
  }
  return pid;
}

pid_t Worker::start() {
  if (pid_ > 0)
    return pid_;

  int pfd[2];
  if (make_cloexec_pipe(pfd) != 0)
    throw std::system_error(errno, std::generic_category(), "pipe");

  try {
    pid_ = spawn(pfd[1]);
  } catch (...) {
    ::close(pfd[0]);
    ::close(pfd[1]);
    throw;
  }
  ::close(pfd[1]);
  out_read_ = pfd[0];

  spdlog::info("[proc={}] started pid={} color={}", cfg_.name, pid_,
               color_name(cfg_.color));

  // регистрируем до запуска waiter_: pid не будет reaped раньше track
  // если остановка уже идёт, track сам добьёт процесс
  (void)shutdown_.track(pid_, [this] { request_stop(); });

  logger_ = std::thread([this] { log_loop(); });
  waiter_ = std::thread([this] { wait_loop(); });
  return pid_;
}

void Worker::wait_exit() {
  if (waiter_.joinable())
    waiter_.join();
}

void Worker::join() {
  wait_exit();
  // процесс уже reaped; внук с унаследованным stdout не должен держать нас
  request_stop();
  if (logger_.joinable())
    logger_.join();
}

void Worker::request_stop() {
  stopping_ = true;
  if (exited_.load())
    log_stop_ = true;
}

void Worker::wait_loop() {
  // сначала наблюдаем выход без reap, чтобы pid не переиспользовали,
  // пока он ещё в списке координатора
  siginfo_t info{};
  int rc;
  do {
    rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
  } while (rc < 0 && errno == EINTR);
  if (rc < 0)
    spdlog::error("[proc={}] waitid failed: {}", cfg_.name,
                  std::strerror(errno));

  shutdown_.untrack(pid_);

  int st = 0;
  pid_t r;
  do {
    r = ::waitpid(pid_, &st, 0);
  } while (r < 0 && errno == EINTR);
  exit_code_ = r == pid_ ? decode_status(st) : -1;

  exited_ = true;
  if (stopping_.load())
    log_stop_ = true;

  int code = exit_code_.load();
  failed_ = code != 0 && !stopping_.load();
  if (code == 0)
    spdlog::info("[proc={}] exited", cfg_.name);
  else if (stopping_.load())
    spdlog::info("[proc={}] stopped code={}", cfg_.name, code);
  else
    spdlog::warn("[proc={}] exited with code {}", cfg_.name, code);
}

void Worker::log_loop() {
  try {
    LogMultiplexer mux(out_read_, cfg_.out_fd,
                       LineFormatter(make_prefix(cfg_.name, cfg_.pad_width),
                                     cfg_.color));
    auto lines = mux.run(log_stop_);
    spdlog::debug("[proc={}] output closed after {} line(s)", cfg_.name, lines);
  } catch (const std::exception &e) {
    // без пересылки вывода процесс дальше не нужен
    spdlog::error("[proc={}] log forwarding failed: {}; terminating pid={}",
                  cfg_.name, e.what(), pid_);
    if (!exited_.load())
      ::kill(pid_, SIGTERM);
  }
  // оставшиеся писатели (внуки) получат EPIPE, а не повиснут на полном pipe
  ::close(out_read_);
  out_read_ = -1;
}

} // namespace procmux
