#include <procmux/shutdown.hpp>

#include <spdlog/spdlog.h>

#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace procmux {

std::string_view to_string(TerminationMode m) {
  return m == TerminationMode::Selective ? "selective" : "whole-group";
}

std::string_view to_string(StopReason r) {
  switch (r) {
  case StopReason::Completed:
    return "completed";
  case StopReason::Requested:
    return "requested";
  case StopReason::Signal:
    return "signal";
  }
  return "unknown";
}

void GroupKill::terminate(const std::vector<pid_t> & /*tracked*/) {
  struct sigaction ign {}, old {};
  ign.sa_handler = SIG_IGN;
  sigemptyset(&ign.sa_mask);
  ::sigaction(SIGTERM, &ign, &old);

  spdlog::debug("[shutdown] SIGTERM -> process group {}", ::getpgrp());
  if (::kill(0, SIGTERM) != 0)
    spdlog::warn("[shutdown] kill(0) failed: {}", std::strerror(errno));

  // повторная установка SIG_IGN сбрасывает SIGTERM, ожидающий у нас самих
  ::sigaction(SIGTERM, &ign, nullptr);
  ::sigaction(SIGTERM, &old, nullptr);
}

void SelectiveKill::terminate(const std::vector<pid_t> &tracked) {
  for (pid_t pid : tracked) {
    if (pid <= 0)
      continue;
    spdlog::debug("[shutdown] SIGTERM -> pid {}", pid);
    if (::kill(pid, SIGTERM) != 0 && errno != ESRCH)
      spdlog::warn("[shutdown] kill({}) failed: {}", pid, std::strerror(errno));
  }
}

std::unique_ptr<KillStrategy> make_kill_strategy(TerminationMode mode) {
  if (mode == TerminationMode::Selective)
    return std::make_unique<SelectiveKill>();
  return std::make_unique<GroupKill>();
}

Shutdown::Shutdown(std::unique_ptr<KillStrategy> strategy)
    : strategy_(std::move(strategy)) {}

bool Shutdown::track(pid_t pid, Listener on_stop) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fired_.load()) {
    spdlog::debug("[shutdown] late pid {} terminated", pid);
    ::kill(pid, SIGTERM);
    if (on_stop)
      on_stop();
    return false;
  }
  entries_.emplace_back(pid, std::move(on_stop));
  return true;
}

void Shutdown::untrack(pid_t pid) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [pid](const auto &e) { return e.first == pid; }),
                 entries_.end());
}

bool Shutdown::trigger(StopReason reason, int signo) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fired_.exchange(true))
    return false;
  reason_ = reason;
  signo_ = signo;

  std::vector<pid_t> pids;
  pids.reserve(entries_.size());
  for (const auto &e : entries_)
    pids.push_back(e.first);

  if (reason == StopReason::Signal)
    spdlog::info("[shutdown] got signal {}; stopping {} process(es) ({})",
                 signo, pids.size(), to_string(strategy_->mode()));
  else
    spdlog::debug("[shutdown] reason={} mode={} tracked={}", to_string(reason),
                  to_string(strategy_->mode()), pids.size());

  strategy_->terminate(pids);
  for (auto &e : entries_) {
    if (e.second)
      e.second();
  }
  return true;
}

std::vector<pid_t> Shutdown::tracked() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<pid_t> out;
  for (const auto &e : entries_)
    out.push_back(e.first);
  return out;
}

} // namespace procmux
