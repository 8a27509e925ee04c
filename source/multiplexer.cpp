#include <procmux/error.hpp>
#include <procmux/multiplexer.hpp>

#include <spdlog/spdlog.h>

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace procmux {

static constexpr int kPollPeriodMs = 100;
// сколько чтений делаем после stop, чтобы не зависнуть на бесконечном писателе
static constexpr int kDrainReads = 64;

static bool write_all(int fd, const char *p, size_t n) {
  while (n > 0) {
    ssize_t w = ::write(fd, p, n);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    p += w;
    n -= static_cast<size_t>(w);
  }
  return true;
}

LogMultiplexer::LogMultiplexer(int in_fd, int out_fd, LineFormat format)
    : in_fd_(in_fd), out_fd_(out_fd), format_(std::move(format)) {
  if (!format_)
    throw UsageError("log multiplexer: no line formatter configured");
}

void LogMultiplexer::emit(std::string_view line) {
  ++emitted_;
  if (!sink_ok_)
    return;
  std::string rec = format_(line);
  rec.push_back('\n');
  if (!write_all(out_fd_, rec.data(), rec.size())) {
    spdlog::warn("[mux] output write failed: {}; dropping further lines",
                 std::strerror(errno));
    sink_ok_ = false;
  }
}

std::size_t LogMultiplexer::run() {
  std::atomic_bool never{false};
  return run(never);
}

std::size_t LogMultiplexer::run(const std::atomic_bool &stop) {
  std::string pending;
  char buf[4096];
  int drain_left = kDrainReads;

  for (;;) {
    bool stopping = stop.load();
    if (stopping && drain_left-- <= 0)
      break;

    pollfd p{in_fd_, POLLIN, 0};
    int rc = ::poll(&p, 1, stopping ? 0 : kPollPeriodMs);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "poll");
    }
    if (rc == 0) {
      if (stopping)
        break;
      continue;
    }

    ssize_t n = ::read(in_fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN)
        continue;
      throw std::system_error(errno, std::generic_category(), "read");
    }
    if (n == 0)
      break;

    pending.append(buf, static_cast<size_t>(n));
    size_t start = 0;
    for (;;) {
      auto nl = pending.find('\n', start);
      if (nl == std::string::npos)
        break;
      emit(std::string_view(pending).substr(start, nl - start));
      start = nl + 1;
    }
    pending.erase(0, start);
  }

  // последняя строка без '\n' — тоже запись
  if (!pending.empty())
    emit(pending);
  return emitted_;
}

} // namespace procmux
