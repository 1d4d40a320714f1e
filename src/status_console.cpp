#include "lineshuf/status_console.hpp"

#include <cerrno>

#include <poll.h>
#include <unistd.h>

#include "lineshuf/progress.hpp"

namespace lineshuf {

namespace {
constexpr int kPollTimeoutMs = 100;
}  // namespace

StatusConsole::StatusConsole(const ProgressMonitor& progress, std::ostream& out, int input_fd)
    : progress_(progress), out_(out), fd_(input_fd) {}

StatusConsole::~StatusConsole() { Stop(); }

void StatusConsole::Start() {
  if (thread_.joinable()) {
    return;
  }
  stop_.store(false, std::memory_order_relaxed);
  thread_ = std::thread([this]() { Loop(); });
}

void StatusConsole::Stop() {
  stop_.store(true, std::memory_order_relaxed);
  if (thread_.joinable()) {
    thread_.join();
  }
}

void StatusConsole::Loop() {
  char buf[256];
  while (!stop_.load(std::memory_order_relaxed)) {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, kPollTimeoutMs);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    if (rc == 0) {
      continue;
    }
    if ((pfd.revents & (POLLIN | POLLHUP)) == 0) {
      return;
    }
    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return;  // EOF or closed
    }
    for (ssize_t i = 0; i < n; ++i) {
      if (buf[i] == '\n') {
        out_ << progress_.FormatSnapshot() << std::endl;
        served_.fetch_add(1, std::memory_order_release);
      }
    }
  }
}

}  // namespace lineshuf
