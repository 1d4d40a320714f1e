#pragma once

#include <atomic>
#include <cstdint>
#include <ostream>
#include <thread>

namespace lineshuf {

class ProgressMonitor;

// Prints a progress snapshot every time a line arrives on input_fd. Runs on its own
// thread and only reads the monitor.
class StatusConsole {
 public:
  StatusConsole(const ProgressMonitor& progress, std::ostream& out, int input_fd = 0);
  ~StatusConsole();

  StatusConsole(const StatusConsole&) = delete;
  StatusConsole& operator=(const StatusConsole&) = delete;

  void Start();
  void Stop();

  [[nodiscard]] std::uint64_t requests_served() const {
    return served_.load(std::memory_order_acquire);
  }

 private:
  void Loop();

  const ProgressMonitor& progress_;
  std::ostream& out_;
  int fd_;
  std::atomic<bool> stop_{false};
  std::atomic<std::uint64_t> served_{0};
  std::thread thread_;
};

}  // namespace lineshuf
