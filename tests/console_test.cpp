#include "test_util.hpp"

#include <chrono>
#include <sstream>
#include <thread>

#include <unistd.h>

#include "lineshuf/progress.hpp"
#include "lineshuf/status_console.hpp"

using namespace lineshuf;

namespace {

template <typename Pred>
bool WaitFor(Pred pred) {
  for (int i = 0; i < 500; ++i) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

void TestPrintsSnapshotPerNewline() {
  int fds[2];
  assert(::pipe(fds) == 0);
  ProgressMonitor progress;
  progress.Start(2048);
  progress.SetStage(ProgressStage::kSplitting);
  progress.AddRead(1024, 10);

  std::ostringstream out;
  StatusConsole console(progress, out, fds[0]);
  console.Start();
  assert(::write(fds[1], "\n", 1) == 1);
  assert(WaitFor([&] { return console.requests_served() == 1; }));

  progress.SetStage(ProgressStage::kShuffling);
  progress.SetChunkCount(4);
  progress.AddChunkShuffled();
  assert(::write(fds[1], "x\n\n", 3) == 3);
  assert(WaitFor([&] { return console.requests_served() == 3; }));

  ::close(fds[1]);
  console.Stop();
  ::close(fds[0]);

  const auto text = out.str();
  assert(text.find("[splitting]") != std::string::npos);
  assert(text.find("(50.0%)") != std::string::npos);
  assert(text.find("chunks shuffled 1 of 4") != std::string::npos);
}

void TestStopWithoutInput() {
  int fds[2];
  assert(::pipe(fds) == 0);
  ProgressMonitor progress;
  std::ostringstream out;
  {
    StatusConsole console(progress, out, fds[0]);
    console.Start();
    console.Stop();
    console.Stop();
  }
  assert(out.str().empty());
  ::close(fds[0]);
  ::close(fds[1]);
}

void TestFormatDuration() {
  assert(FormatDuration(0.0) == "00:00:00");
  assert(FormatDuration(3725.4) == "01:02:05");
}

}  // namespace

int main() {
  TestPrintsSnapshotPerNewline();
  TestStopWithoutInput();
  TestFormatDuration();
  return 0;
}
