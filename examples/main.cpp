#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "lineshuf/pipeline.hpp"
#include "lineshuf/progress.hpp"

int main() {
  using namespace lineshuf;

  const std::filesystem::path tmp = std::filesystem::temp_directory_path();
  const std::string input = (tmp / "lineshuf_example_input.txt").string();
  {
    std::ofstream out(input);
    for (int i = 1; i <= 20; ++i) {
      out << "line " << i << '\n';
    }
  }

  ShuffleOptions opts;
  opts.chunk_records = 6;
  opts.output_path = (tmp / "lineshuf_example_output.txt").string();
  opts.seed = 42;
  opts.num_threads = 2;

  ProgressMonitor progress;
  auto summary = ShuffleFile(input, opts, &progress);
  std::cout << "Shuffled " << summary.records << " lines across " << summary.chunks << " chunks\n";
  std::cout << progress.FormatSnapshot() << "\n";

  std::ifstream in(opts.output_path);
  std::string line;
  while (std::getline(in, line)) {
    std::cout << line << '\n';
  }
  std::filesystem::remove(input);
  std::filesystem::remove(opts.output_path);
  return 0;
}
