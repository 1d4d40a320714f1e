#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include <zlib.h>

namespace lineshuf {

// Reads newline-delimited records from a plain or gzip-compressed (.gz) file.
// The '\n' terminator is stripped; every other byte is passed through unchanged.
class RecordReader {
 public:
  explicit RecordReader(const std::string& path);
  ~RecordReader();

  RecordReader(const RecordReader&) = delete;
  RecordReader& operator=(const RecordReader&) = delete;

  // Returns false at end of input. Throws ShuffleError(kIoFailure) on read errors.
  bool Next(std::string& record);

  // On-disk size of the input (compressed size for .gz).
  [[nodiscard]] std::uint64_t total_bytes() const { return total_bytes_; }
  // On-disk bytes consumed so far.
  [[nodiscard]] std::uint64_t bytes_consumed() const;
  [[nodiscard]] const std::string& path() const { return path_; }

 private:
  bool NextGz(std::string& record);

  std::string path_;
  std::ifstream plain_;
  gzFile gz_ = nullptr;
  std::vector<char> gz_buf_;
  std::size_t gz_pos_ = 0;
  std::size_t gz_len_ = 0;
  bool gz_eof_ = false;
  std::uint64_t total_bytes_ = 0;
  std::uint64_t consumed_ = 0;
};

}  // namespace lineshuf
