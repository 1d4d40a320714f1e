#include "lineshuf/record_reader.hpp"

#include <filesystem>
#include <system_error>

#include "lineshuf/errors.hpp"

namespace lineshuf {

namespace {
constexpr std::size_t kGzBufferBytes = 1 << 16;

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}  // namespace

RecordReader::RecordReader(const std::string& path) : path_(path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw ShuffleError(ErrorKind::kIoFailure, Stage::kSplit, "cannot read input " + path + ": " + ec.message());
  }
  total_bytes_ = static_cast<std::uint64_t>(size);

  if (EndsWith(path, ".gz")) {
    gz_ = gzopen(path.c_str(), "rb");
    if (!gz_) {
      throw ShuffleError(ErrorKind::kIoFailure, Stage::kSplit, "cannot open gzip input " + path);
    }
    gz_buf_.resize(kGzBufferBytes);
    return;
  }

  plain_.open(path, std::ios::binary);
  if (!plain_) {
    throw ShuffleError(ErrorKind::kIoFailure, Stage::kSplit, "cannot open input " + path);
  }
}

RecordReader::~RecordReader() {
  if (gz_) {
    gzclose(gz_);
  }
}

bool RecordReader::Next(std::string& record) {
  if (gz_) {
    return NextGz(record);
  }
  if (!std::getline(plain_, record)) {
    if (plain_.bad()) {
      throw ShuffleError(ErrorKind::kIoFailure, Stage::kSplit, "read error on " + path_);
    }
    return false;
  }
  consumed_ += record.size() + (plain_.eof() ? 0 : 1);
  return true;
}

bool RecordReader::NextGz(std::string& record) {
  record.clear();
  bool any = false;
  while (true) {
    if (gz_pos_ == gz_len_) {
      if (gz_eof_) {
        return any;
      }
      int n = gzread(gz_, gz_buf_.data(), static_cast<unsigned>(gz_buf_.size()));
      if (n < 0) {
        int errnum = 0;
        const char* msg = gzerror(gz_, &errnum);
        throw ShuffleError(ErrorKind::kIoFailure, Stage::kSplit,
                           "gzip read error on " + path_ + ": " + (msg ? msg : "unknown"));
      }
      gz_pos_ = 0;
      gz_len_ = static_cast<std::size_t>(n);
      if (n == 0) {
        gz_eof_ = true;
        consumed_ = total_bytes_;
        return any;
      }
      auto off = gzoffset(gz_);
      if (off >= 0) {
        consumed_ = static_cast<std::uint64_t>(off);
      }
    }
    const char* begin = gz_buf_.data() + gz_pos_;
    const char* end = gz_buf_.data() + gz_len_;
    for (const char* p = begin; p != end; ++p) {
      if (*p == '\n') {
        record.append(begin, p);
        gz_pos_ += static_cast<std::size_t>(p - begin) + 1;
        return true;
      }
    }
    record.append(begin, end);
    gz_pos_ = gz_len_;
    any = true;
  }
}

std::uint64_t RecordReader::bytes_consumed() const { return consumed_; }

}  // namespace lineshuf
