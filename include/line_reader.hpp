#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Reads a file (or stdin for "-") one line at a time through a fixed-size
// chunk buffer. Lines longer than max_line_length are cut at that length and
// the rest of the physical line is skipped.
class LineReader {
private:
  int fd_ = -1;
  bool owns_fd_ = false;
  std::string path_;

  std::vector<char> buf_;
  size_t pos_ = 0;
  size_t len_ = 0;
  bool eof_ = false;

  size_t max_line_;
  size_t line_no_ = 0;
  size_t truncated_lines_ = 0;

  bool fill();

public:
  static constexpr size_t chunk_size = 1 << 16; // 64KB

  LineReader() = delete;
  LineReader(const char *file_name, size_t max_line_length);
  ~LineReader();
  LineReader(const LineReader &) = delete;
  LineReader &operator=(const LineReader &) = delete;

  // Stores the next line, without its terminator or trailing CRs, in `line`.
  // Returns false at end of input. Throws std::runtime_error on read errors.
  bool next(std::string &line);

  size_t line_number() const { return line_no_; }
  size_t truncated_lines() const { return truncated_lines_; }
  const std::string &path() const { return path_; }
};
