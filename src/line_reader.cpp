#include "include/line_reader.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>

static std::runtime_error io_error(const std::string &path) {
  int err = errno;
  return std::runtime_error(path + ": " + std::strerror(err));
}

LineReader::LineReader(const char *file_name, size_t max_line_length)
    : path_(file_name), buf_(chunk_size), max_line_(max_line_length) {
  if (std::strcmp(file_name, "-") == 0) {
    fd_ = STDIN_FILENO;
    return;
  }

  fd_ = open(file_name, O_RDONLY);
  if (fd_ < 0)
    throw io_error(path_);
  owns_fd_ = true;
}

LineReader::~LineReader() {
  if (owns_fd_ && fd_ >= 0)
    close(fd_);
}

bool LineReader::fill() {
  if (eof_)
    return false;

  ssize_t n;
  do {
    n = ::read(fd_, buf_.data(), buf_.size());
  } while (n < 0 && errno == EINTR);

  if (n < 0)
    throw io_error(path_);
  if (n == 0) {
    eof_ = true;
    return false;
  }
  pos_ = 0;
  len_ = static_cast<size_t>(n);
  return true;
}

bool LineReader::next(std::string &line) {
  line.clear();
  bool got_bytes = false;
  bool truncated = false;

  for (;;) {
    if (pos_ == len_ && !fill())
      break;
    got_bytes = true;

    const char *start = buf_.data() + pos_;
    size_t avail = len_ - pos_;
    const void *nl = memchr(start, '\n', avail);
    size_t chunk =
        nl ? static_cast<size_t>(static_cast<const char *>(nl) - start)
           : avail;

    size_t room = max_line_ - std::min(max_line_, line.size());
    if (chunk > room)
      truncated = true;
    line.append(start, std::min(chunk, room));

    if (nl) {
      pos_ += chunk + 1;
      break;
    }
    pos_ = len_;
  }

  if (!got_bytes)
    return false;

  if (truncated)
    ++truncated_lines_;
  while (!line.empty() && line.back() == '\r')
    line.pop_back();
  ++line_no_;
  return true;
}
