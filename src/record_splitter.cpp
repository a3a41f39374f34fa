#include "include/record_splitter.hpp"

std::string_view strip_bom(std::string_view line) {
  if (line.size() >= 3 && line[0] == '\xef' && line[1] == '\xbb' &&
      line[2] == '\xbf')
    line.remove_prefix(3);
  return line;
}

RecordSplitter::RecordSplitter(char delimiter, size_t max_fields)
    : delim_(delimiter), max_fields_(max_fields) {}

// Decodes the quoted field starting at line[i] into scratch_ and returns the
// index of the delimiter that ends it (or line.size()).
size_t RecordSplitter::split_quoted(std::string_view line, size_t i) {
  const size_t end = line.size();
  const size_t start = scratch_.size();

  ++i; // opening quote
  while (i < end) {
    if (line[i] == '"') {
      if (i + 1 < end && line[i + 1] == '"') {
        scratch_ += '"';
        i += 2;
      } else {
        ++i; // closing quote
        break;
      }
    } else {
      scratch_ += line[i++];
    }
  }

  // Anything between the closing quote and the delimiter is dropped
  while (i < end && line[i] != delim_)
    ++i;

  fields_.emplace_back(scratch_.data() + start, scratch_.size() - start);
  return i;
}

std::span<const std::string_view>
RecordSplitter::split(std::string_view line) {
  fields_.clear();
  scratch_.clear();
  capped_ = false;
  if (line.empty())
    return {};

  // Decoded content never outgrows the line, so views into scratch_ stay valid
  if (scratch_.capacity() < line.size())
    scratch_.reserve(line.size());

  const size_t end = line.size();
  size_t i = 0;
  for (;;) {
    if (fields_.size() == max_fields_) {
      capped_ = true;
      break;
    }

    if (i < end && line[i] == '"') {
      i = split_quoted(line, i);
    } else {
      size_t fs = i;
      while (i < end && line[i] != delim_)
        ++i;
      fields_.push_back(line.substr(fs, i - fs));
    }

    if (i >= end)
      break;
    ++i; // delimiter; a trailing one yields one more empty field
  }

  return fields_;
}
