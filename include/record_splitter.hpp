#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Removes a leading UTF-8 byte-order mark, if present.
std::string_view strip_bom(std::string_view line);

// Splits single physical lines into fields. Unquoted fields are views into the
// line passed to split(); decoded quoted fields are views into an internal
// scratch buffer. Both are valid until the next call to split().
class RecordSplitter {
private:
  char delim_;
  size_t max_fields_;
  bool capped_ = false;

  std::string scratch_;
  std::vector<std::string_view> fields_;

  size_t split_quoted(std::string_view line, size_t i);

public:
  RecordSplitter(char delimiter, size_t max_fields);
  RecordSplitter(const RecordSplitter &) = delete;
  RecordSplitter &operator=(const RecordSplitter &) = delete;

  std::span<const std::string_view> split(std::string_view line);

  // True if the last split stopped at max_fields with input left over.
  bool capped() const { return capped_; }
  char delimiter() const { return delim_; }
  size_t max_fields() const { return max_fields_; }
};
