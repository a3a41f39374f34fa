#pragma once

#include "type_lattice.hpp"
#include <cstddef>
#include <vector>

struct SniffOptions {
  char delimiter = ',';
  size_t max_line_length = 1 << 20;
  size_t max_columns = 8192;
};

struct SniffStats {
  size_t data_rows = 0;
  size_t long_rows = 0;       // rows with more fields than the header
  size_t truncated_lines = 0; // lines cut at max_line_length
  bool header_capped = false; // header reached max_columns
};

struct SniffResult {
  std::vector<ColumnSchema> schema;
  SniffStats stats;
};

// Single pass over `path` ("-" for stdin). Throws std::runtime_error if the
// input cannot be opened or read; content problems never throw.
SniffResult sniff_schema(const char *path, const SniffOptions &opts = {});
