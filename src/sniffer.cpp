#include "include/sniffer.hpp"
#include "include/line_reader.hpp"
#include "include/record_splitter.hpp"
#include <string>
#include <utility>

SniffResult sniff_schema(const char *path, const SniffOptions &opts) {
  SniffResult result;
  LineReader reader(path, opts.max_line_length);
  RecordSplitter splitter(opts.delimiter, opts.max_columns);

  std::string line;
  line.reserve(opts.max_line_length < 4096 ? opts.max_line_length : 4096);

  if (!reader.next(line))
    return result;

  auto header = splitter.split(strip_bom(line));
  result.stats.header_capped = splitter.capped();
  if (header.empty()) {
    result.stats.truncated_lines = reader.truncated_lines();
    return result;
  }

  std::vector<std::string> names(header.begin(), header.end());
  const size_t ncols = names.size();
  TypeLattice lattice(ncols);

  while (reader.next(line)) {
    auto row = splitter.split(line);
    ++result.stats.data_rows;
    if (row.size() > ncols || splitter.capped())
      ++result.stats.long_rows;

    // Missing trailing cells are empty and leave their columns untouched
    size_t n = row.size() < ncols ? row.size() : ncols;
    for (size_t col = 0; col < n; ++col)
      lattice.observe(col, row[col]);
  }

  result.stats.truncated_lines = reader.truncated_lines();

  auto types = lattice.finalize();
  result.schema.reserve(ncols);
  for (size_t col = 0; col < ncols; ++col)
    result.schema.push_back({std::move(names[col]), types[col]});
  return result;
}
