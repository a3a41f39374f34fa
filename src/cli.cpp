#include "include/cli.hpp"
#include "include/output.hpp"
#include "include/sniffer.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

static void print_usage() {
  std::cerr
      << "Usage: csvsniff [options] <file.csv | ->\n"
      << "\n"
      << "Infers column names and SQLite-style types (INTEGER, REAL, TEXT)\n"
      << "from a comma-separated file in one pass and prints them as JSON.\n"
      << "\n"
      << "Options:\n"
      << "  --max-line-length <N>    Bytes kept per line (default: 1048576)\n"
      << "  --max-columns <N>        Fields split per line (default: 8192)\n"
      << "  --ddl <table>            Also print a CREATE TABLE statement\n"
      << "  -q, --quiet              Suppress warnings\n"
      << "  -h, --help               Show this help\n"
      << "\n"
      << "Exit status: 0 success, 1 input not readable, 2 usage error\n";
}

// Positive decimal integer, or 0 if `s` is not one.
static size_t parse_size(const char *s) {
  if (!s || *s < '0' || *s > '9')
    return 0;
  char *end = nullptr;
  errno = 0;
  unsigned long long v = std::strtoull(s, &end, 10);
  if (errno != 0 || *end != '\0')
    return 0;
  return static_cast<size_t>(v);
}

static void print_warnings(const SniffResult &result,
                           const SniffOptions &opts) {
  const SniffStats &st = result.stats;
  if (st.header_capped)
    std::cerr << "Warning: header has more than " << opts.max_columns
              << " columns; extra columns ignored\n";
  if (st.long_rows > 0)
    std::cerr << "Warning: " << st.long_rows << " of " << st.data_rows
              << " rows had more fields than the header ("
              << result.schema.size() << "); extra fields ignored\n";
  if (st.truncated_lines > 0)
    std::cerr << "Warning: " << st.truncated_lines << " lines exceeded "
              << opts.max_line_length << " bytes and were truncated\n";
}

int run_cli(int argc, char *argv[]) {
  SniffOptions opts;
  std::string input_path;
  std::string ddl_table;
  bool want_ddl = false;
  bool quiet = false;
  int positionals = 0;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--max-line-length") == 0 && i + 1 < argc) {
      opts.max_line_length = parse_size(argv[++i]);
      if (opts.max_line_length == 0) {
        std::cerr << "Invalid --max-line-length: " << argv[i] << "\n";
        return exit_usage;
      }
    } else if (std::strcmp(argv[i], "--max-columns") == 0 && i + 1 < argc) {
      opts.max_columns = parse_size(argv[++i]);
      if (opts.max_columns == 0) {
        std::cerr << "Invalid --max-columns: " << argv[i] << "\n";
        return exit_usage;
      }
    } else if (std::strcmp(argv[i], "--ddl") == 0 && i + 1 < argc) {
      ddl_table = argv[++i];
      want_ddl = true;
    } else if (std::strcmp(argv[i], "-q") == 0 ||
               std::strcmp(argv[i], "--quiet") == 0) {
      quiet = true;
    } else if (std::strcmp(argv[i], "-h") == 0 ||
               std::strcmp(argv[i], "--help") == 0) {
      print_usage();
      return exit_ok;
    } else if (argv[i][0] != '-' || std::strcmp(argv[i], "-") == 0) {
      input_path = argv[i];
      ++positionals;
    } else {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      print_usage();
      return exit_usage;
    }
  }

  if (positionals != 1) {
    std::cerr << "Expected exactly one input file, got " << positionals
              << "\n";
    print_usage();
    return exit_usage;
  }

  try {
    SniffResult result = sniff_schema(input_path.c_str(), opts);

    render_schema_json(result.schema);
    if (want_ddl) {
      if (result.schema.empty()) {
        if (!quiet)
          std::cerr << "Warning: no columns found; CREATE TABLE skipped\n";
      } else {
        render_create_table(result.schema, ddl_table);
      }
    }

    if (!quiet)
      print_warnings(result, opts);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return exit_io_error;
  }

  return exit_ok;
}
