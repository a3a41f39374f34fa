#include <catch2/catch.hpp>
#include "include/cli.hpp"
#include "test_helpers.hpp"
#include <string>
#include <vector>

struct CliRun {
  int status;
  std::string out;
  std::string err;
};

static CliRun run(std::vector<std::string> args) {
  args.insert(args.begin(), "csvsniff");
  std::vector<char *> argv;
  for (auto &a : args)
    argv.push_back(a.data());
  argv.push_back(nullptr);

  CaptureStdout out;
  CaptureStderr err;
  int status = run_cli(static_cast<int>(args.size()), argv.data());
  return {status, out.str(), err.str()};
}

TEST_CASE("cli: prints the schema for a file", "[cli]") {
  auto r = run({fixture_path("scores.csv")});
  REQUIRE(r.status == exit_ok);
  REQUIRE(r.out == "{\"columns\":[\"id\",\"name\",\"score\"],"
                   "\"types\":[\"INTEGER\",\"TEXT\",\"REAL\"]}\n");
  REQUIRE(r.err.empty());
}

TEST_CASE("cli: quoted comma scenario", "[cli]") {
  TempCsv csv("a,b\n\"1,000\",2\n");
  auto r = run({csv.path()});
  REQUIRE(r.status == exit_ok);
  REQUIRE(r.out ==
          "{\"columns\":[\"a\",\"b\"],\"types\":[\"TEXT\",\"INTEGER\"]}\n");
}

TEST_CASE("cli: header-only file", "[cli]") {
  auto r = run({fixture_path("header_only.csv")});
  REQUIRE(r.status == exit_ok);
  REQUIRE(r.out ==
          "{\"columns\":[\"x\",\"y\"],\"types\":[\"TEXT\",\"TEXT\"]}\n");
}

TEST_CASE("cli: empty file", "[cli]") {
  auto r = run({fixture_path("empty.csv")});
  REQUIRE(r.status == exit_ok);
  REQUIRE(r.out == "{\"columns\":[],\"types\":[]}\n");
}

TEST_CASE("cli: missing file is an I/O error", "[cli]") {
  auto r = run({"nonexistent_file_xyz.csv"});
  REQUIRE(r.status == exit_io_error);
  REQUIRE(r.out.empty());
  REQUIRE(r.err.find("Error: nonexistent_file_xyz.csv") != std::string::npos);
}

TEST_CASE("cli: no arguments is a usage error", "[cli]") {
  auto r = run({});
  REQUIRE(r.status == exit_usage);
  REQUIRE(r.out.empty());
  REQUIRE(r.err.find("Usage:") != std::string::npos);
}

TEST_CASE("cli: two paths is a usage error", "[cli]") {
  auto r = run({fixture_path("scores.csv"), fixture_path("empty.csv")});
  REQUIRE(r.status == exit_usage);
  REQUIRE(r.out.empty());
}

TEST_CASE("cli: usage and I/O statuses differ", "[cli]") {
  REQUIRE(exit_usage != exit_io_error);
  REQUIRE(exit_usage != exit_ok);
  REQUIRE(exit_io_error != exit_ok);
}

TEST_CASE("cli: unknown option is a usage error", "[cli]") {
  auto r = run({"--bogus", fixture_path("scores.csv")});
  REQUIRE(r.status == exit_usage);
  REQUIRE(r.err.find("Unknown option: --bogus") != std::string::npos);
}

TEST_CASE("cli: invalid numeric option values", "[cli]") {
  REQUIRE(run({"--max-columns", "0", fixture_path("scores.csv")}).status ==
          exit_usage);
  REQUIRE(run({"--max-columns", "abc", fixture_path("scores.csv")}).status ==
          exit_usage);
  REQUIRE(run({"--max-line-length", "-5", fixture_path("scores.csv")})
              .status == exit_usage);
  REQUIRE(run({"--max-line-length", "12k", fixture_path("scores.csv")})
              .status == exit_usage);
}

TEST_CASE("cli: help exits cleanly", "[cli]") {
  auto r = run({"--help"});
  REQUIRE(r.status == exit_ok);
  REQUIRE(r.out.empty());
  REQUIRE(r.err.find("--max-columns") != std::string::npos);
}

TEST_CASE("cli: ragged rows produce one warning", "[cli]") {
  auto r = run({fixture_path("ragged.csv")});
  REQUIRE(r.status == exit_ok);
  REQUIRE(r.out == "{\"columns\":[\"a\",\"b\",\"c\",\"d\"],\"types\":["
                   "\"INTEGER\",\"REAL\",\"TEXT\",\"INTEGER\"]}\n");
  REQUIRE(r.err == "Warning: 1 of 5 rows had more fields than the header "
                   "(4); extra fields ignored\n");
}

TEST_CASE("cli: quiet suppresses warnings", "[cli]") {
  auto r = run({"-q", fixture_path("ragged.csv")});
  REQUIRE(r.status == exit_ok);
  REQUIRE(r.err.empty());
  REQUIRE_FALSE(r.out.empty());
}

TEST_CASE("cli: truncated lines are reported", "[cli]") {
  TempCsv csv("a\n" + std::string(100, '1') + "\n");
  auto r = run({"--max-line-length", "10", csv.path()});
  REQUIRE(r.status == exit_ok);
  REQUIRE(r.out == "{\"columns\":[\"a\"],\"types\":[\"INTEGER\"]}\n");
  REQUIRE(r.err.find("1 lines exceeded 10 bytes") != std::string::npos);
}

TEST_CASE("cli: header column cap is reported", "[cli]") {
  TempCsv csv("a,b,c\n1,2,3\n");
  auto r = run({"--max-columns", "2", csv.path()});
  REQUIRE(r.status == exit_ok);
  REQUIRE(r.out == "{\"columns\":[\"a\",\"b\"],"
                   "\"types\":[\"INTEGER\",\"INTEGER\"]}\n");
  REQUIRE(r.err.find("more than 2 columns") != std::string::npos);
}

TEST_CASE("cli: --ddl adds a CREATE TABLE line", "[cli]") {
  auto r = run({fixture_path("scores.csv"), "--ddl", "scores"});
  REQUIRE(r.status == exit_ok);
  REQUIRE(r.out == "{\"columns\":[\"id\",\"name\",\"score\"],"
                   "\"types\":[\"INTEGER\",\"TEXT\",\"REAL\"]}\n"
                   "CREATE TABLE IF NOT EXISTS \"scores\" (\"id\" INTEGER, "
                   "\"name\" TEXT, \"score\" REAL);\n");
}

TEST_CASE("cli: --ddl on an empty file is skipped", "[cli]") {
  auto r = run({"--ddl", "t", fixture_path("empty.csv")});
  REQUIRE(r.status == exit_ok);
  REQUIRE(r.out == "{\"columns\":[],\"types\":[]}\n");
  REQUIRE(r.err.find("CREATE TABLE skipped") != std::string::npos);
}
