#pragma once

// Exit statuses returned by run_cli.
constexpr int exit_ok = 0;
constexpr int exit_io_error = 1;
constexpr int exit_usage = 2;

int run_cli(int argc, char *argv[]);
