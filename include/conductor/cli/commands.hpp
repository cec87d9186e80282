#pragma once

namespace conductor::cli {

int run_cli(int argc, char **argv);
void print_help();

} // namespace conductor::cli
