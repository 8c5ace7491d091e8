// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: habitrack [options]\n\n"
      << "Track habits and streaks from an interactive terminal menu.\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -c, --config <file>        Use a specific configuration file\n"
      << "                             (default: config.yaml)\n"
      << "  -d, --db <file>            Use this database file for this run\n\n"
      << "Keys: Up/Down move, Enter selects, Esc goes back, Ctrl+C quits.\n"
      << std::endl;
}
