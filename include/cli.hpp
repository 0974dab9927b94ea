#pragma once
#include "chunker.hpp"
#include <string>

struct Args {
  std::string input_path;
  std::string substitutions_path;  // empty: no substitution pass
  std::string config_path;
  bool header = true;              // substitution table starts with a header row
  bool verbose = false;
  ChunkOptions chunk;
};

// Defaults, then the --config file, then the remaining flags.
// Exits with status 1 on usage errors; a bad config file throws.
Args parse_cli(int argc, char** argv);
