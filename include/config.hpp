#pragma once
#include "chunker.hpp"
#include "cli.hpp"
#include <string>

// "space" or "none"; anything else throws std::invalid_argument.
JoinPolicy parse_join_policy(const std::string& name);

// Merge a JSON settings file into `a`:
//   { "limit": 1500, "elide_threshold": 80, "placeholder": "...",
//     "join": "space", "substitutions": "table.csv", "header": true }
// Relative "substitutions" paths resolve against the config file's directory.
// Unknown keys are warned about. Throws std::runtime_error on unreadable
// files, malformed JSON, or values of the wrong type.
void load_config(const std::string& path, Args& a);
