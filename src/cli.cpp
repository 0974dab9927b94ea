#include "cli.hpp"
#include "config.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

static const char* USAGE =
"mdchunk <input.md> [-s|--substitutions table.csv] [--no-header] [-l|--limit N]\n"
"        [--elide-threshold N] [--placeholder TEXT] [--join space|none]\n"
"        [--config settings.json] [-v|--verbose]\n"
"The placeholder must be no longer than the elide threshold (default\n"
"placeholder: 47 bytes); pass a shorter --placeholder with a lower threshold.\n";

static bool takes_value(const std::string& f) {
  return f == "-i" || f == "--input" || f == "-s" || f == "--substitutions" ||
         f == "-l" || f == "--limit" || f == "--elide-threshold" ||
         f == "--placeholder" || f == "--join" || f == "--config";
}

static size_t to_count(const std::string& flag, const std::string& v, bool allow_zero) {
  size_t used = 0;
  unsigned long long n = 0;
  bool ok = !v.empty() && v[0] != '-' && v[0] != '+';
  if (ok) {
    try { n = std::stoull(v, &used); } catch (const std::exception&) { ok = false; }
  }
  if (!ok || used != v.size() || (!allow_zero && n == 0)) {
    std::cerr << "Invalid value for " << flag << ": " << v << "\n";
    std::exit(1);
  }
  return (size_t)n;
}

Args parse_cli(int argc, char** argv) {
  Args a;
  std::vector<std::pair<std::string, std::string>> flags;
  int i = 1;
  while (i < argc) {
    std::string f = argv[i++];
    if (f == "-h" || f == "--help") { std::cout << USAGE; std::exit(0); }
    if (f == "-v" || f == "--verbose" || f == "--no-header") {
      flags.emplace_back(f, "");
    } else if (takes_value(f)) {
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      flags.emplace_back(f, argv[i++]);
    } else if (f.size() > 1 && f[0] == '-') {
      std::cerr << "Unknown flag: " << f << "\n"; std::exit(1);
    } else {
      flags.emplace_back("--input", f);
    }
  }

  for (auto& kv : flags) {
    if (kv.first == "--config") a.config_path = kv.second;
  }
  if (!a.config_path.empty()) load_config(a.config_path, a);

  for (auto& kv : flags) {
    const std::string& f = kv.first;
    const std::string& v = kv.second;
    if (f == "-i" || f == "--input") {
      if (!a.input_path.empty()) { std::cerr << "Unexpected argument: " << v << "\n"; std::exit(1); }
      a.input_path = v;
    }
    else if (f == "-s" || f == "--substitutions") a.substitutions_path = v;
    else if (f == "--no-header") a.header = false;
    else if (f == "-l" || f == "--limit") a.chunk.limit = to_count(f, v, false);
    else if (f == "--elide-threshold") a.chunk.elide_threshold = to_count(f, v, true);
    else if (f == "--placeholder") a.chunk.placeholder = v;
    else if (f == "--join") {
      try { a.chunk.join = parse_join_policy(v); }
      catch (const std::invalid_argument& e) { std::cerr << e.what() << "\n"; std::exit(1); }
    }
    else if (f == "-v" || f == "--verbose") a.verbose = true;
  }

  if (a.input_path.empty()) { std::cerr << USAGE; std::exit(1); }
  if (a.chunk.placeholder.size() > a.chunk.elide_threshold) {
    std::cerr << "Placeholder (" << a.chunk.placeholder.size()
              << " bytes) must not exceed the elide threshold (" << a.chunk.elide_threshold
              << "); pass a shorter --placeholder\n";
    std::exit(1);
  }
  return a;
}
