#include "config.hpp"
#include "textio.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
size_t get_count(const json& v, const std::string& key, bool allow_zero) {
  if (!v.is_number_unsigned() || (!allow_zero && v.get<size_t>() == 0)) {
    throw std::runtime_error("'" + key + "' must be a " +
                             (allow_zero ? "non-negative" : "positive") + " integer");
  }
  return v.get<size_t>();
}

std::string get_string(const json& v, const std::string& key) {
  if (!v.is_string()) throw std::runtime_error("'" + key + "' must be a string");
  return v.get<std::string>();
}
}

JoinPolicy parse_join_policy(const std::string& name) {
  if (name == "space") return JoinPolicy::Space;
  if (name == "none") return JoinPolicy::None;
  throw std::invalid_argument("join policy must be 'space' or 'none', got '" + name + "'");
}

void load_config(const std::string& path, Args& a) {
  json j;
  try {
    j = json::parse(read_text_file(path));
  } catch (const json::parse_error& e) {
    throw std::runtime_error(path + ": " + e.what());
  }
  if (!j.is_object()) throw std::runtime_error(path + ": expected a JSON object");

  try {
    for (auto it = j.begin(); it != j.end(); ++it) {
      const std::string& key = it.key();
      const json& v = it.value();
      if (key == "limit") a.chunk.limit = get_count(v, key, false);
      else if (key == "elide_threshold") a.chunk.elide_threshold = get_count(v, key, true);
      else if (key == "placeholder") a.chunk.placeholder = get_string(v, key);
      else if (key == "join") a.chunk.join = parse_join_policy(get_string(v, key));
      else if (key == "substitutions") {
        fs::path p = get_string(v, key);
        if (p.is_relative()) p = fs::path(path).parent_path() / p;
        a.substitutions_path = p.string();
      }
      else if (key == "header") {
        if (!v.is_boolean()) throw std::runtime_error("'header' must be true or false");
        a.header = v.get<bool>();
      }
      else std::cerr << "warning: " << path << ": unknown key '" << key << "' ignored\n";
    }
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(path + ": " + e.what());
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}
