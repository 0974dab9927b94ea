#pragma once
#include <map>
#include <string>
#include <vector>

struct SubstitutionRule {
  std::string from;  // never empty
  std::string to;
};

// Literal find/replace rules applied to the raw document before parsing.
//
// All rules are applied in one left-to-right pass over the input: at each
// position the longest matching `from` wins, and replaced text is never
// rescanned, so the result does not depend on insertion order.
class SubstitutionTable {
public:
  // Throws std::invalid_argument if `from` is empty.
  // Returns false when an existing rule for `from` was overwritten.
  bool add(const std::string& from, const std::string& to);

  bool empty() const { return rules_.empty(); }
  size_t size() const { return rules_.size(); }

  // Rules in match priority: longer `from` first, ties in byte order.
  std::vector<SubstitutionRule> rules() const;

  std::string apply(const std::string& text) const;

private:
  std::map<std::string, std::string> rules_;
};

// Load a two-column CSV table (from,to). With `has_header` the first
// record is skipped. Rows without exactly two fields are skipped with a
// warning on stderr. Throws std::runtime_error if the file is unreadable,
// std::invalid_argument (naming the line) on an empty `from`.
SubstitutionTable read_substitutions(const std::string& path, bool has_header = true);
