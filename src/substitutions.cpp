#include "substitutions.hpp"
#include "csv.hpp"
#include "textio.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <stdexcept>

bool SubstitutionTable::add(const std::string& from, const std::string& to) {
  if (from.empty()) throw std::invalid_argument("substitution with empty 'from'");
  auto res = rules_.insert_or_assign(from, to);
  return res.second;
}

std::vector<SubstitutionRule> SubstitutionTable::rules() const {
  std::vector<SubstitutionRule> out;
  out.reserve(rules_.size());
  for (auto& kv : rules_) out.push_back({kv.first, kv.second});
  // map order already breaks ties lexicographically; stable_sort keeps it
  std::stable_sort(out.begin(), out.end(), [](const SubstitutionRule& a, const SubstitutionRule& b) {
    return a.from.size() > b.from.size();
  });
  return out;
}

std::string SubstitutionTable::apply(const std::string& text) const {
  if (rules_.empty() || text.empty()) return text;

  // One alternation of quoted literals, longest first. RE2's leftmost-first
  // semantics then pick the longest key starting at the leftmost match.
  std::string pattern;
  for (auto& r : rules()) {
    if (!pattern.empty()) pattern += '|';
    pattern += RE2::QuoteMeta(r.from);
  }
  RE2::Options opts;
  opts.set_encoding(RE2::Options::EncodingLatin1);  // byte-literal matching
  opts.set_log_errors(false);
  opts.set_max_mem(int64_t(256) << 20);
  RE2 re(pattern, opts);
  if (!re.ok()) throw std::runtime_error("substitution table: " + re.error());

  std::string out;
  out.reserve(text.size());
  re2::StringPiece input(text);
  re2::StringPiece m;
  size_t pos = 0;
  while (pos < text.size() && re.Match(input, pos, text.size(), RE2::UNANCHORED, &m, 1)) {
    size_t start = (size_t)(m.data() - text.data());
    out.append(text, pos, start - pos);
    out.append(rules_.at(std::string(m.data(), m.size())));
    pos = start + m.size();
  }
  out.append(text, pos, std::string::npos);
  return out;
}

SubstitutionTable read_substitutions(const std::string& path, bool has_header) {
  auto records = parse_csv(read_text_file(path));

  SubstitutionTable table;
  bool first = true;
  for (auto& rec : records) {
    if (first) {
      first = false;
      if (has_header) continue;
    }
    if (rec.fields.size() != 2) {
      std::cerr << "warning: " << path << ":" << rec.line << ": expected 2 fields, got "
                << rec.fields.size() << "; row skipped\n";
      continue;
    }
    try {
      if (!table.add(rec.fields[0], rec.fields[1])) {
        std::cerr << "warning: " << path << ":" << rec.line << ": duplicate key '"
                  << rec.fields[0] << "'; later row wins\n";
      }
    } catch (const std::invalid_argument& e) {
      throw std::invalid_argument(path + ":" + std::to_string(rec.line) + ": " + e.what());
    }
  }
  return table;
}
