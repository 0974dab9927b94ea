#pragma once
#include <string>
#include <vector>

struct CsvRecord {
  int line;                         // 1-based line the record starts on
  std::vector<std::string> fields;
};

// Split comma-separated text into records. Handles RFC 4180 quoting
// ("" inside quotes, embedded commas and newlines) and CRLF line ends.
// A quote opens a quoted field only as the field's first character;
// anywhere else it is literal text.
// Blank lines produce no record. Never throws.
std::vector<CsvRecord> parse_csv(const std::string& data);
