#include "csv.hpp"

std::vector<CsvRecord> parse_csv(const std::string& data) {
  std::vector<CsvRecord> out;
  CsvRecord rec{1, {}};
  std::string field;
  bool in_quotes = false;
  bool touched = false;  // current record has any content
  bool started = false;  // current field has any content
  int line = 1;

  auto end_field = [&]() {
    rec.fields.push_back(std::move(field));
    field.clear();
    started = false;
  };
  auto end_record = [&]() {
    if (touched) {
      end_field();
      out.push_back(std::move(rec));
    }
    field.clear();
    started = false;
    rec = CsvRecord{line, {}};
    touched = false;
  };

  const size_t n = data.size();
  for (size_t i = 0; i < n; ++i) {
    char c = data[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < n && data[i+1] == '"') { field += '"'; ++i; }
        else in_quotes = false;
      } else {
        if (c == '\n') ++line;
        field += c;
      }
      continue;
    }
    switch (c) {
      case '"':
        // only a field-leading quote opens a quoted field
        if (!started) in_quotes = true;
        else field += c;
        started = touched = true;
        break;
      case ',':
        end_field();
        touched = true;
        break;
      case '\r':
        if (i + 1 < n && data[i+1] == '\n') break;  // CRLF: newline handles it
        ++line;
        end_record();
        break;
      case '\n':
        ++line;
        end_record();
        break;
      default:
        field += c;
        started = touched = true;
    }
  }
  end_record();
  return out;
}
