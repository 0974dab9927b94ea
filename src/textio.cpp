#include "textio.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

size_t find_invalid_utf8(const std::string& data) {
  const size_t n = data.size();
  size_t i = 0;
  while (i < n) {
    unsigned char c = (unsigned char)data[i];
    if (c < 0x80) { ++i; continue; }

    int len;
    unsigned char lo = 0x80, hi = 0xBF; // allowed range of the 2nd byte
    if (c >= 0xC2 && c <= 0xDF) len = 2;
    else if (c == 0xE0) { len = 3; lo = 0xA0; }          // no overlongs
    else if (c >= 0xE1 && c <= 0xEC) len = 3;
    else if (c == 0xED) { len = 3; hi = 0x9F; }          // no surrogates
    else if (c >= 0xEE && c <= 0xEF) len = 3;
    else if (c == 0xF0) { len = 4; lo = 0x90; }
    else if (c >= 0xF1 && c <= 0xF3) len = 4;
    else if (c == 0xF4) { len = 4; hi = 0x8F; }          // <= U+10FFFF
    else return i;

    if (i + len > n) return i;
    unsigned char c1 = (unsigned char)data[i+1];
    if (c1 < lo || c1 > hi) return i;
    for (int k = 2; k < len; ++k) {
      unsigned char ck = (unsigned char)data[i+k];
      if (ck < 0x80 || ck > 0xBF) return i;
    }
    i += len;
  }
  return std::string::npos;
}

std::string read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  std::string data;
  {
    std::ostringstream ss; ss << in.rdbuf(); data = ss.str();
  }
  if (in.bad()) throw std::runtime_error("read failed: " + path);

  size_t bad = find_invalid_utf8(data);
  if (bad != std::string::npos) {
    throw std::runtime_error(path + ": invalid UTF-8 at byte offset " + std::to_string(bad));
  }
  return data;
}
