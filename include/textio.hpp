#pragma once
#include <cstddef>
#include <string>

// Offset of the first byte that breaks UTF-8 well-formedness,
// or std::string::npos if the whole buffer is valid.
size_t find_invalid_utf8(const std::string& data);

// Read a file fully into memory. Throws std::runtime_error when the file
// cannot be opened or read, or when its contents are not valid UTF-8.
std::string read_text_file(const std::string& path);
