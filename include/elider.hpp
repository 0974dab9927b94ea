#pragma once
#include <cstddef>
#include <string>

constexpr size_t kElideThreshold = 80;
extern const char* const kListingPlaceholder;

// Code block payloads longer than `threshold` bytes are replaced by
// `placeholder`. Idempotent as long as the placeholder itself fits.
std::string elide_code_block(const std::string& literal,
                             size_t threshold = kElideThreshold,
                             const std::string& placeholder = kListingPlaceholder);
