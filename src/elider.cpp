#include "elider.hpp"

const char* const kListingPlaceholder = "listing omitted; please see the original source";

std::string elide_code_block(const std::string& literal, size_t threshold,
                             const std::string& placeholder) {
  if (literal.size() > threshold) return placeholder;
  return literal;
}
