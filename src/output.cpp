#include "output.hpp"

void write_chunks(std::ostream& os, const std::vector<Chunk>& chunks) {
  for (auto& c : chunks) {
    os << "--- --- --- " << c.text.size() << " --- --- ---\n"
       << c.text << "\n\n";
  }
}
