#pragma once
#include "chunker.hpp"
#include <ostream>
#include <vector>

// One record per chunk: "--- --- --- <bytes> --- --- ---", the chunk
// text, then a blank line.
void write_chunks(std::ostream& os, const std::vector<Chunk>& chunks);
