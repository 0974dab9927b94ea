#pragma once
#include "cli.hpp"
#include <ostream>

// Read, substitute, chunk and print. Chunk records go to `out`,
// diagnostics to `err`. Returns the process exit status: 0 on success,
// 1 when the document or substitution table cannot be read or output fails.
int run(const Args& args, std::ostream& out, std::ostream& err);
