#include "app.hpp"
#include "chunker.hpp"
#include "output.hpp"
#include "substitutions.hpp"
#include "textio.hpp"

#include <exception>

int run(const Args& args, std::ostream& out, std::ostream& err) {
  try {
    std::string content = read_text_file(args.input_path);
    if (args.verbose) err << "Read " << content.size() << " bytes from " << args.input_path << "\n";

    if (!args.substitutions_path.empty()) {
      auto table = read_substitutions(args.substitutions_path, args.header);
      if (args.verbose) err << "Loaded " << table.size() << " substitutions\n";
      content = table.apply(content);
    }

    ChunkStats stats;
    auto chunks = chunk_markdown(content, args.chunk, &stats);
    write_chunks(out, chunks);
    out.flush();
    if (!out) {
      err << "error: failed writing chunks\n";
      return 1;
    }

    if (args.verbose) {
      err << stats.leaves << " leaves (";
      for (int k = 0; k < kLeafKindCount; ++k) {
        if (k) err << ", ";
        err << stats.by_kind[k] << " " << leaf_kind_name(static_cast<LeafKind>(k));
      }
      err << "), " << stats.elided << " listings omitted, "
          << chunks.size() << " chunks (limit " << args.chunk.limit << ")\n";
      if (stats.oversized) {
        err << stats.oversized << " chunk(s) hold a single leaf over the limit\n";
      }
    }
  } catch (const std::exception& e) {
    err << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
