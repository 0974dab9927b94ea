#include "chunker.hpp"
#include <stdexcept>

ChunkAccumulator::ChunkAccumulator(size_t limit, JoinPolicy join)
  : limit_(limit), join_(join) {
  if (limit_ == 0) throw std::invalid_argument("chunk limit must be positive");
}

void ChunkAccumulator::push(const std::string& payload) {
  if (payload.empty()) return;
  size_t index = next_index_++;

  size_t sep = (!buf_.empty() && join_ == JoinPolicy::Space) ? 1 : 0;
  if (!buf_.empty() && buf_.size() + sep + payload.size() > limit_) {
    flush();
    sep = 0;
  }
  if (buf_.empty()) first_ = index;
  if (sep) buf_ += ' ';
  buf_ += payload;
  ++count_;
}

void ChunkAccumulator::flush() {
  if (buf_.empty()) return;
  out_.push_back(Chunk{std::move(buf_), first_, count_});
  buf_.clear();
  count_ = 0;
}

std::vector<Chunk> ChunkAccumulator::finish() {
  flush();
  std::vector<Chunk> out;
  out.swap(out_);
  next_index_ = 0;
  return out;
}

std::vector<Chunk> chunk_leaves(const std::vector<std::string>& payloads, size_t limit,
                                JoinPolicy join) {
  ChunkAccumulator acc(limit, join);
  for (auto& p : payloads) acc.push(p);
  return acc.finish();
}

std::vector<Chunk> chunk_source(LeafSource& source, const ChunkOptions& opts,
                                ChunkStats* stats) {
  ChunkAccumulator acc(opts.limit, opts.join);
  ChunkStats st;
  Leaf leaf;
  while (source.next(leaf)) {
    ++st.leaves;
    ++st.by_kind[static_cast<int>(leaf.kind)];
    if (leaf.kind == LeafKind::CodeBlock) {
      if (leaf.text.size() > opts.elide_threshold) ++st.elided;
      acc.push(elide_code_block(leaf.text, opts.elide_threshold, opts.placeholder));
    } else {
      acc.push(leaf.text);
    }
  }
  auto chunks = acc.finish();
  for (auto& c : chunks) {
    if (c.leaf_count == 1 && c.text.size() > opts.limit) ++st.oversized;
  }
  if (stats) *stats = st;
  return chunks;
}

std::vector<Chunk> chunk_markdown(const std::string& markdown, const ChunkOptions& opts,
                                  ChunkStats* stats) {
  MarkdownWalker walker(markdown);
  return chunk_source(walker, opts, stats);
}
