#pragma once
#include "elider.hpp"
#include "walker.hpp"
#include <string>
#include <vector>

// How consecutive leaves are glued inside one chunk.
enum class JoinPolicy { Space, None };

struct Chunk {
  std::string text;
  size_t first_leaf;  // index of the first leaf in this chunk
  size_t leaf_count;
};

struct ChunkOptions {
  size_t limit = 1500;                   // max chunk bytes, > 0
  size_t elide_threshold = kElideThreshold;
  std::string placeholder = kListingPlaceholder;
  JoinPolicy join = JoinPolicy::Space;
};

struct ChunkStats {
  size_t leaves = 0;
  size_t by_kind[kLeafKindCount] = {0, 0, 0};  // indexed by LeafKind
  size_t elided = 0;     // code blocks replaced by the placeholder
  size_t oversized = 0;  // single-leaf chunks longer than the limit
};

// Greedy packer: a leaf joins the current chunk if the result still fits in
// `limit`, otherwise the chunk is closed and the leaf starts a new one. A
// leaf longer than the limit is never split and becomes a chunk of its own.
// Empty payloads are ignored and take no leaf index.
class ChunkAccumulator {
public:
  // Throws std::invalid_argument if limit is 0.
  explicit ChunkAccumulator(size_t limit, JoinPolicy join = JoinPolicy::Space);

  void push(const std::string& payload);

  // Close the open chunk and hand over everything emitted so far.
  std::vector<Chunk> finish();

private:
  void flush();

  size_t limit_;
  JoinPolicy join_;
  std::string buf_;
  size_t first_ = 0;
  size_t count_ = 0;
  size_t next_index_ = 0;
  std::vector<Chunk> out_;
};

std::vector<Chunk> chunk_leaves(const std::vector<std::string>& payloads, size_t limit,
                                JoinPolicy join = JoinPolicy::Space);

// Drain `source`, elide oversized code blocks, and pack the payloads.
std::vector<Chunk> chunk_source(LeafSource& source, const ChunkOptions& opts,
                                ChunkStats* stats = nullptr);

// Parse markdown and chunk its text content.
std::vector<Chunk> chunk_markdown(const std::string& markdown,
                                  const ChunkOptions& opts = ChunkOptions(),
                                  ChunkStats* stats = nullptr);
