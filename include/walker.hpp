#pragma once
#include <memory>
#include <string>

enum class LeafKind { Text, InlineCode, CodeBlock };
constexpr int kLeafKindCount = 3;

const char* leaf_kind_name(LeafKind kind);

struct Leaf {
  LeafKind kind;
  std::string text;  // literal content, never empty
};

// A finite, one-shot sequence of leaves in document order.
class LeafSource {
public:
  virtual ~LeafSource() = default;
  // Store the next leaf in `out`; false once the sequence is exhausted.
  virtual bool next(Leaf& out) = 0;
};

// Parses CommonMark with cmark-gfm and yields text-bearing nodes in
// depth-first order. Container nodes (headings, lists, emphasis...) yield
// nothing themselves; raw HTML and line breaks are not leaves. Never
// fails on malformed markup.
class MarkdownWalker : public LeafSource {
public:
  explicit MarkdownWalker(const std::string& markdown);
  ~MarkdownWalker() override;

  MarkdownWalker(const MarkdownWalker&) = delete;
  MarkdownWalker& operator=(const MarkdownWalker&) = delete;

  bool next(Leaf& out) override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
