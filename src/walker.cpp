#include "walker.hpp"
#include <cmark-gfm.h>
#include <stdexcept>

const char* leaf_kind_name(LeafKind kind) {
  switch (kind) {
    case LeafKind::Text:       return "text";
    case LeafKind::InlineCode: return "inline-code";
    case LeafKind::CodeBlock:  return "code-block";
  }
  return "unknown";
}

struct MarkdownWalker::Impl {
  cmark_node* doc = nullptr;
  cmark_iter* iter = nullptr;
  bool done = false;

  explicit Impl(const std::string& markdown) {
    doc = cmark_parse_document(markdown.data(), markdown.size(), CMARK_OPT_DEFAULT);
    if (!doc) throw std::runtime_error("cmark: failed to allocate document");
    iter = cmark_iter_new(doc);
    if (!iter) {
      cmark_node_free(doc);
      throw std::runtime_error("cmark: failed to allocate iterator");
    }
  }

  ~Impl() {
    if (iter) cmark_iter_free(iter);
    if (doc) cmark_node_free(doc);
  }
};

MarkdownWalker::MarkdownWalker(const std::string& markdown)
  : impl_(new Impl(markdown)) {}

MarkdownWalker::~MarkdownWalker() = default;

bool MarkdownWalker::next(Leaf& out) {
  if (impl_->done) return false;

  cmark_event_type ev;
  while ((ev = cmark_iter_next(impl_->iter)) != CMARK_EVENT_DONE) {
    if (ev != CMARK_EVENT_ENTER) continue;
    cmark_node* node = cmark_iter_get_node(impl_->iter);

    LeafKind kind;
    switch (cmark_node_get_type(node)) {
      case CMARK_NODE_TEXT:       kind = LeafKind::Text; break;
      case CMARK_NODE_CODE:       kind = LeafKind::InlineCode; break;
      case CMARK_NODE_CODE_BLOCK: kind = LeafKind::CodeBlock; break;
      default: continue;
    }
    const char* lit = cmark_node_get_literal(node);
    if (!lit || !*lit) continue;

    out.kind = kind;
    out.text = lit;
    return true;
  }
  impl_->done = true;
  return false;
}
