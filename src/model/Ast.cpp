#include "model/Ast.hpp"
#include "util/Utf8.hpp"
#include <cstdio>

namespace sift::model {

Node Node::lit(std::u32string s) {
  Node n;
  n.kind = NodeKind::Literal;
  n.literal = std::move(s);
  return n;
}

Node Node::concat(std::vector<Node> items) {
  Node n;
  n.kind = NodeKind::Concat;
  n.children = std::move(items);
  return n;
}

Node Node::alternate(std::vector<Node> items) {
  Node n;
  n.kind = NodeKind::Alternate;
  n.children = std::move(items);
  return n;
}

Node Node::repeat(Node child, uint32_t min, std::optional<uint32_t> max, bool greedy) {
  Node n;
  n.kind = NodeKind::Repeat;
  n.children.push_back(std::move(child));
  n.min = min;
  n.max = max;
  n.greedy = greedy;
  return n;
}

Node Node::klass(util::CharClass cls) {
  Node n;
  n.kind = NodeKind::Class;
  n.cls = std::move(cls);
  return n;
}

Node Node::capture(uint32_t index, Node child, std::optional<std::string> name) {
  Node n;
  n.kind = NodeKind::Capture;
  n.index = index;
  n.name = std::move(name);
  n.children.push_back(std::move(child));
  return n;
}

Node Node::group(Node child) {
  Node n;
  n.kind = NodeKind::Group;
  n.children.push_back(std::move(child));
  return n;
}

Node Node::assertion(AnchorKind kind) {
  Node n;
  n.kind = NodeKind::Anchor;
  n.anchor = kind;
  return n;
}

static const char* anchor_name(AnchorKind k) {
  switch (k) {
    case AnchorKind::StartLine: return "start_line";
    case AnchorKind::EndLine: return "end_line";
    case AnchorKind::StartText: return "start_text";
    case AnchorKind::EndText: return "end_text";
    case AnchorKind::WordBoundary: return "word_boundary";
    case AnchorKind::NotWordBoundary: return "not_word_boundary";
  }
  return "?";
}

static std::string class_string(const util::CharClass& cls) {
  std::string out = "class[";
  char buf[32];
  for (const auto& r : cls.ranges()) {
    if (r.lo == r.hi) std::snprintf(buf, sizeof(buf), "%X,", r.lo);
    else std::snprintf(buf, sizeof(buf), "%X-%X,", r.lo, r.hi);
    out += buf;
  }
  if (out.back() == ',') out.pop_back();
  out += ']';
  return out;
}

static std::string join_children(const char* head, const std::vector<Node>& children) {
  std::string out = head;
  out += '(';
  for (size_t i = 0; i < children.size(); ++i) {
    if (i) out += ", ";
    out += to_string(children[i]);
  }
  out += ')';
  return out;
}

std::string to_string(const Node& node) {
  switch (node.kind) {
    case NodeKind::Empty: return "empty";
    case NodeKind::Literal: return "lit(\"" + util::to_utf8(node.literal) + "\")";
    case NodeKind::Concat: return join_children("cat", node.children);
    case NodeKind::Alternate: return join_children("alt", node.children);
    case NodeKind::Repeat: {
      std::string out = "rep{" + std::to_string(node.min) + ",";
      if (node.max) out += std::to_string(*node.max);
      out += node.greedy ? "}" : "}?";
      return out + "(" + to_string(node.children[0]) + ")";
    }
    case NodeKind::Class: return class_string(node.cls);
    case NodeKind::Capture: {
      std::string head = "cap" + std::to_string(node.index);
      if (node.name) head += "<" + *node.name + ">";
      return join_children(head.c_str(), node.children);
    }
    case NodeKind::Group: return join_children("group", node.children);
    case NodeKind::Anchor: return anchor_name(node.anchor);
  }
  return "?";
}

} // namespace sift::model
