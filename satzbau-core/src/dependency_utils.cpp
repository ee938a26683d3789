#include "dependency_utils.hpp"
#include "pos_classifier.hpp"

#include <algorithm>

namespace Satzbau {
namespace deps {

std::optional<size_t> headIndex(const std::vector<Token> &tokens, size_t i) {
  if (i >= tokens.size())
    return std::nullopt;

  const HeadRef &head = tokens[i].head;
  switch (head.kind) {
  case HeadRef::Kind::None:
    return std::nullopt;
  case HeadRef::Kind::Index:
    if (head.index < 0 || static_cast<size_t>(head.index) >= tokens.size())
      return std::nullopt;
    // parsers mark the root by pointing it at itself
    if (static_cast<size_t>(head.index) == i)
      return std::nullopt;
    return static_cast<size_t>(head.index);
  case HeadRef::Kind::Text: {
    if (head.text.empty())
      return std::nullopt;
    std::optional<size_t> found;
    for (size_t j = 0; j < tokens.size(); ++j) {
      if (tokens[j].text != head.text && tokens[j].lemma != head.text)
        continue;
      if (found)
        return std::nullopt; // ambiguous
      found = j;
    }
    if (found && *found == i)
      return std::nullopt;
    return found;
  }
  }
  return std::nullopt;
}

std::vector<size_t> children(const std::vector<Token> &tokens, size_t head) {
  std::vector<size_t> result;
  for (size_t i = 0; i < tokens.size(); ++i) {
    auto h = headIndex(tokens, i);
    if (h && *h == head)
      result.push_back(i);
  }
  return result;
}

std::vector<size_t> descendants(const std::vector<Token> &tokens, size_t head,
                                int maxDepth) {
  std::vector<size_t> result;
  if (head >= tokens.size() || maxDepth <= 0)
    return result;

  std::vector<bool> seen(tokens.size(), false);
  seen[head] = true;
  std::vector<size_t> frontier = {head};

  for (int depth = 0; depth < maxDepth && !frontier.empty(); ++depth) {
    std::vector<size_t> next;
    for (size_t node : frontier) {
      for (size_t child : children(tokens, node)) {
        if (seen[child])
          continue;
        seen[child] = true;
        result.push_back(child);
        next.push_back(child);
      }
    }
    frontier.swap(next);
  }
  return result;
}

std::optional<int> depthBelow(const std::vector<Token> &tokens, size_t head,
                              size_t node, int maxDepth) {
  if (head >= tokens.size() || node >= tokens.size() || head == node)
    return std::nullopt;

  // walk up from node; bounded by maxDepth so cycles terminate
  size_t current = node;
  for (int depth = 1; depth <= maxDepth; ++depth) {
    auto h = headIndex(tokens, current);
    if (!h)
      return std::nullopt;
    if (*h == head)
      return depth;
    current = *h;
  }
  return std::nullopt;
}

bool inSameClause(const std::vector<Token> &tokens, size_t a, size_t b) {
  size_t lo = std::min(a, b);
  size_t hi = std::max(a, b);
  if (hi > tokens.size())
    hi = tokens.size();
  for (size_t i = lo + 1; i < hi; ++i) {
    if (pos::POSClassifier::isSubordinatingConjunction(tokens[i]) ||
        pos::POSClassifier::isComma(tokens[i]))
      return false;
  }
  return true;
}

std::optional<size_t>
findChild(const std::vector<Token> &tokens, size_t head,
          const std::function<bool(const Token &)> &predicate) {
  for (size_t child : children(tokens, head)) {
    if (predicate(tokens[child]))
      return child;
  }
  return std::nullopt;
}

} // namespace deps
} // namespace Satzbau
