#pragma once

#include "sentence.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace Satzbau {
namespace deps {

// Tokens are addressed by their position in the sentence; a loaded
// Sentence guarantees tokens[i].index == i.

// Resolved head of tokens[i]. Numeric heads are returned when in range and
// not self-referential. Textual heads resolve only when exactly one other
// token carries that text or lemma.
std::optional<size_t> headIndex(const std::vector<Token> &tokens, size_t i);

// All tokens whose resolved head is `head`, in sentence order.
std::vector<size_t> children(const std::vector<Token> &tokens, size_t head);

// Transitive children up to `maxDepth` levels (1 == children only), in
// breadth-first order. Cycles in malformed trees are cut.
std::vector<size_t> descendants(const std::vector<Token> &tokens, size_t head,
                                int maxDepth);

// Depth of `node` below `head`, or nullopt if not reachable within maxDepth.
std::optional<int> depthBelow(const std::vector<Token> &tokens, size_t head,
                              size_t node, int maxDepth);

// False when a subordinating conjunction or a comma lies strictly between
// the two positions.
bool inSameClause(const std::vector<Token> &tokens, size_t a, size_t b);

std::optional<size_t>
findChild(const std::vector<Token> &tokens, size_t head,
          const std::function<bool(const Token &)> &predicate);

} // namespace deps
} // namespace Satzbau
