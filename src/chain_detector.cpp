#include <citegraph/chain_detector.h>

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace citegraph {

void ValidateChainLimits(const ChainLimits &limits) {
  if (limits.max_depth == 0) {
    throw std::invalid_argument("Maximum chain depth must be at least 1");
  }
  if (limits.max_nodes < 2) {
    throw std::invalid_argument("Maximum chain size must be at least 2");
  }
  if (limits.complex_depth == 0 || limits.complex_size == 0) {
    throw std::invalid_argument("Complex chain thresholds must be positive");
  }
  if (limits.complex_depth > limits.max_depth &&
      limits.complex_size > limits.max_nodes) {
    throw std::invalid_argument(
        "Complex chain thresholds exceed the chain limits; no chain could "
        "ever be recorded");
  }
}

ChainDetector::ChainDetector(ChainLimits limits) : limits_(limits) {
  ValidateChainLimits(limits_);
}

ChainExpansion ChainDetector::Expand(const std::string &root,
                                     const CitationAdjacency &adjacency) const {
  ChainExpansion expansion;
  expansion.sections.push_back(root);

  std::unordered_set<std::string> visited{root};
  std::deque<std::pair<std::string, std::size_t>> frontier;
  frontier.emplace_back(root, 0);

  while (!frontier.empty()) {
    auto [id, depth] = std::move(frontier.front());
    frontier.pop_front();
    if (depth >= limits_.max_depth) {
      continue;
    }
    for (auto &target : adjacency.References(id)) {
      if (visited.count(target) != 0) {
        continue;
      }
      if (expansion.sections.size() >= limits_.max_nodes) {
        return expansion;
      }
      visited.insert(target);
      expansion.sections.push_back(target);
      expansion.depth = std::max(expansion.depth, depth + 1);
      frontier.emplace_back(std::move(target), depth + 1);
    }
  }
  return expansion;
}

bool ChainDetector::IsComplex(const ChainExpansion &expansion) const {
  return expansion.depth >= limits_.complex_depth ||
         expansion.sections.size() >= limits_.complex_size;
}

std::optional<Chain>
ChainDetector::Detect(const std::string &root,
                      const CitationAdjacency &adjacency) const {
  auto expansion = Expand(root, adjacency);
  if (!IsComplex(expansion)) {
    return std::nullopt;
  }
  Chain chain;
  chain.id = root;
  chain.chain_sections = std::move(expansion.sections);
  chain.chain_depth = expansion.depth;
  return chain;
}

} // namespace citegraph
