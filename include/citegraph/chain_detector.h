#pragma once

#include <citegraph/interfaces.h>
#include <citegraph/models.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace citegraph {

struct ChainExpansion {
  std::vector<std::string> sections;
  std::size_t depth = 0;
};

// Bounded breadth-first closure over resolved forward edges. Depth is the
// hop distance of the deepest recorded node, root at 0.
class ChainDetector {
public:
  explicit ChainDetector(ChainLimits limits = {});

  ChainExpansion Expand(const std::string &root,
                        const CitationAdjacency &adjacency) const;
  bool IsComplex(const ChainExpansion &expansion) const;

  // Chain without materialized members, or nothing when below threshold.
  std::optional<Chain> Detect(const std::string &root,
                              const CitationAdjacency &adjacency) const;

  const ChainLimits &Limits() const { return limits_; }

private:
  ChainLimits limits_;
};

void ValidateChainLimits(const ChainLimits &limits);

} // namespace citegraph
