#pragma once

#include <citegraph/models.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace citegraph {

// Streams documents in input order. Records that cannot be decoded are
// skipped and counted rather than surfaced.
class DocumentSource {
public:
  virtual ~DocumentSource() = default;
  virtual std::optional<Document> Next() = 0;
  virtual std::size_t SkippedRecords() const = 0;
};

// Resolved forward edges of the graph, as seen by chain expansion.
class CitationAdjacency {
public:
  virtual ~CitationAdjacency() = default;
  virtual std::vector<std::string> References(const std::string &id) const = 0;
};

class BuildPipeline {
public:
  virtual ~BuildPipeline() = default;
  virtual BuildResult Run(const BuildConfig &config) = 0;
};

} // namespace citegraph
