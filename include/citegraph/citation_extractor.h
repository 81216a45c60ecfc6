#pragma once

#include <citegraph/corpus_adapter.h>
#include <citegraph/models.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace citegraph {

struct ExtractionOptions {
  std::size_t context_width = 100;
};

// Scans searchable text against an adapter's pattern table. Matches are
// accepted in pattern priority order; a match overlapping an accepted span
// is dropped. Output is sorted by byte offset.
class CitationExtractor {
public:
  explicit CitationExtractor(std::shared_ptr<const CorpusAdapter> adapter,
                             ExtractionOptions options = {});

  std::vector<RawCitation> Extract(const std::string &text) const;
  std::vector<RawCitation> Extract(const Document &document) const;

  const CorpusAdapter &Adapter() const { return *adapter_; }

private:
  std::shared_ptr<const CorpusAdapter> adapter_;
  ExtractionOptions options_;
};

std::string ContextSnippet(const std::string &text, std::size_t begin,
                           std::size_t end, std::size_t width);

} // namespace citegraph
