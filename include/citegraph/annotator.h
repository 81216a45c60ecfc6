#pragma once

#include <citegraph/corpus_adapter.h>
#include <citegraph/models.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace citegraph {

// Rule-based enrichment. Depends only on the document itself and the count
// of citations extracted from it, so identical input always yields
// identical output.
class Annotator {
public:
  explicit Annotator(std::shared_ptr<const CorpusAdapter> adapter);

  Enrichment Annotate(const Document &document,
                      std::size_t citation_count) const;

  static std::optional<std::string> Summarize(const std::string &title);
  static int ComplexityScore(std::size_t word_count,
                             std::size_t paragraph_count,
                             std::size_t citation_count);
  static std::optional<std::string> OffenseLevel(const std::string &lowered);
  static std::optional<std::string> OffenseDegree(const std::string &lowered);

private:
  std::optional<DocumentClass> Classify(const Document &document,
                                        const std::string &lowered) const;
  std::vector<std::string> PracticeAreas(const Document &document,
                                         const std::string &lowered) const;
  static std::vector<std::string> KeyTerms(const Document &document,
                                           const std::string &text);

  std::shared_ptr<const CorpusAdapter> adapter_;
};

} // namespace citegraph
