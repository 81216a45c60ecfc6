#pragma once

#include <citegraph/models.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace citegraph {

// One entry of a corpus pattern table. The template rewrites capture groups
// ("$1".."$9", "$$" for a literal dollar) into the canonical id.
struct CitationPatternSpec {
  std::string pattern;
  RelationshipKind kind = RelationshipKind::kCrossReference;
  std::string target_template = "$1";
  bool uppercase = false;
  bool case_sensitive = false;
};

struct HeaderIdSpec {
  std::string pattern;
  std::string target_template = "$1";
  bool uppercase = false;
};

// Numeric id prefixes in [from, to] receive the practice-area tag.
struct PracticeAreaRange {
  long from = 0;
  long to = 0;
  std::string area;
};

struct CorpusAdapterSpec {
  std::string corpus_id;
  std::string description;
  bool statutory = true;
  std::string id_format;
  std::optional<HeaderIdSpec> header_id;
  std::vector<CitationPatternSpec> patterns;
  std::vector<PracticeAreaRange> practice_areas;
};

class CitationPattern {
public:
  CitationPattern(CitationPatternSpec spec, std::size_t priority);

  const std::regex &Regex() const { return regex_; }
  RelationshipKind Kind() const { return spec_.kind; }
  std::size_t Priority() const { return priority_; }
  const CitationPatternSpec &Spec() const { return spec_; }

  // Expands the template for a match; empty when a referenced group did
  // not participate in the match.
  std::optional<std::string> Expand(const std::smatch &match) const;

private:
  CitationPatternSpec spec_;
  std::size_t priority_;
  std::regex regex_;
};

// Compiled, immutable view of a CorpusAdapterSpec. Construction validates
// the whole table and throws std::invalid_argument on the first defect, so
// a corpus with a broken pattern never reaches extraction.
class CorpusAdapter {
public:
  explicit CorpusAdapter(CorpusAdapterSpec spec);

  const std::string &CorpusId() const { return spec_.corpus_id; }
  const std::string &Description() const { return spec_.description; }
  bool Statutory() const { return spec_.statutory; }
  const std::vector<CitationPattern> &Patterns() const { return patterns_; }
  const CorpusAdapterSpec &Spec() const { return spec_; }

  bool IsValidId(const std::string &candidate) const;
  std::optional<std::string> Normalize(const CitationPattern &pattern,
                                       const std::smatch &match) const;
  std::optional<std::string> IdFromHeader(const std::string &header) const;
  std::vector<std::string> PracticeAreasFor(const std::string &id) const;

private:
  CorpusAdapterSpec spec_;
  std::vector<CitationPattern> patterns_;
  std::regex id_format_;
  std::optional<CitationPattern> header_id_;
};

RelationshipKind ParseRelationshipKind(const std::string &value);

// Offset of the first `*`, `+` or `{n,}` outside a bracket expression.
// Citation patterns run over whole document bodies, and std::regex recurses
// once per repeated character, so every repetition must carry an upper bound.
std::optional<std::size_t> FindUnboundedQuantifier(const std::string &pattern);

CorpusAdapterSpec ParseCorpusAdapterYaml(const std::string &yaml_text);
CorpusAdapterSpec LoadCorpusAdapterFile(const std::filesystem::path &path);

std::vector<CorpusAdapterSpec> BuiltinAdapterSpecs();

} // namespace citegraph
