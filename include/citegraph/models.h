#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace citegraph {

enum class RelationshipKind {
  kDefines,
  kCrossReference,
  kCites,
  kAmends,
  kSupersedes,
  kUnknown
};

std::string RelationshipName(RelationshipKind kind);

struct Document {
  std::string id;
  std::string corpus_id;
  std::string source_url;
  std::string url_hash;
  std::string header;
  std::string display_title;
  std::vector<std::string> body;
  std::size_t word_count = 0;
};

// Paragraphs joined with '\n'; byte offsets of citations index into this.
std::string SearchableText(const Document &document);
std::size_t CountWords(const std::vector<std::string> &paragraphs);

struct RawCitation {
  std::string target;
  std::string citation_text;
  RelationshipKind kind = RelationshipKind::kUnknown;
  std::size_t byte_offset = 0;
  std::string context_snippet;
};

struct ForwardIndexEntry {
  std::string id;
  std::vector<std::string> direct_references;
  std::size_t reference_count = 0;
  std::vector<RawCitation> references_details;
};

struct CitingDetail {
  std::string id;
  std::string title;
  std::string url;
};

struct ReverseIndexEntry {
  std::string id;
  std::vector<std::string> cited_by;
  std::size_t cited_by_count = 0;
  std::vector<CitingDetail> citing_details;
};

struct ChainMember {
  std::string id;
  std::optional<std::string> title;
  std::optional<std::string> url;
  std::optional<std::string> text;
  std::size_t word_count = 0;
};

struct Chain {
  std::string id;
  std::vector<std::string> chain_sections;
  std::size_t chain_depth = 0;
  std::vector<ChainMember> complete_chain;
};

enum class DocumentClass {
  kCriminalStatute,
  kCivilStatute,
  kDefinitional,
  kProcedural,
  kOther
};

std::string DocumentClassName(DocumentClass value);

struct Enrichment {
  std::optional<std::string> summary;
  std::optional<DocumentClass> classification;
  std::vector<std::string> practice_areas;
  std::optional<int> complexity;
  std::optional<std::string> offense_level;
  std::optional<std::string> offense_degree;
  std::vector<std::string> key_terms;
};

// One document after extraction and annotation, ready to persist.
struct AnnotatedDocument {
  Document document;
  Enrichment enrichment;
  std::vector<RawCitation> citations;
};

struct CorpusStats {
  std::string corpus_id;
  std::size_t total_documents = 0;
  std::size_t documents_with_citations = 0;
  std::size_t documents_cited = 0;
  std::size_t complex_chains = 0;
  std::size_t total_citations = 0;
  std::size_t unresolved_citations = 0;
  std::size_t dangling_references = 0;
  std::size_t skipped_records = 0;
  std::size_t max_references = 0;
  std::string most_referenced;
  std::string build_timestamp;
  std::string builder_version;
};

struct BuildCheckpoint {
  std::string corpus_id;
  std::size_t records_consumed = 0;
  std::string last_committed_id;
  std::size_t documents_committed = 0;
  std::size_t citations_extracted = 0;
  std::size_t unresolved_citations = 0;
  std::size_t skipped_records = 0;
  std::size_t batches_committed = 0;
  bool extraction_complete = false;
};

struct ChainLimits {
  std::size_t max_depth = 4;
  std::size_t max_nodes = 8;
  std::size_t complex_depth = 3;
  std::size_t complex_size = 4;
};

struct BuildConfig {
  std::filesystem::path output_directory = "dist";
  std::size_t batch_size = 2000;
  std::size_t context_width = 100;
  ChainLimits chain_limits;
  std::string build_timestamp;
};

struct BuildResult {
  CorpusStats stats;
  std::filesystem::path output_path;
  bool resumed = false;
  std::size_t batches_committed = 0;
};

} // namespace citegraph
