#include <citegraph/record_codec.h>

#include <citegraph/json_writer.h>

#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace citegraph {
namespace {

void WriteEnrichment(JsonWriter &json, const Enrichment &enrichment) {
  json.BeginObject();
  json.Key("summary").OptionalString(enrichment.summary);
  json.Key("classification");
  if (enrichment.classification) {
    json.String(DocumentClassName(*enrichment.classification));
  } else {
    json.Null();
  }
  json.Key("practice_areas").StringArray(enrichment.practice_areas);
  json.Key("complexity");
  if (enrichment.complexity) {
    json.Integer(*enrichment.complexity);
  } else {
    json.Null();
  }
  json.Key("offense_level").OptionalString(enrichment.offense_level);
  json.Key("offense_degree").OptionalString(enrichment.offense_degree);
  json.Key("key_terms").StringArray(enrichment.key_terms);
  json.EndObject();
}

void WriteCitation(JsonWriter &json, const RawCitation &citation) {
  json.BeginObject();
  json.Key("target").String(citation.target);
  json.Key("citation_text").String(citation.citation_text);
  json.Key("relationship").String(RelationshipName(citation.kind));
  json.Key("offset").Number(citation.byte_offset);
  json.Key("context").String(citation.context_snippet);
  json.EndObject();
}

template <typename T>
T Required(const YAML::Node &root, const char *key) {
  const auto node = root[key];
  if (!node) {
    throw std::runtime_error(std::string("Checkpoint is missing '") + key +
                             "'");
  }
  return node.as<T>();
}

} // namespace

std::string EncodePrimaryRecord(const Document &document,
                                const Enrichment &enrichment,
                                std::size_t citation_count) {
  JsonWriter json;
  json.BeginObject();
  json.Key("id").String(document.id);
  json.Key("corpus").String(document.corpus_id);
  json.Key("source_url").String(document.source_url);
  json.Key("url_hash").String(document.url_hash);
  json.Key("header").String(document.header);
  json.Key("title").String(document.display_title);
  json.Key("paragraphs").StringArray(document.body);
  json.Key("full_text").String(SearchableText(document));
  json.Key("word_count").Number(document.word_count);
  json.Key("paragraph_count").Number(document.body.size());
  json.Key("has_citations").Bool(citation_count > 0);
  json.Key("citation_count").Number(citation_count);
  json.Key("enrichment");
  WriteEnrichment(json, enrichment);
  json.EndObject();
  return json.str();
}

std::string EncodeForwardEntry(const ForwardIndexEntry &entry) {
  JsonWriter json;
  json.BeginObject();
  json.Key("id").String(entry.id);
  json.Key("direct_references").StringArray(entry.direct_references);
  json.Key("reference_count").Number(entry.reference_count);
  json.Key("references_details").BeginArray();
  for (const auto &citation : entry.references_details) {
    WriteCitation(json, citation);
  }
  json.EndArray();
  json.EndObject();
  return json.str();
}

std::string EncodeReverseEntry(const ReverseIndexEntry &entry) {
  JsonWriter json;
  json.BeginObject();
  json.Key("id").String(entry.id);
  json.Key("cited_by").StringArray(entry.cited_by);
  json.Key("cited_by_count").Number(entry.cited_by_count);
  json.Key("citing_details").BeginArray();
  for (const auto &detail : entry.citing_details) {
    json.BeginObject();
    json.Key("id").String(detail.id);
    json.Key("title").String(detail.title);
    json.Key("url").String(detail.url);
    json.EndObject();
  }
  json.EndArray();
  json.EndObject();
  return json.str();
}

std::string EncodeChain(const Chain &chain) {
  JsonWriter json;
  json.BeginObject();
  json.Key("id").String(chain.id);
  json.Key("chain_sections").StringArray(chain.chain_sections);
  json.Key("chain_depth").Number(chain.chain_depth);
  json.Key("chain_size").Number(chain.chain_sections.size());
  json.Key("complete_chain").BeginArray();
  for (const auto &member : chain.complete_chain) {
    json.BeginObject();
    json.Key("id").String(member.id);
    json.Key("title").OptionalString(member.title);
    json.Key("url").OptionalString(member.url);
    json.Key("text").OptionalString(member.text);
    json.Key("word_count").Number(member.word_count);
    json.EndObject();
  }
  json.EndArray();
  json.EndObject();
  return json.str();
}

std::string EncodeCorpusStats(const CorpusStats &stats,
                              const std::vector<std::string> &stores) {
  JsonWriter json;
  json.BeginObject();
  json.Key("corpus").String(stats.corpus_id);
  json.Key("total_documents").Number(stats.total_documents);
  json.Key("documents_with_citations").Number(stats.documents_with_citations);
  json.Key("documents_cited").Number(stats.documents_cited);
  json.Key("complex_chains").Number(stats.complex_chains);
  json.Key("total_citations").Number(stats.total_citations);
  json.Key("unresolved_citations").Number(stats.unresolved_citations);
  json.Key("dangling_references").Number(stats.dangling_references);
  json.Key("skipped_records").Number(stats.skipped_records);
  json.Key("max_references").Number(stats.max_references);
  json.Key("most_referenced").String(stats.most_referenced);
  json.Key("build_timestamp").String(stats.build_timestamp);
  json.Key("builder_version").String(stats.builder_version);
  json.Key("stores").StringArray(stores);
  json.EndObject();
  return json.str();
}

std::string EncodeCheckpoint(const BuildCheckpoint &checkpoint) {
  JsonWriter json;
  json.BeginObject();
  json.Key("corpus").String(checkpoint.corpus_id);
  json.Key("records_consumed").Number(checkpoint.records_consumed);
  json.Key("last_committed_id").String(checkpoint.last_committed_id);
  json.Key("documents_committed").Number(checkpoint.documents_committed);
  json.Key("citations_extracted").Number(checkpoint.citations_extracted);
  json.Key("unresolved_citations").Number(checkpoint.unresolved_citations);
  json.Key("skipped_records").Number(checkpoint.skipped_records);
  json.Key("batches_committed").Number(checkpoint.batches_committed);
  json.Key("extraction_complete").Bool(checkpoint.extraction_complete);
  json.EndObject();
  return json.str();
}

BuildCheckpoint DecodeCheckpoint(const std::string &encoded) {
  try {
    const auto root = YAML::Load(encoded);
    if (!root.IsMap()) {
      throw std::runtime_error("Checkpoint is not an object");
    }
    BuildCheckpoint checkpoint;
    checkpoint.corpus_id = Required<std::string>(root, "corpus");
    checkpoint.records_consumed =
        Required<std::size_t>(root, "records_consumed");
    checkpoint.last_committed_id =
        Required<std::string>(root, "last_committed_id");
    checkpoint.documents_committed =
        Required<std::size_t>(root, "documents_committed");
    checkpoint.citations_extracted =
        Required<std::size_t>(root, "citations_extracted");
    checkpoint.unresolved_citations =
        Required<std::size_t>(root, "unresolved_citations");
    checkpoint.skipped_records = Required<std::size_t>(root, "skipped_records");
    checkpoint.batches_committed =
        Required<std::size_t>(root, "batches_committed");
    checkpoint.extraction_complete =
        Required<bool>(root, "extraction_complete");
    return checkpoint;
  } catch (const YAML::Exception &ex) {
    throw std::runtime_error(std::string("Corrupt checkpoint record: ") +
                             ex.what());
  }
}

} // namespace citegraph
