#include <citegraph/graph_assembler.h>

#include <algorithm>
#include <utility>

namespace citegraph {

ForwardIndexEntry
GraphAssembler::MakeForwardEntry(const std::string &source_id,
                                 std::vector<RawCitation> citations) {
  ForwardIndexEntry entry;
  entry.id = source_id;
  for (const auto &citation : citations) {
    if (citation.kind != RelationshipKind::kUnknown) {
      entry.direct_references.push_back(citation.target);
    }
  }
  std::sort(entry.direct_references.begin(), entry.direct_references.end());
  entry.direct_references.erase(std::unique(entry.direct_references.begin(),
                                            entry.direct_references.end()),
                                entry.direct_references.end());
  entry.reference_count = entry.direct_references.size();

  std::stable_sort(citations.begin(), citations.end(),
                   [](const RawCitation &lhs, const RawCitation &rhs) {
                     return lhs.byte_offset < rhs.byte_offset;
                   });
  entry.references_details = std::move(citations);
  return entry;
}

ReverseIndexEntry
GraphAssembler::MakeReverseEntry(const std::string &target_id,
                                 std::vector<CitingDetail> citers) {
  std::sort(citers.begin(), citers.end(),
            [](const CitingDetail &lhs, const CitingDetail &rhs) {
              return lhs.id < rhs.id;
            });
  citers.erase(std::unique(citers.begin(), citers.end(),
                           [](const CitingDetail &lhs, const CitingDetail &rhs) {
                             return lhs.id == rhs.id;
                           }),
               citers.end());

  ReverseIndexEntry entry;
  entry.id = target_id;
  entry.cited_by.reserve(citers.size());
  for (const auto &citer : citers) {
    entry.cited_by.push_back(citer.id);
  }
  entry.cited_by_count = entry.cited_by.size();
  entry.citing_details = std::move(citers);
  return entry;
}

void GraphAssembler::Add(const Document &source,
                         const std::vector<RawCitation> &citations) {
  forward_.erase(source.id);
  citers_.erase(source.id);
  if (citations.empty()) {
    return;
  }
  forward_.emplace(source.id, MakeForwardEntry(source.id, citations));
  citers_.emplace(source.id, CitingDetail{source.id, source.display_title,
                                          source.source_url});
}

std::map<std::string, ReverseIndexEntry> GraphAssembler::Invert() const {
  std::map<std::string, std::vector<CitingDetail>> grouped;
  for (const auto &entry : forward_) {
    const auto &citer = citers_.at(entry.first);
    for (const auto &target : entry.second.direct_references) {
      grouped[target].push_back(citer);
    }
  }

  std::map<std::string, ReverseIndexEntry> reverse;
  for (auto &group : grouped) {
    reverse.emplace(group.first,
                    MakeReverseEntry(group.first, std::move(group.second)));
  }
  return reverse;
}

std::map<std::string, ForwardIndexEntry> GraphAssembler::TakeForward() {
  auto taken = std::move(forward_);
  forward_.clear();
  citers_.clear();
  return taken;
}

void GraphAssembler::Clear() {
  forward_.clear();
  citers_.clear();
}

ForwardIndexAdjacency::ForwardIndexAdjacency(
    const std::map<std::string, ForwardIndexEntry> &forward)
    : forward_(&forward) {}

std::vector<std::string>
ForwardIndexAdjacency::References(const std::string &id) const {
  const auto found = forward_->find(id);
  if (found == forward_->end()) {
    return {};
  }
  return found->second.direct_references;
}

} // namespace citegraph
