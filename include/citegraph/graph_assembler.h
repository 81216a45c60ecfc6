#pragma once

#include <citegraph/interfaces.h>
#include <citegraph/models.h>

#include <map>
#include <string>
#include <vector>

namespace citegraph {

// Owns the forward index for one build (or one batch of it) and derives the
// reverse index by inversion. Map keys keep every iteration sorted by id.
class GraphAssembler {
public:
  // Re-adding a source replaces its previous entry wholesale.
  void Add(const Document &source, const std::vector<RawCitation> &citations);

  const std::map<std::string, ForwardIndexEntry> &Forward() const {
    return forward_;
  }
  std::size_t Size() const { return forward_.size(); }

  std::map<std::string, ReverseIndexEntry> Invert() const;

  std::map<std::string, ForwardIndexEntry> TakeForward();
  void Clear();

  static ForwardIndexEntry MakeForwardEntry(const std::string &source_id,
                                            std::vector<RawCitation> citations);
  static ReverseIndexEntry MakeReverseEntry(const std::string &target_id,
                                            std::vector<CitingDetail> citers);

private:
  std::map<std::string, ForwardIndexEntry> forward_;
  std::map<std::string, CitingDetail> citers_;
};

// Adjacency over an in-memory forward index.
class ForwardIndexAdjacency : public CitationAdjacency {
public:
  explicit ForwardIndexAdjacency(
      const std::map<std::string, ForwardIndexEntry> &forward);
  std::vector<std::string> References(const std::string &id) const override;

private:
  const std::map<std::string, ForwardIndexEntry> *forward_;
};

} // namespace citegraph
