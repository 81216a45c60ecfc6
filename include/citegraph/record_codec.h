#pragma once

#include <citegraph/models.h>

#include <cstddef>
#include <string>
#include <vector>

namespace citegraph {

// Store values are compact JSON with a fixed field order, so unchanged
// input always encodes to identical bytes.
std::string EncodePrimaryRecord(const Document &document,
                                const Enrichment &enrichment,
                                std::size_t citation_count);
std::string EncodeForwardEntry(const ForwardIndexEntry &entry);
std::string EncodeReverseEntry(const ReverseIndexEntry &entry);
std::string EncodeChain(const Chain &chain);
std::string EncodeCorpusStats(const CorpusStats &stats,
                              const std::vector<std::string> &stores);

std::string EncodeCheckpoint(const BuildCheckpoint &checkpoint);
BuildCheckpoint DecodeCheckpoint(const std::string &encoded);

} // namespace citegraph
