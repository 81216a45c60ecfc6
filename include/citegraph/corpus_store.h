#pragma once

#include <citegraph/sqlite_database.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace citegraph {

enum class StoreName {
  kPrimary,
  kCitations,
  kReverseCitations,
  kChains,
  kMetadata
};

constexpr char kCorpusInfoKey[] = "corpus_info";

std::string StoreTableName(StoreName store);
StoreName ParseStoreName(const std::string &value);
const std::vector<StoreName> &AllStores();
std::vector<std::string> AllStoreNames();

std::filesystem::path CorpusStorePath(const std::filesystem::path &output_dir,
                                      const std::string &corpus_id);
std::filesystem::path
PartialCorpusStorePath(const std::filesystem::path &output_dir,
                       const std::string &corpus_id);

// Read-only view of a finished corpus file, the way downstream readers see
// it. A missing key is an ordinary outcome.
class CorpusStore {
public:
  explicit CorpusStore(const std::filesystem::path &path);

  std::optional<std::string> Get(StoreName store, const std::string &key);
  std::vector<std::string> Keys(StoreName store);
  std::map<std::string, std::string> Dump(StoreName store);
  std::size_t Count(StoreName store);

private:
  SqliteDatabase database_;
};

} // namespace citegraph
