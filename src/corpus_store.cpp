#include <citegraph/corpus_store.h>

#include <stdexcept>

namespace citegraph {
namespace {

std::string Quoted(StoreName store) {
  return "\"" + StoreTableName(store) + "\"";
}

} // namespace

std::string StoreTableName(StoreName store) {
  switch (store) {
  case StoreName::kPrimary:
    return "primary";
  case StoreName::kCitations:
    return "citations";
  case StoreName::kReverseCitations:
    return "reverse_citations";
  case StoreName::kChains:
    return "chains";
  case StoreName::kMetadata:
    return "metadata";
  }
  return "primary";
}

StoreName ParseStoreName(const std::string &value) {
  for (const auto store : AllStores()) {
    if (StoreTableName(store) == value) {
      return store;
    }
  }
  if (value == "reverse") {
    return StoreName::kReverseCitations;
  }
  if (value == "forward") {
    return StoreName::kCitations;
  }
  throw std::invalid_argument("Unknown store '" + value +
                              "'. Expected one of: primary, citations, "
                              "reverse_citations, chains, metadata");
}

const std::vector<StoreName> &AllStores() {
  static const std::vector<StoreName> stores = {
      StoreName::kPrimary, StoreName::kCitations,
      StoreName::kReverseCitations, StoreName::kChains, StoreName::kMetadata};
  return stores;
}

std::vector<std::string> AllStoreNames() {
  std::vector<std::string> names;
  for (const auto store : AllStores()) {
    names.push_back(StoreTableName(store));
  }
  return names;
}

std::filesystem::path CorpusStorePath(const std::filesystem::path &output_dir,
                                      const std::string &corpus_id) {
  return output_dir / (corpus_id + ".sqlite");
}

std::filesystem::path
PartialCorpusStorePath(const std::filesystem::path &output_dir,
                       const std::string &corpus_id) {
  return output_dir / (corpus_id + ".sqlite.partial");
}

CorpusStore::CorpusStore(const std::filesystem::path &path)
    : database_(path, SqliteDatabase::Mode::kReadOnly) {}

std::optional<std::string> CorpusStore::Get(StoreName store,
                                            const std::string &key) {
  auto statement = database_.Prepare("SELECT value FROM " + Quoted(store) +
                                     " WHERE key = ?;");
  statement.Bind(1, key);
  if (!statement.Step()) {
    return std::nullopt;
  }
  return statement.ColumnText(0);
}

std::vector<std::string> CorpusStore::Keys(StoreName store) {
  auto statement =
      database_.Prepare("SELECT key FROM " + Quoted(store) + " ORDER BY key;");
  std::vector<std::string> keys;
  while (statement.Step()) {
    keys.push_back(statement.ColumnText(0));
  }
  return keys;
}

std::map<std::string, std::string> CorpusStore::Dump(StoreName store) {
  auto statement = database_.Prepare("SELECT key, value FROM " +
                                     Quoted(store) + " ORDER BY key;");
  std::map<std::string, std::string> entries;
  while (statement.Step()) {
    entries.emplace(statement.ColumnText(0), statement.ColumnText(1));
  }
  return entries;
}

std::size_t CorpusStore::Count(StoreName store) {
  auto statement =
      database_.Prepare("SELECT COUNT(*) FROM " + Quoted(store) + ";");
  if (!statement.Step()) {
    return 0;
  }
  return static_cast<std::size_t>(statement.ColumnInt64(0));
}

} // namespace citegraph
