#pragma once

#include <citegraph/chain_detector.h>
#include <citegraph/logging.h>
#include <citegraph/models.h>
#include <citegraph/sqlite_database.h>

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace citegraph {

struct FinalizeOptions {
  std::string build_timestamp;
  std::string builder_version;
};

// Sole writer of a corpus file. Batches land in the partial file together
// with their checkpoint; Finalize derives the reverse index, chains and
// corpus_info in one transaction and only then renames the file into
// place, so readers never open a half-built corpus.
class StorageWriter {
public:
  StorageWriter(std::filesystem::path output_dir, std::string corpus_id,
                std::shared_ptr<Logger> logger = nullptr);

  // Returns the checkpoint to resume from. A fresh build gets a zeroed
  // checkpoint and an emptied partial file.
  BuildCheckpoint Open();

  void CommitBatch(const std::vector<AnnotatedDocument> &documents,
                   const std::map<std::string, ForwardIndexEntry> &forward,
                   const BuildCheckpoint &checkpoint);
  void CommitCheckpoint(const BuildCheckpoint &checkpoint);

  CorpusStats Finalize(const BuildCheckpoint &checkpoint,
                       const ChainDetector &detector,
                       const FinalizeOptions &options);

  const std::filesystem::path &FinalPath() const { return final_path_; }
  const std::filesystem::path &PartialPath() const { return partial_path_; }

private:
  SqliteDatabase &Database();
  void EnsureSchema();
  void ClearAll();
  void WriteCheckpoint(const BuildCheckpoint &checkpoint);

  std::filesystem::path output_dir_;
  std::string corpus_id_;
  std::filesystem::path final_path_;
  std::filesystem::path partial_path_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<SqliteDatabase> database_;
};

} // namespace citegraph
