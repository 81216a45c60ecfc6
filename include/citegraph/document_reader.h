#pragma once

#include <citegraph/corpus_adapter.h>
#include <citegraph/interfaces.h>
#include <citegraph/logging.h>

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace citegraph {

// Decodes one JSONL record. Throws std::invalid_argument when the record is
// malformed or no id can be derived for it.
Document DecodeDocumentRecord(const std::string &line,
                              const CorpusAdapter &adapter);

class JsonlDocumentSource : public DocumentSource {
public:
  JsonlDocumentSource(const std::filesystem::path &path,
                      std::shared_ptr<const CorpusAdapter> adapter,
                      std::shared_ptr<Logger> logger = nullptr);
  JsonlDocumentSource(std::unique_ptr<std::istream> stream, std::string name,
                      std::shared_ptr<const CorpusAdapter> adapter,
                      std::shared_ptr<Logger> logger = nullptr);

  std::optional<Document> Next() override;
  std::size_t SkippedRecords() const override { return skipped_; }

private:
  std::unique_ptr<std::istream> stream_;
  std::string name_;
  std::shared_ptr<const CorpusAdapter> adapter_;
  std::shared_ptr<Logger> logger_;
  std::size_t line_number_ = 0;
  std::size_t skipped_ = 0;
};

} // namespace citegraph
