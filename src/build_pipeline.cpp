#include <citegraph/build_pipeline.h>

#include <citegraph/annotator.h>
#include <citegraph/chain_detector.h>
#include <citegraph/citation_extractor.h>
#include <citegraph/graph_assembler.h>
#include <citegraph/storage_writer.h>
#include <citegraph/worker_pool.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <stdexcept>
#include <utility>
#include <vector>

namespace citegraph {
namespace {

std::string FormatUtc(std::time_t seconds) {
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &seconds);
#else
  gmtime_r(&seconds, &tm);
#endif
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buffer;
}

struct BatchExtraction {
  std::vector<RawCitation> citations;
  Enrichment enrichment;
};

} // namespace

std::string
ResolveBuildTimestamp(const std::optional<std::string> &requested) {
  if (requested && !requested->empty()) {
    return *requested;
  }
  if (const char *epoch = std::getenv("SOURCE_DATE_EPOCH")) {
    const std::string value(epoch);
    std::size_t consumed = 0;
    long long seconds = 0;
    try {
      seconds = std::stoll(value, &consumed);
    } catch (const std::logic_error &) {
      consumed = 0;
    }
    if (consumed == 0 || consumed != value.size() || seconds < 0) {
      throw std::invalid_argument("SOURCE_DATE_EPOCH is not a timestamp: " +
                                  value);
    }
    return FormatUtc(static_cast<std::time_t>(seconds));
  }
  return FormatUtc(
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

DefaultBuildPipeline::DefaultBuildPipeline(BuildComponents components)
    : adapter_(std::move(components.adapter)),
      source_(std::move(components.source)),
      logger_(EnsureLogger(std::move(components.logger))),
      threads_(components.threads) {
  if (!adapter_ || !source_) {
    throw std::invalid_argument(
        "Build pipeline requires an adapter and a document source");
  }
}

void DefaultBuildPipeline::SkipCommittedRecords(
    const BuildCheckpoint &checkpoint) {
  std::string last_id;
  for (std::size_t i = 0; i < checkpoint.records_consumed; ++i) {
    auto document = source_->Next();
    if (!document) {
      throw std::runtime_error(
          "Input ended after " + std::to_string(i) +
          " records but the checkpoint covers " +
          std::to_string(checkpoint.records_consumed) +
          "; the input changed since the interrupted build");
    }
    last_id = std::move(document->id);
  }
  if (checkpoint.records_consumed > 0 &&
      last_id != checkpoint.last_committed_id) {
    throw std::runtime_error("Checkpoint expects record " +
                             std::to_string(checkpoint.records_consumed) +
                             " to be '" + checkpoint.last_committed_id +
                             "' but the input has '" + last_id +
                             "'; the input changed since the interrupted "
                             "build");
  }
}

BuildResult DefaultBuildPipeline::Run(const BuildConfig &config) {
  if (config.batch_size == 0) {
    throw std::invalid_argument("Batch size must be positive");
  }
  const ChainDetector detector(config.chain_limits);
  const CitationExtractor extractor(adapter_,
                                    ExtractionOptions{config.context_width});
  const Annotator annotator(adapter_);
  const WorkerPool pool(threads_);
  StorageWriter writer(config.output_directory, adapter_->CorpusId(),
                       logger_);

  logger_->Log(LogLevel::kInfo, "build.start",
               {{"corpus", adapter_->CorpusId()},
                {"output", writer.FinalPath().string()},
                {"batch_size", std::to_string(config.batch_size)},
                {"threads", std::to_string(pool.Size())}});
  const auto build_start = std::chrono::steady_clock::now();

  auto checkpoint = writer.Open();
  BuildResult result;
  result.resumed =
      checkpoint.batches_committed > 0 || checkpoint.extraction_complete;
  if (result.resumed) {
    logger_->Log(LogLevel::kInfo, "build.resume",
                 {{"records_consumed",
                   std::to_string(checkpoint.records_consumed)},
                  {"last_committed_id", checkpoint.last_committed_id},
                  {"batches_committed",
                   std::to_string(checkpoint.batches_committed)},
                  {"extraction_complete",
                   checkpoint.extraction_complete ? "true" : "false"}});
  }

  if (!checkpoint.extraction_complete) {
    SkipCommittedRecords(checkpoint);

    GraphAssembler assembler;
    bool exhausted = false;
    while (!exhausted) {
      std::vector<Document> batch;
      batch.reserve(config.batch_size);
      while (batch.size() < config.batch_size) {
        auto document = source_->Next();
        if (!document) {
          exhausted = true;
          break;
        }
        batch.push_back(std::move(*document));
      }
      if (batch.empty()) {
        break;
      }

      auto extracted = pool.Map(batch, [&](const Document &document) {
        BatchExtraction extraction;
        extraction.citations = extractor.Extract(document);
        extraction.enrichment =
            annotator.Annotate(document, extraction.citations.size());
        return extraction;
      });

      std::vector<AnnotatedDocument> annotated;
      annotated.reserve(batch.size());
      for (std::size_t i = 0; i < batch.size(); ++i) {
        assembler.Add(batch[i], extracted[i].citations);
        checkpoint.citations_extracted += extracted[i].citations.size();
        for (const auto &citation : extracted[i].citations) {
          if (citation.kind == RelationshipKind::kUnknown) {
            ++checkpoint.unresolved_citations;
          }
        }
        annotated.push_back(AnnotatedDocument{std::move(batch[i]),
                                              std::move(extracted[i].enrichment),
                                              std::move(extracted[i].citations)});
      }

      checkpoint.records_consumed += annotated.size();
      checkpoint.last_committed_id = annotated.back().document.id;
      checkpoint.documents_committed += annotated.size();
      checkpoint.skipped_records = source_->SkippedRecords();
      ++checkpoint.batches_committed;

      writer.CommitBatch(annotated, assembler.Forward(), checkpoint);
      assembler.Clear();
      logger_->Log(LogLevel::kInfo, "build.batch.committed",
                   {{"batch", std::to_string(checkpoint.batches_committed)},
                    {"documents", std::to_string(annotated.size())},
                    {"records_consumed",
                     std::to_string(checkpoint.records_consumed)},
                    {"last_committed_id", checkpoint.last_committed_id}});
    }

    checkpoint.skipped_records = source_->SkippedRecords();
    checkpoint.extraction_complete = true;
    writer.CommitCheckpoint(checkpoint);
    logger_->Log(LogLevel::kDebug, "build.stage.complete",
                 {{"stage", "extract"},
                  {"documents", std::to_string(checkpoint.documents_committed)},
                  {"citations", std::to_string(checkpoint.citations_extracted)},
                  {"skipped", std::to_string(checkpoint.skipped_records)}});
  }

  FinalizeOptions finalize;
  finalize.build_timestamp = config.build_timestamp.empty()
                                 ? ResolveBuildTimestamp(std::nullopt)
                                 : config.build_timestamp;
  finalize.builder_version = kBuilderVersion;
  result.stats = writer.Finalize(checkpoint, detector, finalize);
  result.output_path = writer.FinalPath();
  result.batches_committed = checkpoint.batches_committed;
  logger_->Log(LogLevel::kDebug, "build.stage.complete",
               {{"stage", "finalize"},
                {"documents_cited", std::to_string(result.stats.documents_cited)},
                {"complex_chains",
                 std::to_string(result.stats.complex_chains)}});

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - build_start)
          .count();
  logger_->Log(LogLevel::kInfo, "build.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"documents", std::to_string(result.stats.total_documents)},
                {"citations", std::to_string(result.stats.total_citations)},
                {"unresolved",
                 std::to_string(result.stats.unresolved_citations)}});
  return result;
}

} // namespace citegraph
