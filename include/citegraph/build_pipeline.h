#pragma once

#include <citegraph/build_pipeline_builder.h>

#include <memory>
#include <optional>
#include <string>

namespace citegraph {

constexpr char kBuilderVersion[] = "citegraph 1.0.0";

// Explicit value, else SOURCE_DATE_EPOCH, else the current UTC time.
std::string ResolveBuildTimestamp(const std::optional<std::string> &requested);

class DefaultBuildPipeline : public BuildPipeline {
public:
  explicit DefaultBuildPipeline(BuildComponents components);

  BuildResult Run(const BuildConfig &config) override;

private:
  void SkipCommittedRecords(const BuildCheckpoint &checkpoint);

  std::shared_ptr<const CorpusAdapter> adapter_;
  std::unique_ptr<DocumentSource> source_;
  std::shared_ptr<Logger> logger_;
  std::size_t threads_;
};

} // namespace citegraph
