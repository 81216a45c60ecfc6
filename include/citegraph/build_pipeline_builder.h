#pragma once

#include <citegraph/adapter_registry.h>
#include <citegraph/interfaces.h>
#include <citegraph/logging.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace citegraph {

class DefaultBuildPipeline;

struct BuildComponents {
  std::shared_ptr<const CorpusAdapter> adapter;
  std::unique_ptr<DocumentSource> source;
  std::shared_ptr<Logger> logger;
  std::size_t threads = 0;
};

class BuildPipelineBuilder {
public:
  explicit BuildPipelineBuilder(
      const AdapterRegistry &registry = GlobalAdapterRegistry());

  BuildPipelineBuilder &WithCorpus(std::string corpus_id);
  BuildPipelineBuilder &
  WithAdapter(std::shared_ptr<const CorpusAdapter> adapter);
  BuildPipelineBuilder &WithInputPath(std::filesystem::path input);
  BuildPipelineBuilder &WithDocumentSource(std::unique_ptr<DocumentSource> source);
  BuildPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  BuildPipelineBuilder &WithThreads(std::size_t threads);

  DefaultBuildPipeline Build();

private:
  const AdapterRegistry *registry_;
  std::string corpus_id_;
  std::optional<std::filesystem::path> input_;
  BuildComponents components_;
};

} // namespace citegraph
