#include <citegraph/build_pipeline_builder.h>

#include <citegraph/build_pipeline.h>
#include <citegraph/document_reader.h>

#include <stdexcept>
#include <utility>

namespace citegraph {

BuildPipelineBuilder::BuildPipelineBuilder(const AdapterRegistry &registry)
    : registry_(&registry) {}

BuildPipelineBuilder &BuildPipelineBuilder::WithCorpus(std::string corpus_id) {
  corpus_id_ = std::move(corpus_id);
  return *this;
}

BuildPipelineBuilder &BuildPipelineBuilder::WithAdapter(
    std::shared_ptr<const CorpusAdapter> adapter) {
  components_.adapter = std::move(adapter);
  return *this;
}

BuildPipelineBuilder &
BuildPipelineBuilder::WithInputPath(std::filesystem::path input) {
  input_ = std::move(input);
  return *this;
}

BuildPipelineBuilder &BuildPipelineBuilder::WithDocumentSource(
    std::unique_ptr<DocumentSource> source) {
  components_.source = std::move(source);
  return *this;
}

BuildPipelineBuilder &
BuildPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

BuildPipelineBuilder &BuildPipelineBuilder::WithThreads(std::size_t threads) {
  components_.threads = threads;
  return *this;
}

DefaultBuildPipeline BuildPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  components_.adapter = components_.adapter
                            ? std::move(components_.adapter)
                            : registry_->Create(corpus_id_);
  if (!components_.source) {
    if (!input_) {
      throw std::invalid_argument("No input selected for corpus '" +
                                  components_.adapter->CorpusId() + "'");
    }
    components_.source = std::make_unique<JsonlDocumentSource>(
        *input_, components_.adapter, components_.logger);
  }
  return DefaultBuildPipeline(std::move(components_));
}

} // namespace citegraph
