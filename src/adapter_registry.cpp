#include <citegraph/adapter_registry.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace citegraph {

void AdapterRegistry::Register(const std::string &corpus_id,
                               AdapterFactory factory,
                               bool replace_existing) {
  if (corpus_id.empty()) {
    throw std::invalid_argument("Corpus id cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for corpus '" + corpus_id +
                                "' cannot be null");
  }
  if (!replace_existing && factories_.count(corpus_id) != 0) {
    throw std::invalid_argument("Corpus '" + corpus_id +
                                "' already registered");
  }
  factories_[corpus_id] = std::move(factory);
}

void AdapterRegistry::RegisterSpec(CorpusAdapterSpec spec,
                                   bool replace_existing) {
  // Compile once up front so a malformed table fails at registration time.
  auto adapter = std::make_shared<const CorpusAdapter>(std::move(spec));
  const auto corpus_id = adapter->CorpusId();
  Register(
      corpus_id, [adapter]() { return adapter; }, replace_existing);
}

std::shared_ptr<const CorpusAdapter>
AdapterRegistry::Create(const std::string &corpus_id) const {
  if (corpus_id.empty()) {
    throw std::invalid_argument("No corpus selected. Registered: " +
                                JoinNames());
  }
  const auto found = factories_.find(corpus_id);
  if (found == factories_.end()) {
    throw std::invalid_argument("Unknown corpus '" + corpus_id +
                                "'. Registered: " + JoinNames());
  }
  auto adapter = found->second();
  if (!adapter) {
    throw std::runtime_error("Factory for corpus '" + corpus_id +
                             "' returned null");
  }
  return adapter;
}

bool AdapterRegistry::Contains(const std::string &corpus_id) const {
  return factories_.count(corpus_id) != 0;
}

std::vector<std::string> AdapterRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(factories_.size());
  for (const auto &entry : factories_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::string AdapterRegistry::JoinNames() const {
  const auto names = Names();
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

AdapterRegistry MakeAdapterRegistryWithBuiltins() {
  AdapterRegistry registry;
  for (auto &spec : BuiltinAdapterSpecs()) {
    const auto corpus_id = spec.corpus_id;
    registry.Register(corpus_id, [spec = std::move(spec)]() {
      return std::make_shared<const CorpusAdapter>(spec);
    });
  }
  return registry;
}

const AdapterRegistry &GlobalAdapterRegistry() {
  static const AdapterRegistry registry = MakeAdapterRegistryWithBuiltins();
  return registry;
}

} // namespace citegraph
