#pragma once

#include <citegraph/corpus_adapter.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace citegraph {

class AdapterRegistry {
public:
  using AdapterFactory = std::function<std::shared_ptr<const CorpusAdapter>()>;

  void Register(const std::string &corpus_id, AdapterFactory factory,
                bool replace_existing = false);
  void RegisterSpec(CorpusAdapterSpec spec, bool replace_existing = false);

  std::shared_ptr<const CorpusAdapter> Create(const std::string &corpus_id) const;
  bool Contains(const std::string &corpus_id) const;
  std::vector<std::string> Names() const;

private:
  std::string JoinNames() const;

  std::unordered_map<std::string, AdapterFactory> factories_;
};

AdapterRegistry MakeAdapterRegistryWithBuiltins();
const AdapterRegistry &GlobalAdapterRegistry();

} // namespace citegraph
