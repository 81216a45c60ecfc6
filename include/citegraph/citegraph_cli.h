#pragma once

#include <citegraph/adapter_registry.h>
#include <citegraph/logging.h>
#include <citegraph/models.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace citegraph {

struct BuildOptions {
  std::optional<std::filesystem::path> input;
  std::optional<std::string> corpus;
  std::optional<std::filesystem::path> adapter_file;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::size_t> batch_size;
  std::optional<std::size_t> threads;
  std::optional<std::size_t> max_chain_depth;
  std::optional<std::size_t> max_chain_nodes;
  std::optional<std::size_t> complex_depth;
  std::optional<std::size_t> complex_size;
  std::optional<std::size_t> context_width;
  std::optional<std::string> build_timestamp;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

struct ShowOptions {
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> database;
  std::optional<std::string> corpus;
  std::optional<std::string> store;
  std::optional<std::string> key;
  bool list_keys = false;
  bool show_help = false;
};

BuildOptions ParseBuildArguments(const std::vector<std::string> &arguments);
BuildOptions ParseConfigFile(const std::filesystem::path &path);
BuildOptions MergeOptions(const BuildOptions &config_options,
                          const BuildOptions &cli_options);
BuildOptions ResolveBuildOptions(const BuildOptions &cli_options);
BuildConfig MakeBuildConfig(const BuildOptions &options);

// Registry with the built-ins plus the adapter file, if any. The file's
// corpus replaces a built-in of the same name.
AdapterRegistry MakeAdapterRegistry(const BuildOptions &options);
std::string ResolveCorpusId(const BuildOptions &options);

ShowOptions ParseShowArguments(const std::vector<std::string> &arguments);
std::filesystem::path ResolveDatabasePath(const ShowOptions &options);

int RunBuild(const std::vector<std::string> &arguments);
int RunShow(const std::vector<std::string> &arguments);
int RunStats(const std::vector<std::string> &arguments);
int RunAdapters(const std::vector<std::string> &arguments);

} // namespace citegraph
