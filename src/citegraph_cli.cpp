#include <citegraph/build_pipeline.h>
#include <citegraph/citegraph_cli.h>
#include <citegraph/corpus_store.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using citegraph::BuildOptions;
using citegraph::ShowOptions;

const std::filesystem::path kDefaultOutputDirectory = "dist";

void PrintBuildUsage() {
  std::cout
      << "Usage: citegraph build --input <file.jsonl> --corpus <id> "
         "[options]\n"
      << "Options:\n"
      << "  --input <path>          JSONL document stream to index\n"
      << "  --corpus <id>           Corpus adapter to use (see 'citegraph "
         "adapters')\n"
      << "  --adapter-file <path>   YAML corpus adapter definition; defines "
         "or\n"
      << "                          replaces the corpus it names\n"
      << "  --out <path>            Output directory (default: dist)\n"
      << "  --config <file>         Optional YAML config file\n"
      << "  --batch-size <n>        Documents per committed batch "
         "(default: 2000)\n"
      << "  --threads <n>           Extraction workers (default: hardware,\n"
      << "                          at most 16)\n"
      << "  --max-chain-depth <n>   Chain expansion depth bound (default: 4)\n"
      << "  --max-chain-nodes <n>   Chain expansion size bound (default: 8)\n"
      << "  --complex-depth <n>     Depth that makes a chain complex "
         "(default: 3)\n"
      << "  --complex-size <n>      Size that makes a chain complex "
         "(default: 4)\n"
      << "  --context-width <n>     Context snippet width in bytes "
         "(default: 100)\n"
      << "  --build-timestamp <ts>  Timestamp recorded in corpus_info\n"
      << "                          (default: SOURCE_DATE_EPOCH or now)\n"
      << "  --log-level <level>     Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose               Shortcut for --log-level info\n"
      << "  --debug                 Shortcut for --log-level debug\n"
      << "  --help                  Show this message\n";
}

void PrintShowUsage() {
  std::cout
      << "Usage: citegraph show (--db <file> | --corpus <id> [--out <dir>])\n"
      << "                      --store <name> (--key <id> | --keys)\n"
      << "Options:\n"
      << "  --db <path>      Corpus file to read\n"
      << "  --corpus <id>    Corpus whose file lives under --out\n"
      << "  --out <path>     Output directory of the build (default: dist)\n"
      << "  --store <name>   primary, citations, reverse_citations, chains or\n"
      << "                   metadata\n"
      << "  --key <id>       Print the value stored under <id>\n"
      << "  --keys           List every key of the store\n"
      << "  --help           Show this message\n";
}

void PrintStatsUsage() {
  std::cout
      << "Usage: citegraph stats (--db <file> | --corpus <id> [--out <dir>])\n";
}

void PrintAdaptersUsage() {
  std::cout << "Usage: citegraph adapters [--adapter-file <path>]\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::size_t ParseCount(const std::string &raw, const std::string &name) {
  const auto value = Trim(raw);
  if (value.empty() ||
      !std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
      })) {
    throw std::invalid_argument(name + " expects a non-negative integer, got '" +
                                raw + "'");
  }
  try {
    return static_cast<std::size_t>(std::stoull(value));
  } catch (const std::out_of_range &) {
    throw std::invalid_argument(name + " is out of range: " + raw);
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, BuildOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level = citegraph::ParseLogLevel(
        RequireValue(arguments, index, std::string(argument)));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = citegraph::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = citegraph::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleChainOption(const std::vector<std::string> &arguments,
                       std::size_t &index, BuildOptions &options) {
  const std::string argument = arguments[index];
  if (argument == "--max-chain-depth") {
    options.max_chain_depth =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--max-chain-nodes") {
    options.max_chain_nodes =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--complex-depth") {
    options.complex_depth =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--complex-size") {
    options.complex_size =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  return false;
}

bool HandleTuningOption(const std::vector<std::string> &arguments,
                        std::size_t &index, BuildOptions &options) {
  const std::string argument = arguments[index];
  if (argument == "--batch-size") {
    options.batch_size =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--threads") {
    options.threads =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--context-width") {
    options.context_width =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  return false;
}

bool DispatchBuildOption(const std::vector<std::string> &arguments,
                         std::size_t &index, BuildOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--input") {
    options.input = RequireValue(arguments, index, "--input");
    return true;
  }
  if (argument == "--corpus") {
    options.corpus = RequireValue(arguments, index, "--corpus");
    return true;
  }
  if (argument == "--adapter-file") {
    options.adapter_file = RequireValue(arguments, index, "--adapter-file");
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--build-timestamp") {
    options.build_timestamp =
        RequireValue(arguments, index, "--build-timestamp");
    return true;
  }
  return HandleTuningOption(arguments, index, options) ||
         HandleChainOption(arguments, index, options) ||
         HandleLoggingOption(arguments, index, options);
}

void ValidateBuildOptions(const BuildOptions &options) {
  if (!options.input) {
    throw std::invalid_argument("--input is required (or set in config file)");
  }
}

using ConfigValue = std::variant<std::string, std::size_t>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "input",           "corpus",          "adapter_file",
      "out",             "batch_size",      "threads",
      "max_chain_depth", "max_chain_nodes", "complex_depth",
      "complex_size",    "context_width",   "build_timestamp",
      "log_level"};
  return keys;
}

bool IsCountKey(const std::string &key) {
  return key == "batch_size" || key == "threads" || key == "max_chain_depth" ||
         key == "max_chain_nodes" || key == "complex_depth" ||
         key == "complex_size" || key == "context_width";
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"input_file", "input"},
      {"corpus_id", "corpus"},
      {"adapter", "adapter_file"},
      {"output", "out"},
      {"output_directory", "out"},
      {"workers", "threads"},
      {"max_depth", "max_chain_depth"},
      {"max_nodes", "max_chain_nodes"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key +
                                "' must be a scalar value");
  }
  const auto value = node.as<std::string>();
  if (IsCountKey(key)) {
    return ConfigValue{ParseCount(value, key)};
  }
  return ConfigValue{value};
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &ex) {
    throw std::invalid_argument("Malformed config file " + path.string() +
                                ": " + ex.what());
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, BuildOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "input") {
      options.input = std::get<std::string>(value);
    } else if (key == "corpus") {
      options.corpus = std::get<std::string>(value);
    } else if (key == "adapter_file") {
      options.adapter_file = std::get<std::string>(value);
    } else if (key == "out") {
      options.output_directory = std::get<std::string>(value);
    } else if (key == "build_timestamp") {
      options.build_timestamp = std::get<std::string>(value);
    } else if (key == "log_level") {
      options.log_level = citegraph::ParseLogLevel(std::get<std::string>(value));
    } else if (key == "batch_size") {
      options.batch_size = std::get<std::size_t>(value);
    } else if (key == "threads") {
      options.threads = std::get<std::size_t>(value);
    } else if (key == "max_chain_depth") {
      options.max_chain_depth = std::get<std::size_t>(value);
    } else if (key == "max_chain_nodes") {
      options.max_chain_nodes = std::get<std::size_t>(value);
    } else if (key == "complex_depth") {
      options.complex_depth = std::get<std::size_t>(value);
    } else if (key == "complex_size") {
      options.complex_size = std::get<std::size_t>(value);
    } else if (key == "context_width") {
      options.context_width = std::get<std::size_t>(value);
    } else {
      ThrowUnknownKey(key);
    }
  }
}

bool DispatchShowOption(const std::vector<std::string> &arguments,
                        std::size_t &index, ShowOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--db") {
    options.database = RequireValue(arguments, index, "--db");
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--corpus") {
    options.corpus = RequireValue(arguments, index, "--corpus");
    return true;
  }
  if (argument == "--store") {
    options.store = RequireValue(arguments, index, "--store");
    return true;
  }
  if (argument == "--key") {
    options.key = RequireValue(arguments, index, "--key");
    return true;
  }
  if (argument == "--keys") {
    options.list_keys = true;
    return true;
  }
  return false;
}

void PrintBuildSummary(const std::string &corpus_id,
                       const citegraph::BuildResult &result) {
  const auto &stats = result.stats;
  std::cout << "Built corpus '" << corpus_id << "'"
            << (result.resumed ? " (resumed)" : "") << "\n"
            << "  documents:            " << stats.total_documents << "\n"
            << "  with citations:       " << stats.documents_with_citations
            << "\n"
            << "  cited:                " << stats.documents_cited << "\n"
            << "  citations:            " << stats.total_citations << "\n"
            << "  unresolved citations: " << stats.unresolved_citations << "\n"
            << "  complex chains:       " << stats.complex_chains << "\n"
            << "  skipped records:      " << stats.skipped_records << "\n"
            << "  output:               " << result.output_path.string()
            << "\n";
}

} // namespace

namespace citegraph {

BuildOptions ParseBuildArguments(const std::vector<std::string> &arguments) {
  BuildOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchBuildOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

BuildOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  BuildOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

BuildOptions MergeOptions(const BuildOptions &config_options,
                          const BuildOptions &cli_options) {
  BuildOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.input, cli_options.input);
  override_value(merged.corpus, cli_options.corpus);
  override_value(merged.adapter_file, cli_options.adapter_file);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.batch_size, cli_options.batch_size);
  override_value(merged.threads, cli_options.threads);
  override_value(merged.max_chain_depth, cli_options.max_chain_depth);
  override_value(merged.max_chain_nodes, cli_options.max_chain_nodes);
  override_value(merged.complex_depth, cli_options.complex_depth);
  override_value(merged.complex_size, cli_options.complex_size);
  override_value(merged.context_width, cli_options.context_width);
  override_value(merged.build_timestamp, cli_options.build_timestamp);
  override_value(merged.log_level, cli_options.log_level);
  return merged;
}

BuildOptions ResolveBuildOptions(const BuildOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  BuildOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateBuildOptions(merged);
  return merged;
}

BuildConfig MakeBuildConfig(const BuildOptions &options) {
  BuildConfig config;
  config.output_directory =
      options.output_directory.value_or(kDefaultOutputDirectory);
  config.batch_size = options.batch_size.value_or(config.batch_size);
  config.context_width = options.context_width.value_or(config.context_width);
  auto &limits = config.chain_limits;
  limits.max_depth = options.max_chain_depth.value_or(limits.max_depth);
  limits.max_nodes = options.max_chain_nodes.value_or(limits.max_nodes);
  limits.complex_depth = options.complex_depth.value_or(limits.complex_depth);
  limits.complex_size = options.complex_size.value_or(limits.complex_size);
  config.build_timestamp = ResolveBuildTimestamp(options.build_timestamp);
  return config;
}

AdapterRegistry MakeAdapterRegistry(const BuildOptions &options) {
  auto registry = MakeAdapterRegistryWithBuiltins();
  if (options.adapter_file) {
    registry.RegisterSpec(LoadCorpusAdapterFile(*options.adapter_file),
                          /*replace_existing=*/true);
  }
  return registry;
}

std::string ResolveCorpusId(const BuildOptions &options) {
  if (options.corpus) {
    return *options.corpus;
  }
  if (options.adapter_file) {
    return LoadCorpusAdapterFile(*options.adapter_file).corpus_id;
  }
  throw std::invalid_argument(
      "--corpus is required unless --adapter-file names one");
}

ShowOptions ParseShowArguments(const std::vector<std::string> &arguments) {
  ShowOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchShowOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

std::filesystem::path ResolveDatabasePath(const ShowOptions &options) {
  if (options.database) {
    if (!std::filesystem::exists(*options.database)) {
      throw std::runtime_error("Corpus file not found: " +
                               options.database->string());
    }
    return *options.database;
  }
  if (!options.corpus) {
    throw std::invalid_argument("--db or --corpus is required");
  }
  const auto output_dir =
      options.output_directory.value_or(kDefaultOutputDirectory);
  const auto path = CorpusStorePath(output_dir, *options.corpus);
  if (!std::filesystem::exists(path)) {
    if (std::filesystem::exists(
            PartialCorpusStorePath(output_dir, *options.corpus))) {
      throw std::runtime_error("Corpus '" + *options.corpus +
                               "' has an unfinished build under " +
                               output_dir.string() +
                               "; rerun 'citegraph build' to complete it");
    }
    throw std::runtime_error("Corpus file not found: " + path.string());
  }
  return path;
}

int RunBuild(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseBuildArguments(arguments);
  if (cli_options.show_help) {
    PrintBuildUsage();
    return 0;
  }

  const auto merged = ResolveBuildOptions(cli_options);
  LoggingConfig logging;
  logging.level = merged.log_level.value_or(LogLevel::kWarn);
  auto logger = MakeLogger(logging, std::clog);

  const auto registry = MakeAdapterRegistry(merged);
  const auto corpus_id = ResolveCorpusId(merged);
  const auto config = MakeBuildConfig(merged);

  auto pipeline = BuildPipelineBuilder(registry)
                      .WithCorpus(corpus_id)
                      .WithInputPath(*merged.input)
                      .WithLogger(logger)
                      .WithThreads(merged.threads.value_or(0))
                      .Build();
  const auto result = pipeline.Run(config);
  PrintBuildSummary(corpus_id, result);
  return 0;
}

int RunShow(const std::vector<std::string> &arguments) {
  const auto options = ParseShowArguments(arguments);
  if (options.show_help) {
    PrintShowUsage();
    return 0;
  }
  if (!options.store) {
    throw std::invalid_argument("--store is required");
  }
  if (!options.key && !options.list_keys) {
    throw std::invalid_argument("--key or --keys is required");
  }

  const auto store_name = ParseStoreName(*options.store);
  CorpusStore store(ResolveDatabasePath(options));
  if (options.list_keys) {
    for (const auto &key : store.Keys(store_name)) {
      std::cout << key << "\n";
    }
    return 0;
  }

  const auto value = store.Get(store_name, *options.key);
  if (!value) {
    std::cout << "No " << StoreTableName(store_name) << " entry for '"
              << *options.key << "'\n";
    return 1;
  }
  std::cout << *value << "\n";
  return 0;
}

int RunStats(const std::vector<std::string> &arguments) {
  const auto options = ParseShowArguments(arguments);
  if (options.show_help) {
    PrintStatsUsage();
    return 0;
  }
  if (options.store || options.key || options.list_keys) {
    throw std::invalid_argument(
        "stats accepts only --db, --corpus and --out");
  }

  CorpusStore store(ResolveDatabasePath(options));
  const auto value = store.Get(StoreName::kMetadata, kCorpusInfoKey);
  if (!value) {
    throw std::runtime_error("Corpus file has no corpus_info record");
  }
  std::cout << *value << "\n";
  return 0;
}

int RunAdapters(const std::vector<std::string> &arguments) {
  BuildOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--help" || argument == "-h") {
      PrintAdaptersUsage();
      return 0;
    }
    if (argument == "--adapter-file") {
      options.adapter_file = RequireValue(arguments, i, "--adapter-file");
      continue;
    }
    throw std::invalid_argument("Unknown adapters argument: " + argument);
  }

  const auto registry = MakeAdapterRegistry(options);
  for (const auto &name : registry.Names()) {
    const auto adapter = registry.Create(name);
    std::cout << name << "\t"
              << (adapter->Statutory() ? "statutory" : "case law") << "\t"
              << adapter->Description() << "\n";
  }
  return 0;
}

} // namespace citegraph
