#include <citegraph/corpus_adapter.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace citegraph {
namespace {

std::string ToUpper(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::regex CompileOrThrow(const std::string &pattern,
                          std::regex::flag_type flags,
                          const std::string &what) {
  if (pattern.empty()) {
    throw std::invalid_argument(what + " is empty");
  }
  try {
    return std::regex(pattern, flags);
  } catch (const std::regex_error &ex) {
    throw std::invalid_argument(what + " '" + pattern +
                                "' is not a valid regular expression: " +
                                ex.what());
  }
}

std::size_t HighestGroupReference(const std::string &target_template) {
  std::size_t highest = 0;
  for (std::size_t i = 0; i + 1 < target_template.size(); ++i) {
    if (target_template[i] != '$') {
      continue;
    }
    const auto next = target_template[i + 1];
    if (next == '$') {
      ++i;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(next)) != 0) {
      highest = std::max<std::size_t>(highest, next - '0');
      ++i;
    }
  }
  return highest;
}

std::optional<long> LeadingNumber(const std::string &id) {
  std::size_t length = 0;
  while (length < id.size() && length < 9 &&
         std::isdigit(static_cast<unsigned char>(id[length])) != 0) {
    ++length;
  }
  if (length == 0) {
    return std::nullopt;
  }
  return std::stol(id.substr(0, length));
}

} // namespace

std::optional<std::size_t> FindUnboundedQuantifier(const std::string &pattern) {
  bool in_class = false;
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const char c = pattern[i];
    if (c == '\\') {
      ++i;
      continue;
    }
    if (in_class) {
      in_class = c != ']';
      continue;
    }
    if (c == '[') {
      in_class = true;
      continue;
    }
    if (c == '*' || c == '+') {
      return i;
    }
    if (c == '{') {
      const auto close = pattern.find('}', i);
      if (close != std::string::npos && close > i + 1 &&
          pattern[close - 1] == ',') {
        return i;
      }
    }
  }
  return std::nullopt;
}

CitationPattern::CitationPattern(CitationPatternSpec spec, std::size_t priority)
    : spec_(std::move(spec)), priority_(priority) {
  auto flags = std::regex::ECMAScript | std::regex::optimize;
  if (!spec_.case_sensitive) {
    flags |= std::regex::icase;
  }
  regex_ = CompileOrThrow(spec_.pattern, flags,
                          "Citation pattern #" + std::to_string(priority_));
  if (const auto offset = FindUnboundedQuantifier(spec_.pattern)) {
    throw std::invalid_argument(
        "Citation pattern '" + spec_.pattern +
        "' has an unbounded quantifier at offset " + std::to_string(*offset) +
        "; use a bounded repetition such as {1,16}");
  }
  if (spec_.target_template.empty()) {
    throw std::invalid_argument("Citation pattern '" + spec_.pattern +
                                "' has an empty target template");
  }
  const auto referenced = HighestGroupReference(spec_.target_template);
  if (referenced > regex_.mark_count()) {
    throw std::invalid_argument(
        "Citation pattern '" + spec_.pattern + "' has " +
        std::to_string(regex_.mark_count()) +
        " capture groups but its template references $" +
        std::to_string(referenced));
  }
}

std::optional<std::string>
CitationPattern::Expand(const std::smatch &match) const {
  std::string expanded;
  const auto &tmpl = spec_.target_template;
  for (std::size_t i = 0; i < tmpl.size(); ++i) {
    if (tmpl[i] != '$' || i + 1 >= tmpl.size()) {
      expanded.push_back(tmpl[i]);
      continue;
    }
    const auto next = tmpl[i + 1];
    if (next == '$') {
      expanded.push_back('$');
      ++i;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(next)) == 0) {
      expanded.push_back(tmpl[i]);
      continue;
    }
    const auto group = static_cast<std::size_t>(next - '0');
    ++i;
    if (group >= match.size() || !match[group].matched) {
      return std::nullopt;
    }
    auto text = match[group].str();
    if (spec_.uppercase) {
      text = ToUpper(std::move(text));
    }
    expanded.append(text);
  }
  return expanded;
}

CorpusAdapter::CorpusAdapter(CorpusAdapterSpec spec) : spec_(std::move(spec)) {
  if (spec_.corpus_id.empty()) {
    throw std::invalid_argument("Corpus adapter requires a corpus id");
  }
  id_format_ = CompileOrThrow(
      spec_.id_format, std::regex::ECMAScript | std::regex::optimize,
      "Id format of corpus '" + spec_.corpus_id + "'");

  patterns_.reserve(spec_.patterns.size());
  for (std::size_t i = 0; i < spec_.patterns.size(); ++i) {
    patterns_.emplace_back(spec_.patterns[i], i);
  }

  if (spec_.header_id) {
    CitationPatternSpec header;
    header.pattern = spec_.header_id->pattern;
    header.target_template = spec_.header_id->target_template;
    header.uppercase = spec_.header_id->uppercase;
    header_id_.emplace(std::move(header), 0);
  }

  for (const auto &range : spec_.practice_areas) {
    if (range.area.empty() || range.from > range.to) {
      throw std::invalid_argument("Practice area range " +
                                  std::to_string(range.from) + "-" +
                                  std::to_string(range.to) + " of corpus '" +
                                  spec_.corpus_id + "' is malformed");
    }
  }
}

bool CorpusAdapter::IsValidId(const std::string &candidate) const {
  if (candidate.empty()) {
    return false;
  }
  return std::regex_match(candidate, id_format_);
}

std::optional<std::string>
CorpusAdapter::Normalize(const CitationPattern &pattern,
                         const std::smatch &match) const {
  auto expanded = pattern.Expand(match);
  if (!expanded || !IsValidId(*expanded)) {
    return std::nullopt;
  }
  return expanded;
}

std::optional<std::string>
CorpusAdapter::IdFromHeader(const std::string &header) const {
  if (!header_id_) {
    return std::nullopt;
  }
  std::smatch match;
  if (!std::regex_search(header, match, header_id_->Regex())) {
    return std::nullopt;
  }
  return Normalize(*header_id_, match);
}

std::vector<std::string>
CorpusAdapter::PracticeAreasFor(const std::string &id) const {
  std::vector<std::string> areas;
  const auto prefix = LeadingNumber(id);
  if (!prefix) {
    return areas;
  }
  for (const auto &range : spec_.practice_areas) {
    if (*prefix >= range.from && *prefix <= range.to &&
        std::find(areas.begin(), areas.end(), range.area) == areas.end()) {
      areas.push_back(range.area);
    }
  }
  return areas;
}

RelationshipKind ParseRelationshipKind(const std::string &value) {
  auto normalized = ToLower(value);
  std::replace(normalized.begin(), normalized.end(), '-', '_');
  static const std::unordered_map<std::string, RelationshipKind> names = {
      {"defines", RelationshipKind::kDefines},
      {"cross_reference", RelationshipKind::kCrossReference},
      {"cites", RelationshipKind::kCites},
      {"cited", RelationshipKind::kCites},
      {"amends", RelationshipKind::kAmends},
      {"amended_by", RelationshipKind::kAmends},
      {"supersedes", RelationshipKind::kSupersedes},
      {"superseded_by", RelationshipKind::kSupersedes},
      {"unknown", RelationshipKind::kUnknown}};
  const auto found = names.find(normalized);
  if (found == names.end()) {
    throw std::invalid_argument("Unknown relationship kind: " + value);
  }
  return found->second;
}

namespace {

const std::vector<std::string> &SupportedAdapterKeys() {
  static const std::vector<std::string> keys = {
      "corpus",   "description", "statutory",     "id_format",
      "header_id", "patterns",   "practice_areas"};
  return keys;
}

void RejectUnknownKeys(const YAML::Node &node,
                       const std::vector<std::string> &supported,
                       const std::string &context) {
  for (const auto &entry : node) {
    const auto key = entry.first.as<std::string>();
    if (std::find(supported.begin(), supported.end(), key) ==
        supported.end()) {
      throw std::invalid_argument("Unknown key '" + key + "' in " + context);
    }
  }
}

std::string RequireScalar(const YAML::Node &node, const std::string &key,
                          const std::string &context) {
  const auto value = node[key];
  if (!value || !value.IsScalar()) {
    throw std::invalid_argument(context + " requires a scalar '" + key + "'");
  }
  return value.as<std::string>();
}

CitationPatternSpec PatternFromNode(const YAML::Node &node,
                                    std::size_t index) {
  const auto context = "pattern #" + std::to_string(index);
  if (!node.IsMap()) {
    throw std::invalid_argument(context + " must be a mapping");
  }
  RejectUnknownKeys(node,
                    {"pattern", "relationship", "template", "uppercase",
                     "case_sensitive"},
                    context);
  CitationPatternSpec spec;
  spec.pattern = RequireScalar(node, "pattern", context);
  if (node["relationship"]) {
    spec.kind = ParseRelationshipKind(node["relationship"].as<std::string>());
  }
  if (node["template"]) {
    spec.target_template = node["template"].as<std::string>();
  }
  if (node["uppercase"]) {
    spec.uppercase = node["uppercase"].as<bool>();
  }
  if (node["case_sensitive"]) {
    spec.case_sensitive = node["case_sensitive"].as<bool>();
  }
  return spec;
}

CorpusAdapterSpec SpecFromNode(const YAML::Node &root) {
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Adapter definition must contain a mapping at the root");
  }
  RejectUnknownKeys(root, SupportedAdapterKeys(), "adapter definition");

  CorpusAdapterSpec spec;
  spec.corpus_id = RequireScalar(root, "corpus", "Adapter definition");
  spec.id_format = RequireScalar(root, "id_format", "Adapter definition");
  if (root["description"]) {
    spec.description = root["description"].as<std::string>();
  }
  if (root["statutory"]) {
    spec.statutory = root["statutory"].as<bool>();
  }
  if (const auto header = root["header_id"]) {
    HeaderIdSpec header_spec;
    if (header.IsScalar()) {
      header_spec.pattern = header.as<std::string>();
    } else {
      RejectUnknownKeys(header, {"pattern", "template", "uppercase"},
                        "header_id");
      header_spec.pattern = RequireScalar(header, "pattern", "header_id");
      if (header["template"]) {
        header_spec.target_template = header["template"].as<std::string>();
      }
      if (header["uppercase"]) {
        header_spec.uppercase = header["uppercase"].as<bool>();
      }
    }
    spec.header_id = std::move(header_spec);
  }
  if (const auto patterns = root["patterns"]) {
    if (!patterns.IsSequence()) {
      throw std::invalid_argument("Adapter 'patterns' must be a list");
    }
    std::size_t index = 0;
    for (const auto &pattern : patterns) {
      spec.patterns.push_back(PatternFromNode(pattern, index++));
    }
  }
  if (const auto areas = root["practice_areas"]) {
    if (!areas.IsSequence()) {
      throw std::invalid_argument("Adapter 'practice_areas' must be a list");
    }
    for (const auto &area : areas) {
      RejectUnknownKeys(area, {"from", "to", "area"}, "practice_areas");
      PracticeAreaRange range;
      range.from = area["from"].as<long>();
      range.to = area["to"] ? area["to"].as<long>() : range.from;
      range.area = RequireScalar(area, "area", "practice_areas entry");
      spec.practice_areas.push_back(std::move(range));
    }
  }
  return spec;
}

} // namespace

CorpusAdapterSpec ParseCorpusAdapterYaml(const std::string &yaml_text) {
  try {
    return SpecFromNode(YAML::Load(yaml_text));
  } catch (const YAML::Exception &ex) {
    throw std::invalid_argument(std::string("Malformed adapter definition: ") +
                                ex.what());
  }
}

CorpusAdapterSpec LoadCorpusAdapterFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  if (!stream) {
    throw std::runtime_error("Adapter file not found: " + path.string());
  }
  const std::string content((std::istreambuf_iterator<char>(stream)),
                            std::istreambuf_iterator<char>());
  return ParseCorpusAdapterYaml(content);
}

} // namespace citegraph
