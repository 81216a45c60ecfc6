#include <citegraph/document_reader.h>

#include <cctype>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace citegraph {
namespace {

std::string Trim(const std::string &value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

std::optional<std::string> OptionalScalar(const YAML::Node &record,
                                          const char *key) {
  const auto node = record[key];
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  if (!node.IsScalar()) {
    throw std::invalid_argument(std::string("Field '") + key +
                                "' must be a string");
  }
  return node.as<std::string>();
}

std::string TitleFromHeader(const std::string &header) {
  const auto separator = header.find('|');
  if (separator == std::string::npos) {
    return Trim(header);
  }
  return Trim(header.substr(separator + 1));
}

// Value of the \uXXXX escape starting at `at`, if there is one.
std::optional<std::uint32_t> EscapedUnit(const std::string &line,
                                         std::size_t at) {
  if (at + 6 > line.size() || line[at] != '\\' || line[at + 1] != 'u') {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = at + 2; i < at + 6; ++i) {
    const auto c = static_cast<unsigned char>(line[i]);
    if (std::isxdigit(c) == 0) {
      return std::nullopt;
    }
    const auto digit =
        std::isdigit(c) != 0 ? c - '0' : std::tolower(c) - 'a' + 10;
    value = value * 16 + static_cast<std::uint32_t>(digit);
  }
  return value;
}

bool IsHighSurrogate(std::uint32_t unit) {
  return unit >= 0xD800 && unit <= 0xDBFF;
}

bool IsLowSurrogate(std::uint32_t unit) {
  return unit >= 0xDC00 && unit <= 0xDFFF;
}

// JSON writers escape characters beyond the basic plane as UTF-16 surrogate
// pairs, which yaml-cpp rejects. Each pair is folded into a single \U
// escape; an unpaired surrogate becomes U+FFFD.
std::string FoldSurrogateEscapes(const std::string &line) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string folded;
  folded.reserve(line.size());
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] != '\\') {
      folded.push_back(line[i]);
      continue;
    }
    const auto unit = EscapedUnit(line, i);
    if (!unit || (!IsHighSurrogate(*unit) && !IsLowSurrogate(*unit))) {
      // Escapes stay whole, so an escaped backslash never starts a \u.
      folded.append(line, i, 2);
      ++i;
      continue;
    }
    const auto low = EscapedUnit(line, i + 6);
    if (IsHighSurrogate(*unit) && low && IsLowSurrogate(*low)) {
      const std::uint32_t code =
          0x10000 + ((*unit - 0xD800) << 10) + (*low - 0xDC00);
      folded += "\\U";
      for (int shift = 28; shift >= 0; shift -= 4) {
        folded.push_back(kHex[(code >> shift) & 0xF]);
      }
      i += 11;
      continue;
    }
    folded += "\\uFFFD";
    i += 5;
  }
  return folded;
}

YAML::Node LoadRecord(const std::string &line) {
  try {
    return YAML::Load(FoldSurrogateEscapes(line));
  } catch (const YAML::Exception &ex) {
    throw std::invalid_argument(std::string("Malformed JSON: ") + ex.what());
  }
}

} // namespace

Document DecodeDocumentRecord(const std::string &line,
                              const CorpusAdapter &adapter) {
  const auto record = LoadRecord(line);
  if (!record.IsMap()) {
    throw std::invalid_argument("Record is not a JSON object");
  }

  Document document;
  document.corpus_id = adapter.CorpusId();
  document.header = Trim(OptionalScalar(record, "header").value_or(""));
  document.source_url = OptionalScalar(record, "url")
                            .value_or(OptionalScalar(record, "source_url")
                                          .value_or(""));
  document.url_hash = OptionalScalar(record, "url_hash").value_or("");

  if (const auto paragraphs = record["paragraphs"]) {
    if (!paragraphs.IsNull() && !paragraphs.IsSequence()) {
      throw std::invalid_argument("Field 'paragraphs' must be an array");
    }
    for (const auto &paragraph : paragraphs) {
      if (!paragraph.IsScalar()) {
        throw std::invalid_argument("Paragraphs must be strings");
      }
      document.body.push_back(paragraph.as<std::string>());
    }
  }
  document.word_count = CountWords(document.body);

  document.id = Trim(OptionalScalar(record, "id").value_or(""));
  if (document.id.empty()) {
    document.id = adapter.IdFromHeader(document.header).value_or("");
  }
  if (document.id.empty()) {
    throw std::invalid_argument("Record has no id and none can be derived "
                                "from header '" +
                                document.header + "'");
  }

  document.display_title = Trim(OptionalScalar(record, "title").value_or(""));
  if (document.display_title.empty()) {
    document.display_title = TitleFromHeader(document.header);
  }
  return document;
}

JsonlDocumentSource::JsonlDocumentSource(
    const std::filesystem::path &path,
    std::shared_ptr<const CorpusAdapter> adapter,
    std::shared_ptr<Logger> logger)
    : JsonlDocumentSource(std::make_unique<std::ifstream>(path), path.string(),
                          std::move(adapter), std::move(logger)) {}

JsonlDocumentSource::JsonlDocumentSource(
    std::unique_ptr<std::istream> stream, std::string name,
    std::shared_ptr<const CorpusAdapter> adapter,
    std::shared_ptr<Logger> logger)
    : stream_(std::move(stream)), name_(std::move(name)),
      adapter_(std::move(adapter)), logger_(EnsureLogger(std::move(logger))) {
  if (!stream_ || !*stream_) {
    throw std::runtime_error("Input file not found: " + name_);
  }
  if (!adapter_) {
    throw std::invalid_argument("Document source requires an adapter");
  }
}

std::optional<Document> JsonlDocumentSource::Next() {
  std::string line;
  while (std::getline(*stream_, line)) {
    ++line_number_;
    if (line_number_ == 1 && line.rfind("\xEF\xBB\xBF", 0) == 0) {
      line.erase(0, 3);
    }
    if (Trim(line).empty()) {
      continue;
    }
    try {
      return DecodeDocumentRecord(line, *adapter_);
    } catch (const std::invalid_argument &ex) {
      ++skipped_;
      logger_->Log(LogLevel::kWarn, "input.record.skipped",
                   {{"input", name_},
                    {"line", std::to_string(line_number_)},
                    {"reason", ex.what()}});
    } catch (const YAML::Exception &ex) {
      ++skipped_;
      logger_->Log(LogLevel::kWarn, "input.record.skipped",
                   {{"input", name_},
                    {"line", std::to_string(line_number_)},
                    {"reason", ex.what()}});
    }
  }
  if (stream_->bad()) {
    throw std::runtime_error("Failed to read input: " + name_);
  }
  return std::nullopt;
}

} // namespace citegraph
