#include <citegraph/citation_extractor.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>
#include <regex>
#include <stdexcept>
#include <utility>

namespace citegraph {
namespace {

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string CollapseWhitespace(const std::string &text, std::size_t begin,
                               std::size_t end) {
  std::string collapsed;
  collapsed.reserve(end - begin);
  bool pending_space = false;
  for (std::size_t i = begin; i < end; ++i) {
    if (IsSpace(text[i])) {
      pending_space = !collapsed.empty();
      continue;
    }
    if (pending_space) {
      collapsed.push_back(' ');
      pending_space = false;
    }
    collapsed.push_back(text[i]);
  }
  return collapsed;
}

// Accepted spans keyed by begin offset. Accepted spans never intersect, so
// only the nearest span starting before `end` can overlap [begin, end).
class SpanSet {
public:
  bool Overlaps(std::size_t begin, std::size_t end) const {
    auto next = spans_.lower_bound(end);
    if (next == spans_.begin()) {
      return false;
    }
    --next;
    return next->second > begin;
  }

  void Insert(std::size_t begin, std::size_t end) { spans_[begin] = end; }

private:
  std::map<std::size_t, std::size_t> spans_;
};

struct AcceptedMatch {
  std::size_t priority = 0;
  RawCitation citation;
};

} // namespace

std::string ContextSnippet(const std::string &text, std::size_t begin,
                           std::size_t end, std::size_t width) {
  end = std::min(end, text.size());
  begin = std::min(begin, end);
  const auto match_length = end - begin;
  if (match_length >= width) {
    return CollapseWhitespace(text, begin, end);
  }

  const auto slack = width - match_length;
  const auto room_after = text.size() - end;
  auto before = std::min(begin, slack / 2);
  auto after = std::min(room_after, slack - before);
  before = std::min(begin, slack - after);

  auto left = begin - before;
  auto right = end + after;

  // Never cut a word: move each edge inward to the nearest whitespace.
  if (left > 0 && !IsSpace(text[left - 1])) {
    while (left < begin && !IsSpace(text[left])) {
      ++left;
    }
  }
  if (right < text.size() && !IsSpace(text[right])) {
    while (right > end && !IsSpace(text[right - 1])) {
      --right;
    }
  }
  return CollapseWhitespace(text, left, right);
}

CitationExtractor::CitationExtractor(
    std::shared_ptr<const CorpusAdapter> adapter, ExtractionOptions options)
    : adapter_(std::move(adapter)), options_(options) {
  if (!adapter_) {
    throw std::invalid_argument("Citation extractor requires an adapter");
  }
  if (options_.context_width == 0) {
    throw std::invalid_argument("Context width must be positive");
  }
}

std::vector<RawCitation>
CitationExtractor::Extract(const Document &document) const {
  return Extract(SearchableText(document));
}

std::vector<RawCitation>
CitationExtractor::Extract(const std::string &text) const {
  SpanSet accepted_spans;
  std::vector<AcceptedMatch> accepted;

  for (const auto &pattern : adapter_->Patterns()) {
    try {
      const std::sregex_iterator end;
      for (std::sregex_iterator it(text.begin(), text.end(), pattern.Regex());
           it != end; ++it) {
        const auto &match = *it;
        const auto begin = static_cast<std::size_t>(match.position(0));
        const auto length = static_cast<std::size_t>(match.length(0));
        if (length == 0 || accepted_spans.Overlaps(begin, begin + length)) {
          continue;
        }
        accepted_spans.Insert(begin, begin + length);

        AcceptedMatch found;
        found.priority = pattern.Priority();
        found.citation.citation_text = match.str(0);
        found.citation.byte_offset = begin;
        found.citation.context_snippet = ContextSnippet(
            text, begin, begin + length, options_.context_width);
        if (auto target = adapter_->Normalize(pattern, match)) {
          found.citation.target = std::move(*target);
          found.citation.kind = pattern.Kind();
        } else {
          found.citation.target = found.citation.citation_text;
          found.citation.kind = RelationshipKind::kUnknown;
        }
        accepted.push_back(std::move(found));
      }
    } catch (const std::regex_error &) {
      // The regex engine gave up on this text (complexity or stack limits);
      // matches already accepted for the pattern are kept.
      continue;
    }
  }

  std::sort(accepted.begin(), accepted.end(),
            [](const AcceptedMatch &lhs, const AcceptedMatch &rhs) {
              if (lhs.citation.byte_offset != rhs.citation.byte_offset) {
                return lhs.citation.byte_offset < rhs.citation.byte_offset;
              }
              return lhs.priority < rhs.priority;
            });

  std::vector<RawCitation> citations;
  citations.reserve(accepted.size());
  std::transform(std::make_move_iterator(accepted.begin()),
                 std::make_move_iterator(accepted.end()),
                 std::back_inserter(citations),
                 [](AcceptedMatch &&match) { return std::move(match.citation); });
  return citations;
}

} // namespace citegraph
