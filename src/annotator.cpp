#include <citegraph/annotator.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>
#include <utility>

namespace citegraph {
namespace {

constexpr std::size_t kMaxKeyTerms = 10;
constexpr std::size_t kCapitalizedScanBytes = 500;
constexpr std::size_t kMaxQuotedBytes = 256;

const std::vector<std::string> &CriminalIndicators() {
  static const std::vector<std::string> indicators = {
      "felony",   "misdemeanor", "imprisonment", "imprisoned", "convicted",
      "guilty",   "offense",     "violation",    "penalty"};
  return indicators;
}

const std::vector<std::string> &ProceduralIndicators() {
  static const std::vector<std::string> indicators = {
      "procedure", "process", "filing", "hearing", "motion"};
  return indicators;
}

using KeywordTable =
    std::vector<std::pair<std::string, std::vector<std::string>>>;

const KeywordTable &PracticeAreaKeywords() {
  static const KeywordTable table = {
      {"criminal_law",
       {"felony", "misdemeanor", "imprisonment", "convicted", "offense",
        "guilty", "crime", "criminal", "penal", "defendant", "prosecution",
        "sentence", "jail", "prison", "punish"}},
      {"family_law",
       {"marriage", "divorce", "custody", "child support", "adoption",
        "spouse", "parent", "guardian", "domestic", "alimony", "visitation"}},
      {"property_law",
       {"property", "real estate", "conveyance", "deed", "mortgage",
        "landlord", "tenant", "lease", "title", "easement", "lien"}},
      {"business_law",
       {"corporation", "llc", "partnership", "business", "commercial",
        "contract", "enterprise", "company", "shareholder", "entity"}},
      {"tax_law",
       {"tax", "revenue", "assessment", "levy", "taxation", "taxable",
        "income tax", "sales tax", "property tax"}},
      {"employment_law",
       {"employment", "employee", "employer", "workplace", "labor", "wage",
        "worker", "compensation", "unemployment", "benefits"}},
      {"administrative_law",
       {"agency", "regulation", "administrative", "rule", "board",
        "commission", "department", "licensing", "permit"}},
      {"civil_procedure",
       {"complaint", "summons", "pleading", "discovery", "trial", "judgment",
        "appeal", "motion", "filing"}}};
  return table;
}

const std::vector<std::string> &StopWords() {
  static const std::vector<std::string> words = {"the",  "and",  "for",
                                                 "with", "from", "this",
                                                 "that"};
  return words;
}

std::string Lowered(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Trimmed(const std::string &value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

bool ContainsAny(const std::string &haystack,
                 const std::vector<std::string> &needles) {
  return std::any_of(needles.begin(), needles.end(),
                     [&haystack](const std::string &needle) {
                       return haystack.find(needle) != std::string::npos;
                     });
}

std::size_t CountContained(const std::string &haystack,
                           const std::vector<std::string> &needles) {
  return static_cast<std::size_t>(
      std::count_if(needles.begin(), needles.end(),
                    [&haystack](const std::string &needle) {
                      return haystack.find(needle) != std::string::npos;
                    }));
}

void AppendUnique(std::vector<std::string> &values, std::string value) {
  if (value.empty() ||
      std::find(values.begin(), values.end(), value) != values.end()) {
    return;
  }
  values.push_back(std::move(value));
}

bool HasBody(const Document &document) {
  return std::any_of(document.body.begin(), document.body.end(),
                     [](const std::string &paragraph) {
                       return !Trimmed(paragraph).empty();
                     });
}

std::optional<std::string> DegreeFor(const std::string &lowered,
                                     const std::regex &pattern,
                                     char prefix) {
  static const std::vector<std::string> ordinals = {"first", "second", "third",
                                                    "fourth", "fifth"};
  std::smatch match;
  if (!std::regex_search(lowered, match, pattern)) {
    return std::nullopt;
  }
  const auto found =
      std::find(ordinals.begin(), ordinals.end(), match[1].str());
  if (found == ordinals.end()) {
    return std::nullopt;
  }
  return std::string(1, prefix) +
         std::to_string(std::distance(ordinals.begin(), found) + 1);
}

} // namespace

Annotator::Annotator(std::shared_ptr<const CorpusAdapter> adapter)
    : adapter_(std::move(adapter)) {
  if (!adapter_) {
    throw std::invalid_argument("Annotator requires an adapter");
  }
}

Enrichment Annotator::Annotate(const Document &document,
                               std::size_t citation_count) const {
  const auto text = SearchableText(document);
  const auto lowered = Lowered(text);

  Enrichment enrichment;
  enrichment.summary = Summarize(document.display_title);
  if (!enrichment.summary) {
    enrichment.summary = Summarize(document.header);
  }
  enrichment.practice_areas = PracticeAreas(document, lowered);
  enrichment.key_terms = KeyTerms(document, text);

  if (!HasBody(document)) {
    return enrichment;
  }

  enrichment.classification = Classify(document, lowered);
  enrichment.complexity = ComplexityScore(
      document.word_count, document.body.size(), citation_count);
  if (enrichment.classification == DocumentClass::kCriminalStatute) {
    enrichment.offense_level = OffenseLevel(lowered);
    enrichment.offense_degree = OffenseDegree(lowered);
  }
  return enrichment;
}

std::optional<std::string> Annotator::Summarize(const std::string &title) {
  auto subject = Trimmed(title);
  const auto separator = subject.find('|');
  if (separator != std::string::npos) {
    subject = Trimmed(subject.substr(separator + 1));
  }
  while (!subject.empty() && subject.back() == '.') {
    subject.pop_back();
  }
  subject = Lowered(Trimmed(subject));
  if (subject.empty()) {
    return std::nullopt;
  }

  if (ContainsAny(subject, {"definition", "defined"})) {
    return "Defines " + subject;
  }
  if (ContainsAny(subject, {"penalty", "penalties", "punishment"})) {
    return "Establishes penalties for " + subject;
  }
  if (ContainsAny(subject, {"procedure", "process", "filing"})) {
    return "Describes procedure for " + subject;
  }
  return "Relates to " + subject;
}

int Annotator::ComplexityScore(std::size_t word_count,
                               std::size_t paragraph_count,
                               std::size_t citation_count) {
  int score = 5;

  if (word_count > 1000) {
    score += 2;
  } else if (word_count > 500) {
    score += 1;
  } else if (word_count < 100) {
    score -= 1;
  }

  if (paragraph_count > 15) {
    score += 2;
  } else if (paragraph_count > 10) {
    score += 1;
  }

  // Citations per thousand words.
  if (citation_count == 0) {
    score -= 1;
  } else if (word_count > 0) {
    const auto scaled = citation_count * 1000;
    if (scaled > 20 * word_count) {
      score += 2;
    } else if (scaled > 10 * word_count) {
      score += 1;
    }
  }

  return std::clamp(score, 1, 10);
}

std::optional<std::string>
Annotator::OffenseLevel(const std::string &lowered) {
  if (lowered.find("minor misdemeanor") != std::string::npos) {
    return std::string("minor_misdemeanor");
  }
  if (lowered.find("felony") != std::string::npos) {
    return std::string("felony");
  }
  if (lowered.find("misdemeanor") != std::string::npos) {
    return std::string("misdemeanor");
  }
  return std::nullopt;
}

std::optional<std::string>
Annotator::OffenseDegree(const std::string &lowered) {
  static const std::regex felony(
      R"(felony of the (first|second|third|fourth|fifth) degree)");
  static const std::regex misdemeanor(
      R"(misdemeanor of the (first|second|third|fourth) degree)");
  if (auto degree = DegreeFor(lowered, felony, 'F')) {
    return degree;
  }
  return DegreeFor(lowered, misdemeanor, 'M');
}

std::optional<DocumentClass>
Annotator::Classify(const Document &document,
                    const std::string &lowered) const {
  if (!adapter_->Statutory()) {
    return DocumentClass::kOther;
  }
  if (CountContained(lowered, CriminalIndicators()) >= 2) {
    return DocumentClass::kCriminalStatute;
  }
  const auto heading = Lowered(document.header + " " + document.display_title);
  if (lowered.find("as used in") != std::string::npos ||
      heading.find("definition") != std::string::npos) {
    return DocumentClass::kDefinitional;
  }
  if (ContainsAny(lowered, ProceduralIndicators())) {
    return DocumentClass::kProcedural;
  }
  return DocumentClass::kCivilStatute;
}

std::vector<std::string>
Annotator::PracticeAreas(const Document &document,
                         const std::string &lowered) const {
  std::vector<std::string> areas;
  for (const auto &entry : PracticeAreaKeywords()) {
    if (CountContained(lowered, entry.second) >= 2) {
      AppendUnique(areas, entry.first);
    }
  }
  for (auto &area : adapter_->PracticeAreasFor(document.id)) {
    AppendUnique(areas, std::move(area));
  }
  return areas;
}

std::vector<std::string> Annotator::KeyTerms(const Document &document,
                                             const std::string &text) {
  static const std::regex separators(R"([,;.\-\s]{1,16})");
  static const std::regex capitalized(
      R"(\b([A-Z][a-z]{1,40}(?:\s{1,4}[A-Z][a-z]{1,40}){0,8})\b)");
  const auto &stop_words = StopWords();

  std::vector<std::string> terms;
  const auto title = Lowered(document.display_title);
  for (std::sregex_token_iterator it(title.begin(), title.end(), separators,
                                     -1),
       end;
       it != end; ++it) {
    auto word = it->str();
    if (word.size() > 3 &&
        std::find(stop_words.begin(), stop_words.end(), word) ==
            stop_words.end()) {
      AppendUnique(terms, std::move(word));
    }
  }

  // Quotes pair up left to right; an empty pair hands its closing quote on
  // as the next opening one.
  auto open = text.find('"');
  while (open != std::string::npos && terms.size() < kMaxKeyTerms) {
    const auto close = text.find('"', open + 1);
    if (close == std::string::npos) {
      break;
    }
    if (close == open + 1) {
      open = close;
      continue;
    }
    if (close - open - 1 <= kMaxQuotedBytes) {
      const auto term = Trimmed(text.substr(open + 1, close - open - 1));
      if (!term.empty() && term.size() < 30) {
        AppendUnique(terms, Lowered(term));
      }
    }
    open = text.find('"', close + 1);
  }

  const auto opening = text.substr(0, kCapitalizedScanBytes);
  for (std::sregex_iterator it(opening.begin(), opening.end(), capitalized),
       end;
       it != end && terms.size() < kMaxKeyTerms; ++it) {
    const auto term = (*it)[1].str();
    if (term.size() > 5) {
      AppendUnique(terms, Lowered(term));
    }
  }

  if (terms.size() > kMaxKeyTerms) {
    terms.resize(kMaxKeyTerms);
  }
  return terms;
}

} // namespace citegraph
