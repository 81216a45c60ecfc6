#include <citegraph/corpus_adapter.h>

#include <string>
#include <utility>
#include <vector>

namespace citegraph {
namespace {

CitationPatternSpec Pattern(std::string pattern, RelationshipKind kind,
                            std::string target_template = "$1",
                            bool uppercase = false) {
  CitationPatternSpec spec;
  spec.pattern = std::move(pattern);
  spec.kind = kind;
  spec.target_template = std::move(target_template);
  spec.uppercase = uppercase;
  return spec;
}

CorpusAdapterSpec OhioRevisedCode() {
  const std::string section = R"re((\d{1,4}\.\d{1,6}))re";
  const std::string sec = R"re((?:sections?|(?:§){1,2})\s{0,16})re";

  CorpusAdapterSpec spec;
  spec.corpus_id = "ohio_revised";
  spec.description = "Ohio Revised Code sections (2913.02)";
  spec.statutory = true;
  spec.id_format = R"re(\d{1,4}\.\d{1,6})re";
  spec.header_id = HeaderIdSpec{R"re(Section\s{1,16})re" + section, "$1", false};
  spec.patterns = {
      Pattern(R"re((?:as defined in|meaning (?:of|in)|definition in)\s{1,16})re" +
                  sec + section,
              RelationshipKind::kDefines),
      Pattern(R"re(as amended by\s{1,16})re" + sec + section,
              RelationshipKind::kAmends),
      Pattern(R"re((?:superseded|replaced) by\s{1,16})re" + sec + section,
              RelationshipKind::kSupersedes),
      Pattern(
          R"re((?:pursuant to|in accordance with|as provided in|under)\s{1,16})re" +
              sec + section,
          RelationshipKind::kCrossReference),
      Pattern(R"re(division\s{0,16}\([A-Za-z0-9]{1,8}\)(?:\([A-Za-z0-9]{1,8}\)){0,6}\s{1,16}of\s{1,16}section\s{1,16})re" +
                  section,
              RelationshipKind::kCrossReference),
      // Chapter references never name a section, so they stay unresolved.
      Pattern(R"re(chapters?\s{1,16}(\d{1,4})\.?\s{1,16}of the Revised Code)re",
              RelationshipKind::kCrossReference),
      Pattern(sec + section, RelationshipKind::kCrossReference),
      Pattern(R"re(\b(?:to|through)\s{1,16}(\d{3,4}\.\d{2,6})\b)re",
              RelationshipKind::kCrossReference),
  };
  spec.practice_areas = {{1700, 1799, "business_law"},
                         {2900, 2999, "criminal_law"},
                         {3100, 3199, "family_law"},
                         {5500, 5799, "tax_law"}};
  return spec;
}

CorpusAdapterSpec OhioAdministrativeCode() {
  const std::string rule =
      R"re((\d{3,4}(?::\d{1,3})?-\d{1,3}-\d{1,3}(?:\.\d{1,3})?))re";
  const std::string paragraph =
      R"re((?:paragraph\s{0,16}(?:\([A-Za-z0-9]{1,8}\)){1,6}\s{1,16}of\s{1,16})?)re";

  CorpusAdapterSpec spec;
  spec.corpus_id = "ohio_administrative";
  spec.description = "Ohio Administrative Code rules (3701-17-01)";
  spec.statutory = true;
  spec.id_format = R"re(\d{3,4}(?::\d{1,3})?-\d{1,3}-\d{1,3}(?:\.\d{1,3})?)re";
  spec.header_id = HeaderIdSpec{R"re(Rule\s{1,16})re" + rule, "$1", false};
  spec.patterns = {
      Pattern(R"re((?:as defined in|meaning (?:of|in))\s{1,16})re" + paragraph +
                  R"re(rule\s{1,16})re" + rule,
              RelationshipKind::kDefines),
      Pattern(R"re(as amended by\s{1,16}rule\s{1,16})re" + rule,
              RelationshipKind::kAmends),
      Pattern(R"re((?:rescinded and replaced|superseded|replaced) by\s{1,16}rule\s{1,16})re" +
                  rule,
              RelationshipKind::kSupersedes),
      Pattern(
          R"re((?:pursuant to|in accordance with|as provided in|under)\s{1,16})re" +
              paragraph + R"re(rule\s{1,16})re" + rule,
          RelationshipKind::kCrossReference),
      Pattern(R"re((?:O\.A\.C\.|Ohio\s{1,16}Adm(?:\.|inistrative)\s{0,16}Code)\s{1,16})re" +
                  rule,
              RelationshipKind::kCrossReference),
      Pattern(R"re(rules?\s{1,16})re" + rule, RelationshipKind::kCrossReference),
      Pattern(R"re(\b)re" + rule + R"re(\b)re",
              RelationshipKind::kCrossReference),
  };
  spec.practice_areas = {{3701, 3701, "health_law"},
                         {3745, 3745, "environmental_law"},
                         {3901, 3901, "insurance_law"},
                         {4121, 4123, "employment_law"},
                         {4901, 4901, "utilities_law"},
                         {5703, 5703, "tax_law"}};
  return spec;
}

CorpusAdapterSpec OhioConstitution() {
  const std::string article = R"re(([IVXLCDM]{1,8}))re";
  const std::string number = R"re((\d{1,3}[a-z]?))re";

  CorpusAdapterSpec spec;
  spec.corpus_id = "ohio_constitution";
  spec.description = "Ohio Constitution (Article I, Section 1)";
  spec.statutory = true;
  spec.id_format = R"re(Article [IVXLCDM]{1,8}, Section \d{1,3}[A-Z]?)re";
  spec.header_id = HeaderIdSpec{R"re(Article\s{1,16})re" + article +
                                    R"re(,?\s{1,16}Section\s{1,16})re" + number,
                                "Article $1, Section $2", true};
  spec.patterns = {
      Pattern(R"re(as amended by\s{1,16}Section\s{1,16})re" + number +
                  R"re(\s{1,16}of\s{1,16}Article\s{1,16})re" + article + R"re(\b)re",
              RelationshipKind::kAmends, "Article $2, Section $1", true),
      Pattern(R"re(Article\s{1,16})re" + article + R"re(,?\s{1,16}Section\s{1,16})re" +
                  number + R"re(\b)re",
              RelationshipKind::kCrossReference, "Article $1, Section $2",
              true),
      Pattern(R"re(Section\s{1,16})re" + number + R"re(\s{1,16}of\s{1,16}Article\s{1,16})re" +
                  article + R"re(\b)re",
              RelationshipKind::kCrossReference, "Article $2, Section $1",
              true),
      Pattern(R"re(Art\.?\s{0,16})re" + article + R"re(,?\s{0,16}(?:§)\s{0,16})re" + number,
              RelationshipKind::kCrossReference, "Article $1, Section $2",
              true),
  };
  return spec;
}

CorpusAdapterSpec OhioCaseLaw() {
  CorpusAdapterSpec spec;
  spec.corpus_id = "ohio_caselaw";
  spec.description =
      "Ohio court opinions (2023-Ohio-1234, 174 Ohio St.3d 471)";
  spec.statutory = false;
  spec.id_format = R"re(\d{4}-Ohio-\d{1,6}|\d{1,4} Ohio (?:St|App)\.(?:[23]d)? \d{1,5}|\d{1,4} N\.E\.(?:[23]d)? \d{1,5})re";
  spec.header_id =
      HeaderIdSpec{R"re(\b(\d{4})-Ohio-(\d{1,6})\b)re", "$1-Ohio-$2", false};
  spec.patterns = {
      Pattern(R"re(overrul(?:ed|ing)\b[^.;]{0,80}?\b(\d{4})-Ohio-(\d{1,6})\b)re",
              RelationshipKind::kSupersedes, "$1-Ohio-$2"),
      Pattern(R"re(\b(\d{4})-Ohio-(\d{1,6})\b)re", RelationshipKind::kCites,
              "$1-Ohio-$2"),
      Pattern(R"re(\b(\d{1,4})\s{1,16}Ohio\s{1,16}(St|App)\.\s{0,16}([23])d\s{1,16}(\d{1,5})\b)re",
              RelationshipKind::kCites, "$1 Ohio $2.$3d $4"),
      Pattern(R"re(\b(\d{1,4})\s{1,16}Ohio\s{1,16}(St|App)\.\s{1,16}(\d{1,5})\b)re",
              RelationshipKind::kCites, "$1 Ohio $2. $3"),
      Pattern(R"re(\b(\d{1,4})\s{1,16}N\.\s?E\.\s{0,16}([23])d\s{1,16}(\d{1,5})\b)re",
              RelationshipKind::kCites, "$1 N.E.$2d $3"),
      Pattern(R"re(\b(\d{1,4})\s{1,16}N\.\s?E\.\s{1,16}(\d{1,5})\b)re",
              RelationshipKind::kCites, "$1 N.E. $2"),
      // Federal reporters belong to no configured corpus.
      Pattern(R"re(\b(\d{1,4})\s{1,16}U\.\s?S\.\s{1,16}(\d{1,5})\b)re",
              RelationshipKind::kCites, "$1 U.S. $2"),
  };
  return spec;
}

} // namespace

std::vector<CorpusAdapterSpec> BuiltinAdapterSpecs() {
  return {OhioRevisedCode(), OhioAdministrativeCode(), OhioConstitution(),
          OhioCaseLaw()};
}

} // namespace citegraph
