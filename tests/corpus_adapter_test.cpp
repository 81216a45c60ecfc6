#include <citegraph/corpus_adapter.h>

#include <regex>
#include <stdexcept>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace citegraph {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

CorpusAdapterSpec BuiltinSpec(const std::string &corpus_id) {
  for (auto &spec : BuiltinAdapterSpecs()) {
    if (spec.corpus_id == corpus_id) {
      return spec;
    }
  }
  throw std::runtime_error("missing builtin " + corpus_id);
}

std::string ThrownMessage(const std::string &yaml) {
  try {
    CorpusAdapter adapter(ParseCorpusAdapterYaml(yaml));
  } catch (const std::invalid_argument &ex) {
    return ex.what();
  }
  return {};
}

TEST(CorpusAdapterTest, BuiltinAdaptersCompile) {
  const auto specs = BuiltinAdapterSpecs();
  ASSERT_EQ(4u, specs.size());
  for (const auto &spec : specs) {
    EXPECT_NO_THROW(CorpusAdapter adapter(spec)) << spec.corpus_id;
    EXPECT_FALSE(spec.patterns.empty()) << spec.corpus_id;
  }
}

TEST(CorpusAdapterTest, ValidatesRevisedCodeIdShape) {
  const CorpusAdapter adapter(BuiltinSpec("ohio_revised"));

  EXPECT_TRUE(adapter.IsValidId("2913.02"));
  EXPECT_TRUE(adapter.IsValidId("1.01"));
  EXPECT_FALSE(adapter.IsValidId("2913"));
  EXPECT_FALSE(adapter.IsValidId("chapter 2913"));
  EXPECT_FALSE(adapter.IsValidId(""));
}

TEST(CorpusAdapterTest, DerivesIdFromHeader) {
  const CorpusAdapter revised(BuiltinSpec("ohio_revised"));
  EXPECT_EQ("2913.02", revised.IdFromHeader("Section 2913.02|Theft."));
  EXPECT_EQ(std::nullopt, revised.IdFromHeader("Chapter 2913|Theft"));

  const CorpusAdapter constitution(BuiltinSpec("ohio_constitution"));
  EXPECT_EQ("Article IV, Section 3A",
            constitution.IdFromHeader("article iv section 3a|Courts"));
}

TEST(CorpusAdapterTest, MapsIdPrefixesToPracticeAreas) {
  const CorpusAdapter adapter(BuiltinSpec("ohio_revised"));

  EXPECT_THAT(adapter.PracticeAreasFor("2913.02"), ElementsAre("criminal_law"));
  EXPECT_THAT(adapter.PracticeAreasFor("5747.01"), ElementsAre("tax_law"));
  EXPECT_THAT(adapter.PracticeAreasFor("101.01"), IsEmpty());
}

TEST(CorpusAdapterTest, ExpandsTemplateGroups) {
  CitationPatternSpec spec;
  spec.pattern = R"((\d{1,6})-(\d{1,6}))";
  spec.target_template = "$2.$1$$";
  const CitationPattern pattern(spec, 0);

  const std::string text = "see 12-34 here";
  std::smatch match;
  ASSERT_TRUE(std::regex_search(text, match, pattern.Regex()));
  EXPECT_EQ("34.12$", pattern.Expand(match));
}

TEST(CorpusAdapterTest, ExpansionFailsWhenGroupDidNotParticipate) {
  CitationPatternSpec spec;
  spec.pattern = R"((\d{1,6})(x)?)";
  spec.target_template = "$1$2";
  const CitationPattern pattern(spec, 0);

  const std::string text = "12";
  std::smatch match;
  ASSERT_TRUE(std::regex_search(text, match, pattern.Regex()));
  EXPECT_EQ(std::nullopt, pattern.Expand(match));
}

TEST(CorpusAdapterTest, ParsesRelationshipAliases) {
  EXPECT_EQ(RelationshipKind::kAmends, ParseRelationshipKind("amended_by"));
  EXPECT_EQ(RelationshipKind::kSupersedes,
            ParseRelationshipKind("Superseded-By"));
  EXPECT_EQ(RelationshipKind::kCrossReference,
            ParseRelationshipKind("cross-reference"));
  EXPECT_EQ(RelationshipKind::kCites, ParseRelationshipKind("cited"));
  EXPECT_THROW(ParseRelationshipKind("mentions"), std::invalid_argument);
}

TEST(CorpusAdapterTest, ParsesAdapterDefinition) {
  const auto spec = ParseCorpusAdapterYaml(R"(
corpus: city_code
description: Columbus City Code
statutory: true
id_format: '\d{3,4}\.\d{2}'
header_id:
  pattern: 'Section\s{1,8}(\d{3,4}\.\d{2})'
patterns:
  - pattern: 'as defined in section\s{1,8}(\d{3,4}\.\d{2})'
    relationship: defines
  - pattern: 'C\.C\.\s{1,8}(\d{3,4}\.\d{2})'
    relationship: cross-reference
    case_sensitive: true
practice_areas:
  - from: 2301
    to: 2399
    area: criminal_law
)");

  EXPECT_EQ("city_code", spec.corpus_id);
  EXPECT_EQ("Columbus City Code", spec.description);
  ASSERT_TRUE(spec.header_id.has_value());
  ASSERT_EQ(2u, spec.patterns.size());
  EXPECT_EQ(RelationshipKind::kDefines, spec.patterns[0].kind);
  EXPECT_EQ(RelationshipKind::kCrossReference, spec.patterns[1].kind);
  EXPECT_TRUE(spec.patterns[1].case_sensitive);
  EXPECT_EQ("$1", spec.patterns[1].target_template);

  const CorpusAdapter adapter(spec);
  EXPECT_EQ("2317.11", adapter.IdFromHeader("Section 2317.11|Noise"));
  EXPECT_THAT(adapter.PracticeAreasFor("2317.11"), ElementsAre("criminal_law"));
}

TEST(CorpusAdapterTest, RejectsUnknownKeys) {
  EXPECT_THAT(ThrownMessage("corpus: x\nid_format: 'x'\nflavour: mild\n"),
              HasSubstr("Unknown key 'flavour'"));
  EXPECT_THAT(ThrownMessage("corpus: x\nid_format: 'x'\npatterns:\n"
                            "  - pattern: 'x'\n    weight: 3\n"),
              HasSubstr("Unknown key 'weight'"));
}

TEST(CorpusAdapterTest, RejectsMissingIdFormat) {
  EXPECT_THAT(ThrownMessage("corpus: x\npatterns: []\n"),
              HasSubstr("id_format"));
}

TEST(CorpusAdapterTest, RejectsMalformedPattern) {
  EXPECT_THAT(ThrownMessage("corpus: x\nid_format: 'x'\npatterns:\n"
                            "  - pattern: '(unclosed'\n"),
              HasSubstr("not a valid regular expression"));
}

TEST(CorpusAdapterTest, RejectsUnboundedRepetition) {
  EXPECT_THAT(ThrownMessage("corpus: x\nid_format: 'x'\npatterns:\n"
                            "  - pattern: 'see\\s+(\\d{1,4})'\n"),
              HasSubstr("unbounded quantifier at offset 5"));
  EXPECT_THAT(ThrownMessage("corpus: x\nid_format: 'x'\nheader_id:\n"
                            "  pattern: 'Rule (\\d*)'\npatterns:\n"
                            "  - pattern: '(a)'\n"),
              HasSubstr("unbounded quantifier"));
}

TEST(CorpusAdapterTest, FindsUnboundedQuantifiers) {
  EXPECT_EQ(std::size_t{2}, FindUnboundedQuantifier(R"(\s+x)"));
  EXPECT_EQ(std::size_t{1}, FindUnboundedQuantifier("a*"));
  EXPECT_EQ(std::size_t{2}, FindUnboundedQuantifier(R"(\d{2,})"));

  EXPECT_EQ(std::nullopt, FindUnboundedQuantifier(R"(\s{1,16}\d{1,4})"));
  EXPECT_EQ(std::nullopt, FindUnboundedQuantifier(R"(C\+\+ \*)"));
  EXPECT_EQ(std::nullopt, FindUnboundedQuantifier(R"([+*]{1,2}[^+\]*])"));
  EXPECT_EQ(std::nullopt, FindUnboundedQuantifier(R"([^.;]{0,80}?x{3})"));
}

TEST(CorpusAdapterTest, RejectsTemplateBeyondCaptureGroups) {
  EXPECT_THAT(ThrownMessage("corpus: x\nid_format: 'x'\npatterns:\n"
                            "  - pattern: '(a)'\n    template: '$1-$3'\n"),
              HasSubstr("template references $3"));
}

TEST(CorpusAdapterTest, RejectsUnknownRelationship) {
  EXPECT_THAT(ThrownMessage("corpus: x\nid_format: 'x'\npatterns:\n"
                            "  - pattern: '(a)'\n    relationship: likes\n"),
              HasSubstr("Unknown relationship kind"));
}

TEST(CorpusAdapterTest, RejectsMalformedYaml) {
  EXPECT_THAT(ThrownMessage("corpus: [unclosed\n"),
              HasSubstr("Malformed adapter definition"));
}

TEST(CorpusAdapterTest, LoadsAdapterFile) {
  test::TemporaryProject project;
  const auto path = project.AddFile(
      "adapter.yaml", "corpus: tiny\nid_format: '[a-z]+'\npatterns:\n"
                      "  - pattern: 'see ([a-z]{1,20})'\n");

  const auto spec = LoadCorpusAdapterFile(path);
  EXPECT_EQ("tiny", spec.corpus_id);
  EXPECT_THROW(LoadCorpusAdapterFile(project.root() / "missing.yaml"),
               std::runtime_error);
}

} // namespace
} // namespace citegraph
