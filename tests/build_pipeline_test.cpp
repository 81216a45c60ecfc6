#include <citegraph/build_pipeline.h>
#include <citegraph/corpus_store.h>
#include <citegraph/document_reader.h>

#include <algorithm>
#include <cstdlib>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include "test_support/temporary_project.h"

namespace citegraph {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

constexpr char kTimestamp[] = "2024-01-01T00:00:00Z";

const std::vector<std::string> &TheftChapter() {
  static const std::vector<std::string> lines = {
      R"({"id": "2913.01", "header": "Section 2913.01|Definitions.", "url": "https://example.test/2913.01", "paragraphs": ["As used in this chapter, \"deprive\" means to withhold property."]})",
      R"({"id": "2913.02", "header": "Section 2913.02|Theft.", "url": "https://example.test/2913.02", "paragraphs": ["No person shall obtain property, as defined in section 2913.01 of the Revised Code.", "Whoever violates this section is guilty of theft under section 2913.61."]})",
      R"({"id": "2913.03", "header": "Section 2913.03|Unauthorized use of a vehicle.", "url": "https://example.test/2913.03", "paragraphs": ["Penalties are set pursuant to section 2913.02; see chapter 2925 of the Revised Code."]})",
      R"({"id": "2913.04", "header": "Section 2913.04|Unauthorized use of property.", "url": "https://example.test/2913.04", "paragraphs": ["No person shall use property without consent under section 2913.03."]})"};
  return lines;
}

std::string Jsonl(const std::vector<std::string> &lines) {
  std::string content;
  for (const auto &line : lines) {
    content += line + "\n";
  }
  return content;
}

BuildConfig PinnedConfig(const std::filesystem::path &output) {
  BuildConfig config;
  config.output_directory = output;
  config.batch_size = 2;
  config.build_timestamp = kTimestamp;
  return config;
}

BuildResult BuildFromFile(const std::filesystem::path &input,
                          const BuildConfig &config) {
  return BuildPipelineBuilder()
      .WithCorpus("ohio_revised")
      .WithInputPath(input)
      .WithThreads(2)
      .Build()
      .Run(config);
}

using StoreDump = std::map<StoreName, std::map<std::string, std::string>>;

StoreDump DumpAll(const std::filesystem::path &path) {
  CorpusStore store(path);
  StoreDump dump;
  for (const auto name : AllStores()) {
    dump[name] = store.Dump(name);
  }
  return dump;
}

std::vector<Document> DecodeAll(const std::vector<std::string> &lines) {
  const auto adapter = GlobalAdapterRegistry().Create("ohio_revised");
  std::vector<Document> documents;
  for (const auto &line : lines) {
    documents.push_back(DecodeDocumentRecord(line, *adapter));
  }
  return documents;
}

// Serves documents from memory and fails once after a set number of reads,
// the way an interrupted input stream would.
class InterruptedSource : public DocumentSource {
public:
  InterruptedSource(std::vector<Document> documents, std::size_t fail_after)
      : documents_(std::move(documents)), fail_after_(fail_after) {}

  std::optional<Document> Next() override {
    if (reads_ == fail_after_) {
      throw std::runtime_error("input interrupted");
    }
    ++reads_;
    if (position_ >= documents_.size()) {
      return std::nullopt;
    }
    return documents_[position_++];
  }
  std::size_t SkippedRecords() const override { return 0; }

private:
  std::vector<Document> documents_;
  std::size_t fail_after_;
  std::size_t reads_ = 0;
  std::size_t position_ = 0;
};

constexpr std::size_t kNeverFail = static_cast<std::size_t>(-1);

BuildResult BuildFromMemory(std::vector<Document> documents,
                            const BuildConfig &config,
                            std::size_t fail_after = kNeverFail) {
  return BuildPipelineBuilder()
      .WithCorpus("ohio_revised")
      .WithDocumentSource(std::make_unique<InterruptedSource>(
          std::move(documents), fail_after))
      .Build()
      .Run(config);
}

std::set<std::string> Sequence(const YAML::Node &node) {
  std::set<std::string> values;
  for (const auto &value : node) {
    values.insert(value.as<std::string>());
  }
  return values;
}

TEST(BuildPipelineTest, OmitsKeysForAbsentData) {
  test::TemporaryProject project;
  const auto input = project.AddFile("sections.jsonl", Jsonl(TheftChapter()));

  const auto result = BuildFromFile(input, PinnedConfig(project.root() / "dist"));

  EXPECT_EQ(project.root() / "dist" / "ohio_revised.sqlite", result.output_path);
  EXPECT_FALSE(result.resumed);
  EXPECT_EQ(2u, result.batches_committed);
  EXPECT_EQ(4u, result.stats.total_documents);
  EXPECT_EQ(3u, result.stats.documents_with_citations);
  EXPECT_EQ(5u, result.stats.total_citations);
  EXPECT_EQ(1u, result.stats.unresolved_citations);
  EXPECT_EQ(1u, result.stats.dangling_references);
  EXPECT_EQ(2u, result.stats.complex_chains);

  CorpusStore store(result.output_path);
  EXPECT_THAT(store.Keys(StoreName::kPrimary),
              ElementsAre("2913.01", "2913.02", "2913.03", "2913.04"));
  EXPECT_THAT(store.Keys(StoreName::kCitations),
              ElementsAre("2913.02", "2913.03", "2913.04"));
  EXPECT_THAT(store.Keys(StoreName::kReverseCitations),
              ElementsAre("2913.01", "2913.02", "2913.03", "2913.61"));
  EXPECT_THAT(store.Keys(StoreName::kChains),
              ElementsAre("2913.03", "2913.04"));
  EXPECT_THAT(store.Keys(StoreName::kMetadata), ElementsAre(kCorpusInfoKey));
}

TEST(BuildPipelineTest, ReverseIndexMirrorsForwardIndex) {
  test::TemporaryProject project;
  const auto input = project.AddFile("sections.jsonl", Jsonl(TheftChapter()));
  const auto result = BuildFromFile(input, PinnedConfig(project.root() / "dist"));

  CorpusStore store(result.output_path);
  std::set<std::pair<std::string, std::string>> forward_edges;
  for (const auto &entry : store.Dump(StoreName::kCitations)) {
    const auto record = YAML::Load(entry.second);
    for (const auto &target : Sequence(record["direct_references"])) {
      forward_edges.emplace(entry.first, target);
    }
    EXPECT_EQ(record["direct_references"].size(),
              record["reference_count"].as<std::size_t>());
  }
  std::set<std::pair<std::string, std::string>> reverse_edges;
  for (const auto &entry : store.Dump(StoreName::kReverseCitations)) {
    const auto record = YAML::Load(entry.second);
    for (const auto &source : Sequence(record["cited_by"])) {
      reverse_edges.emplace(source, entry.first);
    }
    EXPECT_EQ(record["cited_by"].size(),
              record["cited_by_count"].as<std::size_t>());
  }

  EXPECT_EQ(forward_edges, reverse_edges);
  EXPECT_EQ(4u, forward_edges.size());
}

TEST(BuildPipelineTest, UnresolvedCitationsStayOutOfTheGraph) {
  test::TemporaryProject project;
  const auto input = project.AddFile("sections.jsonl", Jsonl(TheftChapter()));
  const auto result = BuildFromFile(input, PinnedConfig(project.root() / "dist"));

  CorpusStore store(result.output_path);
  const auto forward = store.Get(StoreName::kCitations, "2913.03");
  ASSERT_TRUE(forward.has_value());
  EXPECT_THAT(*forward, HasSubstr(R"("direct_references":["2913.02"])"));
  EXPECT_THAT(*forward, HasSubstr(R"("relationship":"unknown")"));
  EXPECT_FALSE(store.Get(StoreName::kReverseCitations,
                         "chapter 2925 of the Revised Code")
                   .has_value());
}

TEST(BuildPipelineTest, KeepsSelfCitationsAcrossAllStores) {
  test::TemporaryProject project;
  const auto input = project.AddFile(
      "sections.jsonl",
      Jsonl({R"({"id": "2913.10", "header": "Section 2913.10|Loop.", "paragraphs": ["Penalties are set pursuant to section 2913.10 and section 2913.11."]})",
             R"({"id": "2913.11", "header": "Section 2913.11|Back.", "paragraphs": ["See section 2913.10."]})"}));
  auto config = PinnedConfig(project.root() / "dist");
  config.chain_limits.complex_size = 2;

  const auto result = BuildFromFile(input, config);

  EXPECT_EQ(3u, result.stats.total_citations);
  EXPECT_EQ(0u, result.stats.dangling_references);
  EXPECT_EQ(2u, result.stats.documents_cited);
  CorpusStore store(result.output_path);

  const auto forward = store.Get(StoreName::kCitations, "2913.10");
  ASSERT_TRUE(forward.has_value());
  const auto forward_record = YAML::Load(*forward);
  EXPECT_EQ((std::set<std::string>{"2913.10", "2913.11"}),
            Sequence(forward_record["direct_references"]));

  const auto reverse = store.Get(StoreName::kReverseCitations, "2913.10");
  ASSERT_TRUE(reverse.has_value());
  const auto reverse_record = YAML::Load(*reverse);
  EXPECT_EQ((std::set<std::string>{"2913.10", "2913.11"}),
            Sequence(reverse_record["cited_by"]));
  EXPECT_EQ(2u, reverse_record["cited_by_count"].as<std::size_t>());

  for (const auto *root : {"2913.10", "2913.11"}) {
    const auto chain = store.Get(StoreName::kChains, root);
    ASSERT_TRUE(chain.has_value()) << root;
    std::vector<std::string> sections;
    for (const auto &section : YAML::Load(*chain)["chain_sections"]) {
      sections.push_back(section.as<std::string>());
    }
    EXPECT_EQ(root, sections.front());
    EXPECT_EQ(1, std::count(sections.begin(), sections.end(), "2913.10"))
        << root;
    EXPECT_EQ(2u, sections.size()) << root;
  }
}

TEST(BuildPipelineTest, RebuildIsByteIdentical) {
  test::TemporaryProject project;
  const auto input = project.AddFile("sections.jsonl", Jsonl(TheftChapter()));

  const auto first = BuildFromFile(input, PinnedConfig(project.root() / "one"));
  const auto second = BuildFromFile(input, PinnedConfig(project.root() / "two"));

  EXPECT_EQ(DumpAll(first.output_path), DumpAll(second.output_path));
}

TEST(BuildPipelineTest, AddingDocumentOnlyTouchesItsTargets) {
  test::TemporaryProject project;
  auto lines = TheftChapter();
  const auto before_input = project.AddFile("before.jsonl", Jsonl(lines));
  lines.push_back(
      R"({"id": "2913.05", "header": "Section 2913.05|Telecommunications fraud.", "paragraphs": ["Terms have the meaning in section 2913.01."]})");
  const auto after_input = project.AddFile("after.jsonl", Jsonl(lines));

  auto before = DumpAll(
      BuildFromFile(before_input, PinnedConfig(project.root() / "before"))
          .output_path);
  auto after = DumpAll(
      BuildFromFile(after_input, PinnedConfig(project.root() / "after"))
          .output_path);

  EXPECT_EQ(1u, after[StoreName::kPrimary].erase("2913.05"));
  EXPECT_EQ(before[StoreName::kPrimary], after[StoreName::kPrimary]);
  EXPECT_EQ(1u, after[StoreName::kCitations].erase("2913.05"));
  EXPECT_EQ(before[StoreName::kCitations], after[StoreName::kCitations]);
  EXPECT_EQ(before[StoreName::kChains], after[StoreName::kChains]);

  EXPECT_NE(before[StoreName::kReverseCitations]["2913.01"],
            after[StoreName::kReverseCitations]["2913.01"]);
  EXPECT_THAT(after[StoreName::kReverseCitations]["2913.01"],
              HasSubstr(R"("cited_by":["2913.02","2913.05"])"));
  before[StoreName::kReverseCitations].erase("2913.01");
  after[StoreName::kReverseCitations].erase("2913.01");
  EXPECT_EQ(before[StoreName::kReverseCitations],
            after[StoreName::kReverseCitations]);
}

TEST(BuildPipelineTest, ResumedBuildMatchesUninterruptedBuild) {
  test::TemporaryProject project;
  const auto documents = DecodeAll(TheftChapter());
  const auto resumed_config = PinnedConfig(project.root() / "resumed");

  EXPECT_THROW(BuildFromMemory(documents, resumed_config, 3),
               std::runtime_error);
  EXPECT_TRUE(std::filesystem::exists(
      PartialCorpusStorePath(resumed_config.output_directory, "ohio_revised")));
  EXPECT_FALSE(std::filesystem::exists(
      CorpusStorePath(resumed_config.output_directory, "ohio_revised")));

  const auto resumed = BuildFromMemory(documents, resumed_config);
  const auto clean =
      BuildFromMemory(documents, PinnedConfig(project.root() / "clean"));

  EXPECT_TRUE(resumed.resumed);
  EXPECT_FALSE(clean.resumed);
  EXPECT_EQ(2u, resumed.batches_committed);
  EXPECT_EQ(DumpAll(clean.output_path), DumpAll(resumed.output_path));
  EXPECT_FALSE(std::filesystem::exists(
      PartialCorpusStorePath(resumed_config.output_directory, "ohio_revised")));

  SqliteDatabase database(resumed.output_path,
                          SqliteDatabase::Mode::kReadOnly);
  EXPECT_FALSE(database.TableExists("build_checkpoint"));
}

TEST(BuildPipelineTest, ResumeRejectsChangedInput) {
  test::TemporaryProject project;
  auto documents = DecodeAll(TheftChapter());
  const auto config = PinnedConfig(project.root() / "dist");
  EXPECT_THROW(BuildFromMemory(documents, config, 3), std::runtime_error);

  std::swap(documents[0], documents[1]);
  std::swap(documents[1], documents[2]);
  try {
    BuildFromMemory(documents, config);
    FAIL() << "Expected the changed input to be rejected";
  } catch (const std::runtime_error &ex) {
    EXPECT_THAT(ex.what(), HasSubstr("input changed"));
  }
}

TEST(BuildPipelineTest, CountsSkippedRecords) {
  test::TemporaryProject project;
  auto lines = TheftChapter();
  lines.insert(lines.begin() + 1, "{broken");
  const auto input = project.AddFile("sections.jsonl", Jsonl(lines));

  const auto result = BuildFromFile(input, PinnedConfig(project.root() / "dist"));

  EXPECT_EQ(1u, result.stats.skipped_records);
  EXPECT_EQ(4u, result.stats.total_documents);
  CorpusStore store(result.output_path);
  const auto info = store.Get(StoreName::kMetadata, kCorpusInfoKey);
  ASSERT_TRUE(info.has_value());
  EXPECT_THAT(*info, HasSubstr(R"("skipped_records":1)"));
  EXPECT_THAT(*info, HasSubstr(R"("build_timestamp":"2024-01-01T00:00:00Z")"));
}

TEST(BuildPipelineTest, LogsBuildProgress) {
  test::TemporaryProject project;
  const auto input = project.AddFile("sections.jsonl", Jsonl(TheftChapter()));
  std::ostringstream log;

  BuildPipelineBuilder()
      .WithCorpus("ohio_revised")
      .WithInputPath(input)
      .WithLogger(MakeLogger(LoggingConfig{LogLevel::kInfo}, log))
      .Build()
      .Run(PinnedConfig(project.root() / "dist"));

  EXPECT_THAT(log.str(), HasSubstr("message=\"build.start\""));
  EXPECT_THAT(log.str(), HasSubstr("message=\"build.batch.committed\""));
  EXPECT_THAT(log.str(), HasSubstr("message=\"build.complete\""));
}

TEST(BuildPipelineTest, RejectsZeroBatchSize) {
  test::TemporaryProject project;
  const auto input = project.AddFile("sections.jsonl", Jsonl(TheftChapter()));
  auto config = PinnedConfig(project.root() / "dist");
  config.batch_size = 0;

  EXPECT_THROW(BuildFromFile(input, config), std::invalid_argument);
}

TEST(BuildPipelineTest, MissingInputFails) {
  test::TemporaryProject project;
  EXPECT_THROW(BuildFromFile(project.root() / "missing.jsonl",
                             PinnedConfig(project.root() / "dist")),
               std::runtime_error);
}

TEST(BuildPipelineTest, UnknownCorpusFails) {
  EXPECT_THROW(BuildPipelineBuilder().WithCorpus("atlantis").Build(),
               std::invalid_argument);
}

TEST(ResolveBuildTimestampTest, PrefersExplicitValue) {
  EXPECT_EQ("2020-05-05T00:00:00Z",
            ResolveBuildTimestamp(std::string("2020-05-05T00:00:00Z")));
}

TEST(ResolveBuildTimestampTest, ReadsSourceDateEpoch) {
  setenv("SOURCE_DATE_EPOCH", "0", 1);
  EXPECT_EQ("1970-01-01T00:00:00Z", ResolveBuildTimestamp(std::nullopt));
  setenv("SOURCE_DATE_EPOCH", "86400", 1);
  EXPECT_EQ("1970-01-02T00:00:00Z", ResolveBuildTimestamp(std::nullopt));
  setenv("SOURCE_DATE_EPOCH", "yesterday", 1);
  EXPECT_THROW(ResolveBuildTimestamp(std::nullopt), std::invalid_argument);
  unsetenv("SOURCE_DATE_EPOCH");
}

} // namespace
} // namespace citegraph
