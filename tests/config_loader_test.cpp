#include <cochange/config_loader.h>
#include <cochange/mining_config.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

#include "test_support/temporary_directory.h"

namespace cochange {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(ConfigLoaderTest, LoadsYamlFileOverDefaults) {
  test::TemporaryDirectory directory;
  const auto path = directory.AddFile("cochange.yml",
                                      "repository: /srv/repo\n"
                                      "output: /srv/out\n"
                                      "max_changeset_size: 20\n"
                                      "changeset_mode: by_author_time\n"
                                      "author_time_hours: 6\n"
                                      "primary_metric: jaccard\n"
                                      "validation_mode: strict\n"
                                      "ignore_patterns:\n"
                                      "  - \"*.lock\"\n"
                                      "  - vendor/*\n");

  const auto config = LoadMiningConfig(path);

  EXPECT_EQ("/srv/repo", config.repository.generic_string());
  EXPECT_EQ("/srv/out", config.output.generic_string());
  EXPECT_EQ(20, config.max_changeset_size);
  ASSERT_TRUE(std::holds_alternative<ByAuthorTime>(config.changeset_mode));
  EXPECT_DOUBLE_EQ(6.0, std::get<ByAuthorTime>(config.changeset_mode).window_hours);
  EXPECT_EQ(CouplingMetric::kJaccard, config.primary_metric);
  EXPECT_EQ(ValidationMode::kStrict, config.validation_mode);
  EXPECT_THAT(config.ignore_patterns, ElementsAre("*.lock", "vendor/*"));
  EXPECT_EQ(3, config.min_cooccurrence);
  EXPECT_EQ(50, config.topk_edges);
}

TEST(ConfigLoaderTest, NormalizesKeyAliases) {
  const auto overrides = ParseConfigText("Max-Changeset: 10\n"
                                         "window_hours: 12\n"
                                         "topk_edges_per_file: 5\n"
                                         "component_depth: 3\n"
                                         "ignore: \"*.md, docs/*\"\n");

  EXPECT_EQ(std::optional<int>(10), overrides.max_changeset_size);
  EXPECT_EQ(std::optional<double>(12.0), overrides.author_time_hours);
  EXPECT_EQ(std::optional<int>(5), overrides.topk_edges);
  EXPECT_EQ(std::optional<int>(3), overrides.folder_depth);
  ASSERT_TRUE(overrides.ignore_patterns);
  EXPECT_THAT(*overrides.ignore_patterns, ElementsAre("*.md", "docs/*"));
}

TEST(ConfigLoaderTest, RejectsUnknownKeysListingSupportedOnes) {
  try {
    ParseConfigText("max_changesets: 10\n");
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("Unknown config key: max_changesets"));
    EXPECT_THAT(error.what(), HasSubstr("max_changeset_size"));
  }
}

TEST(ConfigLoaderTest, RejectsDuplicateKeysAfterNormalization) {
  EXPECT_THROW(ParseConfigText("topk_edges: 3\ntopk-edges: 4\n"),
               std::invalid_argument);
}

TEST(ConfigLoaderTest, RejectsMalformedValues) {
  EXPECT_THROW(ParseConfigText("min_cooccurrence: three\n"),
               std::invalid_argument);
  EXPECT_THROW(ParseConfigText("topk_edges: 5x\n"), std::invalid_argument);
  EXPECT_THROW(ParseConfigText("all_refs: maybe\n"), std::invalid_argument);
  EXPECT_THROW(ParseConfigText("changeset_mode: by_ticket\n"),
               std::invalid_argument);
  EXPECT_THROW(ParseConfigText("- a\n- b\n"), std::invalid_argument);
}

TEST(ConfigLoaderTest, AuthorWindowOnlyAppliesToAuthorTimeMode) {
  MiningConfig base;
  MiningConfigOverrides overrides;
  overrides.author_time_hours = 2.0;

  const auto by_commit = MergeConfig(base, overrides);
  EXPECT_TRUE(std::holds_alternative<ByCommit>(by_commit.changeset_mode));

  overrides.changeset_mode = "by-author-time";
  const auto by_author = MergeConfig(base, overrides);
  ASSERT_TRUE(std::holds_alternative<ByAuthorTime>(by_author.changeset_mode));
  EXPECT_DOUBLE_EQ(2.0,
                   std::get<ByAuthorTime>(by_author.changeset_mode).window_hours);
}

TEST(ConfigLoaderTest, MergeLeavesUnsetFieldsAlone) {
  MiningConfig base;
  base.topk_edges = 7;
  base.ignore_patterns = {"*.png"};
  MiningConfigOverrides overrides;
  overrides.min_cooccurrence = 1;

  const auto merged = MergeConfig(base, overrides);

  EXPECT_EQ(7, merged.topk_edges);
  EXPECT_EQ(1, merged.min_cooccurrence);
  EXPECT_THAT(merged.ignore_patterns, ElementsAre("*.png"));
}

TEST(ConfigLoaderTest, RejectsMissingAndUnsupportedFiles) {
  test::TemporaryDirectory directory;
  EXPECT_THROW(ParseConfigFile(directory.root() / "missing.yml"),
               std::runtime_error);
  const auto json = directory.AddFile("config.json", "{}");
  EXPECT_THROW(ParseConfigFile(json), std::invalid_argument);
}

TEST(MiningConfigTest, ValidationEnforcesRanges) {
  MiningConfig config;
  config.repository = "/srv/repo";
  config.output = "/srv/out";
  EXPECT_NO_THROW(ValidateMiningConfig(config));

  auto invalid = config;
  invalid.max_changeset_size = 0;
  EXPECT_THROW(ValidateMiningConfig(invalid), std::invalid_argument);

  invalid = config;
  invalid.find_renames_threshold = 101;
  EXPECT_THROW(ValidateMiningConfig(invalid), std::invalid_argument);

  invalid = config;
  invalid.changeset_mode = ByAuthorTime{0.0};
  EXPECT_THROW(ValidateMiningConfig(invalid), std::invalid_argument);

  invalid = config;
  invalid.output.clear();
  EXPECT_THROW(ValidateMiningConfig(invalid), std::invalid_argument);
}

TEST(MiningConfigTest, FingerprintTracksSemanticFieldsOnly) {
  MiningConfig config;
  config.repository = "/srv/repo";
  config.output = "/srv/out";
  const auto fingerprint = ConfigFingerprint(config);

  auto relocated = config;
  relocated.output = "/elsewhere";
  relocated.worker_threads = 8;
  relocated.log_level = LogLevel::kDebug;
  EXPECT_EQ(fingerprint, ConfigFingerprint(relocated));

  auto changed = config;
  changed.topk_edges = 10;
  EXPECT_NE(fingerprint, ConfigFingerprint(changed));

  auto reordered = config;
  reordered.ignore_patterns = {"b", "a"};
  auto sorted = config;
  sorted.ignore_patterns = {"a", "b"};
  EXPECT_EQ(ConfigFingerprint(sorted), ConfigFingerprint(reordered));
}

TEST(MiningConfigTest, ParsesEnumsLeniently) {
  EXPECT_EQ(CouplingMetric::kWeightedJaccard,
            ParseCouplingMetric("Weighted-Jaccard"));
  EXPECT_EQ(CouplingMetric::kConditionalProbability,
            ParseCouplingMetric("p_dst_given_src"));
  EXPECT_EQ(ValidationMode::kPermissive, ParseValidationMode(" PERMISSIVE "));
  EXPECT_EQ("by_author_time", ChangesetModeName(ByAuthorTime{}));
  EXPECT_EQ("by_commit", ChangesetModeName(ByCommit{}));
}

} // namespace
} // namespace cochange
