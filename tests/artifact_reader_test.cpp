#include <cochange/artifact_reader.h>
#include <cochange/artifact_store.h>
#include <cochange/errors.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "test_support/temporary_directory.h"

namespace cochange {
namespace {

using ::testing::HasSubstr;

Edge RankedEdge(FileId src, FileId dst, std::size_t rank, double jaccard) {
  Edge edge;
  edge.src_file_id = src;
  edge.dst_file_id = dst;
  edge.rank = rank;
  edge.pair_count = 4;
  edge.weighted_pair_count = 1.5;
  edge.jaccard = jaccard;
  edge.weighted_jaccard = jaccard;
  edge.p_dst_given_src = 0.5;
  edge.p_src_given_dst = 0.25;
  return edge;
}

Changeset MakeChangeset(const std::string &oid, std::vector<FileId> files) {
  Changeset changeset;
  changeset.key = oid;
  changeset.mode = "by_commit";
  changeset.size = files.size();
  changeset.files = std::move(files);
  changeset.commit_oids = {oid};
  changeset.start_ts = 10;
  changeset.end_ts = 10;
  return changeset;
}

Commit MakeCommit(const std::string &oid, const std::string &subject) {
  Commit commit;
  commit.oid = oid;
  commit.author = "ann";
  commit.author_email = "ann@example.com";
  commit.committer_ts = 10;
  commit.subject = subject;
  return commit;
}

FileIdentity Identity(FileId file_id, std::vector<LineageInterval> lineage) {
  FileIdentity identity;
  identity.file_id = file_id;
  identity.lineage = std::move(lineage);
  return identity;
}

FileStats Stats(FileId file_id, const std::string &path, bool alive) {
  FileStats stats;
  stats.file_id = file_id;
  stats.current_path = path;
  stats.alive = alive;
  return stats;
}

class ArtifactReaderTest : public ::testing::Test {
protected:
  void Publish() {
    ArtifactStore store(directory_.root());
    store.Begin();
    store.AppendCommit(MakeCommit("c1", "first"));
    store.AppendCommit(MakeCommit("c2", "second"));
    store.AppendCommit(MakeCommit("c3", "third"));
    store.AppendChangeset(MakeChangeset("c1", {1, 2, 3}));
    store.AppendChangeset(MakeChangeset("c2", {1, 3}));
    store.AppendChangeset(MakeChangeset("c3", {1, 2}));
    store.WriteFileStats({Stats(1, "new.py", true), Stats(2, "b.py", true),
                          Stats(3, "gone.py", false)});
    store.WriteLineage(
        {Identity(1, {{"old.py", "c1", std::string("c2")}, {"new.py", "c2", {}}}),
         Identity(2, {{"b.py", "c1", {}}}),
         Identity(3, {{"gone.py", "c1", std::string("c3")}})});
    store.WritePathIndex({{"b.py", 2, true},
                          {"gone.py", 3, false},
                          {"new.py", 1, true},
                          {"old.py", 1, false}});
    store.WriteEdges({RankedEdge(1, 2, 1, 0.75), RankedEdge(1, 3, 2, 0.5),
                      RankedEdge(2, 1, 1, 0.75)});
    ValidationSummary summary;
    summary.total_tokens = 100;
    summary.invalid_tokens = 5;
    summary.total_issues = 5;
    summary.issue_counts[IssueReason::kBorderlinePath] = 5;
    store.WriteValidationSummary(summary);

    RunMetadata metadata;
    metadata.repository = "/srv/repo";
    metadata.ref = "main";
    metadata.config_fingerprint = "feedface";
    metadata.first_commit = "c1";
    metadata.last_commit = "c3";
    metadata.commit_count = 3;
    store.Publish(metadata);
  }

  test::TemporaryDirectory directory_;
};

TEST_F(ArtifactReaderTest, ResolvesOldAndCurrentPathsToOneFile) {
  Publish();
  const auto reader = ArtifactReader::Open(directory_.root());

  const auto old_path = reader.LookupPath("old.py");
  ASSERT_TRUE(old_path.has_value());
  EXPECT_EQ(1u, old_path->file_id);
  EXPECT_EQ("new.py", old_path->current_path);
  ASSERT_EQ(2u, old_path->lineage.size());
  EXPECT_EQ("c2", old_path->lineage[0].valid_to_commit.value());
  EXPECT_TRUE(old_path->lineage[1].IsOpen());

  const auto gone = reader.LookupPath("gone.py");
  ASSERT_TRUE(gone.has_value());
  EXPECT_FALSE(gone->alive);
  EXPECT_FALSE(reader.LookupPath("missing.py").has_value());
  EXPECT_FALSE(reader.LookupFile(42).has_value());
}

TEST_F(ArtifactReaderTest, NeighboursComeBackInRankOrder) {
  Publish();
  const auto reader = ArtifactReader::Open(directory_.root());

  const auto all = reader.Neighbors(1, 10);
  ASSERT_EQ(2u, all.size());
  EXPECT_EQ(2u, all[0].dst_file_id);
  EXPECT_EQ(3u, all[1].dst_file_id);
  EXPECT_DOUBLE_EQ(0.75, all[0].jaccard);
  EXPECT_DOUBLE_EQ(0.25, all[0].p_src_given_dst);
  EXPECT_EQ(1u, reader.Neighbors(1, 1).size());
  EXPECT_TRUE(reader.Neighbors(3, 10).empty());
}

TEST_F(ArtifactReaderTest, EvidenceJoinsChangesetsWithCommits) {
  Publish();
  const auto reader = ArtifactReader::Open(directory_.root());

  const auto evidence = reader.Evidence(1, 2, 10);

  ASSERT_EQ(2u, evidence.size());
  EXPECT_EQ("c1", evidence[0].key);
  EXPECT_EQ(3u, evidence[0].size);
  ASSERT_EQ(1u, evidence[0].commits.size());
  EXPECT_EQ("first", evidence[0].commits[0].subject);
  EXPECT_EQ("c3", evidence[1].key);
  EXPECT_EQ("third", evidence[1].commits[0].subject);

  ASSERT_EQ(1u, reader.Evidence(2, 1, 1).size());
  EXPECT_TRUE(reader.Evidence(2, 42, 10).empty());
}

TEST_F(ArtifactReaderTest, SummaryCarriesRunAndQualityFigures) {
  Publish();
  const auto reader = ArtifactReader::Open(directory_.root());

  const auto &summary = reader.Summary();
  EXPECT_EQ("feedface", summary.config_fingerprint);
  EXPECT_EQ("/srv/repo", summary.repository);
  EXPECT_EQ("main", summary.ref);
  EXPECT_EQ("c3", summary.last_commit);
  EXPECT_EQ(3u, summary.commit_count);
  EXPECT_DOUBLE_EQ(0.95, summary.quality_score);
  EXPECT_EQ(5u, summary.issue_counts.at("borderline_path"));
  EXPECT_EQ(3u, summary.table_rows.at("changesets"));
  EXPECT_EQ(7u, summary.table_rows.at("changeset_files"));
}

TEST_F(ArtifactReaderTest, DirectoryWithoutManifestIsIncomplete) {
  try {
    ArtifactReader::Open(directory_.root());
    FAIL() << "expected IncompleteDataset";
  } catch (const IncompleteDataset &error) {
    EXPECT_THAT(error.what(), HasSubstr("No manifest"));
  }
}

TEST_F(ArtifactReaderTest, FailedRunIsReportedAsPartial) {
  directory_.AddFile(kRunFailedFile, "status: failed\n");

  try {
    ArtifactReader::Open(directory_.root());
    FAIL() << "expected IncompleteDataset";
  } catch (const IncompleteDataset &error) {
    EXPECT_THAT(error.what(), HasSubstr("partial"));
  }
}

TEST_F(ArtifactReaderTest, ManifestNamingAMissingTableIsIncomplete) {
  Publish();
  std::filesystem::remove(directory_.root() / "edges.tsv");

  EXPECT_THROW(ArtifactReader::Open(directory_.root()), IncompleteDataset);
}

TEST_F(ArtifactReaderTest, UnsupportedFormatVersionIsRejected) {
  directory_.AddFile(kManifestFile,
                     "format_version: 99\nstatus: complete\ntables: []\n");

  EXPECT_THROW(ArtifactReader::Open(directory_.root()), IncompleteDataset);
}

TEST_F(ArtifactReaderTest, UnparsableManifestIsIncomplete) {
  directory_.AddFile(kManifestFile, "status: [complete\n");

  EXPECT_THROW(ArtifactReader::Open(directory_.root()), IncompleteDataset);
}

} // namespace
} // namespace cochange
