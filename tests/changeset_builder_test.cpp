#include <cochange/changeset_builder.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

namespace cochange {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

Commit MakeCommit(const std::string &oid, const std::string &email,
                  std::int64_t timestamp) {
  Commit commit;
  commit.oid = oid;
  commit.author_email = email;
  commit.committer_ts = timestamp;
  commit.authored_ts = timestamp;
  return commit;
}

TEST(ChangesetBuilderTest, ByCommitEmitsOneChangesetPerCommit) {
  ChangesetBuilder builder(ByCommit{}, 50);

  const auto finished =
      builder.Add(MakeCommit("c1", "ann@example.com", 100), {3, 1, 3});

  ASSERT_EQ(1u, finished.size());
  EXPECT_EQ("c1", finished[0].key);
  EXPECT_EQ("by_commit", finished[0].mode);
  EXPECT_THAT(finished[0].files, ElementsAre(1, 3));
  EXPECT_EQ(2u, finished[0].size);
  EXPECT_THAT(finished[0].commit_oids, ElementsAre("c1"));
  EXPECT_FALSE(finished[0].excluded_from_coupling);
  EXPECT_THAT(builder.Flush(), IsEmpty());
}

TEST(ChangesetBuilderTest, CommitWithoutFilesStillRecordsEmptyChangeset) {
  ChangesetBuilder builder(ByCommit{}, 50);

  const auto finished = builder.Add(MakeCommit("c1", "ann@example.com", 1), {});

  ASSERT_EQ(1u, finished.size());
  EXPECT_EQ(0u, finished[0].size);
  EXPECT_EQ(1u, builder.Counters().changesets);
}

TEST(ChangesetBuilderTest, OversizedChangesetsAreRecordedButExcluded) {
  ChangesetBuilder builder(ByCommit{}, 2);

  builder.Add(MakeCommit("small", "ann@example.com", 1), {1, 2});
  const auto large = builder.Add(MakeCommit("large", "ann@example.com", 2),
                                 {1, 2, 3});

  ASSERT_EQ(1u, large.size());
  EXPECT_TRUE(large[0].excluded_from_coupling);
  EXPECT_EQ(3u, large[0].size);
  const auto &counters = builder.Counters();
  EXPECT_EQ(2u, counters.changesets);
  EXPECT_EQ(1u, counters.excluded_changesets);
  EXPECT_EQ(5u, counters.touched_files);
  EXPECT_EQ(3u, counters.excluded_touched_files);
}

TEST(ChangesetBuilderTest, AuthorTimeGroupsMergeCommitsInsideWindow) {
  ChangesetBuilder builder(ByAuthorTime{1.0}, 50);

  EXPECT_THAT(builder.Add(MakeCommit("c1", "ann@example.com", 1000), {1}),
              IsEmpty());
  EXPECT_THAT(builder.Add(MakeCommit("c2", "bob@example.com", 1500), {2}),
              IsEmpty());
  EXPECT_THAT(builder.Add(MakeCommit("c3", "ann@example.com", 4600), {3}),
              IsEmpty());
  EXPECT_EQ(2u, builder.OpenGroups());

  const auto finished = builder.Flush();

  ASSERT_EQ(2u, finished.size());
  EXPECT_EQ("ann@example.com@1000", finished[0].key);
  EXPECT_EQ("by_author_time", finished[0].mode);
  EXPECT_THAT(finished[0].files, ElementsAre(1, 3));
  EXPECT_THAT(finished[0].commit_oids, ElementsAre("c1", "c3"));
  EXPECT_EQ(1000, finished[0].start_ts);
  EXPECT_EQ(4600, finished[0].end_ts);
  EXPECT_EQ("bob@example.com@1500", finished[1].key);
  EXPECT_THAT(finished[1].files, ElementsAre(2));
  EXPECT_EQ(0u, builder.OpenGroups());
}

TEST(ChangesetBuilderTest, ExpiredGroupsAreEmittedInStartOrder) {
  ChangesetBuilder builder(ByAuthorTime{1.0}, 50);

  builder.Add(MakeCommit("c1", "zed@example.com", 1000), {1});
  builder.Add(MakeCommit("c2", "amy@example.com", 1000), {2});
  builder.Add(MakeCommit("c3", "bob@example.com", 2000), {3});
  const auto expired =
      builder.Add(MakeCommit("c4", "zed@example.com", 5000), {4});

  ASSERT_EQ(2u, expired.size());
  EXPECT_EQ("amy@example.com@1000", expired[0].key);
  EXPECT_EQ("zed@example.com@1000", expired[1].key);

  const auto rest = builder.Flush();
  ASSERT_EQ(2u, rest.size());
  EXPECT_EQ("bob@example.com@2000", rest[0].key);
  EXPECT_EQ("zed@example.com@5000", rest[1].key);
  EXPECT_THAT(rest[1].commit_oids, ElementsAre("c4"));
}

TEST(ChangesetBuilderTest, RejectsNonPositiveMaximum) {
  EXPECT_THROW(ChangesetBuilder(ByCommit{}, 0), std::invalid_argument);
}

} // namespace
} // namespace cochange
