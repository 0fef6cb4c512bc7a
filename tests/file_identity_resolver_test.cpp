#include <cochange/file_identity_resolver.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "test_support/recording_logger.h"

namespace cochange {
namespace {

using ::testing::ElementsAre;
using ::testing::Pair;
using test::RecordingLogger;

class FileIdentityResolverTest : public ::testing::Test {
protected:
  void Commit(const std::string &oid) { resolver_.BeginCommit(oid); }

  std::shared_ptr<RecordingLogger> logger_ =
      std::make_shared<RecordingLogger>();
  FileIdentityResolver resolver_{logger_};
};

TEST_F(FileIdentityResolverTest, RenameKeepsTheFileId) {
  Commit("c1");
  const auto added = resolver_.Resolve("a.py", "c1");
  Commit("c2");
  const auto renamed = resolver_.RecordRename("a.py", "b.py", "c2");
  Commit("c3");
  const auto modified = resolver_.Resolve("b.py", "c3");

  EXPECT_EQ(added, renamed);
  EXPECT_EQ(added, modified);
  const auto &lineage = resolver_.Identity(added).lineage;
  ASSERT_EQ(2u, lineage.size());
  EXPECT_EQ("a.py", lineage[0].path);
  EXPECT_EQ("c1", lineage[0].valid_from_commit);
  EXPECT_EQ("c2", lineage[0].valid_to_commit.value());
  EXPECT_EQ("b.py", lineage[1].path);
  EXPECT_TRUE(lineage[1].IsOpen());
  EXPECT_EQ("b.py", resolver_.Identity(added).LatestPath());
  EXPECT_TRUE(resolver_.VerifyNoOverlap());
}

TEST_F(FileIdentityResolverTest, RenameBackToAnOldPathStaysOneFile) {
  Commit("c1");
  const auto id = resolver_.Resolve("a.py", "c1");
  Commit("c2");
  resolver_.RecordRename("a.py", "b.py", "c2");
  Commit("c3");

  EXPECT_EQ(id, resolver_.RecordRename("b.py", "a.py", "c3"));
  EXPECT_EQ(3u, resolver_.Identity(id).lineage.size());
  EXPECT_THAT(resolver_.CurrentPaths(), ElementsAre(Pair("a.py", id)));
  EXPECT_EQ(1u, resolver_.Identities().size());
}

TEST_F(FileIdentityResolverTest, RenameChainKeepsTheFileId) {
  Commit("c1");
  const auto id = resolver_.Resolve("a.py", "c1");
  Commit("c2");
  EXPECT_EQ(id, resolver_.RecordRename("a.py", "b.py", "c2"));
  Commit("c3");
  EXPECT_EQ(id, resolver_.RecordRename("b.py", "c.py", "c3"));

  const auto &lineage = resolver_.Identity(id).lineage;
  ASSERT_EQ(3u, lineage.size());
  EXPECT_EQ("a.py", lineage[0].path);
  EXPECT_EQ("b.py", lineage[1].path);
  EXPECT_EQ("c3", lineage[1].valid_to_commit.value());
  EXPECT_EQ("c.py", lineage[2].path);
  EXPECT_TRUE(lineage[2].IsOpen());
  EXPECT_THAT(resolver_.CurrentPaths(), ElementsAre(Pair("c.py", id)));
  EXPECT_EQ(id, resolver_.FindByPath("a.py").value());
  EXPECT_EQ(1u, resolver_.Identities().size());
  EXPECT_TRUE(resolver_.VerifyNoOverlap());
}

TEST_F(FileIdentityResolverTest, RepeatedRenameOfOnePathKeepsOneIdentity) {
  Commit("c1");
  const auto id = resolver_.Resolve("a.py", "c1");
  Commit("c2");
  resolver_.RecordRename("a.py", "b.py", "c2");
  Commit("c3");

  EXPECT_EQ(id, resolver_.RecordRename("a.py", "b.py", "c3"));
  EXPECT_EQ(2u, resolver_.Identity(id).lineage.size());
  EXPECT_EQ(1u, resolver_.Identities().size());
  EXPECT_TRUE(resolver_.VerifyNoOverlap());

  Commit("c4");
  EXPECT_EQ(id, resolver_.RecordRename("a.py", "c.py", "c4"));

  const auto &lineage = resolver_.Identity(id).lineage;
  ASSERT_EQ(3u, lineage.size());
  EXPECT_EQ("b.py", lineage[1].path);
  EXPECT_EQ("c4", lineage[1].valid_to_commit.value());
  EXPECT_EQ("c.py", lineage[2].path);
  EXPECT_THAT(resolver_.CurrentPaths(), ElementsAre(Pair("c.py", id)));
  EXPECT_EQ(1u, resolver_.Identities().size());
  EXPECT_TRUE(resolver_.VerifyNoOverlap());
  EXPECT_EQ(0u, resolver_.InconsistencyCount());
}

TEST_F(FileIdentityResolverTest, ReAddingADeletedPathRevivesItsOwner) {
  Commit("c1");
  const auto id = resolver_.Resolve("a.py", "c1");
  Commit("c2");
  EXPECT_EQ(id, resolver_.RecordDeletion("a.py", "c2"));
  EXPECT_EQ(nullptr, resolver_.Identity(id).OpenInterval());
  Commit("c3");

  EXPECT_EQ(id, resolver_.Resolve("a.py", "c3"));
  const auto &lineage = resolver_.Identity(id).lineage;
  ASSERT_EQ(2u, lineage.size());
  EXPECT_EQ("c3", lineage[1].valid_from_commit);
  EXPECT_TRUE(resolver_.VerifyNoOverlap());
}

TEST_F(FileIdentityResolverTest, ReusedPathGetsNewIdWhenOldOwnerMovedOn) {
  Commit("c1");
  const auto original = resolver_.Resolve("a.py", "c1");
  Commit("c2");
  resolver_.RecordRename("a.py", "b.py", "c2");
  Commit("c3");

  const auto fresh = resolver_.Resolve("a.py", "c3");

  EXPECT_NE(original, fresh);
  EXPECT_THAT(resolver_.CurrentPaths(),
              ElementsAre(Pair("a.py", fresh), Pair("b.py", original)));
  EXPECT_TRUE(resolver_.VerifyNoOverlap());
}

TEST_F(FileIdentityResolverTest, RenameOfUnseenPathRecordsBothPaths) {
  Commit("c1");
  const auto id = resolver_.RecordRename("old.py", "new.py", "c1");

  const auto &lineage = resolver_.Identity(id).lineage;
  ASSERT_EQ(2u, lineage.size());
  EXPECT_EQ("old.py", lineage[0].path);
  EXPECT_EQ("c1", lineage[0].valid_to_commit.value());
  EXPECT_EQ(id, resolver_.FindByPath("old.py").value());
  EXPECT_EQ(0u, resolver_.InconsistencyCount());
}

TEST_F(FileIdentityResolverTest, RenameOntoOwnedPathIsReported) {
  Commit("c1");
  const auto a = resolver_.Resolve("a.py", "c1");
  const auto b = resolver_.Resolve("b.py", "c1");
  Commit("c2");

  EXPECT_EQ(b, resolver_.RecordRename("a.py", "b.py", "c2"));

  EXPECT_EQ(1u, resolver_.InconsistencyCount());
  EXPECT_THAT(logger_->Messages(LogLevel::kWarn),
              ElementsAre("identity.inconsistency"));
  EXPECT_EQ(nullptr, resolver_.Identity(a).OpenInterval());
  EXPECT_TRUE(resolver_.VerifyNoOverlap());
}

TEST_F(FileIdentityResolverTest, CopyCreatesAnIndependentFile) {
  Commit("c1");
  const auto source = resolver_.Resolve("a.py", "c1");
  Commit("c2");

  ChangeEntry copy;
  copy.commit_oid = "c2";
  copy.status = ChangeStatus::kCopied;
  copy.old_path = "a.py";
  copy.new_path = "copy.py";
  const auto copied = resolver_.Apply(copy);

  EXPECT_NE(source, copied);
  EXPECT_NE(nullptr, resolver_.Identity(source).OpenInterval());
  EXPECT_EQ("copy.py", resolver_.Identity(copied).LatestPath());
}

TEST_F(FileIdentityResolverTest, DeletionOfUnseenPathGetsClosedIdentity) {
  Commit("c1");
  const auto id = resolver_.RecordDeletion("ghost.py", "c1");

  EXPECT_EQ(nullptr, resolver_.Identity(id).OpenInterval());
  EXPECT_TRUE(resolver_.CurrentPaths().empty());
  EXPECT_EQ(id, resolver_.FindByPath("ghost.py").value());
}

TEST_F(FileIdentityResolverTest, UpdatesMustNameTheOpenCommit) {
  EXPECT_THROW(resolver_.Resolve("a.py", "c1"), std::logic_error);
  Commit("c1");
  EXPECT_THROW(resolver_.Resolve("a.py", "c2"), std::logic_error);
  EXPECT_THROW(resolver_.BeginCommit("c1"), std::logic_error);
  EXPECT_THROW(resolver_.BeginCommit(""), std::logic_error);
  EXPECT_THROW(resolver_.Identity(99), std::out_of_range);
}

TEST_F(FileIdentityResolverTest, PathIndexListsEveryPathWithItsOwner) {
  Commit("c1");
  const auto a = resolver_.Resolve("a.py", "c1");
  const auto gone = resolver_.Resolve("gone.py", "c1");
  Commit("c2");
  resolver_.RecordRename("a.py", "b.py", "c2");
  resolver_.RecordDeletion("gone.py", "c2");

  const auto index = resolver_.PathIndex();

  ASSERT_EQ(3u, index.size());
  EXPECT_EQ("a.py", index[0].path);
  EXPECT_EQ(a, index[0].file_id);
  EXPECT_FALSE(index[0].current);
  EXPECT_EQ("b.py", index[1].path);
  EXPECT_TRUE(index[1].current);
  EXPECT_EQ("gone.py", index[2].path);
  EXPECT_EQ(gone, index[2].file_id);
  EXPECT_FALSE(index[2].current);
}

} // namespace
} // namespace cochange
