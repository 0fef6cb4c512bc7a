#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cochange {

using FileId = std::uint64_t;

struct Commit {
  std::string oid;
  std::string author;
  std::string author_email;
  std::int64_t authored_ts = 0;
  std::int64_t committer_ts = 0;
  std::string subject;
  int parent_count = 0;
  std::size_t sequence = 0;

  bool IsMerge() const { return parent_count > 1; }
};

enum class ChangeStatus {
  kAdded,
  kModified,
  kDeleted,
  kRenamed,
  kCopied,
  kTypeChanged
};

struct ChangeEntry {
  std::string commit_oid;
  ChangeStatus status = ChangeStatus::kModified;
  std::string new_path;
  std::optional<std::string> old_path;
  int similarity = 0;
  FileId file_id = 0;
  bool borderline = false;
  bool in_scope = true;
  std::int64_t lines_added = 0;
  std::int64_t lines_deleted = 0;
};

struct LineageInterval {
  std::string path;
  std::string valid_from_commit;
  std::optional<std::string> valid_to_commit;

  bool IsOpen() const { return !valid_to_commit.has_value(); }
};

struct FileIdentity {
  FileId file_id = 0;
  std::vector<LineageInterval> lineage;

  const LineageInterval *OpenInterval() const;
  const std::string &LatestPath() const { return lineage.back().path; }
};

struct Changeset {
  std::string key;
  std::string mode;
  std::vector<FileId> files;
  std::size_t size = 0;
  std::vector<std::string> commit_oids;
  std::int64_t start_ts = 0;
  std::int64_t end_ts = 0;
  bool excluded_from_coupling = false;
};

struct CouplingStat {
  std::uint64_t pair_count = 0;
  double weighted_pair_count = 0.0;
  std::uint64_t a_total = 0;
  std::uint64_t b_total = 0;
  double a_weighted_total = 0.0;
  double b_weighted_total = 0.0;

  double Jaccard() const;
  double WeightedJaccard() const;
  // p(b | a)
  double ProbabilityBGivenA() const;
  // p(a | b)
  double ProbabilityAGivenB() const;
};

struct Edge {
  FileId src_file_id = 0;
  FileId dst_file_id = 0;
  std::uint64_t pair_count = 0;
  double weighted_pair_count = 0.0;
  double jaccard = 0.0;
  double weighted_jaccard = 0.0;
  double p_dst_given_src = 0.0;
  double p_src_given_dst = 0.0;
  std::size_t rank = 0;
};

struct FolderEdge {
  std::string src_folder;
  std::string dst_folder;
  int depth = 0;
  std::uint64_t pair_count = 0;
  double weighted_pair_count = 0.0;
  double mean_jaccard = 0.0;
  std::size_t file_pair_count = 0;
};

enum class IssueReason {
  kInvalidCommitHeader,
  kTruncatedHeader,
  kInvalidStatus,
  kUnsupportedStatus,
  kMissingPath,
  kStatusAsPath,
  kInvalidPath,
  kBorderlinePath,
  kIncompleteChange,
  kOrphanTokens
};

struct ValidationIssue {
  std::string commit_oid;
  std::string raw_token;
  std::size_t cursor_position = 0;
  std::vector<std::string> surrounding_context;
  IssueReason reason = IssueReason::kInvalidStatus;
};

struct FileStats {
  FileId file_id = 0;
  std::string current_path;
  bool alive = true;
  std::uint64_t commit_count = 0;
  std::uint64_t changeset_total = 0;
  double weighted_total = 0.0;
  std::size_t author_count = 0;
  std::int64_t first_ts = 0;
  std::int64_t last_ts = 0;
  std::int64_t lines_added = 0;
  std::int64_t lines_deleted = 0;
  std::optional<std::uint64_t> head_size;

  std::int64_t EstimatedLoc() const { return lines_added - lines_deleted; }
};

struct MiningResult {
  std::size_t commit_count = 0;
  std::size_t change_count = 0;
  std::size_t changeset_count = 0;
  std::size_t excluded_changesets = 0;
  std::size_t file_count = 0;
  std::size_t pair_count = 0;
  std::size_t edge_count = 0;
  std::size_t folder_edge_count = 0;
  double quality_score = 1.0;
  std::string output_directory;
};

std::string ToString(ChangeStatus status);
std::optional<ChangeStatus> ParseChangeStatus(const std::string &text);
std::string ToString(IssueReason reason);
std::optional<IssueReason> ParseIssueReason(const std::string &text);

} // namespace cochange
