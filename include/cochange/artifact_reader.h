#pragma once

#include <cochange/models.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cochange {

struct FileLookup {
  FileId file_id = 0;
  std::string current_path;
  bool alive = false;
  std::vector<LineageInterval> lineage;
};

struct EvidenceCommit {
  std::string oid;
  std::string author;
  std::int64_t committer_ts = 0;
  std::string subject;
};

struct EvidenceChangeset {
  std::string key;
  std::size_t size = 0;
  std::int64_t start_ts = 0;
  std::int64_t end_ts = 0;
  bool excluded_from_coupling = false;
  std::vector<EvidenceCommit> commits;
};

struct DatasetSummary {
  std::string config_fingerprint;
  std::string repository;
  std::string ref;
  std::string last_commit;
  std::size_t commit_count = 0;
  double quality_score = 1.0;
  std::size_t total_tokens = 0;
  std::size_t invalid_tokens = 0;
  std::size_t identity_inconsistencies = 0;
  std::size_t total_issues = 0;
  std::map<std::string, std::size_t> issue_counts;
  std::map<std::string, std::size_t> table_rows;
};

// Read-only view over a published artifact directory. Opening a directory
// without a manifest fails with IncompleteDataset.
class ArtifactReader {
public:
  static ArtifactReader Open(const std::filesystem::path &directory);

  std::optional<FileLookup> LookupPath(const std::string &path) const;
  std::optional<FileLookup> LookupFile(FileId file_id) const;
  std::vector<Edge> Neighbors(FileId file_id, std::size_t k) const;
  std::vector<EvidenceChangeset> Evidence(FileId a, FileId b,
                                          std::size_t limit) const;
  const DatasetSummary &Summary() const { return summary_; }

private:
  explicit ArtifactReader(std::filesystem::path directory);

  void LoadManifest();
  void LoadValidationSummary();
  void LoadFiles();
  void LoadEdges();
  std::filesystem::path TablePath(const std::string &name) const;

  std::filesystem::path directory_;
  std::map<std::string, std::string> table_files_;
  DatasetSummary summary_;
  std::unordered_map<FileId, FileLookup> files_;
  std::unordered_map<std::string, FileId> path_index_;
  std::unordered_map<FileId, std::vector<Edge>> edges_;
};

} // namespace cochange
