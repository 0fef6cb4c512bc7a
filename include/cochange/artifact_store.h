#pragma once

#include <cochange/coupling_computer.h>
#include <cochange/file_identity_resolver.h>
#include <cochange/logging.h>
#include <cochange/models.h>
#include <cochange/table_io.h>
#include <cochange/validation_collector.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cochange {

inline constexpr int kArtifactFormatVersion = 1;
inline constexpr char kManifestFile[] = "MANIFEST.yaml";
inline constexpr char kRunFailedFile[] = "RUN_FAILED.yaml";
inline constexpr char kValidationSummaryFile[] = "validation_summary.yaml";

struct RunMetadata {
  std::string repository;
  std::string ref;
  std::string config_fingerprint;
  std::string first_commit;
  std::string last_commit;
  std::size_t commit_count = 0;
};

struct TableSummary {
  std::string name;
  std::string file;
  std::size_t rows = 0;
  std::string checksum;
};

// Writes one run's tables into a staging area and makes them visible only
// through the manifest, which is written last. A directory without a
// manifest never holds a usable result.
class ArtifactStore {
public:
  explicit ArtifactStore(std::filesystem::path directory,
                         std::shared_ptr<Logger> logger = nullptr);
  ~ArtifactStore();

  ArtifactStore(const ArtifactStore &) = delete;
  ArtifactStore &operator=(const ArtifactStore &) = delete;

  void Begin();

  void AppendCommit(const Commit &commit);
  void AppendChange(const ChangeEntry &change);
  void AppendChangeset(const Changeset &changeset);

  void WriteFileStats(const std::vector<FileStats> &stats);
  void WriteLineage(const std::vector<FileIdentity> &identities);
  void WritePathIndex(const std::vector<PathOwner> &owners);
  void WritePairStats(const CouplingComputer &coupling,
                      std::uint64_t min_cooccurrence);
  void WriteEdges(const std::vector<Edge> &edges);
  void WriteFolderEdges(const std::vector<FolderEdge> &edges);
  void WriteValidationSummary(const ValidationSummary &summary);

  void Publish(const RunMetadata &metadata);
  void Abort();
  void FlushPartial(const std::string &error, const RunMetadata &metadata);

  const std::filesystem::path &Directory() const { return directory_; }
  bool Staging() const { return staging_; }

private:
  TableWriter &Table(const std::string &name);
  std::vector<TableSummary> CommitTables();
  void WriteYaml(const std::filesystem::path &target,
                 const std::string &content);
  void RemoveStaged();

  std::filesystem::path directory_;
  std::shared_ptr<Logger> logger_;
  std::map<std::string, std::unique_ptr<TableWriter>> tables_;
  std::string validation_summary_;
  bool staging_ = false;
};

const std::vector<std::pair<std::string, std::vector<std::string>>> &
ArtifactTables();

} // namespace cochange
