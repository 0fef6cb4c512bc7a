#include <cochange/artifact_store.h>

#include <cochange/errors.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace cochange {
namespace {

const std::string kPartialSuffix = ".partial";

std::string Timestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm;
  gmtime_r(&time, &tm);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buffer;
}

std::string Flag(bool value) { return value ? "1" : "0"; }

std::string TableFile(const std::string &name) { return name + ".tsv"; }

void EmitTables(YAML::Emitter &out, const std::vector<TableSummary> &tables) {
  out << YAML::Key << "tables" << YAML::Value << YAML::BeginSeq;
  for (const auto &table : tables) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << table.name;
    out << YAML::Key << "file" << YAML::Value << table.file;
    out << YAML::Key << "rows" << YAML::Value << table.rows;
    out << YAML::Key << "checksum" << YAML::Value << table.checksum;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
}

void EmitRun(YAML::Emitter &out, const RunMetadata &metadata) {
  out << YAML::Key << "format_version" << YAML::Value
      << kArtifactFormatVersion;
  out << YAML::Key << "repository" << YAML::Value << YAML::DoubleQuoted
      << metadata.repository;
  out << YAML::Key << "ref" << YAML::Value << YAML::DoubleQuoted
      << metadata.ref;
  out << YAML::Key << "config_fingerprint" << YAML::Value
      << metadata.config_fingerprint;
  out << YAML::Key << "first_commit" << YAML::Value << metadata.first_commit;
  out << YAML::Key << "last_commit" << YAML::Value << metadata.last_commit;
  out << YAML::Key << "commit_count" << YAML::Value << metadata.commit_count;
}

} // namespace

const std::vector<std::pair<std::string, std::vector<std::string>>> &
ArtifactTables() {
  static const std::vector<std::pair<std::string, std::vector<std::string>>>
      tables = {
          {"commits",
           {"oid", "sequence", "author", "author_email", "authored_ts",
            "committer_ts", "parent_count", "is_merge", "subject"}},
          {"changes",
           {"commit_oid", "file_id", "status", "path", "old_path",
            "similarity", "borderline", "in_scope", "lines_added",
            "lines_deleted"}},
          {"changesets",
           {"key", "mode", "size", "start_ts", "end_ts", "commit_count",
            "excluded_from_coupling"}},
          {"changeset_files", {"key", "file_id"}},
          {"changeset_commits", {"key", "commit_oid"}},
          {"file_stats",
           {"file_id", "current_path", "alive", "commit_count",
            "changeset_total", "weighted_total", "author_count", "first_ts",
            "last_ts", "lines_added", "lines_deleted", "head_size"}},
          {"file_lineage",
           {"file_id", "seq", "path", "valid_from_commit", "valid_to_commit"}},
          {"path_index", {"path", "file_id", "current"}},
          {"pair_stats",
           {"a_file_id", "b_file_id", "pair_count", "weighted_pair_count",
            "a_total", "b_total", "a_weighted_total", "b_weighted_total",
            "jaccard", "weighted_jaccard"}},
          {"edges",
           {"src_file_id", "dst_file_id", "rank", "pair_count",
            "weighted_pair_count", "jaccard", "weighted_jaccard",
            "p_dst_given_src", "p_src_given_dst"}},
          {"folder_edges",
           {"src_folder", "dst_folder", "depth", "pair_count",
            "weighted_pair_count", "mean_jaccard", "file_pair_count"}}};
  return tables;
}

ArtifactStore::ArtifactStore(std::filesystem::path directory,
                             std::shared_ptr<Logger> logger)
    : directory_(std::move(directory)),
      logger_(EnsureLogger(std::move(logger))) {}

ArtifactStore::~ArtifactStore() {
  if (staging_) {
    Abort();
  }
}

void ArtifactStore::Begin() {
  std::error_code error;
  std::filesystem::create_directories(directory_, error);
  if (error) {
    throw ArtifactWriteFailure("Unable to create artifact directory " +
                               directory_.string() + ": " + error.message());
  }
  for (const auto *marker : {kManifestFile, kRunFailedFile}) {
    std::filesystem::remove(directory_ / marker, error);
    if (error) {
      throw ArtifactWriteFailure("Unable to remove " +
                                 (directory_ / marker).string() + ": " +
                                 error.message());
    }
  }

  tables_.clear();
  validation_summary_.clear();
  for (const auto &[name, columns] : ArtifactTables()) {
    tables_.emplace(name, std::make_unique<TableWriter>(
                              directory_ / (TableFile(name) + kPartialSuffix),
                              columns));
  }
  staging_ = true;
  logger_->Log(LogLevel::kInfo, "store.begin",
               {{"directory", directory_.string()}});
}

TableWriter &ArtifactStore::Table(const std::string &name) {
  if (!staging_) {
    throw std::logic_error("Artifact store is not staging a run");
  }
  return *tables_.at(name);
}

void ArtifactStore::AppendCommit(const Commit &commit) {
  Table("commits").Append(
      {commit.oid, std::to_string(commit.sequence), commit.author,
       commit.author_email, std::to_string(commit.authored_ts),
       std::to_string(commit.committer_ts),
       std::to_string(commit.parent_count), Flag(commit.IsMerge()),
       commit.subject});
}

void ArtifactStore::AppendChange(const ChangeEntry &change) {
  Table("changes").Append(
      {change.commit_oid, std::to_string(change.file_id),
       ToString(change.status), change.new_path,
       change.old_path.value_or(std::string()),
       std::to_string(change.similarity), Flag(change.borderline),
       Flag(change.in_scope), std::to_string(change.lines_added),
       std::to_string(change.lines_deleted)});
}

void ArtifactStore::AppendChangeset(const Changeset &changeset) {
  Table("changesets").Append(
      {changeset.key, changeset.mode, std::to_string(changeset.size),
       std::to_string(changeset.start_ts), std::to_string(changeset.end_ts),
       std::to_string(changeset.commit_oids.size()),
       Flag(changeset.excluded_from_coupling)});
  auto &files = Table("changeset_files");
  for (const auto file_id : changeset.files) {
    files.Append({changeset.key, std::to_string(file_id)});
  }
  auto &commits = Table("changeset_commits");
  for (const auto &oid : changeset.commit_oids) {
    commits.Append({changeset.key, oid});
  }
}

void ArtifactStore::WriteFileStats(const std::vector<FileStats> &stats) {
  auto &table = Table("file_stats");
  for (const auto &file : stats) {
    table.Append({std::to_string(file.file_id), file.current_path,
                  Flag(file.alive), std::to_string(file.commit_count),
                  std::to_string(file.changeset_total),
                  FormatDouble(file.weighted_total),
                  std::to_string(file.author_count),
                  std::to_string(file.first_ts), std::to_string(file.last_ts),
                  std::to_string(file.lines_added),
                  std::to_string(file.lines_deleted),
                  file.head_size ? std::to_string(*file.head_size)
                                 : std::string()});
  }
}

void ArtifactStore::WriteLineage(const std::vector<FileIdentity> &identities) {
  auto &table = Table("file_lineage");
  for (const auto &identity : identities) {
    for (std::size_t seq = 0; seq < identity.lineage.size(); ++seq) {
      const auto &interval = identity.lineage[seq];
      table.Append({std::to_string(identity.file_id), std::to_string(seq),
                    interval.path, interval.valid_from_commit,
                    interval.valid_to_commit.value_or(std::string())});
    }
  }
}

void ArtifactStore::WritePathIndex(const std::vector<PathOwner> &owners) {
  auto &table = Table("path_index");
  for (const auto &owner : owners) {
    table.Append(
        {owner.path, std::to_string(owner.file_id), Flag(owner.current)});
  }
}

void ArtifactStore::WritePairStats(const CouplingComputer &coupling,
                                   std::uint64_t min_cooccurrence) {
  auto &table = Table("pair_stats");
  for (const auto &[pair, counts] : coupling.Pairs()) {
    if (counts.pair_count < min_cooccurrence) {
      continue;
    }
    const auto stat = coupling.Stat(pair.first, pair.second);
    table.Append({std::to_string(pair.first), std::to_string(pair.second),
                  std::to_string(stat.pair_count),
                  FormatDouble(stat.weighted_pair_count),
                  std::to_string(stat.a_total), std::to_string(stat.b_total),
                  FormatDouble(stat.a_weighted_total),
                  FormatDouble(stat.b_weighted_total),
                  FormatDouble(stat.Jaccard()),
                  FormatDouble(stat.WeightedJaccard())});
  }
}

void ArtifactStore::WriteEdges(const std::vector<Edge> &edges) {
  auto &table = Table("edges");
  for (const auto &edge : edges) {
    table.Append({std::to_string(edge.src_file_id),
                  std::to_string(edge.dst_file_id), std::to_string(edge.rank),
                  std::to_string(edge.pair_count),
                  FormatDouble(edge.weighted_pair_count),
                  FormatDouble(edge.jaccard),
                  FormatDouble(edge.weighted_jaccard),
                  FormatDouble(edge.p_dst_given_src),
                  FormatDouble(edge.p_src_given_dst)});
  }
}

void ArtifactStore::WriteFolderEdges(const std::vector<FolderEdge> &edges) {
  auto &table = Table("folder_edges");
  for (const auto &edge : edges) {
    table.Append({edge.src_folder, edge.dst_folder, std::to_string(edge.depth),
                  std::to_string(edge.pair_count),
                  FormatDouble(edge.weighted_pair_count),
                  FormatDouble(edge.mean_jaccard),
                  std::to_string(edge.file_pair_count)});
  }
}

void ArtifactStore::WriteValidationSummary(const ValidationSummary &summary) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "quality_score" << YAML::Value
      << FormatDouble(summary.QualityScore());
  out << YAML::Key << "total_tokens" << YAML::Value << summary.total_tokens;
  out << YAML::Key << "invalid_tokens" << YAML::Value
      << summary.invalid_tokens;
  out << YAML::Key << "identity_inconsistencies" << YAML::Value
      << summary.identity_inconsistencies;
  out << YAML::Key << "total_issues" << YAML::Value << summary.total_issues;
  out << YAML::Key << "issue_counts" << YAML::Value << YAML::BeginMap;
  for (const auto &[reason, count] : summary.issue_counts) {
    out << YAML::Key << ToString(reason) << YAML::Value << count;
  }
  out << YAML::EndMap;
  out << YAML::Key << "samples" << YAML::Value << YAML::BeginSeq;
  for (const auto &issue : summary.samples) {
    out << YAML::BeginMap;
    out << YAML::Key << "reason" << YAML::Value << ToString(issue.reason);
    out << YAML::Key << "commit" << YAML::Value << issue.commit_oid;
    out << YAML::Key << "cursor" << YAML::Value << issue.cursor_position;
    out << YAML::Key << "token" << YAML::Value << YAML::DoubleQuoted
        << issue.raw_token;
    out << YAML::Key << "context" << YAML::Value << YAML::Flow
        << YAML::BeginSeq;
    for (const auto &context : issue.surrounding_context) {
      out << YAML::DoubleQuoted << context;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;
  if (!out.good()) {
    throw ArtifactWriteFailure("Unable to encode validation summary: " +
                               out.GetLastError());
  }
  validation_summary_ = out.c_str();
}

std::vector<TableSummary> ArtifactStore::CommitTables() {
  std::vector<TableSummary> summaries;
  for (const auto &[name, columns] : ArtifactTables()) {
    auto &writer = *tables_.at(name);
    writer.Close();
    const auto target = directory_ / TableFile(name);
    std::error_code error;
    std::filesystem::rename(writer.Path(), target, error);
    if (error) {
      throw ArtifactWriteFailure("Unable to move " + writer.Path().string() +
                                 " into place: " + error.message());
    }
    summaries.push_back(
        TableSummary{name, TableFile(name), writer.RowCount(), writer.Checksum()});
  }
  if (!validation_summary_.empty()) {
    WriteYaml(directory_ / kValidationSummaryFile, validation_summary_);
  }
  return summaries;
}

void ArtifactStore::WriteYaml(const std::filesystem::path &target,
                              const std::string &content) {
  const auto temporary = target.string() + ".tmp";
  {
    std::ofstream stream(temporary, std::ios::binary | std::ios::trunc);
    if (!stream) {
      throw ArtifactWriteFailure("Unable to open " + temporary);
    }
    stream << content << '\n';
    stream.flush();
    if (!stream) {
      throw ArtifactWriteFailure("Unable to write " + temporary);
    }
  }
  std::error_code error;
  std::filesystem::rename(temporary, target, error);
  if (error) {
    throw ArtifactWriteFailure("Unable to move " + temporary +
                               " into place: " + error.message());
  }
}

void ArtifactStore::Publish(const RunMetadata &metadata) {
  if (!staging_) {
    throw std::logic_error("Publish called without Begin");
  }
  const auto tables = CommitTables();

  YAML::Emitter out;
  out << YAML::BeginMap;
  EmitRun(out, metadata);
  out << YAML::Key << "status" << YAML::Value << "complete";
  out << YAML::Key << "run_timestamp" << YAML::Value << Timestamp();
  out << YAML::Key << "validation_summary" << YAML::Value
      << kValidationSummaryFile;
  EmitTables(out, tables);
  out << YAML::EndMap;
  if (!out.good()) {
    throw ArtifactWriteFailure("Unable to encode manifest: " +
                               out.GetLastError());
  }
  WriteYaml(directory_ / kManifestFile, out.c_str());
  tables_.clear();
  staging_ = false;
  logger_->Log(LogLevel::kInfo, "store.publish",
               {{"directory", directory_.string()},
                {"commits", std::to_string(metadata.commit_count)},
                {"last_commit", metadata.last_commit}});
}

void ArtifactStore::FlushPartial(const std::string &error,
                                 const RunMetadata &metadata) {
  if (!staging_) {
    throw std::logic_error("FlushPartial called without Begin");
  }
  const auto tables = CommitTables();

  YAML::Emitter out;
  out << YAML::BeginMap;
  EmitRun(out, metadata);
  out << YAML::Key << "status" << YAML::Value << "failed";
  out << YAML::Key << "error" << YAML::Value << YAML::DoubleQuoted << error;
  out << YAML::Key << "run_timestamp" << YAML::Value << Timestamp();
  EmitTables(out, tables);
  out << YAML::EndMap;
  if (!out.good()) {
    throw ArtifactWriteFailure("Unable to encode failure marker: " +
                               out.GetLastError());
  }
  WriteYaml(directory_ / kRunFailedFile, out.c_str());
  tables_.clear();
  staging_ = false;
  logger_->Log(LogLevel::kWarn, "store.flush_partial",
               {{"directory", directory_.string()},
                {"last_commit", metadata.last_commit},
                {"error", error}});
}

void ArtifactStore::Abort() {
  RemoveStaged();
  staging_ = false;
  logger_->Log(LogLevel::kInfo, "store.abort",
               {{"directory", directory_.string()}});
}

void ArtifactStore::RemoveStaged() {
  std::vector<std::filesystem::path> staged;
  for (const auto &[name, writer] : tables_) {
    staged.push_back(writer->Path());
  }
  // Destroying the writers closes their streams before removal.
  tables_.clear();
  validation_summary_.clear();
  for (const auto &path : staged) {
    std::error_code error;
    std::filesystem::remove(path, error);
    if (error) {
      logger_->Log(LogLevel::kWarn, "store.cleanup_failed",
                   {{"path", path.string()}, {"error", error.message()}});
    }
  }
}

} // namespace cochange
