#include <cochange/default_mining_pipeline.h>

#include <cochange/artifact_store.h>
#include <cochange/changeset_builder.h>
#include <cochange/commit_stream.h>
#include <cochange/coupling_computer.h>
#include <cochange/errors.h>
#include <cochange/file_identity_resolver.h>
#include <cochange/git_repository.h>
#include <cochange/record_parser.h>
#include <cochange/sparsifier.h>
#include <cochange/validation_collector.h>

#include <fnmatch.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace cochange {
namespace {

bool MatchesAny(const std::vector<std::string> &patterns,
                const std::string &path) {
  // No FNM_PATHNAME: '*' matches across directory separators.
  return std::any_of(patterns.begin(), patterns.end(),
                     [&path](const std::string &pattern) {
                       return fnmatch(pattern.c_str(), path.c_str(), 0) == 0;
                     });
}

struct FileActivity {
  std::uint64_t commit_count = 0;
  std::set<std::string> authors;
  std::int64_t first_ts = 0;
  std::int64_t last_ts = 0;
  std::int64_t lines_added = 0;
  std::int64_t lines_deleted = 0;
};

// State of one run. Every stage is fed in commit order from a single thread;
// only coupling accumulation fans out.
class MiningRun {
public:
  MiningRun(const MiningConfig &config, const CancellationToken &cancel,
            RepositoryGateway &gateway, std::shared_ptr<Logger> logger)
      : config_(config), cancel_(cancel), gateway_(gateway),
        logger_(std::move(logger)), store_(config.output, logger_),
        parser_(config.validation_mode, logger_),
        collector_(static_cast<std::size_t>(config.max_validation_samples)),
        resolver_(logger_),
        changesets_(config.changeset_mode, config.max_changeset_size) {}

  MiningResult Execute();
  // Moves the processed prefix into place beside a failure marker.
  void FlushProcessedPrefix(const MiningError &error);
  void Discard();
  const std::string &LastCommit() const { return last_commit_; }

private:
  void StreamHistory();
  void ProcessCommit(ParsedRecord &parsed);
  void AttachLineStats(const Commit &commit,
                       std::vector<ChangeEntry> &entries);
  void Record(std::vector<Changeset> finished);
  void AccumulateBatch();
  void CheckCancelled();
  std::vector<FileStats> BuildFileStats(const HeadSizes &head_sizes) const;
  RunMetadata Metadata() const;

  const MiningConfig &config_;
  const CancellationToken &cancel_;
  RepositoryGateway &gateway_;
  std::shared_ptr<Logger> logger_;

  ArtifactStore store_;
  RecordParser parser_;
  ValidationCollector collector_;
  FileIdentityResolver resolver_;
  ChangesetBuilder changesets_;
  CouplingComputer coupling_;
  std::unique_ptr<RecordSource> history_;
  std::unique_ptr<NumstatReader> numstat_;

  std::vector<Changeset> batch_;
  std::unordered_map<FileId, FileActivity> activity_;
  std::size_t reported_inconsistencies_ = 0;
  std::string first_commit_;
  std::string last_commit_;
  MiningResult result_;
};

void MiningRun::CheckCancelled() {
  if (cancel_.IsCancelled()) {
    throw RunCancelled("Run cancelled", last_commit_);
  }
}

RunMetadata MiningRun::Metadata() const {
  RunMetadata metadata;
  metadata.repository = config_.repository.string();
  metadata.ref = config_.all_refs ? std::string("--all") : config_.ref;
  metadata.config_fingerprint = ConfigFingerprint(config_);
  metadata.first_commit = first_commit_;
  metadata.last_commit = last_commit_;
  metadata.commit_count = result_.commit_count;
  return metadata;
}

void MiningRun::AccumulateBatch() {
  if (batch_.empty()) {
    return;
  }
  AccumulateSharded(batch_, config_.worker_threads, coupling_);
  batch_.clear();
}

void MiningRun::Record(std::vector<Changeset> finished) {
  for (auto &changeset : finished) {
    CheckCancelled();
    store_.AppendChangeset(changeset);
    ++result_.changeset_count;
    if (changeset.excluded_from_coupling) {
      ++result_.excluded_changesets;
    }
    batch_.push_back(std::move(changeset));
    if (batch_.size() >= static_cast<std::size_t>(config_.batch_size)) {
      AccumulateBatch();
    }
  }
}

void MiningRun::AttachLineStats(const Commit &commit,
                                std::vector<ChangeEntry> &entries) {
  if (!numstat_) {
    return;
  }
  const auto *record = numstat_->Advance(commit.oid);
  if (record == nullptr) {
    return;
  }
  std::unordered_map<std::string, const NumstatEntry *> by_path;
  for (const auto &entry : record->entries) {
    by_path.emplace(entry.path, &entry);
  }
  for (auto &entry : entries) {
    const auto found = by_path.find(entry.new_path);
    if (found == by_path.end() || found->second->binary) {
      continue;
    }
    entry.lines_added = found->second->lines_added;
    entry.lines_deleted = found->second->lines_deleted;
  }
}

void MiningRun::ProcessCommit(ParsedRecord &parsed) {
  auto commit = *parsed.commit;
  commit.sequence = result_.commit_count;
  resolver_.BeginCommit(commit.oid);
  AttachLineStats(commit, parsed.entries);

  std::vector<FileId> in_scope;
  std::unordered_set<FileId> touched;
  for (auto &entry : parsed.entries) {
    entry.file_id = resolver_.Apply(entry);
    entry.in_scope =
        !entry.borderline && !MatchesAny(config_.ignore_patterns, entry.new_path);
    if (entry.in_scope) {
      in_scope.push_back(entry.file_id);
    }

    auto &activity = activity_[entry.file_id];
    if (touched.insert(entry.file_id).second) {
      if (activity.commit_count++ == 0) {
        activity.first_ts = commit.committer_ts;
      }
      activity.first_ts = std::min(activity.first_ts, commit.committer_ts);
      activity.last_ts = std::max(activity.last_ts, commit.committer_ts);
      activity.authors.insert(commit.author_email);
    }
    activity.lines_added += entry.lines_added;
    activity.lines_deleted += entry.lines_deleted;
  }

  const auto inconsistencies = resolver_.InconsistencyCount();
  for (; reported_inconsistencies_ < inconsistencies;
       ++reported_inconsistencies_) {
    collector_.RecordInconsistency();
  }

  store_.AppendCommit(commit);
  for (const auto &entry : parsed.entries) {
    store_.AppendChange(entry);
  }
  result_.change_count += parsed.entries.size();
  ++result_.commit_count;
  if (first_commit_.empty()) {
    first_commit_ = commit.oid;
  }
  last_commit_ = commit.oid;

  Record(changesets_.Add(commit, in_scope));
}

void MiningRun::StreamHistory() {
  history_ = std::make_unique<CommitStream>(gateway_.OpenHistory(config_),
                                            std::string(kCommitMarker),
                                            RecordLayout::kNameStatus);
  if (config_.collect_line_stats) {
    numstat_ = std::make_unique<NumstatReader>(std::make_unique<CommitStream>(
        gateway_.OpenNumstat(config_), std::string(kNumstatMarker),
        RecordLayout::kNumstat));
  }

  RawRecord record;
  while (history_->Next(record)) {
    CheckCancelled();
    auto parsed = parser_.Parse(record);
    collector_.Add(parsed);
    if (parsed.commit) {
      ProcessCommit(parsed);
    }
  }
  CheckCancelled();
  Record(changesets_.Flush());
  AccumulateBatch();

  history_->Finish();
  if (numstat_) {
    numstat_->Finish();
  }
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "history"},
                {"commits", std::to_string(result_.commit_count)},
                {"changes", std::to_string(result_.change_count)},
                {"changesets", std::to_string(result_.changeset_count)}});
}

std::vector<FileStats>
MiningRun::BuildFileStats(const HeadSizes &head_sizes) const {
  std::vector<FileStats> stats;
  stats.reserve(resolver_.Identities().size());
  for (const auto &identity : resolver_.Identities()) {
    FileStats file;
    file.file_id = identity.file_id;
    file.current_path = identity.LatestPath();
    file.alive = identity.OpenInterval() != nullptr;
    if (const auto found = activity_.find(identity.file_id);
        found != activity_.end()) {
      const auto &activity = found->second;
      file.commit_count = activity.commit_count;
      file.author_count = activity.authors.size();
      file.first_ts = activity.first_ts;
      file.last_ts = activity.last_ts;
      file.lines_added = activity.lines_added;
      file.lines_deleted = activity.lines_deleted;
    }
    const auto totals = coupling_.Totals(identity.file_id);
    file.changeset_total = totals.total;
    file.weighted_total = totals.weighted_total;
    if (file.alive) {
      if (const auto size = head_sizes.find(file.current_path);
          size != head_sizes.end()) {
        file.head_size = size->second;
      }
    }
    stats.push_back(std::move(file));
  }
  return stats;
}

MiningResult MiningRun::Execute() {
  gateway_.Verify(config_);
  store_.Begin();
  StreamHistory();

  const auto head_sizes = gateway_.HeadFileSizes(config_);
  const auto stats = BuildFileStats(head_sizes);

  const bool loc_filter = config_.min_loc > 0 && config_.collect_line_stats;
  if (config_.min_loc > 0 && !config_.collect_line_stats) {
    logger_->Log(LogLevel::kWarn, "pipeline.min_loc_ignored",
                 {{"reason", "line statistics are not collected"}});
  }
  std::unordered_set<FileId> eligible;
  std::unordered_map<FileId, std::string> paths;
  for (const auto &file : stats) {
    paths.emplace(file.file_id, file.current_path);
    if (loc_filter && file.EstimatedLoc() < config_.min_loc) {
      continue;
    }
    if (config_.min_file_size > 0 &&
        (!file.head_size ||
         *file.head_size < static_cast<std::uint64_t>(config_.min_file_size))) {
      continue;
    }
    eligible.insert(file.file_id);
  }

  const Sparsifier sparsifier(config_.primary_metric, config_.min_cooccurrence,
                              config_.topk_edges);
  const auto edges = sparsifier.Sparsify(coupling_, [&eligible](FileId id) {
    return eligible.count(id) != 0;
  });
  const auto folder_edges = RollupFolders(edges, paths, config_.folder_depth);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "sparsify"},
                {"pairs", std::to_string(coupling_.Pairs().size())},
                {"edges", std::to_string(edges.size())},
                {"folder_edges", std::to_string(folder_edges.size())}});

  CheckCancelled();
  store_.WriteFileStats(stats);
  store_.WriteLineage(resolver_.Identities());
  store_.WritePathIndex(resolver_.PathIndex());
  store_.WritePairStats(coupling_,
                        static_cast<std::uint64_t>(config_.min_cooccurrence));
  store_.WriteEdges(edges);
  store_.WriteFolderEdges(folder_edges);
  store_.WriteValidationSummary(collector_.Summary());
  store_.Publish(Metadata());

  result_.file_count = stats.size();
  result_.pair_count = coupling_.Pairs().size();
  result_.edge_count = edges.size();
  result_.folder_edge_count = folder_edges.size();
  result_.quality_score = collector_.Summary().QualityScore();
  result_.output_directory = config_.output.string();
  return result_;
}

void MiningRun::FlushProcessedPrefix(const MiningError &error) {
  if (!store_.Staging()) {
    return;
  }
  try {
    store_.FlushPartial(error.what(), Metadata());
  } catch (const ArtifactWriteFailure &flush_error) {
    logger_->Log(LogLevel::kError, "pipeline.flush_partial_failed",
                 {{"error", flush_error.what()}});
    store_.Abort();
  }
}

void MiningRun::Discard() {
  if (store_.Staging()) {
    store_.Abort();
  }
}

} // namespace

DefaultMiningPipeline::DefaultMiningPipeline(MiningComponents components)
    : gateway_(std::move(components.gateway)),
      logger_(EnsureLogger(std::move(components.logger))),
      output_directory_(std::move(components.output_directory)) {
  if (!gateway_) {
    throw std::invalid_argument("Mining pipeline requires a repository gateway");
  }
}

MiningResult DefaultMiningPipeline::Run(const MiningConfig &config,
                                        const CancellationToken &cancel) {
  auto effective = config;
  if (output_directory_) {
    effective.output = *output_directory_;
  }
  ValidateMiningConfig(effective);

  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"repository", effective.repository.string()},
                {"output", effective.output.string()},
                {"mode", ChangesetModeName(effective.changeset_mode)},
                {"validation", ToString(effective.validation_mode)}});
  const auto pipeline_start = std::chrono::steady_clock::now();

  MiningRun run(effective, cancel, *gateway_, logger_);
  try {
    const auto result = run.Execute();
    const auto duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - pipeline_start)
            .count();
    logger_->Log(LogLevel::kInfo, "pipeline.complete",
                 {{"duration_ms", std::to_string(duration_ms)},
                  {"commits", std::to_string(result.commit_count)},
                  {"edges", std::to_string(result.edge_count)},
                  {"quality_score", std::to_string(result.quality_score)}});
    return result;
  } catch (HistoryExportFailed &error) {
    error.SetLastCommitBoundary(run.LastCommit());
    run.FlushProcessedPrefix(error);
    logger_->Log(LogLevel::kError, "pipeline.failed",
                 {{"error", error.what()},
                  {"last_commit", error.LastCommitBoundary()}});
    throw;
  } catch (MiningError &error) {
    error.SetLastCommitBoundary(run.LastCommit());
    run.Discard();
    logger_->Log(LogLevel::kError, "pipeline.failed",
                 {{"error", error.what()},
                  {"last_commit", error.LastCommitBoundary()}});
    throw;
  }
}

} // namespace cochange
