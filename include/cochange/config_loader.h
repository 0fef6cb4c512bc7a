#pragma once

#include <cochange/mining_config.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cochange {

// Values explicitly present in a configuration source. Unset fields leave
// the base configuration untouched when merged.
struct MiningConfigOverrides {
  std::optional<std::filesystem::path> repository;
  std::optional<std::filesystem::path> output;
  std::optional<std::string> ref;
  std::optional<std::string> since_commit;
  std::optional<std::string> since;
  std::optional<std::string> until;
  std::optional<bool> all_refs;
  std::optional<bool> first_parent_only;
  std::optional<bool> skip_merge_commits;
  std::optional<int> find_renames_threshold;
  std::optional<int> max_changeset_size;
  std::optional<std::string> changeset_mode;
  std::optional<double> author_time_hours;
  std::optional<int> min_cooccurrence;
  std::optional<int> topk_edges;
  std::optional<CouplingMetric> primary_metric;
  std::optional<int> folder_depth;
  std::optional<ValidationMode> validation_mode;
  std::optional<int> max_validation_samples;
  std::optional<std::int64_t> min_loc;
  std::optional<std::int64_t> min_file_size;
  std::optional<std::vector<std::string>> ignore_patterns;
  std::optional<bool> collect_line_stats;
  std::optional<int> worker_threads;
  std::optional<int> batch_size;
  std::optional<int> export_timeout_seconds;
  std::optional<LogLevel> log_level;
};

const std::vector<std::string> &SupportedConfigKeys();
std::string NormalizeConfigKey(std::string key);

MiningConfigOverrides ParseConfigFile(const std::filesystem::path &path);
MiningConfigOverrides ParseConfigText(const std::string &yaml);
MiningConfig MergeConfig(const MiningConfig &base,
                         const MiningConfigOverrides &overrides);
MiningConfig LoadMiningConfig(const std::filesystem::path &path);

} // namespace cochange
