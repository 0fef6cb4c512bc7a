#pragma once

#include <cochange/logging.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cochange {

struct ByCommit {};

struct ByAuthorTime {
  double window_hours = 24.0;
};

using ChangesetMode = std::variant<ByCommit, ByAuthorTime>;

enum class CouplingMetric { kJaccard, kWeightedJaccard, kConditionalProbability };

enum class ValidationMode { kStrict, kSoft, kPermissive };

struct MiningConfig {
  std::filesystem::path repository;
  std::filesystem::path output;

  std::string ref = "HEAD";
  std::optional<std::string> since_commit;
  std::optional<std::string> since;
  std::optional<std::string> until;
  bool all_refs = false;
  bool first_parent_only = false;
  bool skip_merge_commits = true;
  int find_renames_threshold = 60;

  int max_changeset_size = 50;
  ChangesetMode changeset_mode = ByCommit{};
  int min_cooccurrence = 3;
  int topk_edges = 50;
  CouplingMetric primary_metric = CouplingMetric::kWeightedJaccard;
  int folder_depth = 2;

  ValidationMode validation_mode = ValidationMode::kSoft;
  int max_validation_samples = 200;

  std::int64_t min_loc = 0;
  std::int64_t min_file_size = 0;
  std::vector<std::string> ignore_patterns;
  bool collect_line_stats = true;

  int worker_threads = 1;
  int batch_size = 256;
  int export_timeout_seconds = 0;
  LogLevel log_level = LogLevel::kWarn;
};

std::string ToString(CouplingMetric metric);
std::string ToString(ValidationMode mode);
std::string ChangesetModeName(const ChangesetMode &mode);

CouplingMetric ParseCouplingMetric(const std::string &value);
ValidationMode ParseValidationMode(const std::string &value);
ChangesetMode ParseChangesetMode(const std::string &value,
                                 double window_hours);

void ValidateMiningConfig(const MiningConfig &config);
std::string ConfigFingerprint(const MiningConfig &config);

} // namespace cochange
