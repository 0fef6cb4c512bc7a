#include <cochange/mining_config.h>

#include <cochange/table_io.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <type_traits>

namespace cochange {
namespace {

std::string Normalize(const std::string &value) {
  std::string normalized;
  for (const auto character : value) {
    if (std::isspace(static_cast<unsigned char>(character)) != 0) {
      continue;
    }
    normalized.push_back(character == '-'
                             ? '_'
                             : static_cast<char>(std::tolower(
                                   static_cast<unsigned char>(character))));
  }
  return normalized;
}

void RequireAtLeast(long long value, long long minimum,
                    const std::string &key) {
  if (value < minimum) {
    throw std::invalid_argument(key + " must be >= " +
                                std::to_string(minimum) + " (got " +
                                std::to_string(value) + ")");
  }
}

} // namespace

std::string ToString(CouplingMetric metric) {
  switch (metric) {
  case CouplingMetric::kJaccard:
    return "jaccard";
  case CouplingMetric::kWeightedJaccard:
    return "weighted_jaccard";
  case CouplingMetric::kConditionalProbability:
    return "conditional_probability";
  }
  return "unknown";
}

std::string ToString(ValidationMode mode) {
  switch (mode) {
  case ValidationMode::kStrict:
    return "strict";
  case ValidationMode::kSoft:
    return "soft";
  case ValidationMode::kPermissive:
    return "permissive";
  }
  return "unknown";
}

std::string ChangesetModeName(const ChangesetMode &mode) {
  return std::visit(
      [](const auto &value) -> std::string {
        using Mode = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<Mode, ByCommit>) {
          return "by_commit";
        } else {
          static_assert(std::is_same_v<Mode, ByAuthorTime>);
          return "by_author_time";
        }
      },
      mode);
}

CouplingMetric ParseCouplingMetric(const std::string &value) {
  const auto normalized = Normalize(value);
  if (normalized == "jaccard") {
    return CouplingMetric::kJaccard;
  }
  if (normalized == "weighted_jaccard" || normalized == "jaccard_weighted") {
    return CouplingMetric::kWeightedJaccard;
  }
  if (normalized == "conditional_probability" || normalized == "p_dst_given_src") {
    return CouplingMetric::kConditionalProbability;
  }
  throw std::invalid_argument("Unknown coupling metric: " + value);
}

ValidationMode ParseValidationMode(const std::string &value) {
  const auto normalized = Normalize(value);
  if (normalized == "strict") {
    return ValidationMode::kStrict;
  }
  if (normalized == "soft") {
    return ValidationMode::kSoft;
  }
  if (normalized == "permissive") {
    return ValidationMode::kPermissive;
  }
  throw std::invalid_argument("Unknown validation mode: " + value);
}

ChangesetMode ParseChangesetMode(const std::string &value,
                                 double window_hours) {
  const auto normalized = Normalize(value);
  if (normalized == "by_commit") {
    return ByCommit{};
  }
  if (normalized == "by_author_time") {
    return ByAuthorTime{window_hours};
  }
  throw std::invalid_argument("Unknown changeset mode: " + value);
}

void ValidateMiningConfig(const MiningConfig &config) {
  if (config.repository.empty()) {
    throw std::invalid_argument("repository is required");
  }
  if (config.output.empty()) {
    throw std::invalid_argument("output is required");
  }
  if (config.ref.empty() && !config.all_refs) {
    throw std::invalid_argument("ref must not be empty");
  }
  RequireAtLeast(config.find_renames_threshold, 1, "find_renames_threshold");
  if (config.find_renames_threshold > 100) {
    throw std::invalid_argument("find_renames_threshold must be <= 100");
  }
  RequireAtLeast(config.max_changeset_size, 1, "max_changeset_size");
  RequireAtLeast(config.min_cooccurrence, 1, "min_cooccurrence");
  RequireAtLeast(config.topk_edges, 1, "topk_edges");
  RequireAtLeast(config.folder_depth, 1, "folder_depth");
  RequireAtLeast(config.max_validation_samples, 0, "max_validation_samples");
  RequireAtLeast(config.min_loc, 0, "min_loc");
  RequireAtLeast(config.min_file_size, 0, "min_file_size");
  RequireAtLeast(config.worker_threads, 1, "worker_threads");
  RequireAtLeast(config.batch_size, 1, "batch_size");
  RequireAtLeast(config.export_timeout_seconds, 0, "export_timeout_seconds");
  if (const auto *window = std::get_if<ByAuthorTime>(&config.changeset_mode)) {
    if (!(window->window_hours > 0.0)) {
      throw std::invalid_argument("author_time_hours must be > 0");
    }
  }
}

std::string ConfigFingerprint(const MiningConfig &config) {
  Fnv1a hash;
  const auto add = [&hash](const std::string &key, const std::string &value) {
    hash.Update(key);
    hash.Update("=");
    hash.Update(value);
    hash.Update("\n");
  };
  add("ref", config.all_refs ? std::string("--all") : config.ref);
  add("since_commit", config.since_commit.value_or(""));
  add("since", config.since.value_or(""));
  add("until", config.until.value_or(""));
  add("first_parent_only", config.first_parent_only ? "1" : "0");
  add("skip_merge_commits", config.skip_merge_commits ? "1" : "0");
  add("find_renames_threshold", std::to_string(config.find_renames_threshold));
  add("max_changeset_size", std::to_string(config.max_changeset_size));
  add("changeset_mode", ChangesetModeName(config.changeset_mode));
  if (const auto *window = std::get_if<ByAuthorTime>(&config.changeset_mode)) {
    add("author_time_hours", FormatDouble(window->window_hours));
  }
  add("min_cooccurrence", std::to_string(config.min_cooccurrence));
  add("topk_edges", std::to_string(config.topk_edges));
  add("primary_metric", ToString(config.primary_metric));
  add("folder_depth", std::to_string(config.folder_depth));
  add("validation_mode", ToString(config.validation_mode));
  add("min_loc", std::to_string(config.min_loc));
  add("min_file_size", std::to_string(config.min_file_size));
  auto patterns = config.ignore_patterns;
  std::sort(patterns.begin(), patterns.end());
  for (const auto &pattern : patterns) {
    add("ignore", pattern);
  }
  add("collect_line_stats", config.collect_line_stats ? "1" : "0");
  return hash.Hex();
}

} // namespace cochange
