#include <cochange/config_loader.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace cochange {
namespace {

using ConfigValue = std::variant<std::string, bool, std::vector<std::string>>;
using RawConfig = std::vector<std::pair<std::string, ConfigValue>>;

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value, const std::string &key_name) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a boolean, got: " + value);
}

std::int64_t ParseInteger(const std::string &value,
                          const std::string &key_name) {
  const auto trimmed = Trim(value);
  std::size_t consumed = 0;
  std::int64_t parsed = 0;
  try {
    parsed = std::stoll(trimmed, &consumed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be an integer, got: " + value);
  }
  if (consumed != trimmed.size()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be an integer, got: " + value);
  }
  return parsed;
}

int ParseInt(const std::string &value, const std::string &key_name) {
  const auto parsed = ParseInteger(value, key_name);
  if (parsed < std::numeric_limits<int>::min() ||
      parsed > std::numeric_limits<int>::max()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' is out of range: " + value);
  }
  return static_cast<int>(parsed);
}

double ParseNumber(const std::string &value, const std::string &key_name) {
  const auto trimmed = Trim(value);
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(trimmed, &consumed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a number, got: " + value);
  }
  if (consumed != trimmed.size()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a number, got: " + value);
  }
  return parsed;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  const auto found = std::find(supported.begin(), supported.end(), normalized);
  if (found == supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractScalar(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a scalar value");
  }
  return node.as<std::string>();
}

void AppendCommaSeparated(const std::string &value,
                          std::vector<std::string> &values) {
  std::string current;
  for (const auto character : value) {
    if (character == ',') {
      if (auto trimmed = Trim(current); !trimmed.empty()) {
        values.push_back(std::move(trimmed));
      }
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  if (auto trimmed = Trim(current); !trimmed.empty()) {
    values.push_back(std::move(trimmed));
  }
}

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      if (auto value = Trim(child.as<std::string>()); !value.empty()) {
        values.push_back(std::move(value));
      }
    }
    return values;
  }
  if (node.IsScalar()) {
    AppendCommaSeparated(node.as<std::string>(), values);
    return values;
  }
  if (node.IsNull()) {
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

bool IsBoolKey(const std::string &key) {
  return key == "all_refs" || key == "first_parent_only" ||
         key == "skip_merge_commits" || key == "collect_line_stats";
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "ignore_patterns") {
    return ExtractList(node, key);
  }
  if (IsBoolKey(key)) {
    return ConfigValue{ParseBool(ExtractScalar(node, key), key)};
  }
  return ConfigValue{ExtractScalar(node, key)};
}

RawConfig ParseYamlConfig(const YAML::Node &root) {
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    const auto duplicate =
        std::find_if(config.begin(), config.end(),
                     [&key](const auto &item) { return item.first == key; });
    if (duplicate != config.end()) {
      throw std::invalid_argument("Config key given twice: " + key);
    }
    config.emplace_back(key, ToConfigValue(key, entry.second));
  }
  return config;
}

void ApplyConfig(const RawConfig &config, MiningConfigOverrides &overrides) {
  for (const auto &[key, value] : config) {
    if (IsBoolKey(key)) {
      const auto flag = std::get<bool>(value);
      if (key == "all_refs") {
        overrides.all_refs = flag;
      } else if (key == "first_parent_only") {
        overrides.first_parent_only = flag;
      } else if (key == "skip_merge_commits") {
        overrides.skip_merge_commits = flag;
      } else {
        overrides.collect_line_stats = flag;
      }
      continue;
    }
    if (key == "ignore_patterns") {
      overrides.ignore_patterns = std::get<std::vector<std::string>>(value);
      continue;
    }

    const auto &text = std::get<std::string>(value);
    if (key == "repository") {
      overrides.repository = text;
    } else if (key == "output") {
      overrides.output = text;
    } else if (key == "ref") {
      overrides.ref = Trim(text);
    } else if (key == "since_commit") {
      overrides.since_commit = Trim(text);
    } else if (key == "since") {
      overrides.since = Trim(text);
    } else if (key == "until") {
      overrides.until = Trim(text);
    } else if (key == "find_renames_threshold") {
      overrides.find_renames_threshold = ParseInt(text, key);
    } else if (key == "max_changeset_size") {
      overrides.max_changeset_size = ParseInt(text, key);
    } else if (key == "changeset_mode") {
      overrides.changeset_mode =
          ChangesetModeName(ParseChangesetMode(text, 1.0));
    } else if (key == "author_time_hours") {
      overrides.author_time_hours = ParseNumber(text, key);
    } else if (key == "min_cooccurrence") {
      overrides.min_cooccurrence = ParseInt(text, key);
    } else if (key == "topk_edges") {
      overrides.topk_edges = ParseInt(text, key);
    } else if (key == "primary_metric") {
      overrides.primary_metric = ParseCouplingMetric(text);
    } else if (key == "folder_depth") {
      overrides.folder_depth = ParseInt(text, key);
    } else if (key == "validation_mode") {
      overrides.validation_mode = ParseValidationMode(text);
    } else if (key == "max_validation_samples") {
      overrides.max_validation_samples = ParseInt(text, key);
    } else if (key == "min_loc") {
      overrides.min_loc = ParseInteger(text, key);
    } else if (key == "min_file_size") {
      overrides.min_file_size = ParseInteger(text, key);
    } else if (key == "worker_threads") {
      overrides.worker_threads = ParseInt(text, key);
    } else if (key == "batch_size") {
      overrides.batch_size = ParseInt(text, key);
    } else if (key == "export_timeout_seconds") {
      overrides.export_timeout_seconds = ParseInt(text, key);
    } else if (key == "log_level") {
      overrides.log_level = ParseLogLevel(text);
    } else {
      ThrowUnknownKey(key);
    }
  }
}

MiningConfigOverrides OverridesFromNode(const YAML::Node &root) {
  MiningConfigOverrides overrides;
  ApplyConfig(ParseYamlConfig(root), overrides);
  return overrides;
}

} // namespace

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"repository",
                                                "output",
                                                "ref",
                                                "since_commit",
                                                "since",
                                                "until",
                                                "all_refs",
                                                "first_parent_only",
                                                "skip_merge_commits",
                                                "find_renames_threshold",
                                                "max_changeset_size",
                                                "changeset_mode",
                                                "author_time_hours",
                                                "min_cooccurrence",
                                                "topk_edges",
                                                "primary_metric",
                                                "folder_depth",
                                                "validation_mode",
                                                "max_validation_samples",
                                                "min_loc",
                                                "min_file_size",
                                                "ignore_patterns",
                                                "collect_line_stats",
                                                "worker_threads",
                                                "batch_size",
                                                "export_timeout_seconds",
                                                "log_level"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"repo", "repository"},
      {"repo_path", "repository"},
      {"output_directory", "output"},
      {"out", "output"},
      {"branch", "ref"},
      {"max_changeset", "max_changeset_size"},
      {"window_hours", "author_time_hours"},
      {"topk_edges_per_file", "topk_edges"},
      {"component_depth", "folder_depth"},
      {"min_revisions", "min_cooccurrence"},
      {"ignore", "ignore_patterns"},
      {"exclude_patterns", "ignore_patterns"},
      {"rename_threshold", "find_renames_threshold"},
      {"workers", "worker_threads"},
      {"metric", "primary_metric"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

MiningConfigOverrides ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }
  return OverridesFromNode(YAML::LoadFile(path.string()));
}

MiningConfigOverrides ParseConfigText(const std::string &yaml) {
  return OverridesFromNode(YAML::Load(yaml));
}

MiningConfig MergeConfig(const MiningConfig &base,
                         const MiningConfigOverrides &overrides) {
  MiningConfig merged = base;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = *source;
    }
  };
  override_value(merged.repository, overrides.repository);
  override_value(merged.output, overrides.output);
  override_value(merged.ref, overrides.ref);
  if (overrides.since_commit) {
    merged.since_commit = overrides.since_commit;
  }
  if (overrides.since) {
    merged.since = overrides.since;
  }
  if (overrides.until) {
    merged.until = overrides.until;
  }
  override_value(merged.all_refs, overrides.all_refs);
  override_value(merged.first_parent_only, overrides.first_parent_only);
  override_value(merged.skip_merge_commits, overrides.skip_merge_commits);
  override_value(merged.find_renames_threshold,
                 overrides.find_renames_threshold);
  override_value(merged.max_changeset_size, overrides.max_changeset_size);

  if (overrides.changeset_mode) {
    double hours = ByAuthorTime{}.window_hours;
    if (const auto *window = std::get_if<ByAuthorTime>(&base.changeset_mode)) {
      hours = window->window_hours;
    }
    merged.changeset_mode = ParseChangesetMode(*overrides.changeset_mode, hours);
  }
  if (overrides.author_time_hours) {
    if (auto *window = std::get_if<ByAuthorTime>(&merged.changeset_mode)) {
      window->window_hours = *overrides.author_time_hours;
    }
  }

  override_value(merged.min_cooccurrence, overrides.min_cooccurrence);
  override_value(merged.topk_edges, overrides.topk_edges);
  override_value(merged.primary_metric, overrides.primary_metric);
  override_value(merged.folder_depth, overrides.folder_depth);
  override_value(merged.validation_mode, overrides.validation_mode);
  override_value(merged.max_validation_samples,
                 overrides.max_validation_samples);
  override_value(merged.min_loc, overrides.min_loc);
  override_value(merged.min_file_size, overrides.min_file_size);
  override_value(merged.ignore_patterns, overrides.ignore_patterns);
  override_value(merged.collect_line_stats, overrides.collect_line_stats);
  override_value(merged.worker_threads, overrides.worker_threads);
  override_value(merged.batch_size, overrides.batch_size);
  override_value(merged.export_timeout_seconds,
                 overrides.export_timeout_seconds);
  override_value(merged.log_level, overrides.log_level);
  return merged;
}

MiningConfig LoadMiningConfig(const std::filesystem::path &path) {
  auto config = MergeConfig(MiningConfig{}, ParseConfigFile(path));
  ValidateMiningConfig(config);
  return config;
}

} // namespace cochange
