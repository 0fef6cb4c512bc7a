#include <cochange/artifact_reader.h>

#include <cochange/artifact_store.h>
#include <cochange/errors.h>
#include <cochange/table_io.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace cochange {
namespace {

template <typename Number, typename Convert>
Number ParseNumber(const std::string &text, Convert convert) {
  try {
    std::size_t consumed = 0;
    const Number value = convert(text, &consumed);
    if (consumed == text.size()) {
      return value;
    }
  } catch (const std::logic_error &) {
    // std::invalid_argument and std::out_of_range both land here.
  }
  throw IncompleteDataset("Corrupt numeric field '" + text + "'");
}

std::uint64_t ToUnsigned(const std::string &text) {
  return ParseNumber<std::uint64_t>(
      text, [](const std::string &value, std::size_t *consumed) {
        return std::stoull(value, consumed);
      });
}

std::int64_t ToSigned(const std::string &text) {
  return ParseNumber<std::int64_t>(
      text, [](const std::string &value, std::size_t *consumed) {
        return std::stoll(value, consumed);
      });
}

double ToDouble(const std::string &text) {
  return ParseNumber<double>(
      text, [](const std::string &value, std::size_t *consumed) {
        return std::stod(value, consumed);
      });
}

YAML::Node LoadYaml(const std::filesystem::path &path) {
  try {
    return YAML::LoadFile(path.string());
  } catch (const YAML::Exception &error) {
    throw IncompleteDataset("Unreadable " + path.string() + ": " +
                            error.what());
  }
}

} // namespace

ArtifactReader::ArtifactReader(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

ArtifactReader ArtifactReader::Open(const std::filesystem::path &directory) {
  if (!std::filesystem::exists(directory / kManifestFile)) {
    if (std::filesystem::exists(directory / kRunFailedFile)) {
      throw IncompleteDataset("Run in " + directory.string() +
                              " failed; only a partial prefix was written");
    }
    throw IncompleteDataset("No manifest in " + directory.string());
  }
  ArtifactReader reader(directory);
  reader.LoadManifest();
  reader.LoadValidationSummary();
  reader.LoadFiles();
  reader.LoadEdges();
  return reader;
}

void ArtifactReader::LoadManifest() {
  const auto manifest = LoadYaml(directory_ / kManifestFile);
  if (!manifest.IsMap() || !manifest["status"] ||
      manifest["status"].as<std::string>("") != "complete") {
    throw IncompleteDataset("Manifest in " + directory_.string() +
                            " does not describe a complete run");
  }
  if (manifest["format_version"].as<int>(0) != kArtifactFormatVersion) {
    throw IncompleteDataset("Unsupported artifact format version in " +
                            directory_.string());
  }
  summary_.config_fingerprint =
      manifest["config_fingerprint"].as<std::string>("");
  summary_.repository = manifest["repository"].as<std::string>("");
  summary_.ref = manifest["ref"].as<std::string>("");
  summary_.last_commit = manifest["last_commit"].as<std::string>("");
  summary_.commit_count = manifest["commit_count"].as<std::size_t>(0);
  for (const auto &table : manifest["tables"]) {
    const auto name = table["name"].as<std::string>("");
    const auto file = table["file"].as<std::string>("");
    if (name.empty() || file.empty()) {
      throw IncompleteDataset("Manifest in " + directory_.string() +
                              " has a malformed table entry");
    }
    if (!std::filesystem::exists(directory_ / file)) {
      throw IncompleteDataset("Manifest lists missing table " + file);
    }
    table_files_[name] = file;
    summary_.table_rows[name] = table["rows"].as<std::size_t>(0);
  }
}

void ArtifactReader::LoadValidationSummary() {
  const auto path = directory_ / kValidationSummaryFile;
  if (!std::filesystem::exists(path)) {
    return;
  }
  const auto summary = LoadYaml(path);
  summary_.quality_score = summary["quality_score"].as<double>(1.0);
  summary_.total_tokens = summary["total_tokens"].as<std::size_t>(0);
  summary_.invalid_tokens = summary["invalid_tokens"].as<std::size_t>(0);
  summary_.identity_inconsistencies =
      summary["identity_inconsistencies"].as<std::size_t>(0);
  summary_.total_issues = summary["total_issues"].as<std::size_t>(0);
  for (const auto &entry : summary["issue_counts"]) {
    summary_.issue_counts[entry.first.as<std::string>()] =
        entry.second.as<std::size_t>();
  }
}

std::filesystem::path
ArtifactReader::TablePath(const std::string &name) const {
  const auto found = table_files_.find(name);
  if (found == table_files_.end()) {
    throw IncompleteDataset("Manifest does not list table " + name);
  }
  return directory_ / found->second;
}

void ArtifactReader::LoadFiles() {
  std::vector<std::string> row;
  TableReader stats(TablePath("file_stats"));
  const auto id_column = stats.Column("file_id");
  const auto path_column = stats.Column("current_path");
  const auto alive_column = stats.Column("alive");
  while (stats.Next(row)) {
    FileLookup lookup;
    lookup.file_id = ToUnsigned(row[id_column]);
    lookup.current_path = row[path_column];
    lookup.alive = row[alive_column] == "1";
    files_.emplace(lookup.file_id, std::move(lookup));
  }

  TableReader lineage(TablePath("file_lineage"));
  const auto lineage_id = lineage.Column("file_id");
  const auto lineage_path = lineage.Column("path");
  const auto from_column = lineage.Column("valid_from_commit");
  const auto to_column = lineage.Column("valid_to_commit");
  while (lineage.Next(row)) {
    const auto found = files_.find(ToUnsigned(row[lineage_id]));
    if (found == files_.end()) {
      continue;
    }
    LineageInterval interval;
    interval.path = row[lineage_path];
    interval.valid_from_commit = row[from_column];
    if (!row[to_column].empty()) {
      interval.valid_to_commit = row[to_column];
    }
    found->second.lineage.push_back(std::move(interval));
  }

  TableReader index(TablePath("path_index"));
  const auto index_path = index.Column("path");
  const auto index_id = index.Column("file_id");
  while (index.Next(row)) {
    path_index_[row[index_path]] = ToUnsigned(row[index_id]);
  }
}

void ArtifactReader::LoadEdges() {
  std::vector<std::string> row;
  TableReader table(TablePath("edges"));
  const auto src = table.Column("src_file_id");
  const auto dst = table.Column("dst_file_id");
  const auto rank = table.Column("rank");
  const auto pair_count = table.Column("pair_count");
  const auto weighted_pair_count = table.Column("weighted_pair_count");
  const auto jaccard = table.Column("jaccard");
  const auto weighted_jaccard = table.Column("weighted_jaccard");
  const auto p_dst = table.Column("p_dst_given_src");
  const auto p_src = table.Column("p_src_given_dst");
  while (table.Next(row)) {
    Edge edge;
    edge.src_file_id = ToUnsigned(row[src]);
    edge.dst_file_id = ToUnsigned(row[dst]);
    edge.rank = ToUnsigned(row[rank]);
    edge.pair_count = ToUnsigned(row[pair_count]);
    edge.weighted_pair_count = ToDouble(row[weighted_pair_count]);
    edge.jaccard = ToDouble(row[jaccard]);
    edge.weighted_jaccard = ToDouble(row[weighted_jaccard]);
    edge.p_dst_given_src = ToDouble(row[p_dst]);
    edge.p_src_given_dst = ToDouble(row[p_src]);
    edges_[edge.src_file_id].push_back(edge);
  }
  for (auto &[file_id, edges] : edges_) {
    std::sort(edges.begin(), edges.end(),
              [](const Edge &left, const Edge &right) {
                return left.rank < right.rank;
              });
  }
}

std::optional<FileLookup>
ArtifactReader::LookupPath(const std::string &path) const {
  const auto found = path_index_.find(path);
  if (found == path_index_.end()) {
    return std::nullopt;
  }
  return LookupFile(found->second);
}

std::optional<FileLookup> ArtifactReader::LookupFile(FileId file_id) const {
  const auto found = files_.find(file_id);
  if (found == files_.end()) {
    return std::nullopt;
  }
  return found->second;
}

std::vector<Edge> ArtifactReader::Neighbors(FileId file_id,
                                            std::size_t k) const {
  const auto found = edges_.find(file_id);
  if (found == edges_.end()) {
    return {};
  }
  const auto count = std::min(k, found->second.size());
  return std::vector<Edge>(found->second.begin(),
                           found->second.begin() + count);
}

std::vector<EvidenceChangeset>
ArtifactReader::Evidence(FileId a, FileId b, std::size_t limit) const {
  std::vector<std::string> row;

  // Changesets are written in emission order and their files sorted, so
  // both ids of a shared changeset appear in one contiguous run of rows.
  std::vector<std::string> shared;
  {
    TableReader files(TablePath("changeset_files"));
    const auto key_column = files.Column("key");
    const auto id_column = files.Column("file_id");
    std::string current_key;
    bool has_a = false;
    bool has_b = false;
    const auto close_group = [&]() {
      if (has_a && has_b) {
        shared.push_back(current_key);
      }
    };
    while (files.Next(row)) {
      if (row[key_column] != current_key) {
        close_group();
        current_key = row[key_column];
        has_a = false;
        has_b = false;
      }
      const auto file_id = ToUnsigned(row[id_column]);
      has_a = has_a || file_id == a;
      has_b = has_b || file_id == b;
    }
    close_group();
  }
  if (shared.size() > limit) {
    shared.resize(limit);
  }
  const std::set<std::string> wanted(shared.begin(), shared.end());

  std::map<std::string, EvidenceChangeset> changesets;
  {
    TableReader table(TablePath("changesets"));
    const auto key = table.Column("key");
    const auto size = table.Column("size");
    const auto start_ts = table.Column("start_ts");
    const auto end_ts = table.Column("end_ts");
    const auto excluded = table.Column("excluded_from_coupling");
    while (table.Next(row)) {
      if (wanted.count(row[key]) == 0) {
        continue;
      }
      EvidenceChangeset changeset;
      changeset.key = row[key];
      changeset.size = ToUnsigned(row[size]);
      changeset.start_ts = ToSigned(row[start_ts]);
      changeset.end_ts = ToSigned(row[end_ts]);
      changeset.excluded_from_coupling = row[excluded] == "1";
      changesets.emplace(changeset.key, std::move(changeset));
    }
  }

  std::map<std::string, std::vector<std::string>> commit_keys;
  {
    TableReader table(TablePath("changeset_commits"));
    const auto key = table.Column("key");
    const auto oid = table.Column("commit_oid");
    while (table.Next(row)) {
      if (wanted.count(row[key]) != 0) {
        commit_keys[row[oid]].push_back(row[key]);
      }
    }
  }

  {
    TableReader table(TablePath("commits"));
    const auto oid = table.Column("oid");
    const auto author = table.Column("author");
    const auto committer_ts = table.Column("committer_ts");
    const auto subject = table.Column("subject");
    while (table.Next(row)) {
      const auto keys = commit_keys.find(row[oid]);
      if (keys == commit_keys.end()) {
        continue;
      }
      EvidenceCommit commit{row[oid], row[author],
                            ToSigned(row[committer_ts]), row[subject]};
      for (const auto &key : keys->second) {
        changesets[key].commits.push_back(commit);
      }
    }
  }

  std::vector<EvidenceChangeset> evidence;
  evidence.reserve(shared.size());
  for (const auto &key : shared) {
    const auto found = changesets.find(key);
    if (found != changesets.end()) {
      evidence.push_back(std::move(found->second));
    }
  }
  return evidence;
}

} // namespace cochange
