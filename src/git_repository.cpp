#include <cochange/git_repository.h>

#include <cochange/errors.h>
#include <cochange/process_byte_source.h>

#include <system_error>
#include <utility>

namespace cochange {
namespace {

std::vector<std::string> LogArguments(const MiningConfig &config,
                                      const std::string &git_binary) {
  std::vector<std::string> arguments = {git_binary,
                                        "-C",
                                        config.repository.string(),
                                        "log",
                                        "--reverse",
                                        "--date-order",
                                        "-z",
                                        "--find-renames=" +
                                            std::to_string(
                                                config.find_renames_threshold) +
                                            "%"};
  if (config.skip_merge_commits) {
    arguments.push_back("--no-merges");
  }
  if (config.first_parent_only) {
    arguments.push_back("--first-parent");
  }
  if (config.since) {
    arguments.push_back("--since=" + *config.since);
  }
  if (config.until) {
    arguments.push_back("--until=" + *config.until);
  }
  return arguments;
}

void AppendRange(const MiningConfig &config,
                 std::vector<std::string> &arguments) {
  if (config.all_refs) {
    arguments.push_back("--all");
  } else if (config.since_commit) {
    arguments.push_back(*config.since_commit + ".." + config.ref);
  } else {
    arguments.push_back(config.ref);
  }
  arguments.push_back("--");
}

} // namespace

std::vector<std::string> HistoryArguments(const MiningConfig &config,
                                          const std::string &git_binary) {
  auto arguments = LogArguments(config, git_binary);
  arguments.push_back("--name-status");
  arguments.push_back("--pretty=format:" + std::string(kCommitMarker) +
                      "%x00%H%x00%P%x00%an%x00%ae%x00%at%x00%ct%x00%s%x00");
  AppendRange(config, arguments);
  return arguments;
}

std::vector<std::string> NumstatArguments(const MiningConfig &config,
                                          const std::string &git_binary) {
  auto arguments = LogArguments(config, git_binary);
  arguments.push_back("--numstat");
  arguments.push_back("--pretty=format:" + std::string(kNumstatMarker) +
                      "%x00%H%x00");
  AppendRange(config, arguments);
  return arguments;
}

HeadSizes ParseLsTree(const std::string &output) {
  HeadSizes sizes;
  std::size_t start = 0;
  while (start < output.size()) {
    auto end = output.find('\0', start);
    if (end == std::string::npos) {
      end = output.size();
    }
    const auto entry = output.substr(start, end - start);
    start = end + 1;

    const auto tab = entry.find('\t');
    if (tab == std::string::npos) {
      continue;
    }
    const auto header = entry.substr(0, tab);
    const auto path = entry.substr(tab + 1);
    const auto size_start = header.find_last_of(' ');
    if (size_start == std::string::npos) {
      continue;
    }
    auto size_text = header.substr(size_start + 1);
    if (size_text.empty() || size_text == "-") {
      continue;
    }
    sizes[path] = std::stoull(size_text);
  }
  return sizes;
}

GitRepository::GitRepository(std::string git_binary,
                             std::shared_ptr<Logger> logger)
    : git_binary_(std::move(git_binary)),
      logger_(EnsureLogger(std::move(logger))) {}

void GitRepository::Verify(const MiningConfig &config) {
  std::error_code error;
  if (!std::filesystem::is_directory(config.repository, error)) {
    throw RepositoryUnavailable("Repository location does not exist: " +
                                config.repository.string());
  }
  try {
    RunCapture({git_binary_, "-C", config.repository.string(), "rev-parse",
                "--git-dir"},
               config.export_timeout_seconds);
  } catch (const HistoryExportFailed &failure) {
    throw RepositoryUnavailable("Not a git repository: " +
                                config.repository.string() + " (" +
                                failure.what() + ")");
  }
  logger_->Log(LogLevel::kDebug, "repository.verified",
               {{"repository", config.repository.string()}});
}

std::unique_ptr<ByteSource>
GitRepository::OpenHistory(const MiningConfig &config) {
  return std::make_unique<ProcessByteSource>(
      HistoryArguments(config, git_binary_), config.export_timeout_seconds,
      logger_);
}

std::unique_ptr<ByteSource>
GitRepository::OpenNumstat(const MiningConfig &config) {
  return std::make_unique<ProcessByteSource>(
      NumstatArguments(config, git_binary_), config.export_timeout_seconds,
      logger_);
}

HeadSizes GitRepository::HeadFileSizes(const MiningConfig &config) {
  const auto tree = config.all_refs ? std::string("HEAD") : config.ref;
  return ParseLsTree(RunCapture({git_binary_, "-C",
                                 config.repository.string(), "ls-tree", "-r",
                                 "-l", "-z", tree},
                                config.export_timeout_seconds));
}

std::string GitRepository::RunCapture(std::vector<std::string> arguments,
                                      int timeout_seconds) {
  ProcessByteSource source(std::move(arguments), timeout_seconds, logger_);
  std::string output;
  char buffer[64 * 1024];
  while (const auto count = source.Read(buffer, sizeof(buffer))) {
    output.append(buffer, count);
  }
  source.Finish();
  return output;
}

} // namespace cochange
