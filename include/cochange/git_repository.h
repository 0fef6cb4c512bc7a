#pragma once

#include <cochange/interfaces.h>
#include <cochange/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cochange {

inline constexpr std::string_view kCommitMarker = "__COCHANGE_COMMIT__";
inline constexpr std::string_view kNumstatMarker = "__COCHANGE_NUMSTAT__";

// Argument vectors for the two history exports. Both select the same
// commits in the same oldest-first order so they can be read in lock-step.
std::vector<std::string> HistoryArguments(const MiningConfig &config,
                                          const std::string &git_binary);
std::vector<std::string> NumstatArguments(const MiningConfig &config,
                                          const std::string &git_binary);

// Parses `git ls-tree -r -l -z` output into path -> blob size.
HeadSizes ParseLsTree(const std::string &output);

class GitRepository : public RepositoryGateway {
public:
  explicit GitRepository(std::string git_binary = "git",
                         std::shared_ptr<Logger> logger = nullptr);

  void Verify(const MiningConfig &config) override;
  std::unique_ptr<ByteSource> OpenHistory(const MiningConfig &config) override;
  std::unique_ptr<ByteSource> OpenNumstat(const MiningConfig &config) override;
  HeadSizes HeadFileSizes(const MiningConfig &config) override;

private:
  std::string RunCapture(std::vector<std::string> arguments,
                         int timeout_seconds);

  std::string git_binary_;
  std::shared_ptr<Logger> logger_;
};

} // namespace cochange
