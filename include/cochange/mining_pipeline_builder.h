#pragma once

#include <cochange/interfaces.h>
#include <cochange/logging.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace cochange {

class DefaultMiningPipeline;

struct MiningComponents {
  std::unique_ptr<RepositoryGateway> gateway;
  std::shared_ptr<Logger> logger;
  // Replaces MiningConfig::output when set.
  std::optional<std::filesystem::path> output_directory;
};

class MiningPipelineBuilder {
public:
  MiningPipelineBuilder() = default;

  MiningPipelineBuilder &
  WithGateway(std::unique_ptr<RepositoryGateway> gateway);
  MiningPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  MiningPipelineBuilder &WithOutputDirectory(std::filesystem::path directory);
  MiningPipelineBuilder &WithGitBinary(std::string git_binary);

  DefaultMiningPipeline Build();

  static MiningPipelineBuilder WithDefaults();

private:
  std::string git_binary_ = "git";
  MiningComponents components_;
};

} // namespace cochange
