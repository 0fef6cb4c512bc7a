#include <cochange/mining_pipeline_builder.h>

#include <cochange/default_mining_pipeline.h>
#include <cochange/git_repository.h>

#include <utility>

namespace cochange {

MiningPipelineBuilder MiningPipelineBuilder::WithDefaults() {
  MiningPipelineBuilder builder;
  builder.WithLogger(std::make_shared<NullLogger>());
  builder.WithGateway(std::make_unique<GitRepository>(
      builder.git_binary_, builder.components_.logger));
  return builder;
}

MiningPipelineBuilder &
MiningPipelineBuilder::WithGateway(std::unique_ptr<RepositoryGateway> gateway) {
  components_.gateway = std::move(gateway);
  return *this;
}

MiningPipelineBuilder &
MiningPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

MiningPipelineBuilder &
MiningPipelineBuilder::WithOutputDirectory(std::filesystem::path directory) {
  components_.output_directory = std::move(directory);
  return *this;
}

MiningPipelineBuilder &
MiningPipelineBuilder::WithGitBinary(std::string git_binary) {
  git_binary_ = std::move(git_binary);
  return *this;
}

DefaultMiningPipeline MiningPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  components_.gateway =
      components_.gateway
          ? std::move(components_.gateway)
          : std::make_unique<GitRepository>(git_binary_, components_.logger);
  return DefaultMiningPipeline(std::move(components_));
}

} // namespace cochange
