#pragma once

#include <cochange/mining_pipeline_builder.h>

#include <filesystem>
#include <memory>
#include <optional>

namespace cochange {

class DefaultMiningPipeline : public MiningPipeline {
public:
  explicit DefaultMiningPipeline(MiningComponents components);

  MiningResult Run(const MiningConfig &config,
                   const CancellationToken &cancel) override;

private:
  std::unique_ptr<RepositoryGateway> gateway_;
  std::shared_ptr<Logger> logger_;
  std::optional<std::filesystem::path> output_directory_;
};

} // namespace cochange
