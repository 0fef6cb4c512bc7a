#pragma once

#include <cochange/mining_config.h>
#include <cochange/models.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace cochange {

// Raw bytes of one export. Read returns 0 at end of stream; Finish reports
// how the producer ended and throws HistoryExportFailed if it failed.
class ByteSource {
public:
  virtual ~ByteSource() = default;
  virtual std::size_t Read(char *buffer, std::size_t size) = 0;
  virtual void Finish() = 0;
};

// Tokens of one commit block. first_cursor is the global position of
// tokens[0] in the export stream.
struct RawRecord {
  std::vector<std::string> tokens;
  std::size_t first_cursor = 0;
  bool has_marker = false;
};

class RecordSource {
public:
  virtual ~RecordSource() = default;
  virtual bool Next(RawRecord &record) = 0;
  virtual void Finish() = 0;
};

using HeadSizes = std::unordered_map<std::string, std::uint64_t>;

class RepositoryGateway {
public:
  virtual ~RepositoryGateway() = default;
  virtual void Verify(const MiningConfig &config) = 0;
  virtual std::unique_ptr<ByteSource> OpenHistory(const MiningConfig &config) = 0;
  virtual std::unique_ptr<ByteSource> OpenNumstat(const MiningConfig &config) = 0;
  virtual HeadSizes HeadFileSizes(const MiningConfig &config) = 0;
};

class CancellationToken {
public:
  void Cancel() { cancelled_.store(true); }
  bool IsCancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

class MiningPipeline {
public:
  virtual ~MiningPipeline() = default;
  virtual MiningResult Run(const MiningConfig &config,
                           const CancellationToken &cancel) = 0;
};

} // namespace cochange
