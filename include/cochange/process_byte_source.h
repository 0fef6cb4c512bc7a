#pragma once

#include <cochange/interfaces.h>
#include <cochange/logging.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace cochange {

// Runs a child process and exposes its stdout. stderr is captured into a
// bounded buffer and reported when the child fails.
class ProcessByteSource : public ByteSource {
public:
  ProcessByteSource(std::vector<std::string> arguments, int timeout_seconds,
                    std::shared_ptr<Logger> logger = nullptr);
  ~ProcessByteSource() override;

  ProcessByteSource(const ProcessByteSource &) = delete;
  ProcessByteSource &operator=(const ProcessByteSource &) = delete;

  std::size_t Read(char *buffer, std::size_t size) override;
  void Finish() override;

  const std::string &ErrorOutput() const { return stderr_; }

private:
  static constexpr std::size_t kMaxErrorOutput = 16 * 1024;

  void Start();
  void DrainErrorOutput();
  void CloseDescriptors();
  int Wait();
  void Kill();
  std::string CommandLine() const;

  std::vector<std::string> arguments_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  std::shared_ptr<Logger> logger_;
  pid_t pid_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  bool finished_ = false;
  bool timed_out_ = false;
  std::string stderr_;
};

// In-memory byte source, handed out in small chunks.
class StringByteSource : public ByteSource {
public:
  explicit StringByteSource(std::string data, std::size_t chunk_size = 4096);

  std::size_t Read(char *buffer, std::size_t size) override;
  void Finish() override;

  void FailOnFinish(std::string message) { failure_ = std::move(message); }

private:
  std::string data_;
  std::size_t chunk_size_;
  std::size_t offset_ = 0;
  std::optional<std::string> failure_;
};

} // namespace cochange
