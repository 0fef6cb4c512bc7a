#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace cochange {

class MiningError : public std::runtime_error {
public:
  explicit MiningError(const std::string &message,
                       std::string last_commit_boundary = "")
      : std::runtime_error(message),
        last_commit_boundary_(std::move(last_commit_boundary)) {}

  const std::string &LastCommitBoundary() const {
    return last_commit_boundary_;
  }
  void SetLastCommitBoundary(std::string oid) {
    last_commit_boundary_ = std::move(oid);
  }

private:
  std::string last_commit_boundary_;
};

class RepositoryUnavailable : public MiningError {
public:
  using MiningError::MiningError;
};

class HistoryExportFailed : public MiningError {
public:
  using MiningError::MiningError;
};

class MalformedRecordError : public MiningError {
public:
  using MiningError::MiningError;
};

class ArtifactWriteFailure : public MiningError {
public:
  using MiningError::MiningError;
};

class RunCancelled : public MiningError {
public:
  using MiningError::MiningError;
};

class IncompleteDataset : public MiningError {
public:
  using MiningError::MiningError;
};

} // namespace cochange
