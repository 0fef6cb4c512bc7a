#pragma once

#include <cochange/interfaces.h>
#include <cochange/logging.h>
#include <cochange/mining_config.h>
#include <cochange/models.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cochange {

struct ParsedRecord {
  std::optional<Commit> commit;
  std::vector<ChangeEntry> entries;
  std::vector<ValidationIssue> issues;
  std::size_t total_tokens = 0;
  std::size_t invalid_tokens = 0;
};

bool IsStatusToken(const std::string &token);
bool IsObjectId(const std::string &token);
// Path tokens a well-formed export would rarely produce.
bool IsBorderlinePath(const std::string &token);

// Turns one raw commit record into a commit and its change entries. Every
// malformed entry is reported and dropped on its own; the rest of the record
// still parses.
class RecordParser {
public:
  explicit RecordParser(ValidationMode mode,
                        std::shared_ptr<Logger> logger = nullptr);

  ParsedRecord Parse(const RawRecord &record);

private:
  enum class State {
    kExpectMetadata,
    kExpectStatus,
    kExpectPath,
    kExpectOldPath,
    kExpectNewPath
  };

  struct Pending {
    ChangeStatus status = ChangeStatus::kModified;
    int similarity = 0;
    std::optional<std::string> old_path;
    bool borderline = false;
    bool discard = false;
  };

  void ParseMetadata();
  void Step(std::size_t index);
  void AcceptPath(std::size_t index);
  void Report(IssueReason reason, std::size_t index);
  void ResetEntry();

  ValidationMode mode_;
  std::shared_ptr<Logger> logger_;

  const RawRecord *record_ = nullptr;
  ParsedRecord result_;
  State state_ = State::kExpectMetadata;
  Pending pending_;
};

} // namespace cochange
