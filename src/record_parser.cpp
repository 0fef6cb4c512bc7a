#include <cochange/record_parser.h>

#include <cochange/errors.h>
#include <cochange/table_io.h>

#include <algorithm>
#include <cctype>
#include <string_view>
#include <utility>

namespace cochange {
namespace {

constexpr std::size_t kMetadataTokens = 7;
constexpr std::size_t kContextRadius = 2;

enum class StatusKind { kSingle, kPair, kUnsupported, kInvalid };

struct StatusToken {
  StatusKind kind = StatusKind::kInvalid;
  ChangeStatus status = ChangeStatus::kModified;
  int similarity = 0;
};

std::string_view StripLeadingNewlines(std::string_view token) {
  while (!token.empty() && (token.front() == '\n' || token.front() == '\r')) {
    token.remove_prefix(1);
  }
  return token;
}

bool AllDigits(std::string_view text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(), [](unsigned char character) {
           return std::isdigit(character) != 0;
         });
}

bool IsHex(std::string_view text, bool lowercase_only) {
  return std::all_of(text.begin(), text.end(), [&](unsigned char character) {
    if (std::isdigit(character) != 0) {
      return true;
    }
    if (character >= 'a' && character <= 'f') {
      return true;
    }
    return !lowercase_only && character >= 'A' && character <= 'F';
  });
}

StatusToken ClassifyStatus(std::string_view token) {
  StatusToken result;
  if (token.empty()) {
    return result;
  }
  if (token.size() == 1) {
    switch (token.front()) {
    case 'A':
      result = {StatusKind::kSingle, ChangeStatus::kAdded, 0};
      break;
    case 'M':
      result = {StatusKind::kSingle, ChangeStatus::kModified, 0};
      break;
    case 'D':
      result = {StatusKind::kSingle, ChangeStatus::kDeleted, 0};
      break;
    case 'T':
      result = {StatusKind::kSingle, ChangeStatus::kTypeChanged, 0};
      break;
    case 'U':
    case 'X':
    case 'B':
      result.kind = StatusKind::kUnsupported;
      break;
    default:
      break;
    }
    return result;
  }
  const auto score = token.substr(1);
  if ((token.front() == 'R' || token.front() == 'C') && score.size() <= 3 &&
      AllDigits(score)) {
    result.kind = StatusKind::kPair;
    result.status =
        token.front() == 'R' ? ChangeStatus::kRenamed : ChangeStatus::kCopied;
    result.similarity = std::stoi(std::string(score));
  }
  return result;
}

bool ParseTimestamp(const std::string &text, std::int64_t &value) {
  std::string_view digits = text;
  bool negative = false;
  if (!digits.empty() && digits.front() == '-') {
    negative = true;
    digits.remove_prefix(1);
  }
  if (!AllDigits(digits) || digits.size() > 18) {
    return false;
  }
  value = 0;
  for (const auto character : digits) {
    value = value * 10 + (character - '0');
  }
  if (negative) {
    value = -value;
  }
  return true;
}

int CountParents(const std::string &parents) {
  int count = 0;
  bool in_word = false;
  for (const auto character : parents) {
    if (character == ' ') {
      in_word = false;
      continue;
    }
    if (!in_word) {
      ++count;
      in_word = true;
    }
  }
  return count;
}

bool ParentsValid(const std::string &parents) {
  std::size_t start = 0;
  while (start <= parents.size()) {
    auto end = parents.find(' ', start);
    if (end == std::string::npos) {
      end = parents.size();
    }
    const auto word = parents.substr(start, end - start);
    if (!word.empty() && !IsObjectId(word)) {
      return false;
    }
    start = end + 1;
  }
  return true;
}

} // namespace

bool IsStatusToken(const std::string &token) {
  return ClassifyStatus(token).kind != StatusKind::kInvalid;
}

bool IsObjectId(const std::string &token) {
  return (token.size() == 40 || token.size() == 64) && IsHex(token, true);
}

bool IsBorderlinePath(const std::string &token) {
  if ((token.size() == 40 || token.size() == 64) && IsHex(token, false)) {
    return true;
  }
  if (token.size() >= 9 && token.size() <= 11 && AllDigits(token)) {
    return true;
  }
  const auto at = token.find('@');
  if (at != std::string::npos && at > 0 &&
      token.find('/') == std::string::npos &&
      token.find('.', at) != std::string::npos) {
    return true;
  }
  if (token.size() >= 2 && token.size() <= 5 &&
      std::string_view("AMDTUXBRC").find(token.front()) !=
          std::string_view::npos &&
      AllDigits(std::string_view(token).substr(1)) && !IsStatusToken(token)) {
    return true;
  }
  return false;
}

RecordParser::RecordParser(ValidationMode mode, std::shared_ptr<Logger> logger)
    : mode_(mode), logger_(EnsureLogger(std::move(logger))) {}

ParsedRecord RecordParser::Parse(const RawRecord &record) {
  record_ = &record;
  result_ = ParsedRecord{};
  state_ = State::kExpectMetadata;
  ResetEntry();
  result_.total_tokens = record.tokens.size() + (record.has_marker ? 1 : 0);

  if (!record.has_marker) {
    if (!record.tokens.empty()) {
      Report(IssueReason::kOrphanTokens, 0);
      result_.invalid_tokens = result_.total_tokens;
    }
    return std::move(result_);
  }

  ParseMetadata();
  if (!result_.commit) {
    result_.invalid_tokens = result_.total_tokens;
    return std::move(result_);
  }

  for (std::size_t index = kMetadataTokens; index < record.tokens.size();
       ++index) {
    Step(index);
  }
  if (state_ != State::kExpectStatus) {
    Report(IssueReason::kIncompleteChange, record.tokens.size() - 1);
  }
  return std::move(result_);
}

void RecordParser::ParseMetadata() {
  const auto &tokens = record_->tokens;
  if (tokens.size() < kMetadataTokens) {
    Report(IssueReason::kTruncatedHeader,
           tokens.empty() ? 0 : tokens.size() - 1);
    return;
  }

  Commit commit;
  commit.oid = tokens[0];
  if (!IsObjectId(commit.oid)) {
    Report(IssueReason::kInvalidCommitHeader, 0);
    return;
  }
  if (!ParentsValid(tokens[1])) {
    Report(IssueReason::kInvalidCommitHeader, 1);
    return;
  }
  if (!ParseTimestamp(tokens[4], commit.authored_ts)) {
    Report(IssueReason::kInvalidCommitHeader, 4);
    return;
  }
  if (!ParseTimestamp(tokens[5], commit.committer_ts)) {
    Report(IssueReason::kInvalidCommitHeader, 5);
    return;
  }
  commit.parent_count = CountParents(tokens[1]);
  commit.author = tokens[2];
  commit.author_email = tokens[3];
  commit.subject = tokens[6];
  result_.commit = std::move(commit);
  state_ = State::kExpectStatus;
}

void RecordParser::Step(std::size_t index) {
  switch (state_) {
  case State::kExpectMetadata:
    break;
  case State::kExpectStatus: {
    const auto token = StripLeadingNewlines(record_->tokens[index]);
    if (token.empty()) {
      break;
    }
    const auto status = ClassifyStatus(token);
    switch (status.kind) {
    case StatusKind::kSingle:
      pending_.status = status.status;
      state_ = State::kExpectPath;
      break;
    case StatusKind::kPair:
      pending_.status = status.status;
      pending_.similarity = status.similarity;
      state_ = State::kExpectOldPath;
      break;
    case StatusKind::kUnsupported:
      Report(IssueReason::kUnsupportedStatus, index);
      pending_.discard = true;
      state_ = State::kExpectPath;
      break;
    case StatusKind::kInvalid:
      Report(IssueReason::kInvalidStatus, index);
      break;
    }
    break;
  }
  case State::kExpectPath:
  case State::kExpectOldPath:
  case State::kExpectNewPath:
    AcceptPath(index);
    break;
  }
}

void RecordParser::AcceptPath(std::size_t index) {
  const auto &token = record_->tokens[index];
  if (token.empty()) {
    Report(IssueReason::kMissingPath, index);
    ResetEntry();
    state_ = State::kExpectStatus;
    return;
  }
  if (IsStatusToken(token)) {
    Report(IssueReason::kStatusAsPath, index);
    ResetEntry();
    state_ = State::kExpectStatus;
    Step(index);
    return;
  }
  if (IsBorderlinePath(token)) {
    switch (mode_) {
    case ValidationMode::kStrict:
    case ValidationMode::kSoft:
      Report(IssueReason::kBorderlinePath, index);
      pending_.discard = true;
      break;
    case ValidationMode::kPermissive:
      pending_.borderline = true;
      logger_->Log(LogLevel::kDebug, "parser.borderline_accepted",
                   {{"commit", result_.commit->oid}, {"path", token}});
      break;
    }
  }

  if (state_ == State::kExpectOldPath) {
    pending_.old_path = token;
    state_ = State::kExpectNewPath;
    return;
  }

  if (!pending_.discard) {
    ChangeEntry entry;
    entry.commit_oid = result_.commit->oid;
    entry.status = pending_.status;
    entry.new_path = token;
    entry.old_path = pending_.old_path;
    entry.similarity = pending_.similarity;
    entry.borderline = pending_.borderline;
    result_.entries.push_back(std::move(entry));
  }
  ResetEntry();
  state_ = State::kExpectStatus;
}

void RecordParser::Report(IssueReason reason, std::size_t index) {
  const auto &tokens = record_->tokens;
  ValidationIssue issue;
  issue.reason = reason;
  issue.commit_oid = result_.commit ? result_.commit->oid : std::string();
  if (issue.commit_oid.empty() && record_->has_marker && !tokens.empty()) {
    issue.commit_oid = tokens.front();
  }
  issue.raw_token = index < tokens.size() ? tokens[index] : std::string();
  issue.cursor_position = record_->first_cursor + index;
  const auto first = index >= kContextRadius ? index - kContextRadius : 0;
  const auto last = std::min(tokens.size(), index + kContextRadius + 1);
  for (auto position = first; position < last; ++position) {
    if (position != index) {
      issue.surrounding_context.push_back(tokens[position]);
    }
  }
  ++result_.invalid_tokens;

  logger_->Log(LogLevel::kDebug, "parser.issue",
               {{"reason", ToString(reason)},
                {"commit", issue.commit_oid},
                {"token", issue.raw_token},
                {"cursor", std::to_string(issue.cursor_position)}});

  if (mode_ == ValidationMode::kStrict) {
    throw MalformedRecordError("Malformed record (" + ToString(reason) +
                               ") at token " +
                               std::to_string(issue.cursor_position) + ": " +
                               EscapeField(issue.raw_token));
  }
  result_.issues.push_back(std::move(issue));
}

void RecordParser::ResetEntry() { pending_ = Pending{}; }

} // namespace cochange
