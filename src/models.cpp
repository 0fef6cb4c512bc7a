#include <cochange/models.h>

#include <stdexcept>
#include <utility>

namespace cochange {
namespace {

double Ratio(double numerator, double denominator, const char *metric) {
  if (denominator <= 0.0) {
    throw std::logic_error(std::string("Zero denominator computing ") +
                           metric);
  }
  return numerator / denominator;
}

const std::pair<IssueReason, const char *> kIssueReasonNames[] = {
    {IssueReason::kInvalidCommitHeader, "invalid_commit_header"},
    {IssueReason::kTruncatedHeader, "truncated_header"},
    {IssueReason::kInvalidStatus, "invalid_status"},
    {IssueReason::kUnsupportedStatus, "unsupported_status"},
    {IssueReason::kMissingPath, "missing_path"},
    {IssueReason::kStatusAsPath, "status_as_path"},
    {IssueReason::kInvalidPath, "invalid_path"},
    {IssueReason::kBorderlinePath, "borderline_path"},
    {IssueReason::kIncompleteChange, "incomplete_change"},
    {IssueReason::kOrphanTokens, "orphan_tokens"}};

const std::pair<ChangeStatus, const char *> kStatusNames[] = {
    {ChangeStatus::kAdded, "added"},
    {ChangeStatus::kModified, "modified"},
    {ChangeStatus::kDeleted, "deleted"},
    {ChangeStatus::kRenamed, "renamed"},
    {ChangeStatus::kCopied, "copied"},
    {ChangeStatus::kTypeChanged, "type_changed"}};

} // namespace

const LineageInterval *FileIdentity::OpenInterval() const {
  for (const auto &interval : lineage) {
    if (interval.IsOpen()) {
      return &interval;
    }
  }
  return nullptr;
}

double CouplingStat::Jaccard() const {
  const auto denominator = static_cast<double>(a_total) +
                           static_cast<double>(b_total) -
                           static_cast<double>(pair_count);
  return Ratio(static_cast<double>(pair_count), denominator, "jaccard");
}

double CouplingStat::WeightedJaccard() const {
  const auto denominator =
      a_weighted_total + b_weighted_total - weighted_pair_count;
  return Ratio(weighted_pair_count, denominator, "weighted jaccard");
}

double CouplingStat::ProbabilityBGivenA() const {
  return Ratio(static_cast<double>(pair_count), static_cast<double>(a_total),
               "p(b|a)");
}

double CouplingStat::ProbabilityAGivenB() const {
  return Ratio(static_cast<double>(pair_count), static_cast<double>(b_total),
               "p(a|b)");
}

std::string ToString(ChangeStatus status) {
  for (const auto &[value, name] : kStatusNames) {
    if (value == status) {
      return name;
    }
  }
  return "unknown";
}

std::optional<ChangeStatus> ParseChangeStatus(const std::string &text) {
  for (const auto &[value, name] : kStatusNames) {
    if (text == name) {
      return value;
    }
  }
  return std::nullopt;
}

std::string ToString(IssueReason reason) {
  for (const auto &[value, name] : kIssueReasonNames) {
    if (value == reason) {
      return name;
    }
  }
  return "unknown";
}

std::optional<IssueReason> ParseIssueReason(const std::string &text) {
  for (const auto &[value, name] : kIssueReasonNames) {
    if (text == name) {
      return value;
    }
  }
  return std::nullopt;
}

} // namespace cochange
