#include <cochange/validation_collector.h>

#include <algorithm>
#include <utility>

namespace cochange {

double ValidationSummary::QualityScore() const {
  if (total_tokens == 0) {
    return 1.0;
  }
  const auto penalty = static_cast<double>(invalid_tokens) +
                       static_cast<double>(identity_inconsistencies);
  const auto score = 1.0 - penalty / static_cast<double>(total_tokens);
  return std::clamp(score, 0.0, 1.0);
}

ValidationCollector::ValidationCollector(std::size_t max_samples)
    : max_samples_(max_samples) {}

void ValidationCollector::Add(const ParsedRecord &record) {
  summary_.total_tokens += record.total_tokens;
  summary_.invalid_tokens += record.invalid_tokens;
  for (const auto &issue : record.issues) {
    AddIssue(issue);
  }
}

void ValidationCollector::AddIssue(ValidationIssue issue) {
  ++summary_.total_issues;
  ++summary_.issue_counts[issue.reason];
  if (summary_.samples.size() < max_samples_) {
    summary_.samples.push_back(std::move(issue));
  }
}

} // namespace cochange
