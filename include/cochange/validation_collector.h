#pragma once

#include <cochange/models.h>
#include <cochange/record_parser.h>

#include <cstddef>
#include <map>
#include <vector>

namespace cochange {

struct ValidationSummary {
  std::size_t total_tokens = 0;
  std::size_t invalid_tokens = 0;
  std::size_t identity_inconsistencies = 0;
  std::size_t total_issues = 0;
  std::map<IssueReason, std::size_t> issue_counts;
  std::vector<ValidationIssue> samples;

  // 1 - (invalid tokens + identity inconsistencies) / total tokens, clamped
  // to [0, 1]. A run without tokens scores 1.
  double QualityScore() const;
};

// Counts every issue; keeps only the first max_samples for inspection.
class ValidationCollector {
public:
  explicit ValidationCollector(std::size_t max_samples);

  void Add(const ParsedRecord &record);
  void AddIssue(ValidationIssue issue);
  void RecordInconsistency() { ++summary_.identity_inconsistencies; }

  const ValidationSummary &Summary() const { return summary_; }

private:
  std::size_t max_samples_;
  ValidationSummary summary_;
};

} // namespace cochange
