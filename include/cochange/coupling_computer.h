#pragma once

#include <cochange/models.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cochange {

struct PairCounts {
  std::uint64_t pair_count = 0;
  double weighted_pair_count = 0.0;
};

struct FileTotals {
  std::uint64_t total = 0;
  double weighted_total = 0.0;
};

using FilePair = std::pair<FileId, FileId>;

// Co-change counters over unordered file pairs, keyed (smaller, larger).
// Accumulators over disjoint changeset slices merge into the same result.
class CouplingComputer {
public:
  void Accumulate(const Changeset &changeset);
  void Merge(const CouplingComputer &other);

  CouplingStat Stat(FileId a, FileId b) const;
  FileTotals Totals(FileId file_id) const;

  const std::map<FilePair, PairCounts> &Pairs() const { return pairs_; }
  const std::unordered_map<FileId, FileTotals> &AllTotals() const {
    return totals_;
  }
  std::size_t ChangesetsAccumulated() const { return changesets_; }

private:
  std::map<FilePair, PairCounts> pairs_;
  std::unordered_map<FileId, FileTotals> totals_;
  std::size_t changesets_ = 0;
};

// Splits a batch into worker_threads contiguous slices, accumulates each on
// its own thread and merges them in slice order into target.
void AccumulateSharded(const std::vector<Changeset> &batch, int worker_threads,
                       CouplingComputer &target);

} // namespace cochange
