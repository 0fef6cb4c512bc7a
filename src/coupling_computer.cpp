#include <cochange/coupling_computer.h>

#include <algorithm>
#include <future>
#include <stdexcept>

namespace cochange {

void CouplingComputer::Accumulate(const Changeset &changeset) {
  if (changeset.excluded_from_coupling || changeset.files.empty()) {
    return;
  }
  ++changesets_;
  const auto &files = changeset.files;
  const auto weight = 1.0 / static_cast<double>(files.size());
  for (const auto file_id : files) {
    auto &totals = totals_[file_id];
    ++totals.total;
    totals.weighted_total += weight;
  }
  for (std::size_t i = 0; i < files.size(); ++i) {
    for (std::size_t j = i + 1; j < files.size(); ++j) {
      const auto a = std::min(files[i], files[j]);
      const auto b = std::max(files[i], files[j]);
      auto &counts = pairs_[{a, b}];
      ++counts.pair_count;
      counts.weighted_pair_count += weight;
    }
  }
}

void CouplingComputer::Merge(const CouplingComputer &other) {
  for (const auto &[file_id, totals] : other.totals_) {
    auto &merged = totals_[file_id];
    merged.total += totals.total;
    merged.weighted_total += totals.weighted_total;
  }
  for (const auto &[pair, counts] : other.pairs_) {
    auto &merged = pairs_[pair];
    merged.pair_count += counts.pair_count;
    merged.weighted_pair_count += counts.weighted_pair_count;
  }
  changesets_ += other.changesets_;
}

FileTotals CouplingComputer::Totals(FileId file_id) const {
  const auto found = totals_.find(file_id);
  return found == totals_.end() ? FileTotals{} : found->second;
}

CouplingStat CouplingComputer::Stat(FileId a, FileId b) const {
  if (a == b) {
    throw std::invalid_argument("Coupling of a file with itself");
  }
  CouplingStat stat;
  const auto found = pairs_.find({std::min(a, b), std::max(a, b)});
  if (found != pairs_.end()) {
    stat.pair_count = found->second.pair_count;
    stat.weighted_pair_count = found->second.weighted_pair_count;
  }
  const auto a_totals = Totals(a);
  const auto b_totals = Totals(b);
  stat.a_total = a_totals.total;
  stat.b_total = b_totals.total;
  stat.a_weighted_total = a_totals.weighted_total;
  stat.b_weighted_total = b_totals.weighted_total;
  return stat;
}

void AccumulateSharded(const std::vector<Changeset> &batch, int worker_threads,
                       CouplingComputer &target) {
  const auto shards = static_cast<std::size_t>(std::max(1, worker_threads));
  if (shards == 1 || batch.size() < 2) {
    for (const auto &changeset : batch) {
      target.Accumulate(changeset);
    }
    return;
  }

  const auto slice = (batch.size() + shards - 1) / shards;
  std::vector<std::future<CouplingComputer>> pending;
  for (std::size_t begin = 0; begin < batch.size(); begin += slice) {
    const auto end = std::min(batch.size(), begin + slice);
    pending.push_back(std::async(std::launch::async, [&batch, begin, end]() {
      CouplingComputer partial;
      for (auto i = begin; i < end; ++i) {
        partial.Accumulate(batch[i]);
      }
      return partial;
    }));
  }
  for (auto &future : pending) {
    target.Merge(future.get());
  }
}

} // namespace cochange
