#pragma once

#include <cochange/coupling_computer.h>
#include <cochange/mining_config.h>
#include <cochange/models.h>

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cochange {

double MetricValue(const Edge &edge, CouplingMetric metric);
Edge MakeEdge(FileId src, FileId dst, const CouplingStat &stat);

// Keeps the strongest topk_edges neighbours of every file. Retention is per
// source, so a->b may survive while b->a does not.
class Sparsifier {
public:
  using EligibilityFilter = std::function<bool(FileId)>;

  Sparsifier(CouplingMetric metric, int min_cooccurrence, int topk_edges);

  std::vector<Edge> Sparsify(const CouplingComputer &coupling,
                             const EligibilityFilter &eligible = {}) const;

private:
  CouplingMetric metric_;
  std::uint64_t min_cooccurrence_;
  std::size_t topk_edges_;
};

// First `depth` directory components of a path; "." for top-level files.
std::string FolderOf(const std::string &path, int depth);

std::vector<FolderEdge>
RollupFolders(const std::vector<Edge> &edges,
              const std::unordered_map<FileId, std::string> &paths, int depth);

} // namespace cochange
