#include <cochange/sparsifier.h>

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

namespace cochange {

double MetricValue(const Edge &edge, CouplingMetric metric) {
  switch (metric) {
  case CouplingMetric::kJaccard:
    return edge.jaccard;
  case CouplingMetric::kWeightedJaccard:
    return edge.weighted_jaccard;
  case CouplingMetric::kConditionalProbability:
    return edge.p_dst_given_src;
  }
  throw std::logic_error("Unhandled coupling metric");
}

Edge MakeEdge(FileId src, FileId dst, const CouplingStat &stat) {
  Edge edge;
  edge.src_file_id = src;
  edge.dst_file_id = dst;
  edge.pair_count = stat.pair_count;
  edge.weighted_pair_count = stat.weighted_pair_count;
  edge.jaccard = stat.Jaccard();
  edge.weighted_jaccard = stat.WeightedJaccard();
  edge.p_dst_given_src = stat.ProbabilityBGivenA();
  edge.p_src_given_dst = stat.ProbabilityAGivenB();
  return edge;
}

Sparsifier::Sparsifier(CouplingMetric metric, int min_cooccurrence,
                       int topk_edges)
    : metric_(metric) {
  if (min_cooccurrence < 1 || topk_edges < 1) {
    throw std::invalid_argument(
        "min_cooccurrence and topk_edges must be positive");
  }
  min_cooccurrence_ = static_cast<std::uint64_t>(min_cooccurrence);
  topk_edges_ = static_cast<std::size_t>(topk_edges);
}

std::vector<Edge> Sparsifier::Sparsify(const CouplingComputer &coupling,
                                       const EligibilityFilter &eligible) const {
  std::map<FileId, std::vector<Edge>> candidates;
  for (const auto &[pair, counts] : coupling.Pairs()) {
    if (counts.pair_count < min_cooccurrence_) {
      continue;
    }
    const auto [a, b] = pair;
    if (eligible && (!eligible(a) || !eligible(b))) {
      continue;
    }
    candidates[a].push_back(MakeEdge(a, b, coupling.Stat(a, b)));
    candidates[b].push_back(MakeEdge(b, a, coupling.Stat(b, a)));
  }

  std::vector<Edge> edges;
  for (auto &[src, neighbours] : candidates) {
    std::sort(neighbours.begin(), neighbours.end(),
              [this](const Edge &left, const Edge &right) {
                const auto left_score = MetricValue(left, metric_);
                const auto right_score = MetricValue(right, metric_);
                if (left_score != right_score) {
                  return left_score > right_score;
                }
                if (left.pair_count != right.pair_count) {
                  return left.pair_count > right.pair_count;
                }
                return left.dst_file_id < right.dst_file_id;
              });
    const auto keep = std::min(topk_edges_, neighbours.size());
    for (std::size_t i = 0; i < keep; ++i) {
      neighbours[i].rank = i + 1;
      edges.push_back(neighbours[i]);
    }
  }
  return edges;
}

std::string FolderOf(const std::string &path, int depth) {
  auto end = std::string::npos;
  std::size_t search = 0;
  for (int component = 0; component < depth; ++component) {
    const auto slash = path.find('/', search);
    if (slash == std::string::npos) {
      break;
    }
    end = slash;
    search = slash + 1;
  }
  return end == std::string::npos ? std::string(".") : path.substr(0, end);
}

std::vector<FolderEdge>
RollupFolders(const std::vector<Edge> &edges,
              const std::unordered_map<FileId, std::string> &paths, int depth) {
  struct Accumulated {
    std::uint64_t pair_count = 0;
    double weighted_pair_count = 0.0;
    double jaccard_sum = 0.0;
    std::size_t file_pairs = 0;
  };

  std::set<FilePair> seen;
  std::map<std::pair<std::string, std::string>, Accumulated> folders;
  for (const auto &edge : edges) {
    const FilePair pair{std::min(edge.src_file_id, edge.dst_file_id),
                        std::max(edge.src_file_id, edge.dst_file_id)};
    if (!seen.insert(pair).second) {
      continue;
    }
    const auto src_folder = FolderOf(paths.at(edge.src_file_id), depth);
    const auto dst_folder = FolderOf(paths.at(edge.dst_file_id), depth);
    if (src_folder == dst_folder) {
      continue;
    }
    auto &accumulated = folders[{std::min(src_folder, dst_folder),
                                 std::max(src_folder, dst_folder)}];
    accumulated.pair_count += edge.pair_count;
    accumulated.weighted_pair_count += edge.weighted_pair_count;
    accumulated.jaccard_sum += edge.jaccard;
    ++accumulated.file_pairs;
  }

  std::vector<FolderEdge> rolled;
  rolled.reserve(folders.size());
  for (const auto &[key, accumulated] : folders) {
    FolderEdge edge;
    edge.src_folder = key.first;
    edge.dst_folder = key.second;
    edge.depth = depth;
    edge.pair_count = accumulated.pair_count;
    edge.weighted_pair_count = accumulated.weighted_pair_count;
    edge.mean_jaccard =
        accumulated.jaccard_sum / static_cast<double>(accumulated.file_pairs);
    edge.file_pair_count = accumulated.file_pairs;
    rolled.push_back(std::move(edge));
  }
  return rolled;
}

} // namespace cochange
