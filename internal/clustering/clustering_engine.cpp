#include "clustering_engine.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <tuple>

#include "internal/clustering/rmsd.hpp"
#include "internal/observability/logging.hpp"
#include "internal/structure/structure_reader.hpp"
#include "internal/util/errors.hpp"

namespace rnaflow::clustering {

using rnaflow::observability::DoubleField;
using rnaflow::observability::IntField;
using rnaflow::observability::StringField;
using rnaflow::pipeline::v1::EnsembleResult;
using rnaflow::pipeline::v1::StructureCluster;

namespace {

class DisjointSet {
 public:
  explicit DisjointSet(std::size_t size) : parent_(size) {
    std::iota(parent_.begin(), parent_.end(), 0);
  }

  std::size_t Find(std::size_t x) {
    while (parent_[x] != x) {
      parent_[x] = parent_[parent_[x]];
      x          = parent_[x];
    }
    return x;
  }

  // The smaller root survives so that component roots are stable.
  void Union(std::size_t a, std::size_t b) {
    a = Find(a);
    b = Find(b);
    if (a == b) return;
    if (b < a) std::swap(a, b);
    parent_[b] = a;
  }

 private:
  std::vector<std::size_t> parent_;
};

} // namespace

ClusteringEngine::ClusteringEngine(ClusteringOptions options, CoordinateLoader loader)
    : options_(std::move(options)), loader_(std::move(loader)) {
  if (!loader_) {
    loader_ = [atoms = options_.atom_names](const std::string& path) { return structure::LoadBackbone(path, atoms); };
  }
}

std::vector<StructureCluster> ClusteringEngine::Cluster(const EnsembleResult& ensemble) const {
  // Successful members, ordered by seed index; values index ensemble.members().
  std::vector<int> usable;
  for (int i = 0; i < ensemble.members_size(); ++i) {
    const auto& member = ensemble.members(i);
    if (!member.failed() && !member.structure_path().empty()) {
      usable.push_back(i);
    }
  }
  std::sort(usable.begin(), usable.end(),
            [&](int a, int b) { return ensemble.members(a).seed_index() < ensemble.members(b).seed_index(); });

  std::vector<StructureCluster> clusters;
  if (usable.empty()) {
    return clusters;
  }
  if (usable.size() == 1) {
    StructureCluster cluster;
    cluster.set_cluster_id(1);
    cluster.set_representative(usable.front());
    cluster.add_member_indices(usable.front());
    cluster.mutable_stats();
    clusters.push_back(std::move(cluster));
    return clusters;
  }

  const std::size_t n = usable.size();
  std::vector<Eigen::Matrix3Xd> coords;
  coords.reserve(n);
  for (auto index : usable) {
    coords.push_back(loader_(ensemble.members(index).structure_path()));
  }
  for (std::size_t i = 1; i < n; ++i) {
    if (coords[i].cols() != coords[0].cols()) {
      throw util::ClusteringInputError(ensemble.backend() + ": seed " + std::to_string(ensemble.members(usable[i]).seed_index()) + " has " +
                                       std::to_string(coords[i].cols()) + " backbone atoms, seed " +
                                       std::to_string(ensemble.members(usable[0]).seed_index()) + " has " +
                                       std::to_string(coords[0].cols()));
    }
  }

  Eigen::MatrixXd rmsd = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(n));
  std::vector<std::tuple<double, std::size_t, std::size_t>> pairs;
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      double value = KabschRmsd(coords[i], coords[j]);
      rmsd(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = value;
      rmsd(static_cast<Eigen::Index>(j), static_cast<Eigen::Index>(i)) = value;
      pairs.emplace_back(value, i, j);
    }
  }
  std::sort(pairs.begin(), pairs.end());

  DisjointSet sets(n);
  for (const auto& [value, i, j] : pairs) {
    if (value < options_.rmsd_threshold) {
      sets.Union(i, j);
    }
  }

  std::map<std::size_t, std::vector<std::size_t>> groups;
  for (std::size_t i = 0; i < n; ++i) {
    groups[sets.Find(i)].push_back(i);
  }

  for (const auto& [root, local] : groups) {
    StructureCluster cluster;

    std::size_t best       = local.front();
    double      best_mean  = 0.0;
    double      sum        = 0.0;
    double      max        = 0.0;
    int         pair_count = 0;
    for (std::size_t a = 0; a < local.size(); ++a) {
      double member_sum = 0.0;
      for (std::size_t b = 0; b < local.size(); ++b) {
        if (a == b) continue;
        double value = rmsd(static_cast<Eigen::Index>(local[a]), static_cast<Eigen::Index>(local[b]));
        member_sum += value;
        if (a < b) {
          sum += value;
          max = std::max(max, value);
          ++pair_count;
        }
      }
      double mean = local.size() > 1 ? member_sum / static_cast<double>(local.size() - 1) : 0.0;
      // `local` is in seed order, so a strict comparison keeps the lowest seed on ties.
      if (a == 0 || mean < best_mean) {
        best      = local[a];
        best_mean = mean;
      }
      cluster.add_member_indices(usable[local[a]]);
    }

    cluster.set_representative(usable[best]);
    auto* stats = cluster.mutable_stats();
    stats->set_mean_rmsd(pair_count > 0 ? sum / pair_count : 0.0);
    stats->set_max_rmsd(max);
    stats->set_representative_mean_rmsd(best_mean);
    clusters.push_back(std::move(cluster));
  }

  std::sort(clusters.begin(), clusters.end(), [&](const StructureCluster& a, const StructureCluster& b) {
    if (a.member_indices_size() != b.member_indices_size()) {
      return a.member_indices_size() > b.member_indices_size();
    }
    return ensemble.members(a.representative()).seed_index() < ensemble.members(b.representative()).seed_index();
  });
  for (std::size_t i = 0; i < clusters.size(); ++i) {
    clusters[i].set_cluster_id(static_cast<int>(i) + 1);
  }

  RNAFLOW_LOG_INFO("Clustered ensemble", {StringField("backend", ensemble.backend()), IntField("structures", static_cast<std::int64_t>(n)),
                                          IntField("clusters", static_cast<std::int64_t>(clusters.size())),
                                          DoubleField("threshold", options_.rmsd_threshold)});
  return clusters;
}

} // namespace rnaflow::clustering
