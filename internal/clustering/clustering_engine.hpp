#pragma once

#include <functional>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "rnaflow/pipeline/v1/state.pb.h"

namespace rnaflow::clustering {

using CoordinateLoader = std::function<Eigen::Matrix3Xd(const std::string& structure_path)>;

struct ClusteringOptions {
  double                   rmsd_threshold = 5.0;
  std::vector<std::string> atom_names{"C3'", "P"};
};

/*
  Single-linkage clustering of one ensemble by backbone RMSD.

  Only successful members take part. Pairs are visited in ascending RMSD
  order and two clusters merge when any cross pair is below the threshold.
  The representative of a cluster is its medoid (lowest mean RMSD to the
  other members), ties going to the lowest seed index. Clusters come out
  by descending population, then ascending representative seed index, and
  reference members by index into the ensemble.

  A single successful member yields one singleton cluster without any RMSD
  computation. Differing atom counts between members throw
  util::ClusteringInputError.
*/
class ClusteringEngine {
 public:
  explicit ClusteringEngine(ClusteringOptions options, CoordinateLoader loader = {});

  std::vector<rnaflow::pipeline::v1::StructureCluster> Cluster(const rnaflow::pipeline::v1::EnsembleResult& ensemble) const;

 private:
  ClusteringOptions options_;
  CoordinateLoader  loader_;
};

} // namespace rnaflow::clustering
