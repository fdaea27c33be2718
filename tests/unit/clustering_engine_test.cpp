#include "internal/clustering/clustering_engine.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <set>

#include "internal/clustering/rmsd.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using rnaflow::clustering::ClusteringEngine;
using rnaflow::clustering::ClusteringOptions;
using rnaflow::clustering::CoordinateLoader;
using rnaflow::pipeline::v1::EnsembleResult;

struct Library {
  std::map<std::string, Eigen::Matrix3Xd> structures;
  int                                     loads = 0;

  CoordinateLoader Loader() {
    return [this](const std::string& path) {
      ++loads;
      return structures.at(path);
    };
  }
};

void AddMember(EnsembleResult& ensemble, Library& library, int seed_index, const Eigen::Matrix3Xd& coords, bool failed = false) {
  auto* member = ensemble.add_members();
  member->set_backend("rhofold");
  member->set_seed_index(seed_index);
  if (failed) {
    member->set_failed(true);
    member->set_failure("exit code 1");
    return;
  }
  const auto path = "seed_" + std::to_string(seed_index) + ".pdb";
  member->set_structure_path(path);
  library.structures[path] = coords;
}

ClusteringOptions Options(double threshold) {
  ClusteringOptions options;
  options.rmsd_threshold = threshold;
  return options;
}

void TestSingleMemberIsSingletonWithoutLoading() {
  Library        library;
  EnsembleResult ensemble;
  ensemble.set_backend("rhofold");
  AddMember(ensemble, library, 0, rnaflow::testing::Helix(10));
  AddMember(ensemble, library, 1, {}, true);

  auto clusters = ClusteringEngine(Options(5.0), library.Loader()).Cluster(ensemble);
  assert(clusters.size() == 1);
  assert(clusters[0].cluster_id() == 1);
  assert(clusters[0].representative() == 0);
  assert(clusters[0].member_indices_size() == 1);
  assert(clusters[0].stats().mean_rmsd() == 0.0);
  assert(library.loads == 0);
}

void TestNoUsableMembers() {
  Library        library;
  EnsembleResult ensemble;
  AddMember(ensemble, library, 0, {}, true);
  assert(ClusteringEngine(Options(5.0), library.Loader()).Cluster(ensemble).empty());
}

void TestTwoShapesGiveTwoClusters() {
  Library        library;
  EnsembleResult ensemble;
  ensemble.set_backend("rhofold");
  // Three rotated copies of one helix, two of a stretched one; seed 2 failed.
  AddMember(ensemble, library, 0, rnaflow::testing::Helix(16, 2.0, 0.0));
  AddMember(ensemble, library, 1, rnaflow::testing::Helix(16, 1.0, 0.4));
  AddMember(ensemble, library, 2, {}, true);
  AddMember(ensemble, library, 3, rnaflow::testing::Helix(16, 1.0, 1.1));
  AddMember(ensemble, library, 4, rnaflow::testing::Helix(16, 2.0, 2.0));
  AddMember(ensemble, library, 5, rnaflow::testing::Helix(16, 1.0, 3.0));

  auto clusters = ClusteringEngine(Options(2.0), library.Loader()).Cluster(ensemble);
  assert(clusters.size() == 2);

  // Largest first; the identical members tie, so the lowest seed represents.
  assert(clusters[0].cluster_id() == 1);
  assert(clusters[0].member_indices_size() == 3);
  assert(ensemble.members(clusters[0].representative()).seed_index() == 1);
  assert(clusters[0].stats().max_rmsd() < 1e-6);

  assert(clusters[1].cluster_id() == 2);
  assert(clusters[1].member_indices_size() == 2);
  assert(ensemble.members(clusters[1].representative()).seed_index() == 0);

  int covered = 0;
  for (const auto& cluster : clusters) {
    for (auto index : cluster.member_indices()) {
      assert(!ensemble.members(index).failed());
      ++covered;
    }
  }
  assert(covered == 5);
}

void TestSingleLinkageChainsNeighbours() {
  Library        library;
  EnsembleResult ensemble;
  // 0-1 and 1-2 are close, 0-2 is not: single linkage still joins all three.
  AddMember(ensemble, library, 0, rnaflow::testing::Helix(12, 1.00));
  AddMember(ensemble, library, 1, rnaflow::testing::Helix(12, 1.06));
  AddMember(ensemble, library, 2, rnaflow::testing::Helix(12, 1.12));

  auto         full    = ClusteringEngine(Options(100.0), library.Loader()).Cluster(ensemble);
  const double spread  = full[0].stats().max_rmsd();
  const double step    = rnaflow::clustering::KabschRmsd(library.structures.at("seed_0.pdb"), library.structures.at("seed_1.pdb"));
  const double between = (step + spread) / 2.0;
  assert(step < spread);

  auto clusters = ClusteringEngine(Options(between), library.Loader()).Cluster(ensemble);
  assert(clusters.size() == 1);
  assert(clusters[0].member_indices_size() == 3);
  // The middle structure is the medoid.
  assert(ensemble.members(clusters[0].representative()).seed_index() == 1);
}

void TestHighThresholdMergesEverythingAndTinyThresholdSplits() {
  Library        library;
  EnsembleResult ensemble;
  for (int seed = 0; seed < 4; ++seed) {
    AddMember(ensemble, library, seed, rnaflow::testing::Helix(10, 1.0 + 0.5 * seed));
  }
  assert(ClusteringEngine(Options(1000.0), library.Loader()).Cluster(ensemble).size() == 1);

  auto split = ClusteringEngine(Options(1e-3), library.Loader()).Cluster(ensemble);
  assert(split.size() == 4);
  // Equal populations: ordered by representative seed.
  for (int i = 0; i < 4; ++i) {
    assert(ensemble.members(split[i].representative()).seed_index() == i);
  }
}

void TestRepeatedClusteringIsIdentical() {
  const std::vector<std::pair<int, Eigen::Matrix3Xd>> shapes{
      {0, rnaflow::testing::Helix(16, 2.0, 0.0)}, {1, rnaflow::testing::Helix(16, 1.0, 0.4)}, {2, rnaflow::testing::Helix(16, 1.0, 1.1)},
      {3, rnaflow::testing::Helix(16, 2.0, 2.0)}, {4, rnaflow::testing::Helix(16, 1.5, 0.7)}, {5, rnaflow::testing::Helix(16, 1.0, 3.0)},
  };
  Library        library;
  EnsembleResult ensemble;
  ensemble.set_backend("rhofold");
  for (const auto& [seed, coords] : shapes) {
    AddMember(ensemble, library, seed, coords);
  }

  auto first  = ClusteringEngine(Options(2.0), library.Loader()).Cluster(ensemble);
  auto second = ClusteringEngine(Options(2.0), library.Loader()).Cluster(ensemble);
  assert(first.size() == second.size());
  for (std::size_t i = 0; i < first.size(); ++i) {
    assert(first[i].SerializeAsString() == second[i].SerializeAsString());
  }

  // Members listed in another order land in the same clusters with the same representatives.
  Library        shuffled_library;
  EnsembleResult shuffled;
  shuffled.set_backend("rhofold");
  for (auto it = shapes.rbegin(); it != shapes.rend(); ++it) {
    AddMember(shuffled, shuffled_library, it->first, it->second);
  }
  auto reordered = ClusteringEngine(Options(2.0), shuffled_library.Loader()).Cluster(shuffled);
  assert(reordered.size() == first.size());
  auto seeds_of = [](const EnsembleResult& owner, const rnaflow::pipeline::v1::StructureCluster& cluster) {
    std::set<int> seeds;
    for (auto index : cluster.member_indices()) {
      seeds.insert(owner.members(index).seed_index());
    }
    return seeds;
  };
  for (std::size_t i = 0; i < first.size(); ++i) {
    assert(reordered[i].cluster_id() == first[i].cluster_id());
    assert(seeds_of(shuffled, reordered[i]) == seeds_of(ensemble, first[i]));
    assert(shuffled.members(reordered[i].representative()).seed_index() == ensemble.members(first[i].representative()).seed_index());
  }
}

void TestAtomCountMismatchIsClusteringInputError() {
  Library        library;
  EnsembleResult ensemble;
  ensemble.set_backend("protenix");
  AddMember(ensemble, library, 0, rnaflow::testing::Helix(10));
  AddMember(ensemble, library, 1, rnaflow::testing::Helix(11));

  bool threw = false;
  try {
    (void)ClusteringEngine(Options(5.0), library.Loader()).Cluster(ensemble);
  } catch (const rnaflow::util::ClusteringInputError&) {
    threw = true;
  }
  assert(threw);
}

void TestReadsStructuresFromDiskByDefault() {
  auto           dir = rnaflow::testing::TempDir("clustering_engine_disk");
  EnsembleResult ensemble;
  for (int seed = 0; seed < 3; ++seed) {
    const auto path = dir / ("seed_" + std::to_string(seed) + ".pdb");
    rnaflow::testing::WritePdb(path, rnaflow::testing::Helix(14, 1.0, 0.5 * seed));
    auto* member = ensemble.add_members();
    member->set_seed_index(seed);
    member->set_structure_path(path.string());
  }
  auto clusters = ClusteringEngine(Options(1.0)).Cluster(ensemble);
  assert(clusters.size() == 1);
  assert(clusters[0].member_indices_size() == 3);
}

} // namespace

int main() {
  TestSingleMemberIsSingletonWithoutLoading();
  TestNoUsableMembers();
  TestTwoShapesGiveTwoClusters();
  TestSingleLinkageChainsNeighbours();
  TestHighThresholdMergesEverythingAndTinyThresholdSplits();
  TestRepeatedClusteringIsIdentical();
  TestAtomCountMismatchIsClusteringInputError();
  TestReadsStructuresFromDiskByDefault();

  std::cout << "rnaflow_unit_clustering_engine: pass\n";
  return 0;
}
