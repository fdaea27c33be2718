#include "internal/scoring/consensus_rank.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

namespace {

using rnaflow::scoring::ConsensusRank;
using rnaflow::scoring::ScoredStructure;

ScoredStructure Entry(const std::string& id, std::vector<std::pair<std::string, double>> metrics) {
  ScoredStructure entry;
  entry.candidate.structure_id = id;
  entry.candidate.backend      = id.substr(0, id.find('_'));
  entry.candidate.seed_index   = id.back() - '0';
  entry.candidate.path         = "/runs/" + id + ".pdb";
  entry.metrics                = std::move(metrics);
  return entry;
}

void TestMeanRankAcrossMetrics() {
  // energy: lower is better; tm: higher is better.
  std::vector<ScoredStructure> scored{
      Entry("rhofold_seed0", {{"energy", -50.0}, {"tm", 0.40}}),
      Entry("rhofold_seed1", {{"energy", -80.0}, {"tm", 0.55}}),
      Entry("protenix_seed0", {{"energy", -60.0}, {"tm", 0.90}}),
  };
  auto ranking = ConsensusRank(scored, {"energy"});
  assert(ranking.size() == 3);

  // seed1: energy 1, tm 2 -> 1.5; protenix: energy 2, tm 1 -> 1.5; seed0: 3, 3.
  assert(ranking[0].structure_id() == "protenix_seed0");
  assert(ranking[1].structure_id() == "rhofold_seed1");
  assert(std::abs(ranking[0].score() - 1.5) < 1e-9);
  assert(std::abs(ranking[1].score() - 1.5) < 1e-9);
  assert(ranking[2].structure_id() == "rhofold_seed0");
  assert(std::abs(ranking[2].score() - 3.0) < 1e-9);

  for (int i = 0; i < 3; ++i) {
    assert(ranking[i].rank() == i + 1);
  }
  assert(ranking[0].backend() == "protenix");
  assert(ranking[0].path() == "/runs/protenix_seed0.pdb");
  assert(ranking[0].metrics_size() == 2);
  assert(ranking[0].metrics(0).name() == "energy");
}

void TestUnscoredStructuresAreLeftOut() {
  std::vector<ScoredStructure> scored{
      Entry("simrna_seed0", {}),
      Entry("simrna_seed1", {{"energy", 3.0}}),
  };
  auto ranking = ConsensusRank(scored, {"energy"});
  assert(ranking.size() == 1);
  assert(ranking[0].structure_id() == "simrna_seed1");
  assert(ranking[0].rank() == 1);
}

void TestMissingMetricOnlyRanksWherePresent() {
  std::vector<ScoredStructure> scored{
      Entry("a_seed0", {{"energy", 1.0}, {"clash", 0.0}}),
      Entry("b_seed0", {{"energy", 2.0}}),
  };
  auto ranking = ConsensusRank(scored, {"energy", "clash"});
  assert(ranking[0].structure_id() == "a_seed0");
  assert(std::abs(ranking[0].score() - 1.0) < 1e-9);
  assert(std::abs(ranking[1].score() - 2.0) < 1e-9);
}

void TestNegativeZeroIsStoredAsZero() {
  auto ranking = ConsensusRank({Entry("a_seed0", {{"quality", -0.0}})}, {});
  assert(ranking[0].metrics(0).value() == 0.0);
  assert(!std::signbit(ranking[0].metrics(0).value()));
}

void TestEmptyInput() {
  assert(ConsensusRank({}, {}).empty());
}

} // namespace

int main() {
  TestMeanRankAcrossMetrics();
  TestUnscoredStructuresAreLeftOut();
  TestMissingMetricOnlyRanksWherePresent();
  TestNegativeZeroIsStoredAsZero();
  TestEmptyInput();

  std::cout << "rnaflow_unit_consensus_rank: pass\n";
  return 0;
}
