#include "consensus_rank.hpp"

#include <algorithm>
#include <map>

namespace rnaflow::scoring {

using rnaflow::pipeline::v1::RankedStructure;

std::vector<RankedStructure> ConsensusRank(const std::vector<ScoredStructure>& scored, const std::set<std::string>& lower_is_better) {
  std::vector<const ScoredStructure*> usable;
  std::set<std::string>               metric_names;
  for (const auto& entry : scored) {
    if (entry.metrics.empty()) continue;
    usable.push_back(&entry);
    for (const auto& [name, _] : entry.metrics) {
      metric_names.insert(name);
    }
  }

  std::map<std::string, double> rank_sums;
  std::map<std::string, int>    rank_counts;
  for (const auto& metric : metric_names) {
    std::vector<std::pair<std::string, double>> values;
    for (const auto* entry : usable) {
      for (const auto& [name, value] : entry->metrics) {
        if (name == metric) {
          values.emplace_back(entry->candidate.structure_id, value);
          break;
        }
      }
    }

    const bool ascending = lower_is_better.count(metric) > 0;
    std::sort(values.begin(), values.end(), [ascending](const auto& a, const auto& b) {
      if (a.second != b.second) {
        return ascending ? a.second < b.second : a.second > b.second;
      }
      return a.first < b.first;
    });
    for (std::size_t i = 0; i < values.size(); ++i) {
      rank_sums[values[i].first] += static_cast<double>(i + 1);
      rank_counts[values[i].first] += 1;
    }
  }

  std::vector<RankedStructure> ranking;
  for (const auto* entry : usable) {
    const auto& id = entry->candidate.structure_id;

    RankedStructure ranked;
    ranked.set_structure_id(id);
    ranked.set_backend(entry->candidate.backend);
    ranked.set_seed_index(entry->candidate.seed_index);
    ranked.set_path(entry->candidate.path);
    ranked.set_score(rank_sums[id] / std::max(1, rank_counts[id]));

    auto metrics = entry->metrics;
    std::sort(metrics.begin(), metrics.end());
    for (const auto& [name, value] : metrics) {
      auto* metric = ranked.add_metrics();
      metric->set_name(name);
      // Adding 0.0 turns -0.0 into 0.0, which survives a JSON round trip.
      metric->set_value(value + 0.0);
    }
    ranking.push_back(std::move(ranked));
  }

  std::sort(ranking.begin(), ranking.end(), [](const RankedStructure& a, const RankedStructure& b) {
    if (a.score() != b.score()) return a.score() < b.score();
    return a.structure_id() < b.structure_id();
  });
  for (std::size_t i = 0; i < ranking.size(); ++i) {
    ranking[i].set_rank(static_cast<int>(i) + 1);
  }
  return ranking;
}

} // namespace rnaflow::scoring
