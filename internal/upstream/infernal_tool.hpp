#pragma once

#include <optional>
#include <string>

#include "internal/upstream/upstream_tool.hpp"
#include "config/config.pb.h"

namespace rnaflow::upstream {

struct RfamHit {
  std::string family;
  std::string accession;
  double      evalue = 0.0;
};

/*
  Rfam family search with Infernal: cmscan over the Rfam CM, then cmfetch
  and cmalign for the top family to build a Stockholm alignment of the
  query. A run without hits, or whose alignment step fails, still succeeds
  with no alignment.
*/
class InfernalTool : public UpstreamTool {
 public:
  explicit InfernalTool(rnaflow::config::ToolsConfig config);

  std::string    Name() const override;
  bool           IsAvailable() const override;
  std::string    Descriptor() const override;
  UpstreamResult Run(const std::filesystem::path& fasta, const UpstreamContext& context) const override;

  // Top hit of a cmscan --fmt 2 table (target name, accession, ..., E-value in column 18).
  static std::optional<RfamHit> ParseTopHit(const std::string& tblout);

 private:
  rnaflow::config::ToolsConfig config_;
};

// The first .sto or .a3m artifact of a sequence-analysis stage; empty if none.
std::string FindAlignment(const std::vector<std::string>& artifacts);

} // namespace rnaflow::upstream
