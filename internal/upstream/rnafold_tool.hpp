#pragma once

#include <optional>
#include <string>

#include "internal/upstream/upstream_tool.hpp"
#include "config/config.pb.h"

namespace rnaflow::upstream {

struct FoldResult {
  std::string sequence;
  std::string dot_bracket;
  double      mfe = 0.0;
};

/*
  Secondary structure with ViennaRNA RNAfold (MFE plus partition function).
  Writes rnafold.dot in RNAfold's own three-line layout:

      >id
      SEQUENCE
      ((((....)))) ( -3.40)
*/
class RNAfoldTool : public UpstreamTool {
 public:
  explicit RNAfoldTool(rnaflow::config::ToolsConfig config);

  std::string    Name() const override;
  bool           IsAvailable() const override;
  std::string    Descriptor() const override;
  UpstreamResult Run(const std::filesystem::path& fasta, const UpstreamContext& context) const override;

  // First MFE prediction in RNAfold stdout.
  static std::optional<FoldResult> ParseOutput(const std::string& stdout_text);

 private:
  rnaflow::config::ToolsConfig config_;
};

// Dot-bracket line of a rnafold.dot artifact; empty if the file is absent or malformed.
std::string ReadDotBracket(const std::filesystem::path& path);

} // namespace rnaflow::upstream
