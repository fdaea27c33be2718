#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace rnaflow::upstream {

struct UpstreamContext {
  std::filesystem::path     work_dir;
  std::filesystem::path     log_dir;
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds kill_grace{std::chrono::seconds(30)};
  const std::atomic<bool>*  cancel = nullptr;
};

struct UpstreamResult {
  bool                     succeeded = false;
  std::string              failure;
  // Informational note stored with the stage (e.g. "no Rfam hit").
  std::string              note;
  std::vector<std::string> artifacts;
};

/*
  Producer that runs before structure prediction (sequence analysis,
  secondary structure). Success means exit 0 and the declared artifacts
  present; everything the prediction stage needs is read back from the
  artifacts so a resumed run can use them without re-running the tool.
*/
class UpstreamTool {
 public:
  virtual ~UpstreamTool() = default;

  virtual std::string    Name() const                                                                      = 0;
  virtual bool           IsAvailable() const                                                               = 0;
  virtual std::string    Descriptor() const                                                                = 0;
  virtual UpstreamResult Run(const std::filesystem::path& fasta, const UpstreamContext& context) const = 0;
};

} // namespace rnaflow::upstream
