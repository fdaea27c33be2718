#include "backend_support.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "internal/scheduler/device_scheduler.hpp"
#include "internal/util/errors.hpp"

namespace rnaflow::predictor {

std::string SanitizeLabel(const std::string& value) {
  std::string out = value;
  for (auto& c : out) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') {
      c = '_';
    }
  }
  return out;
}

std::string GpuIndex(const std::string& device) {
  if (device.empty() || device == scheduler::kDefaultDevice) {
    return {};
  }
  auto colon = device.rfind(':');
  return colon == std::string::npos ? device : device.substr(colon + 1);
}

std::filesystem::path SeedDirectory(const std::filesystem::path& output_dir, int seed_index) {
  return output_dir / ("seed_" + std::to_string(seed_index));
}

process::ProcessOptions InvocationOptions(const InvocationContext& context, const std::string& backend, const std::string& label,
                                          std::vector<std::string> argv) {
  process::ProcessOptions options;
  options.argv        = std::move(argv);
  options.stdout_path = context.log_dir / (backend + "_" + label + ".stdout.log");
  options.stderr_path = context.log_dir / (backend + "_" + label + ".stderr.log");
  options.timeout     = context.timeout;
  options.kill_grace  = context.kill_grace;
  options.cancel      = context.cancel;
  return options;
}

std::filesystem::path FindStructure(const std::filesystem::path& root, const std::vector<std::string>& extensions,
                                    const std::string& needle) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return {};
  }

  std::vector<std::filesystem::path> found;
  for (auto it = std::filesystem::recursive_directory_iterator(root, ec); !ec && it != std::filesystem::recursive_directory_iterator();
       it.increment(ec)) {
    if (!it->is_regular_file(ec)) {
      continue;
    }
    const auto& path = it->path();
    auto        ext  = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) {
      continue;
    }
    const auto relative = "/" + path.lexically_relative(root).generic_string();
    if (!needle.empty() && relative.find(needle) == std::string::npos) {
      continue;
    }
    found.push_back(path);
  }
  if (found.empty()) {
    return {};
  }
  std::sort(found.begin(), found.end());
  return found.front();
}

void WriteTextFile(const std::filesystem::path& path, const std::string& contents) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw util::InvalidState("cannot write " + path.string());
  }
  out << contents;
  if (!out.good()) {
    throw util::InvalidState("write failed for " + path.string());
  }
}

std::string JoinSeeds(const std::vector<std::int64_t>& values) {
  std::ostringstream out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) out << ",";
    out << values[i];
  }
  return out.str();
}

} // namespace rnaflow::predictor
