#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/predictor/predictor_backend.hpp"

namespace rnaflow::predictor {

// "cuda:1" -> "cuda_1", usable in file names.
std::string SanitizeLabel(const std::string& value);

// "cuda:2" -> "2", "3" -> "3"; empty for the default device.
std::string GpuIndex(const std::string& device);

std::filesystem::path SeedDirectory(const std::filesystem::path& output_dir, int seed_index);

// Process options with stdout/stderr captured under context.log_dir/<backend>_<label>.{stdout,stderr}.log.
process::ProcessOptions InvocationOptions(const InvocationContext& context, const std::string& backend, const std::string& label,
                                          std::vector<std::string> argv);

// First regular file below `root` (recursive, sorted by path) with one of `extensions`
// whose path relative to `root`, with a leading '/', contains `needle`; empty path if none.
std::filesystem::path FindStructure(const std::filesystem::path& root, const std::vector<std::string>& extensions,
                                    const std::string& needle = {});

void WriteTextFile(const std::filesystem::path& path, const std::string& contents);

std::string JoinSeeds(const std::vector<std::int64_t>& values);

} // namespace rnaflow::predictor
