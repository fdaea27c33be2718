#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace rnaflow::util {

struct FastaRecord {
  std::string header;
  std::string sequence;

  // First whitespace-delimited token of the header.
  std::string Id() const;
};

// Sequence lines are upper-cased and concatenated. Throws NotFound if the file cannot be opened.
std::vector<FastaRecord> ReadFasta(const std::filesystem::path& path);

} // namespace rnaflow::util
