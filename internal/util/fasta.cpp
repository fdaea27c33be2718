#include "fasta.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "internal/util/errors.hpp"

namespace rnaflow::util {

namespace {

std::string Trim(const std::string& line) {
  auto begin = line.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = line.find_last_not_of(" \t\r\n");
  return line.substr(begin, end - begin + 1);
}

} // namespace

std::string FastaRecord::Id() const {
  auto end = header.find_first_of(" \t");
  return end == std::string::npos ? header : header.substr(0, end);
}

std::vector<FastaRecord> ReadFasta(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw NotFound("cannot open FASTA file: " + path.string());
  }

  std::vector<FastaRecord> records;
  std::string              line;
  bool                     in_record = false;
  while (std::getline(in, line)) {
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    if (line.front() == '>') {
      records.push_back(FastaRecord{Trim(line.substr(1)), {}});
      in_record = true;
      continue;
    }
    if (!in_record) {
      continue;
    }
    std::transform(line.begin(), line.end(), line.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    records.back().sequence += line;
  }
  return records;
}

} // namespace rnaflow::util
