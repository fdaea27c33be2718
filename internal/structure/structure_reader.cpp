#include "structure_reader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <set>
#include <tuple>

#include "internal/util/errors.hpp"

namespace rnaflow::structure {

namespace {

// chain, residue number, atom name
using AtomKey = std::tuple<std::string, int, std::string>;

std::string Trim(const std::string& value) {
  auto begin = value.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return {};
  auto end = value.find_last_not_of(" \t\r");
  return value.substr(begin, end - begin + 1);
}

std::string Column(const std::string& line, std::size_t begin, std::size_t end) {
  if (line.size() <= begin) return {};
  return Trim(line.substr(begin, std::min(end, line.size()) - begin));
}

std::string NormalizeAtomName(std::string name) {
  std::replace(name.begin(), name.end(), '*', '\'');
  return name;
}

double ParseCoordinate(const std::string& value, const std::string& context) {
  try {
    return std::stod(value);
  } catch (const std::exception&) {
    throw util::ClusteringInputError("malformed coordinate '" + value + "' in " + context);
  }
}

int ParseInt(const std::string& value) {
  try {
    return std::stoi(value);
  } catch (const std::exception&) {
    return 0;
  }
}

bool KeepAltLoc(const std::string& alt) {
  return alt.empty() || alt == "." || alt == "?" || alt == "A" || alt == "1";
}

// CIF tokens: whitespace separated, quoted with ' or " (a quote only closes before whitespace).
std::vector<std::string> Tokenize(const std::string& line) {
  std::vector<std::string> tokens;
  std::size_t              i = 0;
  while (i < line.size()) {
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    if (i >= line.size()) break;

    char c = line[i];
    if (c == '\'' || c == '"') {
      std::size_t j = i + 1;
      while (j < line.size() && !(line[j] == c && (j + 1 == line.size() || std::isspace(static_cast<unsigned char>(line[j + 1]))))) ++j;
      tokens.push_back(line.substr(i + 1, j - i - 1));
      i = j + 1;
    } else {
      std::size_t j = i;
      while (j < line.size() && !std::isspace(static_cast<unsigned char>(line[j]))) ++j;
      tokens.push_back(line.substr(i, j - i));
      i = j;
    }
  }
  return tokens;
}

} // namespace

std::vector<Atom> ReadPdb(std::istream& in) {
  std::vector<Atom> atoms;
  std::set<AtomKey> seen;
  std::string       line;
  while (std::getline(in, line)) {
    if (line.rfind("ENDMDL", 0) == 0) {
      break;
    }
    if (line.rfind("ATOM  ", 0) != 0 && line.rfind("HETATM", 0) != 0) {
      continue;
    }
    if (!KeepAltLoc(Column(line, 16, 17))) {
      continue;
    }

    Atom atom;
    atom.name         = NormalizeAtomName(Column(line, 12, 16));
    atom.residue_name = Column(line, 17, 20);
    atom.chain        = Column(line, 21, 22);
    atom.residue_seq  = ParseInt(Column(line, 22, 26));
    if (!seen.emplace(atom.chain, atom.residue_seq, atom.name).second) {
      continue;
    }
    atom.position = Eigen::Vector3d(ParseCoordinate(Column(line, 30, 38), "PDB record"), ParseCoordinate(Column(line, 38, 46), "PDB record"),
                                    ParseCoordinate(Column(line, 46, 54), "PDB record"));
    atoms.push_back(std::move(atom));
  }
  return atoms;
}

std::vector<Atom> ReadMmCif(std::istream& in) {
  std::vector<Atom>          atoms;
  std::map<std::string, int> columns;
  std::string                line;
  bool                       in_loop      = false;
  bool                       in_atom_site = false;
  std::string                first_model;
  std::set<AtomKey>          seen;

  auto column = [&](std::initializer_list<const char*> names) {
    for (const auto* name : names) {
      auto it = columns.find(name);
      if (it != columns.end()) return it->second;
    }
    return -1;
  };

  while (std::getline(in, line)) {
    auto trimmed = Trim(line);
    if (trimmed.rfind("loop_", 0) == 0) {
      if (in_atom_site && !atoms.empty()) break;
      in_loop      = true;
      in_atom_site = false;
      columns.clear();
      continue;
    }
    if (trimmed.rfind("_atom_site.", 0) == 0 && in_loop) {
      in_atom_site = true;
      auto index   = static_cast<int>(columns.size());
      columns[trimmed.substr(std::string("_atom_site.").size())] = index;
      continue;
    }
    if (!in_atom_site) {
      continue;
    }
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == '_') {
      if (!atoms.empty()) break;
      continue;
    }

    auto tokens = Tokenize(trimmed);
    if (tokens.size() < columns.size()) {
      continue;
    }
    auto get = [&](int index) { return index >= 0 ? tokens[static_cast<std::size_t>(index)] : std::string(); };

    auto model = get(column({"pdbx_PDB_model_num"}));
    if (first_model.empty()) first_model = model;
    if (model != first_model) break;
    if (!KeepAltLoc(get(column({"label_alt_id"})))) continue;

    Atom atom;
    atom.name         = NormalizeAtomName(get(column({"auth_atom_id", "label_atom_id"})));
    atom.residue_name = get(column({"auth_comp_id", "label_comp_id"}));
    atom.chain        = get(column({"auth_asym_id", "label_asym_id"}));
    atom.residue_seq  = ParseInt(get(column({"auth_seq_id", "label_seq_id"})));
    if (!seen.emplace(atom.chain, atom.residue_seq, atom.name).second) {
      continue;
    }
    atom.position = Eigen::Vector3d(ParseCoordinate(get(column({"Cartn_x"})), "mmCIF atom_site"),
                                    ParseCoordinate(get(column({"Cartn_y"})), "mmCIF atom_site"),
                                    ParseCoordinate(get(column({"Cartn_z"})), "mmCIF atom_site"));
    atoms.push_back(std::move(atom));
  }
  return atoms;
}

std::vector<Atom> ReadStructure(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::NotFound("cannot open structure: " + path.string());
  }
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
  return ext == ".cif" || ext == ".mmcif" ? ReadMmCif(in) : ReadPdb(in);
}

Eigen::Matrix3Xd SelectAtoms(const std::vector<Atom>& atoms, const std::vector<std::string>& atom_names) {
  std::vector<const Atom*> selected;
  for (const auto& atom : atoms) {
    if (std::find(atom_names.begin(), atom_names.end(), atom.name) != atom_names.end()) {
      selected.push_back(&atom);
    }
  }
  Eigen::Matrix3Xd coords(3, static_cast<Eigen::Index>(selected.size()));
  for (std::size_t i = 0; i < selected.size(); ++i) {
    coords.col(static_cast<Eigen::Index>(i)) = selected[i]->position;
  }
  return coords;
}

Eigen::Matrix3Xd LoadBackbone(const std::filesystem::path& path, const std::vector<std::string>& atom_names) {
  auto coords = SelectAtoms(ReadStructure(path), atom_names);
  if (coords.cols() == 0) {
    throw util::ClusteringInputError("no backbone atoms found in " + path.string());
  }
  return coords;
}

} // namespace rnaflow::structure
