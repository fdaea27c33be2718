#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include <Eigen/Core>

namespace rnaflow::structure {

struct Atom {
  std::string     name;
  std::string     residue_name;
  std::string     chain;
  int             residue_seq = 0;
  Eigen::Vector3d position    = Eigen::Vector3d::Zero();
};

/*
  Minimal coordinate readers. Only the first model is read and only the
  first alternate location of an atom is kept. Atom names are normalized
  from the legacy '*' form (C3*) to the prime form (C3').
*/
std::vector<Atom> ReadPdb(std::istream& in);
std::vector<Atom> ReadMmCif(std::istream& in);

// Dispatches on the file extension (.cif/.mmcif vs anything else). Throws util::NotFound.
std::vector<Atom> ReadStructure(const std::filesystem::path& path);

// 3xN matrix of the atoms whose name is in `atom_names`, in file order.
Eigen::Matrix3Xd SelectAtoms(const std::vector<Atom>& atoms, const std::vector<std::string>& atom_names);

// ReadStructure + SelectAtoms; zero selected atoms is a util::ClusteringInputError.
Eigen::Matrix3Xd LoadBackbone(const std::filesystem::path& path, const std::vector<std::string>& atom_names);

} // namespace rnaflow::structure
