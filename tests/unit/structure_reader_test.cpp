#include "internal/structure/structure_reader.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <sstream>

#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using namespace rnaflow::structure;

constexpr const char* kPdb =
    "HEADER    RNA\n"
    "MODEL        1\n"
    "ATOM      1  P     G A   1      10.000  11.000  12.000  1.00  0.00           P\n"
    "ATOM      2  C3*   G A   1       1.500   2.500   3.500  1.00  0.00           C\n"
    "ATOM      3  C3'A  C A   2       4.000   5.000   6.000  0.50  0.00           C\n"
    "ATOM      4  C3'B  C A   2       9.000   9.000   9.000  0.50  0.00           C\n"
    "HETATM    5  O6    G A   1       0.000   0.000   0.000  1.00  0.00           O\n"
    "ENDMDL\n"
    "MODEL        2\n"
    "ATOM      6  P     G A   1      99.000  99.000  99.000  1.00  0.00           P\n"
    "ENDMDL\n";

constexpr const char* kCif = R"(data_model
#
loop_
_atom_site.group_PDB
_atom_site.id
_atom_site.label_atom_id
_atom_site.label_alt_id
_atom_site.label_comp_id
_atom_site.auth_asym_id
_atom_site.auth_seq_id
_atom_site.Cartn_x
_atom_site.Cartn_y
_atom_site.Cartn_z
_atom_site.pdbx_PDB_model_num
ATOM 1 P . G A 1 1.000 2.000 3.000 1
ATOM 2 "C3'" . G A 1 4.000 5.000 6.000 1
ATOM 3 "C3'" . A A 2 7.000 8.000 9.000 1
ATOM 4 "C3'" . A A 2 70.000 80.000 90.000 2
#
)";

void TestPdbFirstModelAltLocAndLegacyNames() {
  std::istringstream in(kPdb);
  auto               atoms = ReadPdb(in);
  assert(atoms.size() == 4);
  assert(atoms[0].name == "P");
  assert(atoms[1].name == "C3'");
  assert(atoms[1].residue_seq == 1);
  assert(std::abs(atoms[1].position.x() - 1.5) < 1e-9);
  assert(atoms[2].name == "C3'");
  assert(atoms[2].residue_seq == 2);
  assert(std::abs(atoms[2].position.z() - 6.0) < 1e-9);
  assert(atoms[3].name == "O6");

  auto backbone = SelectAtoms(atoms, {"C3'", "P"});
  assert(backbone.cols() == 3);
  assert(std::abs(backbone(0, 0) - 10.0) < 1e-9);
}

void TestMmCifQuotedNamesAndFirstModel() {
  std::istringstream in(kCif);
  auto               atoms = ReadMmCif(in);
  assert(atoms.size() == 3);
  assert(atoms[1].name == "C3'");
  assert(atoms[2].residue_name == "A");
  assert(atoms[2].chain == "A");
  assert(std::abs(atoms[2].position.y() - 8.0) < 1e-9);

  auto backbone = SelectAtoms(atoms, {"C3'"});
  assert(backbone.cols() == 2);
}

void TestLoadBackboneDispatchesOnExtension() {
  auto dir = rnaflow::testing::TempDir("structure_reader");
  rnaflow::testing::WriteFile(dir / "model.cif", kCif);
  rnaflow::testing::WritePdb(dir / "model.pdb", rnaflow::testing::Helix(6));

  assert(LoadBackbone(dir / "model.cif", {"C3'", "P"}).cols() == 3);
  assert(LoadBackbone(dir / "model.pdb", {"C3'"}).cols() == 6);
}

void TestErrors() {
  auto dir = rnaflow::testing::TempDir("structure_reader_errors");

  bool threw = false;
  try {
    (void)ReadStructure(dir / "missing.pdb");
  } catch (const rnaflow::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  rnaflow::testing::WritePdb(dir / "protein.pdb", rnaflow::testing::Helix(4));
  threw = false;
  try {
    (void)LoadBackbone(dir / "protein.pdb", {"CA"});
  } catch (const rnaflow::util::ClusteringInputError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPdbFirstModelAltLocAndLegacyNames();
  TestMmCifQuotedNamesAndFirstModel();
  TestLoadBackboneDispatchesOnExtension();
  TestErrors();

  std::cout << "rnaflow_unit_structure_reader: pass\n";
  return 0;
}
