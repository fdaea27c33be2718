#include "internal/clustering/rmsd.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

#include <Eigen/Geometry>

#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using rnaflow::clustering::KabschRmsd;

void TestIdenticalStructuresHaveZeroRmsd() {
  auto coords = rnaflow::testing::Helix(15);
  assert(KabschRmsd(coords, coords) < 1e-9);
}

void TestRigidMotionIsRemoved() {
  auto            a = rnaflow::testing::Helix(20);
  Eigen::Matrix3d rotation =
      (Eigen::AngleAxisd(0.7, Eigen::Vector3d::UnitX()) * Eigen::AngleAxisd(-1.3, Eigen::Vector3d::UnitY())).toRotationMatrix();
  Eigen::Matrix3Xd b = (rotation * a).colwise() + Eigen::Vector3d(5.0, -12.0, 40.0);
  assert(KabschRmsd(a, b) < 1e-6);
  assert(std::abs(KabschRmsd(a, b) - KabschRmsd(b, a)) < 1e-9);
}

void TestKnownDisplacement() {
  // Two points moved apart symmetrically along x: best fit leaves 1 A per atom.
  Eigen::Matrix3Xd a(3, 2);
  Eigen::Matrix3Xd b(3, 2);
  a << 0.0, 2.0, 0.0, 0.0, 0.0, 0.0;
  b << -1.0, 3.0, 0.0, 0.0, 0.0, 0.0;
  assert(std::abs(KabschRmsd(a, b) - 1.0) < 1e-9);
}

void TestMirrorImageIsNotSuperposable() {
  auto             a      = rnaflow::testing::Helix(20);
  Eigen::Matrix3Xd mirror = a;
  mirror.row(0) *= -1.0;
  assert(KabschRmsd(a, mirror) > 0.5);
}

void TestAtomCountMismatchThrows() {
  bool threw = false;
  try {
    (void)KabschRmsd(rnaflow::testing::Helix(10), rnaflow::testing::Helix(11));
  } catch (const rnaflow::util::ClusteringInputError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestIdenticalStructuresHaveZeroRmsd();
  TestRigidMotionIsRemoved();
  TestKnownDisplacement();
  TestMirrorImageIsNotSuperposable();
  TestAtomCountMismatchThrows();

  std::cout << "rnaflow_unit_rmsd: pass\n";
  return 0;
}
