#pragma once

#include <Eigen/Core>

namespace rnaflow::clustering {

// Minimal RMSD after optimal rigid-body superposition of `a` onto `b`
// (Kabsch, SVD with reflection correction). Both are 3xN with matching atom
// order. Throws util::ClusteringInputError on an atom-count mismatch.
double KabschRmsd(const Eigen::Matrix3Xd& a, const Eigen::Matrix3Xd& b);

} // namespace rnaflow::clustering
