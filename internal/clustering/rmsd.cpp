#include "rmsd.hpp"

#include <cmath>
#include <string>

#include <Eigen/Dense>

#include "internal/util/errors.hpp"

namespace rnaflow::clustering {

double KabschRmsd(const Eigen::Matrix3Xd& a, const Eigen::Matrix3Xd& b) {
  if (a.cols() != b.cols()) {
    throw util::ClusteringInputError("atom count mismatch: " + std::to_string(a.cols()) + " vs " + std::to_string(b.cols()));
  }
  if (a.cols() == 0) {
    throw util::ClusteringInputError("no atoms to superpose");
  }

  const Eigen::Vector3d  a_center = a.rowwise().mean();
  const Eigen::Vector3d  b_center = b.rowwise().mean();
  const Eigen::Matrix3Xd p        = a.colwise() - a_center;
  const Eigen::Matrix3Xd q        = b.colwise() - b_center;

  const Eigen::Matrix3d covariance = p * q.transpose();
  Eigen::JacobiSVD<Eigen::Matrix3d> svd(covariance, Eigen::ComputeFullU | Eigen::ComputeFullV);

  Eigen::Matrix3d correction = Eigen::Matrix3d::Identity();
  if ((svd.matrixV() * svd.matrixU().transpose()).determinant() < 0.0) {
    correction(2, 2) = -1.0;
  }
  const Eigen::Matrix3d rotation = svd.matrixV() * correction * svd.matrixU().transpose();

  const double squared = (rotation * p - q).squaredNorm();
  return std::sqrt(squared / static_cast<double>(a.cols()));
}

} // namespace rnaflow::clustering
