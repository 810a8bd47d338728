// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <complex>
#include <molham/algorithms/linear_operator.hpp>
#include <stdexcept>
#include <string>

namespace molham::algorithms {

namespace {

void check_length(const Eigen::VectorXcd& vec, Eigen::Index expected,
                  const char* operation) {
  if (vec.size() != expected) {
    throw std::invalid_argument(std::string(operation) +
                                " expects a vector of length " +
                                std::to_string(expected) + ", got " +
                                std::to_string(vec.size()));
  }
}

}  // namespace

LinearOperator::LinearOperator(Eigen::Index rows, Eigen::Index cols,
                               Apply matvec, Apply rmatvec)
    : _rows(rows),
      _cols(cols),
      _matvec(std::move(matvec)),
      _rmatvec(std::move(rmatvec)) {
  if (rows < 0 || cols < 0) {
    throw std::invalid_argument(
        "LinearOperator dimensions must be non-negative");
  }
  if (!_matvec || !_rmatvec) {
    throw std::invalid_argument("LinearOperator requires matvec and rmatvec");
  }
}

Eigen::VectorXcd LinearOperator::matvec(const Eigen::VectorXcd& vec) const {
  check_length(vec, _cols, "matvec");
  return _matvec(vec);
}

Eigen::VectorXcd LinearOperator::matvec(const Eigen::VectorXd& vec) const {
  return matvec(Eigen::VectorXcd(vec.cast<std::complex<double>>()));
}

Eigen::VectorXcd LinearOperator::rmatvec(const Eigen::VectorXcd& vec) const {
  check_length(vec, _rows, "rmatvec");
  return _rmatvec(vec);
}

Eigen::MatrixXcd LinearOperator::to_dense() const {
  Eigen::MatrixXcd dense(_rows, _cols);
  Eigen::VectorXcd unit = Eigen::VectorXcd::Zero(_cols);
  for (Eigen::Index j = 0; j < _cols; ++j) {
    unit(j) = 1.0;
    dense.col(j) = matvec(unit);
    unit(j) = 0.0;
  }
  return dense;
}

}  // namespace molham::algorithms
