// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <functional>
#include <utility>

namespace molham::algorithms {

/**
 * @class LinearOperator
 * @brief Complex square or rectangular operator known only through its action
 * on vectors
 *
 * Iterative eigensolvers need nothing more than matvec() and rmatvec(); the
 * dense matrix is never formed unless to_dense() is called.
 */
class LinearOperator {
 public:
  using Apply = std::function<Eigen::VectorXcd(const Eigen::VectorXcd&)>;

  /**
   * @param rows Length of the vectors matvec() returns
   * @param cols Length of the vectors matvec() accepts
   * @param matvec Action of the operator
   * @param rmatvec Action of the adjoint
   */
  LinearOperator(Eigen::Index rows, Eigen::Index cols, Apply matvec,
                 Apply rmatvec);

  Eigen::Index rows() const { return _rows; }

  Eigen::Index cols() const { return _cols; }

  std::pair<Eigen::Index, Eigen::Index> shape() const { return {_rows, _cols}; }

  /**
   * @brief Apply the operator
   * @throws std::invalid_argument if @p vec does not have cols() entries
   */
  Eigen::VectorXcd matvec(const Eigen::VectorXcd& vec) const;

  /**
   * @brief Apply the operator to a real vector, promoted to complex
   */
  Eigen::VectorXcd matvec(const Eigen::VectorXd& vec) const;

  /**
   * @brief Apply the adjoint of the operator
   * @throws std::invalid_argument if @p vec does not have rows() entries
   */
  Eigen::VectorXcd rmatvec(const Eigen::VectorXcd& vec) const;

  Eigen::VectorXcd operator*(const Eigen::VectorXcd& vec) const {
    return matvec(vec);
  }

  /**
   * @brief Materialize the operator column by column from unit vectors
   */
  Eigen::MatrixXcd to_dense() const;

 private:
  Eigen::Index _rows;
  Eigen::Index _cols;
  Apply _matvec;
  Apply _rmatvec;
};

}  // namespace molham::algorithms
