// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <complex>
#include <cstddef>
#include <vector>

namespace molham::utils {

/**
 * @brief Owning dense complex tensor with row-major (C) layout
 *
 * The rank is a runtime property. Element addressing and axis permutation go
 * through Eigen::TensorMap views with Eigen::RowMajor layout over data(), so
 * a rank-4 tensor with uniform extent n shares its storage convention with
 * the flat two-body vectors of MolecularHamiltonian
 * (index p*n^3 + q*n^2 + r*n + s).
 *
 * @code
 * Tensor h2 = Tensor::from_four_index(two_body, norb);
 * Tensor h2t = h2.transpose({1, 0, 3, 2});
 * @endcode
 */
class Tensor {
 public:
  /// Largest rank supported by element access and transpose
  static constexpr size_t max_rank = 8;

  Tensor() = default;

  /**
   * @brief Zero-initialized tensor of the given shape
   * @throws std::invalid_argument if the rank exceeds max_rank
   */
  explicit Tensor(std::vector<size_t> shape);

  /**
   * @brief Wrap existing row-major data
   * @throws std::invalid_argument if data.size() differs from the product of
   * the extents or the rank exceeds max_rank
   */
  Tensor(std::vector<size_t> shape, Eigen::VectorXcd data);

  /**
   * @brief Rank-2 tensor holding the entries of a matrix
   */
  static Tensor from_matrix(const Eigen::MatrixXcd& matrix);

  /**
   * @brief Rank-4 tensor of extent n viewing a flat four-index vector
   * @throws std::invalid_argument if flat.size() != n^4
   */
  static Tensor from_four_index(const Eigen::VectorXcd& flat, size_t n);

  /**
   * @brief Matrix with the entries of a rank-2 tensor
   * @throws std::logic_error if rank() != 2
   */
  Eigen::MatrixXcd to_matrix() const;

  const std::vector<size_t>& shape() const { return _shape; }
  size_t rank() const { return _shape.size(); }
  size_t size() const { return static_cast<size_t>(_data.size()); }

  const Eigen::VectorXcd& data() const { return _data; }
  Eigen::VectorXcd& data() { return _data; }

  /**
   * @brief Bounds-checked element access
   * @throws std::out_of_range on a wrong rank or index
   */
  std::complex<double>& at(const std::vector<size_t>& index);
  const std::complex<double>& at(const std::vector<size_t>& index) const;

  /**
   * @brief Axis permutation; axis i of the result is axis perm[i] of this
   * @throws std::invalid_argument if perm is not a permutation of the axes
   */
  Tensor transpose(const std::vector<size_t>& perm) const;

  /**
   * @brief Elementwise complex conjugate
   */
  Tensor conjugate() const;

 private:
  void _check_index(const std::vector<size_t>& index) const;

  std::vector<size_t> _shape;
  Eigen::VectorXcd _data;
};

}  // namespace molham::utils
