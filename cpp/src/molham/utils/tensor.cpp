// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <array>
#include <functional>
#include <molham/utils/tensor.hpp>
#include <numeric>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unsupported/Eigen/CXX11/Tensor>

namespace molham::utils {

namespace {

using Scalar = std::complex<double>;

template <int Rank>
using RowMajorView =
    Eigen::TensorMap<Eigen::Tensor<Scalar, Rank, Eigen::RowMajor>>;

template <int Rank>
using ConstRowMajorView =
    Eigen::TensorMap<const Eigen::Tensor<Scalar, Rank, Eigen::RowMajor>>;

size_t num_elements(const std::vector<size_t>& shape) {
  return std::accumulate(shape.begin(), shape.end(), size_t{1},
                         std::multiplies<size_t>());
}

void check_rank(const std::vector<size_t>& shape) {
  if (shape.size() > Tensor::max_rank) {
    throw std::invalid_argument("Tensor rank " + std::to_string(shape.size()) +
                                " exceeds the supported maximum of " +
                                std::to_string(Tensor::max_rank));
  }
}

template <int Rank>
std::array<Eigen::Index, Rank> to_eigen_array(const std::vector<size_t>& v) {
  std::array<Eigen::Index, Rank> result{};
  for (int i = 0; i < Rank; ++i) {
    result[i] = static_cast<Eigen::Index>(v[i]);
  }
  return result;
}

// Invoke f with std::integral_constant<int, rank> for a runtime rank in
// [1, Tensor::max_rank]
template <typename Result, int Rank = 1, typename F>
Result with_rank(size_t rank, F&& f) {
  if constexpr (Rank > static_cast<int>(Tensor::max_rank)) {
    throw std::invalid_argument("Tensor rank " + std::to_string(rank) +
                                " exceeds the supported maximum of " +
                                std::to_string(Tensor::max_rank));
  } else {
    if (rank == static_cast<size_t>(Rank)) {
      return f(std::integral_constant<int, Rank>{});
    }
    return with_rank<Result, Rank + 1>(rank, std::forward<F>(f));
  }
}

}  // namespace

Tensor::Tensor(std::vector<size_t> shape)
    : _shape(std::move(shape)),
      _data(Eigen::VectorXcd::Zero(
          static_cast<Eigen::Index>(num_elements(_shape)))) {
  check_rank(_shape);
}

Tensor::Tensor(std::vector<size_t> shape, Eigen::VectorXcd data)
    : _shape(std::move(shape)), _data(std::move(data)) {
  check_rank(_shape);
  if (static_cast<size_t>(_data.size()) != num_elements(_shape)) {
    throw std::invalid_argument(
        "Tensor data holds " + std::to_string(_data.size()) +
        " elements but the shape requires " +
        std::to_string(num_elements(_shape)));
  }
}

Tensor Tensor::from_matrix(const Eigen::MatrixXcd& matrix) {
  Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>
      row_major = matrix;
  Eigen::VectorXcd flat = Eigen::Map<const Eigen::VectorXcd>(
      row_major.data(), row_major.size());
  return Tensor({static_cast<size_t>(matrix.rows()),
                 static_cast<size_t>(matrix.cols())},
                std::move(flat));
}

Tensor Tensor::from_four_index(const Eigen::VectorXcd& flat, size_t n) {
  return Tensor({n, n, n, n}, flat);
}

Eigen::MatrixXcd Tensor::to_matrix() const {
  if (rank() != 2) {
    throw std::logic_error("Only rank-2 tensors convert to a matrix, rank is " +
                           std::to_string(rank()));
  }
  return Eigen::Map<const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic,
                                        Eigen::RowMajor>>(
      _data.data(), static_cast<Eigen::Index>(_shape[0]),
      static_cast<Eigen::Index>(_shape[1]));
}

void Tensor::_check_index(const std::vector<size_t>& index) const {
  if (index.size() != _shape.size()) {
    throw std::out_of_range("Tensor of rank " + std::to_string(rank()) +
                            " indexed with " + std::to_string(index.size()) +
                            " indices");
  }
  for (size_t axis = 0; axis < index.size(); ++axis) {
    if (index[axis] >= _shape[axis]) {
      throw std::out_of_range("Index " + std::to_string(index[axis]) +
                              " out of range for axis " +
                              std::to_string(axis) + " of extent " +
                              std::to_string(_shape[axis]));
    }
  }
}

Scalar& Tensor::at(const std::vector<size_t>& index) {
  _check_index(index);
  if (index.empty()) {
    return _data(0);
  }
  return with_rank<Scalar&>(rank(), [&](auto rank_tag) -> Scalar& {
    constexpr int R = decltype(rank_tag)::value;
    RowMajorView<R> view(_data.data(), to_eigen_array<R>(_shape));
    return view(to_eigen_array<R>(index));
  });
}

const Scalar& Tensor::at(const std::vector<size_t>& index) const {
  _check_index(index);
  if (index.empty()) {
    return _data(0);
  }
  return with_rank<const Scalar&>(rank(), [&](auto rank_tag) -> const Scalar& {
    constexpr int R = decltype(rank_tag)::value;
    ConstRowMajorView<R> view(_data.data(), to_eigen_array<R>(_shape));
    return view(to_eigen_array<R>(index));
  });
}

Tensor Tensor::transpose(const std::vector<size_t>& perm) const {
  const size_t r = rank();
  if (perm.size() != r) {
    throw std::invalid_argument("Permutation length " +
                                std::to_string(perm.size()) +
                                " does not match tensor rank " +
                                std::to_string(r));
  }
  std::vector<bool> seen(r, false);
  bool identity = true;
  for (size_t i = 0; i < r; ++i) {
    if (perm[i] >= r || seen[perm[i]]) {
      throw std::invalid_argument("Invalid axis permutation");
    }
    seen[perm[i]] = true;
    identity = identity && perm[i] == i;
  }
  if (identity) {
    return *this;
  }

  std::vector<size_t> new_shape(r);
  for (size_t i = 0; i < r; ++i) {
    new_shape[i] = _shape[perm[i]];
  }
  Tensor result(new_shape);
  if (size() == 0) {
    return result;
  }

  with_rank<void>(r, [&](auto rank_tag) {
    constexpr int R = decltype(rank_tag)::value;
    ConstRowMajorView<R> source(_data.data(), to_eigen_array<R>(_shape));
    RowMajorView<R> target(result._data.data(), to_eigen_array<R>(new_shape));
    target = source.shuffle(to_eigen_array<R>(perm));
  });
  return result;
}

Tensor Tensor::conjugate() const { return Tensor(_shape, _data.conjugate()); }

}  // namespace molham::utils
