// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cmath>
#include <molham/utils/approx_equal.hpp>
#include <molham/utils/logger.hpp>

namespace molham::utils {

namespace {

template <typename DerivedA, typename DerivedB>
bool all_close(const Eigen::DenseBase<DerivedA>& x,
               const Eigen::DenseBase<DerivedB>& y, double rtol, double atol) {
  if (x.rows() != y.rows() || x.cols() != y.cols()) {
    return false;
  }
  return ((x.derived() - y.derived()).array().abs() <=
          atol + rtol * y.derived().array().abs())
      .all();
}

}  // namespace

ComparisonResult approx_eq(const data::MolecularHamiltonian& lhs,
                           const data::DataClass& rhs, double rtol,
                           double atol) {
  MOLHAM_LOG_TRACE_ENTERING();
  const auto* other = dynamic_cast<const data::MolecularHamiltonian*>(&rhs);
  if (other == nullptr) {
    MOLHAM_LOGGER().debug("Cannot compare molecular_hamiltonian with {}",
                          rhs.get_data_type_name());
    return ComparisonResult::not_comparable;
  }

  if (std::abs(lhs.get_constant() - other->get_constant()) >
      atol + rtol * std::abs(other->get_constant())) {
    return ComparisonResult::not_equal;
  }
  if (!all_close(lhs.get_one_body_tensor(), other->get_one_body_tensor(), rtol,
                 atol)) {
    return ComparisonResult::not_equal;
  }
  if (!all_close(lhs.get_two_body_tensor(), other->get_two_body_tensor(), rtol,
                 atol)) {
    return ComparisonResult::not_equal;
  }
  return ComparisonResult::equal;
}

}  // namespace molham::utils
