// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <molham/data/data_class.hpp>
#include <molham/data/molecular_hamiltonian.hpp>

namespace molham::utils {

/**
 * @brief Outcome of an approximate comparison
 *
 * not_comparable signals that the right-hand operand is of another data type,
 * leaving the decision to the caller.
 */
enum class ComparisonResult { equal, not_equal, not_comparable };

/**
 * @brief Compare a Hamiltonian against another data object
 *
 * Equal when the constants and every entry of both tensors satisfy
 * |x - y| <= atol + rtol * |y|, with x from @p lhs and y from @p rhs. Tensors
 * of different shape are not equal.
 */
ComparisonResult approx_eq(const data::MolecularHamiltonian& lhs,
                           const data::DataClass& rhs, double rtol = 1e-5,
                           double atol = 1e-8);

/**
 * @brief True only if approx_eq() reports ComparisonResult::equal
 */
inline bool approx_equal(const data::MolecularHamiltonian& lhs,
                         const data::DataClass& rhs, double rtol = 1e-5,
                         double atol = 1e-8) {
  return approx_eq(lhs, rhs, rtol, atol) == ComparisonResult::equal;
}

}  // namespace molham::utils
