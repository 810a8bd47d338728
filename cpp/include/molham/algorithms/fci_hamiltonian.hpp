// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <memory>
#include <molham/algorithms/fci_engine.hpp>
#include <molham/algorithms/linear_operator.hpp>
#include <molham/data/molecular_hamiltonian.hpp>

namespace molham::algorithms {

/**
 * @brief Represent a Hamiltonian as an operator on the determinant space
 *
 * The one-body tensor is absorbed into the two-body tensor once, with factor
 * 0.5, and the link tables for both spin species are generated once; every
 * product then costs one contract_2e() call plus the constant shift. The
 * Hamiltonian is Hermitian, so rmatvec() applies the same map as matvec().
 *
 * @param hamiltonian Hamiltonian to represent
 * @param norb Number of spatial orbitals of the CI space
 * @param nelec (alpha, beta) electron counts
 * @param engine CI engine; shared with the returned operator
 * @return Square operator of dimension engine->dim(norb, nelec)
 * @throws std::invalid_argument if @p engine is null, the tensor dimensions
 * are inconsistent, or @p norb differs from the Hamiltonian's orbital count
 */
LinearOperator as_linear_operator(const data::MolecularHamiltonian& hamiltonian,
                                  size_t norb, ElectronCount nelec,
                                  std::shared_ptr<const FciEngine> engine);

/**
 * @brief Diagonal of a real Hamiltonian in the determinant basis, constant
 * included
 *
 * @throws std::invalid_argument if the tensor dimensions are inconsistent or
 * @p norb differs from the Hamiltonian's orbital count
 * @throws UnsupportedOperationError if either tensor holds a nonzero
 * imaginary part
 */
Eigen::VectorXd hamiltonian_diagonal(
    const data::MolecularHamiltonian& hamiltonian, size_t norb,
    ElectronCount nelec, const FciEngine& engine);

}  // namespace molham::algorithms
