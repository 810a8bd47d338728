// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <molham/algorithms/tensor_contractor.hpp>
#include <molham/data/molecular_hamiltonian.hpp>

namespace molham::utils {

/**
 * @brief Transform a Hamiltonian into a rotated orbital basis
 *
 * With U the orbital rotation,
 *
 *   h'[A,B]     = sum_ab h[a,b] U[A,a] conj(U[B,b])
 *   h'[A,B,C,D] = sum_abcd h[a,b,c,d] U[A,a] conj(U[B,b]) U[C,c] conj(U[D,d])
 *
 * and the constant is carried over. Rotating by U1 and then by U2 equals
 * rotating once by U2 * U1. A warning is logged when U is not unitary within
 * 1e-8; the transformation is still applied.
 *
 * @param hamiltonian Hamiltonian to rotate
 * @param rotation norb x norb unitary matrix
 * @param contractor Engine evaluating the two index contractions
 * @return A new Hamiltonian; the input is unchanged
 * @throws std::invalid_argument if @p rotation is not norb x norb
 */
data::MolecularHamiltonian rotate_hamiltonian(
    const data::MolecularHamiltonian& hamiltonian,
    const Eigen::MatrixXcd& rotation,
    const algorithms::TensorContractor& contractor);

/**
 * @brief Rotate using the default contraction engine with the "greedy" path
 * hint
 */
data::MolecularHamiltonian rotate_hamiltonian(
    const data::MolecularHamiltonian& hamiltonian,
    const Eigen::MatrixXcd& rotation);

}  // namespace molham::utils
