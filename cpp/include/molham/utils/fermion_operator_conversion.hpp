// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <molham/data/fermion_operator.hpp>
#include <molham/data/molecular_hamiltonian.hpp>
#include <molham/data/settings.hpp>

namespace molham::utils {

/**
 * @brief Options for building a Hamiltonian from a fermionic operator
 *
 * - "constant_imaginary_tolerance" (double, default 1e-12): largest accepted
 *   magnitude of the imaginary part of the constant term.
 * - "canonicalize_two_body_orbits" (bool, default true): fill each 8-fold
 *   symmetry orbit of the two-body tensor only from the first term that
 *   reaches it. When false, every distinct (p,q,r,s) rewrites its orbit and
 *   the last term in term order wins.
 */
class FermionOperatorConversionSettings : public data::Settings {
 public:
  FermionOperatorConversionSettings() {
    set_default("constant_imaginary_tolerance", 1e-12,
                "Largest accepted imaginary part of the constant term",
                data::BoundConstraint<double>{0.0, 1.0});
    set_default("canonicalize_two_body_orbits", true,
                "Process each two-body symmetry orbit once");
  }
};

/**
 * @brief Express a Hamiltonian as a fermionic operator
 *
 * Produces the constant as the identity term, the terms
 * a+_{s,p} a_{s,q} with coefficient h_pq for both spins, and the terms
 * a+_{s,p} a+_{t,r} a_{t,s} a_{s,q} with coefficient h_pqrs / 2 for the four
 * spin pairs (s,t). Zero coefficients are kept, so the operator always holds
 * 1 + 2 norb^2 + 4 norb^4 terms.
 *
 * @throws std::invalid_argument if the tensor dimensions are inconsistent
 */
data::FermionOperator to_fermion_operator(
    const data::MolecularHamiltonian& hamiltonian);

/**
 * @brief Rebuild a Hamiltonian from a fermionic operator of the form produced
 * by to_fermion_operator()
 *
 * The orbital count is one more than the largest orbital index present (zero
 * for an operator without orbital indices). One-body coefficients are
 * accumulated with weight 1/2 across both spins; each two-body term writes
 * twice its coefficient into all eight symmetry-equivalent entries, so the
 * result always has 8-fold symmetry.
 *
 * @throws InvalidTermError for a constant with an imaginary part above the
 * tolerance, a two-action term that is not a same-spin creation/annihilation
 * pair, a four-action term outside the four allowed spin patterns, a term
 * of any other length, or an orbital index so large that norb^4 complex
 * entries cannot be addressed
 */
data::MolecularHamiltonian from_fermion_operator(
    const data::FermionOperator& op,
    const FermionOperatorConversionSettings& settings = {});

}  // namespace molham::utils
