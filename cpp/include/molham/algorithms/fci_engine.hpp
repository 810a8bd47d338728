// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <utility>
#include <vector>

namespace molham::algorithms {

/**
 * @brief One single-excitation link between two spin strings
 *
 * Applying a+_creation a_annihilation to the source string yields the string
 * with address @c target, with phase @c sign.
 */
struct LinkEntry {
  size_t creation;
  size_t annihilation;
  size_t target;
  int sign;
};

/**
 * @brief For every spin string address, all of its single-excitation links
 */
using LinkTable = std::vector<std::vector<LinkEntry>>;

/**
 * @brief Electron count as (alpha, beta)
 */
using ElectronCount = std::pair<size_t, size_t>;

/**
 * @brief Interface to a determinant-space (full CI) engine
 *
 * CI vectors are flat with address ia * n_beta_strings + ib. The two-body
 * tensors passed in and out are flat row-major norb^4 vectors in chemists'
 * notation, matching data::MolecularHamiltonian.
 *
 * Implementations must be safe to call concurrently; the methods are const
 * and take every input by argument.
 */
class FciEngine {
 public:
  virtual ~FciEngine() = default;

  /**
   * @brief Dimension of the CI space for @p norb orbitals and @p nelec
   * electrons
   */
  virtual size_t dim(size_t norb, ElectronCount nelec) const = 0;

  /**
   * @brief Single-excitation link table for strings of @p nocc electrons in
   * @p norb orbitals
   */
  virtual LinkTable gen_linkstr_index(size_t norb, size_t nocc) const = 0;

  /**
   * @brief Fold the one-body tensor into an effective two-body tensor
   *
   * The result, contracted with contract_2e(), reproduces the action of the
   * full Hamiltonian without its constant, scaled by @p fac.
   */
  virtual Eigen::VectorXcd absorb_h1e(const Eigen::MatrixXcd& h1,
                                      const Eigen::VectorXcd& h2, size_t norb,
                                      ElectronCount nelec,
                                      double fac) const = 0;

  /**
   * @brief Apply an effective two-body operator to a CI vector
   *
   * @param h2eff Effective two-body tensor from absorb_h1e()
   * @param vec CI vector of length dim(norb, nelec)
   * @param link_index Alpha and beta link tables from gen_linkstr_index()
   */
  virtual Eigen::VectorXcd contract_2e(
      const Eigen::VectorXcd& h2eff, const Eigen::VectorXcd& vec, size_t norb,
      ElectronCount nelec,
      const std::pair<LinkTable, LinkTable>& link_index) const = 0;

  /**
   * @brief Diagonal of a real Hamiltonian in the determinant basis, without
   * its constant
   */
  virtual Eigen::VectorXd make_hdiag(const Eigen::MatrixXd& h1,
                                     const Eigen::VectorXd& h2, size_t norb,
                                     ElectronCount nelec) const = 0;
};

}  // namespace molham::algorithms
