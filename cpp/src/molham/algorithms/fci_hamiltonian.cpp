// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <molham/algorithms/fci_hamiltonian.hpp>
#include <molham/exceptions.hpp>
#include <molham/utils/logger.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace molham::algorithms {

namespace {

constexpr double absorb_factor = 0.5;

void check_orbital_space(const data::MolecularHamiltonian& hamiltonian,
                         size_t norb) {
  if (!hamiltonian.is_valid()) {
    throw std::invalid_argument(
        "Hamiltonian tensors have inconsistent dimensions");
  }
  if (hamiltonian.get_num_orbitals() != norb) {
    throw std::invalid_argument(
        "Hamiltonian has " + std::to_string(hamiltonian.get_num_orbitals()) +
        " orbitals but the CI space was requested for " +
        std::to_string(norb));
  }
}

}  // namespace

LinearOperator as_linear_operator(const data::MolecularHamiltonian& hamiltonian,
                                  size_t norb, ElectronCount nelec,
                                  std::shared_ptr<const FciEngine> engine) {
  MOLHAM_LOG_TRACE_ENTERING();
  if (!engine) {
    throw std::invalid_argument("as_linear_operator requires a CI engine");
  }
  check_orbital_space(hamiltonian, norb);

  auto link_index = std::make_shared<const std::pair<LinkTable, LinkTable>>(
      engine->gen_linkstr_index(norb, nelec.first),
      engine->gen_linkstr_index(norb, nelec.second));
  auto h2eff = std::make_shared<const Eigen::VectorXcd>(engine->absorb_h1e(
      hamiltonian.get_one_body_tensor(), hamiltonian.get_two_body_tensor(),
      norb, nelec, absorb_factor));
  const double constant = hamiltonian.get_constant();
  const auto dim = static_cast<Eigen::Index>(engine->dim(norb, nelec));

  MOLHAM_LOGGER().debug(
      "Linear operator of dimension {} for norb={}, nelec=({}, {})", dim, norb,
      nelec.first, nelec.second);

  LinearOperator::Apply apply = [engine, link_index, h2eff, constant, norb,
                                 nelec](const Eigen::VectorXcd& vec) {
    Eigen::VectorXcd result =
        engine->contract_2e(*h2eff, vec, norb, nelec, *link_index);
    if (constant != 0.0) {
      result += constant * vec;
    }
    return result;
  };
  return LinearOperator(dim, dim, apply, apply);
}

Eigen::VectorXd hamiltonian_diagonal(
    const data::MolecularHamiltonian& hamiltonian, size_t norb,
    ElectronCount nelec, const FciEngine& engine) {
  MOLHAM_LOG_TRACE_ENTERING();
  check_orbital_space(hamiltonian, norb);
  if (!hamiltonian.is_real()) {
    throw UnsupportedOperationError(
        "Computing the diagonal of a complex Hamiltonian is not supported");
  }
  Eigen::VectorXd diagonal =
      engine.make_hdiag(hamiltonian.get_one_body_tensor().real(),
                        hamiltonian.get_two_body_tensor().real(), norb, nelec);
  diagonal.array() += hamiltonian.get_constant();
  return diagonal;
}

}  // namespace molham::algorithms
