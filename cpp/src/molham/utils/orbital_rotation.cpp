// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <molham/utils/logger.hpp>
#include <molham/utils/orbital_rotation.hpp>
#include <molham/utils/tensor.hpp>
#include <stdexcept>
#include <string>

namespace molham::utils {

namespace {

constexpr double unitarity_tolerance = 1e-8;

}  // namespace

data::MolecularHamiltonian rotate_hamiltonian(
    const data::MolecularHamiltonian& hamiltonian,
    const Eigen::MatrixXcd& rotation,
    const algorithms::TensorContractor& contractor) {
  MOLHAM_LOG_TRACE_ENTERING();
  const auto norb = static_cast<Eigen::Index>(hamiltonian.get_num_orbitals());
  if (rotation.rows() != norb || rotation.cols() != norb) {
    throw std::invalid_argument(
        "Orbital rotation must be " + std::to_string(norb) + "x" +
        std::to_string(norb) + ", got " + std::to_string(rotation.rows()) +
        "x" + std::to_string(rotation.cols()));
  }

  const double deviation =
      (rotation.adjoint() * rotation - Eigen::MatrixXcd::Identity(norb, norb))
          .norm();
  if (deviation > unitarity_tolerance) {
    MOLHAM_LOGGER().warn(
        "Orbital rotation is not unitary: ||U^H U - I|| = {:.3e}", deviation);
  }

  const Tensor u = Tensor::from_matrix(rotation);
  const Tensor u_conj = u.conjugate();

  const Tensor one_body = contractor.run(
      "ab,Aa,Bb->AB",
      {Tensor::from_matrix(hamiltonian.get_one_body_tensor()), u, u_conj});
  const Tensor two_body = contractor.run(
      "abcd,Aa,Bb,Cc,Dd->ABCD",
      {Tensor::from_four_index(hamiltonian.get_two_body_tensor(),
                               hamiltonian.get_num_orbitals()),
       u, u_conj, u, u_conj});

  return data::MolecularHamiltonian(one_body.to_matrix(), two_body.data(),
                                    hamiltonian.get_constant());
}

data::MolecularHamiltonian rotate_hamiltonian(
    const data::MolecularHamiltonian& hamiltonian,
    const Eigen::MatrixXcd& rotation) {
  MOLHAM_LOG_TRACE_ENTERING();
  auto contractor = algorithms::TensorContractorFactory::create();
  contractor->settings().set("optimize", "greedy");
  return rotate_hamiltonian(hamiltonian, rotation, *contractor);
}

}  // namespace molham::utils
