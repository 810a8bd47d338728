// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <H5Cpp.h>

#include <Eigen/Dense>
#include <complex>
#include <memory>
#include <molham/data/data_class.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace molham::data {

/**
 * @class MolecularHamiltonian
 * @brief Spin-restricted second-quantized molecular electronic Hamiltonian
 *
 * Represents
 *
 *   H = sum_{s,pq} h_pq a+_{sp} a_{sq}
 *     + 1/2 sum_{st,pqrs} h_pqrs a+_{sp} a+_{tr} a_{ts} a_{sq}
 *     + constant
 *
 * where the one-body tensor h_pq is shared by both spin species and the
 * two-body tensor h_pqrs (chemists' notation, (pq|rs)) is summed over all
 * spin pairs. The two-body tensor is stored as a flat row-major vector of
 * length norb^4 with element [p,q,r,s] at index p*norb^3 + q*norb^2 + r*norb +
 * s.
 *
 * Physical two-body tensors have the 8-fold symmetry
 * h_pqrs = h_qprs = h_pqsr = h_qpsr = h_rspq = h_srpq = h_rsqp = h_srqp;
 * consumers assume it but the class does not enforce it.
 *
 * Instances are immutable. Every transformation (for example
 * utils::rotate_hamiltonian) produces a new object, so instances can be
 * shared between threads freely.
 */
class MolecularHamiltonian : public DataClass {
 public:
  /**
   * @brief Construct from complex tensors
   *
   * @param one_body_tensor norb x norb one-body tensor
   * @param two_body_tensor Flat row-major norb^4 two-body tensor
   * @param constant Scalar energy shift (e.g. nuclear repulsion)
   * @param validate Check that the tensor dimensions agree
   * @throws std::invalid_argument if validation is requested and the one-body
   * tensor is not square or the two-body tensor does not hold norb^4 entries
   */
  MolecularHamiltonian(const Eigen::MatrixXcd& one_body_tensor,
                       const Eigen::VectorXcd& two_body_tensor,
                       double constant = 0.0, bool validate = true);

  /**
   * @brief Construct from real tensors; see the complex overload
   */
  MolecularHamiltonian(const Eigen::MatrixXd& one_body_tensor,
                       const Eigen::VectorXd& two_body_tensor,
                       double constant = 0.0, bool validate = true);

  MolecularHamiltonian(const MolecularHamiltonian& other) = default;
  MolecularHamiltonian(MolecularHamiltonian&& other) noexcept = default;
  MolecularHamiltonian& operator=(const MolecularHamiltonian& other) = default;
  MolecularHamiltonian& operator=(MolecularHamiltonian&& other) noexcept =
      default;
  ~MolecularHamiltonian() override = default;

  const Eigen::MatrixXcd& get_one_body_tensor() const { return _one_body; }

  const Eigen::VectorXcd& get_two_body_tensor() const { return _two_body; }

  double get_constant() const { return _constant; }

  /**
   * @brief Number of spatial orbitals, the extent of the one-body tensor's
   * first axis
   */
  size_t get_num_orbitals() const {
    return static_cast<size_t>(_one_body.rows());
  }

  /**
   * @brief Two-body element h_pqrs
   * @throws std::out_of_range if any index is not below get_num_orbitals()
   * or the two-body tensor holds fewer than norb^4 entries
   */
  std::complex<double> get_two_body_element(size_t p, size_t q, size_t r,
                                            size_t s) const;

  /**
   * @brief Flat storage index of element [p,q,r,s]
   */
  static size_t get_two_body_index(size_t p, size_t q, size_t r, size_t s,
                                   size_t norb) {
    return ((p * norb + q) * norb + r) * norb + s;
  }

  /**
   * @brief True if no entry of either tensor has a nonzero imaginary part
   */
  bool is_real() const;

  /**
   * @brief True if the tensor dimensions are mutually consistent
   */
  bool is_valid() const;

  /**
   * @brief Check the 8-fold permutational symmetry of the two-body tensor
   * @param tolerance Maximum absolute deviation between symmetric partners
   */
  bool has_eightfold_symmetry(double tolerance = 1e-12) const;

  std::string get_data_type_name() const override {
    return "molecular_hamiltonian";
  }

  std::string get_summary() const override;

  void to_file(const std::string& filename,
               const std::string& type) const override;

  nlohmann::json to_json() const override;

  void to_json_file(const std::string& filename) const override;

  void to_hdf5(H5::Group& group) const override;

  void to_hdf5_file(const std::string& filename) const override;

  /**
   * @brief Write the Hamiltonian in FCIDUMP format
   *
   * Symmetry-unique two-body entries (ij|kl) with i<=j, k<=l, ij<=kl are
   * written first, then one-body entries with j<=i, then the constant with
   * indices 0 0 0 0. Indices are 1-based; entries below 1e-15 in magnitude are
   * skipped.
   *
   * @param filename Output path
   * @param nalpha Number of alpha electrons (for the header)
   * @param nbeta Number of beta electrons (for the header)
   * @throws UnsupportedOperationError if the Hamiltonian is not real
   * @throws std::invalid_argument if the tensor dimensions are inconsistent
   * or there are no orbitals
   * @throws std::runtime_error on I/O failure
   */
  void to_fcidump_file(const std::string& filename, size_t nalpha,
                       size_t nbeta) const;

  /**
   * @brief Load from file in the specified format ("json" or "hdf5")
   * @throws std::invalid_argument for an unknown format
   */
  static std::shared_ptr<MolecularHamiltonian> from_file(
      const std::string& filename, const std::string& type);

  /**
   * @throws std::runtime_error on missing fields or a version mismatch
   */
  static std::shared_ptr<MolecularHamiltonian> from_json(
      const nlohmann::json& j);

  static std::shared_ptr<MolecularHamiltonian> from_json_file(
      const std::string& filename);

  static std::shared_ptr<MolecularHamiltonian> from_hdf5(H5::Group& group);

  static std::shared_ptr<MolecularHamiltonian> from_hdf5_file(
      const std::string& filename);

 private:
  /// Serialization version
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  static void validate_tensor_dimensions(const Eigen::MatrixXcd& one_body,
                                         const Eigen::VectorXcd& two_body);

  Eigen::MatrixXcd _one_body;
  Eigen::VectorXcd _two_body;
  double _constant;
};

static_assert(DataClassCompliant<MolecularHamiltonian>,
              "MolecularHamiltonian must derive from DataClass and implement "
              "all required deserialization methods");

}  // namespace molham::data
