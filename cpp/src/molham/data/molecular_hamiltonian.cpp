// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <molham/data/molecular_hamiltonian.hpp>
#include <molham/exceptions.hpp>
#include <molham/utils/logger.hpp>
#include <sstream>
#include <stdexcept>

#include "filename_utils.hpp"
#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace molham::data {

MolecularHamiltonian::MolecularHamiltonian(
    const Eigen::MatrixXcd& one_body_tensor,
    const Eigen::VectorXcd& two_body_tensor, double constant, bool validate)
    : _one_body(one_body_tensor),
      _two_body(two_body_tensor),
      _constant(constant) {
  MOLHAM_LOG_TRACE_ENTERING();
  if (validate) {
    validate_tensor_dimensions(_one_body, _two_body);
  }
}

MolecularHamiltonian::MolecularHamiltonian(
    const Eigen::MatrixXd& one_body_tensor,
    const Eigen::VectorXd& two_body_tensor, double constant, bool validate)
    : MolecularHamiltonian(
          Eigen::MatrixXcd(one_body_tensor.cast<std::complex<double>>()),
          Eigen::VectorXcd(two_body_tensor.cast<std::complex<double>>()),
          constant, validate) {}

void MolecularHamiltonian::validate_tensor_dimensions(
    const Eigen::MatrixXcd& one_body, const Eigen::VectorXcd& two_body) {
  if (one_body.rows() != one_body.cols()) {
    throw std::invalid_argument(
        "One-body tensor must be square, got " +
        std::to_string(one_body.rows()) + "x" +
        std::to_string(one_body.cols()));
  }
  const auto norb = static_cast<size_t>(one_body.rows());
  const size_t expected = norb * norb * norb * norb;
  if (static_cast<size_t>(two_body.size()) != expected) {
    throw std::invalid_argument(
        "Two-body tensor size (" + std::to_string(two_body.size()) +
        ") does not match norb^4 = " + std::to_string(expected) +
        " for norb = " + std::to_string(norb));
  }
}

bool MolecularHamiltonian::is_valid() const {
  try {
    validate_tensor_dimensions(_one_body, _two_body);
  } catch (const std::invalid_argument&) {
    return false;
  }
  return true;
}

std::complex<double> MolecularHamiltonian::get_two_body_element(
    size_t p, size_t q, size_t r, size_t s) const {
  const size_t norb = get_num_orbitals();
  if (p >= norb || q >= norb || r >= norb || s >= norb) {
    throw std::out_of_range("Two-body index (" + std::to_string(p) + ", " +
                            std::to_string(q) + ", " + std::to_string(r) +
                            ", " + std::to_string(s) +
                            ") out of range for " + std::to_string(norb) +
                            " orbitals");
  }
  const size_t index = get_two_body_index(p, q, r, s, norb);
  if (index >= static_cast<size_t>(_two_body.size())) {
    throw std::out_of_range("Two-body index (" + std::to_string(p) + ", " +
                            std::to_string(q) + ", " + std::to_string(r) +
                            ", " + std::to_string(s) +
                            ") out of range for a two-body tensor of " +
                            std::to_string(_two_body.size()) + " entries");
  }
  return _two_body(static_cast<Eigen::Index>(index));
}

bool MolecularHamiltonian::is_real() const {
  return (_one_body.imag().array() == 0.0).all() &&
         (_two_body.imag().array() == 0.0).all();
}

bool MolecularHamiltonian::has_eightfold_symmetry(double tolerance) const {
  MOLHAM_LOG_TRACE_ENTERING();
  const size_t n = get_num_orbitals();
  if (!is_valid()) {
    return false;
  }
  for (size_t p = 0; p < n; ++p)
    for (size_t q = 0; q < n; ++q)
      for (size_t r = 0; r < n; ++r)
        for (size_t s = 0; s < n; ++s) {
          const auto ref = get_two_body_element(p, q, r, s);
          const std::complex<double> partners[] = {
              get_two_body_element(q, p, r, s),
              get_two_body_element(p, q, s, r),
              get_two_body_element(q, p, s, r),
              get_two_body_element(r, s, p, q),
              get_two_body_element(s, r, p, q),
              get_two_body_element(r, s, q, p),
              get_two_body_element(s, r, q, p)};
          for (const auto& partner : partners) {
            if (std::abs(partner - ref) > tolerance) {
              return false;
            }
          }
        }
  return true;
}

std::string MolecularHamiltonian::get_summary() const {
  std::ostringstream oss;
  oss << "MolecularHamiltonian Summary:\n";
  oss << "  Number of orbitals: " << get_num_orbitals() << "\n";
  oss << "  Constant: " << std::scientific << std::setprecision(12)
      << _constant << "\n";
  oss << "  Real-valued: " << (is_real() ? "true" : "false") << "\n";
  oss << "  One-body norm: " << _one_body.norm() << "\n";
  oss << "  Two-body norm: " << _two_body.norm() << "\n";
  return oss.str();
}

void MolecularHamiltonian::to_file(const std::string& filename,
                                   const std::string& type) const {
  MOLHAM_LOG_TRACE_ENTERING();
  if (type == "json") {
    to_json_file(filename);
  } else if (type == "hdf5") {
    to_hdf5_file(filename);
  } else {
    throw std::invalid_argument("Unknown file type: " + type +
                                ". Supported types are: json, hdf5");
  }
}

nlohmann::json MolecularHamiltonian::to_json() const {
  MOLHAM_LOG_TRACE_ENTERING();
  nlohmann::json j;
  j["version"] = SERIALIZATION_VERSION;
  j["data_type"] = get_data_type_name();
  j["num_orbitals"] = get_num_orbitals();
  j["constant"] = _constant;
  j["one_body_tensor"] = complex_matrix_to_json(_one_body);
  j["two_body_tensor"] = complex_vector_to_json(_two_body);
  return j;
}

void MolecularHamiltonian::to_json_file(const std::string& filename) const {
  MOLHAM_LOG_TRACE_ENTERING();
  DataTypeFilename::validate_write_suffix(filename, get_data_type_name());

  std::ofstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file for writing: " + filename);
  }
  file << to_json().dump(2);
  if (file.fail()) {
    throw std::runtime_error("Error writing to file: " + filename);
  }
}

void MolecularHamiltonian::to_hdf5(H5::Group& group) const {
  MOLHAM_LOG_TRACE_ENTERING();
  try {
    H5::DataSpace scalar_space(H5S_SCALAR);

    write_string_attribute(group, "version", SERIALIZATION_VERSION);
    write_string_attribute(group, "data_type", get_data_type_name());

    H5::Attribute constant_attr = group.createAttribute(
        "constant", H5::PredType::NATIVE_DOUBLE, scalar_space);
    constant_attr.write(H5::PredType::NATIVE_DOUBLE, &_constant);

    const auto norb = static_cast<uint64_t>(get_num_orbitals());
    H5::Attribute norb_attr = group.createAttribute(
        "num_orbitals", H5::PredType::NATIVE_UINT64, scalar_space);
    norb_attr.write(H5::PredType::NATIVE_UINT64, &norb);

    save_matrix_to_group(group, "one_body_real", _one_body.real());
    save_matrix_to_group(group, "one_body_imag", _one_body.imag());
    save_vector_to_group(group, "two_body_real", _two_body.real());
    save_vector_to_group(group, "two_body_imag", _two_body.imag());
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error in MolecularHamiltonian::to_hdf5: " +
                             std::string(e.getCDetailMsg()));
  }
}

void MolecularHamiltonian::to_hdf5_file(const std::string& filename) const {
  MOLHAM_LOG_TRACE_ENTERING();
  DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
  try {
    H5::H5File file(filename, H5F_ACC_TRUNC);
    H5::Group root_group = file.openGroup("/");
    to_hdf5(root_group);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

void MolecularHamiltonian::to_fcidump_file(const std::string& filename,
                                           size_t nalpha, size_t nbeta) const {
  MOLHAM_LOG_TRACE_ENTERING();
  if (!is_real()) {
    throw UnsupportedOperationError(
        "FCIDUMP format is not supported for complex-valued Hamiltonians.");
  }
  if (!is_valid()) {
    throw std::invalid_argument(
        "Cannot write FCIDUMP for a Hamiltonian with inconsistent tensor "
        "dimensions");
  }
  const size_t norb = get_num_orbitals();
  if (norb == 0) {
    throw std::invalid_argument("Cannot write FCIDUMP for zero orbitals");
  }

  std::ofstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file for writing: " + filename);
  }

  constexpr double print_thresh = 1e-15;

  std::string orb_string;
  for (size_t i = 0; i + 1 < norb; ++i) {
    orb_string += "1,";
  }
  orb_string += "1";

  file << "&FCI ";
  file << "NORB=" << norb << ", ";
  file << "NELEC=" << nalpha + nbeta << ", ";
  file << "MS2=" << static_cast<long long>(nalpha) - static_cast<long long>(nbeta)
       << ",\n";
  file << "ORBSYM=" << orb_string << ",\n";
  file << "ISYM=1,\n";
  file << "&END\n";

  auto formatted_line = [&](size_t i, size_t j, size_t k, size_t l,
                            double val) {
    if (std::abs(val) < print_thresh) return;
    file << std::setw(28) << std::scientific << std::setprecision(16)
         << std::right << val << " ";
    file << std::setw(4) << i << " ";
    file << std::setw(4) << j << " ";
    file << std::setw(4) << k << " ";
    file << std::setw(4) << l << "\n";
  };

  for (size_t i = 0, ij = 0; i < norb; ++i)
    for (size_t j = i; j < norb; ++j, ++ij) {
      for (size_t k = 0, kl = 0; k < norb; ++k)
        for (size_t l = k; l < norb; ++l, ++kl) {
          if (ij <= kl) {
            formatted_line(i + 1, j + 1, k + 1, l + 1,
                           get_two_body_element(i, j, k, l).real());
          }
        }
    }

  for (size_t i = 0; i < norb; ++i)
    for (size_t j = 0; j <= i; ++j) {
      formatted_line(i + 1, j + 1, 0, 0,
                     _one_body(static_cast<Eigen::Index>(i),
                               static_cast<Eigen::Index>(j))
                         .real());
    }

  formatted_line(0, 0, 0, 0, _constant);

  if (file.fail()) {
    throw std::runtime_error("Error writing to file: " + filename);
  }
}

std::shared_ptr<MolecularHamiltonian> MolecularHamiltonian::from_file(
    const std::string& filename, const std::string& type) {
  MOLHAM_LOG_TRACE_ENTERING();
  if (type == "json") {
    return from_json_file(filename);
  } else if (type == "hdf5") {
    return from_hdf5_file(filename);
  }
  throw std::invalid_argument("Unknown file type: " + type +
                              ". Supported types are: json, hdf5");
}

std::shared_ptr<MolecularHamiltonian> MolecularHamiltonian::from_json(
    const nlohmann::json& j) {
  MOLHAM_LOG_TRACE_ENTERING();
  try {
    if (!j.contains("version")) {
      throw std::runtime_error("JSON missing required 'version' field");
    }
    validate_serialization_version(SERIALIZATION_VERSION,
                                   j["version"].get<std::string>());

    if (!j.contains("one_body_tensor") || !j.contains("two_body_tensor")) {
      throw std::runtime_error(
          "JSON missing required 'one_body_tensor' or 'two_body_tensor' "
          "field");
    }
    Eigen::MatrixXcd one_body = json_to_complex_matrix(j["one_body_tensor"]);
    Eigen::VectorXcd two_body = json_to_complex_vector(j["two_body_tensor"]);
    // An empty nested array carries no column count
    if (one_body.size() == 0) {
      one_body.resize(0, 0);
    }
    return std::make_shared<MolecularHamiltonian>(
        one_body, two_body, j.value("constant", 0.0));
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Failed to parse MolecularHamiltonian from JSON: " +
                             std::string(e.what()));
  }
}

std::shared_ptr<MolecularHamiltonian> MolecularHamiltonian::from_json_file(
    const std::string& filename) {
  MOLHAM_LOG_TRACE_ENTERING();
  DataTypeFilename::validate_read_suffix(filename, "molecular_hamiltonian");

  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error(
        "Unable to open MolecularHamiltonian JSON file '" + filename +
        "'. Please check that the file exists and you have read permissions.");
  }
  nlohmann::json json_obj;
  try {
    file >> json_obj;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Failed to parse JSON file '" + filename +
                             "': " + e.what());
  }
  return from_json(json_obj);
}

std::shared_ptr<MolecularHamiltonian> MolecularHamiltonian::from_hdf5(
    H5::Group& group) {
  MOLHAM_LOG_TRACE_ENTERING();
  try {
    if (!group.attrExists("version")) {
      throw std::runtime_error("HDF5 group missing required 'version' attribute");
    }
    validate_serialization_version(SERIALIZATION_VERSION,
                                   read_string_attribute(group, "version"));

    double constant = 0.0;
    if (group.attrExists("constant")) {
      H5::Attribute constant_attr = group.openAttribute("constant");
      constant_attr.read(H5::PredType::NATIVE_DOUBLE, &constant);
    }

    Eigen::MatrixXd one_body_real = load_matrix_from_group(group, "one_body_real");
    Eigen::MatrixXd one_body_imag =
        dataset_exists_in_group(group, "one_body_imag")
            ? load_matrix_from_group(group, "one_body_imag")
            : Eigen::MatrixXd(Eigen::MatrixXd::Zero(one_body_real.rows(),
                                                     one_body_real.cols()));
    Eigen::VectorXd two_body_real = load_vector_from_group(group, "two_body_real");
    Eigen::VectorXd two_body_imag =
        dataset_exists_in_group(group, "two_body_imag")
            ? load_vector_from_group(group, "two_body_imag")
            : Eigen::VectorXd(Eigen::VectorXd::Zero(two_body_real.size()));

    if (one_body_real.rows() != one_body_imag.rows() ||
        one_body_real.cols() != one_body_imag.cols() ||
        two_body_real.size() != two_body_imag.size()) {
      throw std::runtime_error(
          "Real and imaginary parts of stored tensors differ in shape");
    }

    Eigen::MatrixXcd one_body(one_body_real.rows(), one_body_real.cols());
    one_body.real() = one_body_real;
    one_body.imag() = one_body_imag;
    Eigen::VectorXcd two_body(two_body_real.size());
    two_body.real() = two_body_real;
    two_body.imag() = two_body_imag;

    return std::make_shared<MolecularHamiltonian>(one_body, two_body, constant);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error in MolecularHamiltonian::from_hdf5: " +
                             std::string(e.getCDetailMsg()));
  }
}

std::shared_ptr<MolecularHamiltonian> MolecularHamiltonian::from_hdf5_file(
    const std::string& filename) {
  MOLHAM_LOG_TRACE_ENTERING();
  DataTypeFilename::validate_read_suffix(filename, "molecular_hamiltonian");

  H5::H5File file;
  try {
    file.openFile(filename, H5F_ACC_RDONLY);
  } catch (const H5::Exception&) {
    throw std::runtime_error("Unable to open MolecularHamiltonian HDF5 file '" +
                             filename +
                             "'. Please check that the file exists, is a valid "
                             "HDF5 file, and you have read permissions.");
  }

  try {
    H5::Group root_group = file.openGroup("/");
    return from_hdf5(root_group);
  } catch (const H5::Exception& e) {
    throw std::runtime_error(
        "Unable to read MolecularHamiltonian data from HDF5 file '" + filename +
        "'. HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

}  // namespace molham::data
