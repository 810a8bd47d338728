// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "json_serialization.hpp"

#include <stdexcept>
#include <string>
#include <tuple>

namespace molham::data {

nlohmann::json matrix_to_json(const Eigen::MatrixXd& matrix) {
  nlohmann::json j = nlohmann::json::array();
  for (Eigen::Index row = 0; row < matrix.rows(); ++row) {
    nlohmann::json row_array = nlohmann::json::array();
    for (Eigen::Index col = 0; col < matrix.cols(); ++col) {
      row_array.push_back(matrix(row, col));
    }
    j.push_back(row_array);
  }
  return j;
}

nlohmann::json vector_to_json(const Eigen::VectorXd& vector) {
  nlohmann::json j = nlohmann::json::array();
  for (Eigen::Index i = 0; i < vector.size(); ++i) {
    j.push_back(vector(i));
  }
  return j;
}

Eigen::MatrixXd json_to_matrix(const nlohmann::json& j) {
  if (!j.is_array()) {
    throw std::invalid_argument("JSON must be an array for matrix conversion");
  }
  if (j.empty()) {
    return Eigen::MatrixXd(0, 0);
  }

  const auto rows = static_cast<Eigen::Index>(j.size());
  const auto cols = static_cast<Eigen::Index>(j[0].size());

  Eigen::MatrixXd matrix(rows, cols);
  for (Eigen::Index row = 0; row < rows; ++row) {
    if (!j[row].is_array() ||
        static_cast<Eigen::Index>(j[row].size()) != cols) {
      throw std::invalid_argument(
          "All rows must have the same length for matrix conversion");
    }
    for (Eigen::Index col = 0; col < cols; ++col) {
      matrix(row, col) = j[row][col].get<double>();
    }
  }
  return matrix;
}

Eigen::VectorXd json_to_vector(const nlohmann::json& j) {
  if (!j.is_array()) {
    throw std::invalid_argument("JSON must be an array for vector conversion");
  }

  const auto size = static_cast<Eigen::Index>(j.size());
  Eigen::VectorXd vector(size);
  for (Eigen::Index i = 0; i < size; ++i) {
    vector(i) = j[i].get<double>();
  }
  return vector;
}

nlohmann::json complex_matrix_to_json(const Eigen::MatrixXcd& matrix) {
  nlohmann::json j;
  j["real"] = matrix_to_json(matrix.real());
  j["imag"] = matrix_to_json(matrix.imag());
  return j;
}

nlohmann::json complex_vector_to_json(const Eigen::VectorXcd& vector) {
  nlohmann::json j;
  j["real"] = vector_to_json(vector.real());
  j["imag"] = vector_to_json(vector.imag());
  return j;
}

Eigen::MatrixXcd json_to_complex_matrix(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("real")) {
    throw std::invalid_argument(
        "Complex matrix JSON must be an object with a 'real' field");
  }
  Eigen::MatrixXd re = json_to_matrix(j.at("real"));
  Eigen::MatrixXd im =
      j.contains("imag")
          ? json_to_matrix(j.at("imag"))
          : Eigen::MatrixXd(Eigen::MatrixXd::Zero(re.rows(), re.cols()));
  if (re.rows() != im.rows() || re.cols() != im.cols()) {
    throw std::invalid_argument(
        "Real and imaginary parts of complex matrix differ in shape");
  }
  Eigen::MatrixXcd result(re.rows(), re.cols());
  result.real() = re;
  result.imag() = im;
  return result;
}

Eigen::VectorXcd json_to_complex_vector(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("real")) {
    throw std::invalid_argument(
        "Complex vector JSON must be an object with a 'real' field");
  }
  Eigen::VectorXd re = json_to_vector(j.at("real"));
  Eigen::VectorXd im = j.contains("imag")
                           ? json_to_vector(j.at("imag"))
                           : Eigen::VectorXd(Eigen::VectorXd::Zero(re.size()));
  if (re.size() != im.size()) {
    throw std::invalid_argument(
        "Real and imaginary parts of complex vector differ in length");
  }
  Eigen::VectorXcd result(re.size());
  result.real() = re;
  result.imag() = im;
  return result;
}

std::tuple<int, int, int> parse_version_string(
    const std::string& version_string) {
  std::size_t first_dot = version_string.find('.');
  std::size_t second_dot = first_dot == std::string::npos
                               ? std::string::npos
                               : version_string.find('.', first_dot + 1);

  if (first_dot == std::string::npos || second_dot == std::string::npos) {
    throw std::runtime_error(
        "Invalid version string format. Expected 'major.minor.patch', got: " +
        version_string);
  }

  try {
    int major = std::stoi(version_string.substr(0, first_dot));
    int minor = std::stoi(
        version_string.substr(first_dot + 1, second_dot - first_dot - 1));
    int patch = std::stoi(version_string.substr(second_dot + 1));
    return std::make_tuple(major, minor, patch);
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        "Invalid version string format. Expected 'major.minor.patch', got: " +
        version_string);
  }
}

void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version) {
  if (expected_version == found_version) {
    return;
  }

  auto [expected_major, expected_minor, expected_patch] =
      parse_version_string(expected_version);
  auto [found_major, found_minor, found_patch] =
      parse_version_string(found_version);

  if (expected_major != found_major) {
    throw std::runtime_error(
        "Serialization version major mismatch. Expected: " + expected_version +
        ", Found: " + found_version +
        ". Major version differences are not compatible.");
  }

  if (expected_minor != found_minor) {
    throw std::runtime_error(
        "Serialization version minor mismatch. Expected: " + expected_version +
        ", Found: " + found_version +
        ". Minor version differences are not compatible.");
  }
}

}  // namespace molham::data
