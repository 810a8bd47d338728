// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <tuple>

namespace molham::data {

/**
 * @file json_serialization.hpp
 * @brief JSON helpers for Eigen containers and serialization versions
 */

/**
 * @brief Validate serialization version compatibility
 *
 * Major and minor components must match; patch differences are accepted.
 *
 * @throws std::runtime_error on a major or minor mismatch or a malformed
 * version string
 */
void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version);

/**
 * @brief Split "major.minor.patch" into its integer components
 * @throws std::runtime_error if the format is invalid
 */
std::tuple<int, int, int> parse_version_string(
    const std::string& version_string);

/// Row-major nested array
nlohmann::json matrix_to_json(const Eigen::MatrixXd& matrix);

nlohmann::json vector_to_json(const Eigen::VectorXd& vector);

/**
 * @throws std::invalid_argument for ragged or non-array input
 */
Eigen::MatrixXd json_to_matrix(const nlohmann::json& j);

/**
 * @throws std::invalid_argument for non-array input
 */
Eigen::VectorXd json_to_vector(const nlohmann::json& j);

/**
 * @brief Complex matrix as {"real": [[...]], "imag": [[...]]}
 */
nlohmann::json complex_matrix_to_json(const Eigen::MatrixXcd& matrix);

nlohmann::json complex_vector_to_json(const Eigen::VectorXcd& vector);

/**
 * @brief Inverse of complex_matrix_to_json; an absent "imag" part reads as 0
 * @throws std::invalid_argument on missing or mismatched parts
 */
Eigen::MatrixXcd json_to_complex_matrix(const nlohmann::json& j);

Eigen::VectorXcd json_to_complex_vector(const nlohmann::json& j);

}  // namespace molham::data
