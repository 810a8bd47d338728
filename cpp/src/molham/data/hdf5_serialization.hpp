// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <string>

namespace molham::data {

/**
 * @brief Write a real matrix as a row-major 2D double dataset
 */
void save_matrix_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::MatrixXd& matrix);

/**
 * @brief Write a real vector as a 1D double dataset
 */
void save_vector_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::VectorXd& vector);

/**
 * @brief Read a 2D double dataset written by save_matrix_to_group
 * @throws std::runtime_error if the dataset is not two-dimensional
 */
Eigen::MatrixXd load_matrix_from_group(H5::Group& group,
                                       const std::string& dataset_name);

/**
 * @brief Read a 1D double dataset
 */
Eigen::VectorXd load_vector_from_group(H5::Group& group,
                                       const std::string& dataset_name);

/**
 * @brief Write a variable-length string attribute
 */
void write_string_attribute(H5::H5Object& object, const std::string& name,
                            const std::string& value);

/**
 * @brief Read a variable-length string attribute
 */
std::string read_string_attribute(const H5::H5Object& object,
                                  const std::string& name);

bool dataset_exists_in_group(H5::Group& group, const std::string& dataset_name);

}  // namespace molham::data
