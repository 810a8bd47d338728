// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "hdf5_serialization.hpp"

#include <stdexcept>

namespace molham::data {

namespace {

using RowMajorMatrixXd =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

}  // namespace

void save_matrix_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::MatrixXd& matrix) {
  const RowMajorMatrixXd row_major = matrix;
  hsize_t dims[2] = {static_cast<hsize_t>(matrix.rows()),
                     static_cast<hsize_t>(matrix.cols())};
  H5::DataSpace dataspace(2, dims);
  H5::DataSet dataset =
      group.createDataSet(dataset_name, H5::PredType::NATIVE_DOUBLE, dataspace);
  if (row_major.size() > 0) {
    dataset.write(row_major.data(), H5::PredType::NATIVE_DOUBLE);
  }
}

void save_vector_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::VectorXd& vector) {
  hsize_t dims[1] = {static_cast<hsize_t>(vector.size())};
  H5::DataSpace dataspace(1, dims);
  H5::DataSet dataset =
      group.createDataSet(dataset_name, H5::PredType::NATIVE_DOUBLE, dataspace);
  if (vector.size() > 0) {
    dataset.write(vector.data(), H5::PredType::NATIVE_DOUBLE);
  }
}

Eigen::MatrixXd load_matrix_from_group(H5::Group& group,
                                       const std::string& dataset_name) {
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  if (dataspace.getSimpleExtentNdims() != 2) {
    throw std::runtime_error("Dataset '" + dataset_name +
                             "' is not two-dimensional");
  }
  hsize_t dims[2];
  dataspace.getSimpleExtentDims(dims);
  RowMajorMatrixXd matrix(static_cast<Eigen::Index>(dims[0]),
                          static_cast<Eigen::Index>(dims[1]));
  if (matrix.size() > 0) {
    dataset.read(matrix.data(), H5::PredType::NATIVE_DOUBLE);
  }
  return matrix;
}

Eigen::VectorXd load_vector_from_group(H5::Group& group,
                                       const std::string& dataset_name) {
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  hsize_t size = dataspace.getSimpleExtentNpoints();
  Eigen::VectorXd vector(static_cast<Eigen::Index>(size));
  if (size > 0) {
    dataset.read(vector.data(), H5::PredType::NATIVE_DOUBLE);
  }
  return vector;
}

void write_string_attribute(H5::H5Object& object, const std::string& name,
                            const std::string& value) {
  H5::DataSpace scalar_space(H5S_SCALAR);
  H5::StrType string_type(H5::PredType::C_S1, H5T_VARIABLE);
  H5::Attribute attribute =
      object.createAttribute(name, string_type, scalar_space);
  attribute.write(string_type, value);
}

std::string read_string_attribute(const H5::H5Object& object,
                                  const std::string& name) {
  H5::StrType string_type(H5::PredType::C_S1, H5T_VARIABLE);
  H5::Attribute attribute = object.openAttribute(name);
  std::string value;
  attribute.read(string_type, value);
  return value;
}

bool dataset_exists_in_group(H5::Group& group,
                             const std::string& dataset_name) {
  return group.nameExists(dataset_name);
}

}  // namespace molham::data
