// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

namespace H5 {
class Group;
}

#include <concepts>
#include <nlohmann/json.hpp>
#include <string>

namespace molham::data {

/**
 * @brief Common interface of all serializable molham data objects
 *
 * Implementations are immutable value types. The interface also serves as the
 * common base through which unrelated data objects can be compared: a
 * comparison against an object of another concrete type is reported as not
 * comparable rather than as unequal.
 */
class DataClass {
 public:
  virtual ~DataClass() = default;

  /**
   * @brief Name used in file suffixes and serialized payloads
   * @return e.g. "molecular_hamiltonian"
   */
  virtual std::string get_data_type_name() const = 0;

  /**
   * @brief Human readable multi-line summary
   */
  virtual std::string get_summary() const = 0;

  /**
   * @brief Save object to file in the specified format
   * @param filename Path to the output file
   * @param type Format type ("json" or "hdf5")
   * @throws std::invalid_argument if format type is not supported
   * @throws std::runtime_error if I/O error occurs
   */
  virtual void to_file(const std::string& filename,
                       const std::string& type) const = 0;

  /**
   * @brief Convert object to JSON representation
   */
  virtual nlohmann::json to_json() const = 0;

  /**
   * @brief Save object to JSON file
   * @throws std::runtime_error if I/O error occurs
   */
  virtual void to_json_file(const std::string& filename) const = 0;

  /**
   * @brief Save object into an open HDF5 group
   * @throws std::runtime_error if I/O error occurs
   */
  virtual void to_hdf5(H5::Group& group) const = 0;

  /**
   * @brief Save object to HDF5 file
   * @throws std::runtime_error if I/O error occurs
   */
  virtual void to_hdf5_file(const std::string& filename) const = 0;

 protected:
  DataClass() = default;
  DataClass(const DataClass& other) = default;
  DataClass& operator=(const DataClass& other) = default;
  DataClass(DataClass&& other) = default;
  DataClass& operator=(DataClass&& other) = default;
};

/**
 * @brief Concept requiring DataClass inheritance and the static
 * deserialization entry points
 */
template <typename T>
concept DataClassCompliant = std::derived_from<T, DataClass> && requires {
  T::from_file(std::declval<std::string>(), std::declval<std::string>());
} && requires { T::from_json_file(std::declval<std::string>()); } && requires {
  T::from_json(std::declval<nlohmann::json>());
} && requires { T::from_hdf5_file(std::declval<std::string>()); } && requires {
  T::from_hdf5(std::declval<H5::Group&>());
};

}  // namespace molham::data
