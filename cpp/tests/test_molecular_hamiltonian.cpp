// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <filesystem>
#include <fstream>
#include <molham/data/molecular_hamiltonian.hpp>
#include <molham/exceptions.hpp>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include "testing_utilities.hpp"

using namespace molham::data;

class MolecularHamiltonianTest : public ::testing::Test {
 protected:
  void SetUp() override {
    one_body = Eigen::MatrixXd::Identity(2, 2);
    one_body(0, 1) = 0.5;
    one_body(1, 0) = 0.5;
    two_body = testing::random_two_body(2, 42);
    constant = 1.5;
  }

  void TearDown() override {
    std::filesystem::remove("test.molecular_hamiltonian.json");
    std::filesystem::remove("test.molecular_hamiltonian.h5");
    std::filesystem::remove("test.fcidump");
  }

  Eigen::MatrixXd one_body;
  Eigen::VectorXd two_body;
  double constant;
};

TEST_F(MolecularHamiltonianTest, Constructor) {
  MolecularHamiltonian h(one_body, two_body, constant);
  EXPECT_EQ(h.get_num_orbitals(), 2u);
  EXPECT_EQ(h.get_constant(), 1.5);
  EXPECT_EQ(h.get_one_body_tensor()(0, 1), std::complex<double>(0.5, 0.0));
  EXPECT_EQ(h.get_two_body_tensor().size(), 16);
  EXPECT_TRUE(h.is_real());
  EXPECT_TRUE(h.is_valid());
  EXPECT_TRUE(h.has_eightfold_symmetry());
  EXPECT_EQ(h.get_data_type_name(), "molecular_hamiltonian");
}

TEST_F(MolecularHamiltonianTest, DefaultConstantIsZero) {
  MolecularHamiltonian h(one_body, two_body);
  EXPECT_EQ(h.get_constant(), 0.0);
}

TEST_F(MolecularHamiltonianTest, ValidatesDimensions) {
  Eigen::MatrixXd rectangular = Eigen::MatrixXd::Zero(2, 3);
  EXPECT_THROW(MolecularHamiltonian(rectangular, two_body),
               std::invalid_argument);

  Eigen::VectorXd short_two_body = Eigen::VectorXd::Zero(8);
  EXPECT_THROW(MolecularHamiltonian(one_body, short_two_body),
               std::invalid_argument);

  MolecularHamiltonian unchecked(one_body, short_two_body, 0.0, false);
  EXPECT_FALSE(unchecked.is_valid());
  EXPECT_EQ(unchecked.get_num_orbitals(), 2u);
  EXPECT_FALSE(unchecked.has_eightfold_symmetry());
  EXPECT_EQ(unchecked.get_two_body_element(0, 0, 0, 1), 0.0);
  EXPECT_THROW(unchecked.get_two_body_element(1, 1, 1, 1), std::out_of_range);
  EXPECT_THROW(unchecked.get_two_body_element(1, 0, 0, 0), std::out_of_range);
}

TEST_F(MolecularHamiltonianTest, EmptyHamiltonian) {
  MolecularHamiltonian h(Eigen::MatrixXd(0, 0), Eigen::VectorXd(0), 2.0);
  EXPECT_EQ(h.get_num_orbitals(), 0u);
  EXPECT_TRUE(h.is_valid());
  EXPECT_EQ(h.get_constant(), 2.0);
}

TEST_F(MolecularHamiltonianTest, TwoBodyElementAccess) {
  MolecularHamiltonian h(one_body, two_body);
  EXPECT_EQ(MolecularHamiltonian::get_two_body_index(1, 0, 1, 1, 2), 11u);
  EXPECT_EQ(h.get_two_body_element(1, 0, 1, 1).real(), two_body(11));
  EXPECT_THROW(h.get_two_body_element(2, 0, 0, 0), std::out_of_range);
}

TEST_F(MolecularHamiltonianTest, RealityAndSymmetryChecks) {
  Eigen::MatrixXcd complex_one_body = one_body.cast<std::complex<double>>();
  complex_one_body(0, 1) = {0.5, 1e-3};
  complex_one_body(1, 0) = {0.5, -1e-3};
  Eigen::VectorXcd complex_two_body = two_body.cast<std::complex<double>>();
  MolecularHamiltonian h(complex_one_body, complex_two_body);
  EXPECT_FALSE(h.is_real());

  Eigen::VectorXd broken = two_body;
  broken(MolecularHamiltonian::get_two_body_index(0, 1, 0, 0, 2)) += 0.1;
  MolecularHamiltonian asymmetric(one_body, broken);
  EXPECT_FALSE(asymmetric.has_eightfold_symmetry());
  EXPECT_TRUE(asymmetric.has_eightfold_symmetry(0.2));
}

TEST_F(MolecularHamiltonianTest, Summary) {
  MolecularHamiltonian h(one_body, two_body, constant);
  const std::string summary = h.get_summary();
  EXPECT_NE(summary.find("Number of orbitals: 2"), std::string::npos);
  EXPECT_NE(summary.find("Real-valued: true"), std::string::npos);
}

TEST_F(MolecularHamiltonianTest, JsonSerialization) {
  Eigen::MatrixXcd complex_one_body = one_body.cast<std::complex<double>>();
  complex_one_body(0, 1) = {0.5, 0.25};
  complex_one_body(1, 0) = {0.5, -0.25};
  Eigen::VectorXcd complex_two_body = two_body.cast<std::complex<double>>();
  MolecularHamiltonian h(complex_one_body, complex_two_body, constant);

  nlohmann::json j = h.to_json();
  EXPECT_EQ(j["version"].get<std::string>(), "0.1.0");
  EXPECT_EQ(j["data_type"].get<std::string>(), "molecular_hamiltonian");
  EXPECT_EQ(j["num_orbitals"].get<size_t>(), 2u);
  EXPECT_DOUBLE_EQ(j["constant"].get<double>(), 1.5);
  EXPECT_TRUE(j["one_body_tensor"].contains("imag"));

  auto loaded = MolecularHamiltonian::from_json(j);
  EXPECT_EQ(loaded->get_num_orbitals(), 2u);
  EXPECT_DOUBLE_EQ(loaded->get_constant(), 1.5);
  EXPECT_TRUE(loaded->get_one_body_tensor().isApprox(complex_one_body));
  EXPECT_TRUE(loaded->get_two_body_tensor().isApprox(complex_two_body));

  j.erase("version");
  EXPECT_THROW(MolecularHamiltonian::from_json(j), std::runtime_error);

  nlohmann::json wrong_version = h.to_json();
  wrong_version["version"] = "1.0.0";
  EXPECT_THROW(MolecularHamiltonian::from_json(wrong_version),
               std::runtime_error);
}

TEST_F(MolecularHamiltonianTest, JsonFileRoundTrip) {
  MolecularHamiltonian h(one_body, two_body, constant);
  h.to_json_file("test.molecular_hamiltonian.json");
  ASSERT_TRUE(std::filesystem::exists("test.molecular_hamiltonian.json"));

  auto loaded =
      MolecularHamiltonian::from_json_file("test.molecular_hamiltonian.json");
  EXPECT_TRUE(loaded->get_one_body_tensor().isApprox(h.get_one_body_tensor()));
  EXPECT_TRUE(loaded->get_two_body_tensor().isApprox(h.get_two_body_tensor()));
  EXPECT_DOUBLE_EQ(loaded->get_constant(), constant);

  auto generic =
      MolecularHamiltonian::from_file("test.molecular_hamiltonian.json", "json");
  EXPECT_EQ(generic->get_num_orbitals(), 2u);
}

TEST_F(MolecularHamiltonianTest, Hdf5FileRoundTrip) {
  Eigen::MatrixXcd complex_one_body = one_body.cast<std::complex<double>>();
  complex_one_body(1, 1) = {1.0, 0.125};
  MolecularHamiltonian h(complex_one_body,
                         Eigen::VectorXcd(two_body.cast<std::complex<double>>()),
                         constant);
  h.to_file("test.molecular_hamiltonian.h5", "hdf5");
  ASSERT_TRUE(std::filesystem::exists("test.molecular_hamiltonian.h5"));

  auto loaded =
      MolecularHamiltonian::from_hdf5_file("test.molecular_hamiltonian.h5");
  EXPECT_TRUE(loaded->get_one_body_tensor().isApprox(complex_one_body));
  EXPECT_TRUE(loaded->get_two_body_tensor().isApprox(h.get_two_body_tensor()));
  EXPECT_DOUBLE_EQ(loaded->get_constant(), constant);
  EXPECT_FALSE(loaded->is_real());
}

TEST_F(MolecularHamiltonianTest, FilenameValidation) {
  MolecularHamiltonian h(one_body, two_body);
  EXPECT_THROW(h.to_json_file("test.json"), std::invalid_argument);
  EXPECT_THROW(h.to_json_file("test.hamiltonian.json"), std::invalid_argument);
  EXPECT_THROW(h.to_hdf5_file("test.h5"), std::invalid_argument);
  EXPECT_THROW(h.to_file("test.molecular_hamiltonian.xml", "xml"),
               std::invalid_argument);
  EXPECT_THROW(
      MolecularHamiltonian::from_json_file("missing.molecular_hamiltonian.json"),
      std::runtime_error);
  EXPECT_THROW(
      MolecularHamiltonian::from_hdf5_file("missing.molecular_hamiltonian.h5"),
      std::runtime_error);
}

namespace {

using FcidumpEntry = std::tuple<double, int, int, int, int>;

std::vector<FcidumpEntry> read_fcidump_entries(const std::string& filename,
                                               std::string& header) {
  std::ifstream file(filename);
  std::string line;
  std::vector<FcidumpEntry> entries;
  bool in_header = true;
  while (std::getline(file, line)) {
    if (in_header) {
      header += line + "\n";
      in_header = line.find("&END") == std::string::npos;
      continue;
    }
    std::istringstream iss(line);
    double value;
    int i, j, k, l;
    iss >> value >> i >> j >> k >> l;
    entries.emplace_back(value, i, j, k, l);
  }
  return entries;
}

}  // namespace

TEST_F(MolecularHamiltonianTest, FcidumpSingleOrbital) {
  Eigen::MatrixXd h1(1, 1);
  h1 << -1.25;
  Eigen::VectorXd h2(1);
  h2 << 0.5;
  MolecularHamiltonian h(h1, h2, 0.75);
  h.to_fcidump_file("test.fcidump", 1, 1);

  std::string header;
  auto entries = read_fcidump_entries("test.fcidump", header);
  EXPECT_NE(header.find("NORB=1"), std::string::npos);
  EXPECT_NE(header.find("NELEC=2"), std::string::npos);
  EXPECT_NE(header.find("MS2=0"), std::string::npos);
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0], FcidumpEntry(0.5, 1, 1, 1, 1));
  EXPECT_EQ(entries[1], FcidumpEntry(-1.25, 1, 1, 0, 0));
  EXPECT_EQ(entries[2], FcidumpEntry(0.75, 0, 0, 0, 0));
}

TEST_F(MolecularHamiltonianTest, FcidumpUniqueEntries) {
  MolecularHamiltonian h(one_body, two_body, constant);
  h.to_fcidump_file("test.fcidump", 2, 1);

  std::string header;
  auto entries = read_fcidump_entries("test.fcidump", header);
  EXPECT_NE(header.find("MS2=1"), std::string::npos);
  // 6 unique (ij|kl), 3 one-body entries, the constant
  ASSERT_EQ(entries.size(), 10u);
  for (const auto& [value, i, j, k, l] : entries) {
    if (k > 0) {
      EXPECT_LE(i, j);
      EXPECT_LE(k, l);
      const auto expected =
          h.get_two_body_element(i - 1, j - 1, k - 1, l - 1).real();
      EXPECT_NEAR(value, expected, testing::small_value_tolerance);
    }
  }
}

TEST_F(MolecularHamiltonianTest, FcidumpRejectsComplex) {
  Eigen::MatrixXcd complex_one_body = one_body.cast<std::complex<double>>();
  complex_one_body(0, 0) = {1.0, 0.5};
  MolecularHamiltonian h(complex_one_body,
                         Eigen::VectorXcd(two_body.cast<std::complex<double>>()));
  EXPECT_THROW(h.to_fcidump_file("test.fcidump", 1, 1),
               molham::UnsupportedOperationError);
}

TEST_F(MolecularHamiltonianTest, FcidumpRejectsInconsistentTensors) {
  MolecularHamiltonian h(one_body, Eigen::VectorXd(Eigen::VectorXd::Zero(8)),
                         constant, false);
  EXPECT_THROW(h.to_fcidump_file("test.fcidump", 1, 1), std::invalid_argument);
}
