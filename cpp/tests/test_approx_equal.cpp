// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <molham/data/data_class.hpp>
#include <molham/utils/approx_equal.hpp>
#include <stdexcept>
#include <string>

#include "testing_utilities.hpp"

using namespace molham::data;
using molham::utils::approx_eq;
using molham::utils::approx_equal;
using molham::utils::ComparisonResult;

namespace {

class Label : public DataClass {
 public:
  std::string get_data_type_name() const override { return "label"; }
  std::string get_summary() const override { return "Label"; }
  void to_file(const std::string&, const std::string&) const override {
    throw std::logic_error("not serializable");
  }
  nlohmann::json to_json() const override { return {{"label", "x"}}; }
  void to_json_file(const std::string&) const override {
    throw std::logic_error("not serializable");
  }
  void to_hdf5(H5::Group&) const override {
    throw std::logic_error("not serializable");
  }
  void to_hdf5_file(const std::string&) const override {
    throw std::logic_error("not serializable");
  }
};

}  // namespace

class ApproxEqualTest : public ::testing::Test {
 protected:
  void SetUp() override {
    one_body = testing::random_one_body(2, 1);
    two_body = testing::random_two_body(2, 2);
  }

  Eigen::MatrixXd one_body;
  Eigen::VectorXd two_body;
};

TEST_F(ApproxEqualTest, IdenticalHamiltoniansAreEqual) {
  MolecularHamiltonian a(one_body, two_body, 1.0);
  MolecularHamiltonian b(one_body, two_body, 1.0);
  EXPECT_EQ(approx_eq(a, b), ComparisonResult::equal);
  EXPECT_TRUE(approx_equal(a, b));
  EXPECT_TRUE(approx_equal(a, a));
}

TEST_F(ApproxEqualTest, ToleranceOnEveryComponent) {
  MolecularHamiltonian reference(one_body, two_body, 100.0);

  MolecularHamiltonian shifted_constant(one_body, two_body, 100.0 + 5e-4);
  EXPECT_TRUE(approx_equal(shifted_constant, reference));
  EXPECT_FALSE(approx_equal(shifted_constant, reference, 0.0, 1e-8));

  Eigen::MatrixXd perturbed_one_body = one_body;
  perturbed_one_body(1, 0) += 1e-3;
  MolecularHamiltonian one(perturbed_one_body, two_body, 100.0);
  EXPECT_EQ(approx_eq(one, reference), ComparisonResult::not_equal);
  EXPECT_TRUE(approx_equal(one, reference, 0.0, 1e-2));

  Eigen::VectorXd perturbed_two_body = two_body;
  perturbed_two_body(5) += 1e-3;
  MolecularHamiltonian two(one_body, perturbed_two_body, 100.0);
  EXPECT_EQ(approx_eq(two, reference), ComparisonResult::not_equal);
}

TEST_F(ApproxEqualTest, ImaginaryPartsAreCompared) {
  MolecularHamiltonian real(one_body, two_body);
  Eigen::MatrixXcd complex_one_body = one_body.cast<std::complex<double>>();
  complex_one_body(0, 0) += std::complex<double>(0.0, 1e-3);
  MolecularHamiltonian complex_valued(
      complex_one_body,
      Eigen::VectorXcd(two_body.cast<std::complex<double>>()));
  EXPECT_FALSE(approx_equal(real, complex_valued));
}

TEST_F(ApproxEqualTest, DifferentOrbitalCountsAreNotEqual) {
  MolecularHamiltonian two_orbitals(one_body, two_body);
  MolecularHamiltonian three_orbitals(testing::random_one_body(3, 1),
                                      testing::random_two_body(3, 2));
  EXPECT_EQ(approx_eq(two_orbitals, three_orbitals),
            ComparisonResult::not_equal);
}

TEST_F(ApproxEqualTest, ForeignTypeIsNotComparable) {
  MolecularHamiltonian h(one_body, two_body);
  Label label;
  EXPECT_EQ(approx_eq(h, label), ComparisonResult::not_comparable);
  EXPECT_FALSE(approx_equal(h, label));
}
