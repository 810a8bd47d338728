// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <molham/algorithms/tensor_contractor.hpp>
#include <molham/data/settings.hpp>
#include <molham/utils/tensor.hpp>

#include "../src/molham/algorithms/pairwise_contractor.hpp"
#include "testing_utilities.hpp"

using namespace molham::algorithms;
using molham::utils::Tensor;

namespace {

Eigen::MatrixXcd random_matrix(Eigen::Index rows, Eigen::Index cols) {
  return Eigen::MatrixXcd::Random(rows, cols);
}

class FirstOperandContractor : public TensorContractor {
 public:
  std::string name() const override { return "first_operand"; }

 protected:
  Tensor _run_impl(const std::string&,
                   const std::vector<Tensor>& operands) const override {
    return operands.front();
  }
};

}  // namespace

class TensorContractorTest : public ::testing::Test {
 protected:
  void SetUp() override { contractor = TensorContractorFactory::create(); }

  std::unique_ptr<TensorContractor> contractor;
};

TEST_F(TensorContractorTest, DefaultIsPairwise) {
  EXPECT_EQ(contractor->name(), "pairwise");
  EXPECT_EQ(contractor->type_name(), "tensor_contractor");
  EXPECT_TRUE(TensorContractorFactory::has("einsum"));
  EXPECT_EQ(TensorContractorFactory::create("einsum")->name(), "pairwise");
  EXPECT_THROW(TensorContractorFactory::create("no_such_engine"),
               std::runtime_error);
}

TEST_F(TensorContractorTest, RegisterCustomEngine) {
  TensorContractorFactory::register_instance(
      [] { return std::make_unique<FirstOperandContractor>(); });
  EXPECT_TRUE(TensorContractorFactory::has("first_operand"));
  EXPECT_THROW(TensorContractorFactory::register_instance(
                   [] { return std::make_unique<FirstOperandContractor>(); }),
               std::runtime_error);
  EXPECT_TRUE(TensorContractorFactory::unregister_instance("first_operand"));
  EXPECT_FALSE(TensorContractorFactory::has("first_operand"));
}

TEST_F(TensorContractorTest, MatrixProduct) {
  const Eigen::MatrixXcd a = random_matrix(3, 4);
  const Eigen::MatrixXcd b = random_matrix(4, 2);
  Tensor c = contractor->run("ij,jk->ik",
                             {Tensor::from_matrix(a), Tensor::from_matrix(b)});
  EXPECT_TRUE(c.to_matrix().isApprox(a * b, testing::small_value_tolerance));

  Tensor ct = contractor->run("ij,jk->ki",
                              {Tensor::from_matrix(a), Tensor::from_matrix(b)});
  EXPECT_TRUE(ct.to_matrix().isApprox((a * b).transpose(),
                                      testing::small_value_tolerance));
}

TEST_F(TensorContractorTest, ImplicitOutputIsSorted) {
  const Eigen::MatrixXcd a = random_matrix(2, 3);
  const Eigen::MatrixXcd b = random_matrix(3, 5);
  // Free labels i and k, output "ik"
  Tensor c = contractor->run("ij,jk",
                             {Tensor::from_matrix(a), Tensor::from_matrix(b)});
  EXPECT_EQ(c.shape(), (std::vector<size_t>{2, 5}));
  EXPECT_TRUE(c.to_matrix().isApprox(a * b, testing::small_value_tolerance));
}

TEST_F(TensorContractorTest, SumsLabelsOnlyOneOperandCarries) {
  const Eigen::MatrixXcd a = random_matrix(3, 3);
  Tensor rows = contractor->run("ij->i", {Tensor::from_matrix(a)});
  ASSERT_EQ(rows.shape(), (std::vector<size_t>{3}));
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_NEAR(std::abs(rows.at({i}) - a.row(i).sum()), 0.0,
                testing::small_value_tolerance);
  }

  Tensor full = contractor->run("ij,jk->", {Tensor::from_matrix(a),
                                            Tensor::from_matrix(a)});
  EXPECT_EQ(full.rank(), 0u);
  EXPECT_NEAR(std::abs(full.data()(0) - (a * a).sum()), 0.0,
              testing::small_value_tolerance);
}

TEST_F(TensorContractorTest, BasisTransformationOfFourIndexTensor) {
  const size_t n = 3;
  const Eigen::VectorXcd h2 = testing::random_two_body(n, 11).cast<
      std::complex<double>>();
  const Eigen::MatrixXcd u = testing::random_unitary(n, 5);
  const Tensor tu = Tensor::from_matrix(u);
  const Tensor tuc = tu.conjugate();

  Tensor result = contractor->run("abcd,Aa,Bb,Cc,Dd->ABCD",
                                  {Tensor::from_four_index(h2, n), tu, tuc,
                                   tu, tuc});
  ASSERT_EQ(result.shape(), (std::vector<size_t>{n, n, n, n}));

  // Element (A,B,C,D) = (0,1,2,1) by explicit summation
  std::complex<double> expected = 0.0;
  for (size_t a = 0; a < n; ++a)
    for (size_t b = 0; b < n; ++b)
      for (size_t c = 0; c < n; ++c)
        for (size_t d = 0; d < n; ++d)
          expected += h2(((a * n + b) * n + c) * n + d) * u(0, a) *
                      std::conj(u(1, b)) * u(2, c) * std::conj(u(1, d));
  EXPECT_NEAR(std::abs(result.at({0, 1, 2, 1}) - expected), 0.0,
              testing::small_value_tolerance);
}

TEST_F(TensorContractorTest, RejectsInvalidSubscripts) {
  const Tensor m = Tensor::from_matrix(random_matrix(2, 2));
  const Tensor v = Tensor::from_matrix(random_matrix(3, 3));
  EXPECT_THROW(contractor->run("ii->i", {m}), std::invalid_argument);
  EXPECT_THROW(contractor->run("ijk->i", {m}), std::invalid_argument);
  EXPECT_THROW(contractor->run("ij,jk->ik", {m}), std::invalid_argument);
  EXPECT_THROW(contractor->run("ij,jk->ik", {m, v}), std::invalid_argument);
  EXPECT_THROW(contractor->run("ij->iz", {m}), std::invalid_argument);
  EXPECT_THROW(contractor->run("i1->i", {m}), std::invalid_argument);
  // Hadamard-style batch label
  EXPECT_THROW(contractor->run("ij,ij->ij", {m, m}), std::invalid_argument);
  EXPECT_THROW(contractor->run("ij", {}), std::invalid_argument);
}

TEST_F(TensorContractorTest, SettingsLockAfterRun) {
  contractor->settings().set("optimize", "none");
  const Tensor m = Tensor::from_matrix(random_matrix(2, 2));
  contractor->run("ij,jk->ik", {m, m});
  EXPECT_TRUE(contractor->settings().is_locked());
  EXPECT_THROW(contractor->settings().set("optimize", "greedy"),
               molham::data::SettingsAreLocked);
}

TEST(ParseEinsumTest, SplitsOperandsAndOutput) {
  EinsumExpression expr = parse_einsum("ab, Aa ,Bb -> AB", {2, 2, 2});
  ASSERT_EQ(expr.inputs.size(), 3u);
  EXPECT_EQ(expr.inputs[0], "ab");
  EXPECT_EQ(expr.inputs[1], "Aa");
  EXPECT_EQ(expr.inputs[2], "Bb");
  EXPECT_EQ(expr.output, "AB");

  EXPECT_EQ(parse_einsum("ij,jk", {2, 2}).output, "ik");
  EXPECT_EQ(parse_einsum("ij,ji", {2, 2}).output, "");
}

TEST(TensorTest, ConstructionAndAccess) {
  Tensor t({2, 3});
  EXPECT_EQ(t.size(), 6u);
  EXPECT_EQ(t.rank(), 2u);
  t.at({1, 2}) = {1.0, -2.0};
  EXPECT_EQ(t.data()(5), std::complex<double>(1.0, -2.0));
  EXPECT_THROW(t.at({2, 0}), std::out_of_range);
  EXPECT_THROW(t.at({0}), std::out_of_range);
  EXPECT_THROW(Tensor({2, 2}, Eigen::VectorXcd::Zero(3)),
               std::invalid_argument);
  EXPECT_THROW(Tensor({2, 2, 2}).to_matrix(), std::logic_error);
}

TEST(TensorTest, TransposeAndConjugate) {
  Eigen::MatrixXcd m(2, 3);
  m << std::complex<double>(1, 1), 2, 3, 4, 5, std::complex<double>(6, -1);
  const Tensor t = Tensor::from_matrix(m);
  EXPECT_TRUE(t.transpose({1, 0}).to_matrix().isApprox(m.transpose()));
  EXPECT_TRUE(t.conjugate().to_matrix().isApprox(m.conjugate()));
  EXPECT_THROW(t.transpose({0, 0}), std::invalid_argument);

  Tensor cube({2, 3, 4});
  cube.at({1, 2, 3}) = 7.0;
  const Tensor moved = cube.transpose({2, 0, 1});
  EXPECT_EQ(moved.shape(), (std::vector<size_t>{4, 2, 3}));
  EXPECT_EQ(moved.at({3, 1, 2}), std::complex<double>(7.0, 0.0));
}

TEST(TensorTest, RankLimit) {
  EXPECT_NO_THROW(Tensor(std::vector<size_t>(Tensor::max_rank, 1)));
  EXPECT_THROW(Tensor(std::vector<size_t>(Tensor::max_rank + 1, 1)),
               std::invalid_argument);

  Tensor scalar(std::vector<size_t>{});
  EXPECT_EQ(scalar.size(), 1u);
  scalar.at({}) = 2.5;
  EXPECT_EQ(scalar.transpose({}).at({}), std::complex<double>(2.5, 0.0));
}

TEST(TensorTest, HigherRankTranspose) {
  Tensor t({2, 1, 3, 2, 2});
  for (Eigen::Index i = 0; i < t.data().size(); ++i) {
    t.data()(i) = static_cast<double>(i);
  }
  const Tensor moved = t.transpose({4, 2, 0, 3, 1});
  EXPECT_EQ(moved.shape(), (std::vector<size_t>{2, 3, 2, 2, 1}));
  for (size_t a = 0; a < 2; ++a)
    for (size_t c = 0; c < 3; ++c)
      for (size_t d = 0; d < 2; ++d)
        for (size_t e = 0; e < 2; ++e) {
          EXPECT_EQ(moved.at({e, c, a, d, 0}), t.at({a, 0, c, d, e}));
        }
}

TEST_F(TensorContractorTest, ZeroExtentContraction) {
  const Tensor a({2, 0});
  const Tensor b({0, 3});
  const Tensor c = contractor->run("ij,jk->ik", {a, b});
  EXPECT_EQ(c.shape(), (std::vector<size_t>{2, 3}));
  EXPECT_TRUE(c.data().isZero());

  const Tensor empty_rows = contractor->run("ij->i", {Tensor({0, 4})});
  EXPECT_EQ(empty_rows.size(), 0u);
}
