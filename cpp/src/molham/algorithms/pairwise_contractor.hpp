// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <molham/algorithms/tensor_contractor.hpp>
#include <string>
#include <vector>

namespace molham::algorithms {

/**
 * @brief Parsed einsum subscripts
 */
struct EinsumExpression {
  std::vector<std::string> inputs;
  std::string output;
};

/**
 * @brief Parse and validate einsum subscripts against operand ranks
 *
 * @throws std::invalid_argument for malformed subscripts, rank mismatches,
 * repeated labels within one operand or the output, and output labels that
 * no operand carries
 */
EinsumExpression parse_einsum(const std::string& subscripts,
                              const std::vector<size_t>& operand_ranks);

/**
 * @brief Left-to-right pairwise contraction engine
 *
 * Labels appearing in a single operand and not in the output are summed out
 * first. Each subsequent step shuffles the running intermediate and the next
 * operand into matricized form and contracts them over their shared labels
 * with Eigen::Tensor::contract. A shared label that is still needed
 * by a later operand or the output (a batch label) is rejected.
 */
class PairwiseContractor : public TensorContractor {
 public:
  PairwiseContractor() = default;
  ~PairwiseContractor() override = default;

  std::string name() const override { return "pairwise"; }
  std::vector<std::string> aliases() const override {
    return {"pairwise", "einsum"};
  }

 protected:
  utils::Tensor _run_impl(
      const std::string& subscripts,
      const std::vector<utils::Tensor>& operands) const override;
};

}  // namespace molham::algorithms
