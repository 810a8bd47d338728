// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <molham/algorithms/algorithm.hpp>
#include <molham/data/settings.hpp>
#include <molham/utils/tensor.hpp>
#include <string>
#include <vector>

namespace molham::algorithms {

/**
 * @brief Options shared by tensor contraction engines
 *
 * - "optimize" (string, default "greedy"): contraction-path strategy hint,
 *   one of "greedy", "optimal", "none". Engines that evaluate in a fixed
 *   order record the hint without acting on it.
 */
class TensorContractionSettings : public data::Settings {
 public:
  TensorContractionSettings() {
    set_default("optimize", "greedy", "Contraction path optimization strategy",
                std::vector<const char*>{"greedy", "optimal", "none"});
  }
};

/**
 * @brief Engine evaluating Einstein-summation contractions of labelled
 * operands
 *
 * The subscripts follow the usual einsum notation: one group of single-letter
 * labels per operand separated by commas, optionally followed by "->" and the
 * output labels. Labels shared between operands and absent from the output
 * are summed over. Without "->" the output consists of the labels occurring
 * exactly once, in alphabetical order.
 *
 * @code
 * auto contractor = TensorContractorFactory::create();
 * utils::Tensor c = contractor->run("ij,jk->ik", {a, b});
 * @endcode
 */
class TensorContractor
    : public Algorithm<TensorContractor, utils::Tensor, const std::string&,
                       const std::vector<utils::Tensor>&> {
 public:
  TensorContractor() { _settings = std::make_unique<TensorContractionSettings>(); }
  ~TensorContractor() override = default;

  std::string type_name() const final { return "tensor_contractor"; }
};

/**
 * @brief Factory for tensor contraction engines
 *
 * Registered by default: "pairwise" (alias "einsum"), which contracts the
 * operands left to right with one matrix product per step.
 */
struct TensorContractorFactory
    : public AlgorithmFactory<TensorContractor, TensorContractorFactory> {
  static std::string algorithm_type_name() { return "tensor_contractor"; }
  static std::string default_algorithm_name() { return "pairwise"; }
  static void register_default_instances();
};

}  // namespace molham::algorithms
