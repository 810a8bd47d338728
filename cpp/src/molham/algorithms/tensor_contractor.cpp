// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <memory>
#include <molham/algorithms/tensor_contractor.hpp>

#include "pairwise_contractor.hpp"

namespace molham::algorithms {

namespace {

std::unique_ptr<TensorContractor> make_pairwise_contractor() {
  return std::make_unique<PairwiseContractor>();
}

}  // namespace

void TensorContractorFactory::register_default_instances() {
  TensorContractorFactory::register_instance(&make_pairwise_contractor);
}

}  // namespace molham::algorithms
