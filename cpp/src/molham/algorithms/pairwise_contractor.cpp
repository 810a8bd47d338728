// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "pairwise_contractor.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <molham/utils/logger.hpp>
#include <stdexcept>
#include <unsupported/Eigen/CXX11/Tensor>

namespace molham::algorithms {

namespace {

using Matricized =
    Eigen::Tensor<std::complex<double>, 2, Eigen::RowMajor>;
using MatricizedView = Eigen::TensorMap<const Matricized>;
using ReducedView =
    Eigen::TensorMap<Eigen::Tensor<std::complex<double>, 1, Eigen::RowMajor>>;

bool contains(const std::string& labels, char label) {
  return labels.find(label) != std::string::npos;
}

void check_unique_labels(const std::string& labels, const std::string& where) {
  for (size_t i = 0; i < labels.size(); ++i) {
    if (labels.find(labels[i], i + 1) != std::string::npos) {
      throw std::invalid_argument("Label '" + std::string(1, labels[i]) +
                                  "' repeated in " + where + " '" + labels +
                                  "'; diagonal extraction is not supported");
    }
  }
}

size_t extent_product(const std::string& labels,
                      const std::map<char, size_t>& dims) {
  size_t product = 1;
  for (char label : labels) {
    product *= dims.at(label);
  }
  return product;
}

std::vector<size_t> extents(const std::string& labels,
                            const std::map<char, size_t>& dims) {
  std::vector<size_t> shape;
  shape.reserve(labels.size());
  for (char label : labels) {
    shape.push_back(dims.at(label));
  }
  return shape;
}

// Permutation taking a tensor labelled `from` to the label order `to`
std::vector<size_t> permutation(const std::string& from,
                                const std::string& to) {
  std::vector<size_t> perm;
  perm.reserve(to.size());
  for (char label : to) {
    perm.push_back(from.find(label));
  }
  return perm;
}

// Sum a tensor over every label not listed in `keep`; returns the reduced
// tensor labelled by `keep` in its original relative order
utils::Tensor sum_out(const utils::Tensor& tensor, const std::string& labels,
                      const std::string& keep,
                      const std::map<char, size_t>& dims) {
  std::string reduced;
  for (char label : labels) {
    if (!contains(keep, label)) {
      reduced.push_back(label);
    }
  }
  if (reduced.empty()) {
    return tensor;
  }

  utils::Tensor summed(extents(keep, dims));
  const auto rows = static_cast<Eigen::Index>(extent_product(keep, dims));
  const auto cols = static_cast<Eigen::Index>(extent_product(reduced, dims));
  if (rows == 0 || cols == 0) {
    return summed;
  }

  utils::Tensor permuted = tensor.transpose(permutation(labels, keep + reduced));
  MatricizedView view(permuted.data().data(), rows, cols);
  ReducedView target(summed.data().data(), rows);
  target = view.sum(Eigen::array<Eigen::Index, 1>{1});
  return summed;
}

}  // namespace

EinsumExpression parse_einsum(const std::string& subscripts,
                              const std::vector<size_t>& operand_ranks) {
  std::string compact;
  for (char c : subscripts) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      compact.push_back(c);
    }
  }

  EinsumExpression expr;
  std::string lhs = compact;
  const size_t arrow = compact.find("->");
  const bool explicit_output = arrow != std::string::npos;
  if (explicit_output) {
    lhs = compact.substr(0, arrow);
    expr.output = compact.substr(arrow + 2);
  }

  size_t start = 0;
  while (true) {
    size_t comma = lhs.find(',', start);
    expr.inputs.push_back(lhs.substr(start, comma - start));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }

  if (expr.inputs.size() != operand_ranks.size()) {
    throw std::invalid_argument(
        "Einsum subscripts '" + subscripts + "' name " +
        std::to_string(expr.inputs.size()) + " operands but " +
        std::to_string(operand_ranks.size()) + " were given");
  }

  std::map<char, size_t> occurrences;
  for (size_t i = 0; i < expr.inputs.size(); ++i) {
    const std::string& labels = expr.inputs[i];
    for (char label : labels) {
      if (!std::isalpha(static_cast<unsigned char>(label))) {
        throw std::invalid_argument("Invalid einsum label '" +
                                    std::string(1, label) + "' in '" +
                                    subscripts + "'");
      }
      ++occurrences[label];
    }
    if (labels.size() != operand_ranks[i]) {
      throw std::invalid_argument(
          "Operand " + std::to_string(i) + " has rank " +
          std::to_string(operand_ranks[i]) + " but subscripts '" + labels +
          "' name " + std::to_string(labels.size()) + " axes");
    }
    check_unique_labels(labels, "operand subscripts");
  }

  if (!explicit_output) {
    for (const auto& [label, count] : occurrences) {
      if (count == 1) {
        expr.output.push_back(label);
      }
    }
  }

  check_unique_labels(expr.output, "output subscripts");
  for (char label : expr.output) {
    if (occurrences.find(label) == occurrences.end()) {
      throw std::invalid_argument("Output label '" + std::string(1, label) +
                                  "' does not appear in any operand of '" +
                                  subscripts + "'");
    }
  }
  return expr;
}

utils::Tensor PairwiseContractor::_run_impl(
    const std::string& subscripts,
    const std::vector<utils::Tensor>& operands) const {
  MOLHAM_LOG_TRACE_ENTERING();
  if (operands.empty()) {
    throw std::invalid_argument("Einsum requires at least one operand");
  }

  std::vector<size_t> ranks;
  ranks.reserve(operands.size());
  for (const auto& operand : operands) {
    ranks.push_back(operand.rank());
  }
  const EinsumExpression expr = parse_einsum(subscripts, ranks);

  std::map<char, size_t> dims;
  for (size_t i = 0; i < operands.size(); ++i) {
    const auto& shape = operands[i].shape();
    for (size_t axis = 0; axis < shape.size(); ++axis) {
      char label = expr.inputs[i][axis];
      auto [it, inserted] = dims.emplace(label, shape[axis]);
      if (!inserted && it->second != shape[axis]) {
        throw std::invalid_argument(
            "Extent mismatch for label '" + std::string(1, label) + "': " +
            std::to_string(it->second) + " vs " + std::to_string(shape[axis]));
      }
    }
  }

  MOLHAM_LOGGER().trace("Contracting '{}' with optimize hint '{}'", subscripts,
                        _settings->get<std::string>("optimize"));

  auto needed_after = [&](char label, size_t operand_index) {
    if (contains(expr.output, label)) {
      return true;
    }
    for (size_t j = operand_index + 1; j < expr.inputs.size(); ++j) {
      if (contains(expr.inputs[j], label)) {
        return true;
      }
    }
    return false;
  };

  // Labels of operand i that some other operand or the output still uses
  auto kept_labels = [&](size_t i) {
    std::string keep;
    for (char label : expr.inputs[i]) {
      bool used = contains(expr.output, label);
      for (size_t j = 0; j < expr.inputs.size() && !used; ++j) {
        used = j != i && contains(expr.inputs[j], label);
      }
      if (used) {
        keep.push_back(label);
      }
    }
    return keep;
  };

  std::string current_labels = kept_labels(0);
  utils::Tensor current =
      sum_out(operands[0], expr.inputs[0], current_labels, dims);

  for (size_t i = 1; i < operands.size(); ++i) {
    const std::string next_labels = kept_labels(i);
    const utils::Tensor next =
        sum_out(operands[i], expr.inputs[i], next_labels, dims);

    std::string shared, free_current, free_next;
    for (char label : current_labels) {
      if (contains(next_labels, label)) {
        if (needed_after(label, i)) {
          throw std::invalid_argument(
              "Label '" + std::string(1, label) + "' in '" + subscripts +
              "' is shared by operands and kept afterwards; batched "
              "contractions are not supported");
        }
        shared.push_back(label);
      } else {
        free_current.push_back(label);
      }
    }
    for (char label : next_labels) {
      if (!contains(shared, label)) {
        free_next.push_back(label);
      }
    }

    const auto m = static_cast<Eigen::Index>(extent_product(free_current, dims));
    const auto k = static_cast<Eigen::Index>(extent_product(shared, dims));
    const auto n = static_cast<Eigen::Index>(extent_product(free_next, dims));

    utils::Tensor product(extents(free_current + free_next, dims));
    if (m != 0 && n != 0 && k != 0) {
      const utils::Tensor lhs =
          current.transpose(permutation(current_labels, free_current + shared));
      const utils::Tensor rhs =
          next.transpose(permutation(next_labels, shared + free_next));

      MatricizedView a(lhs.data().data(), m, k);
      MatricizedView b(rhs.data().data(), k, n);
      Eigen::TensorMap<Matricized> c(product.data().data(), m, n);
      const Eigen::array<Eigen::IndexPair<Eigen::Index>, 1> contracted = {
          Eigen::IndexPair<Eigen::Index>(1, 0)};
      c = a.contract(b, contracted);
    }

    current_labels = free_current + free_next;
    current = std::move(product);
  }

  if (current_labels.size() != expr.output.size()) {
    throw std::logic_error("Einsum evaluation of '" + subscripts +
                           "' left labels '" + current_labels +
                           "' for output '" + expr.output + "'");
  }
  return current.transpose(permutation(current_labels, expr.output));
}

}  // namespace molham::algorithms
