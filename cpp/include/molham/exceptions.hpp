// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace molham {

/**
 * @brief Exception thrown when a fermionic operator term cannot be mapped onto
 * a molecular Hamiltonian
 *
 * Raised for complex constant terms, one-body terms whose actions are not a
 * same-spin creation/annihilation pair, two-body terms outside the four
 * allowed spin patterns, and terms that are neither constant, one-body nor
 * two-body. The offending term is kept in printable form.
 */
class InvalidTermError : public std::invalid_argument {
 public:
  InvalidTermError(const std::string& message, std::string term)
      : std::invalid_argument(message + ": " + term), term_(std::move(term)) {}

  /// Printable form of the rejected term
  const std::string& term() const noexcept { return term_; }

 private:
  std::string term_;
};

/**
 * @brief Exception thrown when an operation is not defined for the given
 * Hamiltonian, e.g. the diagonal of a complex-valued Hamiltonian
 */
class UnsupportedOperationError : public std::logic_error {
 public:
  explicit UnsupportedOperationError(const std::string& message)
      : std::logic_error(message) {}
};

}  // namespace molham
