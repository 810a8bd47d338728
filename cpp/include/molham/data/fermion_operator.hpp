// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <complex>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace molham::data {

/**
 * @brief Spin label of a fermionic mode
 */
enum class Spin : std::uint8_t { alpha = 0, beta = 1 };

/**
 * @brief Single creation or annihilation operator on a spin-orbital
 *
 * Actions are totally ordered (creation flag, then spin, then orbital) so
 * that products of actions can key an ordered map.
 */
struct FermionAction {
  bool creation;
  Spin spin;
  std::uint64_t orbital;

  auto operator<=>(const FermionAction& other) const = default;
  bool operator==(const FermionAction& other) const = default;

  /**
   * @brief Render as e.g. "cre_a(0)" or "des_b(3)"
   */
  std::string to_string() const;

  /// Alpha-spin creation operator
  inline static FermionAction cre_a(std::uint64_t orbital) {
    return {true, Spin::alpha, orbital};
  }

  /// Beta-spin creation operator
  inline static FermionAction cre_b(std::uint64_t orbital) {
    return {true, Spin::beta, orbital};
  }

  /// Alpha-spin annihilation operator
  inline static FermionAction des_a(std::uint64_t orbital) {
    return {false, Spin::alpha, orbital};
  }

  /// Beta-spin annihilation operator
  inline static FermionAction des_b(std::uint64_t orbital) {
    return {false, Spin::beta, orbital};
  }

  /// Creation operator of the given spin
  inline static FermionAction cre(Spin spin, std::uint64_t orbital) {
    return {true, spin, orbital};
  }

  /// Annihilation operator of the given spin
  inline static FermionAction des(Spin spin, std::uint64_t orbital) {
    return {false, spin, orbital};
  }
};

/**
 * @brief Ordered product of actions, applied right to left; empty means the
 * identity
 */
using FermionTerm = std::vector<FermionAction>;

/**
 * @brief Render a term as e.g. "(cre_a(0), des_a(1))"; the identity is "()"
 */
std::string term_to_string(const FermionTerm& term);

/**
 * @class FermionOperator
 * @brief Linear combination of fermionic action products
 *
 * Maps each distinct term to its complex coefficient. Adding a term that is
 * already present accumulates the coefficients; terms are not normal-ordered
 * or simplified.
 *
 * @code
 * using A = FermionAction;
 * FermionOperator op;
 * op.add_term({}, 1.5);
 * op.add_term({A::cre_a(0), A::des_a(1)}, {0.25, 0.0});
 * @endcode
 */
class FermionOperator {
 public:
  using TermMap = std::map<FermionTerm, std::complex<double>>;
  using const_iterator = TermMap::const_iterator;

  FermionOperator() = default;

  explicit FermionOperator(TermMap terms) : _terms(std::move(terms)) {}

  /**
   * @brief Add @p coefficient to the coefficient of @p term
   * @return Reference to this operator
   */
  FermionOperator& add_term(const FermionTerm& term,
                            std::complex<double> coefficient);

  FermionOperator& operator+=(const FermionOperator& other);

  FermionOperator operator+(const FermionOperator& other) const;

  FermionOperator operator*(std::complex<double> scalar) const;

  /// Number of distinct terms
  size_t size() const { return _terms.size(); }

  bool empty() const { return _terms.empty(); }

  bool contains(const FermionTerm& term) const {
    return _terms.find(term) != _terms.end();
  }

  /**
   * @brief Coefficient of @p term
   * @throws std::out_of_range if the term is absent
   */
  std::complex<double> at(const FermionTerm& term) const;

  const TermMap& terms() const { return _terms; }

  const_iterator begin() const { return _terms.begin(); }
  const_iterator end() const { return _terms.end(); }

  /**
   * @brief Largest orbital index over all terms, or nullopt if no term acts
   * on any orbital
   */
  std::optional<std::uint64_t> max_orbital_index() const;

  /**
   * @brief One line per term, "coefficient * term"
   */
  std::string to_string() const;

 private:
  TermMap _terms;
};

}  // namespace molham::data
