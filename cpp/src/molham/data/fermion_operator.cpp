// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cmath>
#include <molham/data/fermion_operator.hpp>
#include <sstream>
#include <stdexcept>

namespace molham::data {

std::string FermionAction::to_string() const {
  std::string result = creation ? "cre_" : "des_";
  result += (spin == Spin::alpha) ? "a(" : "b(";
  result += std::to_string(orbital) + ")";
  return result;
}

std::string term_to_string(const FermionTerm& term) {
  std::string result = "(";
  for (size_t i = 0; i < term.size(); ++i) {
    if (i > 0) result += ", ";
    result += term[i].to_string();
  }
  return result + ")";
}

FermionOperator& FermionOperator::add_term(const FermionTerm& term,
                                           std::complex<double> coefficient) {
  _terms[term] += coefficient;
  return *this;
}

FermionOperator& FermionOperator::operator+=(const FermionOperator& other) {
  for (const auto& [term, coefficient] : other._terms) {
    _terms[term] += coefficient;
  }
  return *this;
}

FermionOperator FermionOperator::operator+(const FermionOperator& other) const {
  FermionOperator result(*this);
  result += other;
  return result;
}

FermionOperator FermionOperator::operator*(std::complex<double> scalar) const {
  FermionOperator result(*this);
  for (auto& [term, coefficient] : result._terms) {
    coefficient *= scalar;
  }
  return result;
}

std::complex<double> FermionOperator::at(const FermionTerm& term) const {
  auto it = _terms.find(term);
  if (it == _terms.end()) {
    throw std::out_of_range("Term " + term_to_string(term) +
                            " not present in FermionOperator");
  }
  return it->second;
}

std::optional<std::uint64_t> FermionOperator::max_orbital_index() const {
  std::optional<std::uint64_t> result;
  for (const auto& [term, coefficient] : _terms) {
    for (const auto& action : term) {
      if (!result || action.orbital > *result) {
        result = action.orbital;
      }
    }
  }
  return result;
}

std::string FermionOperator::to_string() const {
  std::ostringstream oss;
  for (const auto& [term, coefficient] : _terms) {
    oss << "(" << coefficient.real() << (coefficient.imag() < 0 ? "-" : "+")
        << std::abs(coefficient.imag()) << "j) * " << term_to_string(term)
        << "\n";
  }
  return oss.str();
}

}  // namespace molham::data
