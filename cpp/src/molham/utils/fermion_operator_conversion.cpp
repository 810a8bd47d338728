// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <limits>
#include <molham/exceptions.hpp>
#include <molham/utils/fermion_operator_conversion.hpp>
#include <molham/utils/logger.hpp>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace molham::utils {

namespace {

using data::FermionAction;
using data::FermionOperator;
using data::FermionTerm;
using data::Spin;
using Quadruple = std::array<size_t, 4>;

constexpr std::array<std::pair<Spin, Spin>, 4> spin_pairs = {{
    {Spin::alpha, Spin::alpha},
    {Spin::alpha, Spin::beta},
    {Spin::beta, Spin::alpha},
    {Spin::beta, Spin::beta},
}};

// The 8 index tuples sharing a value under the real chemists'-notation
// symmetry, (p,q,r,s) first
std::array<Quadruple, 8> symmetry_orbit(const Quadruple& pqrs) {
  const auto [p, q, r, s] = pqrs;
  return {{{p, q, r, s},
           {q, p, r, s},
           {p, q, s, r},
           {q, p, s, r},
           {r, s, p, q},
           {s, r, p, q},
           {r, s, q, p},
           {s, r, q, p}}};
}

bool is_one_body_term(const FermionTerm& term) {
  return term[0].creation && !term[1].creation && term[0].spin == term[1].spin;
}

// Whether a dense norb^4 complex tensor is addressable
bool four_index_size_fits(std::uint64_t norb) {
  constexpr std::uint64_t limit =
      static_cast<std::uint64_t>(std::numeric_limits<Eigen::Index>::max()) /
      sizeof(std::complex<double>);
  std::uint64_t elements = 1;
  for (int i = 0; i < 4; ++i) {
    if (norb != 0 && elements > limit / norb) {
      return false;
    }
    elements *= norb;
  }
  return true;
}

const FermionTerm& term_acting_on(const FermionOperator& op,
                                  std::uint64_t orbital) {
  for (const auto& [term, coeff] : op) {
    for (const auto& action : term) {
      if (action.orbital == orbital) {
        return term;
      }
    }
  }
  throw std::logic_error("No term acts on orbital " + std::to_string(orbital));
}

// a+_{s,p} a+_{t,r} a_{t,s} a_{s,q} for any spins s, t
bool is_two_body_term(const FermionTerm& term) {
  return term[0].creation && term[1].creation && !term[2].creation &&
         !term[3].creation && term[0].spin == term[3].spin &&
         term[1].spin == term[2].spin;
}

}  // namespace

data::FermionOperator to_fermion_operator(
    const data::MolecularHamiltonian& hamiltonian) {
  MOLHAM_LOG_TRACE_ENTERING();
  if (!hamiltonian.is_valid()) {
    throw std::invalid_argument(
        "Cannot encode a Hamiltonian with inconsistent tensor dimensions");
  }
  const size_t norb = hamiltonian.get_num_orbitals();
  const auto& one_body = hamiltonian.get_one_body_tensor();
  const auto& two_body = hamiltonian.get_two_body_tensor();

  FermionOperator::TermMap terms;
  terms[FermionTerm{}] = hamiltonian.get_constant();

  for (size_t p = 0; p < norb; ++p) {
    for (size_t q = 0; q < norb; ++q) {
      const std::complex<double> coeff = one_body(p, q);
      terms[{FermionAction::cre_a(p), FermionAction::des_a(q)}] += coeff;
      terms[{FermionAction::cre_b(p), FermionAction::des_b(q)}] += coeff;
    }
  }

  for (size_t p = 0; p < norb; ++p) {
    for (size_t q = 0; q < norb; ++q) {
      for (size_t r = 0; r < norb; ++r) {
        for (size_t s = 0; s < norb; ++s) {
          const std::complex<double> coeff =
              0.5 * two_body(data::MolecularHamiltonian::get_two_body_index(
                        p, q, r, s, norb));
          for (const auto& [s1, s2] : spin_pairs) {
            terms[{FermionAction::cre(s1, p), FermionAction::cre(s2, r),
                   FermionAction::des(s2, s), FermionAction::des(s1, q)}] +=
                coeff;
          }
        }
      }
    }
  }

  MOLHAM_LOGGER().debug("Encoded norb={} Hamiltonian into {} terms", norb,
                        terms.size());
  return FermionOperator(std::move(terms));
}

data::MolecularHamiltonian from_fermion_operator(
    const data::FermionOperator& op,
    const FermionOperatorConversionSettings& settings) {
  MOLHAM_LOG_TRACE_ENTERING();
  const double imag_tolerance =
      settings.get<double>("constant_imaginary_tolerance");
  const bool canonicalize = settings.get<bool>("canonicalize_two_body_orbits");

  const auto max_index = op.max_orbital_index();
  if (max_index && (*max_index == std::numeric_limits<std::uint64_t>::max() ||
                    !four_index_size_fits(*max_index + 1))) {
    throw InvalidTermError("Orbital index " + std::to_string(*max_index) +
                               " is too large for a dense two-body tensor",
                           data::term_to_string(term_acting_on(op, *max_index)));
  }
  const size_t norb = max_index ? static_cast<size_t>(*max_index) + 1 : 0;
  MOLHAM_LOGGER().debug("Decoding {} terms over {} orbitals", op.size(), norb);

  double constant = 0.0;
  Eigen::MatrixXcd one_body = Eigen::MatrixXcd::Zero(norb, norb);
  Eigen::VectorXcd two_body = Eigen::VectorXcd::Zero(norb * norb * norb * norb);
  std::set<Quadruple> seen;

  for (const auto& [term, coeff] : op) {
    switch (term.size()) {
      case 0:
        if (std::abs(coeff.imag()) > imag_tolerance) {
          throw InvalidTermError(
              "Constant term must be real, got imaginary part " +
                  std::to_string(coeff.imag()),
              data::term_to_string(term));
        }
        constant = coeff.real();
        break;

      case 2:
        if (!is_one_body_term(term)) {
          throw InvalidTermError(
              "One-body term is not of the form a+_{s,p} a_{s,q}",
              data::term_to_string(term));
        }
        one_body(term[0].orbital, term[1].orbital) += 0.5 * coeff;
        break;

      case 4: {
        if (!is_two_body_term(term)) {
          throw InvalidTermError(
              "Two-body term is not of the form a+_{s,p} a+_{t,r} a_{t,s} "
              "a_{s,q}",
              data::term_to_string(term));
        }
        const Quadruple pqrs = {term[0].orbital, term[3].orbital,
                                term[1].orbital, term[2].orbital};
        const auto orbit = symmetry_orbit(pqrs);
        const Quadruple key =
            canonicalize ? *std::min_element(orbit.begin(), orbit.end())
                         : pqrs;
        if (!seen.insert(key).second) {
          break;
        }
        const std::complex<double> value = 2.0 * coeff;
        for (const auto& [a, b, c, d] : orbit) {
          two_body(data::MolecularHamiltonian::get_two_body_index(a, b, c, d,
                                                                  norb)) =
              value;
        }
        break;
      }

      default:
        throw InvalidTermError(
            "Term is neither a constant, one-body nor two-body term",
            data::term_to_string(term));
    }
  }

  return data::MolecularHamiltonian(one_body, two_body, constant);
}

}  // namespace molham::utils
