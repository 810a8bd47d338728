// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <molham/data/settings.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace molham::algorithms {

/**
 * @brief Base class for pluggable molham algorithms
 *
 * run() locks the settings and forwards to _run_impl(), so the options an
 * instance ran with cannot change afterwards.
 *
 * @tparam Derived The algorithm interface, e.g. TensorContractor
 * @tparam ReturnType Result type of run() and _run_impl()
 * @tparam Args Argument types of run() and _run_impl()
 *
 * Usage:
 * @code
 * class TensorContractor
 *     : public Algorithm<TensorContractor, utils::Tensor, const std::string&,
 *                        const std::vector<utils::Tensor>&> {
 *  protected:
 *   utils::Tensor _run_impl(const std::string& subscripts,
 *                           const std::vector<utils::Tensor>& operands)
 *       const override;
 * };
 * @endcode
 */
template <typename Derived, typename ReturnType, typename... Args>
class Algorithm {
 public:
  Algorithm() = default;
  virtual ~Algorithm() = default;

  /**
   * @brief Lock settings and run the algorithm
   */
  virtual ReturnType run(Args... args) const {
    this->lock_settings();
    return this->_run_impl(std::forward<Args>(args)...);
  }

  /**
   * @brief Access the algorithm's settings
   */
  data::Settings& settings() { return *_settings; }

  const data::Settings& settings() const { return *_settings; }

  /**
   * @brief Primary registry name of this implementation
   */
  virtual std::string name() const = 0;

  /**
   * @brief Every registry name of this implementation, the primary one first
   */
  virtual std::vector<std::string> aliases() const { return {this->name()}; }

  /**
   * @brief Name of the algorithm interface, shared by all implementations
   */
  virtual std::string type_name() const = 0;

 protected:
  void lock_settings() const { this->_settings->lock(); }

  virtual ReturnType _run_impl(Args... args) const = 0;

  /**
   * @brief The algorithm's settings, replaced by implementations that
   * declare options
   */
  std::unique_ptr<data::Settings> _settings =
      std::make_unique<data::Settings>();
};

/**
 * @brief Name-keyed registry of implementations of one algorithm interface
 *
 * @tparam BaseAlgorithmType The algorithm interface
 * @tparam Derived The concrete factory; provides algorithm_type_name(),
 * default_algorithm_name() and register_default_instances()
 *
 * Usage:
 * @code
 * auto contractor = TensorContractorFactory::create();  // default
 * TensorContractorFactory::register_instance(
 *     [] { return std::make_unique<MyContractor>(); });
 * @endcode
 */
template <typename BaseAlgorithmType, typename Derived>
class AlgorithmFactory {
 public:
  using return_type = std::unique_ptr<BaseAlgorithmType>;
  using functor_type = std::function<return_type(void)>;

  /**
   * @brief Create an algorithm instance
   * @param name Registry name or alias; empty selects the default
   * @throws std::runtime_error if the name is not registered
   */
  static return_type create(const std::string& name = "") {
    std::string key = name.empty() ? Derived::default_algorithm_name() : name;

    auto it = registry().find(key);
    if (it == registry().end()) {
      std::string available_keys;
      for (const auto& [k, _] : registry()) {
        if (!available_keys.empty()) {
          available_keys += ", ";
        }
        available_keys += k;
      }
      throw std::runtime_error("Algorithm factory for " +
                               Derived::algorithm_type_name() +
                               ": Algorithm with name '" + key +
                               "' not found in registry, available options "
                               "are: " +
                               available_keys);
    }
    return it->second();
  }

  /**
   * @brief Register an implementation under its name and all aliases
   * @throws std::runtime_error on a name clash or a foreign algorithm type
   */
  static void register_instance(functor_type func) {
    auto& reg = registry();
    auto tmp = func();

    if (tmp->type_name() != Derived::algorithm_type_name()) {
      throw std::runtime_error(
          "Algorithm factory for " + Derived::algorithm_type_name() +
          ": algorithm with name '" + tmp->name() +
          "' has incorrect algorithm type: " + tmp->type_name() +
          " expected is: " + Derived::algorithm_type_name());
    }

    auto aliases = tmp->aliases();
    for (const auto& alias : aliases) {
      if (reg.find(alias) != reg.end()) {
        throw std::runtime_error("Algorithm factory for " +
                                 Derived::algorithm_type_name() +
                                 ": algorithm with name/alias '" + alias +
                                 "' already exists in registry");
      }
    }
    for (const auto& alias : aliases) {
      reg[alias] = func;
    }
  }

  /**
   * @brief Remove one registry entry
   * @return true if the key was found and removed
   */
  static bool unregister_instance(const std::string& key) {
    return registry().erase(key) > 0;
  }

  /**
   * @brief Registered names and aliases, sorted
   */
  static std::vector<std::string> available() {
    std::vector<std::string> keys;
    for (const auto& [key, _] : registry()) {
      keys.push_back(key);
    }
    return keys;
  }

  static bool has(const std::string& key) {
    return registry().find(key) != registry().end();
  }

 protected:
  static std::map<std::string, functor_type>& registry() {
    static std::map<std::string, functor_type> instance;
    static bool initialized = false;
    if (!initialized) {
      initialized = true;
      Derived::register_default_instances();
    }
    return instance;
  }
};

}  // namespace molham::algorithms
