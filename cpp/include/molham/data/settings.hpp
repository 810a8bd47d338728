// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <variant>
#include <vector>

namespace molham::data {

/**
 * @brief Type-safe variant for storing setting values
 *
 * All integer types are stored as int64_t; other integer types can be set and
 * requested with a range-checked conversion.
 */
using SettingValue = std::variant<bool, int64_t, double, std::string>;

template <typename T>
struct BoundConstraint {
  T min = std::numeric_limits<T>::lowest();
  T max = std::numeric_limits<T>::max();
};

template <typename T>
struct ListConstraint {
  std::vector<T> allowed_values;
};

/**
 * @brief Admissible-value restriction attached to a setting
 */
using Constraint =
    std::variant<BoundConstraint<int64_t>, ListConstraint<int64_t>,
                 BoundConstraint<double>, ListConstraint<std::string>>;

/**
 * @brief Exception thrown when modification of locked settings is requested
 */
class SettingsAreLocked : public std::runtime_error {
 public:
  explicit SettingsAreLocked()
      : std::runtime_error("Settings are locked: please modify a copy.") {}
};

/**
 * @brief Exception thrown when a setting is not found
 */
class SettingNotFound : public std::runtime_error {
 public:
  explicit SettingNotFound(const std::string& key)
      : std::runtime_error("Setting not found: " + key) {}
};

/**
 * @brief Exception thrown when a setting type conversion fails
 */
class SettingTypeMismatch : public std::runtime_error {
 public:
  explicit SettingTypeMismatch(const std::string& key,
                               const std::string& expected_type)
      : std::runtime_error("Type mismatch for setting '" + key +
                           "'. Expected: " + expected_type) {}
};

/**
 * @brief Base class for the option sets of molham algorithms and conversions
 *
 * The available keys, their types, descriptions and constraints are fixed by
 * derived classes during construction through set_default(). Afterwards only
 * the values of existing keys can change, and only with a value of the same
 * type that satisfies the constraint. Algorithms lock their settings when
 * they run.
 *
 * Usage:
 * ```cpp
 * class MySettings : public Settings {
 *  public:
 *   MySettings() {
 *     set_default("tolerance", 1e-12, "Absolute tolerance",
 *                 BoundConstraint<double>{0.0, 1.0});
 *     set_default("mode", "fast", "Evaluation mode",
 *                 std::vector<const char*>{"fast", "exact"});
 *   }
 * };
 *
 * MySettings s;
 * s.set("tolerance", 1e-8);
 * double tol = s.get<double>("tolerance");
 * ```
 */
class Settings {
 public:
  Settings() = default;
  virtual ~Settings() = default;
  Settings(const Settings& other) = default;
  Settings(Settings&& other) noexcept = default;
  Settings& operator=(const Settings& other) = delete;
  Settings& operator=(Settings&& other) noexcept = default;

  /**
   * @brief Set the value of an existing setting
   * @throws SettingsAreLocked if the settings are locked
   * @throws SettingNotFound if @p key was never declared
   * @throws SettingTypeMismatch if the value type differs from the default's
   * @throws std::invalid_argument if the value violates the constraint
   */
  void set(const std::string& key, const SettingValue& value);

  /**
   * @brief Set a string setting from a C string
   */
  void set(const std::string& key, const char* value);

  /**
   * @brief Set an integer setting from any integer type
   * @throws std::out_of_range if the value does not fit into int64_t
   */
  template <typename Integer>
    requires(std::is_integral_v<Integer> && !std::is_same_v<Integer, bool> &&
             !std::is_same_v<Integer, int64_t>)
  void set(const std::string& key, Integer value) {
    if constexpr (std::is_unsigned_v<Integer>) {
      if (static_cast<std::make_unsigned_t<int64_t>>(value) >
          static_cast<std::make_unsigned_t<int64_t>>(
              std::numeric_limits<int64_t>::max())) {
        throw std::out_of_range("Value for setting '" + key +
                                "' cannot be represented as int64_t.");
      }
    }
    set(key, SettingValue(static_cast<int64_t>(value)));
  }

  /**
   * @brief Get a setting value as variant
   * @throws SettingNotFound if key doesn't exist
   */
  SettingValue get(const std::string& key) const;

  /**
   * @brief Get a setting value with type checking
   *
   * Integer types other than int64_t are converted with a range check.
   *
   * @throws SettingNotFound if key doesn't exist
   * @throws SettingTypeMismatch if the stored type does not match
   */
  template <typename T>
  T get(const std::string& key) const {
    auto it = settings_.find(key);
    if (it == settings_.end()) {
      throw SettingNotFound(key);
    }

    if constexpr (is_variant_member_v<T>) {
      if (const T* value = std::get_if<T>(&it->second)) {
        return *value;
      }
      throw SettingTypeMismatch(key, typeid(T).name());
    } else if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
      if (const int64_t* value = std::get_if<int64_t>(&it->second)) {
        if (auto converted = _safe_convert<T>(*value)) {
          return *converted;
        }
      }
      throw SettingTypeMismatch(key, typeid(T).name());
    } else {
      static_assert(is_variant_member_v<T>,
                    "Type not supported in SettingValue variant");
    }
  }

  /**
   * @brief Get a setting value, or @p default_value if the key is absent or
   * holds another type
   */
  template <typename T>
  T get_or_default(const std::string& key, const T& default_value) const {
    if (!has(key)) {
      return default_value;
    }
    try {
      return get<T>(key);
    } catch (const SettingTypeMismatch&) {
      return default_value;
    }
  }

  bool has(const std::string& key) const;

  std::vector<std::string> keys() const;

  size_t size() const;

  bool empty() const;

  /**
   * @brief String rendering of a value (doubles in scientific notation)
   */
  std::string get_as_string(const std::string& key) const;

  std::string get_description(const std::string& key) const;

  bool has_limits(const std::string& key) const;

  Constraint get_limits(const std::string& key) const;

  /**
   * @brief Get a summary string listing every key and its value
   */
  std::string get_summary() const;

  /**
   * @brief JSON object mapping keys to values plus the serialization version
   */
  nlohmann::json to_json() const;

  /**
   * @brief Apply every key of a JSON object through set()
   *
   * The object's "version" field, if present, is validated and skipped. The
   * update is atomic: nothing changes if any key fails.
   *
   * @throws std::runtime_error if @p json_obj is not an object or a value
   * has an unsupported JSON type
   */
  void update(const nlohmann::json& json_obj);

  /**
   * @brief Load updates from a JSON file, see update(const nlohmann::json&)
   */
  void update_from_json_file(const std::string& filename);

  /**
   * @brief Prevent any further modification
   */
  void lock() const;

  bool is_locked() const { return _locked; }

 protected:
  /**
   * @brief Declare a setting with its default value
   *
   * Only meaningful during construction of derived classes; an existing key
   * is left untouched.
   *
   * @throws std::invalid_argument if the constraint type does not fit the
   * value type
   */
  void set_default(const std::string& key, const SettingValue& value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt);

  void set_default(const std::string& key, const char* value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<std::vector<const char*>> limit = std::nullopt);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  template <typename T>
  inline static constexpr bool is_variant_member_v =
      std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
      std::is_same_v<T, double> || std::is_same_v<T, std::string>;

  template <typename TargetT>
  static std::optional<TargetT> _safe_convert(int64_t value) {
    if constexpr (std::is_signed_v<TargetT>) {
      if (value >= static_cast<int64_t>(std::numeric_limits<TargetT>::min()) &&
          value <= static_cast<int64_t>(std::numeric_limits<TargetT>::max())) {
        return static_cast<TargetT>(value);
      }
    } else {
      if (value >= 0 && static_cast<uint64_t>(value) <=
                            std::numeric_limits<TargetT>::max()) {
        return static_cast<TargetT>(value);
      }
    }
    return std::nullopt;
  }

  void _validate_limits(const std::string& key,
                        const SettingValue& value) const;

  static std::string visit_to_string(const SettingValue& value);

  static SettingValue convert_json_to_setting_value(const nlohmann::json& j);

  std::map<std::string, SettingValue> settings_;
  std::map<std::string, std::string> descriptions_;
  std::map<std::string, Constraint> limits_;

  mutable bool _locked = false;
};

}  // namespace molham::data
