// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <fstream>
#include <molham/data/settings.hpp>
#include <molham/utils/logger.hpp>
#include <sstream>

#include "json_serialization.hpp"

namespace molham::data {

namespace {

template <typename T>
std::string format_options(const std::vector<T>& values) {
  std::string options_str = "[";
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) options_str += ", ";
    if constexpr (std::is_same_v<T, std::string>) {
      options_str += "\"" + values[i] + "\"";
    } else {
      options_str += std::to_string(values[i]);
    }
  }
  return options_str + "]";
}

}  // namespace

void Settings::set(const std::string& key, const SettingValue& value) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    throw SettingNotFound(key);
  }
  if (value.index() != it->second.index()) {
    throw SettingTypeMismatch(key, "does not match type of given argument");
  }
  _validate_limits(key, value);
  it->second = value;
}

void Settings::set(const std::string& key, const char* value) {
  set(key, SettingValue(std::string(value)));
}

void Settings::_validate_limits(const std::string& key,
                                const SettingValue& value) const {
  auto limit_it = limits_.find(key);
  if (limit_it == limits_.end()) {
    return;
  }
  const Constraint& limit = limit_it->second;

  if (const auto* str = std::get_if<std::string>(&value)) {
    if (const auto* options = std::get_if<ListConstraint<std::string>>(&limit)) {
      const auto& allowed = options->allowed_values;
      if (std::find(allowed.begin(), allowed.end(), *str) == allowed.end()) {
        throw std::invalid_argument(
            "Value for setting '" + key +
            "' is out of allowed options. Allowed options: " +
            format_options(allowed));
      }
    }
  } else if (const auto* integer = std::get_if<int64_t>(&value)) {
    if (const auto* options = std::get_if<ListConstraint<int64_t>>(&limit)) {
      const auto& allowed = options->allowed_values;
      if (std::find(allowed.begin(), allowed.end(), *integer) ==
          allowed.end()) {
        throw std::invalid_argument(
            "Value for setting '" + key +
            "' is out of allowed options. Allowed options: " +
            format_options(allowed));
      }
    } else if (const auto* bounds =
                   std::get_if<BoundConstraint<int64_t>>(&limit)) {
      if (bounds->min > *integer || *integer > bounds->max) {
        throw std::invalid_argument(
            "Value for setting '" + key +
            "' is out of allowed range. Allowed range: [" +
            std::to_string(bounds->min) + ", " + std::to_string(bounds->max) +
            "]");
      }
    }
  } else if (const auto* real = std::get_if<double>(&value)) {
    if (const auto* bounds = std::get_if<BoundConstraint<double>>(&limit)) {
      if (bounds->min > *real || *real > bounds->max) {
        throw std::invalid_argument(
            "Value for setting '" + key +
            "' is out of allowed range. Allowed range: [" +
            std::to_string(bounds->min) + ", " + std::to_string(bounds->max) +
            "]");
      }
    }
  }
}

SettingValue Settings::get(const std::string& key) const {
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

bool Settings::has(const std::string& key) const {
  return settings_.find(key) != settings_.end();
}

std::vector<std::string> Settings::keys() const {
  std::vector<std::string> result;
  result.reserve(settings_.size());
  for (const auto& [key, value] : settings_) {
    result.push_back(key);
  }
  return result;
}

size_t Settings::size() const { return settings_.size(); }

bool Settings::empty() const { return settings_.empty(); }

std::string Settings::get_as_string(const std::string& key) const {
  return visit_to_string(get(key));
}

std::string Settings::get_description(const std::string& key) const {
  if (!has(key)) {
    throw SettingNotFound(key);
  }
  auto it = descriptions_.find(key);
  return it == descriptions_.end() ? std::string() : it->second;
}

bool Settings::has_limits(const std::string& key) const {
  return limits_.find(key) != limits_.end();
}

Constraint Settings::get_limits(const std::string& key) const {
  auto it = limits_.find(key);
  if (it == limits_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

std::string Settings::get_summary() const {
  std::ostringstream oss;
  oss << "Settings Summary:\n";

  if (empty()) {
    oss << "  No settings configured.\n";
    return oss.str();
  }

  oss << "  Settings:\n";
  for (const auto& [key, value] : settings_) {
    oss << "    " << key << " = " << visit_to_string(value) << "\n";
  }
  return oss.str();
}

nlohmann::json Settings::to_json() const {
  MOLHAM_LOG_TRACE_ENTERING();
  nlohmann::json json_obj;
  json_obj["version"] = SERIALIZATION_VERSION;
  for (const auto& [key, value] : settings_) {
    json_obj[key] =
        std::visit([](const auto& v) { return nlohmann::json(v); }, value);
  }
  return json_obj;
}

void Settings::update(const nlohmann::json& json_obj) {
  MOLHAM_LOG_TRACE_ENTERING();
  if (_locked) {
    throw SettingsAreLocked();
  }
  if (!json_obj.is_object()) {
    throw std::runtime_error("JSON must be an object");
  }
  if (json_obj.contains("version")) {
    validate_serialization_version(SERIALIZATION_VERSION,
                                   json_obj["version"].get<std::string>());
  }

  // Validate everything on a copy first
  Settings staged(*this);
  for (const auto& [key, value] : json_obj.items()) {
    if (key == "version") {
      continue;
    }
    SettingValue converted = convert_json_to_setting_value(value);
    // JSON does not distinguish 1.0 from 1
    if (staged.has(key) && std::holds_alternative<double>(staged.get(key)) &&
        std::holds_alternative<int64_t>(converted)) {
      converted = static_cast<double>(std::get<int64_t>(converted));
    }
    staged.set(key, converted);
  }
  settings_ = std::move(staged.settings_);
}

void Settings::update_from_json_file(const std::string& filename) {
  MOLHAM_LOG_TRACE_ENTERING();
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Unable to open settings JSON file '" + filename +
                             "'");
  }
  nlohmann::json json_obj;
  try {
    file >> json_obj;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Failed to parse settings file '" + filename +
                             "': " + e.what());
  }
  update(json_obj);
}

void Settings::lock() const { _locked = true; }

void Settings::set_default(const std::string& key, const SettingValue& value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit) {
  if (has(key)) {
    return;
  }
  if (limit.has_value()) {
    const bool matches = std::visit(
        [&limit](const auto& v) {
          using ValueType = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<ValueType, bool>) {
            return false;
          } else if constexpr (std::is_same_v<ValueType, std::string>) {
            return std::holds_alternative<ListConstraint<std::string>>(*limit);
          } else if constexpr (std::is_same_v<ValueType, double>) {
            return std::holds_alternative<BoundConstraint<double>>(*limit);
          } else {
            return std::holds_alternative<ListConstraint<int64_t>>(*limit) ||
                   std::holds_alternative<BoundConstraint<int64_t>>(*limit);
          }
        },
        value);
    if (!matches) {
      throw std::invalid_argument("Type of default and constraint for setting '" +
                                  key + "' do not match");
    }
  }

  settings_[key] = value;
  if (description.has_value()) {
    descriptions_[key] = *description;
  }
  if (limit.has_value()) {
    limits_[key] = *limit;
  }
}

void Settings::set_default(const std::string& key, const char* value,
                           std::optional<std::string> description,
                           std::optional<std::vector<const char*>> limit) {
  std::optional<Constraint> constraint;
  if (limit.has_value()) {
    constraint = ListConstraint<std::string>{
        std::vector<std::string>(limit->begin(), limit->end())};
  }
  set_default(key, SettingValue(std::string(value)), std::move(description),
              constraint);
}

std::string Settings::visit_to_string(const SettingValue& value) {
  return std::visit(
      [](const auto& variant_value) -> std::string {
        using ValueType = std::decay_t<decltype(variant_value)>;
        if constexpr (std::is_same_v<ValueType, bool>) {
          return variant_value ? "true" : "false";
        } else if constexpr (std::is_same_v<ValueType, std::string>) {
          return variant_value;
        } else if constexpr (std::is_floating_point_v<ValueType>) {
          std::ostringstream oss;
          oss << std::scientific << variant_value;
          return oss.str();
        } else {
          return std::to_string(variant_value);
        }
      },
      value);
}

SettingValue Settings::convert_json_to_setting_value(
    const nlohmann::json& json_obj) {
  if (json_obj.is_boolean()) {
    return json_obj.get<bool>();
  } else if (json_obj.is_number_integer()) {
    return json_obj.get<int64_t>();
  } else if (json_obj.is_number_float()) {
    return json_obj.get<double>();
  } else if (json_obj.is_string()) {
    return json_obj.get<std::string>();
  }
  throw std::runtime_error("Unsupported JSON type for setting value: " +
                           json_obj.dump());
}

}  // namespace molham::data
