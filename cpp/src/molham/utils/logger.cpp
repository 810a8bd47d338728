// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/sinks/stdout_color_sinks.h>

#include <molham/config.hpp>
#include <molham/utils/logger.hpp>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace molham::utils {

namespace {

constexpr const char* logger_name = "molham";

constexpr spdlog::level::level_enum default_level_from_config() {
  switch (MOLHAM_LOG_LEVEL) {
    case 0:
      return spdlog::level::trace;
    case 1:
      return spdlog::level::debug;
    case 2:
      return spdlog::level::info;
    case 3:
      return spdlog::level::warn;
    case 4:
      return spdlog::level::err;
    case 5:
      return spdlog::level::critical;
    case 6:
      return spdlog::level::off;
    default:
      return spdlog::level::info;
  }
}

// spdlog::get_level() is per-registry; molham keeps its own copy
spdlog::level::level_enum g_global_level = default_level_from_config();
std::mutex g_level_mutex;

std::shared_ptr<spdlog::logger> g_logger;
std::once_flag g_logger_init_flag;

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
  switch (level) {
    case LogLevel::trace:
      return spdlog::level::trace;
    case LogLevel::debug:
      return spdlog::level::debug;
    case LogLevel::info:
      return spdlog::level::info;
    case LogLevel::warn:
      return spdlog::level::warn;
    case LogLevel::error:
      return spdlog::level::err;
    case LogLevel::critical:
      return spdlog::level::critical;
    case LogLevel::off:
      return spdlog::level::off;
  }
  return spdlog::level::info;
}

LogLevel from_spdlog_level(spdlog::level::level_enum level) {
  switch (level) {
    case spdlog::level::trace:
      return LogLevel::trace;
    case spdlog::level::debug:
      return LogLevel::debug;
    case spdlog::level::info:
      return LogLevel::info;
    case spdlog::level::warn:
      return LogLevel::warn;
    case spdlog::level::err:
      return LogLevel::error;
    case spdlog::level::critical:
      return LogLevel::critical;
    case spdlog::level::off:
      return LogLevel::off;
    default:
      return LogLevel::info;
  }
}

void init_global_logger() {
  try {
    g_logger = spdlog::stdout_color_mt(logger_name);
  } catch (const spdlog::spdlog_ex&) {
    // Already registered by an earlier instance of the library
    g_logger = spdlog::get(logger_name);
  }

  if (g_logger) {
    std::lock_guard<std::mutex> lock(g_level_mutex);
    g_logger->set_level(g_global_level);
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%^%l%$] %v");
  }
}

}  // namespace

namespace detail {

std::string path_to_colon_string(const std::string& file_path,
                                 const std::string& start_segment) {
  // Match whole directory names only, so "molham_tests/" is not a hit
  const std::string segment_pattern = "/" + start_segment + "/";
  size_t pos = file_path.find(segment_pattern);

  if (pos == std::string::npos) {
    if (file_path.rfind(start_segment + "/", 0) == 0) {
      pos = 0;
    } else {
      return "";
    }
  } else {
    pos += 1;
  }

  std::vector<std::string> parts;
  std::string part;
  std::istringstream stream(file_path.substr(pos));
  while (std::getline(stream, part, '/')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  if (!parts.empty()) {
    std::string& last = parts.back();
    size_t dot_pos = last.find_last_of('.');
    if (dot_pos != std::string::npos) {
      last = last.substr(0, dot_pos);
    }
  }

  std::ostringstream result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) result << ":";
    result << parts[i];
  }
  return result.str();
}

std::string extract_method_name(std::string_view func_name) {
  std::string full_name(func_name);

  size_t lambda_pos = full_name.find("::<lambda");
  if (lambda_pos != std::string::npos) {
    full_name = full_name.substr(0, lambda_pos);
  }

  size_t paren_pos = full_name.rfind('(');
  if (paren_pos != std::string::npos) {
    full_name = full_name.substr(0, paren_pos);
  }

  // Drop the return type, if any
  size_t space_pos = full_name.rfind(' ');
  if (space_pos != std::string::npos) {
    full_name = full_name.substr(space_pos + 1);
  }

  size_t last_colons = full_name.rfind("::");
  std::string name = (last_colons != std::string::npos)
                         ? full_name.substr(last_colons + 2)
                         : full_name;

  if (last_colons != std::string::npos && last_colons > 0) {
    size_t second_last_colons = full_name.rfind("::", last_colons - 1);
    std::string class_name =
        (second_last_colons != std::string::npos)
            ? full_name.substr(second_last_colons + 2,
                               last_colons - second_last_colons - 2)
            : full_name.substr(0, last_colons);
    if (class_name == name) {
      name += " constructor";
    }
  }

  return name;
}

}  // namespace detail

std::shared_ptr<spdlog::logger> Logger::get() {
  std::call_once(g_logger_init_flag, init_global_logger);

  if (g_logger) {
    std::lock_guard<std::mutex> lock(g_level_mutex);
    if (g_logger->level() != g_global_level) {
      g_logger->set_level(g_global_level);
    }
  }
  return g_logger;
}

std::string Logger::get_source_context(const std::source_location& location) {
  std::string file_id = detail::path_to_colon_string(location.file_name());
  if (file_id.empty()) {
    return "unknown";
  }
  return file_id;
}

void Logger::set_global_level(LogLevel level) {
  auto spdlog_level = to_spdlog_level(level);
  std::lock_guard<std::mutex> lock(g_level_mutex);
  g_global_level = spdlog_level;
  if (g_logger) {
    g_logger->set_level(spdlog_level);
  }
}

LogLevel Logger::get_global_level() {
  std::lock_guard<std::mutex> lock(g_level_mutex);
  return from_spdlog_level(g_global_level);
}

void Logger::disable_all() { set_global_level(LogLevel::off); }

void log_trace_entering(const std::source_location& location) {
  auto logger = Logger::get();
  if (!logger || !logger->should_log(spdlog::level::trace)) {
    return;
  }

  std::string file_ctx = detail::path_to_colon_string(location.file_name());
  std::string method = detail::extract_method_name(location.function_name());
  if (file_ctx.empty()) {
    file_ctx = "unknown";
  }
  if (method.empty()) {
    method = "unknown";
  }
  logger->trace("[{}] Entering {}", file_ctx, method);
}

}  // namespace molham::utils
