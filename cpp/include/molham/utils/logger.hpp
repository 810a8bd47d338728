// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <molham/config.hpp>
#include <source_location>
#include <string>
#include <string_view>

namespace molham::utils {

/**
 * @enum LogLevel
 * @brief Severity threshold for molham log output
 */
enum class LogLevel {
  trace,     ///< Function entry and per-term detail
  debug,     ///< Derived quantities (orbital counts, dimensions)
  info,      ///< General information
  warn,      ///< Suspicious but accepted input
  error,     ///< Error messages
  critical,  ///< Critical errors
  off        ///< Disable logging
};

/**
 * @class Logger
 * @brief Process-wide spdlog wrapper used by every molham component
 *
 * A single colored stdout logger named "molham" is created lazily on first
 * use. Source context (the path below the `molham/` directory, joined with
 * colons) is attached to messages by ContextLogger, so no per-file logger
 * objects are needed.
 *
 * Usage Example
 * -------------
 * ```cpp
 * #include <molham/utils/logger.hpp>
 *
 * MOLHAM_LOGGER().debug("Decoded {} terms over {} orbitals", n, norb);
 *
 * MolecularHamiltonian rotated(...) {
 *   MOLHAM_LOG_TRACE_ENTERING();
 *   ...
 * }
 *
 * Logger::set_global_level(LogLevel::warn);
 * ```
 *
 * Output Format
 * -------------
 * ```
 * [2026-10-19 10:30:00.123456] [warn] [molham:utils:orbital_rotation] ...
 * ```
 *
 * The logger is thread-safe; the level is guarded by a mutex and the
 * instance is created under std::call_once.
 */
class Logger {
 public:
  /**
   * @brief Get the global logger instance
   *
   * The instance is created on first call with a colored console sink, the
   * current global level and the molham timestamped pattern.
   *
   * @return Shared pointer to the global logger instance
   */
  static std::shared_ptr<spdlog::logger> get();

  /**
   * @brief Set the minimum level emitted by the global logger
   * @param level The minimum log level to output
   */
  static void set_global_level(LogLevel level);

  /**
   * @brief Get the current global log level
   * @return The current global log level
   */
  static LogLevel get_global_level();

  /**
   * @brief Silence all output, equivalent to set_global_level(LogLevel::off)
   */
  static void disable_all();

  /**
   * @brief Colon-separated source context for a location
   *
   * Returns for example "molham:utils:orbital_rotation" for a call site in
   * `src/molham/utils/orbital_rotation.cpp`, or "unknown" when the file does
   * not live below a `molham/` directory.
   *
   * @param location Source location (defaults to caller's location)
   * @return Formatted context string
   */
  static std::string get_source_context(
      const std::source_location& location = std::source_location::current());
};

namespace detail {

/**
 * @brief Convert a file path to a colon-joined context string
 *
 * The path is cut at the first directory named @p start_segment and the file
 * extension is dropped.
 *
 * @return The context string, or an empty string when the segment is absent
 */
std::string path_to_colon_string(const std::string& file_path,
                                 const std::string& start_segment = "molham");

/**
 * @brief Reduce a compiler function signature to the bare method name
 *
 * Argument lists and lambda suffixes are removed; constructors are reported
 * as "<Class> constructor".
 */
std::string extract_method_name(std::string_view func_name);

}  // namespace detail

/**
 * @brief Log "Entering <method>" at trace level for the calling function
 * @param location Automatically provided by std::source_location::current()
 */
void log_trace_entering(
    const std::source_location& location = std::source_location::current());

/**
 * @class ContextLogger
 * @brief Short-lived wrapper that prefixes messages with the call-site context
 *
 * Obtain one through MOLHAM_LOGGER().
 */
class ContextLogger {
 public:
  explicit ContextLogger(const std::source_location& loc)
      : context_(Logger::get_source_context(loc)) {}

  template <typename... Args>
  void trace(fmt::format_string<Args...> fmt, Args&&... args) {
    Logger::get()->trace("[{}] {}", context_,
                         fmt::format(fmt, std::forward<Args>(args)...));
  }

  void trace(const std::string& msg) {
    Logger::get()->trace("[{}] {}", context_, msg);
  }

  template <typename... Args>
  void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    Logger::get()->debug("[{}] {}", context_,
                         fmt::format(fmt, std::forward<Args>(args)...));
  }

  void debug(const std::string& msg) {
    Logger::get()->debug("[{}] {}", context_, msg);
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> fmt, Args&&... args) {
    Logger::get()->info("[{}] {}", context_,
                        fmt::format(fmt, std::forward<Args>(args)...));
  }

  void info(const std::string& msg) {
    Logger::get()->info("[{}] {}", context_, msg);
  }

  template <typename... Args>
  void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    Logger::get()->warn("[{}] {}", context_,
                        fmt::format(fmt, std::forward<Args>(args)...));
  }

  void warn(const std::string& msg) {
    Logger::get()->warn("[{}] {}", context_, msg);
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> fmt, Args&&... args) {
    Logger::get()->error("[{}] {}", context_,
                         fmt::format(fmt, std::forward<Args>(args)...));
  }

  void error(const std::string& msg) {
    Logger::get()->error("[{}] {}", context_, msg);
  }

  template <typename... Args>
  void critical(fmt::format_string<Args...> fmt, Args&&... args) {
    Logger::get()->critical("[{}] {}", context_,
                            fmt::format(fmt, std::forward<Args>(args)...));
  }

  void critical(const std::string& msg) {
    Logger::get()->critical("[{}] {}", context_, msg);
  }

  const std::string& context() const { return context_; }

 private:
  std::string context_;
};

}  // namespace molham::utils

/**
 * @def MOLHAM_LOGGER()
 * @brief ContextLogger bound to the current source location
 */
#define MOLHAM_LOGGER() \
  molham::utils::ContextLogger(std::source_location::current())

/**
 * @def MOLHAM_RAW_LOGGER()
 * @brief The underlying spdlog logger, without context prefix
 */
#define MOLHAM_RAW_LOGGER() molham::utils::Logger::get()

/**
 * @def MOLHAM_LOG_TRACE_ENTERING()
 * @brief Log function entry at trace level
 *
 * Expands to nothing when MOLHAM_DISABLE_TRACE_LOG is defined (CMake option
 * MOLHAM_DISABLE_TRACE_LOG=ON).
 */
#ifdef MOLHAM_DISABLE_TRACE_LOG
#define MOLHAM_LOG_TRACE_ENTERING() ((void)0)
#else
#define MOLHAM_LOG_TRACE_ENTERING() molham::utils::log_trace_entering()
#endif
