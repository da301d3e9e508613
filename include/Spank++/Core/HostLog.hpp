/**
 * @file HostLog.hpp
 * @brief Routes messages through the host's logging channels
 * @author Spank++ Team
 * @version 1.0.0
 *
 * @details Messages are always passed through a "%s" format, so user text is
 * never interpreted by the host. The host cannot carry NUL bytes; each one is
 * rendered as the character '0' rather than rejected.
 */

#pragma once

#include <format> // std::format, std::format_string

#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"

namespace spankpp::core {
  /**
   * @brief Emits @p message through the host's logger at @p level.
   */
  fn SpankLog(utils::logging::LogLevel level, utils::types::StringView message) -> void;

  /**
   * @brief Emits @p message on the host's user-visible channel (stderr of srun/sbatch).
   */
  fn SpankLogUser(utils::types::StringView message) -> void;

  /**
   * @brief Sends every record from the logging macros to SpankLog.
   */
  fn InstallHostLogSink() -> void;

  template <typename... Args>
  fn UserLog(std::format_string<Args...> fmt, Args&&... args) -> void {
    SpankLogUser(std::format(fmt, std::forward<Args>(args)...));
  }
} // namespace spankpp::core

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define user_log(fmt, ...) ::spankpp::core::UserLog(fmt __VA_OPT__(, ) __VA_ARGS__)
