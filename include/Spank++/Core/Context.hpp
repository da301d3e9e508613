/**
 * @file Context.hpp
 * @brief Execution contexts a plugin callback can run under
 * @author Spank++ Team
 * @version 1.0.0
 */

#pragma once

#include <format>                    // std::formatter
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include "../Utils/Types.hpp"

namespace spankpp::core {
  /**
   * @enum Context
   * @brief Which host process is running the current callback.
   *
   * The host's error context is not represented here; it surfaces as an error
   * from SpankHandle::context() instead. Never cache this value: it is queried
   * fresh on every call.
   */
  enum class Context : utils::types::u8 {
    Local,     ///< srun, before remote execution
    Remote,    ///< slurmstepd on a compute node
    Allocator, ///< salloc or sbatch
    Slurmd,    ///< slurmd startup and shutdown
    JobScript, ///< prolog or epilog script
  };

  /**
   * @brief Maps the host's raw context value into Context.
   * @return The context, or None for the host's error value or anything unknown.
   */
  fn ContextFromNative(utils::types::i32 raw) -> utils::types::Option<Context>;
} // namespace spankpp::core

template <>
struct std::formatter<spankpp::core::Context> : std::formatter<std::string_view> {
  fn format(const spankpp::core::Context context, std::format_context& ctx) const {
    return std::formatter<std::string_view>::format(magic_enum::enum_name(context), ctx);
  }
};
