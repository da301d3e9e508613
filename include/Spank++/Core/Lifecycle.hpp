/**
 * @file Lifecycle.hpp
 * @brief Lifecycle points invoked by the host and the state they imply
 * @author Spank++ Team
 * @version 1.0.0
 *
 * @details The host drives a plugin through at most twelve callbacks, in the order
 * init -> (job_prolog | init_post_opt) -> (local_user_init | user_init) ->
 * task_init_privileged -> task_init -> task_post_fork -> task_exit ->
 * job_epilog -> slurmd_exit -> exit. Not all of them happen in every process.
 *
 * LifecycleState is tracked for diagnostics only. Dispatch never refuses a
 * callback because of it.
 */

#pragma once

#include <format>                    // std::formatter
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include "../Utils/Types.hpp"

namespace spankpp::core {
  enum class Callback : utils::types::u8 {
    Init,
    JobProlog,
    InitPostOpt,
    LocalUserInit,
    UserInit,
    TaskInitPrivileged,
    TaskInit,
    TaskPostFork,
    TaskExit,
    JobEpilog,
    SlurmdExit,
    Exit,
  };

  enum class LifecycleState : utils::types::u8 {
    Unloaded,
    Initialized,
    OptionsProcessed,
    TaskRunning,
    TaskDone,
    Exited,
  };

  /**
   * @brief Exported symbol the host resolves for @p callback, e.g. "slurm_spank_init".
   */
  fn NativeName(Callback callback) -> utils::types::StringView;

  /**
   * @brief State reached once @p callback has been dispatched from @p current.
   *
   * Exit moves to Exited from anywhere. job_prolog, job_epilog and slurmd_exit
   * are out of band and leave the state unchanged, except that job_prolog
   * counts as option processing for a process that only ran init.
   */
  fn NextState(LifecycleState current, Callback callback) -> LifecycleState;
} // namespace spankpp::core

template <>
struct std::formatter<spankpp::core::Callback> : std::formatter<std::string_view> {
  fn format(const spankpp::core::Callback callback, std::format_context& ctx) const {
    return std::formatter<std::string_view>::format(spankpp::core::NativeName(callback), ctx);
  }
};

template <>
struct std::formatter<spankpp::core::LifecycleState> : std::formatter<std::string_view> {
  fn format(const spankpp::core::LifecycleState state, std::format_context& ctx) const {
    return std::formatter<std::string_view>::format(magic_enum::enum_name(state), ctx);
  }
};
