#include <Spank++/Core/Lifecycle.hpp>

#include <matchit.hpp> // matchit::{match, is, or_, _}

namespace spankpp::core {
  using namespace utils::types;

  fn NativeName(const Callback callback) -> StringView {
    using matchit::match, matchit::is, matchit::_;
    using enum Callback;

    return match(callback)(
      is | Init               = "slurm_spank_init",
      is | JobProlog          = "slurm_spank_job_prolog",
      is | InitPostOpt        = "slurm_spank_init_post_opt",
      is | LocalUserInit      = "slurm_spank_local_user_init",
      is | UserInit           = "slurm_spank_user_init",
      is | TaskInitPrivileged = "slurm_spank_task_init_privileged",
      is | TaskInit           = "slurm_spank_task_init",
      is | TaskPostFork       = "slurm_spank_task_post_fork",
      is | TaskExit           = "slurm_spank_task_exit",
      is | JobEpilog          = "slurm_spank_job_epilog",
      is | SlurmdExit         = "slurm_spank_slurmd_exit",
      is | _                  = "slurm_spank_exit"
    );
  }

  fn NextState(const LifecycleState current, const Callback callback) -> LifecycleState {
    using matchit::match, matchit::is, matchit::or_, matchit::_;
    using enum Callback;

    if (callback == Exit || current == LifecycleState::Exited)
      return LifecycleState::Exited;

    return match(callback)(
      is | Init                                                = LifecycleState::Initialized,
      is | or_(InitPostOpt, LocalUserInit, UserInit)           = LifecycleState::OptionsProcessed,
      is | or_(TaskInitPrivileged, TaskInit, TaskPostFork)     = LifecycleState::TaskRunning,
      is | TaskExit                                            = LifecycleState::TaskDone,
      is | JobProlog                                           = current == LifecycleState::Initialized ? LifecycleState::OptionsProcessed : current,
      is | _                                                   = current
    );
  }
} // namespace spankpp::core
