#include <Spank++/Core/Context.hpp>

#include <matchit.hpp>   // matchit::{match, is, _}
#include <slurm/spank.h> // S_CTX_*

namespace spankpp::core {
  using namespace utils::types;

  fn ContextFromNative(const i32 raw) -> Option<Context> {
    using matchit::match, matchit::is, matchit::_;
    using enum Context;

    return match(raw)(
      is | static_cast<i32>(S_CTX_LOCAL)      = Some(Local),
      is | static_cast<i32>(S_CTX_REMOTE)     = Some(Remote),
      is | static_cast<i32>(S_CTX_ALLOCATOR)  = Some(Allocator),
      is | static_cast<i32>(S_CTX_SLURMD)     = Some(Slurmd),
      is | static_cast<i32>(S_CTX_JOB_SCRIPT) = Some(JobScript),
      is | _                                  = Option<Context>(None)
    );
  }
} // namespace spankpp::core
