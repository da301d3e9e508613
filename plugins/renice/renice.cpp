/**
 * @file renice.cpp
 * @brief Re-nices job tasks to a user-requested priority
 * @author Spank++ Team
 * @version 1.0.0
 *
 * @details The priority comes from `--renice=prio`, or from SLURM_RENICE in the
 * job environment. Administrators can set a floor with the plugstack.conf
 * argument `min_prio=<prio>`; lower requests are raised to it.
 */

#include <cerrno>         // errno
#include <charconv>       // std::from_chars
#include <sys/resource.h> // setpriority, PRIO_PROCESS
#include <system_error>   // std::{errc, system_category}

#include <Spank++/Config/Config.hpp>
#include <Spank++/Spank++.hpp>

namespace {
  using namespace spankpp::utils::types;
  using spankpp::core::Context, spankpp::core::SpankHandle, spankpp::core::SpankOption;
  using spankpp::utils::error::SpankError;

  constexpr i32        MIN_PRIO     = -20;
  constexpr i32        MAX_PRIO     = 19;
  constexpr StringView PRIO_ENV_VAR = "SLURM_RENICE";

  fn ParsePrio(const StringView value) -> Result<i32> {
    i32 prio = 0;

    const auto [end, errc] = std::from_chars(value.data(), value.data() + value.size(), prio);

    if (errc != std::errc() || end != value.data() + value.size())
      ERR_FMT("'{}' is not an integer", value);

    if (prio < MIN_PRIO || prio > MAX_PRIO)
      ERR_FMT("Priority is not between {} and {}", MIN_PRIO, MAX_PRIO);

    return prio;
  }

  class Renice : public spankpp::core::IPlugin {
   public:
    fn init(SpankHandle& spank) -> Result<> override {
      const Context context = TRY(spank.context());

      // Nothing to do in salloc/sbatch
      if (context == Context::Allocator)
        return {};

      if (context == Context::Remote) {
        Result<Vec<String>> args = spank.pluginArgv();

        if (!args)
          ERR_FROM(args.error().wrap("Invalid plugin argument"));

        for (const String& arg : *args) {
          if (arg.starts_with(spankpp::config::ARG_PREFIX))
            continue;

          if (!arg.starts_with("min_prio="))
            ERR_FMT("Invalid plugin argument: {}", arg);

          Result<i32> minPrio = ParsePrio(StringView(arg).substr(StringView("min_prio=").size()));

          if (!minPrio)
            ERR_FROM(minPrio.error().wrap("Invalid min_prio"));

          m_minPrio = *minPrio;
        }
      }

      if (Result<> registered = spank.registerOption(SpankOption("renice").takesValue("prio").usage("Re-nice job tasks to priority [prio]")); !registered)
        ERR_FROM(registered.error().wrap("Failed to register renice option"));

      return {};
    }

    fn initPostOpt(SpankHandle& spank) -> Result<> override {
      const Context context = TRY(spank.context());

      if (context != Context::Local && context != Context::Remote)
        return {};

      Result<Option<String>> prio = spank.getOptionValue("renice");

      if (!prio)
        ERR_FROM(prio.error().wrap("Failed to read --renice option"));

      if (!*prio)
        return {};

      if (Result<> set = setPrio(**prio, "--renice"); !set)
        ERR_FROM(set.error().wrap("Bad value for --renice"));

      return {};
    }

    fn taskPostFork(SpankHandle& spank) -> Result<> override {
      if (!m_prio) {
        Result<Option<String>> fromEnv = spank.getenv(PRIO_ENV_VAR);

        if (!fromEnv)
          ERR_FROM(fromEnv.error().wrap(std::format("Bad value for {}", PRIO_ENV_VAR)));

        if (*fromEnv)
          if (Result<> set = setPrio(**fromEnv, PRIO_ENV_VAR); !set)
            ERR_FROM(set.error().wrap(std::format("Bad value for {}", PRIO_ENV_VAR)));
      }

      if (!m_prio)
        return {};

      const u32   taskId = TRY(spank.taskGlobalId());
      const pid_t pid    = TRY(spank.taskPid());

      info_log("re-nicing task{} pid {} to {}", taskId, pid, *m_prio);

      if (setpriority(PRIO_PROCESS, static_cast<id_t>(pid), *m_prio) < 0)
        ERR_FROM(SpankError(std::system_category().message(errno)).wrap("setpriority"));

      return {};
    }

   private:
    i32         m_minPrio = MIN_PRIO;
    Option<i32> m_prio;

    fn setPrio(const StringView value, const StringView origin) -> Result<> {
      const i32 prio = TRY(ParsePrio(value));

      if (prio < m_minPrio) {
        error_log("{}={} is not allowed, will use min_prio ({})", origin, prio, m_minPrio);
        m_prio = m_minPrio;
      } else
        m_prio = prio;

      return {};
    }
  };
} // namespace

SPANKPP_PLUGIN("renice", SPANKPP_SLURM_VERSION, Renice)
