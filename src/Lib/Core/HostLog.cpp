#include <Spank++/Core/HostLog.hpp>

#include <slurm/spank.h> // slurm_{error, info, verbose, debug, debug2, debug3, spank_log}

#include <Spank++/Utils/Strings.hpp>

namespace spankpp::core {
  using namespace utils::types;
  using utils::logging::LogLevel;

  fn SpankLog(const LogLevel level, const StringView message) -> void {
    const String safe = utils::strings::EscapeNul(message, "0");

    switch (level) {
      case LogLevel::Error:   slurm_error("%s", safe.c_str()); break;
      case LogLevel::Info:    slurm_info("%s", safe.c_str()); break;
      case LogLevel::Verbose: slurm_verbose("%s", safe.c_str()); break;
      case LogLevel::Debug:   slurm_debug("%s", safe.c_str()); break;
      case LogLevel::Debug2:  slurm_debug2("%s", safe.c_str()); break;
      case LogLevel::Debug3:  slurm_debug3("%s", safe.c_str()); break;
    }
  }

  fn SpankLogUser(const StringView message) -> void {
    const String safe = utils::strings::EscapeNul(message, "0");
    slurm_spank_log("%s", safe.c_str());
  }

  fn InstallHostLogSink() -> void {
    utils::logging::SetLogSink(&SpankLog);
  }
} // namespace spankpp::core
