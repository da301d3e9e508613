#include <Spank++/Core/Plugin.hpp>

#include <Spank++/Config/Config.hpp>
#include <Spank++/Core/HostLog.hpp>

namespace spankpp::core {
  using namespace utils::types;

  fn IPlugin::setup(SpankHandle& spank) -> Result<> {
    const config::Config cfg = TRY(config::Config::load(spank.pluginArgvRaw()));

    cfg.apply();

    debug_log("Logging configured at level {}", magic_enum::enum_name(cfg.logging.level));
    return {};
  }

  fn IPlugin::handleError(const utils::error::SpankError& error) -> void {
    SpankLog(utils::logging::LogLevel::Error, error.chain());
  }
} // namespace spankpp::core
