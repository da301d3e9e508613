#include <Spank++/Config/Config.hpp>

#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_cast, case_insensitive}
#include <toml++/impl/parser.hpp>    // toml::{parse_file, parse_error}

#include <Spank++/Core/HostLog.hpp>
#include <Spank++/Utils/Env.hpp>

namespace spankpp::config {
  using namespace types;
  using utils::logging::LogLevel;

  fn ParseLevel(const StringView value, const StringView origin) -> Result<LogLevel> {
    if (const Option<LogLevel> level = utils::logging::ParseLogLevel(value))
      return *level;

    ERR_FMT("Unknown log level '{}' in {}", value, origin);
  }

  fn Logging::fromToml(const toml::table& tbl) -> Result<Logging> {
    Logging logging;

    if (const toml::node_view<const toml::node> levelNode = tbl["level"])
      if (auto levelVal = levelNode.value<String>())
        logging.level = TRY(ParseLevel(*levelVal, "[logging] level"));

    if (const toml::node_view<const toml::node> targetNode = tbl["target"])
      if (auto targetVal = targetNode.value<String>()) {
        const Option<LogTarget> target = magic_enum::enum_cast<LogTarget>(*targetVal, magic_enum::case_insensitive);

        if (!target)
          ERR_FMT("Unknown log target '{}' in [logging] target", *targetVal);

        logging.target = *target;
      }

    return logging;
  }

  fn Config::fromToml(const toml::table& tbl) -> Result<Config> {
    Config cfg;

    if (const toml::node_view loggingTbl = tbl["logging"]; loggingTbl.is_table())
      cfg.logging = TRY(Logging::fromToml(*loggingTbl.as_table()));

    return cfg;
  }

  fn Config::fromFile(const StringView path) -> Result<Config> {
    try {
      const toml::table parsedConfig = toml::parse_file(path);

      debug_log("Config loaded from {}", path);

      return fromToml(parsedConfig);
    } catch (const toml::parse_error& e) {
      ERR_FMT("Failed to load config from {}: {}", path, e.description());
    }
  }

  fn Config::load(const Vec<StringView>& pluginArgs) -> Result<Config> {
    Option<StringView> configPath;
    Option<StringView> levelArg;

    for (const StringView arg : pluginArgs) {
      if (!arg.starts_with(ARG_PREFIX))
        continue;

      const StringView setting = arg.substr(ARG_PREFIX.size());
      const usize      equals  = setting.find('=');

      if (equals == StringView::npos)
        ERR_FMT("Plugin argument '{}' expects a value", arg);

      const StringView key   = setting.substr(0, equals);
      const StringView value = setting.substr(equals + 1);

      if (key == "config")
        configPath = value;
      else if (key == "log_level")
        levelArg = value;
      else
        debug_log("Ignoring unknown plugin argument '{}'", arg);
    }

    Config cfg;

    if (configPath)
      cfg = TRY(fromFile(*configPath));

    if (levelArg)
      cfg.logging.level = TRY(ParseLevel(*levelArg, "plugin argument spankpp.log_level"));

    if (const Result<String> envLevel = utils::env::GetEnv(LOG_LEVEL_ENV))
      cfg.logging.level = TRY(ParseLevel(*envLevel, LOG_LEVEL_ENV));

    return cfg;
  }

  fn Config::apply() const -> void {
    if (logging.target == LogTarget::Host)
      core::InstallHostLogSink();
    else
      utils::logging::SetLogSink(nullptr);

    utils::logging::SetRuntimeLogLevel(logging.level);
  }
} // namespace spankpp::config
