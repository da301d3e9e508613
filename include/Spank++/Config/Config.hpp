#pragma once

#include <toml++/impl/node.hpp>      // toml::node
#include <toml++/impl/node_view.hpp> // toml::node_view
#include <toml++/impl/table.hpp>     // toml::table

#include "../Utils/Error.hpp"
#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"

namespace spankpp::config {
  namespace types = ::spankpp::utils::types;

  /// Plugin arguments read by the configuration layer start with this prefix.
  inline constexpr types::StringView ARG_PREFIX = "spankpp.";

  /// Environment variable overriding the log level.
  inline constexpr types::PCStr LOG_LEVEL_ENV = "SPANKPP_LOG_LEVEL";

  enum class LogTarget : types::u8 {
    Host,   ///< The host's own log (slurmd/slurmstepd log file, srun stderr)
    Stderr, ///< Styled console output, for debugging outside the host
  };

  /**
   * @struct Logging
   * @brief Holds the [logging] table.
   */
  struct Logging {
    utils::logging::LogLevel level  = utils::logging::LogLevel::Info;
    LogTarget                target = LogTarget::Host;

    /**
     * @brief Parses a TOML table to create a Logging instance.
     * @param tbl The TOML table to parse, containing [logging].
     * @return The parsed values, with defaults for missing keys, or a Custom
     *         error naming an unknown level or target.
     */
    static fn fromToml(const toml::table& tbl) -> types::Result<Logging>;
  };

  /**
   * @struct Config
   * @brief Runtime configuration of a Spank++ plugin.
   *
   * Sources, later ones overriding earlier ones:
   * 1. Built-in defaults.
   * 2. The TOML file named by the plugin argument `spankpp.config=<path>`.
   * 3. The plugin argument `spankpp.log_level=<level>`.
   * 4. The SPANKPP_LOG_LEVEL environment variable.
   */
  struct Config {
    Logging logging;

    Config() = default;

    static fn fromToml(const toml::table& tbl) -> types::Result<Config>;

    /**
     * @brief Parses the TOML file at @p path.
     * @return The configuration, or a Custom error if the file cannot be read or parsed.
     */
    static fn fromFile(types::StringView path) -> types::Result<Config>;

    /**
     * @brief Builds the configuration from every source.
     * @param pluginArgs Arguments given to the plugin in plugstack.conf. Those
     *        without the "spankpp." prefix are ignored.
     */
    static fn load(const types::Vec<types::StringView>& pluginArgs) -> types::Result<Config>;

    /**
     * @brief Applies the logging settings to the process-wide logger.
     */
    fn apply() const -> void;
  };

  /**
   * @brief Parses a level name, rejecting unknown ones.
   * @param origin Where the value came from, for the error message.
   */
  fn ParseLevel(types::StringView value, types::StringView origin) -> types::Result<utils::logging::LogLevel>;
} // namespace spankpp::config
