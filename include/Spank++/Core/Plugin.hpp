/**
 * @file Plugin.hpp
 * @brief The interface plugin authors implement
 * @author Spank++ Team
 * @version 1.0.0
 *
 * @details Exactly one IPlugin implementation is instantiated per loaded plugin
 * object, lazily on the first callback. Every lifecycle method defaults to
 * doing nothing, so a plugin overrides only the points it cares about.
 *
 * Returning an error from a lifecycle method reports it through handleError()
 * and makes the host see a failed callback. For job_prolog and job_epilog the
 * host drains the node on failure.
 */

#pragma once

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Handle.hpp"

namespace spankpp::core {
  class IPlugin {
   public:
    IPlugin()                                  = default;
    IPlugin(const IPlugin&)                    = delete;
    IPlugin(IPlugin&&)                         = delete;
    fn operator=(const IPlugin&)->IPlugin&     = delete;
    fn operator=(IPlugin&&)->IPlugin&          = delete;
    virtual ~IPlugin()                         = default;

    /**
     * @brief Runs once, before the first callback reaches the plugin.
     *
     * The default loads the configuration from the plugin arguments and the
     * environment, then points logging at the host.
     *
     * @note A failure, including an exception thrown from an override, is
     *       reported through handleError() but the callback that triggered
     *       setup still runs.
     */
    virtual fn setup(SpankHandle& spank) -> utils::types::Result<>;

    /**
     * @brief Reports an error returned by a lifecycle method or by setup().
     *
     * The default logs the full cause chain through the host at error level.
     * It always writes to the host log, whatever `[logging] target` says and
     * whether or not setup() succeeded, so failed callbacks show up where the
     * scheduler records them. Override it to report somewhere else.
     */
    virtual fn handleError(const utils::error::SpankError& error) -> void;

    /// Called just after plugins are loaded. Options must be registered here.
    virtual fn init(SpankHandle& /*spank*/) -> utils::types::Result<> {
      return {};
    }

    /// Called at the same time as the job prolog, in its own process.
    virtual fn jobProlog(SpankHandle& /*spank*/) -> utils::types::Result<> {
      return {};
    }

    /// Called after option processing; option values are available from here on.
    virtual fn initPostOpt(SpankHandle& /*spank*/) -> utils::types::Result<> {
      return {};
    }

    /// Local context only: called after privileges are dropped.
    virtual fn localUserInit(SpankHandle& /*spank*/) -> utils::types::Result<> {
      return {};
    }

    /// Remote context only: called after privileges are dropped.
    virtual fn userInit(SpankHandle& /*spank*/) -> utils::types::Result<> {
      return {};
    }

    /// Called per task just after fork, before privileges are dropped.
    virtual fn taskInitPrivileged(SpankHandle& /*spank*/) -> utils::types::Result<> {
      return {};
    }

    /// Called per task just before execve.
    virtual fn taskInit(SpankHandle& /*spank*/) -> utils::types::Result<> {
      return {};
    }

    /// Called in the parent for each task after fork.
    virtual fn taskPostFork(SpankHandle& /*spank*/) -> utils::types::Result<> {
      return {};
    }

    /// Called for each task as its exit status is collected.
    virtual fn taskExit(SpankHandle& /*spank*/) -> utils::types::Result<> {
      return {};
    }

    virtual fn jobEpilog(SpankHandle& /*spank*/) -> utils::types::Result<> {
      return {};
    }

    virtual fn slurmdExit(SpankHandle& /*spank*/) -> utils::types::Result<> {
      return {};
    }

    /// Called once just before the process exits.
    virtual fn exit(SpankHandle& /*spank*/) -> utils::types::Result<> {
      return {};
    }
  };
} // namespace spankpp::core
