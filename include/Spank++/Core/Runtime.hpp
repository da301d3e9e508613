/**
 * @file Runtime.hpp
 * @brief Process-wide state behind the exported entry points
 * @author Spank++ Team
 * @version 1.0.0
 *
 * @details The host owns the entry points and passes nothing but its opaque
 * handle through them, so each loaded plugin object keeps one PluginRuntime
 * in a function-local static (see SPANKPP_PLUGIN). The host calls into a
 * plugin strictly sequentially; both mutexes are taken with try_lock and a
 * failure to acquire fails the callback instead of blocking.
 */

#pragma once

#include <slurm/spank.h> // spank_t

#include "../Utils/Types.hpp"
#include "Handle.hpp"
#include "Lifecycle.hpp"
#include "OptionCache.hpp"
#include "Plugin.hpp"

namespace spankpp::core {
  /// Status reported to the host for a successful callback.
  inline constexpr utils::types::i32 STATUS_SUCCESS = 0;
  /// Status reported to the host for a failed callback.
  inline constexpr utils::types::i32 STATUS_FAILURE = -1;

  class PluginRuntime {
   public:
    using Factory = utils::types::UniquePointer<IPlugin> (*)();

    /**
     * @param factory Builds the plugin instance on the first callback.
     * @param optionCallback Capture callback wired into every registered option.
     */
    PluginRuntime(Factory factory, OptionCallback optionCallback);

    PluginRuntime(const PluginRuntime&)                = delete;
    PluginRuntime(PluginRuntime&&)                     = delete;
    fn operator=(const PluginRuntime&)->PluginRuntime& = delete;
    fn operator=(PluginRuntime&&)->PluginRuntime&      = delete;
    ~PluginRuntime()                                   = default;

    /**
     * @brief Runs one lifecycle callback on behalf of the host.
     *
     * Builds the plugin on first use, runs its setup() once, then calls the
     * method matching @p callback. Errors go to the plugin's handleError().
     * Exceptions are caught here and never reach the host.
     *
     * @return STATUS_SUCCESS or STATUS_FAILURE.
     */
    fn dispatch(Callback callback, spank_t spank, utils::types::i32 argc, char** argv) noexcept -> utils::types::i32;

    /**
     * @brief Records an option value delivered by the host.
     * @param slot The token given when the option was registered.
     * @param optarg The value, or nullptr for a flag.
     * @return STATUS_SUCCESS, or STATUS_FAILURE for an unknown slot.
     */
    fn captureOption(utils::types::i32 slot, utils::types::PCStr optarg) noexcept -> utils::types::i32;

    [[nodiscard]] fn state() const -> LifecycleState {
      return m_state;
    }

   private:
    Factory        m_factory;
    OptionCallback m_optionCallback;

    utils::types::Mutex                  m_pluginMutex;
    utils::types::UniquePointer<IPlugin> m_plugin;
    bool                                 m_constructed = false;
    bool                                 m_setupDone   = false;
    LifecycleState                       m_state       = LifecycleState::Unloaded;

    utils::types::Mutex m_cacheMutex;
    OptionCache         m_cache;

    fn run(IPlugin& plugin, Callback callback, SpankHandle& handle) -> utils::types::i32;
  };
} // namespace spankpp::core
