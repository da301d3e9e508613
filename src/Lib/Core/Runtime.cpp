#include <Spank++/Core/Runtime.hpp>

#include <exception> // std::exception
#include <format>    // std::format
#include <mutex>     // std::try_to_lock

#include <Spank++/Core/HostLog.hpp>
#include <Spank++/Utils/Logging.hpp>

namespace spankpp::core {
  using namespace utils::types;
  using utils::error::SpankError;
  using utils::logging::LogLevel;

  namespace {
    /**
     * Holds the plugin instance outside its slot for the length of a callback
     * and puts it back on every exit path.
     */
    class PluginLease {
     public:
      PluginLease(Mutex& mutex, UniquePointer<IPlugin>& slot, UniquePointer<IPlugin> plugin)
        : m_mutex(mutex), m_slot(slot), m_plugin(std::move(plugin)) {}

      PluginLease(const PluginLease&)                = delete;
      PluginLease(PluginLease&&)                     = delete;
      fn operator=(const PluginLease&)->PluginLease& = delete;
      fn operator=(PluginLease&&)->PluginLease&      = delete;

      ~PluginLease() {
        const LockGuard lock(m_mutex);
        m_slot = std::move(m_plugin);
      }

      fn get() const -> IPlugin& {
        return *m_plugin;
      }

     private:
      Mutex&                  m_mutex; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
      UniquePointer<IPlugin>& m_slot;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
      UniquePointer<IPlugin>  m_plugin;
    };
  } // namespace

  PluginRuntime::PluginRuntime(Factory factory, OptionCallback optionCallback)
    : m_factory(factory), m_optionCallback(optionCallback) {}

  fn PluginRuntime::run(IPlugin& plugin, const Callback callback, SpankHandle& handle) -> i32 {
    if (!m_setupDone) {
      m_setupDone = true;

      Result<> setup;

      try {
        setup = plugin.setup(handle);
      } catch (const std::exception& e) {
        setup = Err(SpankError(std::format("unhandled exception: {}", e.what())));
      } catch (...) {
        setup = Err(SpankError("unhandled exception of unknown type"));
      }

      // Setup failures are reported, the triggering callback still runs
      if (!setup)
        plugin.handleError(setup.error().wrap("Plugin setup failed"));
    }

    if (m_state == LifecycleState::Exited)
      info_log("{} called after slurm_spank_exit", callback);

    const LifecycleState next = NextState(m_state, callback);
    debug_log("{}: {} -> {}", callback, m_state, next);
    m_state = next;

    Result<> result;

    switch (callback) {
      case Callback::Init:               result = plugin.init(handle); break;
      case Callback::JobProlog:          result = plugin.jobProlog(handle); break;
      case Callback::InitPostOpt:        result = plugin.initPostOpt(handle); break;
      case Callback::LocalUserInit:      result = plugin.localUserInit(handle); break;
      case Callback::UserInit:           result = plugin.userInit(handle); break;
      case Callback::TaskInitPrivileged: result = plugin.taskInitPrivileged(handle); break;
      case Callback::TaskInit:           result = plugin.taskInit(handle); break;
      case Callback::TaskPostFork:       result = plugin.taskPostFork(handle); break;
      case Callback::TaskExit:           result = plugin.taskExit(handle); break;
      case Callback::JobEpilog:          result = plugin.jobEpilog(handle); break;
      case Callback::SlurmdExit:         result = plugin.slurmdExit(handle); break;
      case Callback::Exit:               result = plugin.exit(handle); break;
    }

    if (!result) {
      plugin.handleError(result.error());
      return STATUS_FAILURE;
    }

    return STATUS_SUCCESS;
  }

  fn PluginRuntime::dispatch(const Callback callback, spank_t spank, const i32 argc, char** argv) noexcept -> i32 {
    try {
      const UniqueLock cacheLock(m_cacheMutex, std::try_to_lock);

      if (!cacheLock.owns_lock()) {
        SpankLog(LogLevel::Error, std::format("{}: option state is already locked", callback));
        return STATUS_FAILURE;
      }

      UniquePointer<IPlugin> taken;

      {
        const UniqueLock pluginLock(m_pluginMutex, std::try_to_lock);

        if (!pluginLock.owns_lock()) {
          SpankLog(LogLevel::Error, std::format("{}: plugin state is already locked", callback));
          return STATUS_FAILURE;
        }

        if (!m_constructed) {
          m_plugin      = m_factory();
          m_constructed = m_plugin != nullptr;
        }

        taken = std::move(m_plugin);
      }

      if (!taken) {
        SpankLog(LogLevel::Error, std::format("{}: plugin instance is unavailable", callback));
        return STATUS_FAILURE;
      }

      const PluginLease lease(m_pluginMutex, m_plugin, std::move(taken));
      SpankHandle       handle(spank, m_cache, argc, argv, m_optionCallback);

      return run(lease.get(), callback, handle);
    } catch (const std::exception& e) {
      SpankLog(LogLevel::Error, std::format("{}: unhandled exception: {}", callback, e.what()));
      return STATUS_FAILURE;
    } catch (...) {
      SpankLog(LogLevel::Error, std::format("{}: unhandled exception of unknown type", callback));
      return STATUS_FAILURE;
    }
  }

  fn PluginRuntime::captureOption(const i32 slot, const PCStr optarg) noexcept -> i32 {
    try {
      const UniqueLock cacheLock(m_cacheMutex, std::try_to_lock);

      if (!cacheLock.owns_lock()) {
        SpankLog(LogLevel::Error, "Option callback: option state is already locked");
        return STATUS_FAILURE;
      }

      OptionCache::Value value = optarg != nullptr ? Some(String(optarg)) : OptionCache::Value(None);

      if (Result<> captured = m_cache.capture(slot, std::move(value)); !captured) {
        error_at(captured.error());
        return STATUS_FAILURE;
      }

      return STATUS_SUCCESS;
    } catch (const std::exception& e) {
      SpankLog(LogLevel::Error, std::format("Option callback: unhandled exception: {}", e.what()));
      return STATUS_FAILURE;
    } catch (...) {
      SpankLog(LogLevel::Error, "Option callback: unhandled exception of unknown type");
      return STATUS_FAILURE;
    }
  }
} // namespace spankpp::core
