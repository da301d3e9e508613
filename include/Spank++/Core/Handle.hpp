/**
 * @file Handle.hpp
 * @brief Per-callback view of the host exposed to plugin code
 * @author Spank++ Team
 * @version 1.0.0
 *
 * @details A SpankHandle is built fresh for every callback and borrows the
 * process-wide option cache. It must not be stored beyond the callback that
 * received it.
 *
 * Environment accessors come in pairs: the job environment (getenv and
 * friends) is only reachable from the Remote and Slurmd contexts, the job
 * control environment only from Local and Allocator. Use the process
 * environment directly for the other side.
 *
 * String results come in three flavours: plain (validated UTF-8, Utf8Error
 * otherwise), Raw (the host's bytes unchanged) and Lossy (invalid sequences
 * replaced with U+FFFD).
 */

#pragma once

#include <slurm/spank.h> // spank_t, spank_item_t
#include <sys/types.h>   // gid_t, pid_t, uid_t

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Context.hpp"
#include "Option.hpp"
#include "OptionCache.hpp"

namespace spankpp::core {
  /// Signature of the capture callback the host invokes for registered options.
  using OptionCallback = int (*)(int val, const char* optarg, int remote);

  class SpankHandle {
   public:
    SpankHandle(
      spank_t        spank,
      OptionCache&   cache,
      utils::types::i32 argc,
      char**         argv,
      OptionCallback optionCallback
    );

    SpankHandle(const SpankHandle&)                = delete;
    SpankHandle(SpankHandle&&)                     = delete;
    fn operator=(const SpankHandle&)->SpankHandle& = delete;
    fn operator=(SpankHandle&&)->SpankHandle&      = delete;
    ~SpankHandle()                                 = default;

    /**
     * @brief Returns the context in which the calling plugin is loaded.
     * @return The context, or a SpankApi error if the host reports none.
     */
    [[nodiscard]] fn context() const -> utils::types::Result<Context>;

    /**
     * @brief Registers a plugin-provided option.
     *
     * Only valid from init(). It must be called identically in every context the
     * plugin is loaded in: each context keeps its own option table and options
     * registered in only some of them silently fail to resolve in the others.
     * Registering the same name twice is rejected by the host.
     *
     * @param option The option description; consumed.
     * @return CStringError if a field holds a NUL byte, SpankApi if the host refuses it.
     */
    fn registerOption(SpankOption option) -> utils::types::Result<>;

    /// Arguments given to this plugin in plugstack.conf.
    [[nodiscard]] fn pluginArgv() const -> utils::types::Result<utils::types::Vec<utils::types::String>>;
    [[nodiscard]] fn pluginArgvRaw() const -> utils::types::Vec<utils::types::StringView>;

    /**
     * @brief Reads @p name from the job environment.
     * @return None if the variable is not set.
     */
    [[nodiscard]] fn getenv(utils::types::StringView name) const -> utils::types::Result<utils::types::Option<utils::types::String>>;
    [[nodiscard]] fn getenvRaw(utils::types::StringView name) const -> utils::types::Result<utils::types::Option<utils::types::String>>;
    [[nodiscard]] fn getenvLossy(utils::types::StringView name) const -> utils::types::Result<utils::types::Option<utils::types::String>>;

    /**
     * @brief Sets @p name in the job environment.
     * @return EnvExists if the variable is set and @p overwrite is false; the
     *         existing value is kept.
     */
    fn setenv(utils::types::StringView name, utils::types::StringView value, bool overwrite) const -> utils::types::Result<>;

    /// Removes @p name from the job environment. Succeeds if it was not set.
    fn unsetenv(utils::types::StringView name) const -> utils::types::Result<>;

    [[nodiscard]] fn jobControlGetenv(utils::types::StringView name) const -> utils::types::Result<utils::types::Option<utils::types::String>>;
    [[nodiscard]] fn jobControlGetenvRaw(utils::types::StringView name) const -> utils::types::Result<utils::types::Option<utils::types::String>>;
    [[nodiscard]] fn jobControlGetenvLossy(utils::types::StringView name) const -> utils::types::Result<utils::types::Option<utils::types::String>>;
    fn jobControlSetenv(utils::types::StringView name, utils::types::StringView value, bool overwrite) const -> utils::types::Result<>;
    fn jobControlUnsetenv(utils::types::StringView name) const -> utils::types::Result<>;

    /**
     * @brief Returns the value given for option @p name.
     *
     * If the option was given several times the last value wins.
     *
     * @warning Before options are processed (in init(), or anywhere in the
     * Slurmd context) this always returns None, even if the user set the
     * option: the host has not delivered it yet.
     *
     * @warning Always None for flag options. Use isOptionSet() for those.
     */
    [[nodiscard]] fn getOptionValue(utils::types::StringView name) -> utils::types::Result<utils::types::Option<utils::types::String>>;
    [[nodiscard]] fn getOptionValueRaw(utils::types::StringView name) -> utils::types::Option<utils::types::String>;
    [[nodiscard]] fn getOptionValueLossy(utils::types::StringView name) -> utils::types::Option<utils::types::String>;

    /**
     * @brief Returns every retained value for option @p name.
     * @note Only the last value is retained, so the vector holds at most one entry.
     */
    [[nodiscard]] fn getOptionValues(utils::types::StringView name) -> utils::types::Result<utils::types::Option<utils::types::Vec<utils::types::String>>>;

    /**
     * @brief Returns whether option @p name was given, with or without a value.
     * @warning Always false before options are processed.
     */
    [[nodiscard]] fn isOptionSet(utils::types::StringView name) -> bool;

    /// 1 if the option was given, 0 otherwise.
    [[nodiscard]] fn getOptionCount(utils::types::StringView name) -> utils::types::usize;

    [[nodiscard]] fn jobUid() const -> utils::types::Result<uid_t>;
    [[nodiscard]] fn jobGid() const -> utils::types::Result<gid_t>;
    [[nodiscard]] fn jobId() const -> utils::types::Result<utils::types::u32>;
    [[nodiscard]] fn jobStepid() const -> utils::types::Result<utils::types::u32>;
    [[nodiscard]] fn jobNnodes() const -> utils::types::Result<utils::types::u32>;
    [[nodiscard]] fn jobNodeid() const -> utils::types::Result<utils::types::u32>;
    [[nodiscard]] fn jobLocalTaskCount() const -> utils::types::Result<utils::types::u32>;
    [[nodiscard]] fn jobTotalTaskCount() const -> utils::types::Result<utils::types::u32>;
    [[nodiscard]] fn jobNcpus() const -> utils::types::Result<utils::types::u16>;

    /// Command line of the job step.
    [[nodiscard]] fn jobArgv() const -> utils::types::Result<utils::types::Vec<utils::types::String>>;
    [[nodiscard]] fn jobArgvRaw() const -> utils::types::Result<utils::types::Vec<utils::types::StringView>>;

    /// Job environment as NAME=VALUE entries.
    [[nodiscard]] fn jobEnv() const -> utils::types::Result<utils::types::Vec<utils::types::String>>;
    [[nodiscard]] fn jobEnvRaw() const -> utils::types::Result<utils::types::Vec<utils::types::StringView>>;

    [[nodiscard]] fn taskId() const -> utils::types::Result<utils::types::i32>;
    [[nodiscard]] fn taskGlobalId() const -> utils::types::Result<utils::types::u32>;
    [[nodiscard]] fn taskExitStatus() const -> utils::types::Result<utils::types::i32>;
    [[nodiscard]] fn taskPid() const -> utils::types::Result<pid_t>;

    /// @return PidNotFound if no task of this job has pid @p pid on this node.
    [[nodiscard]] fn pidToGlobalId(pid_t pid) const -> utils::types::Result<utils::types::u32>;
    [[nodiscard]] fn pidToLocalId(pid_t pid) const -> utils::types::Result<utils::types::u32>;

    /// @return IdNotFound if @p localId is not a task of this node.
    [[nodiscard]] fn localToGlobalId(utils::types::u32 localId) const -> utils::types::Result<utils::types::u32>;
    [[nodiscard]] fn globalToLocalId(utils::types::u32 globalId) const -> utils::types::Result<utils::types::u32>;

    [[nodiscard]] fn jobSupplementaryGids() const -> utils::types::Result<utils::types::Vec<gid_t>>;

    [[nodiscard]] fn slurmVersion() const -> utils::types::Result<utils::types::String>;
    [[nodiscard]] fn slurmVersionMajor() const -> utils::types::Result<utils::types::String>;
    [[nodiscard]] fn slurmVersionMinor() const -> utils::types::Result<utils::types::String>;
    [[nodiscard]] fn slurmVersionMicro() const -> utils::types::Result<utils::types::String>;

    /// CPUs allocated per task; 1 when --overcommit is used.
    [[nodiscard]] fn stepCpusPerTask() const -> utils::types::Result<utils::types::u64>;
    [[nodiscard]] fn jobAllocCores() const -> utils::types::Result<utils::types::String>;
    /// Job allocated memory in MB.
    [[nodiscard]] fn jobAllocMem() const -> utils::types::Result<utils::types::u64>;
    [[nodiscard]] fn stepAllocCores() const -> utils::types::Result<utils::types::String>;
    [[nodiscard]] fn stepAllocMem() const -> utils::types::Result<utils::types::u64>;
    [[nodiscard]] fn slurmRestartCount() const -> utils::types::Result<utils::types::u32>;
    [[nodiscard]] fn jobArrayId() const -> utils::types::Result<utils::types::u32>;
    [[nodiscard]] fn jobArrayTaskId() const -> utils::types::Result<utils::types::u32>;

    /**
     * @brief Prepends @p args to the argv of the task about to run.
     * @note Only valid from task_init_privileged() and task_init().
     */
    fn prependTaskArgv(const utils::types::Vec<utils::types::String>& args) const -> utils::types::Result<>;

   private:
    spank_t           m_spank;
    OptionCache&      m_cache; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    utils::types::i32 m_argc;
    char**            m_argv;
    OptionCallback    m_optionCallback;

    template <typename T>
    fn getItem(spank_item_t item) const -> utils::types::Result<T>;

    template <typename T, typename Key>
    fn getItemByKey(spank_item_t item, Key key) const -> utils::types::Result<T>;

    fn getStringItem(spank_item_t item) const -> utils::types::Result<utils::types::String>;

    fn jobArgvNative() const -> utils::types::Result<utils::types::Vec<utils::types::StringView>>;
    fn jobEnvNative() const -> utils::types::Result<utils::types::Vec<utils::types::StringView>>;

    fn optionValue(utils::types::StringView name) -> const OptionCache::Value*;
    fn getopt(utils::types::StringView name) const -> utils::types::Result<OptionCache::Value>;
  };
} // namespace spankpp::core
