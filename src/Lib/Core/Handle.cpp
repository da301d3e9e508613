/**
 * @file Handle.cpp
 * @brief Host queries behind SpankHandle
 * @author Spank++ Team
 * @version 1.0.0
 */

#include <Spank++/Core/Handle.hpp>

#include <limits>      // std::numeric_limits
#include <type_traits> // std::is_same_v

#include <Spank++/Utils/Logging.hpp>
#include <Spank++/Utils/Strings.hpp>

namespace spankpp::core {
  using namespace utils::types;
  using utils::error::SpankError, utils::error::InternalError;

  namespace kind    = utils::error::kind;
  namespace strings = utils::strings;

  namespace {
    constexpr usize INITIAL_ENV_BUFFER = 4096;

    using GetenvFn   = spank_err_t (*)(spank_t, const char*, char*, int);
    using SetenvFn   = spank_err_t (*)(spank_t, const char*, const char*, int);
    using UnsetenvFn = spank_err_t (*)(spank_t, const char*);

    fn DoGetenv(spank_t spank, const StringView name, GetenvFn getter, const StringView function) -> Result<Option<String>> {
      const String cName = TRY(strings::ToCString(name));

      Vec<char> buffer;
      usize     size = INITIAL_ENV_BUFFER;

      while (true) {
        if (size > static_cast<usize>(std::numeric_limits<i32>::max()))
          ERR(kind::Overflow { .what = "environment buffer", .value = size });

        buffer.assign(size, '\0');

        const spank_err_t status = getter(spank, cName.c_str(), buffer.data(), static_cast<i32>(size));

        switch (status) {
          case ESPANK_SUCCESS:      return Some(String(buffer.data()));
          case ESPANK_ENV_NOEXIST:  return Option<String>(None);
          case ESPANK_NOSPACE:      size *= 2; break;
          default:                  ERR_FROM(SpankError::fromApi(function, status));
        }
      }
    }

    fn DoSetenv(spank_t spank, const StringView name, const StringView value, const bool overwrite, SetenvFn setter, const StringView function) -> Result<> {
      const String cName  = TRY(strings::ToCString(name));
      const String cValue = TRY(strings::ToCString(value));

      const spank_err_t status = setter(spank, cName.c_str(), cValue.c_str(), overwrite ? 1 : 0);

      if (status == ESPANK_SUCCESS)
        return {};

      if (status == ESPANK_ENV_EXISTS)
        ERR(kind::EnvExists { .name = cName });

      ERR_FROM(SpankError::fromApi(function, status));
    }

    fn DoUnsetenv(spank_t spank, const StringView name, UnsetenvFn unsetter, const StringView function) -> Result<> {
      const String cName = TRY(strings::ToCString(name));

      if (const spank_err_t status = unsetter(spank, cName.c_str()); status != ESPANK_SUCCESS)
        ERR_FROM(SpankError::fromApi(function, status));

      return {};
    }

    fn Validated(Result<Option<String>> raw) -> Result<Option<String>> {
      const Option<String> value = TRY(std::move(raw));

      if (!value)
        return Option<String>(None);

      return Some(TRY(strings::ToUtf8(*value)));
    }

    fn Lossy(Result<Option<String>> raw) -> Result<Option<String>> {
      const Option<String> value = TRY(std::move(raw));

      if (!value)
        return Option<String>(None);

      return Some(strings::ToLossyUtf8(*value));
    }

    fn ValidatedAll(const Vec<StringView>& raw) -> Result<Vec<String>> {
      Vec<String> result;
      result.reserve(raw.size());

      for (const StringView item : raw)
        result.push_back(TRY(strings::ToUtf8(item)));

      return result;
    }
  } // namespace

  SpankHandle::SpankHandle(spank_t spank, OptionCache& cache, const i32 argc, char** argv, OptionCallback optionCallback)
    : m_spank(spank), m_cache(cache), m_argc(argc), m_argv(argv), m_optionCallback(optionCallback) {}

  fn SpankHandle::context() const -> Result<Context> {
    if (const Option<Context> context = ContextFromNative(static_cast<i32>(spank_context())))
      return *context;

    ERR_FROM(SpankError::fromApi("spank_context", ESPANK_ERROR));
  }

  fn SpankHandle::registerOption(SpankOption option) -> Result<> {
    const String name = TRY(strings::ToCString(option.name()));

    if (name.empty())
      ERR("Option name must not be empty");

    Option<String> argInfo;
    Option<String> usage;

    if (option.argInfo())
      argInfo = TRY(strings::ToCString(*option.argInfo()));

    if (option.usageText())
      usage = TRY(strings::ToCString(*option.usageText()));

    const i32 slot = TRY(m_cache.nextSlot());

    // The host copies every field during registration
    spank_option native {
      .name    = const_cast<char*>(name.c_str()),                        // NOLINT(cppcoreguidelines-pro-type-const-cast)
      .arginfo = argInfo ? const_cast<char*>(argInfo->c_str()) : nullptr, // NOLINT(cppcoreguidelines-pro-type-const-cast)
      .usage   = usage ? const_cast<char*>(usage->c_str()) : nullptr,     // NOLINT(cppcoreguidelines-pro-type-const-cast)
      .has_arg = option.hasArg() ? 1 : 0,
      .val     = slot,
      .cb      = m_optionCallback,
    };

    if (const spank_err_t status = spank_option_register(m_spank, &native); status != ESPANK_SUCCESS)
      ERR_FROM(SpankError::fromApi("spank_option_register", status));

    m_cache.commit(name);
    return {};
  }

  fn SpankHandle::pluginArgvRaw() const -> Vec<StringView> {
    return strings::ViewArgv(m_argc > 0 ? static_cast<usize>(m_argc) : 0, m_argv);
  }

  fn SpankHandle::pluginArgv() const -> Result<Vec<String>> {
    return ValidatedAll(pluginArgvRaw());
  }

  fn SpankHandle::getenvRaw(const StringView name) const -> Result<Option<String>> {
    return DoGetenv(m_spank, name, spank_getenv, "spank_getenv");
  }

  fn SpankHandle::getenv(const StringView name) const -> Result<Option<String>> {
    return Validated(getenvRaw(name));
  }

  fn SpankHandle::getenvLossy(const StringView name) const -> Result<Option<String>> {
    return Lossy(getenvRaw(name));
  }

  fn SpankHandle::setenv(const StringView name, const StringView value, const bool overwrite) const -> Result<> {
    return DoSetenv(m_spank, name, value, overwrite, spank_setenv, "spank_setenv");
  }

  fn SpankHandle::unsetenv(const StringView name) const -> Result<> {
    return DoUnsetenv(m_spank, name, spank_unsetenv, "spank_unsetenv");
  }

  fn SpankHandle::jobControlGetenvRaw(const StringView name) const -> Result<Option<String>> {
    return DoGetenv(m_spank, name, spank_job_control_getenv, "spank_job_control_getenv");
  }

  fn SpankHandle::jobControlGetenv(const StringView name) const -> Result<Option<String>> {
    return Validated(jobControlGetenvRaw(name));
  }

  fn SpankHandle::jobControlGetenvLossy(const StringView name) const -> Result<Option<String>> {
    return Lossy(jobControlGetenvRaw(name));
  }

  fn SpankHandle::jobControlSetenv(const StringView name, const StringView value, const bool overwrite) const -> Result<> {
    return DoSetenv(m_spank, name, value, overwrite, spank_job_control_setenv, "spank_job_control_setenv");
  }

  fn SpankHandle::jobControlUnsetenv(const StringView name) const -> Result<> {
    return DoUnsetenv(m_spank, name, spank_job_control_unsetenv, "spank_job_control_unsetenv");
  }

  fn SpankHandle::getopt(const StringView name) const -> Result<OptionCache::Value> {
    const String cName = TRY(strings::ToCString(name));

    spank_option native {
      .name    = const_cast<char*>(cName.c_str()), // NOLINT(cppcoreguidelines-pro-type-const-cast)
      .arginfo = nullptr,
      .usage   = nullptr,
      .has_arg = 1,
      .val     = 0,
      .cb      = nullptr,
    };

    char* optarg = nullptr;

    if (const spank_err_t status = spank_option_getopt(m_spank, &native, &optarg); status != ESPANK_SUCCESS)
      ERR_FROM(SpankError::fromApi("spank_option_getopt", status));

    if (optarg == nullptr)
      return OptionCache::Value(None);

    return Some(String(optarg));
  }

  fn SpankHandle::optionValue(const StringView name) -> const OptionCache::Value* {
    // Capture callbacks never fire in prolog/epilog, so ask the host directly there
    if (const Result<Context> current = context(); !current || *current != Context::JobScript)
      return m_cache.find(name);

    if (const OptionCache::Value* cached = m_cache.find(name))
      return cached;

    Result<OptionCache::Value> queried = getopt(name);

    if (!queried) {
      debug3_log("Option '{}' not available from the host: {}", name, queried.error().chain());
      return nullptr;
    }

    m_cache.store(String(name), std::move(*queried));
    return m_cache.find(name);
  }

  fn SpankHandle::getOptionValueRaw(const StringView name) -> Option<String> {
    const OptionCache::Value* entry = optionValue(name);

    if (entry == nullptr || !entry->has_value())
      return None;

    return **entry;
  }

  fn SpankHandle::getOptionValue(const StringView name) -> Result<Option<String>> {
    return Validated(getOptionValueRaw(name));
  }

  fn SpankHandle::getOptionValueLossy(const StringView name) -> Option<String> {
    if (Option<String> value = getOptionValueRaw(name))
      return strings::ToLossyUtf8(*value);

    return None;
  }

  fn SpankHandle::getOptionValues(const StringView name) -> Result<Option<Vec<String>>> {
    const Option<String> value = TRY(getOptionValue(name));

    if (!value)
      return Option<Vec<String>>(None);

    return Some(Vec<String> { *value });
  }

  fn SpankHandle::isOptionSet(const StringView name) -> bool {
    return optionValue(name) != nullptr;
  }

  fn SpankHandle::getOptionCount(const StringView name) -> usize {
    return isOptionSet(name) ? 1 : 0;
  }

  template <typename T>
  fn SpankHandle::getItem(const spank_item_t item) const -> Result<T> {
    T value {};

    if (const spank_err_t status = spank_get_item(m_spank, item, &value); status != ESPANK_SUCCESS)
      ERR_FROM(SpankError::fromApi("spank_get_item", status));

    return value;
  }

  template <typename T, typename Key>
  fn SpankHandle::getItemByKey(const spank_item_t item, const Key key) const -> Result<T> {
    T value {};

    const spank_err_t status = spank_get_item(m_spank, item, key, &value);

    if (status == ESPANK_SUCCESS)
      return value;

    if (status == ESPANK_NOEXIST) {
      if constexpr (std::is_same_v<Key, pid_t>)
        ERR(kind::PidNotFound { .pid = key });
      else
        ERR(kind::IdNotFound { .id = key });
    }

    ERR_FROM(SpankError::fromApi("spank_get_item", status));
  }

  fn SpankHandle::getStringItem(const spank_item_t item) const -> Result<String> {
    const char* value = nullptr;

    if (const spank_err_t status = spank_get_item(m_spank, item, &value); status != ESPANK_SUCCESS)
      ERR_FROM(SpankError::fromApi("spank_get_item", status));

    if (value == nullptr)
      throw InternalError("spank_get_item returned a null string on success");

    return strings::ToUtf8(value);
  }

  fn SpankHandle::jobUid() const -> Result<uid_t> {
    return getItem<uid_t>(S_JOB_UID);
  }

  fn SpankHandle::jobGid() const -> Result<gid_t> {
    return getItem<gid_t>(S_JOB_GID);
  }

  fn SpankHandle::jobId() const -> Result<u32> {
    return getItem<u32>(S_JOB_ID);
  }

  fn SpankHandle::jobStepid() const -> Result<u32> {
    return getItem<u32>(S_JOB_STEPID);
  }

  fn SpankHandle::jobNnodes() const -> Result<u32> {
    return getItem<u32>(S_JOB_NNODES);
  }

  fn SpankHandle::jobNodeid() const -> Result<u32> {
    return getItem<u32>(S_JOB_NODEID);
  }

  fn SpankHandle::jobLocalTaskCount() const -> Result<u32> {
    return getItem<u32>(S_JOB_LOCAL_TASK_COUNT);
  }

  fn SpankHandle::jobTotalTaskCount() const -> Result<u32> {
    return getItem<u32>(S_JOB_TOTAL_TASK_COUNT);
  }

  fn SpankHandle::jobNcpus() const -> Result<u16> {
    return getItem<u16>(S_JOB_NCPUS);
  }

  fn SpankHandle::jobArgvNative() const -> Result<Vec<StringView>> {
    int    argc = 0;
    char** argv = nullptr;

    if (const spank_err_t status = spank_get_item(m_spank, S_JOB_ARGV, &argc, &argv); status != ESPANK_SUCCESS)
      ERR_FROM(SpankError::fromApi("spank_get_item", status));

    if (argv == nullptr)
      throw InternalError("spank_get_item returned a null job argv on success");

    return strings::ViewArgv(argc > 0 ? static_cast<usize>(argc) : 0, argv);
  }

  fn SpankHandle::jobArgvRaw() const -> Result<Vec<StringView>> {
    return jobArgvNative();
  }

  fn SpankHandle::jobArgv() const -> Result<Vec<String>> {
    return ValidatedAll(TRY(jobArgvNative()));
  }

  fn SpankHandle::jobEnvNative() const -> Result<Vec<StringView>> {
    char** env = nullptr;

    if (const spank_err_t status = spank_get_item(m_spank, S_JOB_ENV, &env); status != ESPANK_SUCCESS)
      ERR_FROM(SpankError::fromApi("spank_get_item", status));

    if (env == nullptr)
      throw InternalError("spank_get_item returned a null job environment on success");

    // NULL-terminated, no count given
    usize count = 0;
    while (env[count] != nullptr) // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      ++count;

    return strings::ViewArgv(count, env);
  }

  fn SpankHandle::jobEnvRaw() const -> Result<Vec<StringView>> {
    return jobEnvNative();
  }

  fn SpankHandle::jobEnv() const -> Result<Vec<String>> {
    return ValidatedAll(TRY(jobEnvNative()));
  }

  fn SpankHandle::taskId() const -> Result<i32> {
    return getItem<int>(S_TASK_ID);
  }

  fn SpankHandle::taskGlobalId() const -> Result<u32> {
    return getItem<u32>(S_TASK_GLOBAL_ID);
  }

  fn SpankHandle::taskExitStatus() const -> Result<i32> {
    return getItem<int>(S_TASK_EXIT_STATUS);
  }

  fn SpankHandle::taskPid() const -> Result<pid_t> {
    return getItem<pid_t>(S_TASK_PID);
  }

  fn SpankHandle::pidToGlobalId(const pid_t pid) const -> Result<u32> {
    return getItemByKey<u32>(S_JOB_PID_TO_GLOBAL_ID, pid);
  }

  fn SpankHandle::pidToLocalId(const pid_t pid) const -> Result<u32> {
    return getItemByKey<u32>(S_JOB_PID_TO_LOCAL_ID, pid);
  }

  fn SpankHandle::localToGlobalId(const u32 localId) const -> Result<u32> {
    return getItemByKey<u32>(S_JOB_LOCAL_TO_GLOBAL_ID, localId);
  }

  fn SpankHandle::globalToLocalId(const u32 globalId) const -> Result<u32> {
    return getItemByKey<u32>(S_JOB_GLOBAL_TO_LOCAL_ID, globalId);
  }

  fn SpankHandle::jobSupplementaryGids() const -> Result<Vec<gid_t>> {
    gid_t* gids  = nullptr;
    int    count = 0;

    if (const spank_err_t status = spank_get_item(m_spank, S_JOB_SUPPLEMENTARY_GIDS, &gids, &count); status != ESPANK_SUCCESS)
      ERR_FROM(SpankError::fromApi("spank_get_item", status));

    if (count <= 0)
      return Vec<gid_t> {};

    if (gids == nullptr)
      throw InternalError("spank_get_item returned a null group list with a non-zero count");

    return Vec<gid_t>(gids, gids + count); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }

  fn SpankHandle::slurmVersion() const -> Result<String> {
    return getStringItem(S_SLURM_VERSION);
  }

  fn SpankHandle::slurmVersionMajor() const -> Result<String> {
    return getStringItem(S_SLURM_VERSION_MAJOR);
  }

  fn SpankHandle::slurmVersionMinor() const -> Result<String> {
    return getStringItem(S_SLURM_VERSION_MINOR);
  }

  fn SpankHandle::slurmVersionMicro() const -> Result<String> {
    return getStringItem(S_SLURM_VERSION_MICRO);
  }

  fn SpankHandle::stepCpusPerTask() const -> Result<u64> {
    return getItem<u64>(S_STEP_CPUS_PER_TASK);
  }

  fn SpankHandle::jobAllocCores() const -> Result<String> {
    return getStringItem(S_JOB_ALLOC_CORES);
  }

  fn SpankHandle::jobAllocMem() const -> Result<u64> {
    return getItem<u64>(S_JOB_ALLOC_MEM);
  }

  fn SpankHandle::stepAllocCores() const -> Result<String> {
    return getStringItem(S_STEP_ALLOC_CORES);
  }

  fn SpankHandle::stepAllocMem() const -> Result<u64> {
    return getItem<u64>(S_STEP_ALLOC_MEM);
  }

  fn SpankHandle::slurmRestartCount() const -> Result<u32> {
    return getItem<u32>(S_SLURM_RESTART_COUNT);
  }

  fn SpankHandle::jobArrayId() const -> Result<u32> {
    return getItem<u32>(S_JOB_ARRAY_ID);
  }

  fn SpankHandle::jobArrayTaskId() const -> Result<u32> {
    return getItem<u32>(S_JOB_ARRAY_TASK_ID);
  }

  fn SpankHandle::prependTaskArgv(const Vec<String>& args) const -> Result<> {
    if (args.size() > static_cast<usize>(std::numeric_limits<i32>::max()))
      ERR(kind::Overflow { .what = "task argument count", .value = args.size() });

    Vec<String> owned;
    owned.reserve(args.size());

    for (const String& arg : args)
      owned.push_back(TRY(strings::ToCString(arg)));

    Vec<const char*> argv;
    argv.reserve(owned.size() + 1);

    for (const String& arg : owned)
      argv.push_back(arg.c_str());

    argv.push_back(nullptr);

    if (const spank_err_t status = spank_prepend_task_argv(m_spank, static_cast<i32>(owned.size()), argv.data()); status != ESPANK_SUCCESS)
      ERR_FROM(SpankError::fromApi("spank_prepend_task_argv", status));

    return {};
  }
} // namespace spankpp::core
