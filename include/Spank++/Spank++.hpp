/**
 * @file Spank++.hpp
 * @brief Everything a plugin needs, plus the SPANKPP_PLUGIN export macro
 * @author Spank++ Team
 * @version 1.0.0
 */

#pragma once

#include <memory>      // std::make_unique
#include <type_traits> // std::is_base_of_v

#include <slurm/slurm_version.h> // SLURM_VERSION_NUMBER
#include <slurm/spank.h>         // spank_t

#include "Core/Context.hpp"
#include "Core/Handle.hpp"
#include "Core/HostLog.hpp"
#include "Core/Lifecycle.hpp"
#include "Core/Option.hpp"
#include "Core/Plugin.hpp"
#include "Core/Runtime.hpp"
#include "Utils/Error.hpp"
#include "Utils/Logging.hpp"
#include "Utils/Types.hpp"

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @def SPANKPP_VERSION
 * @brief Encodes a version the way the host does: one byte per component.
 */
#define SPANKPP_VERSION(major, minor, micro) ((((major) & 0xff) << 16) | (((minor) & 0xff) << 8) | ((micro) & 0xff))

/// Version of the Slurm headers the plugin is built against.
#define SPANKPP_SLURM_VERSION SLURM_VERSION_NUMBER

#define SPANKPP_ENTRY_POINT(symbol, callback)                                          \
  int symbol(spank_t spank, int argc, char** argv) {                                  \
    return SpankppRuntime().dispatch(::spankpp::core::Callback::callback, spank, argc, argv); \
  }

/**
 * @def SPANKPP_PLUGIN
 * @brief Exports a plugin object for the host.
 *
 * @param name Plugin name, a string literal.
 * @param version Version the host checks against its own, usually SPANKPP_SLURM_VERSION.
 * @param PluginType Default-constructible class deriving from spankpp::core::IPlugin.
 *
 * Use exactly once per plugin shared object, at namespace scope.
 *
 * @code
 * SPANKPP_PLUGIN("hello", SPANKPP_SLURM_VERSION, Hello)
 * @endcode
 */
#define SPANKPP_PLUGIN(name, version, PluginType)                                                            \
  static_assert(std::is_base_of_v<::spankpp::core::IPlugin, PluginType>, #PluginType " must derive from IPlugin"); \
  extern "C" int spankpp_option_callback(int val, const char* optarg, int remote);                          \
  namespace {                                                                                                \
    fn SpankppRuntime() -> ::spankpp::core::PluginRuntime& {                                                 \
      static ::spankpp::core::PluginRuntime Runtime(                                                         \
        []() -> ::spankpp::utils::types::UniquePointer<::spankpp::core::IPlugin> {                           \
          return std::make_unique<PluginType>();                                                             \
        },                                                                                                   \
        &spankpp_option_callback                                                                             \
      );                                                                                                     \
      return Runtime;                                                                                        \
    }                                                                                                        \
  }                                                                                                          \
  _Pragma("GCC visibility push(default)") extern "C" {                                                       \
    extern const char         plugin_name[]  = name;                                                         \
    extern const char         plugin_type[]  = "spank";                                                      \
    extern const unsigned int plugin_version = version;                                                      \
    int spankpp_option_callback(int val, const char* optarg, int /*remote*/) {                               \
      return SpankppRuntime().captureOption(val, optarg);                                                    \
    }                                                                                                        \
    SPANKPP_ENTRY_POINT(slurm_spank_init, Init)                                                              \
    SPANKPP_ENTRY_POINT(slurm_spank_job_prolog, JobProlog)                                                   \
    SPANKPP_ENTRY_POINT(slurm_spank_init_post_opt, InitPostOpt)                                              \
    SPANKPP_ENTRY_POINT(slurm_spank_local_user_init, LocalUserInit)                                          \
    SPANKPP_ENTRY_POINT(slurm_spank_user_init, UserInit)                                                     \
    SPANKPP_ENTRY_POINT(slurm_spank_task_init_privileged, TaskInitPrivileged)                                \
    SPANKPP_ENTRY_POINT(slurm_spank_task_init, TaskInit)                                                     \
    SPANKPP_ENTRY_POINT(slurm_spank_task_post_fork, TaskPostFork)                                            \
    SPANKPP_ENTRY_POINT(slurm_spank_task_exit, TaskExit)                                                     \
    SPANKPP_ENTRY_POINT(slurm_spank_job_epilog, JobEpilog)                                                   \
    SPANKPP_ENTRY_POINT(slurm_spank_slurmd_exit, SlurmdExit)                                                 \
    SPANKPP_ENTRY_POINT(slurm_spank_exit, Exit)                                                              \
  }                                                                                                          \
  _Pragma("GCC visibility pop")

// NOLINTEND(cppcoreguidelines-macro-usage)
