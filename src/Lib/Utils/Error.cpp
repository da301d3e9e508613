/**
 * @file Error.cpp
 * @brief Rendering of SpankError values
 * @author Spank++ Team
 * @version 1.0.0
 */

#include <Spank++/Utils/Error.hpp>

#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <matchit.hpp>               // matchit::{match, is, _, impl::Overload}
#include <slurm/spank.h>             // spank_strerror, ESPANK_*

#include <Spank++/Utils/Strings.hpp>

namespace spankpp::utils::error {
  using namespace types;

  static_assert(static_cast<i32>(ApiError::Generic) == ESPANK_ERROR);
  static_assert(static_cast<i32>(ApiError::NotLocal) == ESPANK_NOT_LOCAL);

  fn ApiErrorFromNative(const i32 code) -> ApiError {
    using matchit::match, matchit::is, matchit::_;
    using enum ApiError;

    return match(code)(
      is | static_cast<i32>(ESPANK_BAD_ARG)     = BadArg,
      is | static_cast<i32>(ESPANK_NOT_TASK)    = NotTask,
      is | static_cast<i32>(ESPANK_ENV_EXISTS)  = EnvExists,
      is | static_cast<i32>(ESPANK_ENV_NOEXIST) = EnvNotExist,
      is | static_cast<i32>(ESPANK_NOSPACE)     = NoSpace,
      is | static_cast<i32>(ESPANK_NOT_REMOTE)  = NotRemote,
      is | static_cast<i32>(ESPANK_NOEXIST)     = NoExist,
      is | static_cast<i32>(ESPANK_NOT_EXECD)   = NotExecd,
      is | static_cast<i32>(ESPANK_NOT_AVAIL)   = NotAvail,
      is | static_cast<i32>(ESPANK_NOT_LOCAL)   = NotLocal,
      is | _                                    = Generic
    );
  }

  fn RenderApiError(const ApiError code) -> String {
    if (PCStr text = spank_strerror(static_cast<spank_err_t>(code)); text != nullptr && *text != '\0')
      return strings::ToLossyUtf8(text);

    return String(magic_enum::enum_name(code));
  }

  fn SpankError::message() const -> String {
    using matchit::impl::Overload;

    return std::visit(
      Overload {
        [](const kind::CStringError& err) -> String {
          return std::format("String {} cannot be converted to a C string", strings::EscapeNul(err.value, "\\0"));
        },
        [](const kind::EnvExists& err) -> String {
          return std::format("Environment variable {} exists and overwrite was not set", err.name);
        },
        [](const kind::IdNotFound& err) -> String {
          return std::format("Could not find id {}", err.id);
        },
        [](const kind::PidNotFound& err) -> String {
          return std::format("Could not find pid {}", err.pid);
        },
        [](const kind::SpankApi& err) -> String {
          return std::format("Error calling SPANK API function {}: {}", err.function, RenderApiError(err.code));
        },
        [](const kind::Utf8Error& err) -> String {
          return std::format("Cannot parse {} as UTF-8", err.lossy);
        },
        [](const kind::Overflow& err) -> String {
          return std::format("{} ({}) does not fit in a native integer", err.what, err.value);
        },
        [](const kind::Custom& err) -> String {
          return err.message;
        },
      },
      kind
    );
  }

  fn SpankError::chain() const -> String {
    String rendered = message();

    for (const SpankError* link = cause(); link != nullptr; link = link->cause()) {
      rendered += ": ";
      rendered += link->message();
    }

    return rendered;
  }
} // namespace spankpp::utils::error
