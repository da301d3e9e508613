/**
 * @file Error.hpp
 * @brief Error taxonomy for every operation exposed by Spank++
 * @author Spank++ Team
 * @version 1.0.0
 *
 * @details Each native status returned by the host is mapped into a SpankError.
 * Successful calls never produce one. "Item not found" on id/pid lookups gets
 * its own variant so callers can report which key was missing.
 */

#pragma once

#include <format>          // std::formatter, std::format_to
#include <source_location> // std::source_location
#include <stdexcept>       // std::logic_error
#include <sys/types.h>     // pid_t
#include <utility>         // std::move
#include <variant>         // std::{variant, holds_alternative, get_if}

#include "Types.hpp"

namespace spankpp::utils::error {
  namespace types = ::spankpp::utils::types;

  /**
   * @enum ApiError
   * @brief Non-success status codes the host can return.
   *
   * Values mirror the host's spank_err enumeration. Codes the host may add in
   * the future collapse into Generic.
   */
  enum class ApiError : types::i32 {
    Generic     = 1,
    BadArg      = 2,
    NotTask     = 3,
    EnvExists   = 4,
    EnvNotExist = 5,
    NoSpace     = 6,
    NotRemote   = 7,
    NoExist     = 8,
    NotExecd    = 9,
    NotAvail    = 10,
    NotLocal    = 11,
  };

  /**
   * @brief Maps a raw host status into the closed ApiError set.
   * @param code Raw non-success status.
   */
  fn ApiErrorFromNative(types::i32 code) -> ApiError;

  /**
   * @brief Human readable description of an ApiError, as rendered by the host.
   */
  fn RenderApiError(ApiError code) -> types::String;

  namespace kind {
    /// A string holds an embedded NUL and cannot cross into the host.
    struct CStringError {
      types::String value;
    };

    /// setenv without overwrite hit an existing variable.
    struct EnvExists {
      types::String name;
    };

    /// Lookup by numeric task id found nothing.
    struct IdNotFound {
      types::u32 id;
    };

    /// Lookup by process id found nothing.
    struct PidNotFound {
      pid_t pid;
    };

    /// A host function returned a non-success status.
    struct SpankApi {
      types::String function;
      ApiError      code;
    };

    /// Bytes returned by the host are not valid UTF-8. Holds the lossy rendering.
    struct Utf8Error {
      types::String lossy;
    };

    /// A size does not fit in the host's integer type.
    struct Overflow {
      types::String what;
      types::usize  value;
    };

    /// Raised by plugin code or by internal consistency checks.
    struct Custom {
      types::String message;
    };
  } // namespace kind

  /**
   * @enum SpankErrorCode
   * @brief Discriminator for SpankError, in the same order as ErrorKind.
   */
  enum class SpankErrorCode : types::u8 {
    CStringError,
    EnvExists,
    IdNotFound,
    PidNotFound,
    SpankApi,
    Utf8Error,
    Overflow,
    Custom,
  };

  using ErrorKind = std::variant<
    kind::CStringError,
    kind::EnvExists,
    kind::IdNotFound,
    kind::PidNotFound,
    kind::SpankApi,
    kind::Utf8Error,
    kind::Overflow,
    kind::Custom>;

  /**
   * @class SpankError
   * @brief A tagged error value with an optional cause chain.
   */
  class SpankError {
   public:
    ErrorKind            kind;     ///< What went wrong, with its payload
    std::source_location location; ///< Where the error was raised

    SpankError(ErrorKind kind, const std::source_location& location = std::source_location::current())
      : kind(std::move(kind)), location(location) {}

    explicit SpankError(types::String message, const std::source_location& location = std::source_location::current())
      : kind(kind::Custom { std::move(message) }), location(location) {}

    /**
     * @brief Builds the error for a failed host call.
     * @param function Name of the host function that failed.
     * @param status Raw status it returned.
     */
    static fn fromApi(types::StringView function, types::i32 status, const std::source_location& location = std::source_location::current()) -> SpankError {
      return { kind::SpankApi { .function = types::String(function), .code = ApiErrorFromNative(status) }, location };
    }

    [[nodiscard]] fn code() const -> SpankErrorCode {
      return static_cast<SpankErrorCode>(kind.index());
    }

    template <typename Kind>
    [[nodiscard]] fn is() const -> bool {
      return std::holds_alternative<Kind>(kind);
    }

    template <typename Kind>
    [[nodiscard]] fn as() const -> const Kind* {
      return std::get_if<Kind>(&kind);
    }

    /**
     * @brief Renders this error alone, without its causes.
     */
    [[nodiscard]] fn message() const -> types::String;

    /**
     * @brief Renders this error followed by every cause, separated by ": ".
     */
    [[nodiscard]] fn chain() const -> types::String;

    [[nodiscard]] fn cause() const -> const SpankError* {
      return m_cause.get();
    }

    /**
     * @brief Wraps this error under a new context message.
     * @param context Message describing what was being attempted.
     * @return A Custom error whose cause is a copy of this one.
     */
    [[nodiscard]] fn wrap(types::String context, const std::source_location& location = std::source_location::current()) const -> SpankError {
      SpankError outer(std::move(context), location);
      outer.m_cause = std::make_shared<const SpankError>(*this);
      return outer;
    }

   private:
    types::SharedPointer<const SpankError> m_cause;
  };

  /**
   * @brief Thrown when the host breaks a guarantee of its own contract.
   *
   * Never returned as a value: the dispatch boundary catches it and reports the
   * callback as failed.
   */
  class InternalError : public std::logic_error {
   public:
    using std::logic_error::logic_error;
  };
} // namespace spankpp::utils::error

template <>
struct std::formatter<spankpp::utils::error::SpankError> : std::formatter<std::string_view> {
  fn format(const spankpp::utils::error::SpankError& err, std::format_context& ctx) const {
    return std::formatter<std::string_view>::format(err.chain(), ctx);
  }
};

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ERR(...)     return ::spankpp::utils::types::Err(::spankpp::utils::error::SpankError(__VA_ARGS__))
#define ERR_FMT(...) return ::spankpp::utils::types::Err(::spankpp::utils::error::SpankError(std::format(__VA_ARGS__)))
#define ERR_FROM(err) return ::spankpp::utils::types::Err(err)

#define TRY(expr)                                                     \
  ({                                                                  \
    auto _tryResult = (expr);                                         \
    if (!_tryResult)                                                  \
      return ::spankpp::utils::types::Err(std::move(_tryResult).error()); \
    std::move(*_tryResult);                                           \
  })

#define TRY_VOID(expr)                                                  \
  do {                                                                  \
    if (auto _tryResult = (expr); !_tryResult)                          \
      return ::spankpp::utils::types::Err(std::move(_tryResult).error()); \
  } while (false)
// NOLINTEND(cppcoreguidelines-macro-usage)
