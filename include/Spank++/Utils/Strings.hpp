/**
 * @file Strings.hpp
 * @brief Conversions between host C strings and C++ strings
 * @author Spank++ Team
 * @version 1.0.0
 */

#pragma once

#include "Error.hpp"
#include "Types.hpp"

namespace spankpp::utils::strings {
  namespace types = ::spankpp::utils::types;

  /**
   * @brief Checks that a string can be handed to the host as a C string.
   * @param value The string to check.
   * @return The value as an owned string, or CStringError if it holds a NUL byte.
   */
  fn ToCString(types::StringView value) -> types::Result<types::String>;

  /**
   * @brief Returns whether @p bytes is well-formed UTF-8.
   */
  fn IsValidUtf8(types::StringView bytes) -> bool;

  /**
   * @brief Decodes @p bytes as UTF-8, replacing each invalid sequence with U+FFFD.
   */
  fn ToLossyUtf8(types::StringView bytes) -> types::String;

  /**
   * @brief Validates @p bytes as UTF-8.
   * @return The bytes unchanged, or Utf8Error carrying the lossy rendering.
   */
  fn ToUtf8(types::StringView bytes) -> types::Result<types::String>;

  /**
   * @brief Replaces every NUL byte in @p value with @p replacement.
   */
  fn EscapeNul(types::StringView value, types::StringView replacement) -> types::String;

  /**
   * @brief Views a NULL-safe argc/argv pair as string views.
   * @note A null @p argv yields an empty vector whatever @p argc says.
   */
  fn ViewArgv(types::usize argc, const char* const* argv) -> types::Vec<types::StringView>;
} // namespace spankpp::utils::strings
