#pragma once

#include <cstdlib> // std::getenv

#include "Error.hpp"
#include "Types.hpp"

namespace spankpp::utils::env {
  namespace types = ::spankpp::utils::types;

  /**
   * @brief Reads a variable from the calling process's own environment.
   * @details This is the ambient environment of the daemon or client running the
   *          plugin, not the job environment managed through the host.
   * @param name The variable name.
   * @return The value, or a Custom error when the variable is unset.
   */
  inline fn GetEnv(const types::PCStr name) -> types::Result<types::String> {
    if (const types::PCStr value = std::getenv(name)) // NOLINT(concurrency-mt-unsafe)
      return types::String(value);

    ERR_FMT("Environment variable '{}' is not set", name);
  }
} // namespace spankpp::utils::env
