#pragma once

#include <cstdlib> // std::getenv

#include "Definitions.hpp"
#include "Error.hpp"
#include "Types.hpp"

namespace gnome_mcp::utils::env {
  namespace {
    using types::Err;
    using types::PCStr;
    using types::Result;

    using error::GmcpError;
    using enum error::GmcpErrorCode;
  } // namespace

  /**
   * @brief Reads an environment variable.
   *
   * An empty value counts as unset, which is how the XDG base directory
   * variables are meant to be read.
   *
   * @param name The variable to look up.
   * @return The value, or NotFound when unset or empty.
   */
  [[nodiscard]] inline fn GetEnv(const PCStr name) -> Result<PCStr> {
    const PCStr value = std::getenv(name);

    if (!value || *value == '\0')
      return Err(GmcpError(NotFound, std::format("Environment variable {} is not set", name)));

    return value;
  }
} // namespace gnome_mcp::utils::env
