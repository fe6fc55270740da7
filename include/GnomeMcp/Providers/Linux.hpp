#pragma once

#include "GnomeMcp/Config/Config.hpp"
#include "GnomeMcp/Providers/Desktop.hpp"

namespace gnome_mcp::providers {
  /**
   * @brief Builds the GNOME implementations of every provider interface.
   *
   * Bus connections are opened lazily on first use, so this never fails;
   * a missing session bus surfaces as ApiUnavailable from the first call.
   *
   * @param settings Timeouts applied to every D-Bus call, helper process and portal wait.
   */
  fn MakeLinuxProviders(const config::ServerSettings& settings) -> DesktopProviders;
} // namespace gnome_mcp::providers
