#pragma once

#include <atomic> // std::atomic

#include "GnomeMcp/Config/Config.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

#include "Wrappers/DBus.hpp"

namespace gnome_mcp::providers::gnome {
  namespace {
    using utils::types::i32;
    using utils::types::LockGuard;
    using utils::types::Mutex;
    using utils::types::Option;
    using utils::types::PCStr;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::u32;
  } // namespace

  /**
   * @brief Bus connections and timeouts shared by every GNOME provider.
   *
   * Providers take the mutex for the whole of a call; the connections
   * themselves are opened on first use and kept for the process lifetime.
   */
  class Session {
   public:
    explicit Session(const config::ServerSettings& settings);

    [[nodiscard]] fn mutex() -> Mutex& { return m_mutex; }

    /// Requires the mutex to be held.
    fn sessionBus() -> Result<const DBus::Connection*>;

    /// Requires the mutex to be held.
    fn systemBus() -> Result<const DBus::Connection*>;

    [[nodiscard]] fn timeoutMs() const -> i32 { return m_timeoutMs; }
    [[nodiscard]] fn interactiveTimeoutMs() const -> i32 { return m_interactiveTimeoutMs; }

    /// A fresh handle token for portal requests.
    fn nextToken() -> String;

   private:
    Mutex                    m_mutex;
    Option<DBus::Connection> m_session;
    Option<DBus::Connection> m_system;
    i32                      m_timeoutMs;
    i32                      m_interactiveTimeoutMs;
    std::atomic<u32>         m_tokenCounter = 0;
  };

  inline constexpr PCStr PORTAL_BUS  = "org.freedesktop.portal.Desktop";
  inline constexpr PCStr PORTAL_PATH = "/org/freedesktop/portal/desktop";

  /**
   * @brief Calls an xdg-desktop-portal method and waits for its Request::Response.
   *
   * `call` receives the handle token to put in the options and must issue the
   * method call. The returned message is the Response signal, already checked for
   * success; its second argument holds the results dictionary.
   */
  fn CallPortal(
    const DBus::Connection&                                         bus,
    const String&                                                   token,
    const utils::types::Fn<Result<DBus::Message>(const String&)>& call,
    i32                                                             timeoutMs
  ) -> Result<DBus::Message>;

  /**
   * @brief Trims surrounding whitespace, used on helper-process output.
   */
  fn Trim(const String& text) -> String;
} // namespace gnome_mcp::providers::gnome
