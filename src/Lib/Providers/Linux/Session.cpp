#include <algorithm> // std::ranges::replace
#include <format>    // std::format

#include "GnomeMcp/Utils/Logging.hpp"

#include "Session.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace gnome_mcp::providers::gnome {
  namespace {
    fn OpenBus(Option<DBus::Connection>& slot, const DBusBusType type, const StringView label) -> Result<const DBus::Connection*> {
      if (!slot) {
        Result<DBus::Connection> connection = DBus::Connection::busGet(type);

        if (!connection)
          ERR_FMT(ApiUnavailable, "Failed to connect to the {} bus: {}", label, connection.error().message);

        debug_log("Connected to the {} bus as {}", label, connection->uniqueName());

        slot.emplace(std::move(*connection));
      }

      return &*slot;
    }
  } // namespace

  Session::Session(const config::ServerSettings& settings)
    : m_timeoutMs(static_cast<i32>(settings.providerTimeoutMs)),
      m_interactiveTimeoutMs(static_cast<i32>(settings.interactiveTimeoutMs)) {}

  fn Session::sessionBus() -> Result<const DBus::Connection*> {
    return OpenBus(m_session, DBUS_BUS_SESSION, "session");
  }

  fn Session::systemBus() -> Result<const DBus::Connection*> {
    return OpenBus(m_system, DBUS_BUS_SYSTEM, "system");
  }

  fn Session::nextToken() -> String {
    return std::format("gnome_mcp_{}", ++m_tokenCounter);
  }

  fn CallPortal(const DBus::Connection& bus, const String& token, const Fn<Result<DBus::Message>(const String&)>& call, const i32 timeoutMs)
    -> Result<DBus::Message> {
    // The request object path is predictable from our unique name and the token,
    // so the match can be in place before the call is made.
    String sender = bus.uniqueName();

    if (sender.starts_with(':'))
      sender.erase(0, 1);

    std::ranges::replace(sender, '.', '_');

    const String requestPath = std::format("{}/request/{}/{}", PORTAL_PATH, sender, token);
    const String rule        = std::format("type='signal',interface='org.freedesktop.portal.Request',member='Response',path='{}'", requestPath);

    if (Result<> res = bus.addMatch(rule); !res)
      return Err(res.error());

    Result<DBus::Message> handle = call(token);

    if (!handle) {
      bus.removeMatch(rule);
      return Err(handle.error());
    }

    Result<DBus::Message> response = bus.waitForSignal(
      "org.freedesktop.portal.Request",
      "Response",
      [&requestPath](const DBus::Message& message) -> bool { return message.path() == requestPath; },
      timeoutMs
    );

    bus.removeMatch(rule);

    if (!response)
      return Err(response.error());

    DBus::MessageIter iter = response->iterInit();

    const Option<i64> code = iter.getInteger();

    if (!code)
      ERR(ParseError, "Portal response carries no response code");

    if (*code == 1)
      ERR(Other, "The request was cancelled");

    if (*code != 0)
      ERR_FMT(PlatformSpecific, "The portal request failed (response {})", *code);

    return response;
  }

  fn Trim(const String& text) -> String {
    constexpr StringView whitespace = " \t\r\n";

    const usize first = text.find_first_not_of(whitespace);

    if (first == String::npos)
      return {};

    return text.substr(first, text.find_last_not_of(whitespace) - first + 1);
  }
} // namespace gnome_mcp::providers::gnome
