#pragma once

#include <iosfwd>        // std::{istream, ostream}
#include <mcp_message.h> // mcp::json

#include "GnomeMcp/Core/Router.hpp"
#include "GnomeMcp/Utils/Definitions.hpp"
#include "GnomeMcp/Utils/Types.hpp"

namespace gnome_mcp::server {
  namespace {
    using utils::types::i32;
    using utils::types::Option;
    using utils::types::String;
    using utils::types::StringView;
  } // namespace

  /// JSON-RPC 2.0 reserved error codes.
  namespace rpc {
    inline constexpr i32 PARSE_ERROR      = -32700;
    inline constexpr i32 INVALID_REQUEST  = -32600;
    inline constexpr i32 METHOD_NOT_FOUND = -32601;
    inline constexpr i32 INVALID_PARAMS   = -32602;
    inline constexpr i32 INTERNAL_ERROR   = -32603;
  } // namespace rpc

  /**
   * @class StdioServer
   * @brief MCP over line-delimited JSON-RPC.
   *
   * Reads one message per line, answers it, then reads the next. Requests are
   * handled strictly in order; notifications never get a response.
   */
  class StdioServer {
   public:
    StdioServer(String name, String version, const core::RequestRouter& router);

    /**
     * @brief Serves until end of input.
     * @return 0 on end of input, 1 when the input or output stream fails.
     */
    fn run(std::istream& input, std::ostream& output) const -> i32;

    /**
     * @brief Handles a single message.
     * @return The response to write, or None for notifications.
     */
    [[nodiscard]] fn handleMessage(StringView line) const -> Option<mcp::json>;

   private:
    String                     m_name;
    String                     m_version;
    const core::RequestRouter& m_router;

    fn dispatch(const String& method, const mcp::json& params, const mcp::json& id) const -> mcp::json;

    [[nodiscard]] fn handleInitialize() const -> mcp::json;

    [[nodiscard]] fn route(core::RequestKind kind, const String& target, const mcp::json& arguments, const mcp::json& id) const -> mcp::json;
  };
} // namespace gnome_mcp::server
