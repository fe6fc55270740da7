#include "GnomeMcp/Server/StdioServer.hpp"

#include <istream>                   // std::{istream, getline}
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <matchit.hpp>               // matchit::{match, is, _}
#include <ostream>                   // std::ostream

#include "GnomeMcp/Utils/Logging.hpp"

using namespace gnome_mcp::utils::types;

namespace gnome_mcp::server {
  namespace {
    constexpr PCStr PROTOCOL_VERSION = "2024-11-05";

    fn Success(const mcp::json& id, mcp::json result) -> mcp::json {
      return {
        { "jsonrpc",             "2.0" },
        {      "id",                id },
        {  "result", std::move(result) },
      };
    }

    fn Error(const mcp::json& id, const i32 code, const String& message, const Option<mcp::json>& data = None) -> mcp::json {
      mcp::json error = {
        {    "code",    code },
        { "message", message },
      };

      if (data)
        error["data"] = *data;

      return {
        { "jsonrpc", "2.0" },
        {      "id",    id },
        {   "error", error },
      };
    }

    /// Provider text can carry invalid UTF-8, which would otherwise make dump() throw.
    fn Serialize(const mcp::json& value, const int indent = -1) -> String {
      return value.dump(indent, ' ', false, mcp::json::error_handler_t::replace);
    }

    fn IsBlank(const StringView line) -> bool {
      return line.find_first_not_of(" \t\r\n") == StringView::npos;
    }

    fn IsValidId(const mcp::json& id) -> bool {
      return id.is_string() || id.is_number_integer() || id.is_number_unsigned() || id.is_null();
    }
  } // namespace

  StdioServer::StdioServer(String name, String version, const core::RequestRouter& router)
    : m_name(std::move(name)), m_version(std::move(version)), m_router(router) {}

  fn StdioServer::run(std::istream& input, std::ostream& output) const -> i32 {
    String line;

    while (std::getline(input, line)) {
      if (IsBlank(line))
        continue;

      const Option<mcp::json> response = handleMessage(line);

      if (!response)
        continue;

      output << Serialize(*response) << '\n';
      output.flush();

      if (!output) {
        error_log("Failed to write a response to stdout");
        return 1;
      }
    }

    if (input.bad()) {
      error_log("Failed to read from stdin");
      return 1;
    }

    info_log("Input closed, shutting down");

    return 0;
  }

  fn StdioServer::handleMessage(const StringView line) const -> Option<mcp::json> {
    const mcp::json message = mcp::json::parse(line, nullptr, false);

    if (message.is_discarded()) {
      debug_log("Discarding undecodable message");
      return Error(nullptr, rpc::PARSE_ERROR, "Parse error");
    }

    if (!message.is_object())
      return Error(nullptr, rpc::INVALID_REQUEST, "Invalid Request");

    const bool      isNotification = !message.contains("id");
    const mcp::json id             = isNotification ? mcp::json(nullptr) : message["id"];

    if (!IsValidId(id))
      return Error(nullptr, rpc::INVALID_REQUEST, "Invalid Request: id must be a string or a number");

    if (message.contains("jsonrpc") && message["jsonrpc"] != "2.0")
      return isNotification ? None : Option<mcp::json>(Error(id, rpc::INVALID_REQUEST, "Invalid Request: jsonrpc must be \"2.0\""));

    if (!message.contains("method") || !message["method"].is_string())
      return isNotification ? None : Option<mcp::json>(Error(id, rpc::INVALID_REQUEST, "Invalid Request: missing method"));

    const String    method = message["method"].get<String>();
    const mcp::json params = message.value("params", mcp::json::object());

    if (isNotification) {
      if (!method.starts_with("notifications/"))
        debug_log("Ignoring notification for {}", method);

      return None;
    }

    try {
      return dispatch(method, params, id);
    } catch (const Exception& e) {
      error_log("Request {} ({}) threw: {}", Serialize(id), method, e.what());
      return Error(id, rpc::INTERNAL_ERROR, std::format("Internal error: {}", e.what()));
    }
  }

  fn StdioServer::dispatch(const String& method, const mcp::json& params, const mcp::json& id) const -> mcp::json {
    using matchit::match, matchit::is, matchit::_;

    debug_log("Handling {}", method);

    return match(method)(
      is | "initialize"     = [&] { return Success(id, handleInitialize()); },
      is | "ping"           = [&] { return Success(id, mcp::json::object()); },
      is | "tools/list"     = [&] { return Success(id, m_router.listTools()); },
      is | "resources/list" = [&] { return Success(id, m_router.listResources()); },
      is | "tools/call"     = [&] -> mcp::json {
        if (!params.contains("name") || !params["name"].is_string())
          return Error(id, rpc::INVALID_PARAMS, "tools/call requires a string 'name'");

        return route(core::RequestKind::ToolCall, params["name"].get<String>(), params.value("arguments", mcp::json(nullptr)), id);
      },
      is | "resources/read" = [&] -> mcp::json {
        if (!params.contains("uri") || !params["uri"].is_string())
          return Error(id, rpc::INVALID_PARAMS, "resources/read requires a string 'uri'");

        return route(core::RequestKind::ResourceRead, params["uri"].get<String>(), mcp::json(nullptr), id);
      },
      is | _ = [&] { return Error(id, rpc::METHOD_NOT_FOUND, std::format("Method not found: {}", method)); }
    );
  }

  fn StdioServer::handleInitialize() const -> mcp::json {
    return mcp::json {
      { "protocolVersion", PROTOCOL_VERSION },
      {
       "capabilities",
       {
          { "tools", mcp::json::object() },
          { "resources", mcp::json::object() },
        },
       },
      {
       "serverInfo",
       {
          { "name", m_name },
          { "version", m_version },
        },
       },
    };
  }

  fn StdioServer::route(const core::RequestKind kind, const String& target, const mcp::json& arguments, const mcp::json& id) const -> mcp::json {
    const core::Outcome outcome = m_router.handle({ .kind = kind, .target = target, .arguments = arguments });

    if (!outcome) {
      const core::Failure& failure = outcome.error();

      return Error(
        id,
        core::JsonRpcCode(failure.kind),
        failure.message,
        mcp::json {
          { "kind", String(magic_enum::enum_name(failure.kind)) },
        }
      );
    }

    mcp::json result = mcp::json::object();

    if (kind == core::RequestKind::ToolCall)
      result["content"] = mcp::json::array({
        {
          { "type", "text" },
          { "text", Serialize(*outcome, 2) },
        },
      });
    else
      result["contents"] = mcp::json::array({
        {
          { "uri", target },
          { "mimeType", "application/json" },
          { "text", Serialize(*outcome, 2) },
        },
      });

    return Success(id, std::move(result));
  }
} // namespace gnome_mcp::server
