#include <sstream>   // std::{istringstream, ostringstream}
#include <stdexcept> // std::runtime_error

#include "GnomeMcp/Config/Config.hpp"
#include "GnomeMcp/Core/Registry.hpp"
#include "GnomeMcp/Core/Router.hpp"
#include "GnomeMcp/Server/StdioServer.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace testing;
using namespace gnome_mcp::utils::types;
using gnome_mcp::core::Arguments;
using gnome_mcp::core::CapabilityRegistry;
using gnome_mcp::core::HandlerId;
using gnome_mcp::core::HandlerTable;
using gnome_mcp::core::ICapabilityHandler;
using gnome_mcp::core::RequestRouter;
using gnome_mcp::core::ResolvedOptions;
using gnome_mcp::server::StdioServer;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace rpc = gnome_mcp::server::rpc;

namespace {
  // NOLINTBEGIN(readability-identifier-naming)
  class MockHandler : public ICapabilityHandler {
   public:
    MOCK_METHOD(Result<mcp::json>, invoke, (const Arguments&, const ResolvedOptions&), (override));
  };
  // NOLINTEND(readability-identifier-naming)

  fn Lines(const String& output) -> Vec<mcp::json> {
    Vec<mcp::json>     messages;
    std::istringstream stream(output);

    for (String line; std::getline(stream, line);)
      messages.push_back(mcp::json::parse(line));

    return messages;
  }
} // namespace

class StdioServerTest : public Test {
 protected:
  CapabilityRegistry           m_registry = *CapabilityRegistry::build(gnome_mcp::config::EffectiveConfig {});
  NiceMock<MockHandler>*       m_notify   = nullptr;
  NiceMock<MockHandler>*       m_system   = nullptr;
  UniquePointer<RequestRouter> m_router;
  UniquePointer<StdioServer>   m_server;

  fn SetUp() -> void override {
    auto notify = std::make_unique<NiceMock<MockHandler>>();
    auto system = std::make_unique<NiceMock<MockHandler>>();
    m_notify    = notify.get();
    m_system    = system.get();

    HandlerTable handlers;
    handlers.emplace(HandlerId::SendNotification, std::move(notify));
    handlers.emplace(HandlerId::SystemInfo, std::move(system));

    m_router = std::make_unique<RequestRouter>(m_registry, std::move(handlers));
    m_server = std::make_unique<StdioServer>("gnome-mcp-server", "1.2.3", *m_router);
  }

  fn call(const StringView line) const -> mcp::json {
    const Option<mcp::json> response = m_server->handleMessage(line);
    EXPECT_TRUE(response.has_value()) << line;
    return response.value_or(mcp::json(nullptr));
  }
};

TEST_F(StdioServerTest, Initialize) {
  const mcp::json response = call(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})");

  EXPECT_EQ(response["id"], 1);
  EXPECT_EQ(response["result"]["protocolVersion"], "2024-11-05");
  EXPECT_EQ(response["result"]["serverInfo"]["name"], "gnome-mcp-server");
  EXPECT_EQ(response["result"]["serverInfo"]["version"], "1.2.3");
  EXPECT_TRUE(response["result"]["capabilities"].contains("tools"));
  EXPECT_TRUE(response["result"]["capabilities"].contains("resources"));
}

TEST_F(StdioServerTest, MalformedJsonIsParseError) {
  const mcp::json response = call("{\"jsonrpc\":\"2.0\",");

  EXPECT_TRUE(response["id"].is_null());
  EXPECT_EQ(response["error"]["code"], rpc::PARSE_ERROR);
}

TEST_F(StdioServerTest, NonObjectIsInvalidRequest) {
  const mcp::json response = call("[1,2,3]");

  EXPECT_EQ(response["error"]["code"], rpc::INVALID_REQUEST);
}

TEST_F(StdioServerTest, UnknownMethod) {
  const mcp::json response = call(R"({"jsonrpc":"2.0","id":"abc","method":"prompts/list"})");

  EXPECT_EQ(response["id"], "abc");
  EXPECT_EQ(response["error"]["code"], rpc::METHOD_NOT_FOUND);
  EXPECT_EQ(response["error"]["message"], "Method not found: prompts/list");
}

TEST_F(StdioServerTest, NotificationsGetNoResponse) {
  EXPECT_FALSE(m_server->handleMessage(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
  EXPECT_FALSE(m_server->handleMessage(R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"send_notification"}})").has_value());
}

TEST_F(StdioServerTest, ToolCallWrapsPayloadAsText) {
  EXPECT_CALL(*m_notify, invoke(_, _))
    .WillOnce(Return(Result<mcp::json>(mcp::json {
      { "message", "Notification sent" },
      {      "id",                  3 },
    })));

  const mcp::json response = call(
    R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"send_notification","arguments":{"summary":"Hi","body":"There"}}})"
  );

  ASSERT_TRUE(response.contains("result"));
  const mcp::json& content = response["result"]["content"];
  ASSERT_EQ(content.size(), 1u);
  EXPECT_EQ(content[0]["type"], "text");
  EXPECT_EQ(mcp::json::parse(content[0]["text"].get<String>())["id"], 3);
}

TEST_F(StdioServerTest, ToolCallFailureCarriesKind) {
  const mcp::json response = call(R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"send_notification","arguments":{"summary":"Hi"}}})");

  EXPECT_EQ(response["error"]["code"], rpc::INVALID_PARAMS);
  EXPECT_EQ(response["error"]["data"]["kind"], "InvalidArguments");
}

TEST_F(StdioServerTest, ProviderFailureCarriesKind) {
  EXPECT_CALL(*m_system, invoke(_, _)).WillOnce(Return(Result<mcp::json>(Err(GmcpError(ApiUnavailable, "No system info provider is available")))));

  const mcp::json response = call(R"({"jsonrpc":"2.0","id":7,"method":"resources/read","params":{"uri":"gnome://system/info"}})");

  EXPECT_EQ(response["error"]["data"]["kind"], "ProviderError");
  EXPECT_EQ(response["error"]["message"], "No system info provider is available");
}

TEST_F(StdioServerTest, UnknownToolIsCapabilityNotFound) {
  const mcp::json response = call(R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"name":"format_disk"}})");

  EXPECT_EQ(response["error"]["data"]["kind"], "CapabilityNotFound");
}

TEST_F(StdioServerTest, ToolCallWithoutNameIsInvalidParams) {
  const mcp::json response = call(R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{}})");

  EXPECT_EQ(response["error"]["code"], rpc::INVALID_PARAMS);
}

TEST_F(StdioServerTest, ResourceReadReturnsContents) {
  EXPECT_CALL(*m_system, invoke(_, _)).WillOnce(Return(Result<mcp::json>(mcp::json { { "hostname", "workstation" } })));

  const mcp::json response = call(R"({"jsonrpc":"2.0","id":10,"method":"resources/read","params":{"uri":"gnome://system/info"}})");

  const mcp::json& contents = response["result"]["contents"];
  ASSERT_EQ(contents.size(), 1u);
  EXPECT_EQ(contents[0]["uri"], "gnome://system/info");
  EXPECT_EQ(contents[0]["mimeType"], "application/json");
  EXPECT_EQ(mcp::json::parse(contents[0]["text"].get<String>())["hostname"], "workstation");
}

TEST_F(StdioServerTest, HandlerExceptionBecomesInternalError) {
  EXPECT_CALL(*m_system, invoke(_, _)).WillOnce(Throw(std::runtime_error("boom")));

  const mcp::json response = call(R"({"jsonrpc":"2.0","id":11,"method":"resources/read","params":{"uri":"gnome://system/info"}})");

  EXPECT_EQ(response["error"]["code"], rpc::INTERNAL_ERROR);
}

TEST_F(StdioServerTest, RunKeepsServingAfterBadLines) {
  std::istringstream input(
    "not json\n"
    "\n"
    R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
    "\n"
    R"({"jsonrpc":"2.0","id":2,"method":"ping"})"
    "\n"
  );
  std::ostringstream output;

  EXPECT_EQ(m_server->run(input, output), 0);

  const Vec<mcp::json> responses = Lines(output.str());

  ASSERT_EQ(responses.size(), 2u);
  EXPECT_EQ(responses[0]["error"]["code"], rpc::PARSE_ERROR);
  EXPECT_EQ(responses[1]["id"], 2);
  EXPECT_TRUE(responses[1]["result"].empty());
}

TEST_F(StdioServerTest, InvalidUtf8FromProviderIsReplaced) {
  EXPECT_CALL(*m_system, invoke(_, _)).WillOnce(Return(Result<mcp::json>(Err(GmcpError(PlatformSpecific, "'wpctl' failed: \xff\xfe")))));
  EXPECT_CALL(*m_notify, invoke(_, _)).WillOnce(Return(Result<mcp::json>(mcp::json { { "message", "sent \xff" } })));

  std::istringstream input(
    R"({"jsonrpc":"2.0","id":1,"method":"resources/read","params":{"uri":"gnome://system/info"}})"
    "\n"
    R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"send_notification","arguments":{"summary":"a","body":"b"}}})"
    "\n"
  );
  std::ostringstream output;

  EXPECT_EQ(m_server->run(input, output), 0);

  const Vec<mcp::json> responses = Lines(output.str());

  ASSERT_EQ(responses.size(), 2u);
  EXPECT_EQ(responses[0]["error"]["data"]["kind"], "ProviderError");
  EXPECT_NE(responses[0]["error"]["message"].get<String>().find("\xEF\xBF\xBD"), String::npos);
  EXPECT_TRUE(responses[1].contains("result"));
}

TEST_F(StdioServerTest, RunReturnsZeroOnImmediateEof) {
  std::istringstream input;
  std::ostringstream output;

  EXPECT_EQ(m_server->run(input, output), 0);
  EXPECT_TRUE(output.str().empty());
}
