#include <limits>    // std::numeric_limits
#include <stdexcept> // std::out_of_range

#include "GnomeMcp/Core/Capability.hpp"
#include "GnomeMcp/Core/Registry.hpp"
#include "GnomeMcp/Core/Router.hpp"
#include "GnomeMcp/Config/Config.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace testing;
using namespace gnome_mcp::core;
using namespace gnome_mcp::utils::types;
using gnome_mcp::config::EffectiveConfig;
using gnome_mcp::config::ParseConfig;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace {
  // NOLINTBEGIN(readability-identifier-naming)
  class MockHandler : public ICapabilityHandler {
   public:
    MOCK_METHOD(Result<mcp::json>, invoke, (const Arguments&, const ResolvedOptions&), (override));
  };
  // NOLINTEND(readability-identifier-naming)

  fn FindDescriptor(const StringView name) -> const CapabilityDescriptor& {
    for (const CapabilityDescriptor& descriptor : Catalog())
      if (descriptor.name == name)
        return descriptor;

    throw std::out_of_range(std::format("no descriptor named {}", name));
  }
} // namespace

class ValidateArgumentsTest : public Test {};

TEST_F(ValidateArgumentsTest, MissingRequiredParameter) {
  Result<Arguments> args = ValidateArguments(FindDescriptor("send_notification"), mcp::json { { "summary", "hi" } });

  ASSERT_FALSE(args);
  EXPECT_EQ(args.error().code, InvalidArgument);
  EXPECT_NE(args.error().message.find("body"), String::npos);
}

TEST_F(ValidateArgumentsTest, NullArgumentsWithNoRequiredParameters) {
  Result<Arguments> args = ValidateArguments(FindDescriptor("take_screenshot"), mcp::json(nullptr));

  ASSERT_TRUE(args);
  EXPECT_FALSE(args->has("interactive"));
}

TEST_F(ValidateArgumentsTest, NonObjectArgumentsRejected) {
  Result<Arguments> args = ValidateArguments(FindDescriptor("take_screenshot"), mcp::json::array({ 1, 2 }));

  ASSERT_FALSE(args);
  EXPECT_EQ(args.error().code, InvalidArgument);
}

TEST_F(ValidateArgumentsTest, CoercesScalarStrings) {
  Result<Arguments> args = ValidateArguments(
    FindDescriptor("window_management"),
    mcp::json {
      {    "action", "move_to_workspace" },
      { "window_id",             "12345" },
      { "workspace",                 "2" },
    }
  );

  ASSERT_TRUE(args);
  EXPECT_EQ(args->getInteger("workspace"), 2);
  EXPECT_EQ(args->getString("window_id"), "12345");

  Result<Arguments> toggle = ValidateArguments(
    FindDescriptor("quick_settings"),
    mcp::json {
      { "setting", "wifi" },
      { "enabled", "false" },
    }
  );

  ASSERT_TRUE(toggle);
  EXPECT_EQ(toggle->getBool("enabled"), false);
}

TEST_F(ValidateArgumentsTest, RejectsUncoercibleValue) {
  Result<Arguments> args = ValidateArguments(
    FindDescriptor("quick_settings"),
    mcp::json {
      { "setting", "wifi" },
      { "enabled", "maybe" },
    }
  );

  ASSERT_FALSE(args);
  EXPECT_NE(args.error().message.find("enabled"), String::npos);
}

TEST_F(ValidateArgumentsTest, EnforcesAllowedValues) {
  Result<Arguments> args = ValidateArguments(FindDescriptor("media_control"), mcp::json { { "action", "rewind" } });

  ASSERT_FALSE(args);
  EXPECT_EQ(args.error().code, InvalidArgument);
  EXPECT_NE(args.error().message.find("play_pause"), String::npos);
}

TEST_F(ValidateArgumentsTest, EnforcesNumericBounds) {
  Result<Arguments> tooLoud = ValidateArguments(FindDescriptor("set_volume"), mcp::json { { "volume", 150 } });

  ASSERT_FALSE(tooLoud);
  EXPECT_EQ(tooLoud.error().code, InvalidArgument);

  Result<Arguments> ok = ValidateArguments(FindDescriptor("set_volume"), mcp::json { { "volume", 42.5 } });

  ASSERT_TRUE(ok);
  EXPECT_DOUBLE_EQ(*ok->getNumber("volume"), 42.5);
}

TEST_F(ValidateArgumentsTest, RejectsIntegersBeyondSixtyFourBits) {
  Result<Arguments> huge = ValidateArguments(
    FindDescriptor("window_management"),
    mcp::json {
      {    "action", "set_position" },
      { "window_id",            "1" },
      {         "x",           1e19 },
      {         "y",              0 },
    }
  );

  ASSERT_FALSE(huge);
  EXPECT_EQ(huge.error().code, InvalidArgument);
  EXPECT_NE(huge.error().message.find("'x'"), String::npos);

  Result<Arguments> unsignedMax = ValidateArguments(
    FindDescriptor("window_management"),
    mcp::json {
      {    "action",                 "set_position" },
      { "window_id",                            "1" },
      {         "x",                              0 },
      {         "y", std::numeric_limits<u64>::max() },
    }
  );

  ASSERT_FALSE(unsignedMax);
  EXPECT_EQ(unsignedMax.error().code, InvalidArgument);
  EXPECT_NE(unsignedMax.error().message.find("'y'"), String::npos);
}

TEST_F(ValidateArgumentsTest, DropsUndeclaredArguments) {
  Result<Arguments> args = ValidateArguments(
    FindDescriptor("open_file"),
    mcp::json {
      {  "path", "/tmp/a.txt" },
      { "force",         true },
    }
  );

  ASSERT_TRUE(args);
  EXPECT_TRUE(args->has("path"));
  EXPECT_FALSE(args->has("force"));
}

TEST(FailureMappingTest, ErrorCodesMapToFailureKinds) {
  EXPECT_EQ(FailureFromError(GmcpError(InvalidArgument, "x")).kind, FailureKind::InvalidArguments);
  EXPECT_EQ(FailureFromError(GmcpError(Timeout, "x")).kind, FailureKind::ProviderTimeout);
  EXPECT_EQ(FailureFromError(GmcpError(PermissionDenied, "x")).kind, FailureKind::PermissionDenied);
  EXPECT_EQ(FailureFromError(GmcpError(CapabilityNotFound, "x")).kind, FailureKind::CapabilityNotFound);
  EXPECT_EQ(FailureFromError(GmcpError(ApiUnavailable, "x")).kind, FailureKind::ProviderError);
  EXPECT_EQ(FailureFromError(GmcpError(NotFound, "Secret not found")).message, "Secret not found");
}

TEST(FailureMappingTest, JsonRpcCodes) {
  EXPECT_EQ(JsonRpcCode(FailureKind::InvalidArguments), -32602);
  EXPECT_EQ(JsonRpcCode(FailureKind::CapabilityNotFound), -32002);
  EXPECT_EQ(JsonRpcCode(FailureKind::PermissionDenied), -32003);
  EXPECT_EQ(JsonRpcCode(FailureKind::ProviderTimeout), -32001);
  EXPECT_EQ(JsonRpcCode(FailureKind::ProviderError), -32000);
}

class RequestRouterTest : public Test {
 protected:
  fn makeRegistry(const StringView toml) -> CapabilityRegistry {
    Result<EffectiveConfig> config = ParseConfig(toml, "router.toml");
    EXPECT_TRUE(config);

    Result<CapabilityRegistry> registry = CapabilityRegistry::build(*config);
    EXPECT_TRUE(registry);

    return std::move(*registry);
  }

  fn makeHandlers(const HandlerId id) -> HandlerTable {
    auto mock = std::make_unique<NiceMock<MockHandler>>();
    m_mock    = mock.get();

    HandlerTable table;
    table.emplace(id, std::move(mock));
    return table;
  }

  NiceMock<MockHandler>* m_mock = nullptr;
};

TEST_F(RequestRouterTest, RoutesToolCallWithResolvedOptions) {
  const CapabilityRegistry registry = makeRegistry("[tools.audio]\nvolume_step = 4\n");
  const RequestRouter      router(registry, makeHandlers(HandlerId::SetVolume));

  EXPECT_CALL(*m_mock, invoke(_, _))
    .WillOnce([](const Arguments& args, const ResolvedOptions& options) -> Result<mcp::json> {
      EXPECT_EQ(args.getString("direction"), "up");
      EXPECT_EQ(options.getInteger("volume_step"), 4);
      return mcp::json { { "volume", 54 } };
    });

  const Outcome outcome = router.handle({
    .kind      = RequestKind::ToolCall,
    .target    = "set_volume",
    .arguments = mcp::json { { "direction", "up" } },
  });

  ASSERT_TRUE(outcome);
  EXPECT_EQ((*outcome)["volume"], 54);
}

TEST_F(RequestRouterTest, DisabledToolIsNotFoundAndNeverInvoked) {
  const CapabilityRegistry registry = makeRegistry("[tools.notifications]\n");
  const RequestRouter      router(registry, makeHandlers(HandlerId::WindowManagement));

  EXPECT_CALL(*m_mock, invoke(_, _)).Times(0);

  const Outcome outcome = router.handle({
    .kind      = RequestKind::ToolCall,
    .target    = "window_management",
    .arguments = mcp::json { { "action", "list" } },
  });

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error().kind, FailureKind::CapabilityNotFound);
  EXPECT_EQ(outcome.error().message, "Tool not found: window_management");
}

TEST_F(RequestRouterTest, InvalidArgumentsNeverReachHandler) {
  const CapabilityRegistry registry = makeRegistry("");
  const RequestRouter      router(registry, makeHandlers(HandlerId::MediaControl));

  EXPECT_CALL(*m_mock, invoke(_, _)).Times(0);

  const Outcome outcome = router.handle({
    .kind      = RequestKind::ToolCall,
    .target    = "media_control",
    .arguments = mcp::json::object(),
  });

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error().kind, FailureKind::InvalidArguments);
}

TEST_F(RequestRouterTest, HandlerErrorIsMapped) {
  const CapabilityRegistry registry = makeRegistry("");
  const RequestRouter      router(registry, makeHandlers(HandlerId::Contacts));

  EXPECT_CALL(*m_mock, invoke(_, _))
    .WillOnce(Return(Result<mcp::json>(Err(GmcpError(Timeout, "Evolution Data Server did not answer")))));

  const Outcome outcome = router.handle({
    .kind      = RequestKind::ResourceRead,
    .target    = "gnome://contacts/list",
    .arguments = mcp::json(nullptr),
  });

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error().kind, FailureKind::ProviderTimeout);
  EXPECT_EQ(outcome.error().message, "Evolution Data Server did not answer");
}

TEST_F(RequestRouterTest, MissingHandlerIsProviderError) {
  const CapabilityRegistry registry = makeRegistry("");
  const RequestRouter      router(registry, HandlerTable {});

  const Outcome outcome = router.handle({
    .kind      = RequestKind::ResourceRead,
    .target    = "gnome://system/info",
    .arguments = mcp::json(nullptr),
  });

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error().kind, FailureKind::ProviderError);
}

TEST_F(RequestRouterTest, ListsOnlyEnabledCapabilities) {
  const CapabilityRegistry registry = makeRegistry("[tools.audio]\n[resources.audio]\n");
  const RequestRouter      router(registry, HandlerTable {});

  const mcp::json tools = router.listTools()["tools"];
  ASSERT_EQ(tools.size(), 2u);
  EXPECT_EQ(tools[0]["name"], "set_volume");
  EXPECT_EQ(tools[1]["name"], "media_control");

  const mcp::json& volume = tools[0]["inputSchema"]["properties"]["volume"];
  EXPECT_EQ(volume["minimum"], -100.0);
  EXPECT_EQ(volume["maximum"], 100.0);

  const mcp::json& action = tools[1]["inputSchema"]["properties"]["action"];
  EXPECT_TRUE(action["enum"].is_array());

  const mcp::json resources = router.listResources()["resources"];
  ASSERT_EQ(resources.size(), 1u);
  EXPECT_EQ(resources[0]["uri"], "gnome://audio/status");
  EXPECT_EQ(resources[0]["mimeType"], "application/json");
}
