#include "GnomeMcp/Config/Config.hpp"
#include "GnomeMcp/Core/Capability.hpp"
#include "GnomeMcp/Core/Registry.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

#include "gtest/gtest.h"

using namespace gnome_mcp::utils::types;
using gnome_mcp::config::EffectiveConfig;
using gnome_mcp::config::ParseConfig;
using gnome_mcp::core::Catalog;
using gnome_mcp::core::CapabilityKind;
using gnome_mcp::core::CapabilityRegistry;
using gnome_mcp::core::EnabledCapability;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace {
  fn Build(const StringView toml) -> Result<CapabilityRegistry> {
    Result<EffectiveConfig> config = ParseConfig(toml, "test.toml");

    if (!config)
      return Err(config.error());

    return CapabilityRegistry::build(*config);
  }

  fn Names(const Vec<EnabledCapability>& capabilities) -> Vec<String> {
    Vec<String> names;

    for (const EnabledCapability& capability : capabilities)
      names.push_back(capability.descriptor->name);

    return names;
  }
} // namespace

class RegistryTest : public testing::Test {};

TEST_F(RegistryTest, NoConfigurationEnablesWholeCatalog) {
  Result<CapabilityRegistry> registry = CapabilityRegistry::build(EffectiveConfig {});

  ASSERT_TRUE(registry);
  EXPECT_EQ(registry->tools().size() + registry->resources().size(), Catalog().size());

  for (const auto& descriptor : Catalog()) {
    if (descriptor.kind == CapabilityKind::Tool)
      EXPECT_NE(registry->findTool(descriptor.name), nullptr) << descriptor.name;
    else
      EXPECT_NE(registry->findResource(*descriptor.uri), nullptr) << descriptor.name;
  }
}

TEST_F(RegistryTest, PresentCategoryIsAnAllowList) {
  Result<CapabilityRegistry> registry = Build(R"(
    [tools.notifications]
    [tools.audio]
  )");

  ASSERT_TRUE(registry);
  EXPECT_EQ(Names(registry->tools()), (Vec<String> { "send_notification", "set_volume", "media_control" }));

  EXPECT_EQ(registry->findTool("window_management"), nullptr);
  EXPECT_EQ(registry->findTool("keyring_management"), nullptr);

  // [resources] is absent, so every resource stays enabled.
  EXPECT_EQ(registry->resources().size(), 6u);
}

TEST_F(RegistryTest, EmptyCategoryTableDisablesCategory) {
  Result<CapabilityRegistry> registry = Build(R"(
    [resources]
  )");

  ASSERT_TRUE(registry);
  EXPECT_TRUE(registry->resources().empty());
  EXPECT_FALSE(registry->tools().empty());
}

TEST_F(RegistryTest, UnknownNamesAreNotFound) {
  Result<CapabilityRegistry> registry = CapabilityRegistry::build(EffectiveConfig {});

  ASSERT_TRUE(registry);
  EXPECT_EQ(registry->findTool("rm_rf"), nullptr);
  EXPECT_EQ(registry->findResource("gnome://nothing/here"), nullptr);

  // Resources are addressed by URI, not by name.
  EXPECT_EQ(registry->findResource("calendar"), nullptr);
}

TEST_F(RegistryTest, DefaultsApplyWithoutOverride) {
  Result<CapabilityRegistry> registry = Build(R"(
    [resources.calendar]
    [resources.tasks]
  )");

  ASSERT_TRUE(registry);

  const EnabledCapability* calendar = registry->findResource("gnome://calendar/events");
  ASSERT_NE(calendar, nullptr);
  EXPECT_EQ(calendar->options.getInteger("days_ahead"), 30);
  EXPECT_EQ(calendar->options.getInteger("days_behind"), 0);

  const EnabledCapability* tasks = registry->findResource("gnome://tasks/list");
  ASSERT_NE(tasks, nullptr);
  EXPECT_TRUE(tasks->options.getBool("include_completed"));
  EXPECT_FALSE(tasks->options.getBool("include_cancelled"));
  EXPECT_EQ(tasks->options.getInteger("due_within_days"), 0);
}

TEST_F(RegistryTest, OverridesReplaceDefaults) {
  Result<CapabilityRegistry> registry = Build(R"(
    [tools.audio]
    volume_step = 25

    [resources.contacts]
    email_only = true
  )");

  ASSERT_TRUE(registry);

  const EnabledCapability* setVolume = registry->findTool("set_volume");
  ASSERT_NE(setVolume, nullptr);
  EXPECT_EQ(setVolume->options.getInteger("volume_step"), 25);

  const EnabledCapability* contacts = registry->findResource("gnome://contacts/list");
  ASSERT_NE(contacts, nullptr);
  EXPECT_TRUE(contacts->options.getBool("email_only"));
}

TEST_F(RegistryTest, MistypedOptionIsConfigValueError) {
  Result<CapabilityRegistry> registry = Build(R"(
    [resources.calendar]
    days_ahead = "thirty"
  )");

  ASSERT_FALSE(registry);
  EXPECT_EQ(registry.error().code, ConfigValueError);
  EXPECT_NE(registry.error().message.find("resources.calendar.days_ahead"), String::npos);
}

TEST_F(RegistryTest, NegativeOptionIsConfigValueError) {
  Result<CapabilityRegistry> registry = Build(R"(
    [resources.tasks]
    due_within_days = -1
  )");

  ASSERT_FALSE(registry);
  EXPECT_EQ(registry.error().code, ConfigValueError);
}

TEST_F(RegistryTest, OversizedDayWindowIsConfigValueError) {
  Result<CapabilityRegistry> registry = Build(R"(
    [resources.calendar]
    days_ahead = 9223372036854775807
  )");

  ASSERT_FALSE(registry);
  EXPECT_EQ(registry.error().code, ConfigValueError);
  EXPECT_NE(registry.error().message.find("resources.calendar.days_ahead"), String::npos);

  EXPECT_TRUE(Build("[resources.calendar]\ndays_ahead = 36500\n"));
}

TEST_F(RegistryTest, NonTableEntryIsConfigValueError) {
  Result<CapabilityRegistry> registry = Build(R"(
    [tools]
    audio = true
  )");

  ASSERT_FALSE(registry);
  EXPECT_EQ(registry.error().code, ConfigValueError);
}

TEST_F(RegistryTest, BuildIsDeterministic) {
  constexpr StringView toml = R"(
    [tools.window_management]
    [tools.keyring]
    [resources.audio]
  )";

  Result<CapabilityRegistry> first  = Build(toml);
  Result<CapabilityRegistry> second = Build(toml);

  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(Names(first->tools()), Names(second->tools()));
  EXPECT_EQ(Names(first->resources()), Names(second->resources()));
}
