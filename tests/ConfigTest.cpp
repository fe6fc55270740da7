#include <filesystem> // std::filesystem::{path, temp_directory_path, create_directories, remove_all}
#include <fstream>    // std::ofstream
#include <toml++/toml.h>

#include "GnomeMcp/Config/Config.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

#include "gtest/gtest.h"

using namespace gnome_mcp::utils::types;
using gnome_mcp::config::CapabilityEntry;
using gnome_mcp::config::ConfigResolver;
using gnome_mcp::config::EffectiveConfig;
using gnome_mcp::config::OtherValue;
using gnome_mcp::config::ParseConfig;
using gnome_mcp::config::ServerSettings;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace fs = std::filesystem;

class ConfigTest : public testing::Test {
 protected:
  fs::path m_dir;

  fn SetUp() -> void override {
    m_dir = fs::temp_directory_path() / std::format("gnome-mcp-config-test-{}", testing::UnitTest::GetInstance()->random_seed());
    fs::remove_all(m_dir);
    fs::create_directories(m_dir);
  }

  fn TearDown() -> void override {
    std::error_code errc;
    fs::remove_all(m_dir, errc);
  }

  fn write(const String& name, const String& content) const -> fs::path {
    const fs::path path = m_dir / name;
    fs::create_directories(path.parent_path());
    std::ofstream(path) << content;
    return path;
  }
};

TEST_F(ConfigTest, ServerFromToml_Defaults) {
  const toml::table tbl;

  Result<ServerSettings> settings = ServerSettings::fromToml(tbl);

  ASSERT_TRUE(settings);
  EXPECT_EQ(settings->providerTimeoutMs, 5000);
  EXPECT_EQ(settings->interactiveTimeoutMs, 60000);
}

TEST_F(ConfigTest, ServerFromToml_Values) {
  const toml::table tbl = toml::parse(R"(
    provider_timeout_ms = 1500
    interactive_timeout_ms = 30000
  )");

  Result<ServerSettings> settings = ServerSettings::fromToml(tbl);

  ASSERT_TRUE(settings);
  EXPECT_EQ(settings->providerTimeoutMs, 1500);
  EXPECT_EQ(settings->interactiveTimeoutMs, 30000);
}

TEST_F(ConfigTest, ServerFromToml_RejectsNonPositiveTimeout) {
  const toml::table tbl = toml::parse("provider_timeout_ms = 0");

  Result<ServerSettings> settings = ServerSettings::fromToml(tbl);

  ASSERT_FALSE(settings);
  EXPECT_EQ(settings.error().code, ConfigValueError);
}

TEST_F(ConfigTest, ServerFromToml_RejectsWrongType) {
  const toml::table tbl = toml::parse(R"(interactive_timeout_ms = "soon")");

  Result<ServerSettings> settings = ServerSettings::fromToml(tbl);

  ASSERT_FALSE(settings);
  EXPECT_EQ(settings.error().code, ConfigValueError);
}

TEST_F(ConfigTest, ParseConfig_EmptyDocumentLeavesCategoriesAbsent) {
  Result<EffectiveConfig> config = ParseConfig("", "empty.toml");

  ASSERT_TRUE(config);
  EXPECT_FALSE(config->resources.has_value());
  EXPECT_FALSE(config->tools.has_value());
  ASSERT_TRUE(config->source.has_value());
  EXPECT_EQ(*config->source, fs::path("empty.toml"));
}

TEST_F(ConfigTest, ParseConfig_ReadsEntriesAndOptions) {
  Result<EffectiveConfig> config = ParseConfig(R"(
    [resources.calendar]
    days_ahead = 7

    [tools.audio]
    volume_step = 5

    [tools.notifications]
  )", "config.toml");

  ASSERT_TRUE(config);
  ASSERT_TRUE(config->resources.has_value());
  ASSERT_TRUE(config->tools.has_value());

  ASSERT_TRUE(config->resources->contains("calendar"));
  EXPECT_EQ(std::get<i64>(config->resources->at("calendar").options.at("days_ahead")), 7);

  ASSERT_TRUE(config->tools->contains("audio"));
  EXPECT_EQ(std::get<i64>(config->tools->at("audio").options.at("volume_step")), 5);

  ASSERT_TRUE(config->tools->contains("notifications"));
  EXPECT_TRUE(config->tools->at("notifications").options.empty());
}

TEST_F(ConfigTest, ParseConfig_KeepsNonScalarKinds) {
  Result<EffectiveConfig> config = ParseConfig(R"(
    [tools]
    audio = true

    [resources.tasks]
    due_within_days = [1, 2]
  )", "config.toml");

  ASSERT_TRUE(config);

  const CapabilityEntry& audio = config->tools->at("audio");
  ASSERT_TRUE(audio.nonTableKind.has_value());
  EXPECT_EQ(*audio.nonTableKind, "boolean");

  const auto& due = config->resources->at("tasks").options.at("due_within_days");
  ASSERT_TRUE(std::holds_alternative<OtherValue>(due));
  EXPECT_EQ(std::get<OtherValue>(due).kind, "array");
}

TEST_F(ConfigTest, ParseConfig_MalformedTomlIsParseError) {
  Result<EffectiveConfig> config = ParseConfig("[tools\naudio = ", "broken.toml");

  ASSERT_FALSE(config);
  EXPECT_EQ(config.error().code, ConfigParseError);
  EXPECT_NE(config.error().message.find("broken.toml"), String::npos);
}

TEST_F(ConfigTest, ParseConfig_CategoryMustBeTable) {
  Result<EffectiveConfig> config = ParseConfig(R"(tools = "all")", "config.toml");

  ASSERT_FALSE(config);
  EXPECT_EQ(config.error().code, ConfigValueError);
}

TEST_F(ConfigTest, DefaultSearchPaths_ExplicitPathOnly) {
  const Vec<fs::path> paths = gnome_mcp::config::DefaultSearchPaths(fs::path("/tmp/custom.toml"));

  ASSERT_EQ(paths.size(), 1u);
  EXPECT_EQ(paths.front(), fs::path("/tmp/custom.toml"));
}

TEST_F(ConfigTest, DefaultSearchPaths_WorkingDirectoryFirst) {
  const Vec<fs::path> paths = gnome_mcp::config::DefaultSearchPaths();

  ASSERT_FALSE(paths.empty());
  EXPECT_EQ(paths.front(), fs::path("gnome-mcp.toml"));
}

TEST_F(ConfigTest, Resolver_NoFileGivesDefaults) {
  const ConfigResolver resolver({ m_dir / "missing.toml", m_dir / "also-missing.toml" });

  Result<EffectiveConfig> config = resolver.resolve();

  ASSERT_TRUE(config);
  EXPECT_FALSE(config->source.has_value());
  EXPECT_FALSE(config->tools.has_value());
  EXPECT_EQ(config->server, ServerSettings {});
}

TEST_F(ConfigTest, Resolver_FirstFileShadowsLaterFilesEntirely) {
  const fs::path local = write("local.toml", R"(
    [tools.notifications]
  )");

  const fs::path user = write("user/config.toml", R"(
    [resources.calendar]
    days_ahead = 3

    [server]
    provider_timeout_ms = 100
  )");

  const ConfigResolver resolver({ local, user });

  Result<EffectiveConfig> config = resolver.resolve();

  ASSERT_TRUE(config);
  ASSERT_TRUE(config->source.has_value());
  EXPECT_EQ(*config->source, local);
  EXPECT_FALSE(config->resources.has_value());
  EXPECT_EQ(config->server.providerTimeoutMs, 5000);
}

TEST_F(ConfigTest, Resolver_InvalidFirstFileFailsEvenWithValidFallback) {
  const fs::path local = write("local.toml", "[server]\nprovider_timeout_ms = -5\n");
  const fs::path user  = write("user.toml", "[tools.audio]\n");

  const ConfigResolver resolver({ local, user });

  Result<EffectiveConfig> config = resolver.resolve();

  ASSERT_FALSE(config);
  EXPECT_EQ(config.error().code, ConfigValueError);
}

TEST_F(ConfigTest, Resolver_MissingExplicitFileIsError) {
  const ConfigResolver resolver = ConfigResolver::forCommandLine(m_dir / "nowhere.toml");

  Result<EffectiveConfig> config = resolver.resolve();

  ASSERT_FALSE(config);
  EXPECT_EQ(config.error().code, ConfigParseError);
}
