#pragma once

#include <filesystem>            // std::filesystem::path
#include <toml++/impl/table.hpp> // toml::table
#include <variant>               // std::variant

#include "GnomeMcp/Utils/Definitions.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

namespace gnome_mcp::config {
  namespace {
    using utils::types::f64;
    using utils::types::i64;
    using utils::types::Map;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u8;
    using utils::types::Vec;
  } // namespace

  /**
   * @enum Category
   * @brief The two top-level capability tables of the configuration file.
   */
  enum class Category : u8 {
    Resources,
    Tools,
  };

  /**
   * @brief Placeholder for a configuration value that is not a scalar
   * (array, table, date...). Only its TOML type name is kept, for error messages.
   */
  struct OtherValue {
    String kind;

    fn operator==(const OtherValue&) const -> bool = default;
  };

  using ConfigValue = std::variant<bool, i64, f64, String, OtherValue>;
  using OptionBag   = Map<String, ConfigValue>;

  /**
   * @struct CapabilityEntry
   * @brief One `[category.key]` entry of the configuration file.
   */
  struct CapabilityEntry {
    OptionBag      options;      ///< Scalar options found in the sub-table.
    Option<String> nonTableKind; ///< Set when the entry exists but is not a table.

    fn operator==(const CapabilityEntry&) const -> bool = default;
  };

  using CategoryEntries = Map<String, CapabilityEntry>;

  /**
   * @struct ServerSettings
   * @brief Holds the `[server]` table.
   */
  struct ServerSettings {
    i64 providerTimeoutMs    = 5000;  ///< Upper bound for a single provider call.
    i64 interactiveTimeoutMs = 60000; ///< Upper bound for calls that wait on the user (interactive screenshots).

    /**
     * @brief Parses the `[server]` table.
     * @param tbl The TOML table to parse.
     * @return The parsed settings, or a ConfigValueError for a mistyped or non-positive value.
     */
    static fn fromToml(const toml::table& tbl) -> Result<ServerSettings>;

    fn operator==(const ServerSettings&) const -> bool = default;
  };

  /**
   * @struct EffectiveConfig
   * @brief The configuration the process runs with, built once at startup.
   *
   * A category is None when its table is absent from the file (or when there is
   * no file at all); the registry gives those two cases their meaning.
   */
  struct EffectiveConfig {
    Option<std::filesystem::path> source;    ///< File the configuration came from, None when built-in defaults apply.
    Option<CategoryEntries>       resources; ///< `[resources]` entries.
    Option<CategoryEntries>       tools;     ///< `[tools]` entries.
    ServerSettings                server;    ///< `[server]` settings.

    /**
     * @brief Builds the effective configuration from a parsed document.
     * @param tbl The root table.
     * @param source File the table came from.
     */
    static fn fromToml(const toml::table& tbl, std::filesystem::path source) -> Result<EffectiveConfig>;

    [[nodiscard]] fn entries(Category category) const -> const Option<CategoryEntries>&;

    fn operator==(const EffectiveConfig&) const -> bool = default;
  };

  /**
   * @brief Returns the ordered list of candidate configuration files.
   *
   * With an explicit path only that path is returned. Otherwise:
   * `./gnome-mcp.toml`, the user file under `$XDG_CONFIG_HOME` (or
   * `~/.config`), then one file per `$XDG_CONFIG_DIRS` entry (default `/etc/xdg`).
   */
  fn DefaultSearchPaths(const Option<std::filesystem::path>& explicitPath = None) -> Vec<std::filesystem::path>;

  /**
   * @brief Parses configuration text. Used for files and by tests.
   * @param text The TOML document.
   * @param source Name reported in errors and kept as EffectiveConfig::source.
   */
  fn ParseConfig(StringView text, const std::filesystem::path& source) -> Result<EffectiveConfig>;

  /**
   * @class ConfigResolver
   * @brief Finds the first existing configuration file and loads it in its entirety.
   */
  class ConfigResolver {
   public:
    explicit ConfigResolver(Vec<std::filesystem::path> candidates, bool requireFirst = false);

    /**
     * @brief Resolver over the default locations, or over a single path given on the command line.
     */
    static fn forCommandLine(const Option<std::filesystem::path>& explicitPath) -> ConfigResolver;

    /**
     * @brief Loads the configuration.
     * @return The first existing candidate parsed in full, an empty configuration
     * when none exists, or a ConfigParseError / ConfigValueError.
     */
    [[nodiscard]] fn resolve() const -> Result<EffectiveConfig>;

    [[nodiscard]] fn candidates() const -> const Vec<std::filesystem::path>& {
      return m_candidates;
    }

   private:
    Vec<std::filesystem::path> m_candidates;
    bool                       m_requireFirst;
  };
} // namespace gnome_mcp::config
