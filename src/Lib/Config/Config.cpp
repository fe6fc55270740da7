#include "GnomeMcp/Config/Config.hpp"

#include <fstream>                     // std::ifstream
#include <matchit.hpp>                 // matchit::{match, is, _}
#include <sstream>                     // std::ostringstream
#include <toml++/impl/parser.hpp>      // toml::parse
#include <toml++/impl/parse_error.hpp> // toml::parse_error

#include "GnomeMcp/Utils/Env.hpp"
#include "GnomeMcp/Utils/Logging.hpp"

namespace fs = std::filesystem;

using namespace gnome_mcp::utils::types;
using gnome_mcp::utils::env::GetEnv;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace {
  constexpr PCStr LOCAL_CONFIG_NAME = "gnome-mcp.toml";
  constexpr PCStr CONFIG_SUBPATH    = "gnome-mcp/config.toml";

  fn TypeName(const toml::node_type type) -> StringView {
    using matchit::match, matchit::is, matchit::_;
    using enum toml::node_type;

    return match(type)(
      is | table          = "table",
      is | array          = "array",
      is | string         = "string",
      is | integer        = "integer",
      is | floating_point = "float",
      is | boolean        = "boolean",
      is | date           = "date",
      is | time           = "time",
      is | date_time      = "datetime",
      is | _              = "none"
    );
  }

  fn ToConfigValue(const toml::node& node) -> gnome_mcp::config::ConfigValue {
    if (const auto* val = node.as_boolean())
      return val->get();
    if (const auto* val = node.as_integer())
      return val->get();
    if (const auto* val = node.as_floating_point())
      return val->get();
    if (const auto* val = node.as_string())
      return val->get();

    return gnome_mcp::config::OtherValue { .kind = String(TypeName(node.type())) };
  }

  fn ParseCategory(const toml::node& node, const StringView name) -> Result<gnome_mcp::config::CategoryEntries> {
    const toml::table* tbl = node.as_table();

    if (!tbl)
      ERR_FMT(ConfigValueError, "[{}] must be a table, found {}", name, TypeName(node.type()));

    gnome_mcp::config::CategoryEntries entries;

    for (const auto& [key, value] : *tbl) {
      gnome_mcp::config::CapabilityEntry entry;

      if (const toml::table* options = value.as_table()) {
        for (const auto& [optKey, optValue] : *options)
          entry.options.emplace(String(optKey.str()), ToConfigValue(optValue));
      } else {
        entry.nonTableKind = String(TypeName(value.type()));
      }

      entries.emplace(String(key.str()), std::move(entry));
    }

    return entries;
  }

  fn ReadPositive(const toml::table& tbl, const StringView key, i64& out) -> Result<> {
    const toml::node* node = tbl.get(key);

    if (!node)
      return {};

    const auto* integer = node->as_integer();

    if (!integer)
      ERR_FMT(ConfigValueError, "server.{} must be an integer, found {}", key, TypeName(node->type()));

    if (integer->get() <= 0)
      ERR_FMT(ConfigValueError, "server.{} must be positive, found {}", key, integer->get());

    out = integer->get();
    return {};
  }
} // namespace

namespace gnome_mcp::config {
  fn ServerSettings::fromToml(const toml::table& tbl) -> Result<ServerSettings> {
    ServerSettings settings;

    if (Result<> res = ReadPositive(tbl, "provider_timeout_ms", settings.providerTimeoutMs); !res)
      return Err(res.error());

    if (Result<> res = ReadPositive(tbl, "interactive_timeout_ms", settings.interactiveTimeoutMs); !res)
      return Err(res.error());

    return settings;
  }

  fn EffectiveConfig::fromToml(const toml::table& tbl, fs::path source) -> Result<EffectiveConfig> {
    EffectiveConfig config;
    config.source = std::move(source);

    if (const toml::node* node = tbl.get("resources")) {
      Result<CategoryEntries> entries = ParseCategory(*node, "resources");
      if (!entries)
        return Err(entries.error());
      config.resources = std::move(*entries);
    }

    if (const toml::node* node = tbl.get("tools")) {
      Result<CategoryEntries> entries = ParseCategory(*node, "tools");
      if (!entries)
        return Err(entries.error());
      config.tools = std::move(*entries);
    }

    if (const toml::node* node = tbl.get("server")) {
      const toml::table* server = node->as_table();

      if (!server)
        ERR_FMT(ConfigValueError, "[server] must be a table, found {}", TypeName(node->type()));

      Result<ServerSettings> settings = ServerSettings::fromToml(*server);
      if (!settings)
        return Err(settings.error());
      config.server = *settings;
    }

    return config;
  }

  fn EffectiveConfig::entries(const Category category) const -> const Option<CategoryEntries>& {
    return category == Category::Resources ? resources : tools;
  }

  fn DefaultSearchPaths(const Option<fs::path>& explicitPath) -> Vec<fs::path> {
    if (explicitPath)
      return { *explicitPath };

    Vec<fs::path> paths { fs::path(LOCAL_CONFIG_NAME) };

    if (Result<PCStr> xdgHome = GetEnv("XDG_CONFIG_HOME"); xdgHome)
      paths.emplace_back(fs::path(*xdgHome) / CONFIG_SUBPATH);
    else if (Result<PCStr> home = GetEnv("HOME"); home)
      paths.emplace_back(fs::path(*home) / ".config" / CONFIG_SUBPATH);

    String dirs = "/etc/xdg";
    if (Result<PCStr> xdgDirs = GetEnv("XDG_CONFIG_DIRS"); xdgDirs)
      dirs = *xdgDirs;

    usize start = 0;
    while (start <= dirs.size()) {
      const usize end   = dirs.find(':', start);
      const String part = dirs.substr(start, end == String::npos ? String::npos : end - start);

      if (!part.empty())
        paths.emplace_back(fs::path(part) / CONFIG_SUBPATH);

      if (end == String::npos)
        break;

      start = end + 1;
    }

    return paths;
  }

  fn ParseConfig(const StringView text, const fs::path& source) -> Result<EffectiveConfig> {
    try {
      const toml::table root = toml::parse(text, source.string());
      return EffectiveConfig::fromToml(root, source);
    } catch (const toml::parse_error& err) {
      ERR_FMT(
        ConfigParseError,
        "{}:{}:{}: {}",
        source.string(),
        err.source().begin.line,
        err.source().begin.column,
        err.description()
      );
    }
  }

  ConfigResolver::ConfigResolver(Vec<fs::path> candidates, const bool requireFirst)
    : m_candidates(std::move(candidates)), m_requireFirst(requireFirst) {}

  fn ConfigResolver::forCommandLine(const Option<fs::path>& explicitPath) -> ConfigResolver {
    return ConfigResolver(DefaultSearchPaths(explicitPath), explicitPath.has_value());
  }

  fn ConfigResolver::resolve() const -> Result<EffectiveConfig> {
    for (const fs::path& candidate : m_candidates) {
      std::error_code errc;

      if (!fs::is_regular_file(candidate, errc)) {
        if (m_requireFirst)
          ERR_FMT(ConfigParseError, "Configuration file {} does not exist", candidate.string());

        debug_log("No configuration at {}", candidate.string());
        continue;
      }

      std::ifstream file(candidate);

      if (!file)
        ERR_FMT(IoError, "Failed to open configuration file {}", candidate.string());

      std::ostringstream buffer;
      buffer << file.rdbuf();

      info_log("Using configuration file {}", candidate.string());
      return ParseConfig(buffer.str(), candidate);
    }

    info_log("No configuration file found, enabling every capability with default options");
    return EffectiveConfig {};
  }
} // namespace gnome_mcp::config
