#include "GnomeMcp/Core/Registry.hpp"

#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <matchit.hpp>               // matchit::{match, is, _}

#include "GnomeMcp/Utils/Logging.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::config::Category;
using gnome_mcp::config::ConfigValue;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace {
  fn KindOf(const ConfigValue& value) -> String {
    return std::visit(
      [](const auto& held) -> String {
        using T = std::decay_t<decltype(held)>;

        if constexpr (std::is_same_v<T, bool>)
          return "boolean";
        else if constexpr (std::is_same_v<T, i64>)
          return "integer";
        else if constexpr (std::is_same_v<T, f64>)
          return "float";
        else if constexpr (std::is_same_v<T, String>)
          return "string";
        else
          return held.kind;
      },
      value
    );
  }

  fn ExpectedName(const gnome_mcp::core::ValueType type) -> StringView {
    using matchit::match, matchit::is, matchit::_;
    using enum gnome_mcp::core::ValueType;

    return match(type)(
      is | Boolean = "boolean",
      is | Integer = "integer",
      is | Number  = "number",
      is | String  = "string",
      is | _       = "value"
    );
  }
} // namespace

namespace gnome_mcp::core {
  fn ResolveOptions(const CapabilityDescriptor& descriptor, const config::OptionBag& overrides, const StringView category)
    -> Result<ResolvedOptions> {
    Map<String, OptionValue> values;

    for (const OptionSpec& spec : descriptor.options) {
      const auto iter = overrides.find(spec.name);

      if (iter == overrides.end()) {
        values.emplace(spec.name, spec.defaultValue);
        continue;
      }

      const ConfigValue& raw = iter->second;
      Option<OptionValue> resolved;

      switch (spec.type) {
        case ValueType::Boolean:
          if (const bool* val = std::get_if<bool>(&raw))
            resolved = *val;
          break;
        case ValueType::Integer:
          if (const i64* val = std::get_if<i64>(&raw))
            resolved = *val;
          break;
        case ValueType::Number:
          if (const f64* val = std::get_if<f64>(&raw))
            resolved = *val;
          else if (const i64* val = std::get_if<i64>(&raw))
            resolved = static_cast<f64>(*val);
          break;
        case ValueType::String:
          if (const String* val = std::get_if<String>(&raw))
            resolved = *val;
          break;
      }

      if (!resolved)
        ERR_FMT(
          ConfigValueError,
          "{}.{}.{} must be {}, found {}",
          category,
          descriptor.configKey,
          spec.name,
          ExpectedName(spec.type),
          KindOf(raw)
        );

      if (spec.nonNegative) {
        const bool negative = std::visit(
          [](const auto& held) -> bool {
            using T = std::decay_t<decltype(held)>;
            if constexpr (std::is_same_v<T, i64> || std::is_same_v<T, f64>)
              return held < 0;
            else
              return false;
          },
          *resolved
        );

        if (negative)
          ERR_FMT(ConfigValueError, "{}.{}.{} must not be negative", category, descriptor.configKey, spec.name);
      }

      if (spec.maximum)
        if (const i64* val = std::get_if<i64>(&*resolved); val && *val > *spec.maximum)
          ERR_FMT(ConfigValueError, "{}.{}.{} must be at most {}, found {}", category, descriptor.configKey, spec.name, *spec.maximum, *val);

      values.emplace(spec.name, std::move(*resolved));
    }

    return ResolvedOptions(std::move(values));
  }

  fn CapabilityRegistry::build(const config::EffectiveConfig& config) -> Result<CapabilityRegistry> {
    CapabilityRegistry registry;

    for (const CapabilityDescriptor& descriptor : Catalog()) {
      const Category category = descriptor.kind == CapabilityKind::Tool ? Category::Tools : Category::Resources;
      const String   catName  = category == Category::Tools ? "tools" : "resources";

      const Option<config::CategoryEntries>& entries = config.entries(category);

      config::OptionBag overrides;

      if (entries) {
        const auto entry = entries->find(descriptor.configKey);

        if (entry == entries->end()) {
          debug_log("{} '{}' is not listed in [{}], disabled", magic_enum::enum_name(descriptor.kind), descriptor.name, catName);
          continue;
        }

        if (entry->second.nonTableKind)
          ERR_FMT(ConfigValueError, "{}.{} must be a table, found {}", catName, descriptor.configKey, *entry->second.nonTableKind);

        overrides = entry->second.options;
      }

      Result<ResolvedOptions> options = ResolveOptions(descriptor, overrides, catName);

      if (!options)
        return Err(options.error());

      Vec<EnabledCapability>&          target = category == Category::Tools ? registry.m_tools : registry.m_resources;
      Map<String, usize, std::less<>>& index  = category == Category::Tools ? registry.m_toolIndex : registry.m_resourceIndex;

      index.emplace(category == Category::Tools ? descriptor.name : descriptor.uri.value_or(descriptor.name), target.size());
      target.push_back({ .descriptor = &descriptor, .options = std::move(*options) });
    }

    debug_log("Enabled {} tools and {} resources", registry.m_tools.size(), registry.m_resources.size());

    return registry;
  }

  fn CapabilityRegistry::findTool(const StringView name) const -> const EnabledCapability* {
    if (const auto iter = m_toolIndex.find(name); iter != m_toolIndex.end())
      return &m_tools[iter->second];

    return nullptr;
  }

  fn CapabilityRegistry::findResource(const StringView uri) const -> const EnabledCapability* {
    if (const auto iter = m_resourceIndex.find(uri); iter != m_resourceIndex.end())
      return &m_resources[iter->second];

    return nullptr;
  }
} // namespace gnome_mcp::core
