#pragma once

#include "GnomeMcp/Config/Config.hpp"
#include "GnomeMcp/Core/Capability.hpp"
#include "GnomeMcp/Utils/Definitions.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

namespace gnome_mcp::core {
  namespace {
    using utils::types::Map;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  /**
   * @class CapabilityRegistry
   * @brief The set of enabled capabilities, computed once from the configuration.
   *
   * Enablement policy, applied to both categories alike:
   *  - no configuration file: everything is enabled with defaults;
   *  - category table absent: every capability of the category is enabled;
   *  - category table present: only the listed config keys are enabled.
   */
  class CapabilityRegistry {
   public:
    /**
     * @brief Applies the enablement policy and resolves options.
     * @return The registry, or a ConfigValueError naming the offending option.
     */
    static fn build(const config::EffectiveConfig& config) -> Result<CapabilityRegistry>;

    /// Looks up an enabled tool by name. Returns nullptr when unknown or disabled.
    [[nodiscard]] fn findTool(StringView name) const -> const EnabledCapability*;

    /// Looks up an enabled resource by URI. Returns nullptr when unknown or disabled.
    [[nodiscard]] fn findResource(StringView uri) const -> const EnabledCapability*;

    [[nodiscard]] fn tools() const -> const Vec<EnabledCapability>& {
      return m_tools;
    }

    [[nodiscard]] fn resources() const -> const Vec<EnabledCapability>& {
      return m_resources;
    }

   private:
    Vec<EnabledCapability>             m_tools;
    Vec<EnabledCapability>             m_resources;
    Map<String, usize, std::less<>>    m_toolIndex;
    Map<String, usize, std::less<>>    m_resourceIndex;
  };

  /**
   * @brief Merges the declared defaults of a descriptor with a configuration entry.
   * @param category Category name used in error messages.
   */
  fn ResolveOptions(const CapabilityDescriptor& descriptor, const config::OptionBag& overrides, StringView category)
    -> Result<ResolvedOptions>;
} // namespace gnome_mcp::core
