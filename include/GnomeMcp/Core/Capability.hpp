#pragma once

#include <mcp_message.h> // mcp::json
#include <variant>       // std::{variant, get_if}

#include "GnomeMcp/Utils/Definitions.hpp"
#include "GnomeMcp/Utils/Types.hpp"

namespace gnome_mcp::core {
  namespace {
    using utils::types::f64;
    using utils::types::i64;
    using utils::types::Map;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u8;
    using utils::types::Vec;
  } // namespace

  /**
   * @enum CapabilityKind
   * @brief Whether a capability is invoked (tool) or read (resource).
   */
  enum class CapabilityKind : u8 {
    Resource,
    Tool,
  };

  /**
   * @enum ValueType
   * @brief Declared type of an option or an input parameter.
   */
  enum class ValueType : u8 {
    Boolean,
    Integer,
    Number,
    String,
  };

  /**
   * @enum HandlerId
   * @brief Static identifier binding a descriptor to its handler implementation.
   */
  enum class HandlerId : u8 {
    SystemInfo,
    Applications,
    Calendar,
    Tasks,
    Contacts,
    AudioStatus,
    SendNotification,
    LaunchApplication,
    OpenFile,
    SetWallpaper,
    SetVolume,
    MediaControl,
    QuickSettings,
    TakeScreenshot,
    WindowManagement,
    KeyringManagement,
  };

  using OptionValue = std::variant<bool, i64, f64, String>;

  /**
   * @struct OptionSpec
   * @brief A configurable option of a capability, with its compiled-in default.
   */
  struct OptionSpec {
    String      name;
    ValueType   type;
    OptionValue defaultValue;
    bool        nonNegative = false; ///< Reject negative overrides.
    Option<i64> maximum;             ///< Largest accepted integer override.
  };

  /**
   * @struct ParamSpec
   * @brief One input parameter accepted by a tool.
   */
  struct ParamSpec {
    String      name;
    ValueType   type;
    bool        required = false;
    String      description;
    Vec<String> allowed;       ///< Allowed values for enumerated strings, empty when free-form.
    Option<f64> minimum = None; ///< Inclusive lower bound for numeric parameters.
    Option<f64> maximum = None; ///< Inclusive upper bound for numeric parameters.
  };

  /**
   * @struct CapabilityDescriptor
   * @brief Compiled-in description of a tool or resource.
   */
  struct CapabilityDescriptor {
    String          name;
    CapabilityKind  kind;
    String          configKey; ///< Key of the `[tools.*]` / `[resources.*]` entry that enables it.
    String          description;
    Option<String>  uri;       ///< Resource URI, None for tools.
    Vec<OptionSpec> options;
    Vec<ParamSpec>  params;
    HandlerId       handler;
  };

  /**
   * @class ResolvedOptions
   * @brief Option values of an enabled capability: defaults overridden by the configuration.
   *
   * Values are stored with their declared type, so the getters never convert
   * between unrelated types. A name that was never declared yields the
   * type's zero value.
   */
  class ResolvedOptions {
   public:
    ResolvedOptions() = default;

    explicit ResolvedOptions(Map<String, OptionValue> values)
      : m_values(std::move(values)) {}

    [[nodiscard]] fn getBool(StringView name) const -> bool;
    [[nodiscard]] fn getInteger(StringView name) const -> i64;
    [[nodiscard]] fn getNumber(StringView name) const -> f64;
    [[nodiscard]] fn getString(StringView name) const -> String;

    [[nodiscard]] fn values() const -> const Map<String, OptionValue>& {
      return m_values;
    }

    /**
     * @brief The options as a JSON object, for `--list`.
     */
    [[nodiscard]] fn toJson() const -> mcp::json;

   private:
    Map<String, OptionValue> m_values;
  };

  /**
   * @class Arguments
   * @brief Validated and normalised arguments of a request.
   *
   * Every value present has already been coerced to its declared type, and
   * undeclared arguments are gone.
   */
  class Arguments {
   public:
    Arguments()
      : m_values(mcp::json::object()) {}

    explicit Arguments(mcp::json values)
      : m_values(std::move(values)) {}

    [[nodiscard]] fn has(const String& name) const -> bool {
      return m_values.contains(name);
    }

    [[nodiscard]] fn getString(const String& name) const -> Option<String>;
    [[nodiscard]] fn getBool(const String& name) const -> Option<bool>;
    [[nodiscard]] fn getInteger(const String& name) const -> Option<i64>;
    [[nodiscard]] fn getNumber(const String& name) const -> Option<f64>;

    [[nodiscard]] fn json() const -> const mcp::json& {
      return m_values;
    }

   private:
    mcp::json m_values;
  };

  /**
   * @struct EnabledCapability
   * @brief A descriptor that survived the enablement policy, with its resolved options.
   */
  struct EnabledCapability {
    const CapabilityDescriptor* descriptor;
    ResolvedOptions             options;
  };

  /**
   * @brief The fixed catalog, in listing order (resources first, then tools).
   */
  fn Catalog() -> const Vec<CapabilityDescriptor>&;
} // namespace gnome_mcp::core
