#include "GnomeMcp/Core/Capability.hpp"

using namespace gnome_mcp::utils::types;

namespace {
  template <typename T>
  fn Lookup(const Map<String, gnome_mcp::core::OptionValue>& values, const StringView name) -> Option<T> {
    for (const auto& [key, value] : values)
      if (key == name)
        if (const T* held = std::get_if<T>(&value))
          return *held;

    return None;
  }
} // namespace

namespace gnome_mcp::core {
  fn ResolvedOptions::getBool(const StringView name) const -> bool {
    return Lookup<bool>(m_values, name).value_or(false);
  }

  fn ResolvedOptions::getInteger(const StringView name) const -> i64 {
    return Lookup<i64>(m_values, name).value_or(0);
  }

  fn ResolvedOptions::getNumber(const StringView name) const -> f64 {
    if (Option<f64> number = Lookup<f64>(m_values, name))
      return *number;

    return static_cast<f64>(Lookup<i64>(m_values, name).value_or(0));
  }

  fn ResolvedOptions::getString(const StringView name) const -> String {
    return Lookup<String>(m_values, name).value_or(String {});
  }

  fn ResolvedOptions::toJson() const -> mcp::json {
    mcp::json out = mcp::json::object();

    for (const auto& [key, value] : m_values)
      std::visit([&](const auto& held) { out[key] = held; }, value);

    return out;
  }

  fn Arguments::getString(const String& name) const -> Option<String> {
    if (const auto iter = m_values.find(name); iter != m_values.end() && iter->is_string())
      return iter->get<String>();

    return None;
  }

  fn Arguments::getBool(const String& name) const -> Option<bool> {
    if (const auto iter = m_values.find(name); iter != m_values.end() && iter->is_boolean())
      return iter->get<bool>();

    return None;
  }

  fn Arguments::getInteger(const String& name) const -> Option<i64> {
    if (const auto iter = m_values.find(name); iter != m_values.end() && iter->is_number_integer())
      return iter->get<i64>();

    return None;
  }

  fn Arguments::getNumber(const String& name) const -> Option<f64> {
    if (const auto iter = m_values.find(name); iter != m_values.end() && iter->is_number())
      return iter->get<f64>();

    return None;
  }
} // namespace gnome_mcp::core
