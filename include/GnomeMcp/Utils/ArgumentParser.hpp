/**
 * @file ArgumentParser.hpp
 * @brief Small command-line argument parser for the server binary.
 *
 * Supports flags, valued options and enum-backed options whose allowed
 * values come from magic_enum. Help and version requests are reported to the
 * caller instead of exiting, since the caller owns stdout.
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform}
#include <cctype>                    // std::tolower
#include <concepts>                  // std::convertible_to
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_name, enum_cast, enum_values}
#include <utility>                   // std::forward
#include <variant>                   // std::{variant, get, holds_alternative}

#include "Error.hpp"
#include "Types.hpp"

namespace gnome_mcp::utils::argparse {
  namespace {
    using error::GmcpError;
    using error::GmcpErrorCode;

    using types::Err;
    using types::Map;
    using types::Option;
    using types::Result;
    using types::Span;
    using types::String;
    using types::StringView;
    using types::u8;
    using types::UniquePointer;
    using types::Unit;
    using types::usize;
    using types::Vec;

    inline fn EqualsIgnoreCase(const StringView lhs, const StringView rhs) -> bool {
      return std::ranges::equal(lhs, rhs, [](const char charA, const char charB) {
        return std::tolower(static_cast<unsigned char>(charA)) == std::tolower(static_cast<unsigned char>(charB));
      });
    }

    inline fn ToLower(String text) -> String {
      std::ranges::transform(text, text.begin(), [](const char character) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
      });
      return text;
    }
  } // namespace

  using ArgValue   = std::variant<bool, String>;
  using ArgChoices = Vec<String>;

  /**
   * @brief What the caller should do after a successful parse.
   */
  enum class ParseAction : u8 {
    Run,         ///< Continue normally.
    ShowHelp,    ///< `-h/--help` was given.
    ShowVersion, ///< `-v/--version` was given.
  };

  /**
   * @brief String conversion for scoped enums through magic_enum.
   * @tparam EnumType The enum type
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static fn getChoices() -> ArgChoices {
      ArgChoices choices;

      for (const EnumType value : magic_enum::enum_values<EnumType>())
        choices.emplace_back(magic_enum::enum_name(value));

      return choices;
    }

    static fn stringToEnum(const StringView str) -> EnumType {
      for (const EnumType value : magic_enum::enum_values<EnumType>())
        if (EqualsIgnoreCase(str, magic_enum::enum_name(value)))
          return value;

      return magic_enum::enum_values<EnumType>()[0];
    }
  };

  /**
   * @brief A single command-line option with its aliases, help and value.
   */
  class Argument {
   public:
    explicit Argument(Vec<String> names)
      : m_names(std::move(names)) {}

    fn help(String help_text) -> Argument& {
      m_helpText = std::move(help_text);
      return *this;
    }

    fn flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    fn defaultValue(String value) -> Argument& {
      m_defaultValue = std::move(value);
      return *this;
    }

    /**
     * @brief Sets an enum default; the enum's names become the allowed values.
     */
    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    fn defaultValue(const EnumType value) -> Argument& {
      m_defaultValue = String(magic_enum::enum_name(value));
      m_choices      = EnumTraits<EnumType>::getChoices();
      return *this;
    }

    template <typename T>
    [[nodiscard]] fn get() const -> T {
      if (m_value && std::holds_alternative<T>(*m_value))
        return std::get<T>(*m_value);

      if (m_defaultValue && std::holds_alternative<T>(*m_defaultValue))
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    [[nodiscard]] fn isUsed() const -> bool {
      return m_value.has_value();
    }

    [[nodiscard]] fn isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] fn names() const -> const Vec<String>& {
      return m_names;
    }

    [[nodiscard]] fn helpText() const -> const String& {
      return m_helpText;
    }

    [[nodiscard]] fn choices() const -> const Option<ArgChoices>& {
      return m_choices;
    }

    fn markUsed() -> Unit {
      m_value = true;
    }

    fn setValue(String value) -> Result<> {
      if (m_choices) {
        const bool allowed = std::ranges::any_of(*m_choices, [&](const String& choice) { return EqualsIgnoreCase(value, choice); });

        if (!allowed) {
          String joined;
          for (const String& choice : *m_choices)
            joined += (joined.empty() ? "" : ", ") + ToLower(choice);

          return Err(GmcpError(
            GmcpErrorCode::InvalidArgument,
            std::format("Invalid value '{}' for argument '{}'. Allowed values: {}", value, m_names.front(), joined)
          ));
        }
      }

      m_value = std::move(value);
      return {};
    }

   private:
    Vec<String>        m_names;
    String             m_helpText;
    Option<ArgValue>   m_value;
    Option<ArgValue>   m_defaultValue;
    Option<ArgChoices> m_choices;
    bool               m_isFlag = false;
  };

  /**
   * @brief Collects arguments and parses argv against them.
   */
  class ArgumentParser {
   public:
    explicit ArgumentParser(String programName, String version)
      : m_programName(std::move(programName)), m_version(std::move(version)) {
      addArguments("-h", "--help").help("Show this help message and exit").flag();
      addArguments("-v", "--version").help("Show version information and exit").flag();
    }

    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    fn addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(Vec<String> { String(std::forward<NameTs>(names))... }));
      Argument& arg = *m_arguments.back();

      for (const String& name : arg.names())
        m_argumentMap[name] = &arg;

      return arg;
    }

    fn parseArgs(const Span<const char* const> args) -> Result<ParseAction> {
      for (usize i = 1; i < args.size(); ++i) {
        const String current = args[i];

        if (current == "-h" || current == "--help")
          return ParseAction::ShowHelp;

        if (current == "-v" || current == "--version")
          return ParseAction::ShowVersion;

        // --name=value form
        String name = current;
        Option<String> inlineValue;

        if (const usize eq = current.find('='); current.starts_with("--") && eq != String::npos) {
          name        = current.substr(0, eq);
          inlineValue = current.substr(eq + 1);
        }

        const auto iter = m_argumentMap.find(name);

        if (iter == m_argumentMap.end())
          return Err(GmcpError(GmcpErrorCode::InvalidArgument, std::format("Unknown argument: {}", current)));

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          if (inlineValue)
            return Err(GmcpError(GmcpErrorCode::InvalidArgument, std::format("Flag {} does not take a value", name)));

          argument->markUsed();
          continue;
        }

        if (!inlineValue) {
          if (i + 1 >= args.size())
            return Err(GmcpError(GmcpErrorCode::InvalidArgument, std::format("Argument {} requires a value", name)));

          inlineValue = args[++i];
        }

        if (Result<> result = argument->setValue(std::move(*inlineValue)); !result)
          return Err(result.error());
      }

      return ParseAction::Run;
    }

    template <typename T = String>
    [[nodiscard]] fn get(const StringView name) const -> T {
      if (const auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->get<T>();

      return T {};
    }

    template <typename EnumType>
    [[nodiscard]] fn getEnum(const StringView name) const -> EnumType {
      return EnumTraits<EnumType>::stringToEnum(get<String>(name));
    }

    [[nodiscard]] fn isUsed(const StringView name) const -> bool {
      if (const auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->isUsed();

      return false;
    }

    [[nodiscard]] fn version() const -> const String& {
      return m_version;
    }

    [[nodiscard]] fn helpText() const -> String {
      String text = std::format("Usage: {}", m_programName);

      for (const UniquePointer<Argument>& arg : m_arguments)
        text += std::format(" [{}{}]", arg->names().front(), arg->isFlag() ? "" : " VALUE");

      text += "\n\nArguments:\n";

      for (const UniquePointer<Argument>& arg : m_arguments) {
        String names;
        for (const String& name : arg->names())
          names += (names.empty() ? "" : ", ") + name;

        text += std::format("  {}{}\n", names, arg->isFlag() ? "" : " VALUE");

        if (!arg->helpText().empty())
          text += std::format("    {}\n", arg->helpText());

        if (arg->choices()) {
          String joined;
          for (const String& choice : *arg->choices())
            joined += (joined.empty() ? "" : ", ") + ToLower(choice);

          text += std::format("    Available values: {}\n", joined);
        }
      }

      return text;
    }

   private:
    String                                        m_programName;
    String                                        m_version;
    Vec<UniquePointer<Argument>>                  m_arguments;
    Map<String, Argument*, std::less<>>           m_argumentMap;
  };
} // namespace gnome_mcp::utils::argparse
