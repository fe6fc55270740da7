#include "GnomeMcp/Core/Router.hpp"

#include <charconv>                  // std::from_chars
#include <cmath>                     // std::trunc, std::isfinite
#include <limits>                    // std::numeric_limits
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <matchit.hpp>               // matchit::{match, is, _}
#include <mcp_tool.h>                // mcp::{tool, tool_builder}

#include "GnomeMcp/Utils/Logging.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::utils::error::GmcpError;
using gnome_mcp::utils::error::GmcpErrorCode;

namespace {
  using gnome_mcp::core::ParamSpec;
  using gnome_mcp::core::ValueType;

  template <typename T>
  fn ParseNumber(const String& text) -> Option<T> {
    T value {};

    const char* begin = text.data();
    const char* end   = text.data() + text.size(); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto [ptr, errc] = std::from_chars(begin, end, value);

    if (text.empty() || errc != std::errc() || ptr != end)
      return None;

    return value;
  }

  fn Coerce(const ParamSpec& spec, const mcp::json& value) -> Result<mcp::json> {
    switch (spec.type) {
      case ValueType::String:
        if (value.is_string())
          return value;
        break;

      case ValueType::Boolean:
        if (value.is_boolean())
          return value;
        if (value.is_string() && value.get<String>() == "true")
          return mcp::json(true);
        if (value.is_string() && value.get<String>() == "false")
          return mcp::json(false);
        break;

      case ValueType::Integer:
        if (value.is_number_unsigned()) {
          if (value.get<u64>() > static_cast<u64>(std::numeric_limits<i64>::max()))
            ERR_FMT(GmcpErrorCode::InvalidArgument, "Value for '{}' is out of range", spec.name);
          return mcp::json(value.get<i64>());
        }
        if (value.is_number_integer())
          return mcp::json(value.get<i64>());
        if (value.is_number_float()) {
          // 2^63 is exact as a double, so this keeps the cast below defined.
          constexpr f64 LIMIT  = 9223372036854775808.0;
          const f64     number = value.get<f64>();

          if (std::isfinite(number) && std::trunc(number) == number) {
            if (number < -LIMIT || number >= LIMIT)
              ERR_FMT(GmcpErrorCode::InvalidArgument, "Value for '{}' is out of range", spec.name);
            return mcp::json(static_cast<i64>(number));
          }
        }
        if (value.is_string())
          if (Option<i64> parsed = ParseNumber<i64>(value.get<String>()))
            return mcp::json(*parsed);
        break;

      case ValueType::Number:
        if (value.is_number())
          return mcp::json(value.get<f64>());
        if (value.is_string())
          if (Option<f64> parsed = ParseNumber<f64>(value.get<String>()); parsed && std::isfinite(*parsed))
            return mcp::json(*parsed);
        break;
    }

    ERR_FMT(GmcpErrorCode::InvalidArgument, "Invalid type for '{}': expected {}", spec.name, magic_enum::enum_name(spec.type));
  }
} // namespace

namespace gnome_mcp::core {
  fn ValidateArguments(const CapabilityDescriptor& descriptor, const mcp::json& raw) -> Result<Arguments> {
    if (!raw.is_null() && !raw.is_object())
      ERR(GmcpErrorCode::InvalidArgument, "Arguments must be an object");

    mcp::json normalised = mcp::json::object();

    for (const ParamSpec& spec : descriptor.params) {
      const bool present = raw.is_object() && raw.contains(spec.name) && !raw.at(spec.name).is_null();

      if (!present) {
        if (spec.required)
          ERR_FMT(GmcpErrorCode::InvalidArgument, "Missing required parameter '{}'", spec.name);

        continue;
      }

      Result<mcp::json> value = Coerce(spec, raw.at(spec.name));

      if (!value)
        return Err(value.error());

      if (!spec.allowed.empty()) {
        const String text = value->get<String>();

        if (std::ranges::find(spec.allowed, text) == spec.allowed.end()) {
          String joined;
          for (const String& allowed : spec.allowed)
            joined += (joined.empty() ? "" : ", ") + allowed;

          ERR_FMT(GmcpErrorCode::InvalidArgument, "Invalid value '{}' for '{}'. Allowed values: {}", text, spec.name, joined);
        }
      }

      if (value->is_number()) {
        const f64 number = value->get<f64>();

        if (spec.minimum && number < *spec.minimum)
          ERR_FMT(GmcpErrorCode::InvalidArgument, "'{}' must be at least {}", spec.name, *spec.minimum);

        if (spec.maximum && number > *spec.maximum)
          ERR_FMT(GmcpErrorCode::InvalidArgument, "'{}' must be at most {}", spec.name, *spec.maximum);
      }

      normalised[spec.name] = std::move(*value);
    }

    return Arguments(std::move(normalised));
  }

  fn FailureFromError(const GmcpError& error) -> Failure {
    using matchit::match, matchit::is, matchit::_;
    using enum GmcpErrorCode;

    const FailureKind kind = match(error.code)(
      is | InvalidArgument    = FailureKind::InvalidArguments,
      is | Timeout            = FailureKind::ProviderTimeout,
      is | PermissionDenied   = FailureKind::PermissionDenied,
      is | CapabilityNotFound = FailureKind::CapabilityNotFound,
      is | _                  = FailureKind::ProviderError
    );

    return { .kind = kind, .message = error.message };
  }

  fn JsonRpcCode(const FailureKind kind) -> i32 {
    using matchit::match, matchit::is, matchit::_;
    using enum FailureKind;

    return match(kind)(
      is | InvalidArguments   = -32602,
      is | CapabilityNotFound = -32002,
      is | PermissionDenied   = -32003,
      is | ProviderTimeout    = -32001,
      is | _                  = -32000
    );
  }

  RequestRouter::RequestRouter(const CapabilityRegistry& registry, HandlerTable handlers)
    : m_registry(registry), m_handlers(std::move(handlers)) {}

  fn RequestRouter::handle(const Request& request) const -> Outcome {
    const bool isTool = request.kind == RequestKind::ToolCall;

    const EnabledCapability* capability = isTool ? m_registry.findTool(request.target) : m_registry.findResource(request.target);

    if (!capability)
      return Err(Failure {
        .kind    = FailureKind::CapabilityNotFound,
        .message = std::format("{} not found: {}", isTool ? "Tool" : "Resource", request.target),
      });

    Result<Arguments> args = ValidateArguments(*capability->descriptor, request.arguments);

    if (!args)
      return Err(Failure { .kind = FailureKind::InvalidArguments, .message = args.error().message });

    const auto handler = m_handlers.find(capability->descriptor->handler);

    if (handler == m_handlers.end() || !handler->second)
      return Err(Failure {
        .kind    = FailureKind::ProviderError,
        .message = std::format("No handler available for {}", capability->descriptor->name),
      });

    debug_log("Invoking {}", capability->descriptor->name);

    Result<mcp::json> result = handler->second->invoke(*args, capability->options);

    if (!result) {
      debug_at(result.error());
      return Err(FailureFromError(result.error()));
    }

    return std::move(*result);
  }

  fn RequestRouter::listTools() const -> mcp::json {
    mcp::json toolsArray = mcp::json::array();

    for (const EnabledCapability& capability : m_registry.tools()) {
      const CapabilityDescriptor& descriptor = *capability.descriptor;

      mcp::tool_builder builder(descriptor.name);
      builder.with_description(descriptor.description);

      for (const ParamSpec& spec : descriptor.params) {
        switch (spec.type) {
          case ValueType::String:  builder.with_string_param(spec.name, spec.description, spec.required); break;
          case ValueType::Boolean: builder.with_boolean_param(spec.name, spec.description, spec.required); break;
          case ValueType::Integer:
          case ValueType::Number:  builder.with_number_param(spec.name, spec.description, spec.required); break;
        }
      }

      mcp::tool tool = builder.build();

      for (const ParamSpec& spec : descriptor.params) {
        mcp::json& property = tool.parameters_schema["properties"][spec.name];

        if (spec.type == ValueType::Integer)
          property["type"] = "integer";

        if (!spec.allowed.empty())
          property["enum"] = spec.allowed;

        if (spec.minimum)
          property["minimum"] = *spec.minimum;

        if (spec.maximum)
          property["maximum"] = *spec.maximum;
      }

      toolsArray.push_back(tool.to_json());
    }

    return {
      { "tools", toolsArray },
    };
  }

  fn RequestRouter::listResources() const -> mcp::json {
    mcp::json resourcesArray = mcp::json::array();

    for (const EnabledCapability& capability : m_registry.resources()) {
      const CapabilityDescriptor& descriptor = *capability.descriptor;

      resourcesArray.push_back({
        {         "uri", descriptor.uri.value_or("") },
        {        "name", descriptor.name },
        { "description", descriptor.description },
        {    "mimeType", "application/json" },
      });
    }

    return {
      { "resources", resourcesArray },
    };
  }
} // namespace gnome_mcp::core
