#pragma once

#include <mcp_message.h> // mcp::json

#include "GnomeMcp/Core/Capability.hpp"
#include "GnomeMcp/Core/Registry.hpp"
#include "GnomeMcp/Utils/Definitions.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

namespace gnome_mcp::core {
  namespace {
    using utils::error::GmcpError;
    using utils::types::i32;
    using utils::types::Map;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u8;
    using utils::types::UniquePointer;
  } // namespace

  /**
   * @enum FailureKind
   * @brief Closed set of per-request failures reported to the client.
   */
  enum class FailureKind : u8 {
    CapabilityNotFound, ///< Unknown or disabled tool/resource.
    InvalidArguments,   ///< Arguments failed validation.
    ProviderError,      ///< The desktop service failed.
    ProviderTimeout,    ///< The desktop service did not answer in time.
    PermissionDenied,   ///< The desktop service refused the operation.
  };

  struct Failure {
    FailureKind kind;
    String      message;
  };

  using Outcome = Result<mcp::json, Failure>;

  enum class RequestKind : u8 {
    ToolCall,
    ResourceRead,
  };

  /**
   * @struct Request
   * @brief A decoded tool call or resource read.
   */
  struct Request {
    RequestKind kind;
    String      target;    ///< Tool name or resource URI.
    mcp::json   arguments; ///< Argument bag, null when absent.
  };

  /**
   * @class ICapabilityHandler
   * @brief Single interface implemented by every tool and resource.
   */
  class ICapabilityHandler {
   public:
    ICapabilityHandler(const ICapabilityHandler&) = delete;
    ICapabilityHandler(ICapabilityHandler&&)      = delete;

    fn operator=(const ICapabilityHandler&)->ICapabilityHandler& = delete;
    fn operator=(ICapabilityHandler&&)->ICapabilityHandler&      = delete;

    virtual ~ICapabilityHandler() = default;

    /**
     * @brief Runs the capability.
     * @param args Validated arguments.
     * @param options Options resolved from the configuration.
     * @return The JSON payload, or an error whose code is mapped to a FailureKind.
     */
    virtual fn invoke(const Arguments& args, const ResolvedOptions& options) -> Result<mcp::json> = 0;

   protected:
    ICapabilityHandler() = default;
  };

  using HandlerTable = Map<HandlerId, UniquePointer<ICapabilityHandler>>;

  /**
   * @brief Checks and normalises arguments against a descriptor's parameters.
   * @return The normalised arguments, or an InvalidArgument error naming the field.
   */
  fn ValidateArguments(const CapabilityDescriptor& descriptor, const mcp::json& raw) -> Result<Arguments>;

  /**
   * @brief Maps a handler error onto the failure taxonomy, keeping its message.
   */
  fn FailureFromError(const GmcpError& error) -> Failure;

  /**
   * @brief JSON-RPC error code reported for a failure kind.
   */
  fn JsonRpcCode(FailureKind kind) -> i32;

  /**
   * @class RequestRouter
   * @brief Routes requests to the handler of an enabled capability.
   *
   * Stateless: the registry and the handler table are fixed at construction.
   */
  class RequestRouter {
   public:
    RequestRouter(const CapabilityRegistry& registry, HandlerTable handlers);

    [[nodiscard]] fn handle(const Request& request) const -> Outcome;

    /// Body of a `tools/list` result.
    [[nodiscard]] fn listTools() const -> mcp::json;

    /// Body of a `resources/list` result.
    [[nodiscard]] fn listResources() const -> mcp::json;

   private:
    const CapabilityRegistry& m_registry;
    HandlerTable              m_handlers;
  };
} // namespace gnome_mcp::core
