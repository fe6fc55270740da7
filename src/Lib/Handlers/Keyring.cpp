#include <glaze/json/read.hpp> // glz::read

#include "GnomeMcp/Handlers/Handlers.hpp"
#include "GnomeMcp/Utils/Logging.hpp"

#include "Factories.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::core::Arguments;
using gnome_mcp::core::ICapabilityHandler;
using gnome_mcp::core::ResolvedOptions;
using gnome_mcp::providers::SecretAttributes;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace gnome_mcp::handlers {
  namespace {
    using providers::ISecretStore;
    using providers::SecretItem;

    class KeyringManagementHandler final : public ICapabilityHandler {
     public:
      explicit KeyringManagementHandler(SharedPointer<ISecretStore> secrets)
        : m_secrets(std::move(secrets)) {}

      fn invoke(const Arguments& args, const ResolvedOptions& /*options*/) -> Result<mcp::json> override {
        const String action = args.getString("action").value_or("");

        Result<SecretAttributes> attributes = ParseSecretAttributes(args.getString("attributes"));

        if (!attributes)
          return Err(attributes.error());

        if (action == "store")
          return store(args, *attributes);

        if (action != "retrieve" && action != "delete")
          ERR_FMT(InvalidArgument, "Unknown keyring action '{}'", action);

        if (attributes->empty())
          ERR_FMT(InvalidArgument, "attributes required for {} action", action);

        Result<ISecretStore*> secrets = Require(m_secrets, "secret store");

        if (!secrets)
          return Err(secrets.error());

        if (action == "retrieve") {
          Result<SecretItem> item = (*secrets)->retrieve(*attributes);

          if (!item)
            return Err(item.error());

          return mcp::json {
            {      "label", item->label },
            {     "secret", item->secret },
            { "attributes", item->attributes },
          };
        }

        Result<String> label = (*secrets)->remove(*attributes);

        if (!label)
          return Err(label.error());

        return mcp::json {
          { "message", std::format("Deleted secret '{}'", *label) },
          {   "label", *label },
        };
      }

     private:
      SharedPointer<ISecretStore> m_secrets;

      fn store(const Arguments& args, const SecretAttributes& attributes) -> Result<mcp::json> {
        const Option<String> label  = args.getString("label");
        const Option<String> secret = args.getString("secret");

        if (!label)
          ERR(InvalidArgument, "label required for store action");

        if (!secret)
          ERR(InvalidArgument, "secret required for store action");

        Result<ISecretStore*> secrets = Require(m_secrets, "secret store");

        if (!secrets)
          return Err(secrets.error());

        Result<String> item = (*secrets)->store(*label, *secret, attributes);

        if (!item)
          return Err(item.error());

        return mcp::json {
          { "message", std::format("Stored secret '{}'", *label) },
          {    "item", *item },
        };
      }
    };
  } // namespace

  fn ParseSecretAttributes(const Option<String>& encoded) -> Result<SecretAttributes> {
    using glz::error_ctx, glz::read, glz::error_code;

    SecretAttributes attributes;

    if (!encoded || encoded->empty())
      return attributes;

    if (const error_ctx errc = read<glz::opts {}>(attributes, *encoded); errc.ec != error_code::none)
      ERR_FMT(InvalidArgument, "attributes must be a JSON object of string values: {}", glz::format_error(errc, *encoded));

    return attributes;
  }

  fn MakeKeyringManagement(SharedPointer<ISecretStore> secrets) -> HandlerPtr {
    return std::make_unique<KeyringManagementHandler>(std::move(secrets));
  }
} // namespace gnome_mcp::handlers
