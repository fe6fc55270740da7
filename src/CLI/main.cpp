#include <cstdlib>  // EXIT_FAILURE, EXIT_SUCCESS
#include <iostream> // std::{cin, cout}

#include "GnomeMcp/Config/Config.hpp"
#include "GnomeMcp/Core/Registry.hpp"
#include "GnomeMcp/Core/Router.hpp"
#include "GnomeMcp/Handlers/Handlers.hpp"
#include "GnomeMcp/Providers/Linux.hpp"
#include "GnomeMcp/Server/StdioServer.hpp"
#include "GnomeMcp/Utils/ArgumentParser.hpp"
#include "GnomeMcp/Utils/Definitions.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Logging.hpp"
#include "GnomeMcp/Utils/Types.hpp"

using namespace gnome_mcp::utils::types;
using namespace gnome_mcp::utils::logging;

namespace {
  constexpr PCStr SERVER_NAME = "gnome-mcp-server";

  fn PrintCatalog(const gnome_mcp::core::CapabilityRegistry& registry) -> void {
    std::cout << "Resources:\n";

    for (const gnome_mcp::core::EnabledCapability& resource : registry.resources())
      std::cout << std::format("  {:<20} {}\n", resource.descriptor->name, resource.descriptor->uri.value_or(""));

    std::cout << "Tools:\n";

    for (const gnome_mcp::core::EnabledCapability& tool : registry.tools())
      std::cout << std::format("  {:<20} {}\n", tool.descriptor->name, tool.descriptor->description);

    std::cout.flush();
  }
} // namespace

fn main(const i32 argc, const char* argv[]) -> i32 try {
  Option<std::filesystem::path> configPath;
  bool                          listOnly = false;

  {
    using gnome_mcp::utils::argparse::ArgumentParser, gnome_mcp::utils::argparse::ParseAction;

    ArgumentParser parser(SERVER_NAME, GMCP_VERSION);

    parser
      .addArguments("--config")
      .help("Read the configuration from this file instead of searching the default locations.")
      .defaultValue(String(""));

    parser
      .addArguments("-l", "--log-level")
      .help("Set the minimum log level.")
      .defaultValue(LogLevel::Info);

    parser
      .addArguments("-V", "--verbose")
      .help("Enable verbose logging. Overrides --log-level.")
      .flag();

    parser
      .addArguments("--list")
      .help("Print the enabled tools and resources, then exit.")
      .flag();

    Result<ParseAction> action = parser.parseArgs({ argv, static_cast<usize>(argc) });

    if (!action) {
      error_at(action.error());
      std::cout << parser.helpText();
      return EXIT_FAILURE;
    }

    if (*action == ParseAction::ShowHelp) {
      std::cout << parser.helpText();
      return EXIT_SUCCESS;
    }

    if (*action == ParseAction::ShowVersion) {
      std::cout << std::format("{} {}\n", SERVER_NAME, parser.version());
      return EXIT_SUCCESS;
    }

    if (const String path = parser.get<String>("--config"); !path.empty())
      configPath = path;

    listOnly = parser.get<bool>("--list");

    SetRuntimeLogLevel(parser.get<bool>("--verbose") ? LogLevel::Debug : parser.getEnum<LogLevel>("--log-level"));
  }

  using namespace gnome_mcp;

  const config::ConfigResolver resolver = config::ConfigResolver::forCommandLine(configPath);

  Result<config::EffectiveConfig> effective = resolver.resolve();

  if (!effective) {
    error_at(effective.error());
    return EXIT_FAILURE;
  }

  Result<core::CapabilityRegistry> registry = core::CapabilityRegistry::build(*effective);

  if (!registry) {
    error_at(registry.error());
    return EXIT_FAILURE;
  }

  if (listOnly) {
    PrintCatalog(*registry);
    return EXIT_SUCCESS;
  }

  info_log("Serving {} tools and {} resources", registry->tools().size(), registry->resources().size());

  const providers::DesktopProviders desktop = providers::MakeLinuxProviders(effective->server);

  const core::RequestRouter router(*registry, handlers::MakeHandlerTable(desktop));

  const server::StdioServer server(SERVER_NAME, GMCP_VERSION, router);

  return server.run(std::cin, std::cout);
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
