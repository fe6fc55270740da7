#include "GnomeMcp/Providers/Linux.hpp"

#include "Factories.hpp"

namespace gnome_mcp::providers {
  fn MakeLinuxProviders(const config::ServerSettings& settings) -> DesktopProviders {
    using namespace gnome;

    const SessionPtr session = std::make_shared<Session>(settings);

    return DesktopProviders {
      .notifications = MakeNotificationProvider(session),
      .applications  = MakeApplicationProvider(session),
      .fileOpener    = MakeFileOpener(session),
      .wallpaper     = MakeWallpaperProvider(session),
      .audio         = MakeAudioMixer(session),
      .media         = MakeMediaController(session),
      .quickSettings = MakeQuickSettings(session),
      .screenshot    = MakeScreenshotService(session),
      .windows       = MakeWindowManager(session),
      .secrets       = MakeSecretStore(session),
      .systemInfo    = MakeSystemInfoProvider(session),
      .personalData  = MakePersonalDataProvider(session),
    };
  }
} // namespace gnome_mcp::providers
