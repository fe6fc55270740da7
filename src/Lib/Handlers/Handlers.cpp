#include "GnomeMcp/Handlers/Handlers.hpp"

#include <magic_enum/magic_enum.hpp> // magic_enum::enum_values
#include <matchit.hpp>               // matchit::{match, is, _}

#include "Factories.hpp"

using gnome_mcp::core::HandlerId;
using gnome_mcp::core::HandlerTable;
using gnome_mcp::providers::DesktopProviders;

namespace gnome_mcp::handlers {
  fn MakeHandler(const HandlerId handler, const DesktopProviders& providers) -> HandlerPtr {
    using matchit::match, matchit::is, matchit::_;
    using enum HandlerId;

    return match(handler)(
      is | SystemInfo        = [&] { return MakeSystemInfo(providers.systemInfo); },
      is | Applications      = [&] { return MakeApplications(providers.applications); },
      is | Calendar          = [&] { return MakeCalendar(providers.personalData); },
      is | Tasks             = [&] { return MakeTasks(providers.personalData); },
      is | Contacts          = [&] { return MakeContacts(providers.personalData); },
      is | AudioStatus       = [&] { return MakeAudioStatus(providers.audio, providers.media); },
      is | SendNotification  = [&] { return MakeSendNotification(providers.notifications); },
      is | LaunchApplication = [&] { return MakeLaunchApplication(providers.applications); },
      is | OpenFile          = [&] { return MakeOpenFile(providers.fileOpener); },
      is | SetWallpaper      = [&] { return MakeSetWallpaper(providers.wallpaper); },
      is | SetVolume         = [&] { return MakeSetVolume(providers.audio); },
      is | MediaControl      = [&] { return MakeMediaControl(providers.media); },
      is | QuickSettings     = [&] { return MakeQuickSettings(providers.quickSettings); },
      is | TakeScreenshot    = [&] { return MakeTakeScreenshot(providers.screenshot); },
      is | WindowManagement  = [&] { return MakeWindowManagement(providers.windows); },
      is | KeyringManagement = [&] { return MakeKeyringManagement(providers.secrets); },
      is | _                 = [&] { return HandlerPtr {}; }
    );
  }

  fn MakeHandlerTable(const DesktopProviders& providers) -> HandlerTable {
    HandlerTable table;

    for (const HandlerId handler : magic_enum::enum_values<HandlerId>())
      table.emplace(handler, MakeHandler(handler, providers));

    return table;
  }
} // namespace gnome_mcp::handlers
