#pragma once

#include "GnomeMcp/Providers/Desktop.hpp"
#include "GnomeMcp/Utils/Types.hpp"

#include "Session.hpp"

namespace gnome_mcp::providers::gnome {
  using SessionPtr = utils::types::SharedPointer<Session>;

  /// Backend kinds of an Evolution Data Server source.
  enum class SourceKind : utils::types::u8 {
    Calendar,
    TaskList,
    AddressBook,
  };

  /**
   * @brief Parses the `[Desktop Entry]` group of a .desktop file.
   * @return None for entries that are hidden, NoDisplay, or not applications.
   */
  fn ParseDesktopEntry(utils::types::StringView content, const utils::types::String& desktopId) -> utils::types::Option<ApplicationInfo>;

  /**
   * @brief Parses `wpctl get-volume` output ("Volume: 0.45 [MUTED]").
   */
  fn ParseWpctlVolume(utils::types::StringView output) -> utils::types::Result<VolumeState>;

  /**
   * @brief Maps an org.gnome.Shell.Eval reply onto a result.
   * An empty failure means unsafe mode is off and becomes PermissionDenied.
   */
  fn InterpretEvalReply(bool success, const utils::types::String& result) -> utils::types::Result<utils::types::String>;

  /**
   * @brief Decodes the JSON window list produced by the Shell script.
   */
  fn DecodeWindowList(const utils::types::String& json) -> utils::types::Result<utils::types::Vec<WindowInfo>>;

  /**
   * @brief Reads the backend kind from an EDS source's key-file data.
   * @return None for disabled sources and sources with no calendar, task list or address book.
   */
  fn ParseSourceData(utils::types::StringView data) -> utils::types::Option<SourceKind>;

  // Desktop.cpp
  fn MakeNotificationProvider(SessionPtr session) -> utils::types::SharedPointer<INotificationProvider>;
  fn MakeFileOpener(SessionPtr session) -> utils::types::SharedPointer<IFileOpener>;
  fn MakeWallpaperProvider(SessionPtr session) -> utils::types::SharedPointer<IWallpaperProvider>;
  fn MakeScreenshotService(SessionPtr session) -> utils::types::SharedPointer<IScreenshotService>;
  fn MakeQuickSettings(SessionPtr session) -> utils::types::SharedPointer<IQuickSettings>;

  // Applications.cpp
  fn MakeApplicationProvider(SessionPtr session) -> utils::types::SharedPointer<IApplicationProvider>;

  // Audio.cpp
  fn MakeAudioMixer(SessionPtr session) -> utils::types::SharedPointer<IAudioMixer>;
  fn MakeMediaController(SessionPtr session) -> utils::types::SharedPointer<IMediaController>;

  // Windows.cpp
  fn MakeWindowManager(SessionPtr session) -> utils::types::SharedPointer<IWindowManager>;

  // Secrets.cpp
  fn MakeSecretStore(SessionPtr session) -> utils::types::SharedPointer<ISecretStore>;

  // SystemInfo.cpp
  fn MakeSystemInfoProvider(SessionPtr session) -> utils::types::SharedPointer<ISystemInfoProvider>;

  // Evolution.cpp
  fn MakePersonalDataProvider(SessionPtr session) -> utils::types::SharedPointer<IPersonalDataProvider>;
} // namespace gnome_mcp::providers::gnome
