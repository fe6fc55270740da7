#pragma once

#include <glaze/core/common.hpp> // object
#include <glaze/core/meta.hpp>   // Object

#include "GnomeMcp/Providers/PersonalData.hpp"
#include "GnomeMcp/Utils/Definitions.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

namespace gnome_mcp::providers {
  namespace {
    using utils::types::i64;
    using utils::types::Map;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::String;
    using utils::types::u32;
    using utils::types::u64;
    using utils::types::u8;
    using utils::types::Unit;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief Declares the copy/move/destructor boilerplate shared by every provider interface.
   */
#define GMCP_PROVIDER_INTERFACE(Name)                  \
 public:                                               \
  Name(const Name&)                = delete;           \
  Name(Name&&)                     = delete;           \
  fn operator=(const Name&)->Name& = delete;           \
  fn operator=(Name&&)->Name&      = delete;           \
  virtual ~Name()                  = default;          \
                                                       \
 protected:                                            \
  Name()                           = default;          \
                                                       \
 public:

  /**
   * @struct ApplicationInfo
   * @brief An installed desktop entry.
   */
  struct ApplicationInfo {
    String         id;   ///< Desktop file id, e.g. `org.gnome.Nautilus`.
    String         name; ///< Display name.
    Option<String> description;
    Option<String> exec;
    Option<String> icon;
    Vec<String>    categories;
  };

  struct VolumeState {
    i64  level; ///< 0-100, may exceed 100 when over-amplified.
    bool muted;
  };

  /**
   * @struct PlayerInfo
   * @brief An MPRIS media player on the session bus.
   */
  struct PlayerInfo {
    String         busName;
    Option<String> identity;
    Option<String> playbackStatus;
    Option<String> title;
    Vec<String>    artists;
    Option<String> album;
  };

  enum class MediaAction : u8 {
    Play,
    Pause,
    PlayPause,
    Stop,
    Next,
    Previous,
  };

  enum class QuickSetting : u8 {
    Wifi,
    Bluetooth,
    NightLight,
    DoNotDisturb,
    DarkStyle,
  };

  enum class SnapSide : u8 {
    Left,
    Right,
  };

  /**
   * @struct WindowInfo
   * @brief A window as reported by GNOME Shell.
   */
  struct WindowInfo {
    u64    id;
    String title;
    String wmClass;
    i64    workspace;
    bool   minimized;
    bool   maximized;
    bool   focused;
  };

  struct WindowGeometry {
    i64 x;
    i64 y;
    i64 width;
    i64 height;
  };

  /**
   * @struct SecretItem
   * @brief A secret retrieved from the keyring.
   */
  struct SecretItem {
    String              path; ///< D-Bus object path of the item.
    String              label;
    String              secret;
    Map<String, String> attributes;
  };

  using SecretAttributes = Map<String, String>;

  /**
   * @struct SystemInfo
   * @brief Host and session details.
   */
  struct SystemInfo {
    String         osName;
    Option<String> osVersion;
    String         kernel;
    String         architecture;
    String         hostname;
    Option<String> desktop;
    Option<String> shellVersion;
    u64            uptimeSeconds;
    u64            totalMemoryBytes;
    u64            availableMemoryBytes;
  };

  class INotificationProvider {
    GMCP_PROVIDER_INTERFACE(INotificationProvider)

    /// Shows a notification and returns its server-assigned id.
    virtual fn notify(const String& summary, const String& body) -> Result<u32> = 0;
  };

  class IApplicationProvider {
    GMCP_PROVIDER_INTERFACE(IApplicationProvider)

    /// Installed applications, sorted by name.
    virtual fn listInstalled() -> Result<Vec<ApplicationInfo>> = 0;

    /// Launches the best match for `appName` and returns its desktop id.
    virtual fn launch(const String& appName) -> Result<String> = 0;
  };

  class IFileOpener {
    GMCP_PROVIDER_INTERFACE(IFileOpener)

    virtual fn open(const String& pathOrUri) -> Result<> = 0;
  };

  class IWallpaperProvider {
    GMCP_PROVIDER_INTERFACE(IWallpaperProvider)

    virtual fn setWallpaper(const String& imagePath) -> Result<> = 0;
  };

  class IAudioMixer {
    GMCP_PROVIDER_INTERFACE(IAudioMixer)

    virtual fn getVolume() -> Result<VolumeState> = 0;
    virtual fn setVolume(i64 level) -> Result<>   = 0;
    virtual fn setMute(bool muted) -> Result<>    = 0;
  };

  class IMediaController {
    GMCP_PROVIDER_INTERFACE(IMediaController)

    virtual fn listPlayers() -> Result<Vec<PlayerInfo>> = 0;

    /**
     * @brief Sends a playback command.
     * @param player Case-insensitive substring of the bus name; the first player when None.
     * @return Bus name of the player that received the command.
     */
    virtual fn sendMediaCommand(MediaAction action, const Option<String>& player) -> Result<String> = 0;
  };

  class IQuickSettings {
    GMCP_PROVIDER_INTERFACE(IQuickSettings)

    virtual fn setToggle(QuickSetting setting, bool enabled) -> Result<> = 0;
  };

  class IScreenshotService {
    GMCP_PROVIDER_INTERFACE(IScreenshotService)

    /// Takes a screenshot and returns the URI of the saved image.
    virtual fn capture(bool interactive) -> Result<String> = 0;
  };

  class IWindowManager {
    GMCP_PROVIDER_INTERFACE(IWindowManager)

    virtual fn listWindows() -> Result<Vec<WindowInfo>>                                    = 0;
    virtual fn focus(u64 windowId) -> Result<>                                             = 0;
    virtual fn close(u64 windowId) -> Result<>                                             = 0;
    virtual fn minimize(u64 windowId) -> Result<>                                          = 0;
    virtual fn toggleMaximize(u64 windowId) -> Result<>                                    = 0;
    virtual fn switchWorkspace(i64 workspace) -> Result<>                                  = 0;
    virtual fn moveToWorkspace(u64 windowId, i64 workspace) -> Result<>                    = 0;
    virtual fn getGeometry(u64 windowId) -> Result<WindowGeometry>                         = 0;
    virtual fn setGeometry(u64 windowId, const WindowGeometry& geometry) -> Result<>       = 0;
    virtual fn setPosition(u64 windowId, i64 x, i64 y) -> Result<>                         = 0;
    virtual fn setSize(u64 windowId, i64 width, i64 height) -> Result<>                    = 0;

    /// Tiles a window to one half of its monitor's work area; the focused window when None.
    virtual fn snap(const Option<u64>& windowId, SnapSide side) -> Result<> = 0;
  };

  class ISecretStore {
    GMCP_PROVIDER_INTERFACE(ISecretStore)

    /// Stores (or replaces) a secret; returns the item path.
    virtual fn store(const String& label, const String& secret, const SecretAttributes& attributes) -> Result<String> = 0;

    /// First item matching every attribute. NotFound when nothing matches.
    virtual fn retrieve(const SecretAttributes& attributes) -> Result<SecretItem> = 0;

    /// Deletes the first item matching every attribute; returns its label.
    virtual fn remove(const SecretAttributes& attributes) -> Result<String> = 0;
  };

  class ISystemInfoProvider {
    GMCP_PROVIDER_INTERFACE(ISystemInfoProvider)

    virtual fn getSystemInfo() -> Result<SystemInfo> = 0;
  };

  class IPersonalDataProvider {
    GMCP_PROVIDER_INTERFACE(IPersonalDataProvider)

    /// Events of every enabled calendar overlapping [from, to].
    virtual fn listEvents(const Timestamp& from, const Timestamp& to) -> Result<Vec<Event>> = 0;
    virtual fn listTasks() -> Result<Vec<Task>>                                             = 0;
    virtual fn listContacts() -> Result<Vec<Contact>>                                       = 0;
  };

#undef GMCP_PROVIDER_INTERFACE

  /**
   * @struct DesktopProviders
   * @brief Every provider the handlers may use. A handler whose provider is
   * null reports ApiUnavailable.
   */
  struct DesktopProviders {
    SharedPointer<INotificationProvider> notifications;
    SharedPointer<IApplicationProvider>  applications;
    SharedPointer<IFileOpener>           fileOpener;
    SharedPointer<IWallpaperProvider>    wallpaper;
    SharedPointer<IAudioMixer>           audio;
    SharedPointer<IMediaController>      media;
    SharedPointer<IQuickSettings>        quickSettings;
    SharedPointer<IScreenshotService>    screenshot;
    SharedPointer<IWindowManager>        windows;
    SharedPointer<ISecretStore>          secrets;
    SharedPointer<ISystemInfoProvider>   systemInfo;
    SharedPointer<IPersonalDataProvider> personalData;
  };
} // namespace gnome_mcp::providers

template <>
struct glz::meta<gnome_mcp::providers::WindowInfo> {
  using T = gnome_mcp::providers::WindowInfo;

  // clang-format off
  static constexpr detail::Object value = object(
    "id",        &T::id,
    "title",     &T::title,
    "wm_class",  &T::wmClass,
    "workspace", &T::workspace,
    "minimized", &T::minimized,
    "maximized", &T::maximized,
    "focused",   &T::focused
  );
  // clang-format on
};

template <>
struct glz::meta<gnome_mcp::providers::WindowGeometry> {
  using T = gnome_mcp::providers::WindowGeometry;

  // clang-format off
  static constexpr detail::Object value = object(
    "x",      &T::x,
    "y",      &T::y,
    "width",  &T::width,
    "height", &T::height
  );
  // clang-format on
};
