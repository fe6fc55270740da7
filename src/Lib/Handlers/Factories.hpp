#pragma once

#include "GnomeMcp/Core/Router.hpp"
#include "GnomeMcp/Providers/Desktop.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

namespace gnome_mcp::handlers {
  using HandlerPtr = utils::types::UniquePointer<core::ICapabilityHandler>;

  /**
   * @brief Returns the provider, or ApiUnavailable when none was configured.
   */
  template <typename Provider>
  fn Require(const utils::types::SharedPointer<Provider>& provider, const utils::types::StringView what) -> utils::types::Result<Provider*> {
    if (!provider)
      ERR_FMT(utils::error::GmcpErrorCode::ApiUnavailable, "No {} provider is available", what);

    return provider.get();
  }

  // Tools.cpp
  fn MakeSendNotification(utils::types::SharedPointer<providers::INotificationProvider> provider) -> HandlerPtr;
  fn MakeLaunchApplication(utils::types::SharedPointer<providers::IApplicationProvider> provider) -> HandlerPtr;
  fn MakeOpenFile(utils::types::SharedPointer<providers::IFileOpener> provider) -> HandlerPtr;
  fn MakeSetWallpaper(utils::types::SharedPointer<providers::IWallpaperProvider> provider) -> HandlerPtr;
  fn MakeQuickSettings(utils::types::SharedPointer<providers::IQuickSettings> provider) -> HandlerPtr;
  fn MakeTakeScreenshot(utils::types::SharedPointer<providers::IScreenshotService> provider) -> HandlerPtr;

  // Audio.cpp
  fn MakeSetVolume(utils::types::SharedPointer<providers::IAudioMixer> mixer) -> HandlerPtr;
  fn MakeMediaControl(utils::types::SharedPointer<providers::IMediaController> media) -> HandlerPtr;
  fn MakeAudioStatus(utils::types::SharedPointer<providers::IAudioMixer> mixer, utils::types::SharedPointer<providers::IMediaController> media) -> HandlerPtr;

  // WindowManagement.cpp
  fn MakeWindowManagement(utils::types::SharedPointer<providers::IWindowManager> windows) -> HandlerPtr;

  // Keyring.cpp
  fn MakeKeyringManagement(utils::types::SharedPointer<providers::ISecretStore> secrets) -> HandlerPtr;

  // Resources.cpp
  fn MakeSystemInfo(utils::types::SharedPointer<providers::ISystemInfoProvider> provider) -> HandlerPtr;
  fn MakeApplications(utils::types::SharedPointer<providers::IApplicationProvider> provider) -> HandlerPtr;
  fn MakeCalendar(utils::types::SharedPointer<providers::IPersonalDataProvider> provider) -> HandlerPtr;
  fn MakeTasks(utils::types::SharedPointer<providers::IPersonalDataProvider> provider) -> HandlerPtr;
  fn MakeContacts(utils::types::SharedPointer<providers::IPersonalDataProvider> provider) -> HandlerPtr;
} // namespace gnome_mcp::handlers
