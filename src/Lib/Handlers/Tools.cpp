#include <matchit.hpp> // matchit::{match, is, _}

#include "GnomeMcp/Utils/Logging.hpp"

#include "Factories.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::core::Arguments;
using gnome_mcp::core::ICapabilityHandler;
using gnome_mcp::core::ResolvedOptions;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace gnome_mcp::handlers {
  namespace {
    using providers::IApplicationProvider;
    using providers::IFileOpener;
    using providers::INotificationProvider;
    using providers::IQuickSettings;
    using providers::IScreenshotService;
    using providers::IWallpaperProvider;
    using providers::QuickSetting;

    class SendNotificationHandler final : public ICapabilityHandler {
     public:
      explicit SendNotificationHandler(SharedPointer<INotificationProvider> provider)
        : m_provider(std::move(provider)) {}

      fn invoke(const Arguments& args, const ResolvedOptions& /*options*/) -> Result<mcp::json> override {
        Result<INotificationProvider*> provider = Require(m_provider, "notification");

        if (!provider)
          return Err(provider.error());

        Result<u32> id = (*provider)->notify(args.getString("summary").value_or(""), args.getString("body").value_or(""));

        if (!id)
          return Err(id.error());

        return mcp::json {
          { "message", "Notification sent" },
          {      "id", *id },
        };
      }

     private:
      SharedPointer<INotificationProvider> m_provider;
    };

    class LaunchApplicationHandler final : public ICapabilityHandler {
     public:
      explicit LaunchApplicationHandler(SharedPointer<IApplicationProvider> provider)
        : m_provider(std::move(provider)) {}

      fn invoke(const Arguments& args, const ResolvedOptions& /*options*/) -> Result<mcp::json> override {
        const String appName = args.getString("app_name").value_or("");

        if (appName.empty())
          ERR(InvalidArgument, "app_name must not be empty");

        Result<IApplicationProvider*> provider = Require(m_provider, "application");

        if (!provider)
          return Err(provider.error());

        Result<String> launched = (*provider)->launch(appName);

        if (!launched)
          return Err(launched.error());

        return mcp::json {
          { "message", std::format("Launched {}", *launched) },
          {  "app_id", *launched },
        };
      }

     private:
      SharedPointer<IApplicationProvider> m_provider;
    };

    class OpenFileHandler final : public ICapabilityHandler {
     public:
      explicit OpenFileHandler(SharedPointer<IFileOpener> provider)
        : m_provider(std::move(provider)) {}

      fn invoke(const Arguments& args, const ResolvedOptions& /*options*/) -> Result<mcp::json> override {
        const String path = args.getString("path").value_or("");

        if (path.empty())
          ERR(InvalidArgument, "path must not be empty");

        Result<IFileOpener*> provider = Require(m_provider, "file opener");

        if (!provider)
          return Err(provider.error());

        if (Result<> res = (*provider)->open(path); !res)
          return Err(res.error());

        return mcp::json {
          { "message", std::format("Opened {}", path) },
        };
      }

     private:
      SharedPointer<IFileOpener> m_provider;
    };

    class SetWallpaperHandler final : public ICapabilityHandler {
     public:
      explicit SetWallpaperHandler(SharedPointer<IWallpaperProvider> provider)
        : m_provider(std::move(provider)) {}

      fn invoke(const Arguments& args, const ResolvedOptions& /*options*/) -> Result<mcp::json> override {
        Result<IWallpaperProvider*> provider = Require(m_provider, "wallpaper");

        if (!provider)
          return Err(provider.error());

        const String imagePath = args.getString("image_path").value_or("");

        if (Result<> res = (*provider)->setWallpaper(imagePath); !res)
          return Err(res.error());

        return mcp::json {
          {    "message", "Wallpaper set" },
          { "image_path", imagePath },
        };
      }

     private:
      SharedPointer<IWallpaperProvider> m_provider;
    };

    class QuickSettingsHandler final : public ICapabilityHandler {
     public:
      explicit QuickSettingsHandler(SharedPointer<IQuickSettings> provider)
        : m_provider(std::move(provider)) {}

      fn invoke(const Arguments& args, const ResolvedOptions& /*options*/) -> Result<mcp::json> override {
        using matchit::match, matchit::is, matchit::_;

        const String name    = args.getString("setting").value_or("");
        const bool   enabled = args.getBool("enabled").value_or(false);

        const Option<QuickSetting> setting = match(name)(
          is | "wifi"           = Option<QuickSetting>(QuickSetting::Wifi),
          is | "bluetooth"      = Option<QuickSetting>(QuickSetting::Bluetooth),
          is | "night_light"    = Option<QuickSetting>(QuickSetting::NightLight),
          is | "do_not_disturb" = Option<QuickSetting>(QuickSetting::DoNotDisturb),
          is | "dark_style"     = Option<QuickSetting>(QuickSetting::DarkStyle),
          is | _                = Option<QuickSetting>(None)
        );

        if (!setting)
          ERR_FMT(InvalidArgument, "Unknown setting '{}'", name);

        Result<IQuickSettings*> provider = Require(m_provider, "quick settings");

        if (!provider)
          return Err(provider.error());

        if (Result<> res = (*provider)->setToggle(*setting, enabled); !res)
          return Err(res.error());

        return mcp::json {
          { "setting", name },
          { "enabled", enabled },
        };
      }

     private:
      SharedPointer<IQuickSettings> m_provider;
    };

    class TakeScreenshotHandler final : public ICapabilityHandler {
     public:
      explicit TakeScreenshotHandler(SharedPointer<IScreenshotService> provider)
        : m_provider(std::move(provider)) {}

      fn invoke(const Arguments& args, const ResolvedOptions& options) -> Result<mcp::json> override {
        Result<IScreenshotService*> provider = Require(m_provider, "screenshot");

        if (!provider)
          return Err(provider.error());

        const bool interactive = args.getBool("interactive").value_or(options.getBool("interactive"));

        Result<String> uri = (*provider)->capture(interactive);

        if (!uri)
          return Err(uri.error());

        debug_log("Screenshot saved to {}", *uri);

        return mcp::json {
          {         "uri", *uri },
          { "interactive", interactive },
        };
      }

     private:
      SharedPointer<IScreenshotService> m_provider;
    };
  } // namespace

  fn MakeSendNotification(SharedPointer<INotificationProvider> provider) -> HandlerPtr {
    return std::make_unique<SendNotificationHandler>(std::move(provider));
  }

  fn MakeLaunchApplication(SharedPointer<IApplicationProvider> provider) -> HandlerPtr {
    return std::make_unique<LaunchApplicationHandler>(std::move(provider));
  }

  fn MakeOpenFile(SharedPointer<IFileOpener> provider) -> HandlerPtr {
    return std::make_unique<OpenFileHandler>(std::move(provider));
  }

  fn MakeSetWallpaper(SharedPointer<IWallpaperProvider> provider) -> HandlerPtr {
    return std::make_unique<SetWallpaperHandler>(std::move(provider));
  }

  fn MakeQuickSettings(SharedPointer<IQuickSettings> provider) -> HandlerPtr {
    return std::make_unique<QuickSettingsHandler>(std::move(provider));
  }

  fn MakeTakeScreenshot(SharedPointer<IScreenshotService> provider) -> HandlerPtr {
    return std::make_unique<TakeScreenshotHandler>(std::move(provider));
  }
} // namespace gnome_mcp::handlers
