#include <algorithm>   // std::ranges::transform
#include <cctype>      // std::tolower
#include <filesystem>  // std::filesystem::{path, exists, is_regular_file, canonical}
#include <matchit.hpp> // matchit::{match, is, _}

#include "GnomeMcp/Utils/Logging.hpp"

#include "Factories.hpp"
#include "Wrappers/Process.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;
namespace fs = std::filesystem;

namespace gnome_mcp::providers::gnome {
  namespace {
    fn IsUri(const String& text) -> bool {
      return text.find("://") != String::npos;
    }

    fn GSettingsSet(const Session& session, const String& schema, const String& key, const String& value) -> Result<> {
      Result<Process::Output> output = Process::RunChecked({ "gsettings", "set", schema, key, value }, session.timeoutMs());

      if (!output)
        return Err(output.error());

      return {};
    }

    class NotificationProvider final : public INotificationProvider {
     public:
      explicit NotificationProvider(SessionPtr session) : m_session(std::move(session)) {}

      fn notify(const String& summary, const String& body) -> Result<u32> override {
        LockGuard lock(m_session->mutex());

        Result<const DBus::Connection*> bus = m_session->sessionBus();

        if (!bus)
          return Err(bus.error());

        Result<DBus::Message> reply = (*bus)->call(
          "org.freedesktop.Notifications",
          "/org/freedesktop/Notifications",
          "org.freedesktop.Notifications",
          "Notify",
          m_session->timeoutMs(),
          "gnome-mcp-server",
          u32 { 0 },
          "",
          summary,
          body,
          DBus::StringList {},
          DBus::VariantDict {},
          i32 { -1 }
        );

        if (!reply)
          return Err(reply.error());

        DBus::MessageIter iter = reply->iterInit();

        const Option<i64> id = iter.getInteger();

        if (!id)
          ERR(ParseError, "Notify reply carries no notification id");

        return static_cast<u32>(*id);
      }

     private:
      SessionPtr m_session;
    };

    class FileOpener final : public IFileOpener {
     public:
      explicit FileOpener(SessionPtr session) : m_session(std::move(session)) {}

      fn open(const String& pathOrUri) -> Result<> override {
        if (!IsUri(pathOrUri) && !fs::exists(pathOrUri))
          ERR_FMT(InvalidArgument, "File does not exist: {}", pathOrUri);

        LockGuard lock(m_session->mutex());

        Result<Process::Output> output = Process::RunChecked({ "xdg-open", pathOrUri }, m_session->timeoutMs());

        if (!output)
          return Err(output.error());

        return {};
      }

     private:
      SessionPtr m_session;
    };

    class WallpaperProvider final : public IWallpaperProvider {
     public:
      explicit WallpaperProvider(SessionPtr session) : m_session(std::move(session)) {}

      fn setWallpaper(const String& imagePath) -> Result<> override {
        Result<String> uri = ToImageUri(imagePath);

        if (!uri)
          return Err(uri.error());

        LockGuard lock(m_session->mutex());

        Result<const DBus::Connection*> bus = m_session->sessionBus();

        if (!bus)
          return Err(bus.error());

        const DBus::Connection& connection = **bus;

        Result<DBus::Message> response = CallPortal(
          connection,
          m_session->nextToken(),
          [&](const String& token) -> Result<DBus::Message> {
            return connection.call(
              PORTAL_BUS,
              PORTAL_PATH,
              "org.freedesktop.portal.Wallpaper",
              "SetWallpaperURI",
              m_session->timeoutMs(),
              "",
              *uri,
              DBus::VariantDict {
                { "handle_token", token },
                { "show-preview", false },
                {       "set-on", String("background") },
              }
            );
          },
          m_session->timeoutMs()
        );

        if (!response)
          return Err(response.error());

        return {};
      }

     private:
      SessionPtr m_session;

      static fn ToImageUri(const String& imagePath) -> Result<String> {
        if (imagePath.starts_with("file://"))
          return imagePath;

        const fs::path path(imagePath);

        std::error_code errc;

        if (!fs::exists(path, errc))
          ERR_FMT(InvalidArgument, "Image file does not exist: {}", imagePath);

        if (!fs::is_regular_file(path, errc))
          ERR_FMT(InvalidArgument, "Path is not a file: {}", imagePath);

        String extension = path.extension().string();

        if (extension.empty())
          ERR(InvalidArgument, "No file extension found");

        extension.erase(0, 1);
        std::ranges::transform(extension, extension.begin(), [](const unsigned char chr) { return static_cast<char>(std::tolower(chr)); });

        if (extension != "jpg" && extension != "jpeg" && extension != "png")
          ERR_FMT(InvalidArgument, "Unsupported image format: {}", path.extension().string());

        const fs::path canonical = fs::canonical(path, errc);

        if (errc)
          ERR_FROM(errc);

        return std::format("file://{}", canonical.string());
      }
    };

    class ScreenshotService final : public IScreenshotService {
     public:
      explicit ScreenshotService(SessionPtr session) : m_session(std::move(session)) {}

      fn capture(const bool interactive) -> Result<String> override {
        LockGuard lock(m_session->mutex());

        Result<const DBus::Connection*> bus = m_session->sessionBus();

        if (!bus)
          return Err(bus.error());

        const DBus::Connection& connection = **bus;

        Result<DBus::Message> response = CallPortal(
          connection,
          m_session->nextToken(),
          [&](const String& token) -> Result<DBus::Message> {
            return connection.call(
              PORTAL_BUS,
              PORTAL_PATH,
              "org.freedesktop.portal.Screenshot",
              "Screenshot",
              m_session->timeoutMs(),
              "",
              DBus::VariantDict {
                { "handle_token", token },
                {  "interactive", interactive },
                {        "modal", true },
              }
            );
          },
          interactive ? m_session->interactiveTimeoutMs() : m_session->timeoutMs()
        );

        if (!response)
          return Err(response.error());

        DBus::MessageIter iter = response->iterInit();

        Option<String> uri;

        if (iter.next())
          iter.forEachEntry([&uri](const String& key, DBus::MessageIter& value) {
            if (key == "uri")
              uri = value.getString();
          });

        if (!uri)
          ERR(ParseError, "Screenshot portal returned no uri");

        return *uri;
      }

     private:
      SessionPtr m_session;
    };

    class QuickSettings final : public IQuickSettings {
     public:
      explicit QuickSettings(SessionPtr session) : m_session(std::move(session)) {}

      fn setToggle(const QuickSetting setting, const bool enabled) -> Result<> override {
        using matchit::match, matchit::is, matchit::_;

        LockGuard lock(m_session->mutex());

        return match(setting)(
          is | QuickSetting::Wifi         = [&] { return setSystemProperty("org.freedesktop.NetworkManager", "/org/freedesktop/NetworkManager", "org.freedesktop.NetworkManager", "WirelessEnabled", enabled); },
          is | QuickSetting::Bluetooth    = [&] { return setSystemProperty("org.bluez", "/org/bluez/hci0", "org.bluez.Adapter1", "Powered", enabled); },
          is | QuickSetting::NightLight   = [&] { return GSettingsSet(*m_session, "org.gnome.settings-daemon.plugins.color", "night-light-enabled", enabled ? "true" : "false"); },
          // show-banners is the inverse of do-not-disturb.
          is | QuickSetting::DoNotDisturb = [&] { return GSettingsSet(*m_session, "org.gnome.desktop.notifications", "show-banners", enabled ? "false" : "true"); },
          is | QuickSetting::DarkStyle    = [&] { return GSettingsSet(*m_session, "org.gnome.desktop.interface", "color-scheme", enabled ? "prefer-dark" : "default"); },
          is | _                          = [&] { return Result<>(Err(GmcpError(InvalidArgument, "Unknown quick setting"))); }
        );
      }

     private:
      SessionPtr m_session;

      fn setSystemProperty(PCStr destination, PCStr path, PCStr interface, PCStr property, const bool value) -> Result<> {
        Result<const DBus::Connection*> bus = m_session->systemBus();

        if (!bus)
          return Err(bus.error());

        return (*bus)->setProperty(destination, path, interface, property, value, m_session->timeoutMs());
      }
    };
  } // namespace

  fn MakeNotificationProvider(SessionPtr session) -> SharedPointer<INotificationProvider> {
    return std::make_shared<NotificationProvider>(std::move(session));
  }

  fn MakeFileOpener(SessionPtr session) -> SharedPointer<IFileOpener> {
    return std::make_shared<FileOpener>(std::move(session));
  }

  fn MakeWallpaperProvider(SessionPtr session) -> SharedPointer<IWallpaperProvider> {
    return std::make_shared<WallpaperProvider>(std::move(session));
  }

  fn MakeScreenshotService(SessionPtr session) -> SharedPointer<IScreenshotService> {
    return std::make_shared<ScreenshotService>(std::move(session));
  }

  fn MakeQuickSettings(SessionPtr session) -> SharedPointer<IQuickSettings> {
    return std::make_shared<QuickSettings>(std::move(session));
  }
} // namespace gnome_mcp::providers::gnome
