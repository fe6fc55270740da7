#include <charconv>      // std::from_chars
#include <fstream>       // std::ifstream
#include <sys/sysinfo.h> // sysinfo
#include <sys/utsname.h> // utsname, uname

#include "GnomeMcp/Utils/Env.hpp"
#include "GnomeMcp/Utils/Logging.hpp"

#include "Factories.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::utils::env::GetEnv;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace gnome_mcp::providers::gnome {
  namespace {
    fn Unquote(String value) -> String {
      if ((value.length() >= 2 && value.front() == '"' && value.back() == '"') ||
          (value.length() >= 2 && value.front() == '\'' && value.back() == '\''))
        value = value.substr(1, value.length() - 2);

      return value;
    }

    struct OsRelease {
      String         name;
      Option<String> version;
    };

    fn ReadOsRelease() -> Result<OsRelease> {
      std::ifstream file("/etc/os-release");

      if (!file.is_open())
        ERR(NotFound, "Failed to open /etc/os-release");

      Map<String, String> values;

      for (String line; std::getline(file, line);)
        if (const usize equals = line.find('='); equals != String::npos)
          values.emplace(line.substr(0, equals), Unquote(line.substr(equals + 1)));

      const auto get = [&values](const String& key) -> Option<String> {
        if (const auto iter = values.find(key); iter != values.end() && !iter->second.empty())
          return iter->second;

        return None;
      };

      Option<String> name = get("NAME");

      if (!name)
        name = get("PRETTY_NAME");

      if (!name)
        ERR(NotFound, "NAME line not found in /etc/os-release");

      Option<String> version = get("VERSION_ID");

      if (!version)
        version = get("VERSION");

      return OsRelease { .name = *name, .version = version };
    }

    /// MemAvailable from /proc/meminfo, in bytes.
    fn ReadAvailableMemory() -> Option<u64> {
      std::ifstream file("/proc/meminfo");

      for (String line; std::getline(file, line);)
        if (line.starts_with("MemAvailable:")) {
          const usize digits = line.find_first_of("0123456789");

          if (digits == String::npos)
            return None;

          u64 kibibytes = 0;

          if (std::from_chars(line.data() + digits, line.data() + line.size(), kibibytes).ec != std::errc()) // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return None;

          return kibibytes * 1024;
        }

      return None;
    }

    fn GetDesktopEnvironment() -> Option<String> {
      if (Result<PCStr> xdg = GetEnv("XDG_CURRENT_DESKTOP"); xdg) {
        String desktop = *xdg;

        if (const usize colon = desktop.find(':'); colon != String::npos)
          desktop.resize(colon);

        return desktop;
      }

      if (Result<PCStr> session = GetEnv("DESKTOP_SESSION"); session)
        return String(*session);

      return None;
    }

    class LinuxSystemInfo final : public ISystemInfoProvider {
     public:
      explicit LinuxSystemInfo(SessionPtr session) : m_session(std::move(session)) {}

      fn getSystemInfo() -> Result<SystemInfo> override {
        Result<OsRelease> release = ReadOsRelease();

        if (!release)
          return Err(release.error());

        utsname uts;

        if (uname(&uts) == -1)
          ERR(InternalError, "uname call failed");

        struct sysinfo info;

        if (sysinfo(&info) != 0)
          ERR(ApiUnavailable, "sysinfo call failed");

        if (info.mem_unit == 0)
          ERR(PlatformSpecific, "sysinfo.mem_unit is 0, cannot calculate memory");

        LockGuard lock(m_session->mutex());

        return SystemInfo {
          .osName               = release->name,
          .osVersion            = release->version,
          .kernel               = uts.release,
          .architecture         = uts.machine,
          .hostname             = hostname(uts),
          .desktop              = GetDesktopEnvironment(),
          .shellVersion         = shellVersion(),
          .uptimeSeconds        = static_cast<u64>(info.uptime),
          .totalMemoryBytes     = static_cast<u64>(info.totalram) * info.mem_unit,
          .availableMemoryBytes = ReadAvailableMemory().value_or(static_cast<u64>(info.freeram + info.bufferram) * info.mem_unit),
        };
      }

     private:
      SessionPtr m_session;

      /// The static hostname from systemd-hostnamed, falling back to the kernel's.
      fn hostname(const utsname& uts) const -> String {
        Result<const DBus::Connection*> bus = m_session->systemBus();

        if (!bus) {
          debug_at(bus.error());
          return uts.nodename;
        }

        Result<DBus::Message> reply = (*bus)->getProperty(
          "org.freedesktop.hostname1", "/org/freedesktop/hostname1", "org.freedesktop.hostname1", "Hostname", m_session->timeoutMs()
        );

        if (!reply) {
          debug_at(reply.error());
          return uts.nodename;
        }

        DBus::MessageIter iter = reply->iterInit();

        Option<String> name = iter.getString();

        return name && !name->empty() ? *name : String(uts.nodename);
      }

      fn shellVersion() const -> Option<String> {
        Result<const DBus::Connection*> bus = m_session->sessionBus();

        if (!bus) {
          debug_at(bus.error());
          return None;
        }

        Result<DBus::Message> reply = (*bus)->getProperty("org.gnome.Shell", "/org/gnome/Shell", "org.gnome.Shell", "ShellVersion", m_session->timeoutMs());

        if (!reply) {
          debug_at(reply.error());
          return None;
        }

        DBus::MessageIter iter = reply->iterInit();

        return iter.getString();
      }
    };
  } // namespace

  fn MakeSystemInfoProvider(SessionPtr session) -> SharedPointer<ISystemInfoProvider> {
    return std::make_shared<LinuxSystemInfo>(std::move(session));
  }
} // namespace gnome_mcp::providers::gnome
