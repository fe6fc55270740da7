#include <algorithm>  // std::ranges::{sort, transform, find_if}
#include <cctype>     // std::tolower
#include <filesystem> // std::filesystem::{path, recursive_directory_iterator}
#include <fstream>    // std::ifstream
#include <sstream>    // std::{istringstream, ostringstream}

#include "GnomeMcp/Utils/Env.hpp"
#include "GnomeMcp/Utils/Logging.hpp"

#include "Factories.hpp"
#include "Wrappers/Process.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::utils::env::GetEnv;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;
namespace fs = std::filesystem;

namespace gnome_mcp::providers::gnome {
  namespace {
    fn ToLower(String text) -> String {
      std::ranges::transform(text, text.begin(), [](const unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
      return text;
    }

    fn SplitList(const String& value, const char separator) -> Vec<String> {
      Vec<String>        out;
      std::istringstream stream(value);

      for (String item; std::getline(stream, item, separator);)
        if (!item.empty())
          out.push_back(item);

      return out;
    }

    /// Application directories in XDG precedence order.
    fn ApplicationDirs() -> Vec<fs::path> {
      Vec<fs::path> dirs;

      if (Result<PCStr> dataHome = GetEnv("XDG_DATA_HOME"); dataHome)
        dirs.emplace_back(fs::path(*dataHome) / "applications");
      else if (Result<PCStr> home = GetEnv("HOME"))
        dirs.emplace_back(fs::path(*home) / ".local" / "share" / "applications");

      Result<PCStr> dataDirs = GetEnv("XDG_DATA_DIRS");

      for (const String& dir : SplitList(dataDirs ? String(*dataDirs) : String("/usr/local/share:/usr/share"), ':'))
        dirs.emplace_back(fs::path(dir) / "applications");

      return dirs;
    }

    fn ReadFile(const fs::path& path) -> Option<String> {
      std::ifstream file(path);

      if (!file)
        return None;

      std::ostringstream buffer;
      buffer << file.rdbuf();

      return buffer.str();
    }

    class ApplicationProvider final : public IApplicationProvider {
     public:
      explicit ApplicationProvider(SessionPtr session) : m_session(std::move(session)) {}

      fn listInstalled() -> Result<Vec<ApplicationInfo>> override {
        Vec<ApplicationInfo> apps;
        Map<String, bool>    seen; // earlier directories shadow later ones

        for (const fs::path& dir : ApplicationDirs()) {
          std::error_code errc;

          if (!fs::is_directory(dir, errc))
            continue;

          for (fs::recursive_directory_iterator iter(dir, fs::directory_options::skip_permission_denied, errc), end; iter != end; iter.increment(errc)) {
            if (errc)
              break;

            if (!iter->is_regular_file(errc) || iter->path().extension() != ".desktop")
              continue;

            // Desktop ids use '-' for subdirectory separators.
            String desktopId = fs::relative(iter->path(), dir, errc).replace_extension().string();
            std::ranges::replace(desktopId, '/', '-');

            if (!seen.try_emplace(desktopId, true).second)
              continue;

            const Option<String> content = ReadFile(iter->path());

            if (!content)
              continue;

            if (Option<ApplicationInfo> app = ParseDesktopEntry(*content, desktopId))
              apps.push_back(std::move(*app));
          }
        }

        std::ranges::sort(apps, {}, &ApplicationInfo::name);

        debug_log("Found {} installed applications", apps.size());

        return apps;
      }

      fn launch(const String& appName) -> Result<String> override {
        Result<Vec<ApplicationInfo>> apps = listInstalled();

        if (!apps)
          return Err(apps.error());

        const String needle = ToLower(appName);

        auto match = std::ranges::find_if(*apps, [&](const ApplicationInfo& app) { return app.id == appName; });

        if (match == apps->end())
          match = std::ranges::find_if(*apps, [&](const ApplicationInfo& app) { return ToLower(app.name).contains(needle); });

        if (match == apps->end())
          ERR_FMT(NotFound, "No installed application matches '{}'", appName);

        LockGuard lock(m_session->mutex());

        Result<Process::Output> output = Process::RunChecked({ "gtk-launch", match->id }, m_session->timeoutMs());

        if (!output)
          return Err(output.error());

        info_log("Launched {} ({})", match->name, match->id);

        return match->id;
      }

     private:
      SessionPtr m_session;
    };
  } // namespace

  fn ParseDesktopEntry(const StringView content, const String& desktopId) -> Option<ApplicationInfo> {
    std::istringstream stream { String(content) };

    bool                inEntry = false;
    Map<String, String> keys;

    for (String line; std::getline(stream, line);) {
      if (!line.empty() && line.back() == '\r')
        line.pop_back();

      if (line.empty() || line.front() == '#')
        continue;

      if (line.front() == '[') {
        // Only the main group matters; actions follow it.
        if (inEntry)
          break;

        inEntry = line == "[Desktop Entry]";
        continue;
      }

      if (!inEntry)
        continue;

      const usize equals = line.find('=');

      if (equals == String::npos)
        continue;

      String key   = Trim(line.substr(0, equals));
      String value = Trim(line.substr(equals + 1));

      // Localized keys (Name[de]) are skipped.
      if (key.contains('['))
        continue;

      keys.try_emplace(std::move(key), std::move(value));
    }

    if (keys.empty())
      return None;

    const auto get = [&keys](const String& key) -> Option<String> {
      if (const auto iter = keys.find(key); iter != keys.end() && !iter->second.empty())
        return iter->second;

      return None;
    };

    if (get("Type").value_or("") != "Application" || get("NoDisplay") == "true" || get("Hidden") == "true")
      return None;

    const Option<String> name = get("Name");

    if (!name)
      return None;

    return ApplicationInfo {
      .id          = desktopId,
      .name        = *name,
      .description = get("Comment"),
      .exec        = get("Exec"),
      .icon        = get("Icon"),
      .categories  = SplitList(get("Categories").value_or(""), ';'),
    };
  }

  fn MakeApplicationProvider(SessionPtr session) -> SharedPointer<IApplicationProvider> {
    return std::make_shared<ApplicationProvider>(std::move(session));
  }
} // namespace gnome_mcp::providers::gnome
