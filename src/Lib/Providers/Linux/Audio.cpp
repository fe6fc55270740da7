#include <algorithm>   // std::ranges::transform
#include <cctype>      // std::tolower
#include <charconv>    // std::from_chars
#include <cmath>       // std::lround
#include <matchit.hpp> // matchit::{match, is, _}

#include "GnomeMcp/Utils/Logging.hpp"

#include "Factories.hpp"
#include "Wrappers/Process.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace gnome_mcp::providers::gnome {
  namespace {
    constexpr StringView MPRIS_PREFIX = "org.mpris.MediaPlayer2.";
    constexpr PCStr      MPRIS_PATH   = "/org/mpris/MediaPlayer2";
    constexpr PCStr      DEFAULT_SINK = "@DEFAULT_AUDIO_SINK@";

    fn ToLower(String text) -> String {
      std::ranges::transform(text, text.begin(), [](const unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
      return text;
    }

    class WpctlMixer final : public IAudioMixer {
     public:
      explicit WpctlMixer(SessionPtr session) : m_session(std::move(session)) {}

      fn getVolume() -> Result<VolumeState> override {
        LockGuard lock(m_session->mutex());

        Result<Process::Output> output = Process::RunChecked({ "wpctl", "get-volume", DEFAULT_SINK }, m_session->timeoutMs());

        if (!output)
          return Err(output.error());

        return ParseWpctlVolume(output->stdoutText);
      }

      fn setVolume(const i64 level) -> Result<> override {
        LockGuard lock(m_session->mutex());

        Result<Process::Output> output = Process::RunChecked({ "wpctl", "set-volume", DEFAULT_SINK, std::format("{}%", level) }, m_session->timeoutMs());

        if (!output)
          return Err(output.error());

        return {};
      }

      fn setMute(const bool muted) -> Result<> override {
        LockGuard lock(m_session->mutex());

        Result<Process::Output> output = Process::RunChecked({ "wpctl", "set-mute", DEFAULT_SINK, muted ? "1" : "0" }, m_session->timeoutMs());

        if (!output)
          return Err(output.error());

        return {};
      }

     private:
      SessionPtr m_session;
    };

    class MprisController final : public IMediaController {
     public:
      explicit MprisController(SessionPtr session) : m_session(std::move(session)) {}

      fn listPlayers() -> Result<Vec<PlayerInfo>> override {
        LockGuard lock(m_session->mutex());

        Result<const DBus::Connection*> bus = m_session->sessionBus();

        if (!bus)
          return Err(bus.error());

        Result<Vec<String>> names = playerNames(**bus);

        if (!names)
          return Err(names.error());

        Vec<PlayerInfo> players;

        for (const String& name : *names)
          players.push_back(describe(**bus, name));

        return players;
      }

      fn sendMediaCommand(const MediaAction action, const Option<String>& player) -> Result<String> override {
        using matchit::match, matchit::is, matchit::_;

        LockGuard lock(m_session->mutex());

        Result<const DBus::Connection*> bus = m_session->sessionBus();

        if (!bus)
          return Err(bus.error());

        Result<Vec<String>> names = playerNames(**bus);

        if (!names)
          return Err(names.error());

        if (names->empty())
          ERR(NotFound, "No media players found");

        String target = names->front();

        if (player) {
          const String needle = ToLower(*player);
          const auto   found  = std::ranges::find_if(*names, [&needle](const String& name) { return ToLower(name).contains(needle); });

          if (found == names->end())
            ERR_FMT(NotFound, "Player '{}' not found", *player);

          target = *found;
        }

        const PCStr method = match(action)(
          is | MediaAction::Play      = "Play",
          is | MediaAction::Pause     = "Pause",
          is | MediaAction::PlayPause = "PlayPause",
          is | MediaAction::Stop      = "Stop",
          is | MediaAction::Next      = "Next",
          is | MediaAction::Previous  = "Previous",
          is | _                      = "PlayPause"
        );

        Result<DBus::Message> reply = (*bus)->call(target.c_str(), MPRIS_PATH, "org.mpris.MediaPlayer2.Player", method, m_session->timeoutMs());

        if (!reply)
          return Err(reply.error());

        debug_log("Sent {} to {}", method, target);

        return target;
      }

     private:
      SessionPtr m_session;

      fn playerNames(const DBus::Connection& bus) const -> Result<Vec<String>> {
        Result<DBus::Message> reply = bus.call(DBUS_SERVICE_DBUS, DBUS_PATH_DBUS, DBUS_INTERFACE_DBUS, "ListNames", m_session->timeoutMs());

        if (!reply)
          return Err(reply.error());

        DBus::MessageIter iter = reply->iterInit();

        if (!iter.isValid() || iter.getArgType() != DBUS_TYPE_ARRAY)
          ERR(ParseError, "Invalid DBus ListNames reply format: Expected array");

        Vec<String> names;

        for (String& name : iter.getStringList())
          if (name.starts_with(MPRIS_PREFIX))
            names.push_back(std::move(name));

        return names;
      }

      fn describe(const DBus::Connection& bus, const String& name) const -> PlayerInfo {
        PlayerInfo info { .busName = name, .identity = None, .playbackStatus = None, .title = None, .artists = {}, .album = None };

        if (Result<DBus::Message> identity = bus.getProperty(name.c_str(), MPRIS_PATH, "org.mpris.MediaPlayer2", "Identity", m_session->timeoutMs())) {
          DBus::MessageIter iter = identity->iterInit();
          info.identity          = iter.getString();
        }

        Result<DBus::Message> props = bus.call(name.c_str(), MPRIS_PATH, DBUS_INTERFACE_PROPERTIES, "GetAll", m_session->timeoutMs(), "org.mpris.MediaPlayer2.Player");

        if (!props) {
          debug_at(props.error());
          return info;
        }

        DBus::MessageIter iter = props->iterInit();

        iter.forEachEntry([&info](const String& key, DBus::MessageIter& value) {
          if (key == "PlaybackStatus")
            info.playbackStatus = value.getString();
          else if (key == "Metadata")
            value.forEachEntry([&info](const String& field, DBus::MessageIter& meta) {
              if (field == "xesam:title")
                info.title = meta.getString();
              else if (field == "xesam:album")
                info.album = meta.getString();
              else if (field == "xesam:artist")
                info.artists = meta.getStringList();
            });
        });

        return info;
      }
    };
  } // namespace

  fn ParseWpctlVolume(const StringView output) -> Result<VolumeState> {
    // "Volume: 0.45" or "Volume: 0.45 [MUTED]"
    constexpr StringView prefix = "Volume:";

    const usize start = output.find(prefix);

    if (start == StringView::npos)
      ERR_FMT(ParseError, "Unexpected wpctl output: {}", output);

    StringView rest = output.substr(start + prefix.size());

    while (!rest.empty() && rest.front() == ' ')
      rest.remove_prefix(1);

    f64 fraction = 0;

    const auto [ptr, errc] = std::from_chars(rest.data(), rest.data() + rest.size(), fraction); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (errc != std::errc())
      ERR_FMT(ParseError, "Unexpected wpctl output: {}", output);

    return VolumeState {
      .level = static_cast<i64>(std::lround(fraction * 100.0)),
      .muted = output.find("[MUTED]") != StringView::npos,
    };
  }

  fn MakeAudioMixer(SessionPtr session) -> SharedPointer<IAudioMixer> {
    return std::make_shared<WpctlMixer>(std::move(session));
  }

  fn MakeMediaController(SessionPtr session) -> SharedPointer<IMediaController> {
    return std::make_shared<MprisController>(std::move(session));
  }
} // namespace gnome_mcp::providers::gnome
