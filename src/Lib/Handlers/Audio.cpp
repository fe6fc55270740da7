#include <algorithm>   // std::clamp
#include <cmath>       // std::llround
#include <matchit.hpp> // matchit::{match, is, _}

#include "GnomeMcp/Handlers/Handlers.hpp"
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
    using providers::IAudioMixer;
    using providers::IMediaController;
    using providers::MediaAction;
    using providers::PlayerInfo;
    using providers::VolumeState;

    constexpr i64 MIN_VOLUME = 0;
    constexpr i64 MAX_VOLUME = 100;

    fn PlayerToJson(const PlayerInfo& player) -> mcp::json {
      return {
        { "bus_name", player.busName },
        { "identity", player.identity ? mcp::json(*player.identity) : mcp::json(nullptr) },
        {   "status", player.playbackStatus ? mcp::json(*player.playbackStatus) : mcp::json(nullptr) },
        {    "title", player.title ? mcp::json(*player.title) : mcp::json(nullptr) },
        {  "artists", player.artists },
        {    "album", player.album ? mcp::json(*player.album) : mcp::json(nullptr) },
      };
    }

    class SetVolumeHandler final : public ICapabilityHandler {
     public:
      explicit SetVolumeHandler(SharedPointer<IAudioMixer> mixer)
        : m_mixer(std::move(mixer)) {}

      fn invoke(const Arguments& args, const ResolvedOptions& options) -> Result<mcp::json> override {
        if (Result<> valid = ValidateVolumeRequest(args); !valid)
          return Err(valid.error());

        Result<IAudioMixer*> mixer = Require(m_mixer, "audio mixer");

        if (!mixer)
          return Err(mixer.error());

        // Absolute and mute-only changes still report the previous state, but do not depend on it.
        Result<VolumeState> state = (*mixer)->getVolume();

        if (!state) {
          if (VolumeChangeIsRelative(args))
            return Err(state.error());

          debug_log("Could not read the current volume: {}", state.error().message);
        }

        Result<Option<i64>> target = ComputeVolumeTarget(args, state ? state->level : MIN_VOLUME, options.getInteger("volume_step"));

        if (!target)
          return Err(target.error());

        if (*target)
          if (Result<> res = (*mixer)->setVolume(**target); !res)
            return Err(res.error());

        const Option<bool> mute = args.getBool("mute");

        if (mute)
          if (Result<> res = (*mixer)->setMute(*mute); !res)
            return Err(res.error());

        const mcp::json previous = state ? mcp::json(state->level) : mcp::json(nullptr);

        return mcp::json {
          { "previous", previous },
          {   "volume", *target ? mcp::json(**target) : previous },
          {    "muted", mute ? mcp::json(*mute) : state ? mcp::json(state->muted) : mcp::json(nullptr) },
        };
      }

     private:
      SharedPointer<IAudioMixer> m_mixer;
    };

    class MediaControlHandler final : public ICapabilityHandler {
     public:
      explicit MediaControlHandler(SharedPointer<IMediaController> media)
        : m_media(std::move(media)) {}

      fn invoke(const Arguments& args, const ResolvedOptions& /*options*/) -> Result<mcp::json> override {
        using matchit::match, matchit::is, matchit::_;

        const String actionName = args.getString("action").value_or("");

        const Option<MediaAction> action = match(actionName)(
          is | "play"       = Option<MediaAction>(MediaAction::Play),
          is | "pause"      = Option<MediaAction>(MediaAction::Pause),
          is | "play_pause" = Option<MediaAction>(MediaAction::PlayPause),
          is | "stop"       = Option<MediaAction>(MediaAction::Stop),
          is | "next"       = Option<MediaAction>(MediaAction::Next),
          is | "previous"   = Option<MediaAction>(MediaAction::Previous),
          is | _            = Option<MediaAction>(None)
        );

        if (!action)
          ERR_FMT(InvalidArgument, "Unknown media action '{}'", actionName);

        Result<IMediaController*> media = Require(m_media, "media");

        if (!media)
          return Err(media.error());

        Result<String> player = (*media)->sendMediaCommand(*action, args.getString("player"));

        if (!player)
          return Err(player.error());

        return mcp::json {
          { "action", actionName },
          { "player", *player },
        };
      }

     private:
      SharedPointer<IMediaController> m_media;
    };

    class AudioStatusHandler final : public ICapabilityHandler {
     public:
      AudioStatusHandler(SharedPointer<IAudioMixer> mixer, SharedPointer<IMediaController> media)
        : m_mixer(std::move(mixer)), m_media(std::move(media)) {}

      fn invoke(const Arguments& /*args*/, const ResolvedOptions& /*options*/) -> Result<mcp::json> override {
        mcp::json volume = mcp::json::object();
        mcp::json media  = mcp::json::object();

        if (m_mixer) {
          if (Result<VolumeState> state = m_mixer->getVolume()) {
            volume["level"] = state->level;
            volume["muted"] = state->muted;
          } else
            warn_at(state.error());
        }

        if (m_media) {
          if (Result<Vec<PlayerInfo>> players = m_media->listPlayers()) {
            mcp::json list = mcp::json::array();
            mcp::json active = nullptr;

            for (const PlayerInfo& player : *players) {
              list.push_back(PlayerToJson(player));

              if (active.is_null() && player.playbackStatus == "Playing")
                active = player.busName;
            }

            media["players"]       = std::move(list);
            media["active_player"] = std::move(active);
          } else
            warn_at(players.error());
        }

        return mcp::json {
          { "volume", volume },
          {  "media", media },
        };
      }

     private:
      SharedPointer<IAudioMixer>      m_mixer;
      SharedPointer<IMediaController> m_media;
    };
  } // namespace

  fn VolumeChangeIsRelative(const Arguments& args) -> bool {
    return args.has("direction") || (args.has("volume") && args.getBool("relative").value_or(false));
  }

  fn ValidateVolumeRequest(const Arguments& args) -> Result<> {
    const Option<f64> volume    = args.getNumber("volume");
    const bool        direction = args.has("direction");

    if (volume && direction)
      ERR(InvalidArgument, "'volume' and 'direction' cannot be combined");

    if (!volume && !direction && !args.has("mute"))
      ERR(InvalidArgument, "Provide at least one of 'volume', 'direction' or 'mute'");

    if (volume && !VolumeChangeIsRelative(args) && (*volume < static_cast<f64>(MIN_VOLUME) || *volume > static_cast<f64>(MAX_VOLUME)))
      ERR_FMT(InvalidArgument, "'volume' must be between {} and {}", MIN_VOLUME, MAX_VOLUME);

    return {};
  }

  fn ComputeVolumeTarget(const Arguments& args, const i64 current, const i64 step) -> Result<Option<i64>> {
    if (Result<> valid = ValidateVolumeRequest(args); !valid)
      return Err(valid.error());

    const Option<f64>    volume    = args.getNumber("volume");
    const Option<String> direction = args.getString("direction");
    const bool           relative  = args.getBool("relative").value_or(false);

    if (direction)
      return std::clamp(current + (*direction == "down" ? -step : step), MIN_VOLUME, MAX_VOLUME);

    if (volume && relative)
      return std::clamp(current + static_cast<i64>(std::llround(*volume)), MIN_VOLUME, MAX_VOLUME);

    if (volume)
      return static_cast<i64>(std::llround(*volume));

    return Option<i64>(None);
  }

  fn MakeSetVolume(SharedPointer<IAudioMixer> mixer) -> HandlerPtr {
    return std::make_unique<SetVolumeHandler>(std::move(mixer));
  }

  fn MakeMediaControl(SharedPointer<IMediaController> media) -> HandlerPtr {
    return std::make_unique<MediaControlHandler>(std::move(media));
  }

  fn MakeAudioStatus(SharedPointer<IAudioMixer> mixer, SharedPointer<IMediaController> media) -> HandlerPtr {
    return std::make_unique<AudioStatusHandler>(std::move(mixer), std::move(media));
  }
} // namespace gnome_mcp::handlers
