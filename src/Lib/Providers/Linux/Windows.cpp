#include <glaze/json/read.hpp> // glz::read

#include "GnomeMcp/Utils/Logging.hpp"

#include "Factories.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace gnome_mcp::providers::gnome {
  namespace {
    constexpr StringView UNSAFE_MODE_HINT =
      "GNOME Shell refused to evaluate the script; enable unsafe mode: open Looking Glass (Alt+F2, `lg`) and run "
      "`global.context.unsafe_mode = true`";

    // Helpers shared by every script. Mutter dropped the MaximizeFlags argument in
    // recent releases, so both call shapes are handled.
    constexpr StringView PRELUDE = R"JS(
const findWindow = id => {
  const win = global.get_window_actors().map(a => a.get_meta_window()).find(w => w.get_id() === id);
  if (!win) throw new Error(`window ${id} not found`);
  return win;
};
const focusedWindow = () => {
  const win = global.display.get_focus_window();
  if (!win) throw new Error('no window is focused');
  return win;
};
const findWorkspace = index => {
  const ws = global.workspace_manager.get_workspace_by_index(index);
  if (!ws) throw new Error(`workspace ${index} not found`);
  return ws;
};
const isMaximized = w => typeof w.is_maximized === 'function' ? w.is_maximized() : w.get_maximized() !== 0;
const maximize = w => typeof w.get_maximized === 'function' ? w.maximize(3) : w.maximize();
const unmaximize = w => typeof w.get_maximized === 'function' ? w.unmaximize(3) : w.unmaximize();
)JS";

    fn Script(const StringView body) -> String {
      return std::format("(() => {{{}\n{}\n}})()", PRELUDE, body);
    }

    template <typename T>
    fn Decode(const String& json, const StringView what) -> Result<T> {
      using glz::error_ctx, glz::read, glz::error_code;

      T value {};

      if (const error_ctx errc = read<glz::opts { .error_on_unknown_keys = false }>(value, json); errc.ec != error_code::none)
        ERR_FMT(ParseError, "Failed to decode {} from GNOME Shell: {}", what, glz::format_error(errc, json));

      return value;
    }

    class ShellWindowManager final : public IWindowManager {
     public:
      explicit ShellWindowManager(SessionPtr session) : m_session(std::move(session)) {}

      fn listWindows() -> Result<Vec<WindowInfo>> override {
        Result<String> json = eval(R"JS(
return global.get_window_actors()
  .map(a => a.get_meta_window())
  .filter(w => w.get_window_type() === 0 && !w.is_skip_taskbar())
  .map(w => ({
    id: w.get_id(),
    title: w.get_title() || '',
    wm_class: w.get_wm_class() || '',
    workspace: w.get_workspace() ? w.get_workspace().index() : -1,
    minimized: w.minimized,
    maximized: isMaximized(w),
    focused: w.has_focus(),
  }));)JS");

        if (!json)
          return Err(json.error());

        return Decode<Vec<WindowInfo>>(*json, "window list");
      }

      fn focus(const u64 windowId) -> Result<> override {
        return run(std::format("findWindow({}).activate(global.get_current_time()); return true;", windowId));
      }

      fn close(const u64 windowId) -> Result<> override {
        return run(std::format("findWindow({}).delete(global.get_current_time()); return true;", windowId));
      }

      fn minimize(const u64 windowId) -> Result<> override {
        return run(std::format("findWindow({}).minimize(); return true;", windowId));
      }

      fn toggleMaximize(const u64 windowId) -> Result<> override {
        return run(std::format("const w = findWindow({}); if (isMaximized(w)) unmaximize(w); else maximize(w); return true;", windowId));
      }

      fn switchWorkspace(const i64 workspace) -> Result<> override {
        return run(std::format("findWorkspace({}).activate(global.get_current_time()); return true;", workspace));
      }

      fn moveToWorkspace(const u64 windowId, const i64 workspace) -> Result<> override {
        return run(std::format("findWindow({}).change_workspace(findWorkspace({})); return true;", windowId, workspace));
      }

      fn getGeometry(const u64 windowId) -> Result<WindowGeometry> override {
        Result<String> json = eval(std::format(
          "const r = findWindow({}).get_frame_rect(); return {{ x: r.x, y: r.y, width: r.width, height: r.height }};", windowId
        ));

        if (!json)
          return Err(json.error());

        return Decode<WindowGeometry>(*json, "window geometry");
      }

      fn setGeometry(const u64 windowId, const WindowGeometry& geometry) -> Result<> override {
        return run(std::format(
          "const w = findWindow({}); unmaximize(w); w.move_resize_frame(false, {}, {}, {}, {}); return true;",
          windowId,
          geometry.x,
          geometry.y,
          geometry.width,
          geometry.height
        ));
      }

      fn setPosition(const u64 windowId, const i64 x, const i64 y) -> Result<> override {
        return run(std::format(
          "const w = findWindow({}); const r = w.get_frame_rect(); w.move_resize_frame(false, {}, {}, r.width, r.height); return true;",
          windowId,
          x,
          y
        ));
      }

      fn setSize(const u64 windowId, const i64 width, const i64 height) -> Result<> override {
        return run(std::format(
          "const w = findWindow({}); unmaximize(w); const r = w.get_frame_rect(); w.move_resize_frame(false, r.x, r.y, {}, {}); return true;",
          windowId,
          width,
          height
        ));
      }

      fn snap(const Option<u64>& windowId, const SnapSide side) -> Result<> override {
        const String target = windowId ? std::format("findWindow({})", *windowId) : String("focusedWindow()");

        // Left takes the floor of the half width, right the remainder.
        return run(std::format(
          R"JS(const w = {};
const area = global.workspace_manager.get_active_workspace().get_work_area_for_monitor(w.get_monitor());
const half = Math.floor(area.width / 2);
unmaximize(w);
if ({}) w.move_resize_frame(false, area.x, area.y, half, area.height);
else w.move_resize_frame(false, area.x + half, area.y, area.width - half, area.height);
return true;)JS",
          target,
          side == SnapSide::Left ? "true" : "false"
        ));
      }

     private:
      SessionPtr m_session;

      fn eval(const StringView body) -> Result<String> {
        LockGuard lock(m_session->mutex());

        Result<const DBus::Connection*> bus = m_session->sessionBus();

        if (!bus)
          return Err(bus.error());

        Result<DBus::Message> reply = (*bus)->call("org.gnome.Shell", "/org/gnome/Shell", "org.gnome.Shell", "Eval", m_session->timeoutMs(), Script(body));

        if (!reply) {
          if (reply.error().code == PermissionDenied)
            ERR(PermissionDenied, String(UNSAFE_MODE_HINT));

          return Err(reply.error());
        }

        DBus::MessageIter iter = reply->iterInit();

        const Option<bool> success = iter.getBool();

        if (!success || !iter.next())
          ERR(ParseError, "Unexpected reply from org.gnome.Shell.Eval");

        return InterpretEvalReply(*success, iter.getString().value_or(""));
      }

      fn run(const StringView body) -> Result<> {
        Result<String> result = eval(body);

        if (!result)
          return Err(result.error());

        return {};
      }
    };
  } // namespace

  fn InterpretEvalReply(const bool success, const String& result) -> Result<String> {
    if (success)
      return result;

    // Without unsafe mode the Shell answers every script with (false, "").
    if (result.empty())
      ERR(PermissionDenied, String(UNSAFE_MODE_HINT));

    if (result.contains("not found") || result.contains("no window is focused"))
      ERR_FMT(NotFound, "GNOME Shell: {}", result);

    ERR_FMT(PlatformSpecific, "GNOME Shell script failed: {}", result);
  }

  fn DecodeWindowList(const String& json) -> Result<Vec<WindowInfo>> {
    return Decode<Vec<WindowInfo>>(json, "window list");
  }

  fn MakeWindowManager(SessionPtr session) -> SharedPointer<IWindowManager> {
    return std::make_shared<ShellWindowManager>(std::move(session));
  }
} // namespace gnome_mcp::providers::gnome
