#include <charconv> // std::from_chars

#include "GnomeMcp/Handlers/Handlers.hpp"
#include "GnomeMcp/Utils/Logging.hpp"

#include "Factories.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::core::Arguments;
using gnome_mcp::core::ICapabilityHandler;
using gnome_mcp::core::ResolvedOptions;
using gnome_mcp::providers::SnapSide;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace gnome_mcp::handlers {
  namespace {
    using providers::IWindowManager;
    using providers::WindowGeometry;
    using providers::WindowInfo;

    // clang-format off
    constexpr Array<Pair<StringView, WindowAction>, 12> ACTION_NAMES = {{
      { "list",              WindowAction::List            },
      { "focus",             WindowAction::Focus           },
      { "close",             WindowAction::Close           },
      { "minimize",          WindowAction::Minimize        },
      { "maximize",          WindowAction::Maximize        },
      { "switch_workspace",  WindowAction::SwitchWorkspace },
      { "move_to_workspace", WindowAction::MoveToWorkspace },
      { "get_geometry",      WindowAction::GetGeometry     },
      { "set_geometry",      WindowAction::SetGeometry     },
      { "set_position",      WindowAction::SetPosition     },
      { "set_size",          WindowAction::SetSize         },
      { "snap",              WindowAction::Snap            },
    }};
    // clang-format on

    fn ActionName(const WindowAction action) -> StringView {
      for (const auto& [name, value] : ACTION_NAMES)
        if (value == action)
          return name;

      return "unknown";
    }

    /// Window ids are interpolated into Shell scripts, so only plain decimal ids are accepted.
    fn ParseWindowId(const String& text) -> Result<u64> {
      u64 value = 0;

      const char* end = text.data() + text.size(); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

      const auto [ptr, errc] = std::from_chars(text.data(), end, value);

      if (text.empty() || errc != std::errc() || ptr != end)
        ERR_FMT(InvalidArgument, "window_id must be a decimal window id, got '{}'", text);

      return value;
    }

    fn RequireField(const Option<i64>& value, const StringView field, const WindowAction action) -> Result<i64> {
      if (!value)
        ERR_FMT(InvalidArgument, "{} required for {} action", field, ActionName(action));

      return *value;
    }

    fn WindowToJson(const WindowInfo& window) -> mcp::json {
      return {
        {        "id", window.id },
        {     "title", window.title },
        {  "wm_class", window.wmClass },
        { "workspace", window.workspace },
        { "minimized", window.minimized },
        { "maximized", window.maximized },
        {   "focused", window.focused },
      };
    }

    fn Done(const StringView message, const WindowRequest& request) -> Result<mcp::json> {
      mcp::json out = {
        { "message", message },
        {  "action", ActionName(request.action) },
      };

      if (request.windowId)
        out["window_id"] = std::to_string(*request.windowId);

      return out;
    }

    class WindowManagementHandler final : public ICapabilityHandler {
     public:
      explicit WindowManagementHandler(SharedPointer<IWindowManager> windows)
        : m_windows(std::move(windows)) {}

      fn invoke(const Arguments& args, const ResolvedOptions& /*options*/) -> Result<mcp::json> override {
        Result<WindowRequest> request = ParseWindowRequest(args);

        if (!request)
          return Err(request.error());

        Result<IWindowManager*> windows = handlers::Require(m_windows, "window manager");

        if (!windows)
          return Err(windows.error());

        IWindowManager& manager = **windows;
        const u64       id      = request->windowId.value_or(0);

        switch (request->action) {
          case WindowAction::List: {
            Result<Vec<WindowInfo>> list = manager.listWindows();

            if (!list)
              return Err(list.error());

            mcp::json items = mcp::json::array();

            for (const WindowInfo& window : *list)
              items.push_back(WindowToJson(window));

            return mcp::json {
              { "windows", items },
              {   "count", list->size() },
            };
          }

          case WindowAction::GetGeometry: {
            Result<WindowGeometry> geometry = manager.getGeometry(id);

            if (!geometry)
              return Err(geometry.error());

            return mcp::json {
              { "window_id", std::to_string(id) },
              {  "geometry",
               {
                  { "x", geometry->x },
                  { "y", geometry->y },
                  { "width", geometry->width },
                  { "height", geometry->height },
                } },
            };
          }

          case WindowAction::Focus:
            if (Result<> res = manager.focus(id); !res)
              return Err(res.error());
            return Done("Window focused", *request);

          case WindowAction::Close:
            if (Result<> res = manager.close(id); !res)
              return Err(res.error());
            return Done("Window closed", *request);

          case WindowAction::Minimize:
            if (Result<> res = manager.minimize(id); !res)
              return Err(res.error());
            return Done("Window minimized", *request);

          case WindowAction::Maximize:
            if (Result<> res = manager.toggleMaximize(id); !res)
              return Err(res.error());
            return Done("Window maximize toggled", *request);

          case WindowAction::SwitchWorkspace:
            if (Result<> res = manager.switchWorkspace(*request->workspace); !res)
              return Err(res.error());
            return Done(std::format("Switched to workspace {}", *request->workspace), *request);

          case WindowAction::MoveToWorkspace:
            if (Result<> res = manager.moveToWorkspace(id, *request->workspace); !res)
              return Err(res.error());
            return Done(std::format("Window moved to workspace {}", *request->workspace), *request);

          case WindowAction::SetGeometry:
            if (Result<> res = manager.setGeometry(id, { .x = *request->x, .y = *request->y, .width = *request->width, .height = *request->height }); !res)
              return Err(res.error());
            return Done("Window geometry set", *request);

          case WindowAction::SetPosition:
            if (Result<> res = manager.setPosition(id, *request->x, *request->y); !res)
              return Err(res.error());
            return Done("Window moved", *request);

          case WindowAction::SetSize:
            if (Result<> res = manager.setSize(id, *request->width, *request->height); !res)
              return Err(res.error());
            return Done("Window resized", *request);

          case WindowAction::Snap:
            if (Result<> res = manager.snap(request->windowId, *request->side); !res)
              return Err(res.error());
            return Done(std::format("Window snapped {}", *request->side == SnapSide::Left ? "left" : "right"), *request);
        }

        ERR(InternalError, "Unhandled window action");
      }

     private:
      SharedPointer<IWindowManager> m_windows;
    };
  } // namespace

  fn ParseWindowRequest(const Arguments& args) -> Result<WindowRequest> {
    const String actionName = args.getString("action").value_or("");

    Option<WindowAction> action;

    for (const auto& [name, value] : ACTION_NAMES)
      if (name == actionName)
        action = value;

    if (!action)
      ERR_FMT(InvalidArgument, "Unknown window action '{}'", actionName);

    WindowRequest request {
      .action    = *action,
      .windowId  = None,
      .workspace = args.getInteger("workspace"),
      .x         = args.getInteger("x"),
      .y         = args.getInteger("y"),
      .width     = args.getInteger("width"),
      .height    = args.getInteger("height"),
      .side      = None,
    };

    if (Option<String> windowId = args.getString("window_id")) {
      Result<u64> parsed = ParseWindowId(*windowId);

      if (!parsed)
        return Err(parsed.error());

      request.windowId = *parsed;
    }

    if (request.workspace && *request.workspace < 0)
      ERR(InvalidArgument, "workspace must be 0 or greater");

    if (request.width && *request.width <= 0)
      ERR(InvalidArgument, "width must be greater than 0");

    if (request.height && *request.height <= 0)
      ERR(InvalidArgument, "height must be greater than 0");

    const bool needsWindow = *action != WindowAction::List && *action != WindowAction::SwitchWorkspace && *action != WindowAction::Snap;

    if (needsWindow && !request.windowId)
      ERR_FMT(InvalidArgument, "window_id required for {} action", ActionName(*action));

    switch (*action) {
      case WindowAction::SwitchWorkspace:
      case WindowAction::MoveToWorkspace:
        if (Result<i64> res = RequireField(request.workspace, "workspace", *action); !res)
          return Err(res.error());
        break;

      case WindowAction::SetGeometry:
      case WindowAction::SetPosition:
        if (Result<i64> res = RequireField(request.x, "x", *action); !res)
          return Err(res.error());
        if (Result<i64> res = RequireField(request.y, "y", *action); !res)
          return Err(res.error());

        if (*action == WindowAction::SetPosition)
          break;

        [[fallthrough]];

      case WindowAction::SetSize:
        if (Result<i64> res = RequireField(request.width, "width", *action); !res)
          return Err(res.error());
        if (Result<i64> res = RequireField(request.height, "height", *action); !res)
          return Err(res.error());
        break;

      case WindowAction::Snap: {
        const Option<String> position = args.getString("position");

        if (!position)
          ERR(InvalidArgument, "position required for snap action ('left' or 'right')");

        if (*position == "left")
          request.side = SnapSide::Left;
        else if (*position == "right")
          request.side = SnapSide::Right;
        else
          ERR_FMT(InvalidArgument, "Invalid snap position '{}', expected 'left' or 'right'", *position);

        break;
      }

      default: break;
    }

    return request;
  }

  fn MakeWindowManagement(SharedPointer<IWindowManager> windows) -> HandlerPtr {
    return std::make_unique<WindowManagementHandler>(std::move(windows));
  }
} // namespace gnome_mcp::handlers
