#include "GnomeMcp/Core/Capability.hpp"

using namespace gnome_mcp::utils::types;

namespace gnome_mcp::core {
  namespace {
    // A century keeps the calendar and task windows inside the clock's range.
    constexpr i64 MAX_DAYS = 36500;

    fn Resource(String name, String uri, String description, const HandlerId handler, Vec<OptionSpec> options = {})
      -> CapabilityDescriptor {
      String configKey = name;

      return {
        .name        = std::move(name),
        .kind        = CapabilityKind::Resource,
        .configKey   = std::move(configKey),
        .description = std::move(description),
        .uri         = std::move(uri),
        .options     = std::move(options),
        .params      = {},
        .handler     = handler,
      };
    }

    fn Tool(String name, String configKey, String description, const HandlerId handler, Vec<ParamSpec> params, Vec<OptionSpec> options = {})
      -> CapabilityDescriptor {
      return {
        .name        = std::move(name),
        .kind        = CapabilityKind::Tool,
        .configKey   = std::move(configKey),
        .description = std::move(description),
        .uri         = None,
        .options     = std::move(options),
        .params      = std::move(params),
        .handler     = handler,
      };
    }

    fn BuildCatalog() -> Vec<CapabilityDescriptor> {
      Vec<CapabilityDescriptor> catalog;

      // Resources
      catalog.push_back(Resource(
        "system_info",
        "gnome://system/info",
        "OS version, kernel, hostname, desktop, uptime and memory",
        HandlerId::SystemInfo
      ));

      catalog.push_back(Resource(
        "applications",
        "gnome://applications/installed",
        "List of installed desktop applications",
        HandlerId::Applications
      ));

      catalog.push_back(Resource(
        "calendar",
        "gnome://calendar/events",
        "Calendar events from Evolution Data Server",
        HandlerId::Calendar,
        {
          { .name = "days_ahead", .type = ValueType::Integer, .defaultValue = i64 { 30 }, .nonNegative = true, .maximum = MAX_DAYS },
          { .name = "days_behind", .type = ValueType::Integer, .defaultValue = i64 { 0 }, .nonNegative = true, .maximum = MAX_DAYS },
        }
      ));

      catalog.push_back(Resource(
        "tasks",
        "gnome://tasks/list",
        "Task lists and todos from Evolution Data Server",
        HandlerId::Tasks,
        {
          { .name = "include_completed", .type = ValueType::Boolean, .defaultValue = true },
          { .name = "include_cancelled", .type = ValueType::Boolean, .defaultValue = false },
          { .name = "due_within_days", .type = ValueType::Integer, .defaultValue = i64 { 0 }, .nonNegative = true, .maximum = MAX_DAYS },
        }
      ));

      catalog.push_back(Resource(
        "contacts",
        "gnome://contacts/list",
        "Contact list from Evolution Data Server",
        HandlerId::Contacts,
        {
          { .name = "email_only", .type = ValueType::Boolean, .defaultValue = false },
        }
      ));

      catalog.push_back(Resource(
        "audio",
        "gnome://audio/status",
        "Current volume, mute state and media players",
        HandlerId::AudioStatus
      ));

      // Tools
      catalog.push_back(Tool(
        "send_notification",
        "notifications",
        "Send a desktop notification",
        HandlerId::SendNotification,
        {
          { .name = "summary", .type = ValueType::String, .required = true, .description = "Notification summary" },
          { .name = "body", .type = ValueType::String, .required = true, .description = "Notification body" },
        }
      ));

      catalog.push_back(Tool(
        "launch_application",
        "applications",
        "Launch an application by name or desktop id",
        HandlerId::LaunchApplication,
        {
          { .name = "app_name", .type = ValueType::String, .required = true, .description = "Application name (e.g., 'Firefox', 'Terminal')" },
        }
      ));

      catalog.push_back(Tool(
        "open_file",
        "open_file",
        "Open a file or URL with its default application",
        HandlerId::OpenFile,
        {
          { .name = "path", .type = ValueType::String, .required = true, .description = "File path or URL to open (e.g., '/home/user/document.pdf', 'https://example.com')" },
        }
      ));

      catalog.push_back(Tool(
        "set_wallpaper",
        "wallpaper",
        "Set the desktop wallpaper from a local file path",
        HandlerId::SetWallpaper,
        {
          { .name = "image_path", .type = ValueType::String, .required = true, .description = "Full path to a JPEG or PNG image" },
        }
      ));

      catalog.push_back(Tool(
        "set_volume",
        "audio",
        "Control system volume and mute/unmute",
        HandlerId::SetVolume,
        {
          { .name = "volume", .type = ValueType::Number, .description = "Volume level (0-100), or a signed change when relative is true", .minimum = -100.0, .maximum = 100.0 },
          { .name = "mute", .type = ValueType::Boolean, .description = "Mute (true) or unmute (false) the system" },
          { .name = "relative", .type = ValueType::Boolean, .description = "If true, volume is a relative change (+10, -5)" },
          { .name = "direction", .type = ValueType::String, .description = "Step the volume up or down by the configured step", .allowed = { "up", "down" } },
        },
        {
          { .name = "volume_step", .type = ValueType::Integer, .defaultValue = i64 { 10 }, .nonNegative = true, .maximum = i64 { 100 } },
        }
      ));

      catalog.push_back(Tool(
        "media_control",
        "audio",
        "Control media playback (play, pause, skip, etc.) via MPRIS",
        HandlerId::MediaControl,
        {
          { .name = "action", .type = ValueType::String, .required = true, .description = "Media control action to perform", .allowed = { "play", "pause", "play_pause", "stop", "next", "previous" } },
          { .name = "player", .type = ValueType::String, .description = "Specific player to control (uses the first player if not specified)" },
        }
      ));

      catalog.push_back(Tool(
        "quick_settings",
        "quick_settings",
        "Toggle GNOME quick settings",
        HandlerId::QuickSettings,
        {
          { .name = "setting", .type = ValueType::String, .required = true, .description = "Which boolean setting to toggle", .allowed = { "wifi", "bluetooth", "night_light", "do_not_disturb", "dark_style" } },
          { .name = "enabled", .type = ValueType::Boolean, .required = true, .description = "true to enable, false to disable the setting" },
        }
      ));

      catalog.push_back(Tool(
        "take_screenshot",
        "screenshot",
        "Take a screenshot using the desktop portal",
        HandlerId::TakeScreenshot,
        {
          { .name = "interactive", .type = ValueType::Boolean, .description = "Show interactive screenshot dialog for area selection" },
        },
        {
          { .name = "interactive", .type = ValueType::Boolean, .defaultValue = false },
        }
      ));

      catalog.push_back(Tool(
        "window_management",
        "window_management",
        "Manage windows and workspaces via GNOME Shell (requires unsafe mode). Workspaces are 0-indexed.",
        HandlerId::WindowManagement,
        {
          { .name = "action", .type = ValueType::String, .required = true, .description = "Action to perform", .allowed = { "list", "focus", "close", "minimize", "maximize", "switch_workspace", "move_to_workspace", "get_geometry", "set_geometry", "set_position", "set_size", "snap" } },
          { .name = "window_id", .type = ValueType::String, .description = "Window ID for focus/close/minimize/maximize/move_to_workspace/geometry actions" },
          { .name = "workspace", .type = ValueType::Integer, .description = "Workspace number for switch_workspace/move_to_workspace actions (0-based)" },
          { .name = "x", .type = ValueType::Integer, .description = "X coordinate for set_geometry/set_position actions" },
          { .name = "y", .type = ValueType::Integer, .description = "Y coordinate for set_geometry/set_position actions" },
          { .name = "width", .type = ValueType::Integer, .description = "Width for set_geometry/set_size actions" },
          { .name = "height", .type = ValueType::Integer, .description = "Height for set_geometry/set_size actions" },
          { .name = "position", .type = ValueType::String, .description = "Position for snap action", .allowed = { "left", "right" } },
        }
      ));

      catalog.push_back(Tool(
        "keyring_management",
        "keyring",
        "Store, retrieve and delete secrets in the GNOME keyring",
        HandlerId::KeyringManagement,
        {
          { .name = "action", .type = ValueType::String, .required = true, .description = "Action to perform", .allowed = { "store", "retrieve", "delete" } },
          { .name = "label", .type = ValueType::String, .description = "Human-readable label for the secret (required for store)" },
          { .name = "secret", .type = ValueType::String, .description = "The secret value to store (required for store)" },
          { .name = "attributes", .type = ValueType::String, .description = "JSON object of string attributes (e.g. {\"application\": \"myapp\", \"username\": \"user\"})" },
        }
      ));

      return catalog;
    }
  } // namespace

  fn Catalog() -> const Vec<CapabilityDescriptor>& {
    static const Vec<CapabilityDescriptor> CatalogEntries = BuildCatalog();
    return CatalogEntries;
  }
} // namespace gnome_mcp::core
