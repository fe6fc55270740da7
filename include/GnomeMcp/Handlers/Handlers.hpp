#pragma once

#include "GnomeMcp/Core/Capability.hpp"
#include "GnomeMcp/Core/Router.hpp"
#include "GnomeMcp/Providers/Desktop.hpp"
#include "GnomeMcp/Utils/Definitions.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

namespace gnome_mcp::handlers {
  namespace {
    using utils::types::i64;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::u64;
    using utils::types::u8;
    using utils::types::UniquePointer;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief Creates the handler for a capability, bound to the providers it needs.
   */
  fn MakeHandler(core::HandlerId handler, const providers::DesktopProviders& providers) -> UniquePointer<core::ICapabilityHandler>;

  /**
   * @brief One handler per HandlerId, ready for the router.
   */
  fn MakeHandlerTable(const providers::DesktopProviders& providers) -> core::HandlerTable;

  /// True when a `set_volume` call adjusts the current level instead of replacing it.
  fn VolumeChangeIsRelative(const core::Arguments& args) -> bool;

  /**
   * @brief Checks `set_volume` arguments that need no mixer state.
   * @return InvalidArgument for `volume` with `direction`, for an empty request,
   * or for an absolute level outside 0-100.
   */
  fn ValidateVolumeRequest(const core::Arguments& args) -> Result<>;

  /**
   * @brief Works out the new volume level for a `set_volume` call.
   * @param args Validated `set_volume` arguments.
   * @param current Current level, 0-100.
   * @param step Configured `volume_step`.
   * @return The target level, None when only the mute state changes, or an
   * InvalidArgument error for contradictory or out-of-range arguments.
   */
  fn ComputeVolumeTarget(const core::Arguments& args, i64 current, i64 step) -> Result<Option<i64>>;

  enum class WindowAction : u8 {
    List,
    Focus,
    Close,
    Minimize,
    Maximize,
    SwitchWorkspace,
    MoveToWorkspace,
    GetGeometry,
    SetGeometry,
    SetPosition,
    SetSize,
    Snap,
  };

  /**
   * @struct WindowRequest
   * @brief A `window_management` call whose per-action requirements have been checked.
   */
  struct WindowRequest {
    WindowAction                   action;
    Option<u64>                    windowId;
    Option<i64>                    workspace;
    Option<i64>                    x;
    Option<i64>                    y;
    Option<i64>                    width;
    Option<i64>                    height;
    Option<providers::SnapSide>    side;
  };

  /**
   * @brief Checks the fields required by the requested action.
   * @return The request, or an InvalidArgument error naming the missing or malformed field.
   */
  fn ParseWindowRequest(const core::Arguments& args) -> Result<WindowRequest>;

  /**
   * @brief Decodes the `attributes` argument of `keyring_management`, a JSON object of strings.
   * @return An empty map when absent, or an InvalidArgument error when malformed.
   */
  fn ParseSecretAttributes(const Option<String>& encoded) -> Result<providers::SecretAttributes>;

  /**
   * @brief Applies the `tasks` resource options.
   *
   * Tasks without a due date are never dropped by the due-date window.
   */
  fn FilterTasks(Vec<providers::Task> tasks, bool includeCompleted, bool includeCancelled, i64 dueWithinDays, const providers::Timestamp& now)
    -> Vec<providers::Task>;
} // namespace gnome_mcp::handlers
