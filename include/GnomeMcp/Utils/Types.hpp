/**
 * @file Types.hpp
 * @brief Short names for the standard types used throughout gnome-mcp.
 *
 * Every module pulls these in with anonymous-namespace using-declarations,
 * so the aliases stay the same across the tree.
 */

#pragma once

#include <array>       // std::array
#include <cstdint>     // std::{u,}int{8,32,64}_t
#include <functional>  // std::function
#include <map>         // std::map
#include <memory>      // std::{shared_ptr, unique_ptr}
#include <mutex>       // std::{mutex, lock_guard}
#include <optional>    // std::optional
#include <span>        // std::span
#include <string>      // std::string
#include <string_view> // std::string_view
#include <utility>     // std::pair
#include <vector>      // std::vector

namespace gnome_mcp::utils::types {
  // Fixed-width numbers. Volume levels, window ids and timeouts all go through these.
  using u8    = std::uint8_t;
  using u32   = std::uint32_t;
  using u64   = std::uint64_t;
  using i32   = std::int32_t;
  using i64   = std::int64_t;
  using f64   = double;
  using usize = std::size_t;

  /// Return type of functions that only report success or failure.
  using Unit = void;

  using String     = std::string;
  using StringView = std::string_view;
  using PCStr      = const char*; ///< Null-terminated string handed to C APIs (libdbus, execvp).

  using Exception = std::exception;
  using Mutex     = std::mutex;
  using LockGuard = std::lock_guard<Mutex>;

  inline constexpr std::nullopt_t None = std::nullopt;

  template <typename Tp>
  using Option = std::optional<Tp>;

  template <typename Tp, usize sz>
  using Array = std::array<Tp, sz>;

  template <typename Tp>
  using Vec = std::vector<Tp>;

  /// Non-owning view, used for argv.
  template <typename Tp, usize sz = std::dynamic_extent>
  using Span = std::span<Tp, sz>;

  template <typename T1, typename T2>
  using Pair = std::pair<T1, T2>;

  /**
   * @brief Ordered map.
   *
   * Ordering keeps tools/list, resources/list and option dumps deterministic.
   */
  template <typename Key, typename Val, typename Cmp = std::less<Key>>
  using Map = std::map<Key, Val, Cmp>;

  template <typename Tp>
  using SharedPointer = std::shared_ptr<Tp>;

  template <typename Tp, typename Dp = std::default_delete<Tp>>
  using UniquePointer = std::unique_ptr<Tp, Dp>;

  /// Type-erased callable, used for provider factories.
  template <typename Sig>
  using Fn = std::function<Sig>;
} // namespace gnome_mcp::utils::types
