/**
 * @file Types.hpp
 * @brief Core type aliases used throughout Spank++
 * @author Spank++ Team
 * @version 1.0.0
 */

#pragma once

#include <array>         // std::array
#include <cstddef>       // std::size_t, std::ptrdiff_t
#include <cstdint>       // std::{u}int{8,16,32,64}_t
#include <expected>      // std::{expected, unexpected}
#include <map>           // std::map
#include <memory>        // std::{unique_ptr, shared_ptr}
#include <mutex>         // std::{mutex, lock_guard, unique_lock}
#include <optional>      // std::{optional, nullopt}
#include <span>          // std::span
#include <string>        // std::string
#include <string_view>   // std::string_view
#include <tuple>         // std::tuple
#include <unordered_map> // std::unordered_map
#include <utility>       // std::pair
#include <vector>        // std::vector

/// Trailing-return function shorthand used across the codebase.
#define fn auto

namespace spankpp::utils::error {
  class SpankError;
} // namespace spankpp::utils::error

namespace spankpp::utils::types {
  using u8  = std::uint8_t;
  using u16 = std::uint16_t;
  using u32 = std::uint32_t;
  using u64 = std::uint64_t;

  using i8  = std::int8_t;
  using i16 = std::int16_t;
  using i32 = std::int32_t;
  using i64 = std::int64_t;

  using f32 = float;
  using f64 = double;

  using usize = std::size_t;
  using isize = std::ptrdiff_t;

  using String     = std::string;
  using StringView = std::string_view;
  using PCStr      = const char*;
  using CStr       = char;
  using RawPointer = void*;

  /// Empty value for results that carry no payload.
  struct Unit {
    constexpr fn operator==(const Unit&) const -> bool = default;
  };

  template <typename T>
  using Vec = std::vector<T>;

  template <typename T, usize N>
  using Array = std::array<T, N>;

  template <typename T, usize N = std::dynamic_extent>
  using Span = std::span<T, N>;

  template <typename Key, typename Val>
  using Map = std::map<Key, Val>;

  template <typename Key, typename Val>
  using UnorderedMap = std::unordered_map<Key, Val>;

  template <typename First, typename Second>
  using Pair = std::pair<First, Second>;

  template <typename... Ts>
  using Tuple = std::tuple<Ts...>;

  template <typename T>
  using Option = std::optional<T>;

  inline constexpr std::nullopt_t None = std::nullopt;

  template <typename T>
  constexpr fn Some(T&& value) -> Option<std::decay_t<T>> {
    return std::make_optional<std::decay_t<T>>(std::forward<T>(value));
  }

  template <typename T = Unit, typename E = error::SpankError>
  using Result = std::expected<T, E>;

  template <typename E>
  constexpr fn Err(E&& error) -> std::unexpected<std::decay_t<E>> {
    return std::unexpected<std::decay_t<E>>(std::forward<E>(error));
  }

  template <typename T, typename Deleter = std::default_delete<T>>
  using UniquePointer = std::unique_ptr<T, Deleter>;

  template <typename T>
  using SharedPointer = std::shared_ptr<T>;

  using Mutex     = std::mutex;
  using LockGuard = std::lock_guard<Mutex>;
  using UniqueLock = std::unique_lock<Mutex>;
} // namespace spankpp::utils::types
