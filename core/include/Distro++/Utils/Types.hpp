/**
 * @file Types.hpp
 * @brief Type aliases shared by every Distro++ module.
 *
 * The aliases keep signatures short and make the ownership of a value visible at
 * a glance (`String` owns, `StringView` borrows, `Result` may fail).
 */

#pragma once

#include <ankerl/unordered_dense.h> // ankerl::unordered_dense::map (UnorderedMap)
#include <array>                    // std::array (Array)
#include <cstdint>                  // std::{uint8_t, int32_t, ...}
#include <expected>                 // std::{expected, unexpected}
#include <functional>               // std::function (Fn)
#include <map>                      // std::map (Map)
#include <memory>                   // std::unique_ptr (UniquePointer)
#include <mutex>                    // std::{mutex, lock_guard} (Mutex, LockGuard)
#include <optional>                 // std::optional (Option)
#include <span>                     // std::span (Span)
#include <string>                   // std::string (String)
#include <string_view>              // std::string_view (StringView)
#include <vector>                   // std::vector (Vec)

namespace distro::utils {
  // Forward decl for Result and Err
  namespace error {
    struct DistroError;
  } // namespace error

  namespace types {
    /**
     * @brief 8-bit unsigned integer.
     */
    using u8 = std::uint8_t;

    /**
     * @brief 32-bit signed integer.
     */
    using i32 = std::int32_t;

    /**
     * @brief Unsigned size type (result of sizeof).
     */
    using usize = std::size_t;

    /**
     * @brief Owning, mutable string.
     */
    using String = std::string;

    /**
     * @brief Non-owning view of a string.
     */
    using StringView = std::string_view;

    /**
     * @brief Single character type.
     */
    using CStr = char;

    /**
     * @brief Pointer to a null-terminated C-style string.
     */
    using PCStr = const char*;

    /**
     * @brief Represents a unit type.
     */
    using Unit = void;

    /**
     * @brief Standard exception type.
     */
    using Exception = std::exception;

    /**
     * @brief Mutex type for synchronization.
     */
    using Mutex = std::mutex;

    /**
     * @brief RAII-style lock guard for mutexes.
     */
    using LockGuard = std::lock_guard<Mutex>;

    /**
     * @brief Represents a value that may or may not be present.
     * @tparam Tp The type of the potential value.
     */
    template <typename Tp>
    using Option = std::optional<Tp>;

    /**
     * @brief Represents an empty optional value.
     */
    inline constexpr std::nullopt_t None = std::nullopt;

    /**
     * @brief Fixed-size array.
     */
    template <typename Tp, usize sz>
    using Array = std::array<Tp, sz>;

    /**
     * @brief Dynamic-size array.
     */
    template <typename Tp>
    using Vec = std::vector<Tp>;

    /**
     * @brief Non-owning view of a contiguous sequence of elements.
     */
    template <typename Tp, usize sz = std::dynamic_extent>
    using Span = std::span<Tp, sz>;

    /**
     * @brief Ordered map with transparent comparison, so lookups accept a StringView.
     */
    template <typename Key, typename Val>
    using Map = std::map<Key, Val, std::less<>>;

    /**
     * @brief High-performance unordered map using Robin Hood hashing.
     */
    template <typename Key, typename Val>
    using UnorderedMap = ankerl::unordered_dense::map<Key, Val>;

    /**
     * @brief Manages unique ownership of a dynamically allocated object.
     */
    template <typename Tp, typename Dp = std::default_delete<Tp>>
    using UniquePointer = std::unique_ptr<Tp, Dp>;

    /**
     * @brief Represents a callable object.
     */
    template <typename Tp>
    using Fn = std::function<Tp>;

    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Either a success value of type Tp or an error of type Er.
     */
    template <typename Tp = Unit, typename Er = error::DistroError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     */
    template <typename Er = error::DistroError>
    using Err = std::unexpected<Er>;

    /**
     * @brief Key-value attributes produced by a single data source.
     *
     * Keys are lower-case attribute names; a missing key means the source did not
     * provide that attribute.
     */
    using AttributeMap = Map<String, String>;
  } // namespace types
} // namespace distro::utils
