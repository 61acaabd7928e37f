#pragma once

#include <utility> // std::forward

#include "Types.hpp"

namespace distro::utils {
  namespace types = ::distro::utils::types;

  /**
   * @class Lazy
   * @brief A value computed at most once, on first request, and then cached for the
   *        lifetime of the owner.
   *
   * The first caller runs the supplied function while holding the internal mutex;
   * concurrent first callers block until it finishes and then see the same value.
   * The cached value is never invalidated.
   *
   * @code
   * mutable Lazy<AttributeMap> m_osRelease;
   *
   * auto osReleaseInfo() const -> const AttributeMap& {
   *   return m_osRelease.getOrCompute([this] { return loadOsRelease(); });
   * }
   * @endcode
   */
  template <typename T>
  class Lazy {
   public:
    Lazy() = default;

    Lazy(const Lazy&)                    = delete;
    Lazy(Lazy&&)                         = delete;
    auto operator=(const Lazy&) -> Lazy& = delete;
    auto operator=(Lazy&&) -> Lazy&      = delete;
    ~Lazy()                              = default;

    /**
     * @brief Returns the cached value, computing it with @p compute on first use.
     *
     * If @p compute throws, nothing is cached and the next call tries again.
     */
    template <typename Fn>
    auto getOrCompute(Fn&& compute) const -> const T& {
      const types::LockGuard lock(m_mutex);

      if (!m_value)
        m_value.emplace(std::forward<Fn>(compute)());

      return *m_value;
    }

    /**
     * @brief Whether the value has already been computed.
     */
    [[nodiscard]] auto isComputed() const -> bool {
      const types::LockGuard lock(m_mutex);
      return m_value.has_value();
    }

   private:
    mutable types::Mutex             m_mutex;
    mutable types::Option<T>         m_value;
  };
} // namespace distro::utils
