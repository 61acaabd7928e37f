/**
 * @file Normalization.hpp
 * @brief Translation tables that map raw distribution IDs to canonical ones.
 *
 * The same distribution reports different IDs through different sources and
 * across its own releases (Oracle Linux is `ol` in os-release but
 * `EnterpriseEnterprise` in lsb_release). Each source has its own table.
 */

#pragma once

#include "../Utils/Types.hpp"

namespace distro::core::normalization {
  namespace types = ::distro::utils::types;

  using IdTable = types::UnorderedMap<types::String, types::String>;

  /**
   * @brief Table for the `ID` field of os-release.
   */
  auto OsIdTable() -> const IdTable&;

  /**
   * @brief Table for the `Distributor ID` reported by lsb_release.
   */
  auto LsbIdTable() -> const IdTable&;

  /**
   * @brief Table for IDs derived from release-file basenames and from uname.
   */
  auto DistroIdTable() -> const IdTable&;

  /**
   * @brief Lower-cases @p rawId, replaces spaces with underscores and looks the
   *        result up in @p table. Keys absent from the table pass through.
   *
   * Normalizing an already normalized ID returns it unchanged.
   */
  auto NormalizeId(types::StringView rawId, const IdTable& table) -> types::String;

  inline auto NormalizeOsId(const types::StringView rawId) -> types::String {
    return NormalizeId(rawId, OsIdTable());
  }

  inline auto NormalizeLsbId(const types::StringView rawId) -> types::String {
    return NormalizeId(rawId, LsbIdTable());
  }

  inline auto NormalizeDistroId(const types::StringView rawId) -> types::String {
    return NormalizeId(rawId, DistroIdTable());
  }
} // namespace distro::core::normalization
