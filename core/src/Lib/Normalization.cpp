#include <algorithm>   // std::ranges::replace
#include <string>      // std::string (String)
#include <string_view> // std::string_view (StringView)

#include "Distro++/Core/Normalization.hpp"
#include "Distro++/Core/Parsers.hpp"

#include "Distro++/Utils/Types.hpp"

using namespace distro::utils::types;

namespace distro::core::normalization {
  auto OsIdTable() -> const IdTable& {
    static const IdTable Table;

    return Table;
  }

  auto LsbIdTable() -> const IdTable& {
    static const IdTable Table = {
      { "enterpriseenterprise", "oracle" },      // Oracle Enterprise Linux
      { "redhatenterpriseworkstation", "rhel" }, // RHEL 6, 7 Workstation
      { "redhatenterpriseserver", "rhel" },      // RHEL 6, 7 Server
    };

    return Table;
  }

  auto DistroIdTable() -> const IdTable& {
    static const IdTable Table = {
      { "redhat", "rhel" }, // RHEL 6.x, 7.x
    };

    return Table;
  }

  auto NormalizeId(const StringView rawId, const IdTable& table) -> String {
    String key = parsers::ToLower(rawId);
    std::ranges::replace(key, ' ', '_');

    if (const auto iter = table.find(key); iter != table.end())
      return iter->second;

    return key;
  }
} // namespace distro::core::normalization
