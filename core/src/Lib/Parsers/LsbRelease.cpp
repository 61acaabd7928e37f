#include <algorithm>   // std::ranges::replace
#include <string>      // std::string (String)
#include <string_view> // std::string_view (StringView)

#include "Distro++/Core/Parsers.hpp"

#include "Distro++/Utils/Types.hpp"

using namespace distro::utils::types;

namespace distro::core::parsers {
  auto ParseLsbReleaseContent(const Span<const String> lines) -> AttributeMap {
    AttributeMap props;

    for (const StringView line : lines) {
      const usize colon = line.find(':');

      if (colon == StringView::npos)
        continue;

      String key = ToLower(Trim(line.substr(0, colon)));
      std::ranges::replace(key, ' ', '_');

      props[std::move(key)] = String(Trim(line.substr(colon + 1)));
    }

    return props;
  }
} // namespace distro::core::parsers
