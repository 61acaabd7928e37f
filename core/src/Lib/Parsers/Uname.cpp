#include <regex>       // std::{regex, smatch, regex_search}
#include <string>      // std::string (String)
#include <string_view> // std::string_view (StringView)
#include <utility>     // std::move

#include "Distro++/Core/Parsers.hpp"

#include "Distro++/Utils/Types.hpp"

using namespace distro::utils::types;

namespace distro::core::parsers {
  auto ParseUnameContent(const Span<const String> lines) -> AttributeMap {
    static const std::regex Pattern(R"(^([^\s]+)\s+([\d.]+))");

    AttributeMap props;

    if (lines.empty())
      return props;

    const String first(Trim(lines.front()));
    std::smatch  match;

    if (!std::regex_search(first, match, Pattern))
      return props;

    String name = match[1].str();

    // The Linux kernel release would otherwise win "best version" on distributions
    // that are perfectly identifiable by other means.
    if (name == "Linux")
      return props;

    props["id"]      = ToLower(name);
    props["release"] = match[2].str();
    props["name"]    = std::move(name);

    return props;
  }
} // namespace distro::core::parsers
