#include <regex>       // std::{regex, smatch, regex_search}
#include <string>      // std::string (String)
#include <string_view> // std::string_view (StringView)
#include <utility>     // std::move

#include "Distro++/Core/Parsers.hpp"

#include "Distro++/Utils/Error.hpp"
#include "Distro++/Utils/Types.hpp"

using namespace distro::utils::types;

namespace {
  auto StripChars(StringView text, const StringView chars) -> StringView {
    const usize first = text.find_first_not_of(chars);

    if (first == StringView::npos)
      return {};

    return text.substr(first, text.find_last_not_of(chars) - first + 1);
  }

  /**
   * @brief Pulls the codename out of a VERSION value.
   *
   * Handles both `7 (Core)` (RHEL, CentOS, Fedora) and `16.04.1 LTS, Xenial Xerus`
   * (older Ubuntu). Returns `""` when neither form is present.
   */
  auto CodenameFromVersion(const String& version) -> String {
    static const std::regex CODENAME_PATTERN(R"((\(\D+\))|,(\s+)?\D+)");

    std::smatch match;

    if (version.size() > distro::core::parsers::MAX_MATCHED_LENGTH || !std::regex_search(version, match, CODENAME_PATTERN))
      return {};

    const String whole = match[0].str();

    StringView codename = StripChars(whole, "()");
    codename            = StripChars(codename, ",");

    return String(distro::core::parsers::Trim(codename));
  }
} // namespace

namespace distro::core::parsers {
  auto ParseOsReleaseContent(const StringView content) -> Result<AttributeMap> {
    const Vec<String> words = TRY(TokenizeShell(content));

    AttributeMap props;

    for (const String& word : words) {
      const usize equals = word.find('=');

      // Anything that is not an assignment would be a command, which os-release does not allow.
      if (equals == String::npos)
        continue;

      const StringView key(word.data(), equals);
      String           value = word.substr(equals + 1);

      if (key == "VERSION")
        props["codename"] = CodenameFromVersion(value);

      props[ToLower(key)] = std::move(value);
    }

    return props;
  }
} // namespace distro::core::parsers
