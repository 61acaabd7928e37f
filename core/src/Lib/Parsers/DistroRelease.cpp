#include <algorithm>   // std::ranges::reverse
#include <regex>       // std::{regex, smatch, regex_search, regex_constants}
#include <string>      // std::string (String)
#include <string_view> // std::string_view (StringView)

#include "Distro++/Core/Parsers.hpp"

#include "Distro++/Utils/Types.hpp"

using namespace distro::utils::types;

namespace {
  // Written for the reversed line: `)codename( version esaeler name`. Group 1 is
  // the codename, group 2 the version, group 3 the name. The optional `STL ` skips
  // an "LTS" suffix that follows the version in some releases.
  constexpr PCStr REVERSED_RELEASE_PATTERN = R"((?:[^)]*\)(.*)\()? *(?:STL )?([\d.+a-z-]*\d) *(?:esaeler *)?(.+))";

  constexpr PCStr RELEASE_BASENAME_PATTERN = R"((\w+)[-_](release|version)$)";

  // Anchors at the start of the subject only, leaving the pattern's own `$` to anchor the end.
  auto MatchFromStart(const String& subject, std::smatch& match, const std::regex& pattern) -> bool {
    return std::regex_search(subject, match, pattern, std::regex_constants::match_continuous);
  }

  auto ReversedGroup(const std::smatch& match, const usize group) -> String {
    if (!match[group].matched)
      return {};

    String text = match[group].str();
    std::ranges::reverse(text);
    return text;
  }
} // namespace

namespace distro::core::parsers {
  auto MatchReversed(const StringView line) -> Option<ReversedMatch> {
    static const std::regex Pattern(REVERSED_RELEASE_PATTERN);

    // libstdc++ recurses once per character on the open-ended groups.
    if (line.size() > MAX_MATCHED_LENGTH)
      return None;

    const String reversed(line.rbegin(), line.rend());
    std::smatch  match;

    if (!MatchFromStart(reversed, match, Pattern))
      return None;

    return ReversedMatch {
      .name      = ReversedGroup(match, 3),
      .versionId = ReversedGroup(match, 2),
      .codename  = ReversedGroup(match, 1),
    };
  }

  auto MatchReleaseBasename(const StringView basename) -> Option<String> {
    static const std::regex Pattern(RELEASE_BASENAME_PATTERN);

    const String subject(basename);
    std::smatch  match;

    if (!MatchFromStart(subject, match, Pattern))
      return None;

    return match[1].str();
  }

  auto ParseDistroReleaseContent(const StringView line) -> AttributeMap {
    const StringView trimmed = Trim(line);

    AttributeMap props;

    if (trimmed.empty())
      return props;

    const Option<ReversedMatch> match = MatchReversed(trimmed);

    if (!match) {
      props["name"] = String(trimmed);
      return props;
    }

    props["name"] = match->name;

    if (!match->versionId.empty())
      props["version_id"] = match->versionId;

    if (!match->codename.empty())
      props["codename"] = match->codename;

    return props;
  }

  auto ExtractVersionId(const StringView text) -> String {
    const Option<ReversedMatch> match = MatchReversed(Trim(text));

    return match ? match->versionId : String {};
  }
} // namespace distro::core::parsers
