/**
 * @file Parsers.hpp
 * @brief Grammar parsers for the four distribution data sources.
 *
 * Every parser is a pure function of its input text; reading files and running
 * commands is left to Distribution. Each one turns its input into an
 * AttributeMap with lower-case keys and returns an empty map when the input
 * carries no information.
 */

#pragma once

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace distro::core::parsers {
  namespace types = ::distro::utils::types;

  /**
   * @brief Splits @p input into words with POSIX shell quoting rules.
   *
   * Whitespace separates words. `#` outside quotes starts a comment that runs to the end
   * of the line. Single quotes are literal. Inside double quotes only `\"`, `\\`, `\$`
   * and `` \` `` are escapes and every other backslash is kept. Outside quotes a
   * backslash escapes the next character. Backslash-newline is removed everywhere
   * except inside single quotes.
   *
   * @return The words, or ParseError on an unterminated quote or a trailing backslash.
   *
   * @code
   * TokenizeShell(R"(NAME="Ubuntu Linux" # distro)") // => { "NAME=Ubuntu Linux" }
   * @endcode
   */
  auto TokenizeShell(types::StringView input) -> types::Result<types::Vec<types::String>>;

  /**
   * @brief Parses the content of an os-release file.
   *
   * Each `KEY=value` word becomes `props[lower(KEY)] = value`; other words are
   * ignored. A `VERSION` key also yields a `codename` entry, taken from the
   * parenthesized or comma-separated suffix of the version (`""` when it has none).
   *
   * @code
   * ParseOsReleaseContent("NAME=Ubuntu\nVERSION=\"18.04.1 LTS (Bionic Beaver)\"\n");
   * // => { codename: "Bionic Beaver", name: "Ubuntu", version: "18.04.1 LTS (Bionic Beaver)" }
   * @endcode
   */
  auto ParseOsReleaseContent(types::StringView content) -> types::Result<types::AttributeMap>;

  /**
   * @brief Parses the output lines of `lsb_release -a`.
   *
   * `Distributor ID:	Ubuntu` becomes `distributor_id = "Ubuntu"`. Lines without a
   * colon are skipped.
   */
  auto ParseLsbReleaseContent(types::Span<const types::String> lines) -> types::AttributeMap;

  /**
   * @brief Parses the first line of a legacy distribution release file.
   *
   * `CentOS Linux release 7.1.1503 (Core)` becomes
   * `{ codename: "Core", name: "CentOS Linux", version_id: "7.1.1503" }`. A line the
   * pattern does not recognize is taken whole as the name.
   */
  auto ParseDistroReleaseContent(types::StringView line) -> types::AttributeMap;

  /**
   * @brief Parses the output lines of `uname -rs`.
   *
   * A kernel name of exactly `Linux` carries no distribution information and yields an
   * empty map; anything else (e.g. `FreeBSD 13.2-RELEASE`) yields `id`, `name` and
   * `release`.
   */
  auto ParseUnameContent(types::Span<const types::String> lines) -> types::AttributeMap;

  /**
   * @struct ReversedMatch
   * @brief Captures of the distro release pattern, already reversed back into reading order.
   */
  struct ReversedMatch {
    types::String name;
    types::String versionId;
    types::String codename;
  };

  /**
   * @brief Longest text handed to a regular expression. Longer text is treated as not matching.
   */
  constexpr types::usize MAX_MATCHED_LENGTH = 4096;

  /**
   * @brief Matches a distro release line from its end.
   *
   * The version and codename sit at the end of a release line while the name has
   * arbitrary length, so the line is reversed and matched at the start with a pattern
   * written for reversed text. The captures are reversed back before returning.
   *
   * @param line A single line, already trimmed.
   * @return The captures, or None when the pattern does not match or the line is
   *         longer than MAX_MATCHED_LENGTH.
   */
  auto MatchReversed(types::StringView line) -> types::Option<ReversedMatch>;

  /**
   * @brief Recognizes release-file basenames like `centos-release` or `slackware-version`.
   * @return The distribution word (`centos`, `slackware`), or None.
   */
  auto MatchReleaseBasename(types::StringView basename) -> types::Option<types::String>;

  /**
   * @brief Extracts the version number a distro release line would yield.
   *
   * Applied to free-form strings such as a PRETTY_NAME or an lsb_release description.
   * @return The `version_id` capture, or `""`.
   */
  auto ExtractVersionId(types::StringView text) -> types::String;

  /**
   * @brief Splits text into lines on `\n`, dropping a trailing `\r` from each.
   */
  auto SplitLines(types::StringView text) -> types::Vec<types::String>;

  /**
   * @brief Strips ASCII whitespace from both ends.
   */
  auto Trim(types::StringView text) -> types::StringView;

  /**
   * @brief ASCII lower-casing; bytes outside A-Z are left alone.
   */
  auto ToLower(types::StringView text) -> types::String;
} // namespace distro::core::parsers
