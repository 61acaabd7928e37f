#include <algorithm>   // std::ranges::transform
#include <ranges>      // std::views::split
#include <string>      // std::string (String)
#include <string_view> // std::string_view (StringView)

#include "Distro++/Core/Parsers.hpp"

#include "Distro++/Utils/Types.hpp"

using namespace distro::utils::types;

namespace {
  constexpr StringView ASCII_WHITESPACE = " \t\n\r\f\v";
} // namespace

namespace distro::core::parsers {
  auto Trim(const StringView text) -> StringView {
    const usize first = text.find_first_not_of(ASCII_WHITESPACE);

    if (first == StringView::npos)
      return {};

    const usize last = text.find_last_not_of(ASCII_WHITESPACE);

    return text.substr(first, last - first + 1);
  }

  auto ToLower(const StringView text) -> String {
    String lower(text);

    std::ranges::transform(lower, lower.begin(), [](const char chr) -> char {
      return (chr >= 'A' && chr <= 'Z') ? static_cast<char>(chr - 'A' + 'a') : chr;
    });

    return lower;
  }

  auto SplitLines(const StringView text) -> Vec<String> {
    Vec<String> lines;

    if (text.empty())
      return lines;

    for (auto lineRange : text | std::views::split('\n')) {
      StringView line(lineRange.begin(), lineRange.end());

      if (line.ends_with('\r'))
        line.remove_suffix(1);

      lines.emplace_back(line);
    }

    // "a\nb\n" is two lines, not three.
    if (text.ends_with('\n'))
      lines.pop_back();

    return lines;
  }
} // namespace distro::core::parsers
