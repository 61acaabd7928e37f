#include <string>      // std::string (String)
#include <string_view> // std::string_view (StringView)
#include <utility>     // std::move

#include "Distro++/Core/Parsers.hpp"

#include "Distro++/Utils/Error.hpp"
#include "Distro++/Utils/Types.hpp"

using enum distro::utils::error::DistroErrorCode;
using namespace distro::utils::types;

namespace {
  enum class LexState : u8 {
    Whitespace,
    Word,
    SingleQuote,
    DoubleQuote,
  };

  constexpr auto IsShellSpace(const char chr) -> bool {
    return chr == ' ' || chr == '\t' || chr == '\r' || chr == '\n';
  }

  // Characters a backslash escapes inside double quotes; any other backslash is literal there.
  constexpr auto IsDoubleQuoteEscapable(const char chr) -> bool {
    return chr == '"' || chr == '\\' || chr == '$' || chr == '`';
  }

  /**
   * @brief Accumulates the current word. A word exists as soon as any part of it
   *        (even an empty pair of quotes) has been seen.
   */
  class WordBuilder {
   public:
    auto append(const char chr) -> Unit {
      m_word += chr;
      m_started = true;
    }

    auto start() -> Unit {
      m_started = true;
    }

    auto flushInto(Vec<String>& words) -> Unit {
      if (!m_started)
        return;

      words.emplace_back(std::move(m_word));
      m_word.clear();
      m_started = false;
    }

   private:
    String m_word;
    bool   m_started = false;
  };
} // namespace

namespace distro::core::parsers {
  auto TokenizeShell(const StringView input) -> Result<Vec<String>> {
    Vec<String> words;
    WordBuilder word;
    LexState    state = LexState::Whitespace;

    for (usize idx = 0; idx < input.size(); ++idx) {
      const char chr = input[idx];

      switch (state) {
        case LexState::Whitespace:
        case LexState::Word:
          if (IsShellSpace(chr)) {
            word.flushInto(words);
            state = LexState::Whitespace;
          } else if (chr == '#') {
            word.flushInto(words);
            state = LexState::Whitespace;

            const usize eol = input.find('\n', idx);
            idx             = (eol == StringView::npos) ? input.size() : eol;
          } else if (chr == '\\') {
            if (idx + 1 >= input.size())
              ERR(ParseError, "No escaped character after trailing backslash");

            const char next = input[++idx];

            // Line continuation: joins the two lines without producing a character.
            if (next == '\n')
              continue;

            word.append(next);
            state = LexState::Word;
          } else if (chr == '\'') {
            word.start();
            state = LexState::SingleQuote;
          } else if (chr == '"') {
            word.start();
            state = LexState::DoubleQuote;
          } else {
            word.append(chr);
            state = LexState::Word;
          }
          break;

        case LexState::SingleQuote:
          if (chr == '\'')
            state = LexState::Word;
          else
            word.append(chr);
          break;

        case LexState::DoubleQuote:
          if (chr == '"') {
            state = LexState::Word;
          } else if (chr == '\\' && idx + 1 < input.size()) {
            const char next = input[idx + 1];

            if (next == '\n') {
              ++idx;
            } else if (IsDoubleQuoteEscapable(next)) {
              word.append(next);
              ++idx;
            } else {
              word.append(chr);
            }
          } else {
            word.append(chr);
          }
          break;
      }
    }

    if (state == LexState::SingleQuote || state == LexState::DoubleQuote)
      ERR(ParseError, "No closing quotation");

    word.flushInto(words);

    return words;
  }
} // namespace distro::core::parsers
