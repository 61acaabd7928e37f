/**
 * @file ArgumentParser.hpp
 * @brief Small command-line argument parser used by the `distro` tool.
 *
 * Supports flags, valued options, enum-style choices (through magic_enum) and
 * binding parsed values straight into an options struct with bindTo().
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform}
#include <cctype>                    // std::tolower
#include <concepts>                  // std::convertible_to
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_name, enum_cast, enum_values}
#include <sstream>                   // std::ostringstream
#include <utility>                   // std::forward
#include <variant>                   // std::variant

#include "Error.hpp"
#include "Types.hpp"

namespace distro::utils::argparse {
  namespace error = ::distro::utils::error;
  namespace types = ::distro::utils::types;

  class Argument;

  using ArgValue   = std::variant<bool, types::String>;
  using ArgBinding = types::Fn<void(const Argument&)>;
  using ArgChoices = types::Vec<types::String>;

  inline auto ToLower(types::StringView str) -> types::String {
    types::String lower(str);
    std::ranges::transform(lower, lower.begin(), [](types::u8 chr) -> types::CStr { return static_cast<types::CStr>(std::tolower(chr)); });
    return lower;
  }

  /**
   * @brief String conversions for scoped enums, via magic_enum.
   * @tparam EnumType The enum type
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    /**
     * @brief Lower-cased names of every enumerator, in declaration order.
     */
    static auto getChoices() -> const ArgChoices& {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      static const ArgChoices CACHED_CHOICES = [] {
        ArgChoices vec;
        for (const auto value : magic_enum::enum_values<EnumType>())
          vec.emplace_back(ToLower(magic_enum::enum_name(value)));
        return vec;
      }();

      return CACHED_CHOICES;
    }

    // Case-insensitive; unknown names fall back to the first enumerator.
    static auto stringToEnum(types::StringView str) -> EnumType {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      if (auto result = magic_enum::enum_cast<EnumType>(str))
        return *result;

      const auto enumValues = magic_enum::enum_values<EnumType>();

      for (const auto value : enumValues)
        if (std::ranges::equal(str, magic_enum::enum_name(value), [](char charA, char charB) { return std::tolower(charA) == std::tolower(charB); }))
          return value;

      return enumValues[0];
    }

    static auto enumToString(EnumType value) -> types::String {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");
      return ToLower(magic_enum::enum_name(value));
    }
  };

  /**
   * @brief A command-line argument with its metadata and parsed value.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { types::String(std::forward<NameTs>(names))... } {}

    auto help(types::String helpText) -> Argument& {
      m_helpText = std::move(helpText);
      return *this;
    }

    /**
     * @brief Sets the placeholder shown after the option in the help text.
     */
    auto metavar(types::String name) -> Argument& {
      m_metavar = std::move(name);
      return *this;
    }

    auto defaultValue(types::String value) -> Argument& {
      m_defaultValue = std::move(value);
      return *this;
    }

    /**
     * @brief Uses an enum value as the default and its enumerators as the allowed choices.
     */
    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto defaultValue(EnumType value) -> Argument& {
      m_defaultValue = EnumTraits<EnumType>::enumToString(value);
      return choices(EnumTraits<EnumType>::getChoices());
    }

    auto flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    auto choices(const ArgChoices& choices) -> Argument& {
      m_choices.clear();
      m_choices.reserve(choices.size());

      for (const types::String& choice : choices)
        m_choices.emplace_back(ToLower(choice));

      return *this;
    }

    /**
     * @brief The parsed value, or the default when the argument was not given.
     */
    template <typename T>
    [[nodiscard]] auto get() const -> T {
      if (m_isUsed && m_value && std::holds_alternative<T>(*m_value))
        return std::get<T>(*m_value);

      if (m_defaultValue && std::holds_alternative<T>(*m_defaultValue))
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    [[nodiscard]] auto getEnum() const -> EnumType {
      return EnumTraits<EnumType>::stringToEnum(get<types::String>());
    }

    [[nodiscard]] auto isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] auto isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] auto getPrimaryName() const -> const types::String& {
      return m_names.back();
    }

    [[nodiscard]] auto getNames() const -> const types::Vec<types::String>& {
      return m_names;
    }

    [[nodiscard]] auto getHelpText() const -> const types::String& {
      return m_helpText;
    }

    [[nodiscard]] auto getMetavar() const -> const types::String& {
      return m_metavar;
    }

    [[nodiscard]] auto getChoices() const -> const ArgChoices& {
      return m_choices;
    }

    /**
     * @brief Stores a value given on the command line, validating it against the choices.
     */
    auto setValue(types::String value) -> types::Result<> {
      if (!m_choices.empty()) {
        types::String lowerValue = ToLower(value);

        if (std::ranges::find(m_choices, lowerValue) == m_choices.end()) {
          std::ostringstream choicesStream;
          for (types::usize i = 0; i < m_choices.size(); ++i)
            choicesStream << (i > 0 ? ", " : "") << m_choices[i];

          ERR_FMT(
            error::DistroErrorCode::InvalidArgument,
            "Invalid value '{}' for argument '{}'. Allowed values: {}",
            value,
            getPrimaryName(),
            choicesStream.str()
          );
        }

        value = std::move(lowerValue);
      }

      m_value  = std::move(value);
      m_isUsed = true;
      return {};
    }

    auto markUsed() -> types::Unit {
      m_isUsed = true;

      if (m_isFlag)
        m_value = true;
    }

    /**
     * @brief Assigns the parsed value (or default) to @p member when bindings are applied.
     *
     * @code
     *   struct Options { bool json; String confDir; };
     *   Options opts;
     *   parser.addArguments("-j", "--json").flag().bindTo(opts.json);
     *   parser.addArguments("--conf-dir").bindTo(opts.confDir);
     * @endcode
     */
    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::String>
    auto bindTo(T& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.get<T>(); };
      return *this;
    }

    /**
     * @brief Like bindTo(), but only touches @p member when the argument was given,
     *        so values loaded from elsewhere survive an absent option.
     */
    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::String>
    auto overrides(T& member) -> Argument& {
      m_binding = [&member](const Argument& arg) {
        if (arg.isUsed())
          member = arg.get<T>();
      };
      return *this;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto bindToEnum(EnumType& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.getEnum<EnumType>(); };
      return *this;
    }

    auto applyBinding() const -> types::Unit {
      if (m_binding)
        m_binding(*this);
    }

   private:
    types::Vec<types::String> m_names;
    types::String             m_helpText;
    types::String             m_metavar = "VALUE";
    types::Option<ArgValue>   m_value;
    types::Option<ArgValue>   m_defaultValue;
    ArgChoices                m_choices; ///< Lower-cased; empty means any value is accepted.
    ArgBinding                m_binding;
    bool                      m_isFlag {};
    bool                      m_isUsed {};
  };

  /**
   * @brief Parses argv into registered Arguments.
   *
   * `-h/--help` and `-v/--version` are always registered. Parsing stops at either of
   * them and the caller checks helpRequested() / versionRequested().
   */
  class ArgumentParser {
   public:
    ArgumentParser(types::String programName, types::String version)
      : m_programName(std::move(programName)), m_version(std::move(version)) {
      addArguments("-h", "--help").help("Show this help message and exit").flag();
      addArguments("-v", "--version").help("Show version information and exit").flag();
    }

    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    auto addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));
      Argument& arg = *m_arguments.back();

      for (const types::String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    /**
     * @brief Parses arguments; args[0] is the program name and is skipped.
     */
    auto parseArgs(types::Span<const types::String> args) -> types::Result<> {
      for (types::usize i = 1; i < args.size(); ++i) {
        const types::String& arg = args[i];

        auto iter = m_argumentMap.find(arg);
        if (iter == m_argumentMap.end())
          ERR_FMT(error::DistroErrorCode::InvalidArgument, "Unknown argument: {}", arg);

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          argument->markUsed();

          if (isUsed("--help") || isUsed("--version"))
            return {};

          continue;
        }

        if (i + 1 >= args.size())
          ERR_FMT(error::DistroErrorCode::InvalidArgument, "Argument {} requires a value", arg);

        TRY_VOID(argument->setValue(args[++i]));
      }

      return {};
    }

    auto parseArgs(types::Span<const char* const> args) -> types::Result<> {
      types::Vec<types::String> owned(args.begin(), args.end());
      return parseArgs(types::Span<const types::String>(owned));
    }

    /**
     * @brief Parses arguments, then applies every binding.
     */
    template <typename ArgsT>
    auto parseInto(const ArgsT& args) -> types::Result<> {
      TRY_VOID(parseArgs(std::span(args)));

      if (!helpRequested() && !versionRequested())
        applyBindings();

      return {};
    }

    template <typename T = types::String>
    [[nodiscard]] auto get(types::StringView name) const -> T {
      if (auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->get<T>();

      return T {};
    }

    template <typename EnumType>
    [[nodiscard]] auto getEnum(types::StringView name) const -> EnumType {
      static_assert(EnumTraits<EnumType>::has_string_conversion, "Enum type must be a scoped enum");

      if (auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->getEnum<EnumType>();

      return EnumTraits<EnumType>::stringToEnum("");
    }

    [[nodiscard]] auto isUsed(types::StringView name) const -> bool {
      if (auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->isUsed();

      return false;
    }

    [[nodiscard]] auto helpRequested() const -> bool {
      return isUsed("--help");
    }

    [[nodiscard]] auto versionRequested() const -> bool {
      return isUsed("--version");
    }

    [[nodiscard]] auto getVersion() const -> const types::String& {
      return m_version;
    }

    /**
     * @brief Renders the usage line and the per-argument help.
     */
    [[nodiscard]] auto helpText() const -> types::String {
      std::ostringstream out;
      out << "Usage: " << m_programName;

      for (const auto& arg : m_arguments) {
        out << " [" << arg->getPrimaryName();
        if (!arg->isFlag())
          out << ' ' << arg->getMetavar();
        out << ']';
      }

      out << "\n\nArguments:\n";

      for (const auto& arg : m_arguments) {
        out << "  ";
        for (types::usize i = 0; i < arg->getNames().size(); ++i)
          out << (i > 0 ? ", " : "") << arg->getNames()[i];

        if (!arg->isFlag())
          out << ' ' << arg->getMetavar();
        out << '\n';

        if (!arg->getHelpText().empty())
          out << "    " << arg->getHelpText() << '\n';

        if (!arg->getChoices().empty()) {
          out << "    Available values: ";
          for (types::usize i = 0; i < arg->getChoices().size(); ++i)
            out << (i > 0 ? ", " : "") << arg->getChoices()[i];
          out << "\n    Default: " << arg->get<types::String>() << '\n';
        }
      }

      return out.str();
    }

    auto applyBindings() const -> types::Unit {
      for (const auto& arg : m_arguments)
        arg->applyBinding();
    }

   private:
    types::String                              m_programName;
    types::String                              m_version;
    types::Vec<types::UniquePointer<Argument>> m_arguments;
    types::Map<types::String, Argument*>       m_argumentMap;
  };
} // namespace distro::utils::argparse
