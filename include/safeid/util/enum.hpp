#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace safeid {

template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> T;

namespace util {

// Lowercase alphanumerics only: "Back-Off", "back_off" and "BACKOFF" match.
[[nodiscard]] inline auto normalize_enum_token(std::string_view token)
    -> std::string {
  std::string out;
  out.reserve(token.size());
  for (char c : token) {
    const auto uch = static_cast<unsigned char>(c);
    if (std::isalnum(uch) != 0) {
      out.push_back(static_cast<char>(std::tolower(uch)));
    }
  }
  return out;
}

// "RandomSource" -> "random_source". Runs of capitals stay together.
[[nodiscard]] inline auto enum_name_to_snake_case(std::string_view name)
    -> std::string {
  std::string out;
  for (std::size_t i = 0; i < name.size(); ++i) {
    const auto uch = static_cast<unsigned char>(name[i]);
    const bool boundary =
        i > 0 && std::isupper(uch) != 0 &&
        (std::islower(static_cast<unsigned char>(name[i - 1])) != 0 ||
         (i + 1 < name.size() &&
          std::islower(static_cast<unsigned char>(name[i + 1])) != 0));
    if (boundary) {
      out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(uch)));
  }
  return out;
}

struct EnumEntry {
  std::string display;
  std::string token;
};

template <typename E>
inline constexpr std::size_t enum_count =
    boost::mp11::mp_size<boost::describe::describe_enumerators<E>>::value;

template <typename E>
using EnumTable = std::array<std::pair<E, EnumEntry>, enum_count<E>>;

// One entry per described enumerator, in declaration order, built on first
// use.
template <typename E> [[nodiscard]] auto enum_table() -> const EnumTable<E> & {
  static const auto table = [] {
    EnumTable<E> out{};
    std::size_t i = 0;
    boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
        [&](auto d) {
          out[i++] = {d.value, EnumEntry{enum_name_to_snake_case(d.name),
                                         normalize_enum_token(d.name)}};
        });
    return out;
  }();
  return table;
}

template <typename E>
[[nodiscard]] auto find_enum(std::string_view input) -> std::optional<E> {
  const auto wanted = normalize_enum_token(input);
  const auto &table = enum_table<E>();
  const auto it = std::ranges::find_if(
      table, [&](const auto &entry) { return entry.second.token == wanted; });
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->first;
}

template <typename E>
[[nodiscard]] auto enum_to_snake_case_view(E value) noexcept
    -> std::string_view {
  for (const auto &[enum_value, entry] : enum_table<E>()) {
    if (enum_value == value) {
      return entry.display;
    }
  }
  return "unknown";
}

template <typename E>
[[nodiscard]] auto is_enum_name(std::string_view input) -> bool {
  return find_enum<E>(input).has_value();
}

} // namespace util

// Defines to_string_view(EnumType) and parse<EnumType>; unknown names parse
// to DefaultValue.
#define SAFEID_DEFINE_ENUM_SERDE(EnumType, DefaultValue)                       \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept            \
      -> std::string_view {                                                    \
    return ::safeid::util::enum_to_snake_case_view(value);                     \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> EnumType {                                                            \
    return ::safeid::util::find_enum<EnumType>(s).value_or(DefaultValue);      \
  }

} // namespace safeid
