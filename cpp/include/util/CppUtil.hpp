#pragma once

#include <algorithm>
#include <cstdint>
#include <type_traits>
#include <utility>

/*
 * Marks the arguments as used without evaluating them. The LOG_*() macros rely on this so that a
 * variable that only appears inside a compiled-out LOG_DEBUG() does not trigger an unused-variable
 * warning.
 */
#define USE_UNEVALUATED(...) ((void)sizeof(util::detail::use_unevaluated(__VA_ARGS__)))

namespace util {

namespace detail {

template <typename... Ts>
int use_unevaluated(const Ts&...);

}  // namespace detail

#ifdef DEBUG_BUILD
constexpr bool kDebugBuild = true;
#else
constexpr bool kDebugBuild = false;
#endif

template <size_t N>
struct StringLiteral {
  constexpr StringLiteral(const char (&str)[N]) { std::copy_n(str, N, value); }
  template <size_t M>
  constexpr bool operator==(const StringLiteral<M>& other) const {
    // strcmp() is not required to be constexpr, so compare by hand.
    if (N != M) return false;
    for (size_t i = 0; i < N; ++i) {
      if (value[i] != other.value[i]) return false;
    }
    return true;
  }
  char value[N];
};

/*
 * A compile-time list of string literals. Used by boost_util::program_options::options_description
 * to detect option-name clashes at compile time.
 */
template <StringLiteral... Ss>
struct StringLiteralSequence {
  template <StringLiteral S>
  static constexpr bool contains = ((Ss == S) || ...);
};

/*
 * The following are equivalent:
 *
 * using T = util::int_sequence<1, 2, 3>;
 *
 * and:
 *
 * using T = std::integer_sequence<int, 1, 2, 3>;
 */
template <int... Ints>
using int_sequence = std::integer_sequence<int, Ints...>;

template <typename T>
struct is_int_sequence : std::false_type {};
template <int... Ints>
struct is_int_sequence<int_sequence<Ints...>> : std::true_type {};
template <typename T>
inline constexpr bool is_int_sequence_v = is_int_sequence<T>::value;

/*
 * true: util::int_sequence_contains_v<util::int_sequence<1, 3, 5>, 1>
 * false: util::int_sequence_contains_v<util::int_sequence<1, 3, 5>, 2>
 */
template <typename T, int K>
struct int_sequence_contains : std::false_type {};
template <int... Is, int K>
struct int_sequence_contains<int_sequence<Is...>, K>
    : std::bool_constant<((Is == K) || ...)> {};
template <typename T, int K>
inline constexpr bool int_sequence_contains_v = int_sequence_contains<T, K>::value;

template <typename T, StringLiteral S>
inline constexpr bool string_literal_sequence_contains_v = T::template contains<S>;

template <typename T, typename U>
struct concat_int_sequence {};
template <int... Is, int... Js>
struct concat_int_sequence<int_sequence<Is...>, int_sequence<Js...>> {
  using type = int_sequence<Is..., Js...>;
};
template <typename T, typename U>
using concat_int_sequence_t = typename concat_int_sequence<T, U>::type;

template <typename T, typename U>
struct concat_string_literal_sequence {};
template <StringLiteral... S1, StringLiteral... S2>
struct concat_string_literal_sequence<StringLiteralSequence<S1...>, StringLiteralSequence<S2...>> {
  using type = StringLiteralSequence<S1..., S2...>;
};
template <typename T, typename U>
using concat_string_literal_sequence_t = typename concat_string_literal_sequence<T, U>::type;

/*
 * no_overlap_v<T, U> is true iff no element of U is contained in T. Works for both
 * StringLiteralSequence and int_sequence.
 */
template <typename T, typename U>
struct no_overlap : std::true_type {};
template <typename T, StringLiteral... Ss>
struct no_overlap<T, StringLiteralSequence<Ss...>>
    : std::bool_constant<(!T::template contains<Ss> && ...)> {};
template <typename T, int... Is>
struct no_overlap<T, int_sequence<Is...>>
    : std::bool_constant<(!int_sequence_contains_v<T, Is> && ...)> {};
template <typename T, typename U>
constexpr bool no_overlap_v = no_overlap<T, U>::value;

namespace concepts {

template <typename T>
concept IntSequence = is_int_sequence_v<T>;

}  // namespace concepts

}  // namespace util
