#pragma once

#include <algorithm>
#include <cstddef>

#define XSTR(a) STR(a)
#define STR(a) #a

// True iff macro was defined to 1, e.g. with -DDEBUG_BUILD. Usable in if constexpr.
#define IS_DEFINED(macro) (XSTR(macro)[0] == '1')

// Type-checks the arguments without evaluating them. The LOG_*() macros rely on this.
#define USE_UNEVALUATED(...) ((void)sizeof((util::detail::use_unevaluated(__VA_ARGS__), 0)))

namespace util {

namespace detail {

template <typename... Ts>
constexpr void use_unevaluated(Ts&&...) {}

}  // namespace detail

// A string literal that can be passed as a template argument: add_option<"num-rounds">(...)
template <size_t N>
struct StringLiteral {
  constexpr StringLiteral(const char (&str)[N]) { std::copy_n(str, N, value); }

  template <size_t M>
  constexpr bool operator==(const StringLiteral<M>& other) const {
    return std::equal(value, value + N, other.value, other.value + M);
  }

  char value[N];
};

// Compile-time lists of option names and abbreviations, used by boost_util::program_options.
template <StringLiteral... Names>
struct NameList {
  template <StringLiteral Name>
  static constexpr bool contains() {
    return ((Names == Name) || ...);
  }
};

template <char... Chars>
struct CharList {
  static constexpr bool contains(char c) { return ((Chars == c) || ...); }
};

/*
 * list_union<A, B>::type is A followed by B. list_union<A, B>::disjoint is true iff no element of
 * B is already in A.
 */
template <typename A, typename B>
struct list_union;

template <StringLiteral... As, StringLiteral... Bs>
struct list_union<NameList<As...>, NameList<Bs...>> {
  using type = NameList<As..., Bs...>;
  static constexpr bool disjoint = (!NameList<As...>::template contains<Bs>() && ...);
};

template <char... As, char... Bs>
struct list_union<CharList<As...>, CharList<Bs...>> {
  using type = CharList<As..., Bs...>;
  static constexpr bool disjoint = (!CharList<As...>::contains(Bs) && ...);
};

}  // namespace util
