// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef NEURE_INCLUDE_NEURE_UNIT_HPP
#define NEURE_INCLUDE_NEURE_UNIT_HPP

#include <neure/error.hpp>
#include <neure/unicode.hpp>
#include <neure/utf8.hpp>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace neure {

struct unit_predicate_trait_tag {};
template <class P, class = void> struct is_unit_predicate : std::false_type {};
template <class P> struct is_unit_predicate<P, std::enable_if_t<std::is_same_v<unit_predicate_trait_tag, typename std::decay_t<P>::predicate_trait>>> : std::true_type {};
template <class P> inline constexpr bool is_unit_predicate_v = is_unit_predicate<P>::value;

template <class Derived>
struct unit_predicate_interface
{
	using predicate_trait = unit_predicate_trait_tag;
	[[nodiscard]] constexpr Derived& derived() noexcept { return static_cast<Derived&>(*this); }
	[[nodiscard]] constexpr Derived const& derived() const noexcept { return static_cast<Derived const&>(*this); }
};

struct any_predicate : unit_predicate_interface<any_predicate>
{
	template <class T> [[nodiscard]] constexpr bool operator()(T /*value*/) const noexcept { return true; }
	[[nodiscard]] constexpr std::string_view expected() const noexcept { return "any unit"; }
};

struct wild_predicate : unit_predicate_interface<wild_predicate>
{
	template <class T> [[nodiscard]] constexpr bool operator()(T value) const noexcept { return static_cast<char32_t>(value) != U'\n'; }
	[[nodiscard]] constexpr std::string_view expected() const noexcept { return "any unit except newline"; }
};

struct equal_predicate : unit_predicate_interface<equal_predicate>
{
	char32_t value;
	constexpr explicit equal_predicate(char32_t v) noexcept : value{v} {}
	template <class T> [[nodiscard]] constexpr bool operator()(T x) const noexcept { return static_cast<char32_t>(x) == value; }
	[[nodiscard]] constexpr std::string_view expected() const noexcept { return "literal unit"; }
};

struct range_predicate : unit_predicate_interface<range_predicate>
{
	char32_t first;
	char32_t last;

	constexpr range_predicate(char32_t f, char32_t l) : first{f}, last{l}
	{
		if (first > last)
			throw bad_character_range{};
	}

	template <class T> [[nodiscard]] constexpr bool operator()(T x) const noexcept { return (first <= static_cast<char32_t>(x)) && (static_cast<char32_t>(x) <= last); }
	[[nodiscard]] constexpr std::string_view expected() const noexcept { return "unit in range"; }
};

class set_predicate : public unit_predicate_interface<set_predicate>
{
	std::vector<char32_t> members_;

	void sort_and_unique()
	{
		std::sort(members_.begin(), members_.end());
		members_.erase(std::unique(members_.begin(), members_.end()), members_.end());
	}

public:
	explicit set_predicate(std::initializer_list<char32_t> members) : members_{members} { sort_and_unique(); }

	explicit set_predicate(std::string_view members)
	{
		for (std::size_t pos = 0; pos < members.size(); ) {
			auto const [rune, width] = utf8::decode_rune(members, pos);
			members_.push_back(rune);
			pos += width;
		}
		sort_and_unique();
	}

	template <class T> [[nodiscard]] bool operator()(T x) const noexcept { return std::binary_search(members_.begin(), members_.end(), static_cast<char32_t>(x)); }
	[[nodiscard]] std::string_view expected() const noexcept { return "unit in set"; }
	[[nodiscard]] std::size_t size() const noexcept { return members_.size(); }
};

// Named character classes. Applied to byte units, only the ASCII portion of
// each class matches.
struct class_predicate : unit_predicate_interface<class_predicate>
{
	unicode::ctype mask;
	std::string_view name;

	constexpr class_predicate(unicode::ctype m, std::string_view n) noexcept : mask{m}, name{n} {}

	template <class T>
	[[nodiscard]] constexpr bool operator()(T x) const noexcept
	{
		if constexpr (std::is_same_v<T, std::uint8_t>)
			if (!unicode::is_ascii(x))
				return false;
		return unicode::is_ctype(static_cast<char32_t>(x), mask);
	}

	[[nodiscard]] constexpr std::string_view expected() const noexcept { return name; }
};

struct digit_predicate : unit_predicate_interface<digit_predicate>
{
	unsigned int radix;

	constexpr explicit digit_predicate(unsigned int r) : radix{r}
	{
		if ((radix < 2) || (radix > 36)) // NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
			throw bad_radix{};
	}

	template <class T>
	[[nodiscard]] constexpr bool operator()(T x) const noexcept
	{
		auto const c = static_cast<char32_t>(x);
		if (unicode::is_ascii_digit(c))
			return static_cast<unsigned int>(c - U'0') < radix;
		if (unicode::is_ascii_lowercase(c))
			return static_cast<unsigned int>(c - U'a') + 10U < radix;
		if (unicode::is_ascii_uppercase(c))
			return static_cast<unsigned int>(c - U'A') + 10U < radix;
		return false;
	}

	[[nodiscard]] constexpr std::string_view expected() const noexcept { return "digit"; }
};

template <class Fn>
struct callable_predicate : unit_predicate_interface<callable_predicate<Fn>>
{
	Fn fn;
	template <class F, class = std::enable_if_t<std::is_constructible_v<Fn, F&&>>> constexpr explicit callable_predicate(F&& f) noexcept(std::is_nothrow_constructible_v<Fn, F&&>) : fn(std::forward<F>(f)) {}
	template <class T> [[nodiscard]] constexpr bool operator()(T x) const { return static_cast<bool>(fn(x)); }
	[[nodiscard]] constexpr std::string_view expected() const noexcept { return "unit satisfying predicate"; }
};

template <class F> callable_predicate(F&&) -> callable_predicate<std::decay_t<F>>;

template <class P1, class P2>
struct and_predicate : unit_predicate_interface<and_predicate<P1, P2>>
{
	P1 p1;
	P2 p2;
	constexpr and_predicate(P1 x1, P2 x2) : p1(std::move(x1)), p2(std::move(x2)) {}
	template <class T> [[nodiscard]] constexpr bool operator()(T x) const { return p1(x) && p2(x); }
	[[nodiscard]] constexpr std::string_view expected() const noexcept { return "unit matching all predicates"; }
};

template <class P1, class P2>
struct or_predicate : unit_predicate_interface<or_predicate<P1, P2>>
{
	P1 p1;
	P2 p2;
	constexpr or_predicate(P1 x1, P2 x2) : p1(std::move(x1)), p2(std::move(x2)) {}
	template <class T> [[nodiscard]] constexpr bool operator()(T x) const { return p1(x) || p2(x); }
	[[nodiscard]] constexpr std::string_view expected() const noexcept { return "unit matching any predicate"; }
};

template <class P1>
struct not_predicate : unit_predicate_interface<not_predicate<P1>>
{
	P1 p1;
	constexpr explicit not_predicate(P1 x1) : p1(std::move(x1)) {}
	template <class T> [[nodiscard]] constexpr bool operator()(T x) const { return !p1(x); }
	[[nodiscard]] constexpr std::string_view expected() const noexcept { return "unit not matching predicate"; }
};

template <class T>
inline constexpr bool is_unit_literal_v = std::is_same_v<std::decay_t<T>, char> || std::is_same_v<std::decay_t<T>, char32_t> || std::is_same_v<std::decay_t<T>, std::uint8_t>;

template <class P, class = std::enable_if_t<is_unit_predicate_v<P>>>
[[nodiscard]] constexpr auto make_predicate(P const& p) -> P const& { return p; }

template <class T, class = std::enable_if_t<is_unit_literal_v<T>>, class = void>
[[nodiscard]] constexpr equal_predicate make_predicate(T c) noexcept
{
	if constexpr (std::is_same_v<T, char>)
		return equal_predicate{static_cast<char32_t>(static_cast<unsigned char>(c))};
	else
		return equal_predicate{static_cast<char32_t>(c)};
}

template <class P> using predicate_t = std::decay_t<decltype(make_predicate(std::declval<P>()))>;

template <class P1, class P2>
inline constexpr bool are_predicate_operands_v = (is_unit_predicate_v<P1> && (is_unit_predicate_v<P2> || is_unit_literal_v<P2>)) || (is_unit_literal_v<P1> && is_unit_predicate_v<P2>);

template <class P1, class P2, class = std::enable_if_t<are_predicate_operands_v<P1, P2>>>
[[nodiscard]] constexpr auto operator&&(P1 const& p1, P2 const& p2)
{
	return and_predicate<predicate_t<P1>, predicate_t<P2>>{make_predicate(p1), make_predicate(p2)};
}

template <class P1, class P2, class = std::enable_if_t<are_predicate_operands_v<P1, P2>>>
[[nodiscard]] constexpr auto operator||(P1 const& p1, P2 const& p2)
{
	return or_predicate<predicate_t<P1>, predicate_t<P2>>{make_predicate(p1), make_predicate(p2)};
}

template <class P1, class = std::enable_if_t<is_unit_predicate_v<P1>>>
[[nodiscard]] constexpr auto operator!(P1 const& p1)
{
	return not_predicate<P1>{p1};
}

template <class T, class = std::enable_if_t<is_unit_literal_v<T>>> [[nodiscard]] constexpr equal_predicate unit(T c) noexcept { return make_predicate(c); }
template <class T, class = std::enable_if_t<is_unit_literal_v<T>>> [[nodiscard]] constexpr equal_predicate equal(T c) noexcept { return make_predicate(c); }
[[nodiscard]] constexpr range_predicate range(char32_t first, char32_t last) { return range_predicate{first, last}; }
[[nodiscard]] inline set_predicate one_of(std::string_view members) { return set_predicate{members}; }
[[nodiscard]] inline set_predicate one_of(std::initializer_list<char32_t> members) { return set_predicate{members}; }
[[nodiscard]] constexpr digit_predicate digit(unsigned int radix) { return digit_predicate{radix}; }
[[nodiscard]] constexpr class_predicate classes(unicode::ctype mask) noexcept { return class_predicate{mask, "unit in character classes"}; }
template <class F> [[nodiscard]] constexpr auto unit_if(F&& f) { return callable_predicate{std::forward<F>(f)}; }

inline constexpr any_predicate any{};
inline constexpr wild_predicate wild{};
inline constexpr class_predicate alphabetic{unicode::ctype::alphabetic, "alphabetic"};
inline constexpr class_predicate numeric{unicode::ctype::numeric, "numeric"};
inline constexpr class_predicate alphanumeric{unicode::ctype::alphanumeric, "alphanumeric"};
inline constexpr class_predicate whitespace{unicode::ctype::whitespace, "whitespace"};
inline constexpr class_predicate control{unicode::ctype::control, "control"};
inline constexpr class_predicate ascii{unicode::ctype::ascii, "ascii"};
inline constexpr class_predicate ascii_alphabetic{unicode::ctype::ascii_alphabetic, "ascii alphabetic"};
inline constexpr class_predicate ascii_alphanumeric{unicode::ctype::ascii_alphanumeric, "ascii alphanumeric"};
inline constexpr class_predicate ascii_digit{unicode::ctype::ascii_digit, "ascii digit"};
inline constexpr class_predicate ascii_hexdigit{unicode::ctype::ascii_hexdigit, "ascii hexdigit"};
inline constexpr class_predicate ascii_lowercase{unicode::ctype::ascii_lowercase, "ascii lowercase"};
inline constexpr class_predicate ascii_uppercase{unicode::ctype::ascii_uppercase, "ascii uppercase"};
inline constexpr class_predicate ascii_punctuation{unicode::ctype::ascii_punctuation, "ascii punctuation"};
inline constexpr class_predicate ascii_graphic{unicode::ctype::ascii_graphic, "ascii graphic"};
inline constexpr class_predicate ascii_whitespace{unicode::ctype::ascii_whitespace, "ascii whitespace"};
inline constexpr class_predicate ascii_control{unicode::ctype::ascii_control, "ascii control"};
inline constexpr class_predicate word{unicode::ctype::word, "word"};

} // namespace neure

#endif
