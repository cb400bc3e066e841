// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef NEURE_INCLUDE_NEURE_UNICODE_HPP
#define NEURE_INCLUDE_NEURE_UNICODE_HPP

#include <neure/detail.hpp>

#include <array>
#include <cstdint>
#include <cstddef>

namespace neure::unicode {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

enum class ctype : std::uint_least16_t
{
	none = 0,
	alphabetic = 0x0001,
	numeric = 0x0002,
	whitespace = 0x0004,
	control = 0x0008,
	ascii = 0x0010,
	ascii_alphabetic = 0x0020,
	ascii_digit = 0x0040,
	ascii_hexdigit = 0x0080,
	ascii_lowercase = 0x0100,
	ascii_uppercase = 0x0200,
	ascii_punctuation = 0x0400,
	ascii_graphic = 0x0800,
	ascii_whitespace = 0x1000,
	ascii_control = 0x2000,
	word = 0x4000,
	alphanumeric = alphabetic | numeric,
	ascii_alphanumeric = ascii_alphabetic | ascii_digit,
	is_bitfield_enum
};

namespace detail {

struct rune_range
{
	char32_t first;
	char32_t last;
};

template <std::size_t N>
[[nodiscard]] constexpr bool in_table(std::array<rune_range, N> const& table, char32_t r) noexcept
{
	std::size_t lo = 0;
	std::size_t hi = N;
	while (lo < hi) {
		std::size_t const mid = lo + ((hi - lo) / 2);
		if (r < table[mid].first)
			hi = mid;
		else if (table[mid].last < r)
			lo = mid + 1;
		else
			return true;
	}
	return false;
}

// Letter, letter-number and other-alphabetic blocks of the major scripts.
// This approximates the Unicode Alphabetic property: Devanagari is covered
// in full, including its vowel signs, but most other Indic scripts list only
// their letters, and historic and minor scripts are absent.
inline constexpr std::array<rune_range, 134> alphabetic_table
{{
	{0x0041, 0x005A}, {0x0061, 0x007A}, {0x00AA, 0x00AA}, {0x00B5, 0x00B5}, {0x00BA, 0x00BA}, {0x00C0, 0x00D6}, {0x00D8, 0x00F6}, {0x00F8, 0x02C1},
	{0x02C6, 0x02D1}, {0x02E0, 0x02E4}, {0x02EC, 0x02EC}, {0x02EE, 0x02EE}, {0x0345, 0x0345}, {0x0370, 0x0374}, {0x0376, 0x0377}, {0x037A, 0x037D},
	{0x037F, 0x037F}, {0x0386, 0x0386}, {0x0388, 0x038A}, {0x038C, 0x038C}, {0x038E, 0x03A1}, {0x03A3, 0x03F5}, {0x03F7, 0x0481}, {0x048A, 0x052F},
	{0x0531, 0x0556}, {0x0559, 0x0559}, {0x0560, 0x0588}, {0x05D0, 0x05EA}, {0x05EF, 0x05F2}, {0x0620, 0x064A}, {0x066E, 0x06D3}, {0x06D5, 0x06D5},
	{0x0710, 0x072F}, {0x0780, 0x07A5}, {0x0900, 0x093B}, {0x093D, 0x094C}, {0x094E, 0x0950}, {0x0955, 0x0963}, {0x0985, 0x09B9}, {0x0A05, 0x0A39},
	{0x0A85, 0x0AB9}, {0x0B05, 0x0B39}, {0x0B85, 0x0BB9}, {0x0C05, 0x0C39}, {0x0C85, 0x0CB9}, {0x0D05, 0x0D3A}, {0x0D85, 0x0DC6}, {0x0E01, 0x0E30},
	{0x0E32, 0x0E33}, {0x0E40, 0x0E46}, {0x0E81, 0x0EB0}, {0x0F00, 0x0F00}, {0x0F40, 0x0F6C}, {0x1000, 0x102A}, {0x10A0, 0x10C5}, {0x10D0, 0x10FA},
	{0x10FC, 0x1248}, {0x1250, 0x135A}, {0x13A0, 0x13F5}, {0x1401, 0x166C}, {0x1780, 0x17B3}, {0x1820, 0x1878}, {0x1E00, 0x1F15}, {0x1F18, 0x1F1D},
	{0x1F20, 0x1F45}, {0x1F48, 0x1F4D}, {0x1F50, 0x1F57}, {0x1F59, 0x1F59}, {0x1F5B, 0x1F5B}, {0x1F5D, 0x1F5D}, {0x1F5F, 0x1F7D}, {0x1F80, 0x1FB4},
	{0x1FB6, 0x1FBC}, {0x1FBE, 0x1FBE}, {0x1FC2, 0x1FC4}, {0x1FC6, 0x1FCC}, {0x1FD0, 0x1FD3}, {0x1FD6, 0x1FDB}, {0x1FE0, 0x1FEC}, {0x1FF2, 0x1FF4},
	{0x1FF6, 0x1FFC}, {0x2071, 0x2071}, {0x207F, 0x207F}, {0x2090, 0x209C}, {0x2102, 0x2102}, {0x2107, 0x2107}, {0x210A, 0x2113}, {0x2115, 0x2115},
	{0x2119, 0x211D}, {0x2124, 0x2124}, {0x2126, 0x2126}, {0x2128, 0x2128}, {0x212A, 0x212D}, {0x212F, 0x2139}, {0x2160, 0x2188}, {0x24B6, 0x24E9},
	{0x2C00, 0x2CE4}, {0x2D00, 0x2D25}, {0x3005, 0x3007}, {0x3021, 0x3029}, {0x3031, 0x3035}, {0x3038, 0x303C}, {0x3041, 0x3096}, {0x309D, 0x309F},
	{0x30A1, 0x30FA}, {0x30FC, 0x30FF}, {0x3105, 0x312F}, {0x3131, 0x318E}, {0x31A0, 0x31BF}, {0x31F0, 0x31FF}, {0x3400, 0x4DBF}, {0x4E00, 0x9FFF},
	{0xA000, 0xA48C}, {0xA4D0, 0xA4FD}, {0xA500, 0xA60C}, {0xA640, 0xA66E}, {0xA680, 0xA69D}, {0xA722, 0xA788}, {0xA78B, 0xA7CA}, {0xAC00, 0xD7A3},
	{0xF900, 0xFA6D}, {0xFB00, 0xFB06}, {0xFB1D, 0xFB28}, {0xFB2A, 0xFBB1}, {0xFE70, 0xFEFC}, {0xFF21, 0xFF3A}, {0xFF41, 0xFF5A}, {0xFF66, 0xFFBE},
	{0x10000, 0x1004D}, {0x10400, 0x1049D}, {0x1D400, 0x1D6A5}, {0x20000, 0x2A6DF}, {0x2A700, 0x2EBE0}, {0x30000, 0x3134A}
}};

// Decimal digit, letter-number and other-number blocks.
inline constexpr std::array<rune_range, 46> numeric_table
{{
	{0x0030, 0x0039}, {0x00B2, 0x00B3}, {0x00B9, 0x00B9}, {0x00BC, 0x00BE}, {0x0660, 0x0669}, {0x06F0, 0x06F9}, {0x07C0, 0x07C9}, {0x0966, 0x096F},
	{0x09E6, 0x09EF}, {0x0A66, 0x0A6F}, {0x0AE6, 0x0AEF}, {0x0B66, 0x0B6F}, {0x0BE6, 0x0BF2}, {0x0C66, 0x0C6F}, {0x0CE6, 0x0CEF}, {0x0D66, 0x0D78},
	{0x0E50, 0x0E59}, {0x0ED0, 0x0ED9}, {0x0F20, 0x0F33}, {0x1040, 0x1049}, {0x1369, 0x137C}, {0x16EE, 0x16F0}, {0x17E0, 0x17E9}, {0x1810, 0x1819},
	{0x2070, 0x2070}, {0x2074, 0x2079}, {0x2080, 0x2089}, {0x2150, 0x2182}, {0x2185, 0x2189}, {0x2460, 0x249B}, {0x24EA, 0x24FF}, {0x2776, 0x2793},
	{0x2CFD, 0x2CFD}, {0x3007, 0x3007}, {0x3021, 0x3029}, {0x3038, 0x303A}, {0x3192, 0x3195}, {0x3220, 0x3229}, {0x3248, 0x324F}, {0x3251, 0x325F},
	{0x3280, 0x3289}, {0x32B1, 0x32BF}, {0xA620, 0xA629}, {0xFF10, 0xFF19}, {0x1D7CE, 0x1D7FF}, {0x1F100, 0x1F10C}
}};

inline constexpr std::array<rune_range, 10> whitespace_table
{{
	{0x0009, 0x000D}, {0x0020, 0x0020}, {0x0085, 0x0085}, {0x00A0, 0x00A0}, {0x1680, 0x1680},
	{0x2000, 0x200A}, {0x2028, 0x2029}, {0x202F, 0x202F}, {0x205F, 0x205F}, {0x3000, 0x3000}
}};

} // namespace detail

[[nodiscard]] constexpr bool is_ascii(char32_t r) noexcept { return r < 0x80; }
[[nodiscard]] constexpr bool is_ascii_uppercase(char32_t r) noexcept { return (U'A' <= r) && (r <= U'Z'); }
[[nodiscard]] constexpr bool is_ascii_lowercase(char32_t r) noexcept { return (U'a' <= r) && (r <= U'z'); }
[[nodiscard]] constexpr bool is_ascii_alphabetic(char32_t r) noexcept { return is_ascii_uppercase(r) || is_ascii_lowercase(r); }
[[nodiscard]] constexpr bool is_ascii_digit(char32_t r) noexcept { return (U'0' <= r) && (r <= U'9'); }
[[nodiscard]] constexpr bool is_ascii_alphanumeric(char32_t r) noexcept { return is_ascii_alphabetic(r) || is_ascii_digit(r); }
[[nodiscard]] constexpr bool is_ascii_hexdigit(char32_t r) noexcept { return is_ascii_digit(r) || ((U'a' <= r) && (r <= U'f')) || ((U'A' <= r) && (r <= U'F')); }
[[nodiscard]] constexpr bool is_ascii_graphic(char32_t r) noexcept { return (U'!' <= r) && (r <= U'~'); }
[[nodiscard]] constexpr bool is_ascii_punctuation(char32_t r) noexcept { return is_ascii_graphic(r) && !is_ascii_alphanumeric(r); }
[[nodiscard]] constexpr bool is_ascii_whitespace(char32_t r) noexcept { return (r == U' ') || (r == U'\t') || (r == U'\n') || (r == U'\f') || (r == U'\r'); }
[[nodiscard]] constexpr bool is_ascii_control(char32_t r) noexcept { return (r < 0x20) || (r == 0x7F); }
[[nodiscard]] constexpr bool is_word(char32_t r) noexcept { return is_ascii_alphanumeric(r) || (r == U'_'); }

[[nodiscard]] constexpr bool is_alphabetic(char32_t r) noexcept { return is_ascii(r) ? is_ascii_alphabetic(r) : detail::in_table(detail::alphabetic_table, r); }
[[nodiscard]] constexpr bool is_numeric(char32_t r) noexcept { return is_ascii(r) ? is_ascii_digit(r) : detail::in_table(detail::numeric_table, r); }
[[nodiscard]] constexpr bool is_alphanumeric(char32_t r) noexcept { return is_alphabetic(r) || is_numeric(r); }
[[nodiscard]] constexpr bool is_whitespace(char32_t r) noexcept { return detail::in_table(detail::whitespace_table, r); }
[[nodiscard]] constexpr bool is_control(char32_t r) noexcept { return (r < 0x20) || ((0x7F <= r) && (r <= 0x9F)); }

// True when r belongs to at least one of the classes named in mask.
[[nodiscard]] constexpr bool is_ctype(char32_t r, ctype mask) noexcept
{
	auto const has = [mask](ctype c) { return (mask & c) != ctype::none; };
	return (has(ctype::alphabetic) && is_alphabetic(r)) ||
		(has(ctype::numeric) && is_numeric(r)) ||
		(has(ctype::whitespace) && is_whitespace(r)) ||
		(has(ctype::control) && is_control(r)) ||
		(has(ctype::ascii) && is_ascii(r)) ||
		(has(ctype::ascii_alphabetic) && is_ascii_alphabetic(r)) ||
		(has(ctype::ascii_digit) && is_ascii_digit(r)) ||
		(has(ctype::ascii_hexdigit) && is_ascii_hexdigit(r)) ||
		(has(ctype::ascii_lowercase) && is_ascii_lowercase(r)) ||
		(has(ctype::ascii_uppercase) && is_ascii_uppercase(r)) ||
		(has(ctype::ascii_punctuation) && is_ascii_punctuation(r)) ||
		(has(ctype::ascii_graphic) && is_ascii_graphic(r)) ||
		(has(ctype::ascii_whitespace) && is_ascii_whitespace(r)) ||
		(has(ctype::ascii_control) && is_ascii_control(r)) ||
		(has(ctype::word) && is_word(r));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace neure::unicode

#endif
