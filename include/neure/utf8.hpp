// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

// Based on the Flexible and Economical UTF-8 Decoder by Bjoern Hoehrmann
// Copyright (c) 2008-2010 Bjoern Hoehrmann <bjoern@hoehrmann.de>
// See LICENSE.md file or http://bjoern.hoehrmann.de/utf-8/decoder/dfa/
// for more details.

#ifndef NEURE_INCLUDE_NEURE_UTF8_HPP
#define NEURE_INCLUDE_NEURE_UTF8_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace neure::utf8 {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

namespace detail {

enum class decode_state : unsigned char { accept = 0, reject = 12 };

inline constexpr std::array<unsigned char, 256> dfa_class_table
{
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
	 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9,
	 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7,
	 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7,
	 8, 8, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2,
	 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2,
	10, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 4, 3, 3,
	11, 6, 6, 6, 5, 8, 8, 8, 8, 8, 8, 8, 8, 8, 8, 8
};

inline constexpr std::array<unsigned char, 108> dfa_transition_table
{
	0,12,24,36,60,96,84,12,12,12,48,72,12,12,12,12,
	12,12,12,12,12,12,12,12,12, 0,12,12,12,12,12, 0,
	12, 0,12,12,12,24,12,12,12,12,12,24,12,24,12,12,
	12,12,12,12,12,12,12,24,12,12,12,12,12,24,12,12,
	12,12,12,12,12,24,12,12,12,12,12,12,12,12,12,36,
	12,36,12,12,12,36,12,12,12,12,12,36,12,36,12,12,
	12,36,12,12,12,12,12,12,12,12,12,12
};

inline constexpr char32_t utf32_replacement = U'\U0000fffd';

[[nodiscard]] constexpr decode_state decode_rune_octet(char32_t& rune, char octet, decode_state state) noexcept
{
	auto const symbol = static_cast<unsigned int>(static_cast<unsigned char>(octet));
	auto const dfa_class = static_cast<unsigned int>(dfa_class_table[symbol]); // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
	rune = (state == decode_state::accept) ? (symbol & (0xffU >> dfa_class)) : ((symbol & 0x3fU) | (rune << 6U));
	return static_cast<decode_state>(dfa_transition_table[static_cast<std::size_t>(state) + dfa_class]); // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
}

[[nodiscard]] constexpr unsigned int non_ascii_rune_length(char32_t rune) noexcept
{
	if (rune < 0x00000800U)
		return 2;
	if (rune < 0x00010000U)
		return 3;
	return 4;
}

} // namespace detail

[[nodiscard]] constexpr bool is_lead(char octet) noexcept
{
	return (static_cast<unsigned char>(octet) & 0xc0U) != 0x80U;
}

// Decodes the rune starting at offset, returning it with its encoded width
// in octets. Malformed sequences decode as U+FFFD and extend to the next lead
// octet so that decoding always resumes on a boundary.
[[nodiscard]] constexpr std::pair<char32_t, std::size_t> decode_rune(std::string_view text, std::size_t offset) noexcept
{
	char32_t rune = U'\0';
	detail::decode_state state = detail::decode_state::accept;
	std::size_t pos = offset;
	while ((pos < text.size()) && (state != detail::decode_state::reject))
		if (state = detail::decode_rune_octet(rune, text[pos++], state); state == detail::decode_state::accept)
			return {rune, pos - offset};
	if ((state == detail::decode_state::reject) && ((pos - offset) > 1) && is_lead(text[pos - 1]))
		--pos;
	while ((pos < text.size()) && !is_lead(text[pos]))
		++pos;
	return {detail::utf32_replacement, (std::max)(pos - offset, std::size_t{1})};
}

[[nodiscard]] constexpr bool is_boundary(std::string_view text, std::size_t offset) noexcept
{
	return (offset == text.size()) || ((offset < text.size()) && is_lead(text[offset]));
}

[[nodiscard]] constexpr std::size_t count_runes(std::string_view text) noexcept
{
	std::size_t count = 0;
	for (std::size_t pos = 0; pos < text.size(); ++count)
		pos += decode_rune(text, pos).second;
	return count;
}

template <class OutputIt>
inline std::pair<OutputIt, bool> encode_rune(OutputIt dst, char32_t rune)
{
	if (rune < 0x80) {
		*dst++ = static_cast<char>(rune);
	} else {
		if ((0x00110000U <= rune) || ((rune & 0xfffff800U) == 0x0000d800U))
			return {encode_rune(dst, detail::utf32_replacement).first, false};
		unsigned int const n = detail::non_ascii_rune_length(rune);
		for (unsigned int i = 0, c = ((0xf0U << (4 - n)) & 0xf0U); i < n; ++i, c = 0x80U)
			*dst++ = static_cast<char>(((rune >> (6 * (n - i - 1))) & 0x3fU) | c);
	}
	return {dst, true};
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

[[nodiscard]] inline std::string encode_rune(char32_t rune)
{
	std::string result;
	encode_rune(std::back_inserter(result), rune);
	return result;
}

} // namespace neure::utf8

#endif
