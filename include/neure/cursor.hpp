// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef NEURE_INCLUDE_NEURE_CURSOR_HPP
#define NEURE_INCLUDE_NEURE_CURSOR_HPP

#include <neure/error.hpp>
#include <neure/span.hpp>
#include <neure/utf8.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace neure {

template <class T>
struct basic_unit
{
	T value;
	std::size_t offset;
	std::size_t width;

	[[nodiscard]] constexpr std::size_t next() const noexcept { return offset + width; }
	[[nodiscard]] friend constexpr bool operator==(basic_unit const& x, basic_unit const& y) noexcept { return (x.value == y.value) && (x.offset == y.offset) && (x.width == y.width); }
	[[nodiscard]] friend constexpr bool operator!=(basic_unit const& x, basic_unit const& y) noexcept { return !(x == y); }
};

struct text_encoding
{
	using unit_type = char32_t;
	[[nodiscard]] static constexpr std::pair<char32_t, std::size_t> decode(std::string_view input, std::size_t offset) noexcept { return utf8::decode_rune(input, offset); }
	[[nodiscard]] static constexpr bool is_boundary(std::string_view input, std::size_t offset) noexcept { return utf8::is_boundary(input, offset); }
};

struct byte_encoding
{
	using unit_type = std::uint8_t;
	[[nodiscard]] static constexpr std::pair<std::uint8_t, std::size_t> decode(std::string_view input, std::size_t offset) noexcept { return {static_cast<std::uint8_t>(input[offset]), 1}; }
	[[nodiscard]] static constexpr bool is_boundary(std::string_view input, std::size_t offset) noexcept { return offset <= input.size(); }
};

// Positioned view over an input buffer. Offsets count code units (bytes) for
// both encodings; text cursors decode UTF-8 and only ever rest on a rune
// boundary. The cursor never owns the input.
template <class Encoding>
class basic_cursor
{
	std::string_view input_;
	std::size_t offset_{0};

public:
	using encoding_type = Encoding;
	using unit_type = typename Encoding::unit_type;
	using unit = basic_unit<unit_type>;

	constexpr basic_cursor() noexcept = default;
	constexpr explicit basic_cursor(std::string_view input) noexcept : input_{input} {}

	template <class E = Encoding, class = std::enable_if_t<std::is_same_v<E, byte_encoding>>>
	basic_cursor(std::uint8_t const* data, std::size_t size) noexcept : input_{reinterpret_cast<char const*>(data), size} {} // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)

	template <class E = Encoding, class = std::enable_if_t<std::is_same_v<E, byte_encoding>>>
	explicit basic_cursor(std::vector<std::uint8_t> const& bytes) noexcept : basic_cursor{bytes.data(), bytes.size()} {}

	[[nodiscard]] constexpr std::string_view input() const noexcept { return input_; }
	[[nodiscard]] constexpr std::size_t offset() const noexcept { return offset_; }
	[[nodiscard]] constexpr std::size_t length() const noexcept { return input_.size(); }
	[[nodiscard]] constexpr std::size_t remaining() const noexcept { return input_.size() - offset_; }
	[[nodiscard]] constexpr bool at_start() const noexcept { return offset_ == 0; }
	[[nodiscard]] constexpr bool at_end() const noexcept { return offset_ >= input_.size(); }
	[[nodiscard]] constexpr std::string_view rest() const noexcept { return input_.substr(offset_); }
	[[nodiscard]] constexpr std::string_view rest_at(std::size_t off) const noexcept { return off < input_.size() ? input_.substr(off) : std::string_view{}; }

	[[nodiscard]] constexpr std::optional<unit> peek_at(std::size_t off) const noexcept
	{
		if (off >= input_.size())
			return std::nullopt;
		auto const decoded = Encoding::decode(input_, off);
		return unit{decoded.first, off, decoded.second};
	}

	[[nodiscard]] constexpr std::optional<unit> peek() const noexcept
	{
		return peek_at(offset_);
	}

	result<void> advance(std::size_t n) noexcept
	{
		if (n > remaining())
			return error::out_of_bounds(input_.size());
		if (!Encoding::is_boundary(input_, offset_ + n))
			return error::mismatch(offset_ + n, "code point boundary");
		offset_ += n;
		return {};
	}

	[[nodiscard]] result<std::string_view> slice(span s) const noexcept
	{
		if ((s.begin > input_.size()) || (s.length > (input_.size() - s.begin)))
			return error::out_of_bounds(input_.size());
		return input_.substr(s.begin, s.length);
	}

	// Repositions the cursor without validation; used by combinators to
	// restore a previously observed offset.
	constexpr void seek(std::size_t off) noexcept { offset_ = off; }

	constexpr void reset() noexcept { offset_ = 0; }
	constexpr void reset(std::string_view input) noexcept { input_ = input; offset_ = 0; }
};

using text_cursor = basic_cursor<text_encoding>;
using byte_cursor = basic_cursor<byte_encoding>;

template <class C> struct is_cursor : std::false_type {};
template <class E> struct is_cursor<basic_cursor<E>> : std::true_type {};
template <class C> inline constexpr bool is_cursor_v = is_cursor<std::decay_t<C>>::value;

} // namespace neure

#endif
