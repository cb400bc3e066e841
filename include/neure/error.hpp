// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef NEURE_INCLUDE_NEURE_ERROR_HPP
#define NEURE_INCLUDE_NEURE_ERROR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace neure {

class neure_error : public std::runtime_error { using std::runtime_error::runtime_error; };
class bad_character_range : public neure_error { public: bad_character_range() : neure_error{"character range is reversed"} {} };
class bad_quantifier_bounds : public neure_error { public: bad_quantifier_bounds() : neure_error{"minimum repetition count exceeds maximum"} {} };
class bad_radix : public neure_error { public: bad_radix() : neure_error{"radix must be between 2 and 36"} {} };
class bad_matcher : public neure_error { public: bad_matcher() : neure_error{"dynamic matcher is undefined or its definition has expired"} {} };
class bad_result_access : public neure_error { public: bad_result_access() : neure_error{"attempted to access the value of a failed result"} {} };

enum class error_kind : std::uint_least8_t
{
	mismatch,
	out_of_bounds,
	capture_out_of_bounds,
	conversion_failed
};

[[nodiscard]] constexpr std::string_view to_string(error_kind kind) noexcept
{
	switch (kind) {
		case error_kind::mismatch: return "mismatch";
		case error_kind::out_of_bounds: return "out of bounds";
		case error_kind::capture_out_of_bounds: return "capture out of bounds";
		case error_kind::conversion_failed: return "conversion failed";
	}
	return "unknown";
}

// Outcome of a failed match attempt. Mismatch descriptions point at static
// strings owned by the predicates, so failing alternatives never allocate.
class error
{
	error_kind kind_{error_kind::mismatch};
	std::size_t position_{0};
	std::size_t slot_{0};
	std::string_view expected_;
	std::string_view slice_;
	std::string cause_;

	error(error_kind k, std::size_t pos) noexcept : kind_{k}, position_{pos} {}

public:
	[[nodiscard]] static error mismatch(std::size_t pos, std::string_view expected) noexcept { error e{error_kind::mismatch, pos}; e.expected_ = expected; return e; }
	[[nodiscard]] static error out_of_bounds(std::size_t pos) noexcept { return error{error_kind::out_of_bounds, pos}; }
	[[nodiscard]] static error capture_out_of_bounds(std::size_t slot) noexcept { error e{error_kind::capture_out_of_bounds, 0}; e.slot_ = slot; return e; }

	[[nodiscard]] static error conversion_failed(std::size_t pos, std::string_view slice, std::string cause)
	{
		error e{error_kind::conversion_failed, pos};
		e.slice_ = slice;
		e.cause_ = std::move(cause);
		return e;
	}

	[[nodiscard]] error_kind kind() const noexcept { return kind_; }
	[[nodiscard]] std::size_t position() const noexcept { return position_; }
	[[nodiscard]] std::size_t slot() const noexcept { return slot_; }
	[[nodiscard]] std::string_view expected() const noexcept { return expected_; }
	[[nodiscard]] std::string_view slice() const noexcept { return slice_; }
	[[nodiscard]] std::string const& cause() const noexcept { return cause_; }

	[[nodiscard]] std::string message() const
	{
		std::string msg{to_string(kind_)};
		switch (kind_) {
			case error_kind::mismatch:
				msg.append(" at offset ").append(std::to_string(position_)).append(": expected ").append(expected_);
				break;
			case error_kind::out_of_bounds:
				msg.append(" at offset ").append(std::to_string(position_));
				break;
			case error_kind::capture_out_of_bounds:
				msg.append(": slot ").append(std::to_string(slot_));
				break;
			case error_kind::conversion_failed:
				msg.append(" at offset ").append(std::to_string(position_)).append(" for \"").append(slice_).append("\": ").append(cause_);
				break;
		}
		return msg;
	}

	[[nodiscard]] friend bool operator==(error const& x, error const& y) noexcept
	{
		return (x.kind_ == y.kind_) && (x.position_ == y.position_) && (x.slot_ == y.slot_) &&
			(x.expected_ == y.expected_) && (x.slice_ == y.slice_) && (x.cause_ == y.cause_);
	}

	[[nodiscard]] friend bool operator!=(error const& x, error const& y) noexcept { return !(x == y); }
};

template <class T>
class [[nodiscard]] result
{
	static_assert(!std::is_same_v<std::decay_t<T>, neure::error>, "result value type cannot be error");
	std::variant<T, neure::error> storage_;

public:
	using value_type = T;

	template <class U = T, class = std::enable_if_t<std::is_constructible_v<T, U&&> && !std::is_same_v<std::decay_t<U>, neure::error> && !std::is_same_v<std::decay_t<U>, result>>>
	result(U&& value) : storage_{std::in_place_index<0>, std::forward<U>(value)} {} // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
	result(neure::error e) : storage_{std::in_place_index<1>, std::move(e)} {} // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)

	[[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
	[[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

	[[nodiscard]] T& value() & { if (!has_value()) throw bad_result_access{}; return std::get<0>(storage_); }
	[[nodiscard]] T const& value() const& { if (!has_value()) throw bad_result_access{}; return std::get<0>(storage_); }
	[[nodiscard]] T&& value() && { if (!has_value()) throw bad_result_access{}; return std::get<0>(std::move(storage_)); }
	template <class U> [[nodiscard]] T value_or(U&& alt) const& { return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(alt)); }

	[[nodiscard]] T& operator*() & noexcept { return *std::get_if<0>(&storage_); }
	[[nodiscard]] T const& operator*() const& noexcept { return *std::get_if<0>(&storage_); }
	[[nodiscard]] T&& operator*() && noexcept { return std::move(*std::get_if<0>(&storage_)); }
	[[nodiscard]] T* operator->() noexcept { return std::get_if<0>(&storage_); }
	[[nodiscard]] T const* operator->() const noexcept { return std::get_if<0>(&storage_); }

	[[nodiscard]] neure::error const& error() const& noexcept { return *std::get_if<1>(&storage_); }
	[[nodiscard]] neure::error&& error() && noexcept { return std::move(*std::get_if<1>(&storage_)); }
};

template <>
class [[nodiscard]] result<void>
{
	std::optional<neure::error> error_;

public:
	using value_type = void;

	result() noexcept = default;
	result(neure::error e) : error_{std::move(e)} {} // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)

	[[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
	[[nodiscard]] explicit operator bool() const noexcept { return has_value(); }
	void value() const { if (error_.has_value()) throw bad_result_access{}; }
	[[nodiscard]] neure::error const& error() const& noexcept { return *error_; }
	[[nodiscard]] neure::error&& error() && noexcept { return std::move(*error_); }
};

} // namespace neure

#endif
