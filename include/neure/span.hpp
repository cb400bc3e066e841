// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef NEURE_INCLUDE_NEURE_SPAN_HPP
#define NEURE_INCLUDE_NEURE_SPAN_HPP

#include <neure/error.hpp>

#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>

namespace neure {

struct span
{
	std::size_t begin{0};
	std::size_t length{0};

	[[nodiscard]] constexpr std::size_t end() const noexcept { return begin + length; }
	[[nodiscard]] constexpr bool empty() const noexcept { return length == 0; }
	[[nodiscard]] constexpr span merge(span const& s) const noexcept { return span{begin, s.end() - begin}; }
	[[nodiscard]] friend constexpr bool operator==(span const& x, span const& y) noexcept { return (x.begin == y.begin) && (x.length == y.length); }
	[[nodiscard]] friend constexpr bool operator!=(span const& x, span const& y) noexcept { return !(x == y); }
	[[nodiscard]] friend constexpr bool operator<(span const& x, span const& y) noexcept { return (x.begin < y.begin) || ((x.begin == y.begin) && (x.length < y.length)); }
};

class span_list
{
	span const* first_{nullptr};
	std::size_t size_{0};

public:
	constexpr span_list() noexcept = default;
	constexpr span_list(span const* first, std::size_t size) noexcept : first_{first}, size_{size} {}
	[[nodiscard]] constexpr span const* begin() const noexcept { return first_; }
	[[nodiscard]] constexpr span const* end() const noexcept { return first_ + size_; } // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
	[[nodiscard]] constexpr std::size_t size() const noexcept { return size_; }
	[[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }
	[[nodiscard]] constexpr span const& operator[](std::size_t i) const noexcept { return first_[i]; } // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
	[[nodiscard]] constexpr span const& front() const noexcept { return first_[0]; } // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
	[[nodiscard]] constexpr span const& back() const noexcept { return first_[size_ - 1]; } // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
};

// Fixed set of capture slots, each holding the spans recorded for it in match
// order. Every push is journaled so that alternation and repetition can drop
// the captures of an abandoned attempt with rollback.
class capture_store
{
	std::vector<std::vector<span>> slots_;
	std::vector<std::size_t> journal_;

public:
	using checkpoint = std::size_t;

	explicit capture_store(std::size_t capacity) : slots_(capacity) {}

	[[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }
	[[nodiscard]] bool contains(std::size_t slot) const noexcept { return (slot < slots_.size()) && !slots_[slot].empty(); }
	[[nodiscard]] std::size_t size() const noexcept { return journal_.size(); }

	[[nodiscard]] result<span_list> spans(std::size_t slot) const
	{
		if (slot >= slots_.size())
			return error::capture_out_of_bounds(slot);
		return span_list{slots_[slot].data(), slots_[slot].size()};
	}

	[[nodiscard]] result<span> span_at(std::size_t slot, std::size_t index) const
	{
		if ((slot >= slots_.size()) || (index >= slots_[slot].size()))
			return error::capture_out_of_bounds(slot);
		return slots_[slot][index];
	}

	template <class Cursor>
	[[nodiscard]] result<std::vector<std::string_view>> slices(std::size_t slot, Cursor const& cursor) const
	{
		if (slot >= slots_.size())
			return error::capture_out_of_bounds(slot);
		std::vector<std::string_view> views;
		views.reserve(slots_[slot].size());
		for (auto const& s : slots_[slot]) {
			auto slice = cursor.slice(s);
			if (!slice)
				return std::move(slice).error();
			views.push_back(*slice);
		}
		return views;
	}

	result<void> push(std::size_t slot, span s)
	{
		if (slot >= slots_.size())
			return error::capture_out_of_bounds(slot);
		slots_[slot].push_back(s);
		journal_.push_back(slot);
		return {};
	}

	[[nodiscard]] checkpoint mark() const noexcept { return journal_.size(); }

	void rollback(checkpoint cp) noexcept
	{
		while (journal_.size() > cp) {
			slots_[journal_.back()].pop_back();
			journal_.pop_back();
		}
	}

	// Removes the captures recorded since cp, returning them in push order so
	// they can be reinstated later with replay.
	[[nodiscard]] std::vector<std::pair<std::size_t, span>> take(checkpoint cp)
	{
		std::vector<std::pair<std::size_t, span>> entries;
		if (journal_.size() > cp) {
			entries.resize(journal_.size() - cp);
			for (auto it = entries.rbegin(); journal_.size() > cp; ++it) {
				*it = {journal_.back(), slots_[journal_.back()].back()};
				slots_[journal_.back()].pop_back();
				journal_.pop_back();
			}
		}
		return entries;
	}

	void replay(std::vector<std::pair<std::size_t, span>> const& entries)
	{
		for (auto const& [slot, s] : entries) {
			slots_[slot].push_back(s);
			journal_.push_back(slot);
		}
	}

	void reset() noexcept
	{
		for (auto& slot : slots_)
			slot.clear();
		journal_.clear();
	}
};

} // namespace neure

#endif
