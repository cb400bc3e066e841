// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef NEURE_INCLUDE_NEURE_ITERATOR_HPP
#define NEURE_INCLUDE_NEURE_ITERATOR_HPP

#include <neure/matcher.hpp>

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>

namespace neure {

// Input iterator over successive matches of a matcher, each one starting
// where the previous one ended. Iteration stops at the first failed match,
// at the end of input, or after a zero-length match. The matcher is shared
// with the range, so an iterator stays valid after its range is destroyed.
template <class M, class Cursor>
class span_iterator
{
	std::shared_ptr<M const> matcher_;
	Cursor cursor_;
	std::optional<span> current_;

	void next()
	{
		current_.reset();
		if ((matcher_ == nullptr) || cursor_.at_end())
			return;
		if (auto r = matcher_->try_match(cursor_, nullptr); r)
			current_ = *r;
	}

public:
	using iterator_category = std::input_iterator_tag;
	using value_type = span;
	using difference_type = std::ptrdiff_t;
	using pointer = span const*;
	using reference = span const&;

	span_iterator() noexcept = default;
	span_iterator(std::shared_ptr<M const> m, Cursor cur) : matcher_{std::move(m)}, cursor_{cur} { next(); }

	[[nodiscard]] Cursor const& cursor() const noexcept { return cursor_; }
	[[nodiscard]] reference operator*() const noexcept { return *current_; }
	[[nodiscard]] pointer operator->() const noexcept { return &*current_; }

	span_iterator& operator++()
	{
		if (current_ && current_->empty())
			current_.reset();
		else
			next();
		return *this;
	}

	span_iterator operator++(int) { span_iterator i{*this}; ++*this; return i; }

	[[nodiscard]] friend bool operator==(span_iterator const& x, span_iterator const& y) noexcept
	{
		if (!x.current_ || !y.current_)
			return x.current_.has_value() == y.current_.has_value();
		return (x.matcher_ == y.matcher_) && (*x.current_ == *y.current_);
	}

	[[nodiscard]] friend bool operator!=(span_iterator const& x, span_iterator const& y) noexcept { return !(x == y); }
};

template <class M, class Cursor>
class span_range
{
	std::shared_ptr<M const> matcher_;
	Cursor cursor_;

public:
	using iterator = span_iterator<M, Cursor>;

	span_range(M m, Cursor cur) : matcher_{std::make_shared<M const>(std::move(m))}, cursor_{cur} {}
	[[nodiscard]] iterator begin() const { return iterator{matcher_, cursor_}; }
	[[nodiscard]] iterator end() const noexcept { return iterator{}; }
};

// Input iterator over the units of a cursor's input from its current offset.
// It holds its own copy of the cursor.
template <class Cursor>
class unit_iterator
{
	Cursor cursor_;
	std::optional<typename Cursor::unit> current_;

public:
	using iterator_category = std::input_iterator_tag;
	using value_type = typename Cursor::unit;
	using difference_type = std::ptrdiff_t;
	using pointer = value_type const*;
	using reference = value_type const&;

	unit_iterator() noexcept = default;
	unit_iterator(Cursor const& cur, std::size_t off) : cursor_{cur}, current_{cur.peek_at(off)} {}

	[[nodiscard]] reference operator*() const noexcept { return *current_; }
	[[nodiscard]] pointer operator->() const noexcept { return &*current_; }
	unit_iterator& operator++() { current_ = cursor_.peek_at(current_->next()); return *this; }
	unit_iterator operator++(int) { unit_iterator i{*this}; ++*this; return i; }

	[[nodiscard]] friend bool operator==(unit_iterator const& x, unit_iterator const& y) noexcept
	{
		if (!x.current_ || !y.current_)
			return x.current_.has_value() == y.current_.has_value();
		return x.current_->offset == y.current_->offset;
	}

	[[nodiscard]] friend bool operator!=(unit_iterator const& x, unit_iterator const& y) noexcept { return !(x == y); }
};

template <class Cursor>
class unit_range
{
	Cursor cursor_;

public:
	using iterator = unit_iterator<Cursor>;

	explicit unit_range(Cursor cur) noexcept : cursor_{cur} {}
	[[nodiscard]] iterator begin() const { return iterator{cursor_, cursor_.offset()}; }
	[[nodiscard]] iterator end() const noexcept { return iterator{}; }
};

template <class E, class Cursor, class = std::enable_if_t<is_cursor_v<Cursor>>>
[[nodiscard]] auto match_spans(E&& e, Cursor const& cur)
{
	return span_range<matcher_t<E>, Cursor>{make_matcher(std::forward<E>(e)), cur};
}

template <class Cursor, class = std::enable_if_t<is_cursor_v<Cursor>>>
[[nodiscard]] unit_range<Cursor> units(Cursor const& cur) noexcept
{
	return unit_range<Cursor>{cur};
}

// Scans forward one unit at a time for the first offset at which m matches,
// leaving the cursor after that match. The cursor is unchanged if no offset
// matches.
template <class M, class Cursor, class = std::enable_if_t<is_cursor_v<Cursor>>>
[[nodiscard]] std::optional<span> find(M const& m, Cursor& cur, capture_store* store = nullptr)
{
	auto const beg = cur.offset();
	for (std::size_t off = beg; off <= cur.length(); ) {
		auto const cp = detail::mark(store);
		cur.seek(off);
		if (auto r = neure::try_match(m, cur, store); r)
			return *r;
		detail::rollback(store, cp);
		auto const u = cur.peek_at(off);
		if (!u)
			break;
		off = u->next();
	}
	cur.seek(beg);
	return std::nullopt;
}

} // namespace neure

#endif
