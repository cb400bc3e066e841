// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef NEURE_INCLUDE_NEURE_DYNAMIC_HPP
#define NEURE_INCLUDE_NEURE_DYNAMIC_HPP

#include <neure/matcher.hpp>

#include <atomic>
#include <memory>
#include <type_traits>
#include <utility>

namespace neure {

template <class Cursor>
class matcher_concept
{
public:
	matcher_concept() = default;
	matcher_concept(matcher_concept const&) = delete;
	matcher_concept(matcher_concept&&) = delete;
	matcher_concept& operator=(matcher_concept const&) = delete;
	matcher_concept& operator=(matcher_concept&&) = delete;
	virtual ~matcher_concept() = default;
	[[nodiscard]] virtual result<span> try_match(Cursor& cur, capture_store* store) const = 0;
};

template <class Cursor, class M>
class matcher_model final : public matcher_concept<Cursor>
{
	M matcher_;

public:
	template <class X, class = std::enable_if_t<std::is_constructible_v<M, X&&>>>
	explicit matcher_model(X&& x) : matcher_{std::forward<X>(x)} {}
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const override { return matcher_.try_match(cur, store); }
};

template <class Cursor, class E>
[[nodiscard]] std::unique_ptr<matcher_concept<Cursor> const> make_matcher_model(E&& e)
{
	return std::make_unique<matcher_model<Cursor, matcher_t<E>> const>(make_matcher(std::forward<E>(e)));
}

// Single owner of a type-erased matcher.
template <class Cursor>
class boxed_matcher : public matcher_interface<boxed_matcher<Cursor>>
{
	std::unique_ptr<matcher_concept<Cursor> const> impl_;

public:
	using cursor_type = Cursor;

	boxed_matcher() noexcept = default;

	template <class E, class = std::enable_if_t<is_matcher_operand_v<E> && !std::is_same_v<std::decay_t<E>, boxed_matcher>>>
	boxed_matcher(E&& e) : impl_{make_matcher_model<Cursor>(std::forward<E>(e))} {} // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)

	[[nodiscard]] bool defined() const noexcept { return impl_ != nullptr; }

	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		if (impl_ == nullptr)
			throw bad_matcher{};
		return impl_->try_match(cur, store);
	}
};

template <class Cursor, bool Synchronized>
class basic_dynamic_matcher;

// Non-owning handle to the definition of a dynamic matcher, used where a
// grammar refers back to itself so that no ownership cycle is formed.
template <class Cursor, bool Synchronized>
class matcher_reference : public matcher_interface<matcher_reference<Cursor, Synchronized>>
{
	friend class basic_dynamic_matcher<Cursor, Synchronized>;
	using slot_type = std::shared_ptr<matcher_concept<Cursor> const>;

	std::weak_ptr<slot_type> slot_;

	explicit matcher_reference(std::weak_ptr<slot_type> s) noexcept : slot_{std::move(s)} {}

public:
	using cursor_type = Cursor;

	[[nodiscard]] bool expired() const noexcept { return slot_.expired(); }

	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		auto const slot = slot_.lock();
		if (slot == nullptr)
			throw bad_matcher{};
		return basic_dynamic_matcher<Cursor, Synchronized>::match_slot(*slot, cur, store);
	}
};

// Shared handle to a type-erased matcher definition. Copies alias the same
// definition, which may be supplied after the handle has been referenced by
// other matchers, allowing recursive grammars. The synchronized variant
// publishes and reads the definition atomically so that handles can be
// shared across threads while the grammar is redefined.
template <class Cursor, bool Synchronized>
class basic_dynamic_matcher : public matcher_interface<basic_dynamic_matcher<Cursor, Synchronized>>
{
	friend class matcher_reference<Cursor, Synchronized>;
	using impl_type = std::shared_ptr<matcher_concept<Cursor> const>;

	std::shared_ptr<impl_type> slot_;

	[[nodiscard]] static impl_type acquire(impl_type const& impl)
	{
		if constexpr (Synchronized)
			return std::atomic_load(&impl);
		else
			return impl;
	}

	static void publish(impl_type& impl, impl_type desired)
	{
		if constexpr (Synchronized)
			std::atomic_store(&impl, std::move(desired));
		else
			impl = std::move(desired);
	}

	[[nodiscard]] static result<span> match_slot(impl_type const& slot, Cursor& cur, capture_store* store)
	{
		if constexpr (Synchronized) {
			auto const impl = acquire(slot);
			if (impl == nullptr)
				throw bad_matcher{};
			return impl->try_match(cur, store);
		} else {
			if (slot == nullptr)
				throw bad_matcher{};
			return slot->try_match(cur, store);
		}
	}

public:
	using cursor_type = Cursor;

	basic_dynamic_matcher() : slot_{std::make_shared<impl_type>()} {}

	template <class E, class = std::enable_if_t<is_matcher_operand_v<E> && !std::is_same_v<std::decay_t<E>, basic_dynamic_matcher>>>
	basic_dynamic_matcher(E&& e) : basic_dynamic_matcher{} { define(std::forward<E>(e)); } // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)

	template <class E, class = std::enable_if_t<is_matcher_operand_v<E>>>
	basic_dynamic_matcher& define(E&& e)
	{
		publish(*slot_, impl_type{make_matcher_model<Cursor>(std::forward<E>(e))});
		return *this;
	}

	[[nodiscard]] bool defined() const { return acquire(*slot_) != nullptr; }
	[[nodiscard]] long use_count() const noexcept { return slot_.use_count(); }
	[[nodiscard]] matcher_reference<Cursor, Synchronized> reference() const noexcept { return matcher_reference<Cursor, Synchronized>{slot_}; }

	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		return match_slot(*slot_, cur, store);
	}
};

template <class Cursor> using dynamic_matcher = basic_dynamic_matcher<Cursor, false>;
template <class Cursor> using synchronized_matcher = basic_dynamic_matcher<Cursor, true>;
template <class Cursor> using dynamic_reference = matcher_reference<Cursor, false>;
template <class Cursor> using synchronized_reference = matcher_reference<Cursor, true>;

} // namespace neure

#endif
