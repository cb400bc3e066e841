// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef NEURE_INCLUDE_NEURE_MATCHER_HPP
#define NEURE_INCLUDE_NEURE_MATCHER_HPP

#include <neure/cursor.hpp>
#include <neure/detail.hpp>
#include <neure/error.hpp>
#include <neure/span.hpp>
#include <neure/unit.hpp>

#include <charconv>
#include <cstddef>
#include <exception>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace neure {

struct matcher_trait_tag {};
template <class M, class = void> struct is_matcher : std::false_type {};
template <class M> struct is_matcher<M, std::enable_if_t<std::is_same_v<matcher_trait_tag, typename std::decay_t<M>::matcher_trait>>> : std::true_type {};
template <class M> inline constexpr bool is_matcher_v = is_matcher<M>::value;

template <class E>
inline constexpr bool is_matcher_operand_v = is_matcher_v<E> || is_unit_predicate_v<E> || is_unit_literal_v<E> || std::is_convertible_v<E, std::string_view>;

template <class Derived>
struct matcher_interface
{
	using matcher_trait = matcher_trait_tag;
	[[nodiscard]] constexpr Derived& derived() noexcept { return static_cast<Derived&>(*this); }
	[[nodiscard]] constexpr Derived const& derived() const noexcept { return static_cast<Derived const&>(*this); }
};

template <class Derived, class M1>
struct unary_matcher_interface : matcher_interface<Derived>
{
	M1 m1;
	template <class X1, class = std::enable_if_t<std::is_constructible_v<M1, X1&&>>>
	constexpr explicit unary_matcher_interface(X1&& x1) : m1(std::forward<X1>(x1)) {}
};

template <class Derived, class M1, class M2>
struct binary_matcher_interface : matcher_interface<Derived>
{
	M1 m1;
	M2 m2;
	template <class X1, class X2, class = std::enable_if_t<std::is_constructible_v<M1, X1&&> && std::is_constructible_v<M2, X2&&>>>
	constexpr binary_matcher_interface(X1&& x1, X2&& x2) : m1(std::forward<X1>(x1)), m2(std::forward<X2>(x2)) {}
};

namespace detail {

[[nodiscard]] inline capture_store::checkpoint mark(capture_store const* store) noexcept
{
	return (store != nullptr) ? store->mark() : 0;
}

inline void rollback(capture_store* store, capture_store::checkpoint cp) noexcept
{
	if (store != nullptr)
		store->rollback(cp);
}

template <class M, class Cursor, class = void> struct has_try_value : std::false_type {};
template <class M, class Cursor> struct has_try_value<M, Cursor, std::void_t<decltype(std::declval<M const&>().try_value(std::declval<Cursor&>(), std::declval<capture_store*>()))>> : std::true_type {};
template <class M, class Cursor> inline constexpr bool has_try_value_v = has_try_value<M, Cursor>::value;

template <class R> struct unwrap_conversion { using type = R; };
template <class T> struct unwrap_conversion<result<T>> { using type = T; };
template <class T> struct unwrap_conversion<std::optional<T>> { using type = T; };
template <class R> using unwrap_conversion_t = typename unwrap_conversion<std::decay_t<R>>::type;

} // namespace detail

// Matches m and yields its value: the converted value for matchers that
// produce one, otherwise the slice of input that m consumed.
template <class M, class Cursor>
[[nodiscard]] auto try_value(M const& m, Cursor& cur, capture_store* store)
{
	if constexpr (detail::has_try_value_v<M, Cursor>) {
		return m.try_value(cur, store);
	} else {
		auto r = m.try_match(cur, store);
		if (!r)
			return result<std::string_view>{std::move(r).error()};
		return result<std::string_view>{cur.input().substr(r->begin, r->length)};
	}
}

template <class M, class Cursor>
using value_t = typename decltype(neure::try_value(std::declval<M const&>(), std::declval<Cursor&>(), std::declval<capture_store*>()))::value_type;

struct bounds
{
	static constexpr std::size_t npos = (std::numeric_limits<std::size_t>::max)();

	std::size_t min{0};
	std::size_t max{npos};

	constexpr bounds() noexcept = default;

	constexpr bounds(std::size_t lo, std::size_t hi) : min{lo}, max{hi}
	{
		if (min > max)
			throw bad_quantifier_bounds{};
	}

	[[nodiscard]] static constexpr bounds exactly(std::size_t n) noexcept { bounds b; b.min = n; b.max = n; return b; }
	[[nodiscard]] static constexpr bounds at_least(std::size_t n) noexcept { bounds b; b.min = n; return b; }
	[[nodiscard]] static constexpr bounds at_most(std::size_t n) noexcept { bounds b; b.max = n; return b; }
	[[nodiscard]] constexpr bool contains(std::size_t n) const noexcept { return (min <= n) && (n <= max); }
};

class literal_matcher : public matcher_interface<literal_matcher>
{
	std::string text_;

public:
	explicit literal_matcher(std::string_view t) : text_{t} {}
	[[nodiscard]] std::string const& text() const noexcept { return text_; }

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* /*store*/) const
	{
		auto const beg = cur.offset();
		auto const rest = cur.rest();
		if (rest.substr(0, text_.size()) != text_) {
			if ((rest.size() < text_.size()) && (text_.compare(0, rest.size(), rest) == 0))
				return error::out_of_bounds(cur.length());
			return error::mismatch(beg, "literal string");
		}
		if (auto adv = cur.advance(text_.size()); !adv)
			return std::move(adv).error();
		return span{beg, text_.size()};
	}
};

template <class P>
struct one_matcher : matcher_interface<one_matcher<P>>
{
	P pred;

	template <class X, class = std::enable_if_t<std::is_constructible_v<P, X&&>>>
	constexpr explicit one_matcher(X&& x) : pred(std::forward<X>(x)) {}

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* /*store*/) const
	{
		auto const u = cur.peek();
		if (!u)
			return error::out_of_bounds(cur.offset());
		if (!pred(u->value))
			return error::mismatch(u->offset, pred.expected());
		cur.seek(u->next());
		return span{u->offset, u->width};
	}
};

struct eps_matcher : matcher_interface<eps_matcher>
{
	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* /*store*/) const { return span{cur.offset(), 0}; }
};

struct start_matcher : matcher_interface<start_matcher>
{
	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* /*store*/) const
	{
		if (!cur.at_start())
			return error::mismatch(cur.offset(), "start of input");
		return span{0, 0};
	}
};

struct end_matcher : matcher_interface<end_matcher>
{
	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* /*store*/) const
	{
		if (!cur.at_end())
			return error::mismatch(cur.offset(), "end of input");
		return span{cur.offset(), 0};
	}
};

template <class E>
[[nodiscard]] constexpr auto make_matcher(E&& e)
{
	if constexpr (is_matcher_v<E>)
		return std::decay_t<E>{std::forward<E>(e)};
	else if constexpr (is_unit_literal_v<E>)
		return one_matcher<equal_predicate>{make_predicate(e)};
	else if constexpr (is_unit_predicate_v<E>)
		return one_matcher<std::decay_t<E>>{std::forward<E>(e)};
	else if constexpr (std::is_convertible_v<E, std::string_view>)
		return literal_matcher{std::string_view{e}};
	else
		static_assert(detail::always_false_v<E>, "invalid matcher type");
}

template <class E> using matcher_t = std::decay_t<decltype(make_matcher(std::declval<E>()))>;

struct always_continue
{
	template <class Cursor, class Unit>
	[[nodiscard]] constexpr bool operator()(Cursor const& /*cur*/, Unit const& /*u*/) const noexcept { return true; }
};

// Greedy unit repetition. Each unit accepted by pred is offered to cond
// before it is counted; a false answer ends the repetition successfully in
// front of that unit. The cursor stays at the starting offset while cond
// runs, so lookahead goes through peek_at or rest_at.
template <class P, class Cond = always_continue>
struct count_matcher : matcher_interface<count_matcher<P, Cond>>
{
	P pred;
	bounds limits;
	Cond cond;

	constexpr count_matcher(P p, bounds b, Cond c) : pred(std::move(p)), limits{b}, cond(std::move(c)) {}

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* /*store*/) const
	{
		auto const beg = cur.offset();
		std::size_t end = beg;
		std::size_t count = 0;
		bool exhausted = false;
		while (count < limits.max) {
			auto const u = cur.peek_at(end);
			if (!u) {
				exhausted = true;
				break;
			}
			if (!pred(u->value) || !cond(std::as_const(cur), *u))
				break;
			end = u->next();
			++count;
		}
		if (count < limits.min) {
			result<span> ret{exhausted ? error::out_of_bounds(end) : error::mismatch(end, pred.expected())};
			return NEURE_TRACE_RESULT("count", beg, ret);
		}
		cur.seek(end);
		result<span> ret{span{beg, end - beg}};
		return NEURE_TRACE_RESULT("count", beg, ret);
	}
};

// Continuation condition that accepts a unit only when m matches starting at
// that unit.
template <class M>
struct lookahead_condition
{
	M matcher;

	template <class Cursor, class Unit>
	[[nodiscard]] bool operator()(Cursor const& cur, Unit const& u) const
	{
		Cursor probe{cur.input()};
		probe.seek(u.offset);
		return matcher.try_match(probe, nullptr).has_value();
	}
};

namespace detail {

// Shared loop of the matcher-level repetitions. step runs one repetition and
// yields its value, sink receives each value that is kept.
template <class Cursor, class Step, class Sink>
[[nodiscard]] result<span> repeat_loop(Cursor& cur, capture_store* store, bounds limits, Step const& step, Sink&& sink)
{
	auto const beg = cur.offset();
	auto const cp = detail::mark(store);
	std::size_t count = 0;
	while (count < limits.max) {
		auto const pos = cur.offset();
		auto const icp = detail::mark(store);
		auto r = step(cur, store);
		if (!r) {
			cur.seek(pos);
			detail::rollback(store, icp);
			if (count < limits.min) {
				cur.seek(beg);
				detail::rollback(store, cp);
				return std::move(r).error();
			}
			break;
		}
		sink(std::move(*r));
		++count;
		if (cur.offset() == pos)
			break;
	}
	return span{beg, cur.offset() - beg};
}

} // namespace detail

template <class M1>
struct repeat_matcher : unary_matcher_interface<repeat_matcher<M1>, M1>
{
	bounds limits;

	template <class X1>
	constexpr repeat_matcher(X1&& x1, bounds b) : unary_matcher_interface<repeat_matcher<M1>, M1>{std::forward<X1>(x1)}, limits{b} {}

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		[[maybe_unused]] auto const beg = cur.offset();
		auto ret = detail::repeat_loop(cur, store, limits, [this](Cursor& c, capture_store* s) { return this->m1.try_match(c, s); }, [](span&&) {});
		return NEURE_TRACE_RESULT("repeat", beg, ret);
	}
};

template <class M1>
struct collect_matcher : unary_matcher_interface<collect_matcher<M1>, M1>
{
	bounds limits;

	template <class X1>
	constexpr collect_matcher(X1&& x1, bounds b) : unary_matcher_interface<collect_matcher<M1>, M1>{std::forward<X1>(x1)}, limits{b} {}

	template <class Cursor>
	[[nodiscard]] result<std::vector<value_t<M1, Cursor>>> try_value(Cursor& cur, capture_store* store) const
	{
		std::vector<value_t<M1, Cursor>> values;
		auto r = detail::repeat_loop(cur, store, limits, [this](Cursor& c, capture_store* s) { return neure::try_value(this->m1, c, s); }, [&values](auto&& v) { values.push_back(std::forward<decltype(v)>(v)); });
		if (!r)
			return std::move(r).error();
		return values;
	}

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		auto const beg = cur.offset();
		auto r = try_value(cur, store);
		if (!r)
			return std::move(r).error();
		return span{beg, cur.offset() - beg};
	}
};

template <class M1, class M2>
struct sequence_matcher : binary_matcher_interface<sequence_matcher<M1, M2>, M1, M2>
{
	using base_type = binary_matcher_interface<sequence_matcher<M1, M2>, M1, M2>;
	using base_type::base_type;

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		auto const beg = cur.offset();
		if (auto r1 = this->m1.try_match(cur, store); !r1)
			return NEURE_TRACE_RESULT("sequence", beg, r1);
		if (auto r2 = this->m2.try_match(cur, store); !r2)
			return NEURE_TRACE_RESULT("sequence", beg, r2);
		return span{beg, cur.offset() - beg};
	}
};

template <class M1, class M2>
struct choice_matcher : binary_matcher_interface<choice_matcher<M1, M2>, M1, M2>
{
	using base_type = binary_matcher_interface<choice_matcher<M1, M2>, M1, M2>;
	using base_type::base_type;

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		auto const beg = cur.offset();
		auto const cp = detail::mark(store);
		if (auto r1 = this->m1.try_match(cur, store); r1)
			return r1;
		cur.seek(beg);
		detail::rollback(store, cp);
		auto r2 = this->m2.try_match(cur, store);
		if (!r2) {
			cur.seek(beg);
			detail::rollback(store, cp);
		}
		return NEURE_TRACE_RESULT("choice", beg, r2);
	}
};

// Runs both alternatives from the same offset and keeps the longer one, the
// left alternative winning ties. Only the winner's captures survive.
template <class M1, class M2>
struct longest_matcher : binary_matcher_interface<longest_matcher<M1, M2>, M1, M2>
{
	using base_type = binary_matcher_interface<longest_matcher<M1, M2>, M1, M2>;
	using base_type::base_type;

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		auto const beg = cur.offset();
		auto const cp = detail::mark(store);
		auto r1 = this->m1.try_match(cur, store);
		auto const end1 = cur.offset();
		std::vector<std::pair<std::size_t, span>> captures1;
		if (r1 && (store != nullptr))
			captures1 = store->take(cp);
		else
			detail::rollback(store, cp);
		cur.seek(beg);
		auto r2 = this->m2.try_match(cur, store);
		if (r1 && (!r2 || (r2->length <= (end1 - beg)))) {
			detail::rollback(store, cp);
			if (store != nullptr)
				store->replay(captures1);
			cur.seek(end1);
			result<span> ret{span{beg, end1 - beg}};
			return NEURE_TRACE_RESULT("longest", beg, ret);
		}
		if (!r2) {
			cur.seek(beg);
			detail::rollback(store, cp);
			return NEURE_TRACE_RESULT("longest", beg, r1);
		}
		return NEURE_TRACE_RESULT("longest", beg, r2);
	}
};

// left, sep, right in sequence; yields the pair of the left and right values.
// On failure the cursor and captures are restored.
template <class L, class S, class R>
struct sep_once_matcher : matcher_interface<sep_once_matcher<L, S, R>>
{
	L left;
	S sep;
	R right;

	constexpr sep_once_matcher(L l, S s, R r) : left(std::move(l)), sep(std::move(s)), right(std::move(r)) {}

	template <class Cursor>
	[[nodiscard]] result<std::pair<value_t<L, Cursor>, value_t<R, Cursor>>> try_value(Cursor& cur, capture_store* store) const
	{
		auto const beg = cur.offset();
		auto const cp = detail::mark(store);
		auto const restore = [&] { cur.seek(beg); detail::rollback(store, cp); };
		auto l = neure::try_value(left, cur, store);
		if (!l) {
			restore();
			return std::move(l).error();
		}
		if (auto s = sep.try_match(cur, store); !s) {
			restore();
			return std::move(s).error();
		}
		auto r = neure::try_value(right, cur, store);
		if (!r) {
			restore();
			return std::move(r).error();
		}
		return std::make_pair(std::move(*l), std::move(*r));
	}

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		auto const beg = cur.offset();
		auto const cp = detail::mark(store);
		auto ret = [&]() -> result<span> {
			if (auto l = left.try_match(cur, store); !l)
				return l;
			if (auto s = sep.try_match(cur, store); !s)
				return s;
			if (auto r = right.try_match(cur, store); !r)
				return r;
			return span{beg, cur.offset() - beg};
		}();
		if (!ret) {
			cur.seek(beg);
			detail::rollback(store, cp);
		}
		return NEURE_TRACE_RESULT("sep_once", beg, ret);
	}
};

// One or more items, each followed by an optional separator that is kept,
// until an item or its separator fails. A trailing separator is consumed; in
// terminated mode every item must be followed by its own separator instead.
template <class P, class S>
class separate_matcher : public matcher_interface<separate_matcher<P, S>>
{
	P item_;
	S sep_;
	std::size_t min_{1};
	bool terminated_{false};

	template <class Cursor, class Step, class Sink>
	[[nodiscard]] result<span> match_items(Cursor& cur, capture_store* store, Step const& step, Sink&& sink) const
	{
		auto const beg = cur.offset();
		auto const cp = detail::mark(store);
		std::size_t count = 0;
		std::optional<error> failure;
		for (;;) {
			auto const pos = cur.offset();
			auto const icp = detail::mark(store);
			auto v = step(cur, store);
			if (!v) {
				failure = std::move(v).error();
				cur.seek(pos);
				detail::rollback(store, icp);
				break;
			}
			auto const item_end = cur.offset();
			auto const scp = detail::mark(store);
			auto const s = sep_.try_match(cur, store);
			if (!s) {
				cur.seek(item_end);
				detail::rollback(store, scp);
				if (terminated_) {
					failure = s.error();
					cur.seek(pos);
					detail::rollback(store, icp);
					break;
				}
			}
			sink(std::move(*v));
			++count;
			if (!s || (cur.offset() == pos))
				break;
		}
		if (count < min_) {
			cur.seek(beg);
			detail::rollback(store, cp);
			if (failure)
				return std::move(*failure);
			return error::mismatch(beg, "separated items");
		}
		return span{beg, cur.offset() - beg};
	}

public:
	constexpr separate_matcher(P item, S sep) : item_(std::move(item)), sep_(std::move(sep)) {}

	[[nodiscard]] constexpr std::size_t min_items() const noexcept { return min_; }
	[[nodiscard]] constexpr bool is_terminated() const noexcept { return terminated_; }
	[[nodiscard]] separate_matcher at_least(std::size_t n) const { separate_matcher m{*this}; m.min_ = n; return m; }
	[[nodiscard]] separate_matcher terminated(bool t = true) const { separate_matcher m{*this}; m.terminated_ = t; return m; }

	template <class Cursor>
	[[nodiscard]] result<std::vector<value_t<P, Cursor>>> try_value(Cursor& cur, capture_store* store) const
	{
		std::vector<value_t<P, Cursor>> values;
		auto r = match_items(cur, store, [this](Cursor& c, capture_store* s) { return neure::try_value(item_, c, s); }, [&values](auto&& v) { values.push_back(std::forward<decltype(v)>(v)); });
		if (!r)
			return std::move(r).error();
		return values;
	}

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		[[maybe_unused]] auto const beg = cur.offset();
		auto ret = match_items(cur, store, [this](Cursor& c, capture_store* s) { return item_.try_match(c, s); }, [](span&&) {});
		return NEURE_TRACE_RESULT("separate", beg, ret);
	}
};

// head, m, tail in sequence. The span covers all three while the value is
// the value of m alone.
template <class M, class H, class T>
struct enclose_matcher : matcher_interface<enclose_matcher<M, H, T>>
{
	M inner;
	H head;
	T tail;

	constexpr enclose_matcher(M m, H h, T t) : inner(std::move(m)), head(std::move(h)), tail(std::move(t)) {}

	template <class Cursor>
	[[nodiscard]] result<value_t<M, Cursor>> try_value(Cursor& cur, capture_store* store) const
	{
		if (auto h = head.try_match(cur, store); !h)
			return std::move(h).error();
		auto v = neure::try_value(inner, cur, store);
		if (!v)
			return std::move(v).error();
		if (auto t = tail.try_match(cur, store); !t)
			return std::move(t).error();
		return std::move(*v);
	}

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		auto const beg = cur.offset();
		if (auto h = head.try_match(cur, store); !h)
			return NEURE_TRACE_RESULT("enclose", beg, h);
		if (auto m = inner.try_match(cur, store); !m)
			return NEURE_TRACE_RESULT("enclose", beg, m);
		if (auto t = tail.try_match(cur, store); !t)
			return NEURE_TRACE_RESULT("enclose", beg, t);
		return span{beg, cur.offset() - beg};
	}
};

namespace detail {

template <class Out, class Fn, class In>
[[nodiscard]] result<Out> convert(Fn const& fn, In&& in, std::size_t pos, std::string_view slice)
{
	using ret_type = std::decay_t<std::invoke_result_t<Fn const&, In&&>>;
	try {
		if constexpr (is_specialization_of_v<ret_type, result>) {
			auto r = std::invoke(fn, std::forward<In>(in));
			if (!r) {
				auto const& e = r.error();
				return error::conversion_failed(pos, slice, e.kind() == error_kind::conversion_failed ? e.cause() : e.message());
			}
			return std::move(*r);
		} else if constexpr (is_specialization_of_v<ret_type, std::optional>) {
			auto r = std::invoke(fn, std::forward<In>(in));
			if (!r)
				return error::conversion_failed(pos, slice, "conversion produced no value");
			return std::move(*r);
		} else {
			return std::invoke(fn, std::forward<In>(in));
		}
	} catch (std::exception const& e) {
		return error::conversion_failed(pos, slice, e.what());
	}
}

} // namespace detail

template <class M1, class Fn>
struct map_matcher : unary_matcher_interface<map_matcher<M1, Fn>, M1>
{
	Fn fn;

	template <class X1, class F>
	constexpr map_matcher(X1&& x1, F&& f) : unary_matcher_interface<map_matcher<M1, Fn>, M1>{std::forward<X1>(x1)}, fn(std::forward<F>(f)) {}

	template <class Cursor>
	[[nodiscard]] auto try_value(Cursor& cur, capture_store* store) const
	{
		using output_type = detail::unwrap_conversion_t<std::invoke_result_t<Fn const&, value_t<M1, Cursor>&&>>;
		auto const beg = cur.offset();
		auto v = neure::try_value(this->m1, cur, store);
		if (!v)
			return result<output_type>{std::move(v).error()};
		return detail::convert<output_type>(fn, std::move(*v), beg, cur.input().substr(beg, cur.offset() - beg));
	}

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		auto const beg = cur.offset();
		auto v = try_value(cur, store);
		if (!v) {
			result<span> ret{std::move(v).error()};
			return NEURE_TRACE_RESULT("map", beg, ret);
		}
		return span{beg, cur.offset() - beg};
	}
};

template <class M1>
struct capture_matcher : unary_matcher_interface<capture_matcher<M1>, M1>
{
	std::size_t slot;

	template <class X1>
	constexpr capture_matcher(std::size_t s, X1&& x1) : unary_matcher_interface<capture_matcher<M1>, M1>{std::forward<X1>(x1)}, slot{s} {}

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		if ((store != nullptr) && (slot >= store->capacity()))
			return error::capture_out_of_bounds(slot);
		auto r = this->m1.try_match(cur, store);
		if (r && (store != nullptr))
			if (auto p = store->push(slot, *r); !p)
				return std::move(p).error();
		return r;
	}
};

// Probes without committing, then continues with on_match or otherwise from
// the starting offset. The probe is either a matcher, whose effects on the
// cursor and captures are undone, or a callable inspecting the cursor.
template <class Probe, class M1, class M2>
struct branch_matcher : binary_matcher_interface<branch_matcher<Probe, M1, M2>, M1, M2>
{
	Probe probe;

	template <class X0, class X1, class X2>
	constexpr branch_matcher(X0&& x0, X1&& x1, X2&& x2)
		: binary_matcher_interface<branch_matcher<Probe, M1, M2>, M1, M2>{std::forward<X1>(x1), std::forward<X2>(x2)}, probe(std::forward<X0>(x0)) {}

	template <class Cursor>
	[[nodiscard]] bool test(Cursor& cur, capture_store* store) const
	{
		if constexpr (is_matcher_v<Probe>) {
			detail::scope_exit const restore{[&cur, store, cp = detail::mark(store), pos = cur.offset()] {
				cur.seek(pos);
				detail::rollback(store, cp);
			}};
			return probe.try_match(cur, store).has_value();
		} else {
			return static_cast<bool>(std::invoke(probe, std::as_const(cur)));
		}
	}

	template <class Cursor>
	[[nodiscard]] result<span> try_match(Cursor& cur, capture_store* store) const
	{
		if (test(cur, store))
			return this->m1.try_match(cur, store);
		return this->m2.try_match(cur, store);
	}
};

template <class T>
struct integer_converter
{
	int radix{10};

	constexpr explicit integer_converter(int r) : radix{r}
	{
		if ((radix < 2) || (radix > 36)) // NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
			throw bad_radix{};
	}

	[[nodiscard]] result<T> operator()(std::string_view text) const
	{
		T value{};
		auto const last = text.data() + text.size(); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
		auto const [ptr, ec] = std::from_chars(text.data(), last, value, radix);
		if (ec == std::errc::result_out_of_range)
			return error::conversion_failed(0, text, "integer out of range");
		if ((ec != std::errc{}) || (ptr != last))
			return error::conversion_failed(0, text, "invalid integer");
		return value;
	}
};

template <class T = int>
[[nodiscard]] constexpr integer_converter<T> to_integer(int radix = 10) { return integer_converter<T>{radix}; } // NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

struct string_converter
{
	[[nodiscard]] std::string operator()(std::string_view text) const { return std::string{text}; }
};

[[nodiscard]] constexpr string_converter to_string() noexcept { return string_converter{}; }

[[nodiscard]] inline literal_matcher lit(std::string_view text) { return literal_matcher{text}; }
template <class T, class = std::enable_if_t<is_unit_literal_v<T>>> [[nodiscard]] constexpr one_matcher<equal_predicate> lit(T c) noexcept { return one_matcher<equal_predicate>{make_predicate(c)}; }
template <class P, class = std::enable_if_t<is_unit_predicate_v<P>>> [[nodiscard]] constexpr auto one(P&& p) { return one_matcher<std::decay_t<P>>{std::forward<P>(p)}; }
[[nodiscard]] constexpr eps_matcher eps() noexcept { return eps_matcher{}; }
[[nodiscard]] constexpr start_matcher start() noexcept { return start_matcher{}; }
[[nodiscard]] constexpr end_matcher end() noexcept { return end_matcher{}; }

template <class P>
[[nodiscard]] constexpr auto count(P&& p, bounds b)
{
	return count_matcher<predicate_t<P>>{make_predicate(std::forward<P>(p)), b, always_continue{}};
}

template <class P, class Cond>
[[nodiscard]] constexpr auto count_if(P&& p, bounds b, Cond&& cond)
{
	return count_matcher<predicate_t<P>, std::decay_t<Cond>>{make_predicate(std::forward<P>(p)), b, std::forward<Cond>(cond)};
}

template <class E, class = std::enable_if_t<is_matcher_operand_v<E>>>
[[nodiscard]] constexpr auto when_ahead(E&& e) { return lookahead_condition<matcher_t<E>>{make_matcher(std::forward<E>(e))}; }

template <class E>
[[nodiscard]] constexpr auto repeat(E&& e, bounds b) { return repeat_matcher<matcher_t<E>>{make_matcher(std::forward<E>(e)), b}; }

template <class E> [[nodiscard]] constexpr auto optional(E&& e) { return repeat(std::forward<E>(e), bounds::at_most(1)); }
template <class E> [[nodiscard]] constexpr auto zero_or_more(E&& e) { return repeat(std::forward<E>(e), bounds{}); }
template <class E> [[nodiscard]] constexpr auto one_or_more(E&& e) { return repeat(std::forward<E>(e), bounds::at_least(1)); }

template <class E>
[[nodiscard]] constexpr auto collect(E&& e, bounds b = bounds::at_least(1))
{
	return collect_matcher<matcher_t<E>>{make_matcher(std::forward<E>(e)), b};
}

template <class E1, class E2>
[[nodiscard]] constexpr auto then(E1&& e1, E2&& e2)
{
	return sequence_matcher<matcher_t<E1>, matcher_t<E2>>{make_matcher(std::forward<E1>(e1)), make_matcher(std::forward<E2>(e2))};
}

template <class E1, class E2, class E3, class... Es>
[[nodiscard]] constexpr auto then(E1&& e1, E2&& e2, E3&& e3, Es&&... es)
{
	return then(std::forward<E1>(e1), then(std::forward<E2>(e2), std::forward<E3>(e3), std::forward<Es>(es)...));
}

template <class E1, class E2>
[[nodiscard]] constexpr auto choice(E1&& e1, E2&& e2)
{
	return choice_matcher<matcher_t<E1>, matcher_t<E2>>{make_matcher(std::forward<E1>(e1)), make_matcher(std::forward<E2>(e2))};
}

template <class E1, class E2, class E3, class... Es>
[[nodiscard]] constexpr auto choice(E1&& e1, E2&& e2, E3&& e3, Es&&... es)
{
	return choice(std::forward<E1>(e1), choice(std::forward<E2>(e2), std::forward<E3>(e3), std::forward<Es>(es)...));
}

template <class E1, class E2>
[[nodiscard]] constexpr auto longest(E1&& e1, E2&& e2)
{
	return longest_matcher<matcher_t<E1>, matcher_t<E2>>{make_matcher(std::forward<E1>(e1)), make_matcher(std::forward<E2>(e2))};
}

template <class L, class S, class R>
[[nodiscard]] constexpr auto sep_once(L&& l, S&& s, R&& r)
{
	return sep_once_matcher<matcher_t<L>, matcher_t<S>, matcher_t<R>>{make_matcher(std::forward<L>(l)), make_matcher(std::forward<S>(s)), make_matcher(std::forward<R>(r))};
}

template <class P, class S>
[[nodiscard]] constexpr auto separate(P&& p, S&& s)
{
	return separate_matcher<matcher_t<P>, matcher_t<S>>{make_matcher(std::forward<P>(p)), make_matcher(std::forward<S>(s))};
}

template <class E, class L, class R>
[[nodiscard]] constexpr auto quote(E&& e, L&& l, R&& r)
{
	return enclose_matcher<matcher_t<E>, matcher_t<L>, matcher_t<R>>{make_matcher(std::forward<E>(e)), make_matcher(std::forward<L>(l)), make_matcher(std::forward<R>(r))};
}

template <class E, class T>
[[nodiscard]] constexpr auto pad(E&& e, T&& tail)
{
	return enclose_matcher<matcher_t<E>, eps_matcher, matcher_t<T>>{make_matcher(std::forward<E>(e)), eps_matcher{}, make_matcher(std::forward<T>(tail))};
}

template <class E, class H>
[[nodiscard]] constexpr auto padded(E&& e, H&& head)
{
	return enclose_matcher<matcher_t<E>, matcher_t<H>, eps_matcher>{make_matcher(std::forward<E>(e)), make_matcher(std::forward<H>(head)), eps_matcher{}};
}

template <class S, class E>
[[nodiscard]] constexpr auto skip_then(S&& skipper, E&& e)
{
	return padded(std::forward<E>(e), zero_or_more(std::forward<S>(skipper)));
}

template <class E, class F>
[[nodiscard]] constexpr auto map(E&& e, F&& f)
{
	return map_matcher<matcher_t<E>, std::decay_t<F>>{make_matcher(std::forward<E>(e)), std::forward<F>(f)};
}

template <class E>
[[nodiscard]] constexpr auto capture(std::size_t slot, E&& e)
{
	return capture_matcher<matcher_t<E>>{slot, make_matcher(std::forward<E>(e))};
}

template <class Probe, class E1, class E2>
[[nodiscard]] constexpr auto branch(Probe&& probe, E1&& on_match, E2&& otherwise)
{
	if constexpr (is_matcher_operand_v<Probe>)
		return branch_matcher<matcher_t<Probe>, matcher_t<E1>, matcher_t<E2>>{make_matcher(std::forward<Probe>(probe)), make_matcher(std::forward<E1>(on_match)), make_matcher(std::forward<E2>(otherwise))};
	else
		return branch_matcher<std::decay_t<Probe>, matcher_t<E1>, matcher_t<E2>>{std::forward<Probe>(probe), make_matcher(std::forward<E1>(on_match)), make_matcher(std::forward<E2>(otherwise))};
}

template <class M, class Cursor, class = std::enable_if_t<is_cursor_v<Cursor>>>
[[nodiscard]] result<span> try_match(M const& m, Cursor& cur, capture_store* store = nullptr)
{
	if constexpr (is_matcher_v<M>)
		return m.try_match(cur, store);
	else
		return make_matcher(m).try_match(cur, store);
}

template <class M, class Cursor, class = std::enable_if_t<is_cursor_v<Cursor>>>
[[nodiscard]] result<span> try_match(M const& m, Cursor& cur, capture_store& store)
{
	return neure::try_match(m, cur, &store);
}

// Matches m and appends the resulting span to slot. An out of range slot is
// reported before anything is matched, leaving cursor and store untouched.
template <class M, class Cursor, class = std::enable_if_t<is_cursor_v<Cursor>>>
[[nodiscard]] result<span> try_cap(std::size_t slot, M const& m, Cursor& cur, capture_store& store)
{
	if (slot >= store.capacity())
		return error::capture_out_of_bounds(slot);
	auto r = neure::try_match(m, cur, &store);
	if (r)
		if (auto p = store.push(slot, *r); !p)
			return std::move(p).error();
	return r;
}

template <class M, class Cursor, class = std::enable_if_t<is_cursor_v<Cursor>>>
[[nodiscard]] bool is_match(M const& m, Cursor& cur, capture_store* store = nullptr)
{
	return neure::try_match(m, cur, store).has_value();
}

} // namespace neure

#endif
