// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <neure/neure.hpp>
#include <atomic>
#include <iostream>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#undef NDEBUG
#include <cassert>

using neure::bounds;
using neure::span;
using neure::text_cursor;

static_assert(neure::is_matcher_v<neure::dynamic_matcher<text_cursor>>);
static_assert(neure::is_matcher_v<neure::dynamic_reference<text_cursor>>);
static_assert(neure::is_matcher_v<neure::boxed_matcher<text_cursor>>);
static_assert(std::is_copy_constructible_v<neure::dynamic_matcher<text_cursor>>);
static_assert(!std::is_copy_constructible_v<neure::boxed_matcher<text_cursor>>);
static_assert(std::is_move_constructible_v<neure::boxed_matcher<text_cursor>>);

auto const digits = neure::count(neure::ascii_digit, bounds::at_least(1));

void test_recursive_brackets()
{
	neure::dynamic_matcher<text_cursor> nested;
	nested.define(neure::then('[', neure::zero_or_more(nested.reference()), ']'));
	assert(nested.defined());
	assert(nested.use_count() == 1);

	text_cursor cur{"[[][[]]]x"};
	assert(*neure::try_match(nested, cur) == (span{0, 8}));

	text_cursor open{"[[]"};
	auto const r = neure::try_match(nested, open);
	assert(!r && (r.error().kind() == neure::error_kind::out_of_bounds));
}

void test_mutual_recursion()
{
	neure::dynamic_matcher<text_cursor> expr;
	auto const atom = neure::choice(digits, neure::then('(', expr.reference(), ')'));
	expr.define(neure::separate(atom, neure::one_of("+-")));

	text_cursor cur{"(1+2)-3"};
	assert(*neure::try_match(expr, cur) == (span{0, 7}));
	assert(cur.at_end());

	text_cursor deep{"((((4))))+5"};
	assert(neure::try_match(expr, deep));
	assert(deep.at_end());

	text_cursor bad{"(1+2"};
	assert(!neure::try_match(expr, bad));
}

void test_handles_alias_definition()
{
	neure::dynamic_matcher<text_cursor> first;
	auto second = first;
	assert(!first.defined());
	assert(first.use_count() == 2);
	second.define("x");
	assert(first.defined());

	text_cursor cur{"xy"};
	assert(neure::try_match(first, cur));

	// definitions may be replaced after the handle is in use
	auto const pair = neure::then(first, first);
	first.define(neure::one(neure::ascii_lowercase));
	cur.reset();
	assert(*neure::try_match(pair, cur) == (span{0, 2}));
}

void test_captures_through_dynamic()
{
	neure::dynamic_matcher<text_cursor> item{neure::capture(0, digits)};
	neure::capture_store store{1};
	text_cursor cur{"1 22 333"};
	assert(neure::try_match(neure::separate(item, ' '), cur, store));
	assert(store.spans(0)->size() == 3);
}

void test_undefined_matchers()
{
	text_cursor cur{"abc"};

	bool thrown = false;
	try {
		neure::dynamic_matcher<text_cursor> const undefined;
		(void)neure::try_match(undefined, cur);
	} catch (neure::bad_matcher const&) {
		thrown = true;
	}
	assert(thrown);

	thrown = false;
	try {
		neure::boxed_matcher<text_cursor> const empty;
		assert(!empty.defined());
		(void)neure::try_match(empty, cur);
	} catch (neure::bad_matcher const&) {
		thrown = true;
	}
	assert(thrown);

	auto const dangling = [] {
		neure::dynamic_matcher<text_cursor> const temporary{"abc"};
		return temporary.reference();
	}();
	assert(dangling.expired());

	thrown = false;
	try {
		(void)neure::try_match(dangling, cur);
	} catch (neure::bad_matcher const&) {
		thrown = true;
	}
	assert(thrown);
	assert(cur.offset() == 0);
}

void test_boxed_matcher()
{
	neure::boxed_matcher<text_cursor> boxed{neure::then("ab", neure::end())};
	assert(boxed.defined());
	text_cursor cur{"ab"};
	assert(neure::try_match(boxed, cur));

	std::vector<neure::boxed_matcher<text_cursor>> alternatives;
	alternatives.emplace_back("let");
	alternatives.emplace_back(neure::count(neure::ascii_lowercase, bounds::at_least(1)));
	alternatives.emplace_back(digits);

	text_cursor word{"42"};
	std::size_t matched = 0;
	for (auto const& m : alternatives) {
		word.reset();
		if (neure::is_match(m, word))
			++matched;
	}
	assert(matched == 1);

	auto moved = std::move(alternatives.front());
	text_cursor let{"let"};
	assert(neure::try_match(moved, let));
}

void test_synchronized_matcher()
{
	neure::synchronized_matcher<text_cursor> shared{neure::one_or_more('a')};
	auto const line = neure::then(shared, neure::end());
	std::atomic<int> failures{0};

	std::vector<std::thread> workers;
	for (int t = 0; t < 4; ++t) {
		workers.emplace_back([&line, &failures] {
			for (int i = 0; i < 1000; ++i) {
				text_cursor cur{"aaaa"};
				if (!neure::is_match(line, cur))
					++failures;
			}
		});
	}

	for (int i = 0; i < 100; ++i) {
		if ((i % 2) == 0)
			shared.define(neure::then('a', neure::zero_or_more('a')));
		else
			shared.define(neure::count('a', bounds::at_least(1)));
	}

	for (auto& w : workers)
		w.join();

	assert(failures.load() == 0);

	auto const ref = shared.reference();
	text_cursor cur{"aa"};
	assert(*neure::try_match(ref, cur) == (span{0, 2}));
}

int main()
try {
	test_recursive_brackets();
	test_mutual_recursion();
	test_handles_alias_definition();
	test_captures_through_dynamic();
	test_undefined_matchers();
	test_boxed_matcher();
	test_synchronized_matcher();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "Unknown Error\n";
	return 1;
}
