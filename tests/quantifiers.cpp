// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <neure/neure.hpp>
#include <iostream>

#undef NDEBUG
#include <cassert>

using neure::bounds;

void test_count_bounds()
{
	neure::text_cursor c1{"dbcdbb"};
	assert(*neure::try_match(neure::count(neure::one_of("bcd"), bounds{4, 7}), c1) == (neure::span{0, 6}));

	neure::text_cursor c2{"你你你你你啊"};
	assert(*neure::try_match(neure::count(U'你', bounds{2, 4}), c2) == (neure::span{0, 12}));
	assert(c2.offset() == 12);

	neure::text_cursor c3{"\nabedf"};
	assert(*neure::try_match(neure::count(neure::wild, bounds{0, 1}), c3) == (neure::span{0, 0}));

	neure::text_cursor c4{"AEUF"};
	assert(*neure::try_match(neure::count(!neure::range('a', 'z'), bounds{}), c4) == (neure::span{0, 4}));

	neure::text_cursor c5{" \u00A0dda"};
	assert(*neure::try_match(neure::count(neure::whitespace, bounds::exactly(2)), c5) == (neure::span{0, 3}));
	assert(c5.peek()->value == U'd');
}

void test_count_failure()
{
	neure::text_cursor cur{"1a"};
	auto const r = neure::try_match(neure::count(neure::ascii_digit, bounds::at_least(2)), cur);
	assert(!r);
	assert(r.error().kind() == neure::error_kind::mismatch);
	assert(r.error().position() == 1);
	assert(cur.offset() == 0);

	neure::text_cursor short_cur{"1"};
	auto const o = neure::try_match(neure::count(neure::ascii_digit, bounds::at_least(2)), short_cur);
	assert(!o && (o.error().kind() == neure::error_kind::out_of_bounds));
	assert(short_cur.offset() == 0);

	neure::text_cursor empty{""};
	assert(neure::try_match(neure::count(neure::any, bounds::at_most(3)), empty));
}

void test_bounds()
{
	assert(bounds{}.contains(0) && bounds{}.contains(bounds::npos));
	assert(bounds::exactly(2).contains(2) && !bounds::exactly(2).contains(3));
	assert(!bounds::at_least(1).contains(0));
	assert(!bounds::at_most(1).contains(2));

	bool thrown = false;
	try {
		bounds const b{3, 2};
		(void)b;
	} catch (neure::bad_quantifier_bounds const&) {
		thrown = true;
	}
	assert(thrown);
}

void test_count_if()
{
	neure::text_cursor cur{"12345"};
	bool saw_start = true;
	auto const first_two = neure::count_if(neure::ascii_digit, bounds{}, [&saw_start](neure::text_cursor const& c, neure::text_cursor::unit const& u) {
		saw_start = saw_start && (c.offset() == 0);
		return u.offset < 2;
	});
	assert(*neure::try_match(first_two, cur) == (neure::span{0, 2}));
	assert(saw_start);
	assert(cur.offset() == 2);

	// a condition that refuses the first unit ends below the minimum
	neure::text_cursor none{"12"};
	auto const refuse = neure::count_if(neure::ascii_digit, bounds::at_least(1), [](auto const&, auto const&) { return false; });
	auto const r = neure::try_match(refuse, none);
	assert(!r && (r.error().position() == 0));
	assert(none.offset() == 0);

	neure::text_cursor pairs{"abc1"};
	auto const lowercase_pairs = neure::count_if(neure::ascii_lowercase, bounds{}, neure::when_ahead(neure::then(neure::ascii_lowercase, neure::ascii_lowercase)));
	assert(*neure::try_match(lowercase_pairs, pairs) == (neure::span{0, 2}));
}

void test_repeat()
{
	neure::text_cursor cur{"abababab"};
	assert(*neure::try_match(neure::repeat("ab", bounds{2, 3}), cur) == (neure::span{0, 6}));
	assert(cur.rest() == "ab");

	neure::text_cursor short_cur{"aba"};
	auto const r = neure::try_match(neure::repeat("ab", bounds{2, 3}), short_cur);
	assert(!r);
	assert(short_cur.offset() == 0);

	neure::text_cursor digits{"1,2,3x"};
	assert(*neure::try_match(neure::one_or_more(neure::then(neure::ascii_digit, neure::optional(','))), digits) == (neure::span{0, 5}));

	neure::text_cursor none{"y"};
	assert(*neure::try_match(neure::optional('x'), none) == (neure::span{0, 0}));
	assert(*neure::try_match(neure::zero_or_more('x'), none) == (neure::span{0, 0}));
	assert(!neure::try_match(neure::one_or_more('x'), none));
	assert(none.offset() == 0);
}

void test_repeat_zero_length()
{
	neure::text_cursor cur{"abc"};
	assert(*neure::try_match(neure::zero_or_more(neure::eps()), cur) == (neure::span{0, 0}));
	assert(*neure::try_match(neure::one_or_more(neure::optional('z')), cur) == (neure::span{0, 0}));
	assert(*neure::try_match(neure::repeat(neure::zero_or_more(neure::ascii_lowercase), bounds::at_least(1)), cur) == (neure::span{0, 3}));
}

void test_repeat_partial_iteration()
{
	// an iteration that advances and then fails is undone before stopping
	neure::text_cursor cur{"ababa!"};
	assert(*neure::try_match(neure::zero_or_more(neure::then('a', 'b')), cur) == (neure::span{0, 4}));
	assert(cur.offset() == 4);
	assert(neure::try_match(neure::then('a', '!'), cur));
}

int main()
try {
	test_count_bounds();
	test_count_failure();
	test_bounds();
	test_count_if();
	test_repeat();
	test_repeat_zero_length();
	test_repeat_partial_iteration();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "Unknown Error\n";
	return 1;
}
