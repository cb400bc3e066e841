// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <neure/neure.hpp>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>

#undef NDEBUG
#include <cassert>

static_assert(std::is_base_of_v<std::runtime_error, neure::neure_error>);
static_assert(std::is_base_of_v<neure::neure_error, neure::bad_character_range>);
static_assert(std::is_base_of_v<neure::neure_error, neure::bad_quantifier_bounds>);
static_assert(std::is_base_of_v<neure::neure_error, neure::bad_radix>);
static_assert(std::is_base_of_v<neure::neure_error, neure::bad_matcher>);
static_assert(std::is_base_of_v<neure::neure_error, neure::bad_result_access>);
static_assert(!std::is_convertible_v<neure::result<int>, bool>);
static_assert(std::is_constructible_v<bool, neure::result<int>>);

using neure::error;
using neure::error_kind;
using neure::text_cursor;

void test_error_kinds()
{
	assert(neure::to_string(error_kind::mismatch) == "mismatch");
	assert(neure::to_string(error_kind::out_of_bounds) == "out of bounds");
	assert(neure::to_string(error_kind::capture_out_of_bounds) == "capture out of bounds");
	assert(neure::to_string(error_kind::conversion_failed) == "conversion failed");

	auto const m = error::mismatch(4, "ascii digit");
	assert(m.kind() == error_kind::mismatch);
	assert(m.position() == 4);
	assert(m.expected() == "ascii digit");
	assert(m.message() == "mismatch at offset 4: expected ascii digit");

	auto const o = error::out_of_bounds(9);
	assert(o.message() == "out of bounds at offset 9");

	auto const c = error::capture_out_of_bounds(3);
	assert(c.slot() == 3);
	assert(c.message() == "capture out of bounds: slot 3");

	auto const f = error::conversion_failed(2, "300", "integer out of range");
	assert(f.slice() == "300");
	assert(f.cause() == "integer out of range");

	assert(m == error::mismatch(4, "ascii digit"));
	assert(m != error::mismatch(5, "ascii digit"));
	assert(m != error::mismatch(4, "literal unit"));
	assert(o != error::mismatch(9, ""));
}

void test_failure_positions()
{
	text_cursor cur{"abc"};
	auto const literal = neure::try_match(neure::then("ab", 'x'), cur);
	assert(!literal);
	assert(literal.error() == error::mismatch(2, "literal unit"));

	cur.reset();
	auto const word = neure::try_match("abd", cur);
	assert(word.error() == error::mismatch(0, "literal string"));

	cur.reset();
	auto const past = neure::try_match("abcd", cur);
	assert(past.error() == error::out_of_bounds(3));
	assert(cur.offset() == 0);

	auto const slice = cur.slice(neure::span{2, 5});
	assert(!slice && (slice.error().kind() == error_kind::out_of_bounds));
}

void test_result_access()
{
	neure::result<int> const ok{42};
	assert(ok.has_value() && ok);
	assert(ok.value() == 42);
	assert(*ok == 42);
	assert(ok.value_or(7) == 42);

	neure::result<int> const failed{error::out_of_bounds(0)};
	assert(!failed.has_value() && !failed);
	assert(failed.value_or(7) == 7);
	assert(failed.error().kind() == error_kind::out_of_bounds);

	bool thrown = false;
	try {
		(void)failed.value();
	} catch (neure::bad_result_access const&) {
		thrown = true;
	}
	assert(thrown);

	neure::result<std::string> moved{std::string{"text"}};
	std::string const taken = std::move(moved).value();
	assert(taken == "text");

	neure::result<void> const done;
	assert(done);
	done.value();

	neure::result<void> const bad{error::mismatch(0, "end of input")};
	assert(!bad);
	thrown = false;
	try {
		bad.value();
	} catch (neure::neure_error const& e) {
		thrown = std::string{e.what()}.find("failed result") != std::string::npos;
	}
	assert(thrown);
}

void test_construction_errors()
{
	int caught = 0;

	try {
		(void)neure::range(U'9', U'0');
	} catch (neure::neure_error const&) {
		++caught;
	}

	try {
		(void)neure::count(neure::any, neure::bounds{5, 1});
	} catch (neure::neure_error const&) {
		++caught;
	}

	try {
		(void)neure::digit(1);
	} catch (std::runtime_error const&) {
		++caught;
	}

	assert(caught == 3);
}

int main()
try {
	test_error_kinds();
	test_failure_positions();
	test_result_access();
	test_construction_errors();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "Unknown Error\n";
	return 1;
}
