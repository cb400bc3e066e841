// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <neure/neure.hpp>
#include <cstdint>
#include <iostream>
#include <vector>

#undef NDEBUG
#include <cassert>

void test_text_cursor()
{
	neure::text_cursor cur{"a你b"}; // U+4F60 occupies three octets
	assert(cur.length() == 5);
	assert(cur.offset() == 0);
	assert(cur.at_start());

	auto const a = cur.peek();
	assert(a && (a->value == U'a') && (a->offset == 0) && (a->width == 1));
	auto const ni = cur.peek_at(1);
	assert(ni && (ni->value == U'你') && (ni->offset == 1) && (ni->width == 3));
	assert(cur.offset() == 0);

	assert(cur.advance(1));
	auto const mid = cur.advance(1);
	assert(!mid);
	assert(mid.error().kind() == neure::error_kind::mismatch);
	assert(cur.offset() == 1);

	assert(cur.advance(3));
	assert(cur.peek()->value == U'b');
	auto const past = cur.advance(2);
	assert(!past);
	assert(past.error().kind() == neure::error_kind::out_of_bounds);
	assert(cur.offset() == 4);

	assert(cur.advance(1));
	assert(cur.at_end());
	assert(!cur.peek());
	assert(!cur.peek_at(17));
	assert(cur.advance(0));

	auto const slice = cur.slice(neure::span{1, 3});
	assert(slice && (*slice == "你"));
	assert(!cur.slice(neure::span{4, 3}));
	assert(cur.rest().empty());
	assert(cur.rest_at(4) == "b");

	cur.reset("xyz");
	assert((cur.offset() == 0) && (cur.length() == 3));
	assert(cur.peek()->value == U'x');
}

void test_byte_cursor()
{
	std::vector<std::uint8_t> const bytes{0x00, 0xE4, 0xBD, 0xA0, 0x7F};
	neure::byte_cursor cur{bytes};
	assert(cur.length() == 5);
	assert(cur.peek()->value == 0x00);
	assert(cur.peek_at(1)->value == 0xE4);
	assert(cur.peek_at(1)->width == 1);
	assert(cur.advance(2)); // bytes carry no boundary constraint
	assert(cur.offset() == 2);
	assert(!cur.advance(4));
	assert(cur.advance(3));
	assert(cur.at_end());

	neure::byte_cursor raw{bytes.data(), 2};
	assert(raw.length() == 2);
}

void test_literal_string()
{
	neure::text_cursor cur{"hello world"};
	auto const r = neure::try_match("hello", cur);
	assert(r && (*r == neure::span{0, 5}));
	assert(cur.offset() == 5);

	auto const f = neure::try_match("world", cur);
	assert(!f);
	assert(f.error().kind() == neure::error_kind::mismatch);
	assert(f.error().position() == 5);
	assert(cur.offset() == 5);

	assert(neure::try_match(neure::lit(" world"), cur));
	assert(cur.at_end());

	neure::text_cursor shorter{"hel"};
	auto const o = neure::try_match("hello", shorter);
	assert(!o && (o.error().kind() == neure::error_kind::out_of_bounds));
	assert(shorter.offset() == 0);

	neure::text_cursor empty{"abc"};
	auto const e = neure::try_match("", empty);
	assert(e && (*e == neure::span{0, 0}));
}

void test_literal_unit()
{
	neure::text_cursor cur{"你你a"};
	auto const r = neure::try_match(U'你', cur);
	assert(r && (*r == neure::span{0, 3}));
	assert(neure::try_match(neure::lit(U'你'), cur));
	assert(cur.offset() == 6);
	assert(!neure::try_match('b', cur));
	assert(neure::try_match('a', cur));
	auto const end = neure::try_match('a', cur);
	assert(!end && (end.error().kind() == neure::error_kind::out_of_bounds));
}

void test_one()
{
	neure::text_cursor cur{"7x"};
	assert(neure::try_match(neure::one(neure::ascii_digit), cur));
	auto const r = neure::try_match(neure::one(neure::ascii_digit), cur);
	assert(!r);
	assert(r.error().expected() == "ascii digit");
	assert(r.error().position() == 1);
	assert(cur.offset() == 1);
}

void test_anchors()
{
	neure::text_cursor cur{"ab"};
	assert(neure::try_match(neure::start(), cur));
	assert(!neure::try_match(neure::end(), cur));
	assert(neure::try_match("ab", cur));
	assert(!neure::try_match(neure::start(), cur));
	auto const e = neure::try_match(neure::end(), cur);
	assert(e && (*e == neure::span{2, 0}));

	neure::text_cursor empty{""};
	assert(neure::try_match(neure::then(neure::start(), neure::end()), empty));
	assert(neure::try_match(neure::eps(), empty));
}

void test_byte_matching()
{
	std::vector<std::uint8_t> const bytes{0xCA, 0xFE, 0xBA, 0xBE, 0x00};
	neure::byte_cursor cur{bytes};
	auto const magic = neure::then(std::uint8_t{0xCA}, std::uint8_t{0xFE}, neure::count(neure::range(0xB0, 0xBF), neure::bounds{1, 2}));
	auto const r = neure::try_match(magic, cur);
	assert(r && (*r == neure::span{0, 4}));
	assert(neure::try_match(neure::then(std::uint8_t{0x00}, neure::end()), cur));

	std::vector<std::uint8_t> const high{0xFF, 0xFE, 0xFF};
	neure::byte_cursor bom{high};
	assert(neure::try_match(neure::lit('\xff'), bom));
	assert(!neure::try_match(neure::lit('\xff'), bom));
	assert(neure::try_match(neure::one(neure::unit('\xfe')), bom));
	auto const tail = neure::try_match(neure::then(neure::lit('\xff'), neure::end()), bom);
	assert(tail && (*tail == neure::span{2, 1}));
}

int main()
try {
	test_text_cursor();
	test_byte_cursor();
	test_literal_string();
	test_literal_unit();
	test_one();
	test_anchors();
	test_byte_matching();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "Unknown Error\n";
	return 1;
}
