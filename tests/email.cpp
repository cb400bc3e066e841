// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <neure/neure.hpp>
#include <array>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#undef NDEBUG
#include <cassert>

using neure::bounds;
using neure::span;
using neure::text_cursor;

// A dot only continues the domain while another dot follows it, leaving the
// last label for the top level domain.
auto const domain = neure::count_if(neure::ascii_digit || neure::ascii_lowercase || neure::one_of(".-"), bounds::at_least(1),
	[](text_cursor const& cur, text_cursor::unit const& u) {
		return (u.value != U'.') || (cur.rest_at(u.next()).find('.') != std::string_view::npos);
	});

auto const local = neure::count(neure::ascii_lowercase || neure::ascii_digit || neure::one_of("_.+-"), bounds::at_least(1));
auto const tld = neure::count(neure::ascii_lowercase || '.', bounds{2, 6});
auto const email = neure::then(neure::start(), neure::capture(0, local), '@', neure::capture(1, domain), '.', neure::capture(2, tld), neure::end());

std::array<std::string_view, 10> const test_cases{{
	"plainaddress",
	"#@%^%#$@#$@#.com",
	"@example.com",
	"joe smith <email@example.com>",
	"”(),:;<>[ ]@example.com",
	"much.”more unusual”@example.com",
	"very.unusual.”@”.unusual.com@example.com",
	"email@example.com",
	"firstname.lastname@example.com",
	"email@subdomain.example.com",
}};

void test_domain_condition()
{
	text_cursor cur{"a.b.c"};
	assert(*neure::try_match(domain, cur) == (span{0, 3}));
	assert(cur.rest() == ".c");

	text_cursor single{"example.com"};
	assert(*neure::try_match(domain, single) == (span{0, 7}));
}

void test_email_addresses()
{
	std::vector<bool> outcomes;
	std::vector<std::vector<std::string>> captured;
	neure::capture_store store{3};

	for (auto const address : test_cases) {
		text_cursor cur{address};
		store.reset();
		bool const matched = neure::is_match(email, cur, &store);
		outcomes.push_back(matched);
		if (matched) {
			std::vector<std::string> parts;
			for (std::size_t slot = 0; slot < 3; ++slot)
				parts.emplace_back(store.slices(slot, cur)->front());
			captured.push_back(std::move(parts));
		}
	}

	assert(outcomes == (std::vector<bool>{false, false, false, false, false, false, false, true, true, true}));
	assert(captured.size() == 3);
	assert(captured[0] == (std::vector<std::string>{"email", "example", "com"}));
	assert(captured[1] == (std::vector<std::string>{"firstname.lastname", "example", "com"}));
	assert(captured[2] == (std::vector<std::string>{"email", "subdomain.example", "com"}));
}

void test_failed_address_position()
{
	neure::capture_store store{3};
	text_cursor cur{"joe smith <email@example.com>"};
	auto const r = neure::try_match(email, cur, store);
	assert(!r);
	assert(r.error().kind() == neure::error_kind::mismatch);
	assert(r.error().position() == 3);
	assert(store.contains(0));
	assert(!store.contains(1));
}

int main()
try {
	test_domain_condition();
	test_email_addresses();
	test_failed_address_position();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "Unknown Error\n";
	return 1;
}
