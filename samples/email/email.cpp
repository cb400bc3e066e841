// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <neure/neure.hpp>
#include <neure/iostream.hpp>

#include <string_view>

namespace samples::email {

using namespace neure;
using cursor = text_cursor;

// Keeps a dot inside the domain only while another dot follows it.
inline constexpr auto more_dots_follow = [](cursor const& cur, cursor::unit const& u) {
	return (u.value != U'.') || (cur.rest_at(u.next()).find('.') != std::string_view::npos);
};

auto const Local  = count(ascii_lowercase || ascii_digit || one_of("_.+-"), bounds::at_least(1));
auto const Domain = count_if(ascii_digit || ascii_lowercase || one_of(".-"), bounds::at_least(1), more_dots_follow);
auto const TLD    = count(ascii_lowercase || '.', bounds{2, 6});
auto const Email  = then(start(), capture(0, Local), '@', capture(1, Domain), '.', capture(2, TLD), end());

} // namespace samples::email

int main()
try {
	using namespace samples::email;
	capture_store store{3};
	std::size_t valid = 0;
	auto const lines = for_each_line(std::cin, [&store, &valid](cursor& cur) {
		store.reset();
		if (auto const r = try_match(Email, cur, store); !r) {
			std::cout << "invalid: " << r.error().message() << "\n";
			return;
		}
		auto const part = [&store, &cur](std::size_t slot) { return store.slices(slot, cur).value().front(); };
		std::cout << "valid: local=" << part(0) << " domain=" << part(1) << " tld=" << part(2) << "\n";
		++valid;
	}, "email> ");
	std::cout << valid << " of " << lines << " addresses are valid\n";
	return 0;
} catch (std::exception const& e) {
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "UNKNOWN ERROR\n";
	return 1;
}
