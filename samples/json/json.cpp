// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <neure/neure.hpp>
#include <neure/iostream.hpp>

#include <string>

// Matcher for JSON Data Interchange Standard (RFC7159)
class json_matcher
{
public:
	json_matcher()
	{
		using namespace neure;
		auto const WS             = one_of(" \t\r\n");
		auto const Digits         = count(ascii_digit, bounds::at_least(1));
		auto const ExponentPart   = then(one_of("Ee"), optional(one_of("+-")), Digits);
		auto const FractionalPart = then('.', Digits);
		auto const IntegralPart   = choice('0', then(range('1', '9'), count(ascii_digit, bounds{})));
		auto const Number         = then(optional('-'), IntegralPart, optional(FractionalPart), optional(ExponentPart));
		auto const Boolean        = choice("true", "false");
		auto const Null           = lit("null");
		auto const UnicodeEscape  = then('u', count(ascii_hexdigit, bounds::exactly(4)));
		auto const Escape         = then('\\', choice(one_of("/\\\"bfnrt"), UnicodeEscape));
		auto const String         = quote(zero_or_more(choice(!(one_of("\"\\") || range(U'\0', U'\x1F')), Escape)), '"', '"');
		auto const Comma          = skip_then(WS, ',');
		auto const Elements       = then(value_.reference(), zero_or_more(then(Comma, value_.reference())));
		auto const Array          = quote(optional(Elements), '[', skip_then(WS, ']'));
		auto const Member         = then(skip_then(WS, String), skip_then(WS, ':'), value_.reference());
		auto const Members        = then(Member, zero_or_more(then(Comma, Member)));
		auto const Object         = quote(optional(Members), '{', skip_then(WS, '}'));
		value_.define(skip_then(WS, choice(Object, Array, String, Number, Boolean, Null)));
		grammar_ = then(value_, zero_or_more(WS), end());
	}

	[[nodiscard]] neure::result<neure::span> match(std::string const& input) const
	{
		neure::text_cursor cur{input};
		return neure::try_match(grammar_, cur);
	}

private:
	neure::dynamic_matcher<neure::text_cursor> value_;
	neure::boxed_matcher<neure::text_cursor> grammar_;
};

int main()
{
	try {
		json_matcher const matcher;
		auto const result = matcher.match(neure::readsource(std::cin));
		if (!result) {
			std::cout << "Invalid JSON! " << result.error().message() << "\n";
			return -1;
		}
	} catch (std::exception const& e) {
		std::cerr << "ERROR: " << e.what() << "\n";
		return -1;
	} catch (...) {
		std::cerr << "UNKNOWN ERROR\n";
		return -1;
	}
	return 0;
}
