// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef NEURE_INCLUDE_NEURE_IOSTREAM_HPP
#define NEURE_INCLUDE_NEURE_IOSTREAM_HPP

#include <neure/neure.hpp>

#include <cstdio>
#include <iostream>
#include <iterator>
#include <string>

#ifndef NEURE_NO_ISATTY
#ifdef _MSC_VER
#ifndef NEURE_HAS_ISATTY_MSVC
#define NEURE_HAS_ISATTY_MSVC
#endif
#else
#ifndef NEURE_HAS_ISATTY_POSIX
#ifdef __has_include
#if __has_include(<unistd.h>)
#define NEURE_HAS_ISATTY_POSIX
#endif
#endif
#endif
#endif
#endif // NEURE_NO_ISATTY

#if defined NEURE_HAS_ISATTY_MSVC
#include <io.h>
#elif defined NEURE_HAS_ISATTY_POSIX
#include <unistd.h>
#endif

namespace neure {

[[nodiscard]] inline bool stdin_isatty() noexcept
{
#if defined NEURE_HAS_ISATTY_MSVC
	return _isatty(_fileno(stdin)) != 0;
#elif defined NEURE_HAS_ISATTY_POSIX
	return isatty(fileno(stdin)) != 0;
#else
	return false;
#endif
}

// Reads the whole of input into a string, for matching documents as a single
// buffer.
[[nodiscard]] inline std::string readsource(std::istream& input)
{
	return std::string{std::istreambuf_iterator<char>{input}, std::istreambuf_iterator<char>{}};
}

// Invokes fn with a text cursor over each line read from input, prompting when
// input is an interactive terminal. Returns the number of lines visited.
template <class Fn>
std::size_t for_each_line(std::istream& input, Fn&& fn, std::string_view prompt = {})
{
	bool const interactive = (&input == &std::cin) && stdin_isatty();
	std::size_t count = 0;
	std::string line;
	for (;;) {
		if (interactive && !prompt.empty())
			std::cout << prompt << std::flush;
		if (!std::getline(input, line))
			break;
		if (!line.empty() && (line.back() == '\r'))
			line.pop_back();
		text_cursor cur{line};
		fn(cur);
		++count;
	}
	return count;
}

} // namespace neure

#endif
