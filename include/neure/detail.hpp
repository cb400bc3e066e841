// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef NEURE_INCLUDE_NEURE_DETAIL_HPP
#define NEURE_INCLUDE_NEURE_DETAIL_HPP

#include <cstddef>
#include <type_traits>
#include <utility>

#ifdef NEURE_ENABLE_TRACE
#include <iostream>
#define NEURE_TRACE_RESULT(name, begin, ret) ::neure::detail::trace_result((name), (begin), (ret))
#else
#define NEURE_TRACE_RESULT(name, begin, ret) (ret)
#endif // NEURE_ENABLE_TRACE

namespace neure {

inline namespace bitfield_ops {

template <class T, class = std::void_t<decltype(T::is_bitfield_enum)>>
[[nodiscard]] constexpr T operator~(T x) noexcept
{
	return static_cast<T>(~static_cast<std::underlying_type_t<T>>(x));
}

template <class T, class = std::void_t<decltype(T::is_bitfield_enum)>>
[[nodiscard]] constexpr T operator&(T x, T y) noexcept
{
	return static_cast<T>(static_cast<std::underlying_type_t<T>>(x) & static_cast<std::underlying_type_t<T>>(y));
}

template <class T, class = std::void_t<decltype(T::is_bitfield_enum)>>
[[nodiscard]] constexpr T operator|(T x, T y) noexcept
{
	return static_cast<T>(static_cast<std::underlying_type_t<T>>(x) | static_cast<std::underlying_type_t<T>>(y));
}

template <class T, class = std::void_t<decltype(T::is_bitfield_enum)>>
constexpr T& operator|=(T& x, T y) noexcept
{
	return (x = x | y);
}

template <class T, class = std::void_t<decltype(T::is_bitfield_enum)>>
constexpr T& operator&=(T& x, T y) noexcept
{
	return (x = x & y);
}

} // namespace bitfield_ops

namespace detail {

template <class T> inline constexpr bool always_false_v = false;

template <class T, template <class...> class Template> struct is_specialization_of : std::false_type {};
template <template <class...> class Template, class... Args> struct is_specialization_of<Template<Args...>, Template> : std::true_type {};
template <class T, template <class...> class Template> inline constexpr bool is_specialization_of_v = is_specialization_of<std::decay_t<T>, Template>::value;

template <class EF>
class scope_exit
{
	static_assert(std::is_invocable_v<EF>);

	EF destructor_;
	bool released_{false};

public:
	template <class Fn, class = std::enable_if_t<std::is_constructible_v<EF, Fn&&>>>
	constexpr explicit scope_exit(Fn&& fn) noexcept(std::is_nothrow_constructible_v<EF, Fn&&>)
		: destructor_{std::forward<Fn>(fn)}
	{}

	~scope_exit()
	{
		if (!released_)
			destructor_();
	}

	void release() noexcept
	{
		released_ = true;
	}

	scope_exit(scope_exit const&) = delete;
	scope_exit(scope_exit&&) = delete;
	scope_exit& operator=(scope_exit const&) = delete;
	scope_exit& operator=(scope_exit&&) = delete;
};

template <class Fn, class = std::enable_if_t<std::is_invocable_v<Fn>>>
scope_exit(Fn) -> scope_exit<std::decay_t<Fn>>;

#ifdef NEURE_ENABLE_TRACE

template <class Result>
[[nodiscard]] Result trace_result(char const* name, std::size_t begin, Result&& ret)
{
	std::clog << "neure: " << name << " @" << begin << " -> ";
	if (ret)
		std::clog << "ok [" << ret->begin << ",+" << ret->length << "]\n";
	else
		std::clog << ret.error().message() << "\n";
	return std::forward<Result>(ret);
}

#endif // NEURE_ENABLE_TRACE

} // namespace detail

} // namespace neure

#endif
