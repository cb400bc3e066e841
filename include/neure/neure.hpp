// neure - Backtracking-free pattern matching combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef NEURE_INCLUDE_NEURE_NEURE_HPP
#define NEURE_INCLUDE_NEURE_NEURE_HPP

#include <neure/error.hpp>
#include <neure/detail.hpp>
#include <neure/utf8.hpp>
#include <neure/unicode.hpp>
#include <neure/span.hpp>
#include <neure/cursor.hpp>
#include <neure/unit.hpp>
#include <neure/matcher.hpp>
#include <neure/dynamic.hpp>
#include <neure/iterator.hpp>

#endif
