// Heavily inspired by: https://blog.ganets.ky/StaticString/
// In accordance with above mentioned site's licensing:
//
// The MIT License (MIT)
// Copyright (c) 2013-2018 Blackrock Digital LLC
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#pragma once

#include <range/v3/algorithm/copy_n.hpp>

#include <array>
#include <cstddef>
#include <iterator>
#include <string_view>

namespace dockgrader {

/// A fully compile-time capable string type, usable as a non-type template parameter
/// Guaranteed to be null-terminated
template <std::size_t Size>
class StaticString
{
public:
    constexpr StaticString() = default;

    // NOLINTNEXTLINE(google-explicit-constructor,*-avoid-c-arrays)
    constexpr /*implicit*/ StaticString(const char (&input)[Size + 1]) {
        ranges::copy_n(std::data(input), Size + 1, data.begin());
    }

    constexpr std::string_view view() const { return {data.data(), Size}; }

    constexpr std::size_t size() const { return Size; }

    std::array<char, Size + 1> data{};
};

// NOLINTNEXTLINE(*-avoid-c-arrays)
template <std::size_t N>
StaticString(const char (&input)[N]) -> StaticString<N - 1>;

} // namespace dockgrader
