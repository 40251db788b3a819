//---------------------------------------------------------------------------------------
// include/giflet/palette.hpp
//---------------------------------------------------------------------------------------
//
// Copyright (c) 2025, Steffen Schümann <s.schuemann@pobox.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
//---------------------------------------------------------------------------------------
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace giflet {

struct Rgb
{
    uint8_t r{};
    uint8_t g{};
    uint8_t b{};
    bool operator==(const Rgb& other) const { return r == other.r && g == other.g && b == other.b; }
    bool operator!=(const Rgb& other) const { return !(*this == other); }
};

class Palette
{
public:
    static constexpr size_t SIZE = 256;
    static constexpr size_t CUBE_STEPS = 6;
    static constexpr size_t CUBE_SIZE = CUBE_STEPS * CUBE_STEPS * CUBE_STEPS;
    using Entries = std::array<Rgb, SIZE>;

    // The fixed table used for every encoded file: a 6x6x6 color cube
    // (index r*36 + g*6 + b) followed by 40 shades of gray.
    static const Palette& standard();

    size_t size() const { return _entries.size(); }
    const Rgb& operator[](size_t index) const { return _entries[index]; }
    const Entries& entries() const { return _entries; }
    Entries::const_iterator begin() const { return _entries.begin(); }
    Entries::const_iterator end() const { return _entries.end(); }

    static size_t cubeIndex(size_t r, size_t g, size_t b) { return r * CUBE_STEPS * CUBE_STEPS + g * CUBE_STEPS + b; }

private:
    Palette();
    Entries _entries{};
};

}
