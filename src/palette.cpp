//---------------------------------------------------------------------------------------
// src/palette.cpp
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

#include <giflet/palette.hpp>

#include <cmath>

namespace giflet {

Palette::Palette()
{
    size_t index = 0;
    for (size_t r = 0; r < CUBE_STEPS; ++r) {
        for (size_t g = 0; g < CUBE_STEPS; ++g) {
            for (size_t b = 0; b < CUBE_STEPS; ++b) {
                _entries[index++] = {static_cast<uint8_t>(std::round(r * 51.0)), static_cast<uint8_t>(std::round(g * 51.0)), static_cast<uint8_t>(std::round(b * 51.0))};
            }
        }
    }
    for (; index < SIZE; ++index) {
        auto gray = static_cast<uint8_t>(std::round((index - CUBE_SIZE) * 6.375));
        _entries[index] = {gray, gray, gray};
    }
}

const Palette& Palette::standard()
{
    static const Palette palette;
    return palette;
}

}
