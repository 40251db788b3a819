//---------------------------------------------------------------------------------------
// include/giflet/colorquantizer.hpp
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

#include <giflet/palette.hpp>
#include <giflet/utility.hpp>

#include <cstdint>
#include <unordered_map>

namespace giflet {

class ColorQuantizer
{
public:
    explicit ColorQuantizer(const Palette& palette = Palette::standard())
        : _palette(palette)
    {
    }

    // Index of the nearest palette entry by squared RGB distance, on equal
    // distance the lower index wins. Components are clamped to 0..255.
    uint8_t closestIndex(int r, int g, int b);

    // Maps a row-major RGBA8 buffer to one palette index per pixel, alpha
    // is ignored and a trailing incomplete pixel is dropped.
    ByteArray quantize(ByteView rgba);

    size_t numCachedColors() const { return _cache.size(); }
    const Palette& palette() const { return _palette; }

private:
    uint8_t searchPalette(int r, int g, int b) const;
    const Palette& _palette;
    std::unordered_map<uint32_t, uint8_t> _cache;
};

}
