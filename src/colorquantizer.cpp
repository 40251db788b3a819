//---------------------------------------------------------------------------------------
// src/colorquantizer.cpp
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

#include <giflet/colorquantizer.hpp>

#include <algorithm>
#include <limits>

namespace giflet {

uint8_t ColorQuantizer::closestIndex(int r, int g, int b)
{
    r = std::clamp(r, 0, 255);
    g = std::clamp(g, 0, 255);
    b = std::clamp(b, 0, 255);
    auto key = static_cast<uint32_t>((r << 16) | (g << 8) | b);
    auto iter = _cache.find(key);
    if (iter != _cache.end()) {
        return iter->second;
    }
    auto index = searchPalette(r, g, b);
    _cache.emplace(key, index);
    return index;
}

uint8_t ColorQuantizer::searchPalette(int r, int g, int b) const
{
    int minDist = std::numeric_limits<int>::max();
    size_t closest = 0;
    for (size_t i = 0; i < _palette.size(); ++i) {
        const auto& entry = _palette[i];
        int dr = r - entry.r;
        int dg = g - entry.g;
        int db = b - entry.b;
        int dist = dr * dr + dg * dg + db * db;
        if (dist < minDist) {
            minDist = dist;
            closest = i;
        }
    }
    return static_cast<uint8_t>(closest);
}

ByteArray ColorQuantizer::quantize(ByteView rgba)
{
    ByteArray indices;
    indices.reserve(rgba.size() / 4);
    for (size_t i = 0; i + 3 < rgba.size(); i += 4) {
        indices.push_back(closestIndex(rgba[i], rgba[i + 1], rgba[i + 2]));
    }
    return indices;
}

}
