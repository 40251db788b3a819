//---------------------------------------------------------------------------------------
// src/gifencoder.cpp
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

#include <giflet/gifencoder.hpp>
#include <giflet/colorquantizer.hpp>
#include <giflet/gifwriter.hpp>
#include <giflet/lzwcompressor.hpp>
#include <giflet/palette.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>

namespace giflet {

GifEncoder::GifEncoder(uint16_t width, uint16_t height, EncoderOptions options)
    : _width(width)
    , _height(height)
    , _options(options)
{
}

uint16_t GifEncoder::delayFromMilliseconds(uint32_t delayTime_ms)
{
    return static_cast<uint16_t>(std::min<uint32_t>(delayTime_ms / 10, 0xffff));
}

void GifEncoder::addFrame(ByteView rgba, uint32_t delayTime_ms)
{
    size_t expected = size_t(_width) * _height * 4;
    if (rgba.size() != expected) {
        throw InvalidFrameError(fmt::format("Frame {} has {} bytes, expected {} for {}x{} RGBA", _frames.size(), rgba.size(), expected, _width, _height));
    }
    _frames.push_back({ByteArray(rgba.begin(), rgba.end()), delayFromMilliseconds(delayTime_ms)});
}

ByteArray GifEncoder::encode() const
{
    using namespace std::chrono;
    if (_frames.empty()) {
        throw EmptyInputError();
    }
    auto start = steady_clock::now();
    progress(1, fmt::format("Encoding {} frame{} of {}x{} pixels", _frames.size(), _frames.size() == 1 ? "" : "s", _width, _height));

    const auto& palette = Palette::standard();
    ColorQuantizer quantizer(palette);
    LzwCompressor lzw(LzwCompressor::DEFAULT_MIN_CODE_SIZE, _options.fullDictionaryPolicy);

    GifWriter writer;
    writer.writeHeader(_width, _height);
    writer.writeGlobalColorTable(palette);
    writer.writeLoopExtension(_options.loopCount);
    for (size_t i = 0; i < _frames.size(); ++i) {
        const auto& frame = _frames[i];
        auto indices = quantizer.quantize(frame._rgba);
        auto compressed = lzw.compress(indices);
        writer.writeGraphicControl(frame._delayTime);
        writer.writeImageDescriptor(_width, _height);
        writer.writeImageData(lzw.minCodeSize(), compressed);
        progress(2, fmt::format("Frame {}: {} pixels -> {} bytes LZW, {} codes, {} bit max, delay {}/100s", i, indices.size(), compressed.size(), lzw.dictionarySize(), lzw.maxCodeWidth(), frame._delayTime));
    }
    writer.writeTrailer();

    auto duration = duration_cast<milliseconds>(steady_clock::now() - start).count();
    progress(1, fmt::format("Encoded {} bytes, {} distinct colors ({}ms)", writer.size(), quantizer.numCachedColors(), duration));
    return writer.release();
}

std::future<ByteArray> GifEncoder::encodeAsync() const
{
    return std::async(std::launch::async, [this]() { return encode(); });
}

bool GifEncoder::writeToFile(const std::string& filename) const
{
    auto image = encode();
    return writeFile(filename, image.data(), image.size());
}

}
