//---------------------------------------------------------------------------------------
// src/gifwriter.cpp
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

#include <giflet/gifwriter.hpp>

#include <algorithm>
#include <stdexcept>

namespace giflet {

void GifWriter::checkOpen() const
{
    if (_finalized) {
        throw std::logic_error("GifWriter: no blocks can be added after the trailer");
    }
}

void GifWriter::writeHeader(uint16_t width, uint16_t height)
{
    checkOpen();
    appendTo("GIF89a", 6);
    // Logical Screen Descriptor
    appendU16({width, height});
    appendU8({SCREEN_FLAGS_GLOBAL_256, 0, 0});  // flags, background index, aspect ratio
}

void GifWriter::writeGlobalColorTable(const Palette& palette)
{
    checkOpen();
    for (const auto& color : palette) {
        appendU8({color.r, color.g, color.b});
    }
}

void GifWriter::writeLoopExtension(uint16_t loopCount)
{
    checkOpen();
    appendU8({EXTENSION_INTRODUCER, APPLICATION_LABEL, 11});
    appendTo("NETSCAPE2.0", 11);
    appendU8({3, 1});
    appendU16(loopCount);  // 0 = forever
    appendU8(0);
}

void GifWriter::writeGraphicControl(uint16_t delayTime_cs, uint8_t disposalMethod)
{
    checkOpen();
    appendU8({EXTENSION_INTRODUCER, GRAPHIC_CONTROL_LABEL, 4, static_cast<uint8_t>((disposalMethod & 7) << 2)});
    appendU16(delayTime_cs);  // 1s/100
    appendU8({0, 0});         // transparent color index, terminator
}

void GifWriter::writeImageDescriptor(uint16_t width, uint16_t height)
{
    checkOpen();
    appendU8(IMAGE_SEPARATOR);
    appendU16({0, 0, width, height});
    appendU8(0);  // no local color table, not interlaced
}

void GifWriter::writeImageData(uint8_t minCodeSize, ByteView compressed)
{
    checkOpen();
    appendU8(minCodeSize);
    SubblockInserter sbi(_buffer);
    std::copy(compressed.begin(), compressed.end(), sbi);
}

void GifWriter::writeTrailer()
{
    checkOpen();
    appendU8(TRAILER);
    _finalized = true;
}

ByteArray GifWriter::release()
{
    if (!_finalized) {
        throw std::logic_error("GifWriter: released before the trailer was written");
    }
    ByteArray result;
    result.swap(_buffer);
    _finalized = false;
    return result;
}

}
