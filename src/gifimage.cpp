//---------------------------------------------------------------------------------------
// src/gifimage.cpp
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

#include <giflet/gifimage.hpp>

#include <iostream>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <ghc/lzw.hpp>

#ifdef GIFLET_DEBUG_OUTPUT
#include <ghc/hexdump.hpp>
#endif

namespace giflet {

GifImage::GifImage(ByteView data)
{
    decode(data);
}

GifImage GifImage::fromFile(const std::string& filename)
{
    auto data = loadFile(filename, 16 * 1024 * 1024);
    if (data.empty()) {
        throw GifFormatError(fmt::format("Couldn't read GIF file '{}'", filename));
    }
    return GifImage(data);
}

uint8_t GifImage::readU8(const uint8_t*& data, const uint8_t* end)
{
    if (data >= end) {
        throw GifFormatError("Unexpected end of GIF data");
    }
    return *data++;
}

uint16_t GifImage::readU16(const uint8_t*& data, const uint8_t* end)
{
    uint16_t result = readU8(data, end);
    result |= readU8(data, end) << 8;
    return result;
}

ByteArray GifImage::getBlockData(const uint8_t*& data, const uint8_t* end)
{
    ByteArray result;
    while (true) {
        uint8_t blockSize = readU8(data, end);
        if (!blockSize)
            break;
        if (end - data < blockSize) {
            throw GifFormatError("Truncated sub-block in GIF data");
        }
        result.insert(result.end(), data, data + blockSize);
        data += blockSize;
    }
    return result;
}

std::vector<Rgb> GifImage::readColorTable(const uint8_t*& data, const uint8_t* end, size_t numEntries)
{
    if (static_cast<size_t>(end - data) < numEntries * 3) {
        throw GifFormatError("Truncated color table in GIF data");
    }
    std::vector<Rgb> table;
    table.reserve(numEntries);
    for (size_t i = 0; i < numEntries; ++i, data += 3) {
        table.push_back({data[0], data[1], data[2]});
    }
    return table;
}

void GifImage::decode(ByteView gifData)
{
    const auto* data = gifData.data();
    const uint8_t* end = data + gifData.size();
    _fileSize = gifData.size();
    if (gifData.size() < 13) {
        throw GifFormatError("Data too short for a GIF header");
    }
    std::string_view signature(reinterpret_cast<const char*>(data), 6u);
    if (signature == "GIF89a") {
        _is89a = true;
    }
    else if (signature != "GIF87a") {
        throw GifFormatError("Missing GIF87a/GIF89a signature");
    }
    data += 6;
    _width = readU16(data, end);
    _height = readU16(data, end);
    _screenFlags = readU8(data, end);
    _backgroundIndex = readU8(data, end);
    _aspectRatio = readU8(data, end);
    if (_screenFlags & 0x80) {
        _palette = readColorTable(data, end, size_t(1) << ((_screenFlags & 7) + 1));
    }
#ifdef GIFLET_DEBUG_OUTPUT
    std::cout << "---START-DECODE---" << std::endl;
    ghc::hexDump(std::cout, gifData.data(), data - gifData.data(), true);
#endif
    std::optional<Frame::ControlExtension> controlExtension;
    bool trailerFound = false;
    while (!trailerFound) {
        switch (readU8(data, end)) {
            case 0x21: {
                auto extensionType = readU8(data, end);
                auto extensionBytes = getBlockData(data, end);
                switch (extensionType) {
                    case 0xf9: {
                        GIFLET_DEBUG_LOG("Graphics Control Extension (21 f9):");
                        if (extensionBytes.size() != 4) {
                            throw GifFormatError(fmt::format("Graphics control extension with {} bytes, expected 4", extensionBytes.size()));
                        }
                        auto packed = extensionBytes[0];
                        controlExtension = Frame::ControlExtension{Frame::ControlExtension::DisposalMethod((packed >> 2) & 7), (packed & 2) != 0, (packed & 1) != 0,
                                                                   static_cast<uint16_t>(extensionBytes[1] | (extensionBytes[2] << 8)), extensionBytes[3]};
                        break;
                    }
                    case 0xfe:
                        GIFLET_DEBUG_LOG("Comment Extension (21 fe):");
                        _comment.assign(extensionBytes.begin(), extensionBytes.end());
                        break;
                    case 0xff:
                        GIFLET_DEBUG_LOG("Application Extension (21 ff):");
                        // NETSCAPE2.0/ANIMEXTS1.0 identifier, then sub-block 01 <loop count>
                        if (extensionBytes.size() == 14 && extensionBytes[11] == 1 && (std::string_view(reinterpret_cast<const char*>(extensionBytes.data()), 11) == "NETSCAPE2.0" || std::string_view(reinterpret_cast<const char*>(extensionBytes.data()), 11) == "ANIMEXTS1.0")) {
                            _loopCount = static_cast<uint16_t>(extensionBytes[12] | (extensionBytes[13] << 8));
                        }
                        break;
                    default:
                        GIFLET_DEBUG_LOG("Skipped extension type " + std::to_string(extensionType));
                        break;
                }
                break;
            }
            case 0x2c: {
                GIFLET_DEBUG_LOG("Image Descriptor (2c):");
                Frame frame{};
                frame._left = readU16(data, end);
                frame._top = readU16(data, end);
                frame._width = readU16(data, end);
                frame._height = readU16(data, end);
                frame._controlExtension = controlExtension;
                controlExtension.reset();
                auto flags = readU8(data, end);
                frame._isInterlaced = (flags & 0x40) != 0;
                if (flags & 0x80) {
                    frame._palette = readColorTable(data, end, size_t(1) << ((flags & 7) + 1));
                }
                frame._minCodeSize = readU8(data, end);
                if (frame._minCodeSize < 2 || frame._minCodeSize > 8) {
                    throw GifFormatError(fmt::format("Invalid LZW minimum code size {}", frame._minCodeSize));
                }
                // locate the end of the sub-block chain first, so the decoder can't run past it
                const auto* chainStart = data;
                while (true) {
                    auto blockSize = readU8(data, end);
                    if (!blockSize)
                        break;
                    if (end - data < blockSize) {
                        throw GifFormatError("Truncated image data in GIF");
                    }
                    data += blockSize;
                    ++frame._numSubBlocks;
                    frame._compressedSize += blockSize;
                }
                SubblockReader sbr(ByteView{chainStart, static_cast<size_t>(data - chainStart)});
                ghc::compression::LzwDecoder<SubblockReader> lzw(sbr, sbr.end(), frame._minCodeSize);
                auto pixels = lzw.decompress();
                if (!pixels) {
                    throw GifFormatError(fmt::format("Corrupt LZW data in frame {}", _frames.size()));
                }
                if (pixels->size() != size_t(frame._width) * frame._height) {
                    throw GifFormatError(fmt::format("Frame {} decodes to {} pixels, expected {} for {}x{}", _frames.size(), pixels->size(), size_t(frame._width) * frame._height, frame._width, frame._height));
                }
                frame._pixels = std::move(*pixels);
#ifdef GIFLET_DEBUG_OUTPUT
                ghc::hexDump(std::cout, chainStart, data - chainStart, true, chainStart - gifData.data());
#endif
                _frames.push_back(std::move(frame));
                break;
            }
            case 0x3b:
                GIFLET_DEBUG_LOG("Trailer (3b)");
                trailerFound = true;
                break;
            default:
                throw GifFormatError(fmt::format("Unknown block type 0x{:02x} at offset {}", *(data - 1), data - 1 - gifData.data()));
        }
    }
    GIFLET_DEBUG_LOG("---END-DECODE---");
}

void GifImage::dumpInfo(std::ostream& os) const
{
    os << fmt::format("{}, {}x{}, {} bytes", _is89a ? "GIF89a" : "GIF87a", _width, _height, _fileSize) << std::endl;
    os << fmt::format("    Global color table: {} entries", _palette.size()) << std::endl;
    if (_loopCount) {
        os << "    Loop count: " << (*_loopCount ? std::to_string(*_loopCount) : std::string("forever")) << std::endl;
    }
    if (!_comment.empty()) {
        os << "    Comment: " << _comment << std::endl;
    }
    for (size_t i = 0; i < _frames.size(); ++i) {
        const auto& frame = _frames[i];
        os << fmt::format("    Frame {}: {}x{} at {},{}, {} pixels decoded, {} bytes LZW in {} sub-blocks (min code size {})", i, frame._width, frame._height, frame._left, frame._top, frame._pixels.size(), frame._compressedSize,
                          frame._numSubBlocks, frame._minCodeSize);
        if (frame._controlExtension) {
            os << fmt::format(", delay {}/100s, disposal {}", frame._controlExtension->_delayTime, static_cast<int>(frame._controlExtension->_disposalMethod));
        }
        if (!frame._palette.empty()) {
            os << fmt::format(", local color table with {} entries", frame._palette.size());
        }
        os << std::endl;
    }
}

}
