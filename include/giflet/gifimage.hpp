//---------------------------------------------------------------------------------------
// include/giflet/gifimage.hpp
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

#include <giflet/errors.hpp>
#include <giflet/palette.hpp>
#include <giflet/utility.hpp>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#ifdef GIFLET_DEBUG_OUTPUT
#include <iostream>
#define GIFLET_DEBUG_LOG(x) std::cout << (x) << std::endl
#else
#define GIFLET_DEBUG_LOG(x)
#endif

namespace giflet {

// Read-only view of a decoded GIF87a/GIF89a file, used to inspect and
// verify encoder output. Malformed data throws GifFormatError.
class GifImage
{
public:
    struct Frame
    {
        struct ControlExtension
        {
            // 4..7 are reserved and kept as read
            enum DisposalMethod : uint8_t { unspecified, doNotDispose, restoreToBackground, restoreToPrevious };
            DisposalMethod _disposalMethod{unspecified};
            bool _userInput{false};
            bool _transparency{false};
            uint16_t _delayTime{};
            uint8_t _transparentColor{0};
        };
        uint16_t _left{};
        uint16_t _top{};
        uint16_t _width{};
        uint16_t _height{};
        std::vector<Rgb> _palette;
        ByteArray _pixels;
        bool _isInterlaced{false};
        uint8_t _minCodeSize{};
        size_t _numSubBlocks{};
        size_t _compressedSize{};
        std::optional<ControlExtension> _controlExtension;
    };

    explicit GifImage(ByteView data);
    static GifImage fromFile(const std::string& filename);

    bool is89a() const { return _is89a; }
    uint16_t width() const { return _width; }
    uint16_t height() const { return _height; }
    uint8_t backgroundIndex() const { return _backgroundIndex; }
    uint8_t aspectRatio() const { return _aspectRatio; }
    uint8_t screenFlags() const { return _screenFlags; }
    bool hasGlobalColorTable() const { return !_palette.empty(); }
    const std::vector<Rgb>& globalPalette() const { return _palette; }
    std::optional<uint16_t> loopCount() const { return _loopCount; }
    const std::string& comment() const { return _comment; }
    size_t numFrames() const { return _frames.size(); }
    const Frame& getFrame(size_t index) const { return _frames.at(index); }
    size_t fileSize() const { return _fileSize; }

    void dumpInfo(std::ostream& os) const;

private:
    // Input iterator over the payload of a [<length> <data>]* 00 sub-block
    // chain, hiding the length bytes.
    class SubblockReader
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = uint8_t;
        using difference_type = std::ptrdiff_t;
        using pointer = const uint8_t*;
        using reference = const uint8_t&;
        explicit SubblockReader(ByteView input)
            : _buffer(input)
            , _src(input.data())
        {
            if (!input.empty())
                _bytesLeft = _blockSize = *_src++;
        }
        reference operator*() const { return *_src; }
        SubblockReader& operator++()
        {
            const uint8_t* end = _buffer.data() + _buffer.size();
            if (_src < end) {
                if (_bytesLeft) {
                    --_bytesLeft;
                    ++_src;
                }
                if (_blockSize && !_bytesLeft) {
                    _bytesLeft = _blockSize = (_src < end ? *_src++ : 0);
                }
            }
            else {
                _bytesLeft = _blockSize = 0;
            }
            return *this;
        }
        SubblockReader operator++(int)
        {
            auto temp = *this;
            ++(*this);
            return temp;
        }
        bool operator==(const SubblockReader& other) const { return _src == other._src || (!_blockSize && !other._blockSize); }
        bool operator!=(const SubblockReader& other) const { return !(*this == other); }
        SubblockReader end() const
        {
            SubblockReader sbr(ByteView{});
            sbr._buffer = _buffer;
            sbr._src = _buffer.data() + _buffer.size();
            return sbr;
        }

    private:
        ByteView _buffer;
        const uint8_t* _src{};
        size_t _blockSize{};
        size_t _bytesLeft{};
    };

    void decode(ByteView gifData);
    static uint8_t readU8(const uint8_t*& data, const uint8_t* end);
    static uint16_t readU16(const uint8_t*& data, const uint8_t* end);
    static ByteArray getBlockData(const uint8_t*& data, const uint8_t* end);
    static std::vector<Rgb> readColorTable(const uint8_t*& data, const uint8_t* end, size_t numEntries);

    bool _is89a{false};
    uint16_t _width{};
    uint16_t _height{};
    uint8_t _screenFlags{};
    uint8_t _backgroundIndex{};
    uint8_t _aspectRatio{};
    std::vector<Rgb> _palette;
    std::optional<uint16_t> _loopCount;
    std::string _comment;
    std::vector<Frame> _frames;
    size_t _fileSize{};
};

}
