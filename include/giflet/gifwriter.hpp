//---------------------------------------------------------------------------------------
// include/giflet/gifwriter.hpp
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

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <memory>

namespace giflet {

// Append-only assembly of a GIF89a byte stream. Blocks are written in file
// order, writeTrailer() finalizes the buffer, release() hands it out.
class GifWriter
{
public:
    static constexpr uint8_t EXTENSION_INTRODUCER = 0x21;
    static constexpr uint8_t APPLICATION_LABEL = 0xFF;
    static constexpr uint8_t GRAPHIC_CONTROL_LABEL = 0xF9;
    static constexpr uint8_t IMAGE_SEPARATOR = 0x2C;
    static constexpr uint8_t TRAILER = 0x3B;
    static constexpr uint8_t SCREEN_FLAGS_GLOBAL_256 = 0xF7;
    static constexpr size_t MAX_SUBBLOCK_SIZE = 255;
    static constexpr size_t LOOP_EXTENSION_SIZE = 19;
    static constexpr size_t GRAPHIC_CONTROL_SIZE = 8;
    static constexpr size_t IMAGE_DESCRIPTOR_SIZE = 10;

    GifWriter() = default;

    void writeHeader(uint16_t width, uint16_t height);
    void writeGlobalColorTable(const Palette& palette);
    void writeLoopExtension(uint16_t loopCount = 0);
    void writeGraphicControl(uint16_t delayTime_cs, uint8_t disposalMethod = 0);
    void writeImageDescriptor(uint16_t width, uint16_t height);
    void writeImageData(uint8_t minCodeSize, ByteView compressed);
    void writeTrailer();

    bool isFinalized() const { return _finalized; }
    size_t size() const { return _buffer.size(); }
    const ByteArray& bytes() const { return _buffer; }
    ByteArray release();

private:
    // Output iterator that splits everything written through it into
    // [<length> <data>]* 00 sub-blocks, the last copy going out of scope
    // patches the final length and writes the terminator.
    class SubblockInserter
    {
    public:
        using iterator_category = std::output_iterator_tag;
        using value_type = void;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = void;
        explicit SubblockInserter(ByteArray& buffer, size_t maxSize = MAX_SUBBLOCK_SIZE)
            : _impl(std::make_shared<Impl>(Impl{maxSize, buffer, buffer.size(), 0}))
        {
            _impl->_buffer.push_back(0);
        }
        SubblockInserter(const SubblockInserter&) = default;
        SubblockInserter& operator=(const SubblockInserter&) = default;
        ~SubblockInserter()
        {
            if (_impl && _impl.use_count() == 1 && _impl->_inserted) {
                _impl->_buffer[_impl->_subBlockStart] = static_cast<uint8_t>(_impl->_inserted);
                _impl->_buffer.push_back(0);
            }
        }
        SubblockInserter& operator=(uint8_t val)
        {
            _impl->_buffer.push_back(val);
            if (++_impl->_inserted == _impl->_maxSize) {
                _impl->_buffer[_impl->_subBlockStart] = static_cast<uint8_t>(_impl->_maxSize);
                _impl->_subBlockStart = _impl->_buffer.size();
                _impl->_inserted = 0;
                _impl->_buffer.push_back(0);
            }
            return *this;
        }
        SubblockInserter& operator*() { return *this; }
        SubblockInserter& operator++() { return *this; }
        SubblockInserter operator++(int) { return *this; }

    private:
        struct Impl
        {
            size_t _maxSize{};
            ByteArray& _buffer;
            size_t _subBlockStart{};
            size_t _inserted{};
        };
        std::shared_ptr<Impl> _impl;
    };

    void checkOpen() const;
    void appendU8(uint8_t val) { _buffer.push_back(val); }
    void appendU8(std::initializer_list<uint8_t> vals) { _buffer.insert(_buffer.end(), vals.begin(), vals.end()); }
    void appendU16(uint16_t val)
    {
        _buffer.push_back(val & 0xff);
        _buffer.push_back(val >> 8);
    }
    void appendU16(std::initializer_list<uint16_t> vals)
    {
        for (auto v : vals)
            appendU16(v);
    }
    void appendTo(const char* text, size_t length) { _buffer.insert(_buffer.end(), text, text + length); }

    ByteArray _buffer;
    bool _finalized{false};
};

}
