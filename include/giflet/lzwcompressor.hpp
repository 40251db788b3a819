//---------------------------------------------------------------------------------------
// include/giflet/lzwcompressor.hpp
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

#include <giflet/utility.hpp>

#include <cstddef>
#include <cstdint>
#include <unordered_map>

namespace giflet {

enum class FullDictionaryPolicy {
    eFreeze,  // keep the full table, no clear code, as older encoders did
    eReset    // emit a clear code and start over once the table is full
};

class LzwCompressor
{
public:
    using Code = uint16_t;
    static constexpr size_t MAX_ENTRIES = 4096;
    static constexpr int MAX_CODE_WIDTH = 12;
    static constexpr uint8_t DEFAULT_MIN_CODE_SIZE = 8;

    explicit LzwCompressor(uint8_t minCodeSize = DEFAULT_MIN_CODE_SIZE, FullDictionaryPolicy policy = FullDictionaryPolicy::eFreeze);

    // Compresses one frame worth of palette indices into the GIF flavored LZW
    // code stream (clear code, data codes, end of information), packed LSB first.
    ByteArray compress(ByteView indices);

    uint8_t minCodeSize() const { return _minCodeSize; }
    Code clearCode() const { return static_cast<Code>(1u << _minCodeSize); }
    Code endCode() const { return clearCode() + 1; }
    FullDictionaryPolicy policy() const { return _policy; }

    // statistics of the last compress() call
    size_t dictionarySize() const { return _maxDictionarySize; }
    int maxCodeWidth() const { return _maxCodeWidth; }
    size_t clearCodesEmitted() const { return _clearCodes; }

private:
    static uint32_t makeKey(Code prefix, uint8_t symbol) { return (static_cast<uint32_t>(prefix) << 8) | symbol; }
    void resetDictionary();
    uint8_t _minCodeSize;
    FullDictionaryPolicy _policy;
    std::unordered_map<uint32_t, Code> _dictionary;
    Code _nextCode{};
    int _codeWidth{};
    size_t _maxDictionarySize{};
    int _maxCodeWidth{};
    size_t _clearCodes{};
};

}
