//---------------------------------------------------------------------------------------
// src/lzwcompressor.cpp
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

#include <giflet/lzwcompressor.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>

namespace giflet {

namespace {

class CodePacker
{
public:
    explicit CodePacker(ByteArray& output)
        : _output(output)
    {
    }
    void write(uint32_t code, int width)
    {
        _bits |= code << _numBits;
        _numBits += width;
        while (_numBits >= 8) {
            _output.push_back(static_cast<uint8_t>(_bits & 0xff));
            _bits >>= 8;
            _numBits -= 8;
        }
    }
    void flush()
    {
        if (_numBits) {
            _output.push_back(static_cast<uint8_t>(_bits & 0xff));
            _bits = 0;
            _numBits = 0;
        }
    }

private:
    ByteArray& _output;
    uint32_t _bits{};
    int _numBits{};
};

}

LzwCompressor::LzwCompressor(uint8_t minCodeSize, FullDictionaryPolicy policy)
    : _minCodeSize(minCodeSize)
    , _policy(policy)
{
    if (minCodeSize < 2 || minCodeSize > 8) {
        throw std::invalid_argument("LZW minimum code size must be in the range 2..8, got " + std::to_string(minCodeSize));
    }
}

void LzwCompressor::resetDictionary()
{
    // single symbols are implicit, their code is the symbol value
    _dictionary.clear();
    _nextCode = endCode() + 1;
    _codeWidth = _minCodeSize + 1;
}

ByteArray LzwCompressor::compress(ByteView indices)
{
    ByteArray result;
    CodePacker packer(result);
    _dictionary.reserve(MAX_ENTRIES);
    resetDictionary();
    _maxCodeWidth = _codeWidth;
    _maxDictionarySize = _nextCode;
    _clearCodes = 1;
    packer.write(clearCode(), _codeWidth);

    std::optional<Code> current;
    for (auto symbol : indices) {
        if (symbol >= clearCode()) {
            throw std::invalid_argument("LZW input symbol " + std::to_string(symbol) + " exceeds the alphabet of " + std::to_string(clearCode()) + " entries");
        }
        if (!current) {
            current = symbol;
            continue;
        }
        auto key = makeKey(*current, symbol);
        auto iter = _dictionary.find(key);
        if (iter != _dictionary.end()) {
            current = iter->second;
            continue;
        }
        packer.write(*current, _codeWidth);
        if (_nextCode < MAX_ENTRIES) {
            _dictionary.emplace(key, _nextCode++);
            if (_nextCode > (1u << _codeWidth) && _codeWidth < MAX_CODE_WIDTH) {
                ++_codeWidth;
            }
            _maxDictionarySize = std::max(_maxDictionarySize, static_cast<size_t>(_nextCode));
            _maxCodeWidth = std::max(_maxCodeWidth, _codeWidth);
        }
        else if (_policy == FullDictionaryPolicy::eReset) {
            packer.write(clearCode(), _codeWidth);
            ++_clearCodes;
            resetDictionary();
        }
        current = symbol;
    }
    if (current) {
        packer.write(*current, _codeWidth);
    }
    packer.write(endCode(), _codeWidth);
    packer.flush();
    _dictionary.clear();
    return result;
}

}
