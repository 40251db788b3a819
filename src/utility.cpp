//---------------------------------------------------------------------------------------
// src/utility.cpp
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

#include <giflet/utility.hpp>

#include <fstream>
#include <iterator>

namespace giflet {

ByteArray loadFile(const std::string& filename, size_t maxSize)
{
    std::ifstream is(filename, std::ios::binary | std::ios::ate);
    if (is.is_open()) {
        auto size = static_cast<size_t>(is.tellg());
        if (size > maxSize) {
            return {};
        }
        is.seekg(0, std::ios::beg);
        ByteArray buffer(size);
        if (is.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size))) {
            return buffer;
        }
    }
    return {};
}

std::string loadTextFile(const std::string& filename)
{
    std::ifstream is(filename);
    if (!is.is_open()) {
        return {};
    }
    return {std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
}

bool writeFile(const std::string& filename, const uint8_t* data, size_t size)
{
    std::ofstream os(filename, std::ios::binary);
    if (!os.is_open()) {
        return false;
    }
    os.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    return !!os;
}

}
