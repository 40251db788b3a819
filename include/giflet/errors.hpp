//---------------------------------------------------------------------------------------
// include/giflet/errors.hpp
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

#include <stdexcept>
#include <string>

namespace giflet {

class GifError : public std::runtime_error
{
public:
    explicit GifError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

// encode() was called before any frame was added
class EmptyInputError : public GifError
{
public:
    EmptyInputError()
        : GifError("No frames to encode")
    {
    }
};

// frame buffer doesn't match the encoder dimensions
class InvalidFrameError : public GifError
{
public:
    using GifError::GifError;
};

// malformed or truncated GIF data given to the reader
class GifFormatError : public GifError
{
public:
    using GifError::GifError;
};

}
