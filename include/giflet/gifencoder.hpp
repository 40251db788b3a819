//---------------------------------------------------------------------------------------
// include/giflet/gifencoder.hpp
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

#include <giflet/encoderoptions.hpp>
#include <giflet/errors.hpp>
#include <giflet/utility.hpp>

#include <cstdint>
#include <functional>
#include <future>
#include <string>
#include <utility>
#include <vector>

namespace giflet {

class GifEncoder
{
public:
    using ProgressHandler = std::function<void(int, std::string)>;
    struct Frame
    {
        ByteArray _rgba;
        uint16_t _delayTime{};  // 1s/100
    };

    GifEncoder(uint16_t width, uint16_t height, EncoderOptions options = {});

    uint16_t width() const { return _width; }
    uint16_t height() const { return _height; }
    const EncoderOptions& options() const { return _options; }
    size_t numFrames() const { return _frames.size(); }
    const Frame& getFrame(size_t index) const { return _frames.at(index); }

    // Stores a copy of a width*height RGBA8 buffer, the delay is given in
    // milliseconds and truncated to 1/100s. Throws InvalidFrameError on a
    // size mismatch.
    void addFrame(ByteView rgba, uint32_t delayTime_ms);

    // Produces the complete animated GIF from all frames added so far, throws
    // EmptyInputError if there are none. Nothing is returned on failure.
    ByteArray encode() const;

    // Runs encode() as a separate task, the encoder has to outlive the future.
    std::future<ByteArray> encodeAsync() const;

    bool writeToFile(const std::string& filename) const;

    void setProgressHandler(ProgressHandler handler) { _progress = std::move(handler); }

    static uint16_t delayFromMilliseconds(uint32_t delayTime_ms);

private:
    void progress(int verbosityLevel, const std::string& message) const
    {
        if (_progress)
            _progress(verbosityLevel, message);
    }
    uint16_t _width{};
    uint16_t _height{};
    EncoderOptions _options;
    std::vector<Frame> _frames;
    ProgressHandler _progress;
};

}
