//---------------------------------------------------------------------------------------
// src/giflet.cpp
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
#include <giflet/gifimage.hpp>
#include <giflet/utility.hpp>

#include <ghc/cli.hpp>
#include <ghc/hexdump.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#ifndef GIFLET_VERSION
#define GIFLET_VERSION "unknown"
#endif

static constexpr double PI = 3.14159265358979323846;

// Stand-in for an external rasterizer: a color wheel gradient with a bright
// bar sweeping from left to right over the course of the animation.
static giflet::ByteArray renderDemoFrame(uint16_t width, uint16_t height, size_t frame, size_t numFrames)
{
    giflet::ByteArray rgba(size_t(width) * height * 4);
    auto barX = numFrames ? static_cast<int>(frame * width / numFrames) : 0;
    auto barWidth = std::max(1, width / 10);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            auto* pixel = rgba.data() + (size_t(y) * width + x) * 4;
            if (x >= barX && x < barX + barWidth) {
                pixel[0] = pixel[1] = pixel[2] = 255;
            }
            else {
                double phase = 2.0 * PI * (double(x) / width + double(frame) / std::max<size_t>(numFrames, 1));
                pixel[0] = static_cast<uint8_t>(127.5 + 127.5 * std::sin(phase));
                pixel[1] = static_cast<uint8_t>(255 * y / std::max(1, height - 1));
                pixel[2] = static_cast<uint8_t>(127.5 + 127.5 * std::cos(phase));
            }
            pixel[3] = 255;
        }
    }
    return rgba;
}

static int showInfo(const std::vector<std::string>& inputList, bool hexdump)
{
    int errors = 0;
    for (const auto& input : inputList) {
        try {
            auto gif = giflet::GifImage::fromFile(input);
            std::cout << input << ": ";
            gif.dumpInfo(std::cout);
            if (hexdump) {
                auto data = giflet::loadFile(input);
                ghc::hexDump(std::cout, data.data(), data.size());
            }
        }
        catch (giflet::GifError& ex) {
            std::cerr << "ERROR: " << input << ": " << ex.what() << std::endl;
            ++errors;
        }
    }
    return errors ? 1 : 0;
}

int main(int argc, char* argv[])
{
    using namespace std::chrono;
    ghc::CLI cli(argc, argv);
    int64_t width = 0;
    int64_t height = 0;
    int64_t delay = 100;
    int64_t demoFrames = 0;
    int64_t loopCount = -1;
    bool resetFullDictionary = false;
    bool info = false;
    bool hexdump = false;
    bool quiet = false;
    bool verbose = false;
    bool version = false;
    int verbosity = 1;
    std::string outputFile;
    std::string configFile;
    std::vector<std::string> inputList;

    cli.category("Encoder");
    cli.option({"-W", "--width"}, width, "width of the animation in pixels");
    cli.option({"-H", "--height"}, height, "height of the animation in pixels");
    cli.option({"-d", "--delay"}, delay, "delay of every frame in milliseconds, default is 100");
    cli.option({"-o", "--output"}, outputFile, "name of the generated gif file");
    cli.option({"--demo"}, demoFrames, "render the given number of frames of a built-in test pattern instead of reading input files");
    cli.option({"--config"}, configFile, "JSON file with encoder options (loopCount, fullDictionary)");
    cli.option({"--loop-count"}, loopCount, "number of repetitions of the animation, 0 is forever (default)");
    cli.option({"--reset-full-dictionary"}, resetFullDictionary, "emit a clear code when the LZW dictionary is full instead of freezing it");

    cli.category("Inspection");
    cli.option({"-i", "--info"}, info, "list the block structure of the given gif files");
    cli.option({"--hexdump"}, hexdump, "additionally dump the bytes of the generated or inspected file");

    cli.category("General");
    cli.option({"-q", "--quiet"}, quiet, "suppress all output during operation");
    cli.option({"-v", "--verbose"}, verbose, "more verbose progress output");
    cli.option({"--version"}, version, "just shows version info and exits");

    cli.positional(inputList, "Raw RGBA8 frame files (width*height*4 bytes each) in display order, or gif files with --info");
    cli.parse();

    if (quiet)
        verbosity = 0;
    else if (verbose)
        verbosity = 100;

    if (!quiet || version) {
        std::clog << "Giflet v" GIFLET_VERSION ", animated GIF encoder" << std::endl;
        if (version)
            return 0;
    }

    if (info) {
        if (inputList.empty()) {
            std::cerr << "ERROR: No gif files given to inspect" << std::endl;
            return 1;
        }
        return showInfo(inputList, hexdump);
    }

    if (width <= 0 || width > 0xffff || height <= 0 || height > 0xffff) {
        std::cerr << "ERROR: Width and height need to be in the range 1..65535 (use -W/--width and -H/--height)." << std::endl;
        return 1;
    }
    if (delay < 0 || delay > 0xffffffffll) {
        std::cerr << "ERROR: Invalid frame delay " << delay << "ms" << std::endl;
        return 1;
    }
    if (outputFile.empty()) {
        std::cerr << "ERROR: No output filename given (use -o/--output)." << std::endl;
        return 1;
    }
    if (inputList.empty() && demoFrames <= 0) {
        std::cerr << "ERROR: No input frames given" << std::endl;
        return 1;
    }
    if (!inputList.empty() && demoFrames > 0) {
        std::cerr << "ERROR: Only either input files or --demo, not both are supported!" << std::endl;
        return 1;
    }

    try {
        giflet::EncoderOptions options;
        if (!configFile.empty()) {
            auto configText = giflet::loadTextFile(configFile);
            if (configText.empty()) {
                std::cerr << "ERROR: Couldn't read JSON file '" << configFile << "' with encoder options." << std::endl;
                return 1;
            }
            options = giflet::EncoderOptions::fromJson(nlohmann::json::parse(configText));
        }
        if (loopCount >= 0) {
            if (loopCount > 0xffff) {
                std::cerr << "ERROR: Loop count needs to be in the range 0..65535" << std::endl;
                return 1;
            }
            options.loopCount = static_cast<uint16_t>(loopCount);
        }
        if (resetFullDictionary) {
            options.fullDictionaryPolicy = giflet::FullDictionaryPolicy::eReset;
        }
        if (verbosity > 1) {
            std::clog << "INFO: Encoder options: " << options.toJson().dump() << std::endl;
        }

        auto start = steady_clock::now();
        giflet::GifEncoder encoder(static_cast<uint16_t>(width), static_cast<uint16_t>(height), options);
        if (!quiet) {
            encoder.setProgressHandler([&](int verbLvl, std::string msg) {
                if (verbLvl <= verbosity) {
                    std::clog << std::string(verbLvl * 2 - 2, ' ') << msg << std::endl;
                }
            });
        }
        if (demoFrames > 0) {
            for (int64_t i = 0; i < demoFrames; ++i) {
                encoder.addFrame(renderDemoFrame(encoder.width(), encoder.height(), i, demoFrames), static_cast<uint32_t>(delay));
            }
        }
        else {
            for (const auto& input : inputList) {
                auto data = giflet::loadFile(input);
                if (data.empty()) {
                    std::cerr << "ERROR: Couldn't read frame file: " << input << std::endl;
                    return 1;
                }
                encoder.addFrame(data, static_cast<uint32_t>(delay));
            }
        }
        auto image = encoder.encode();
        if (!giflet::writeFile(outputFile, image.data(), image.size())) {
            std::cerr << "ERROR: Couldn't write output file: " << outputFile << std::endl;
            return 1;
        }
        if (hexdump) {
            ghc::hexDump(std::cout, image.data(), image.size());
        }
        auto duration = duration_cast<milliseconds>(steady_clock::now() - start).count();
        if (!quiet)
            std::clog << "Wrote " << outputFile << " (" << image.size() << " bytes, " << duration << "ms)" << std::endl;
    }
    catch (giflet::GifError& ex) {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
    catch (nlohmann::json::exception& ex) {
        std::cerr << "ERROR: Couldn't parse encoder option file '" << configFile << "': " << ex.what() << std::endl;
        return 1;
    }
    catch (std::exception& ex) {
        std::cerr << "Internal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
