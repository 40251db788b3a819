//
// Created by Steffen Schümann on 28.02.24.
//
#include "testutils.hpp"

#include <giflet/gifencoder.hpp>
#include <giflet/gifimage.hpp>

#include <sstream>

using namespace giflet;

namespace {
const uint8_t sample_gif[] = {
    0x47, 0x49, 0x46, 0x38, 0x39, 0x61, 0x0a, 0x00, 0x0a, 0x00, 0x91, 0x00, 0x00, 0xff, 0xff, 0xff,
    0xff, 0x00, 0x00, 0x00, 0x00, 0xff, 0x00, 0x00, 0x00, 0x21, 0xf9, 0x04, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x2c, 0x00, 0x00, 0x00, 0x00, 0x0a, 0x00, 0x0a, 0x00, 0x00, 0x02, 0x16, 0x8c, 0x2d, 0x99,
    0x87, 0x2a, 0x1c, 0xdc, 0x33, 0xa0, 0x02, 0x75, 0xec, 0x95, 0xfa, 0xa8, 0xde, 0x60, 0x8c, 0x04,
    0x91, 0x4c, 0x01, 0x00, 0x3b
};

// clang-format off
const uint8_t sample_pixels[] = {
    1, 1, 1, 1, 1, 2, 2, 2, 2, 2,
    1, 1, 1, 1, 1, 2, 2, 2, 2, 2,
    1, 1, 1, 1, 1, 2, 2, 2, 2, 2,
    1, 1, 1, 0, 0, 0, 0, 2, 2, 2,
    1, 1, 1, 0, 0, 0, 0, 2, 2, 2,
    2, 2, 2, 0, 0, 0, 0, 1, 1, 1,
    2, 2, 2, 0, 0, 0, 0, 1, 1, 1,
    2, 2, 2, 2, 2, 1, 1, 1, 1, 1,
    2, 2, 2, 2, 2, 1, 1, 1, 1, 1,
    2, 2, 2, 2, 2, 1, 1, 1, 1, 1
};
// clang-format on

ByteArray sampleData()
{
    return ByteArray(std::begin(sample_gif), std::end(sample_gif));
}
}  // namespace

TEST_SUITE("GifImage")
{
    TEST_CASE("decodes a small GIF89a with a 4 color table")
    {
        GifImage gif(sampleData());
        CHECK(gif.is89a());
        CHECK(gif.width() == 10);
        CHECK(gif.height() == 10);
        REQUIRE(gif.globalPalette().size() == 4);
        CHECK(gif.globalPalette()[1] == Rgb{255, 0, 0});
        CHECK(gif.globalPalette()[2] == Rgb{0, 0, 255});
        CHECK(!gif.loopCount());
        REQUIRE(gif.numFrames() == 1);
        const auto& frame = gif.getFrame(0);
        CHECK(frame._minCodeSize == 2);
        CHECK(frame._numSubBlocks == 1);
        CHECK(frame._compressedSize == 22);
        REQUIRE(frame._controlExtension);
        CHECK(frame._controlExtension->_delayTime == 0);
        CHECK(frame._pixels == ByteArray(std::begin(sample_pixels), std::end(sample_pixels)));
    }

    TEST_CASE("reads comments and skips unknown extensions")
    {
        auto data = sampleData();
        ByteArray extensions{0x21, 0xfe, 0x05, 'h', 'e', 'l', 'l', 'o', 0x00, 0x21, 0x01, 0x02, 0xaa, 0xbb, 0x00};
        data.insert(data.begin() + 25, extensions.begin(), extensions.end());
        GifImage gif(data);
        CHECK(gif.comment() == "hello");
        CHECK(gif.numFrames() == 1);
    }

    TEST_CASE("rejects malformed data")
    {
        SUBCASE("too short")
        {
            CHECK_THROWS_AS(GifImage(ByteArray{'G', 'I', 'F'}), GifFormatError);
        }
        SUBCASE("wrong signature")
        {
            auto data = sampleData();
            data[3] = '9';
            data[4] = '0';
            CHECK_THROWS_AS(GifImage{data}, GifFormatError);
        }
        SUBCASE("missing trailer")
        {
            auto data = sampleData();
            data.pop_back();
            CHECK_THROWS_AS(GifImage{data}, GifFormatError);
        }
        SUBCASE("truncated image data")
        {
            auto data = sampleData();
            data.resize(data.size() - 10);
            CHECK_THROWS_AS(GifImage{data}, GifFormatError);
        }
        SUBCASE("unknown block")
        {
            auto data = sampleData();
            data[data.size() - 1] = 0x42;
            CHECK_THROWS_WITH_AS(GifImage{data}, doctest::Contains("0x42"), GifFormatError);
        }
    }

    TEST_CASE("info dump lists frames")
    {
        GifImage gif(sampleData());
        std::ostringstream os;
        gif.dumpInfo(os);
        auto text = os.str();
        CHECK(text.find("GIF89a, 10x10") != std::string::npos);
        CHECK(text.find("Frame 0: 10x10") != std::string::npos);
        CHECK(text.find("100 pixels decoded") != std::string::npos);
    }

    TEST_CASE("missing files are reported")
    {
        CHECK_THROWS_AS(GifImage::fromFile("this/file/does/not/exist.gif"), GifFormatError);
    }

    TEST_CASE("reserved disposal methods are kept")
    {
        auto data = sampleData();
        REQUIRE(data[26] == 0xf9);
        data[28] = 4 << 2;
        GifImage gif(data);
        REQUIRE(gif.getFrame(0)._controlExtension);
        CHECK(static_cast<int>(gif.getFrame(0)._controlExtension->_disposalMethod) == 4);
        data[28] = 2 << 2;
        CHECK(GifImage(data).getFrame(0)._controlExtension->_disposalMethod == GifImage::Frame::ControlExtension::restoreToBackground);
    }

    TEST_CASE("image data that decodes to the wrong pixel count is rejected")
    {
        GifEncoder encoder(1, 1);
        encoder.addFrame(testutils::solidFrame(1, 1, 0, 0, 0), 100);
        auto data = encoder.encode();
        // image data tail: 08 04 | 00 01 04 04 | 00 3b = clear, 0, end at 9 bits
        REQUIRE(ByteArray(data.end() - 8, data.end()) == ByteArray{0x08, 0x04, 0x00, 0x01, 0x04, 0x04, 0x00, 0x3b});
        CHECK(GifImage(data).getFrame(0)._pixels == ByteArray{0});
        SUBCASE("code beyond the next free entry")
        {
            // clear, 300, end
            data[data.size() - 5] = 0x59;
            data[data.size() - 4] = 0x06;
            CHECK_THROWS_WITH_AS(GifImage{data}, doctest::Contains("decodes to 0 pixels"), GifFormatError);
        }
        SUBCASE("end code right after the clear code")
        {
            // clear, end
            data.erase(data.end() - 7, data.end() - 2);
            data.insert(data.end() - 2, {0x03, 0x00, 0x03, 0x02});
            CHECK_THROWS_AS(GifImage{data}, GifFormatError);
        }
    }
}
