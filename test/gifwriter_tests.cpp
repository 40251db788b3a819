//
// Created by Steffen Schümann on 16.03.25.
//
#include "testutils.hpp"

#include <giflet/gifwriter.hpp>

#include <stdexcept>
#include <string>

using namespace giflet;
using testutils::readU16;

TEST_SUITE("GifWriter")
{
    TEST_CASE("header and logical screen descriptor")
    {
        GifWriter writer;
        writer.writeHeader(320, 0x1234);
        CHECK(writer.bytes() == ByteArray{'G', 'I', 'F', '8', '9', 'a', 0x40, 0x01, 0x34, 0x12, 0xf7, 0x00, 0x00});
    }

    TEST_CASE("global color table is 768 bytes in palette order")
    {
        GifWriter writer;
        writer.writeGlobalColorTable(Palette::standard());
        const auto& bytes = writer.bytes();
        REQUIRE(bytes.size() == 768);
        CHECK(bytes[180 * 3] == 255);
        CHECK(bytes[180 * 3 + 1] == 0);
        CHECK(bytes[180 * 3 + 2] == 0);
        CHECK(bytes[255 * 3] == 249);
    }

    TEST_CASE("looping extension")
    {
        GifWriter writer;
        writer.writeLoopExtension();
        auto expected = ByteArray{0x21, 0xff, 0x0b, 'N', 'E', 'T', 'S', 'C', 'A', 'P', 'E', '2', '.', '0', 0x03, 0x01, 0x00, 0x00, 0x00};
        CHECK(writer.bytes() == expected);
        CHECK(writer.size() == GifWriter::LOOP_EXTENSION_SIZE);
        GifWriter limited;
        limited.writeLoopExtension(3);
        CHECK(readU16(limited.bytes(), 16) == 3);
    }

    TEST_CASE("graphic control extension and image descriptor")
    {
        GifWriter writer;
        writer.writeGraphicControl(10);
        CHECK(writer.bytes() == ByteArray{0x21, 0xf9, 0x04, 0x00, 0x0a, 0x00, 0x00, 0x00});
        writer.writeImageDescriptor(1, 1);
        CHECK(writer.size() == GifWriter::GRAPHIC_CONTROL_SIZE + GifWriter::IMAGE_DESCRIPTOR_SIZE);
        CHECK(ByteArray(writer.bytes().begin() + 8, writer.bytes().end()) == ByteArray{0x2c, 0, 0, 0, 0, 1, 0, 1, 0, 0});
    }

    TEST_CASE("disposal method goes to bits 2..4")
    {
        GifWriter writer;
        writer.writeGraphicControl(0, 2);
        CHECK(writer.bytes()[3] == 0x08);
    }

    TEST_CASE("image data is split into sub-blocks")
    {
        SUBCASE("empty payload only has the terminator")
        {
            GifWriter writer;
            writer.writeImageData(8, ByteArray{});
            CHECK(writer.bytes() == ByteArray{8, 0});
        }
        SUBCASE("short payload")
        {
            GifWriter writer;
            writer.writeImageData(8, ByteArray{1, 2, 3});
            CHECK(writer.bytes() == ByteArray{8, 3, 1, 2, 3, 0});
        }
        SUBCASE("exactly one full block")
        {
            GifWriter writer;
            writer.writeImageData(8, ByteArray(255, 0xaa));
            const auto& bytes = writer.bytes();
            REQUIRE(bytes.size() == 1 + 1 + 255 + 1);
            CHECK(bytes[1] == 255);
            CHECK(bytes.back() == 0);
        }
        SUBCASE("600 bytes become 255 + 255 + 90")
        {
            GifWriter writer;
            ByteArray payload(600);
            for (size_t i = 0; i < payload.size(); ++i)
                payload[i] = static_cast<uint8_t>(i);
            writer.writeImageData(8, payload);
            const auto& bytes = writer.bytes();
            REQUIRE(bytes.size() == 1 + 3 + 600 + 1);
            CHECK(bytes[1] == 255);
            CHECK(bytes[2 + 255] == 255);
            CHECK(bytes[3 + 510] == 90);
            CHECK(bytes[4 + 510] == static_cast<uint8_t>(510));
            CHECK(bytes.back() == 0);
        }
    }

    TEST_CASE("trailer finalizes the buffer")
    {
        GifWriter writer;
        writer.writeHeader(1, 1);
        CHECK_THROWS_AS(writer.release(), std::logic_error);
        writer.writeTrailer();
        CHECK(writer.isFinalized());
        CHECK_THROWS_AS(writer.writeGraphicControl(1), std::logic_error);
        auto bytes = writer.release();
        CHECK(bytes.size() == 14);
        CHECK(bytes.back() == 0x3b);
        CHECK(writer.size() == 0);
    }
}
