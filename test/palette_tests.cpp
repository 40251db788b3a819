//
// Created by Steffen Schümann on 14.03.25.
//
#include <doctest/doctest.h>

#include <giflet/palette.hpp>

using namespace giflet;

TEST_SUITE("Palette")
{
    TEST_CASE("standard palette has exactly 256 entries")
    {
        CHECK(Palette::standard().size() == 256);
        CHECK(Palette::standard().entries().size() == Palette::SIZE);
    }

    TEST_CASE("standard palette is deterministic")
    {
        const auto& first = Palette::standard();
        const auto& second = Palette::standard();
        for (size_t i = 0; i < Palette::SIZE; ++i) {
            CHECK(first[i] == second[i]);
        }
    }

    TEST_CASE("color cube ordering is red major")
    {
        const auto& palette = Palette::standard();
        for (size_t r = 0; r < 6; ++r) {
            for (size_t g = 0; g < 6; ++g) {
                for (size_t b = 0; b < 6; ++b) {
                    auto index = r * 36 + g * 6 + b;
                    REQUIRE(Palette::cubeIndex(r, g, b) == index);
                    CHECK(palette[index] == Rgb{static_cast<uint8_t>(r * 51), static_cast<uint8_t>(g * 51), static_cast<uint8_t>(b * 51)});
                }
            }
        }
        CHECK(palette[180] == Rgb{255, 0, 0});
        CHECK(palette[215] == Rgb{255, 255, 255});
    }

    TEST_CASE("gray ramp fills the last 40 entries")
    {
        const auto& palette = Palette::standard();
        SUBCASE("entries are pure grays")
        {
            for (size_t i = Palette::CUBE_SIZE; i < Palette::SIZE; ++i) {
                CHECK(palette[i].r == palette[i].g);
                CHECK(palette[i].g == palette[i].b);
            }
        }
        SUBCASE("halfway values round up")
        {
            CHECK(palette[216].r == 0);
            CHECK(palette[217].r == 6);
            CHECK(palette[218].r == 13);
            CHECK(palette[220].r == 26);   // 25.5
            CHECK(palette[224].r == 51);
            CHECK(palette[236].r == 128);  // 127.5
            CHECK(palette[255].r == 249);
        }
    }
}
