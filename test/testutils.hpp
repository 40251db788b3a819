#pragma once

#include <doctest/doctest.h>

#include <giflet/utility.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <iostream>
#include <numeric>
#include <sstream>
#include <vector>

#include <ghc/lzw.hpp>

namespace doctest {
template <>
struct StringMaker<giflet::ByteArray>
{
    static String convert(const giflet::ByteArray& vec)
    {
        std::ostringstream oss;
        oss << "[";
        if (!vec.empty())
            oss << std::accumulate(std::next(vec.begin()), vec.end(), fmt::format("0x{:02x}", vec[0]), [](std::string& a, uint8_t b) { return a + "," + fmt::format("0x{:02x}", b); });
        oss << "]";
        return oss.str().c_str();
    }
};
}  // namespace doctest

namespace testutils {

// Reference decoder for LZW code streams, independent from the encoder
inline giflet::ByteArray lzwDecode(const giflet::ByteArray& compressed, uint8_t minCodeSize = 8)
{
    auto iter = compressed.cbegin();
    ghc::compression::LzwDecoder<giflet::ByteArray::const_iterator> lzw(iter, compressed.cend(), minCodeSize);
    auto result = lzw.decompress();
    REQUIRE(result);
    return *result;
}

inline giflet::ByteArray solidFrame(uint16_t width, uint16_t height, uint8_t r, uint8_t g, uint8_t b)
{
    giflet::ByteArray rgba;
    rgba.reserve(size_t(width) * height * 4);
    for (size_t i = 0; i < size_t(width) * height; ++i) {
        rgba.insert(rgba.end(), {r, g, b, 255});
    }
    return rgba;
}

inline giflet::ByteArray noiseFrame(uint16_t width, uint16_t height, uint32_t seed)
{
    giflet::ByteArray rgba(size_t(width) * height * 4);
    for (size_t i = 0; i < rgba.size(); ++i) {
        seed = seed * 1664525u + 1013904223u;
        rgba[i] = static_cast<uint8_t>(seed >> 24);
    }
    return rgba;
}

inline giflet::ByteArray randomIndices(size_t length, uint32_t seed, unsigned alphabetSize = 256)
{
    giflet::ByteArray indices(length);
    for (auto& index : indices) {
        seed = seed * 1664525u + 1013904223u;
        index = static_cast<uint8_t>((seed >> 16) % alphabetSize);
    }
    return indices;
}

inline uint16_t readU16(const giflet::ByteArray& data, size_t offset)
{
    return static_cast<uint16_t>(data.at(offset) | (data.at(offset + 1) << 8));
}

}  // namespace testutils
