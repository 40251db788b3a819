//
// Created by Steffen Schümann on 17.03.25.
//
#include <doctest/doctest.h>

#include <giflet/encoderoptions.hpp>
#include <giflet/errors.hpp>

#include <nlohmann/json.hpp>

using namespace giflet;

TEST_SUITE("EncoderOptions")
{
    TEST_CASE("defaults reproduce the classic output")
    {
        EncoderOptions options;
        CHECK(options.loopCount == 0);
        CHECK(options.fullDictionaryPolicy == FullDictionaryPolicy::eFreeze);
    }

    TEST_CASE("fromJson reads known keys")
    {
        auto options = EncoderOptions::fromJson(nlohmann::json::parse(R"({"loopCount": 3, "fullDictionary": "reset"})"));
        CHECK(options.loopCount == 3);
        CHECK(options.fullDictionaryPolicy == FullDictionaryPolicy::eReset);
    }

    TEST_CASE("missing keys keep defaults")
    {
        auto options = EncoderOptions::fromJson(nlohmann::json::object());
        CHECK(options.loopCount == 0);
        CHECK(options.fullDictionaryPolicy == FullDictionaryPolicy::eFreeze);
    }

    TEST_CASE("invalid values are rejected")
    {
        CHECK_THROWS_AS(EncoderOptions::fromJson(nlohmann::json::parse(R"({"loopCount": 70000})")), GifError);
        CHECK_THROWS_AS(EncoderOptions::fromJson(nlohmann::json::parse(R"({"loopCount": -1})")), GifError);
        CHECK_THROWS_AS(EncoderOptions::fromJson(nlohmann::json::parse(R"({"fullDictionary": "sometimes"})")), GifError);
        CHECK_THROWS_AS(EncoderOptions::fromJson(nlohmann::json::parse("[1, 2]")), GifError);
        CHECK_THROWS_AS(EncoderOptions::fromJson(nlohmann::json::parse(R"({"loopCount": "many"})")), nlohmann::json::exception);
    }

    TEST_CASE("toJson round trips")
    {
        EncoderOptions options;
        options.loopCount = 12;
        options.fullDictionaryPolicy = FullDictionaryPolicy::eReset;
        auto json = options.toJson();
        CHECK(json["loopCount"] == 12);
        CHECK(json["fullDictionary"] == "reset");
        auto copy = EncoderOptions::fromJson(json);
        CHECK(copy.loopCount == 12);
        CHECK(copy.fullDictionaryPolicy == FullDictionaryPolicy::eReset);
    }
}
