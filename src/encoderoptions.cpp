//---------------------------------------------------------------------------------------
// src/encoderoptions.cpp
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

#include <giflet/encoderoptions.hpp>
#include <giflet/errors.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace giflet {

const char* EncoderOptions::policyName(FullDictionaryPolicy policy)
{
    switch (policy) {
        case FullDictionaryPolicy::eFreeze:
            return "freeze";
        case FullDictionaryPolicy::eReset:
            return "reset";
    }
    return "freeze";
}

FullDictionaryPolicy EncoderOptions::policyFromName(const std::string& name)
{
    if (name == "freeze")
        return FullDictionaryPolicy::eFreeze;
    if (name == "reset")
        return FullDictionaryPolicy::eReset;
    throw GifError(fmt::format("Unknown full dictionary policy '{}', expected 'freeze' or 'reset'", name));
}

EncoderOptions EncoderOptions::fromJson(const nlohmann::json& json)
{
    EncoderOptions options;
    if (!json.is_object()) {
        throw GifError("Encoder options must be a JSON object");
    }
    if (json.contains("loopCount")) {
        auto loopCount = json.at("loopCount").get<int64_t>();
        if (loopCount < 0 || loopCount > 0xffff) {
            throw GifError(fmt::format("Loop count {} is out of range 0..65535", loopCount));
        }
        options.loopCount = static_cast<uint16_t>(loopCount);
    }
    if (json.contains("fullDictionary")) {
        options.fullDictionaryPolicy = policyFromName(json.at("fullDictionary").get<std::string>());
    }
    return options;
}

nlohmann::json EncoderOptions::toJson() const
{
    return {{"loopCount", loopCount}, {"fullDictionary", policyName(fullDictionaryPolicy)}};
}

}
