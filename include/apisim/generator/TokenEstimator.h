#pragma once

#include <string>

namespace Json {
class Value;
}

namespace apisim {
namespace generator {

// Rough token accounting: four characters per token.
class TokenEstimator {
public:
    static constexpr int kCharsPerToken = 4;

    // At least 1 for any input, including empty text.
    static int Estimate(const std::string& text);

    // Text of a chat "messages" array. String contents and "text" parts of
    // array contents are joined.
    static std::string ChatText(const Json::Value& messages);

    // Strings of a "prompt"/"input" field that is a string or an array of strings.
    static std::string PromptText(const Json::Value& prompt);

    // Filler text of roughly `tokens` tokens (one word per token).
    static std::string LoremText(int tokens);
};

} // namespace generator
} // namespace apisim
