#include "apisim/generator/TokenEstimator.h"

#include <json/json.h>

namespace apisim {
namespace generator {

int TokenEstimator::Estimate(const std::string& text) {
    const int n = static_cast<int>((text.size() + kCharsPerToken - 1) / kCharsPerToken);
    return n < 1 ? 1 : n;
}

std::string TokenEstimator::ChatText(const Json::Value& messages) {
    std::string out;
    if (!messages.isArray()) return out;
    for (const auto& msg : messages) {
        if (!msg.isObject()) continue;
        const Json::Value& content = msg["content"];
        if (content.isString()) {
            out += content.asString();
            out += "\n";
        } else if (content.isArray()) {
            for (const auto& part : content) {
                if (part.isObject() && part["text"].isString()) {
                    out += part["text"].asString();
                    out += "\n";
                }
            }
        }
    }
    return out;
}

std::string TokenEstimator::PromptText(const Json::Value& prompt) {
    if (prompt.isString()) return prompt.asString();
    std::string out;
    if (!prompt.isArray()) return out;
    for (const auto& item : prompt) {
        if (item.isString()) {
            out += item.asString();
            out += "\n";
        }
    }
    return out;
}

std::string TokenEstimator::LoremText(int tokens) {
    static const char* kWords[] = {
        "lorem", "ipsum", "dolor", "sit", "amet", "consectetur", "adipiscing", "elit",
        "sed", "do", "eiusmod", "tempor", "incididunt", "ut", "labore", "et",
        "dolore", "magna", "aliqua", "enim", "ad", "minim", "veniam", "quis",
    };
    constexpr int kWordCount = sizeof(kWords) / sizeof(kWords[0]);

    std::string out;
    for (int i = 0; i < tokens; ++i) {
        if (i > 0) out += ' ';
        out += kWords[i % kWordCount];
    }
    if (!out.empty()) out += '.';
    return out;
}

} // namespace generator
} // namespace apisim
