#include "earshot/filter/incomplete_sentence.hpp"
#include "earshot/core/text.hpp"

#include <utility>

namespace earshot {

IncompleteSentenceDetector::OpenerTable IncompleteSentenceDetector::defaultOpeners() {
    OpenerTable table;
    table["en"] = {
        "what is the", "how do you", "where is the", "when did the", "why do",
        "who is", "which one", "how far is", "what are the", "tell me about",
        "what about", "how about", "what if", "can you", "could you",
        "would you", "will you",
    };
    return table;
}

IncompleteSentenceDetector::IncompleteSentenceDetector(OpenerTable openers, std::string locale)
    : openers_(std::move(openers)), locale_(std::move(locale)) {}

const std::vector<std::string>& IncompleteSentenceDetector::openers() const {
    static const std::vector<std::string> kNone;
    auto it = openers_.find(locale_);
    return it == openers_.end() ? kNone : it->second;
}

bool IncompleteSentenceDetector::isIncomplete(const std::string& text) const {
    for (const auto& opener : openers()) {
        if (endsWithPhrase(text, opener)) return true;
    }
    return false;
}

}
