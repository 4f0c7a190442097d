#ifndef EARSHOT_INCOMPLETE_SENTENCE_HPP
#define EARSHOT_INCOMPLETE_SENTENCE_HPP

#include <map>
#include <string>
#include <vector>

namespace earshot {

// Question openers that signal the speaker paused mid-sentence, keyed by locale
class IncompleteSentenceDetector {
public:
    using OpenerTable = std::map<std::string, std::vector<std::string>>;

    static OpenerTable defaultOpeners();

    explicit IncompleteSentenceDetector(OpenerTable openers = defaultOpeners(), std::string locale = "en");

    // True when the fragment ends on one of the locale's openers
    bool isIncomplete(const std::string& text) const;

    void setLocale(const std::string& locale) { locale_ = locale; }
    const std::string& locale() const { return locale_; }

    const std::vector<std::string>& openers() const;

private:
    OpenerTable openers_;
    std::string locale_;
};

}

#endif
