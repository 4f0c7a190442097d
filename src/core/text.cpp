#include "earshot/core/text.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace earshot {

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return out;
}

std::string collapseWhitespace(const std::string& s) {
    std::istringstream in(s);
    std::string word;
    std::string out;
    while (in >> word) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

std::string normalizeText(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '\'' || c >= 0x80) {
            out += (char)std::tolower(c);
        } else {
            out += ' ';
        }
    }
    return collapseWhitespace(out);
}

int wordCount(const std::string& s) {
    std::istringstream in(s);
    std::string word;
    int n = 0;
    while (in >> word) ++n;
    return n;
}

bool containsPhrase(const std::string& text, const std::string& phrase) {
    const std::string p = normalizeText(phrase);
    if (p.empty()) return false;
    const std::string t = " " + normalizeText(text) + " ";
    return t.find(" " + p + " ") != std::string::npos;
}

bool endsWithPhrase(const std::string& text, const std::string& phrase) {
    const std::string p = normalizeText(phrase);
    if (p.empty()) return false;
    const std::string t = normalizeText(text);
    if (t == p) return true;

    const std::string suffix = " " + p;
    return t.size() > suffix.size() && t.compare(t.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string applyReplacements(std::string text, const std::vector<std::pair<std::string, std::string>>& table) {
    for (const auto& entry : table) {
        if (entry.first.empty()) continue;
        size_t pos = 0;
        while ((pos = text.find(entry.first, pos)) != std::string::npos) {
            text.replace(pos, entry.first.size(), entry.second);
            pos += entry.second.size();
        }
    }
    return text;
}

}
