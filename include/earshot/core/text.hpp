#ifndef EARSHOT_TEXT_HPP
#define EARSHOT_TEXT_HPP

#include <string>
#include <utility>
#include <vector>

namespace earshot {

std::string toLower(const std::string& s);

// Lower-cases, turns punctuation (apostrophes excepted) into spaces and collapses whitespace
std::string normalizeText(const std::string& s);

// Trims and collapses runs of whitespace into single spaces
std::string collapseWhitespace(const std::string& s);

int wordCount(const std::string& s);

// Whole-word phrase matching on normalized text
bool containsPhrase(const std::string& text, const std::string& phrase);
bool endsWithPhrase(const std::string& text, const std::string& phrase);

// Applies each (from, to) substitution in order to every occurrence
std::string applyReplacements(std::string text, const std::vector<std::pair<std::string, std::string>>& table);

}

#endif
