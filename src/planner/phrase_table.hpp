#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <initializer_list>
#include <algorithm>
#include <utility>

// Lowercase words of `text`, split on anything that is not a letter or digit.
// "Back-to-back MWF" -> {"back", "to", "back", "mwf"}
std::vector<std::string> tokenize_words(const std::string& text);

// Declarative phrase -> value mapping. Phrases are matched as whole word
// sequences, case-insensitively; a lookup returns the longest phrase that
// starts at the given word.
template <typename T>
class PhraseTable {
public:
    struct Match {
        size_t length;        // words consumed
        std::string phrase;   // normalized phrase text
        const T* value;
    };

    PhraseTable() = default;

    PhraseTable(std::initializer_list<std::pair<std::string, T>> entries) {
        for (const auto& [phrase, value] : entries) add(phrase, value);
    }

    void add(const std::string& phrase, T value) {
        auto words = tokenize_words(phrase);
        if (words.empty()) return;
        if (words.size() > max_words_) max_words_ = words.size();
        entries_[std::move(words)] = std::move(value);
    }

    std::optional<Match> longest_match(const std::vector<std::string>& words, size_t pos) const {
        size_t limit = std::min(max_words_, words.size() - std::min(pos, words.size()));
        for (size_t len = limit; len > 0; --len) {
            std::vector<std::string> key(words.begin() + pos, words.begin() + pos + len);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                return Match{len, join(key), &it->second};
            }
        }
        return std::nullopt;
    }

    size_t size() const { return entries_.size(); }

private:
    static std::string join(const std::vector<std::string>& words) {
        std::string out;
        for (const auto& w : words) {
            if (!out.empty()) out += ' ';
            out += w;
        }
        return out;
    }

    std::map<std::vector<std::string>, T> entries_;
    size_t max_words_ = 0;
};
