#include "crossfill/vocabulary.hpp"
#include <algorithm>
#include <stdexcept>

namespace crossfill {

Vocabulary::Vocabulary(std::vector<std::string> words)
    : words_(std::move(words)) {
    // 重複を除去してソート
    std::sort(words_.begin(), words_.end());
    words_.erase(std::unique(words_.begin(), words_.end()), words_.end());
}

const std::string& Vocabulary::word(WordId id) const {
    if (id >= words_.size()) {
        throw std::out_of_range("WordId out of range: " + std::to_string(id));
    }
    return words_[id];
}

std::optional<WordId> Vocabulary::find(const std::string& word) const {
    auto it = std::lower_bound(words_.begin(), words_.end(), word);
    if (it == words_.end() || *it != word) {
        return std::nullopt;
    }
    return static_cast<WordId>(it - words_.begin());
}

WordId Vocabulary::id(const std::string& word) const {
    auto found = find(word);
    if (!found) {
        throw std::out_of_range("Word not in vocabulary: " + word);
    }
    return *found;
}

} // namespace crossfill
