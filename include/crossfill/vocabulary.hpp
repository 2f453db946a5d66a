/**
 * @file vocabulary.hpp
 * @brief 語彙（候補単語の集合）
 */
#ifndef CROSSFILL_VOCABULARY_HPP
#define CROSSFILL_VOCABULARY_HPP

#include <vector>
#include <string>
#include <optional>
#include <cstddef>

namespace crossfill {

/**
 * @brief 語彙内の単語インデックス
 */
using WordId = size_t;

/**
 * @brief 候補単語の集合
 *
 * 単語は辞書順にソートされ、重複は除去される。
 * WordId は辞書順のインデックスなので、WordId の比較は単語の辞書順比較と一致する。
 */
class Vocabulary {
public:
    Vocabulary() = default;

    /**
     * @brief 単語リストから語彙を作成
     * @param words 単語リスト（重複可）
     */
    explicit Vocabulary(std::vector<std::string> words);

    size_t size() const { return words_.size(); }
    bool empty() const { return words_.empty(); }

    /**
     * @brief WordId から単語を取得
     * @throws std::out_of_range id が範囲外
     */
    const std::string& word(WordId id) const;

    /**
     * @brief 単語の WordId を検索
     */
    std::optional<WordId> find(const std::string& word) const;

    /**
     * @brief 単語の WordId を取得
     * @throws std::out_of_range 語彙に含まれない
     */
    WordId id(const std::string& word) const;

    const std::vector<std::string>& words() const { return words_; }
    std::vector<std::string>::const_iterator begin() const { return words_.begin(); }
    std::vector<std::string>::const_iterator end() const { return words_.end(); }

private:
    std::vector<std::string> words_;
};

} // namespace crossfill

#endif // CROSSFILL_VOCABULARY_HPP
