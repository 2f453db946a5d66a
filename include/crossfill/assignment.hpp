/**
 * @file assignment.hpp
 * @brief 部分割当と割当チェッカー
 */
#ifndef CROSSFILL_ASSIGNMENT_HPP
#define CROSSFILL_ASSIGNMENT_HPP

#include "crossfill/puzzle.hpp"
#include <vector>
#include <map>
#include <string>
#include <optional>

namespace crossfill {

/**
 * @brief スロット → 単語の部分割当
 */
class Assignment {
public:
    Assignment() = default;

    /**
     * @brief slot_count 個のスロットに対する空の割当
     */
    explicit Assignment(size_t slot_count);

    size_t slot_count() const { return words_.size(); }

    /**
     * @brief 割り当て済みスロット数
     */
    size_t size() const { return assigned_count_; }
    bool empty() const { return assigned_count_ == 0; }

    /**
     * @brief 単語を割り当てる（既に割当があれば上書き）
     */
    void assign(SlotId slot, WordId word);

    /**
     * @brief 割当を取り消す
     */
    void unassign(SlotId slot);

    bool is_assigned(SlotId slot) const { return words_[slot].has_value(); }

    /**
     * @brief 割り当てられた単語（未割当なら std::nullopt）
     */
    const std::optional<WordId>& word(SlotId slot) const { return words_[slot]; }

    /**
     * @brief slot 以外のスロットが word を使っているか
     */
    bool uses(WordId word, std::optional<SlotId> except = std::nullopt) const;

private:
    std::vector<std::optional<WordId>> words_;
    size_t assigned_count_ = 0;
};

/**
 * @brief 割当を単語文字列で表したもの（スロット名 → 単語）
 */
using Solution = std::map<std::string, std::string>;

/**
 * @brief 割当の検証
 */
class AssignmentChecker {
public:
    explicit AssignmentChecker(const Puzzle& puzzle) : puzzle_(puzzle) {}

    /**
     * @brief 割当が矛盾していないか
     *
     * 同じ単語が2つのスロットに割り当てられている場合、
     * または割り当て済みの隣接スロット対が重なり位置で異なる文字を持つ場合に false。
     */
    bool consistent(const Assignment& assignment) const;

    /**
     * @brief 全スロットに単語が割り当てられているか
     */
    bool complete(const Assignment& assignment) const;

    /**
     * @brief 割当を スロット名 → 単語 の形に変換（割り当て済みのみ）
     */
    Solution to_solution(const Assignment& assignment) const;

private:
    const Puzzle& puzzle_;
};

} // namespace crossfill

#endif // CROSSFILL_ASSIGNMENT_HPP
