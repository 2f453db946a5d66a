/**
 * @file domain.hpp
 * @brief 単語定義域クラス（Sparse Set ベース）
 */
#ifndef CROSSFILL_DOMAIN_HPP
#define CROSSFILL_DOMAIN_HPP

#include "crossfill/vocabulary.hpp"
#include <vector>
#include <cstddef>
#include <cstdint>

namespace crossfill {

/**
 * @brief スロットの候補単語集合を表すクラス
 *
 * 値は Vocabulary 内の WordId。Sparse Set を使用し、O(1) での存在確認と削除を実現する。
 * 削除は有効範囲 [0, n_) 内でのスワップのみで行うため、
 * バックトラック時の復元は size (n_) のリセットのみで O(1)。
 */
class Domain {
public:
    using value_type = WordId;

    /**
     * @brief 空の定義域を作成
     */
    Domain();

    /**
     * @brief 語彙全体 {0, ..., vocabulary_size - 1} を定義域とする
     * @param vocabulary_size 語彙サイズ
     */
    explicit Domain(size_t vocabulary_size);

    bool empty() const { return n_ == 0; }
    size_t size() const { return n_; }

    /**
     * @brief 受け付け可能な WordId の上限
     */
    size_t capacity() const { return sparse_.size(); }

    /**
     * @brief 値が定義域に含まれるか
     */
    bool contains(value_type value) const {
        return value < sparse_.size() && sparse_[value] < n_;
    }

    /**
     * @brief 値を削除
     * @return 値が削除されたらtrue（元々含まれていなければfalse）
     * @note 最後の1値も削除できる（空の定義域は伝播失敗として上位で扱う）
     */
    bool remove(value_type value);

    /**
     * @brief 指定値に固定
     * @return 値が定義域に含まれていればtrue
     */
    bool assign(value_type value);

    /**
     * @brief 有効な値を WordId 昇順で取得
     */
    std::vector<value_type> values() const;

    /**
     * @brief 単一値に固定されているか
     */
    bool is_singleton() const { return n_ == 1; }

    /**
     * @brief Dense 配列の有効範囲の先頭ポインタ（順序は不定）
     */
    const value_type* begin() const { return values_.data(); }

    /**
     * @brief Dense 配列の有効範囲の末尾ポインタ
     */
    const value_type* end() const { return values_.data() + n_; }

    // ===== Sparse Set 内部アクセス（DomainStore からの操作用） =====

    /**
     * @brief 有効サイズ (n_) を取得
     */
    size_t n() const { return n_; }

    /**
     * @brief 有効サイズを設定（バックトラック用）
     */
    void set_n(size_t n);

    /**
     * @brief Dense 配列全体（無効部分を含む）
     */
    const std::vector<value_type>& dense() const { return values_; }

    /**
     * @brief Dense 配列の並びと有効サイズを丸ごと復元
     */
    void restore_dense(std::vector<value_type> dense, size_t n);

    /**
     * @brief 値の Dense 配列上の位置（無ければ SIZE_MAX）
     */
    size_t index_of(value_type value) const;

    /**
     * @brief Sparse Set 内でスワップ
     */
    void swap_at(size_t i, size_t j);

private:
    std::vector<value_type> values_;  // Dense 配列
    std::vector<size_t> sparse_;      // sparse_[word] = values_ 上の位置
    size_t n_;                        // 有効な値の数
};

} // namespace crossfill

#endif // CROSSFILL_DOMAIN_HPP
