/**
 * @file propagator.hpp
 * @brief 整合性エンジン（ノード整合・AC-3 アーク整合）
 */
#ifndef CROSSFILL_PROPAGATOR_HPP
#define CROSSFILL_PROPAGATOR_HPP

#include "crossfill/puzzle.hpp"
#include "crossfill/domain_store.hpp"
#include <vector>

namespace crossfill {

/**
 * @brief 伝播の統計情報
 */
struct PropagationStats {
    size_t revise_count = 0;      // revise() の呼び出し回数
    size_t arcs_processed = 0;    // キューから取り出したアーク数
    size_t words_removed = 0;     // 削除した単語数
    size_t failures = 0;          // 定義域が空になった回数
};

/**
 * @brief ノード整合と AC-3 による定義域の絞り込み
 *
 * Puzzle は参照で保持するだけで変更しない。
 * 定義域は呼び出し側の DomainStore を直接変更する（Trail に記録される）。
 */
class Propagator {
public:
    explicit Propagator(const Puzzle& puzzle);

    /**
     * @brief 各スロットの定義域から長さの合わない単語を削除
     */
    void enforce_node_consistency(DomainStore& domains);

    /**
     * @brief x を y に対してアーク整合にする
     *
     * domain(y) の中に重なり位置の文字が一致する単語が無い wx を domain(x) から削除する。
     * 重なりが無ければ何もしない。
     *
     * @return domain(x) から1語でも削除したらtrue
     */
    bool revise(DomainStore& domains, SlotId x, SlotId y);

    /**
     * @brief 全アークから AC-3 を実行
     * @return 全定義域が空でなければtrue、空になったらfalse
     */
    bool ac3(DomainStore& domains);

    /**
     * @brief 指定したアークを初期キューとして AC-3 を実行
     * @param arcs 初期キュー（空なら何もせず成功）
     * @return 全定義域が空でなければtrue、空になったらfalse
     */
    bool ac3(DomainStore& domains, const std::vector<Arc>& arcs);

    const PropagationStats& stats() const { return stats_; }

private:
    const Puzzle& puzzle_;
    PropagationStats stats_;

    // キューに入っているアークの印（in_queue_[x * n + y]）
    std::vector<char> in_queue_;
};

} // namespace crossfill

#endif // CROSSFILL_PROPAGATOR_HPP
